#pragma once
#include "../InputBackend.h"

/**
 * Virtual pointer device created through /dev/uinput.
 * The user needs write access to /dev/uinput (usually the "input" group).
 */

class LinuxInputBackend : public InputBackend
{
public:
    LinuxInputBackend();
    ~LinuxInputBackend() override;

    LinuxInputBackend(const LinuxInputBackend &) = delete;
    LinuxInputBackend &operator=(const LinuxInputBackend &) = delete;

    bool isOpen() const { return fd_ >= 0; }

    void moveRelative(int dx, int dy) override;

    void middleDown() override;
    void middleUp() override;

    void scroll(int ticks) override;

private:
    void emitEvent(int type, int code, int value);
    void sync();

    int fd_ = -1;
};
