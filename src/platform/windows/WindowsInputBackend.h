#pragma once
#include "../InputBackend.h"
#include <windows.h>

class WindowsInputBackend : public InputBackend
{
public:
    WindowsInputBackend() = default;

    void moveRelative(int dx, int dy) override;

    void middleDown() override;
    void middleUp() override;

    void scroll(int ticks) override;
};
