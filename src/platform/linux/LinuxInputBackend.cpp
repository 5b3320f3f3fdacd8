#include "LinuxInputBackend.h"

#include <QDebug>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace
{
    constexpr const char *kDevicePath = "/dev/uinput";
    constexpr const char *kDeviceName = "Kido virtual pointer";

    bool setBit(int fd, unsigned long request, int bit)
    {
        return ioctl(fd, request, bit) >= 0;
    }
}

LinuxInputBackend::LinuxInputBackend()
{
    fd_ = ::open(kDevicePath, O_WRONLY | O_NONBLOCK);
    if (fd_ < 0)
    {
        qWarning() << "[LinuxInputBackend] cannot open" << kDevicePath << ":"
                   << std::strerror(errno);
        return;
    }

    // BTN_LEFT is needed for the device to be classified as a mouse
    const bool ok = setBit(fd_, UI_SET_EVBIT, EV_KEY) &&
                    setBit(fd_, UI_SET_KEYBIT, BTN_LEFT) &&
                    setBit(fd_, UI_SET_KEYBIT, BTN_MIDDLE) &&
                    setBit(fd_, UI_SET_KEYBIT, BTN_RIGHT) &&
                    setBit(fd_, UI_SET_EVBIT, EV_REL) &&
                    setBit(fd_, UI_SET_RELBIT, REL_X) &&
                    setBit(fd_, UI_SET_RELBIT, REL_Y) &&
                    setBit(fd_, UI_SET_RELBIT, REL_WHEEL) &&
                    setBit(fd_, UI_SET_EVBIT, EV_SYN);

    uinput_setup setup;
    std::memset(&setup, 0, sizeof(setup));
    setup.id.bustype = BUS_VIRTUAL;
    setup.id.vendor = 0x1209;
    setup.id.product = 0x4b44;
    std::strncpy(setup.name, kDeviceName, UINPUT_MAX_NAME_SIZE - 1);

    if (!ok || ioctl(fd_, UI_DEV_SETUP, &setup) < 0 ||
        ioctl(fd_, UI_DEV_CREATE) < 0)
    {
        qWarning() << "[LinuxInputBackend] uinput device setup failed:"
                   << std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        return;
    }

    qInfo() << "[LinuxInputBackend] created" << kDeviceName;
}

LinuxInputBackend::~LinuxInputBackend()
{
    if (fd_ < 0)
        return;

    ioctl(fd_, UI_DEV_DESTROY);
    ::close(fd_);
}

void LinuxInputBackend::emitEvent(int type, int code, int value)
{
    if (fd_ < 0)
        return;

    input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = static_cast<__u16>(type);
    ev.code = static_cast<__u16>(code);
    ev.value = value;

    if (::write(fd_, &ev, sizeof(ev)) != static_cast<ssize_t>(sizeof(ev)))
        qWarning() << "[LinuxInputBackend] write failed:" << std::strerror(errno);
}

void LinuxInputBackend::sync()
{
    emitEvent(EV_SYN, SYN_REPORT, 0);
}

void LinuxInputBackend::moveRelative(int dx, int dy)
{
    if (dx == 0 && dy == 0)
        return;

    if (dx != 0)
        emitEvent(EV_REL, REL_X, dx);
    if (dy != 0)
        emitEvent(EV_REL, REL_Y, dy);
    sync();
}

void LinuxInputBackend::middleDown()
{
    emitEvent(EV_KEY, BTN_MIDDLE, 1);
    sync();
}

void LinuxInputBackend::middleUp()
{
    emitEvent(EV_KEY, BTN_MIDDLE, 0);
    sync();
}

void LinuxInputBackend::scroll(int ticks)
{
    if (ticks == 0)
        return;

    emitEvent(EV_REL, REL_WHEEL, ticks);
    sync();
}
