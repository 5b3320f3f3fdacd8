#include "WindowsInputBackend.h"

static void sendMouse(DWORD flags, int dx = 0, int dy = 0, DWORD data = 0)
{
    INPUT in = {};
    in.type = INPUT_MOUSE;
    in.mi.dwFlags = flags;

    in.mi.dx = dx;
    in.mi.dy = dy;
    in.mi.mouseData = data;

    SendInput(1, &in, sizeof(INPUT));
}

void WindowsInputBackend::moveRelative(int dx, int dy)
{
    if (dx == 0 && dy == 0)
        return;
    sendMouse(MOUSEEVENTF_MOVE, dx, dy);
}

void WindowsInputBackend::middleDown()
{
    sendMouse(MOUSEEVENTF_MIDDLEDOWN);
}

void WindowsInputBackend::middleUp()
{
    sendMouse(MOUSEEVENTF_MIDDLEUP);
}

void WindowsInputBackend::scroll(int ticks)
{
    if (ticks == 0)
        return;
    sendMouse(MOUSEEVENTF_WHEEL, 0, 0, static_cast<DWORD>(ticks * WHEEL_DELTA));
}
