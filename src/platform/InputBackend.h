#pragma once

class InputBackend
{
public:
    virtual ~InputBackend() = default;

    // Relative pointer movement in pixels
    virtual void moveRelative(int dx, int dy) = 0;

    // Middle button press + release (orbit drag)
    virtual void middleDown() = 0;
    virtual void middleUp() = 0;

    // Scrolling, in wheel notches: positive = up
    virtual void scroll(int ticks) = 0;
};
