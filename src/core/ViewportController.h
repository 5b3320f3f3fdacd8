#pragma once
#include <optional>

#include "../common/Types.h"
#include "Config.h"

class InputSimulator;

/**
 * ViewportController
 * --------------------
 * Maps confirmed gestures onto the viewport's native navigation:
 *
 *  - Orbit    : middle-button drag (press once, then relative moves)
 *  - ZoomIn   : scroll up   (rate limited)
 *  - ZoomOut  : scroll down (rate limited)
 *  - Idle     : release the middle button
 */

class ViewportController
{
public:
    ViewportController(InputSimulator *input, const ViewportConfig &config);

    void act(const GestureResult &result, double now);

    // Make sure nothing is left pressed
    void releaseAll();

    bool isOrbiting() const { return orbiting_; }

private:
    void doOrbit(const std::optional<OrbitDelta> &delta);
    void endOrbit();
    void doZoom(int ticks, double now);

    InputSimulator *input_;
    ViewportConfig config_;

    bool orbiting_ = false;
    std::optional<double> lastZoomTime_;
};
