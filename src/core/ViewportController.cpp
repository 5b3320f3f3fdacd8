#include "ViewportController.h"

#include <cmath>
#include <limits>

#include "../common/Utils.h"
#include "../platform/InputSimulator.h"

namespace
{
    // Saturates instead of overflowing the int conversion
    int toPixels(double v)
    {
        return static_cast<int>(Utils::clamp(v,
                                             std::numeric_limits<int>::min(),
                                             std::numeric_limits<int>::max()));
    }
}

ViewportController::ViewportController(InputSimulator *input,
                                       const ViewportConfig &config)
    : input_(input), config_(config)
{
}

void ViewportController::act(const GestureResult &result, double now)
{
    switch (result.gesture)
    {
    case Gesture::Orbit:
        doOrbit(result.orbit);
        break;
    case Gesture::ZoomIn:
        endOrbit(); // release MMB before scrolling
        doZoom(config_.zoomInScroll, now);
        break;
    case Gesture::ZoomOut:
        endOrbit();
        doZoom(config_.zoomOutScroll, now);
        break;
    case Gesture::Idle:
        endOrbit();
        break;
    }
}

void ViewportController::releaseAll()
{
    endOrbit();
}

void ViewportController::doOrbit(const std::optional<OrbitDelta> &delta)
{
    if (!delta || !std::isfinite(delta->dx) || !std::isfinite(delta->dy))
        return;

    // normalised delta -> pixels
    const int px = toPixels(delta->dx * config_.captureWidth * config_.orbitSensitivityX);
    const int py = toPixels(delta->dy * config_.captureHeight * config_.orbitSensitivityY);

    if (!orbiting_)
    {
        input_->middleDown();
        orbiting_ = true;
    }

    input_->moveRelative(px, py);
}

void ViewportController::endOrbit()
{
    if (!orbiting_)
        return;

    input_->middleUp();
    orbiting_ = false;
}

void ViewportController::doZoom(int ticks, double now)
{
    if (lastZoomTime_ && now - *lastZoomTime_ < config_.zoomScrollInterval)
        return;

    input_->scroll(ticks);
    lastZoomTime_ = now;
}
