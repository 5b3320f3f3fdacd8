#pragma once
#include <optional>

#include "../common/Types.h"
#include "Config.h"
#include "GestureStateMachine.h"
#include "OpennessEstimator.h"
#include "Filters/OpennessHistory.h"
#include "Filters/PositionSmoother.h"

/**
 * GestureClassifier
 * --------------------
 * Turns one hand snapshot per tick into a confirmed gesture:
 *
 *  - ZoomIn / ZoomOut : openness changing faster than the zoom threshold,
 *                       or held open/closed while a zoom is confirmed
 *  - Orbit            : open hand moving beyond the dead zone
 *  - Idle             : everything else, and for a while after a zoom ends
 *
 * Not thread safe; feed ticks from a single caller, in order.
 * `now` is monotonic seconds.
 */

class GestureClassifier
{
public:
    explicit GestureClassifier(const ClassifierConfig &config = ClassifierConfig());

    GestureResult update(const std::optional<HandSnapshot> &hand, double now);

    Gesture confirmed() const { return stateMachine_.confirmed(); }
    const GestureStateMachine::State &hysteresis() const { return stateMachine_.state(); }

    // Last computed values, for diagnostics
    double lastOpenness() const { return lastOpenness_; }
    std::optional<double> lastSpeed() const { return lastSpeed_; }

private:
    struct Point2
    {
        double x = 0.0;
        double y = 0.0;
    };

    GestureResult classify(double openness, const std::optional<double> &speed,
                           const Vec3 &smoothed, double now);
    Gesture confirm(Gesture raw) { return stateMachine_.filterGesture(raw); }
    void resetTracking();

    ClassifierConfig config_;

    OpennessEstimator openness_;
    PositionSmoother smoother_;
    OpennessHistory history_;
    GestureStateMachine stateMachine_;

    std::optional<Point2> prev_;
    std::optional<double> zoomEndTime_;

    double lastOpenness_ = 0.0;
    std::optional<double> lastSpeed_;
};
