#pragma once
#include <optional>

#include "../../common/Constants.h"
#include "../../common/Types.h"

/**
 * PositionSmoother
 * --------------------------
 * Exponential smoothing of the hand's representative point (x, y, z).
 * The first sample after construction or reset() seeds the state as-is.
 */

class PositionSmoother
{
public:
    explicit PositionSmoother(double alpha = EMA_ALPHA)
        : alpha_(alpha) {}

    Vec3 update(const Vec3 &sample);

    void reset() { state_.reset(); }

    bool isInitialized() const { return state_.has_value(); }
    std::optional<Vec3> smoothed() const { return state_; }

private:
    double alpha_;
    std::optional<Vec3> state_;
};
