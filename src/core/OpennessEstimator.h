#pragma once

#include "../common/Constants.h"
#include "../common/Types.h"

/**
 * OpennessEstimator
 * --------------------
 * 0.0 (tight fist) .. 1.0 (fully open palm).
 *
 * Average of tip-to-wrist / knuckle-to-wrist over the five fingers,
 * mapped linearly from [ratioMin, ratioMax] and clamped.
 */

class OpennessEstimator
{
public:
    OpennessEstimator(double ratioMin = OPENNESS_RATIO_MIN,
                      double ratioMax = OPENNESS_RATIO_MAX)
        : ratioMin_(ratioMin), ratioMax_(ratioMax) {}

    double estimate(const HandSnapshot &hand) const;

    // Mean tip/knuckle ratio, or 0 when every finger is degenerate
    static double averageRatio(const HandSnapshot &hand);

    double mapRatio(double ratio) const;

private:
    double ratioMin_;
    double ratioMax_;
};
