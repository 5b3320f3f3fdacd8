#pragma once
#include <optional>

#include "../../common/Constants.h"
#include "../../common/RingBuffer.h"

/**
 * OpennessHistory
 * --------------------
 * Last OPENNESS_HISTORY_CAPACITY (timestamp, openness) samples.
 * speed() is the slope between the oldest and newest sample in
 * openness units per second: positive = opening, negative = closing.
 */

class OpennessHistory
{
public:
    struct Sample
    {
        double timestamp = 0.0;
        double openness = 0.0;
    };

    using Buffer = RingBuffer<Sample, OPENNESS_HISTORY_CAPACITY>;

    OpennessHistory(int minSamples = SPEED_MIN_SAMPLES,
                    double minSpan = SPEED_MIN_SPAN)
        : minSamples_(minSamples), minSpan_(minSpan) {}

    // Returns false (and drops the sample) if timestamp is not newer
    // than the newest stored one.
    bool push(double timestamp, double openness);
    void clear() { samples_.clear(); }

    // Unknown with too few samples or too short a time span
    std::optional<double> speed() const;

    std::size_t size() const { return samples_.size(); }
    const Buffer &samples() const { return samples_; }

private:
    Buffer samples_;
    int minSamples_;
    double minSpan_;
};
