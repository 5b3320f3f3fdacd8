#include "OpennessHistory.h"

bool OpennessHistory::push(double timestamp, double openness)
{
    if (!samples_.empty() && timestamp <= samples_.back().timestamp)
        return false;

    samples_.push_back({timestamp, openness});
    return true;
}

std::optional<double> OpennessHistory::speed() const
{
    if (samples_.size() < static_cast<std::size_t>(minSamples_))
        return std::nullopt;

    const Sample &first = samples_.front();
    const Sample &last = samples_.back();

    const double dt = last.timestamp - first.timestamp;
    if (dt < minSpan_)
        return std::nullopt;

    return (last.openness - first.openness) / dt;
}
