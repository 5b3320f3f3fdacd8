#include "OpennessEstimator.h"

#include "../common/Utils.h"

namespace
{
    constexpr double kDegenerateKnuckle = 1e-6;
}

double OpennessEstimator::averageRatio(const HandSnapshot &hand)
{
    const Landmark &wrist = hand.wrist();

    double sum = 0.0;
    int count = 0;
    for (std::size_t i = 0; i < HandIndex::Tips.size(); ++i)
    {
        const Landmark &tip = hand.landmarks[HandIndex::Tips[i]];
        const Landmark &knuckle = hand.landmarks[HandIndex::Knuckles[i]];

        const double dKnuckle = Utils::distance3(knuckle, wrist);
        if (dKnuckle < kDegenerateKnuckle)
            continue;

        sum += Utils::distance3(tip, wrist) / dKnuckle;
        ++count;
    }

    if (count == 0)
        return 0.0;
    return sum / count;
}

double OpennessEstimator::mapRatio(double ratio) const
{
    return Utils::clamp((ratio - ratioMin_) / (ratioMax_ - ratioMin_), 0.0, 1.0);
}

double OpennessEstimator::estimate(const HandSnapshot &hand) const
{
    return mapRatio(averageRatio(hand));
}
