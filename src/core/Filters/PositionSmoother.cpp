#include "PositionSmoother.h"

Vec3 PositionSmoother::update(const Vec3 &sample)
{
    if (!state_)
    {
        state_ = sample;
        return *state_;
    }

    Vec3 &d = *state_;
    d.x = alpha_ * sample.x + (1 - alpha_) * d.x;
    d.y = alpha_ * sample.y + (1 - alpha_) * d.y;
    d.z = alpha_ * sample.z + (1 - alpha_) * d.z;
    return d;
}
