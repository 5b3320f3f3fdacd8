#pragma once

#include <QElapsedTimer>

#include <cmath>

#include "Types.h"

/**
 * Geometry and timing helpers used across modules.
 */

namespace Utils
{

    inline double clamp(double v, double min, double max)
    {
        if (v < min)
            return min;
        if (v > max)
            return max;
        return v;
    }

    inline double distance3(const Landmark &a, const Landmark &b)
    {
        const double dx = a.x - b.x;
        const double dy = a.y - b.y;
        const double dz = a.z - b.z;
        return std::sqrt(dx * dx + dy * dy + dz * dz);
    }

    template <typename Indices>
    inline Vec3 centroid(const HandSnapshot &hand, const Indices &ids)
    {
        Vec3 c;
        for (int i : ids)
        {
            c.x += hand.landmarks[i].x;
            c.y += hand.landmarks[i].y;
            c.z += hand.landmarks[i].z;
        }
        const double n = static_cast<double>(ids.size());
        c.x /= n;
        c.y /= n;
        c.z /= n;
        return c;
    }

    // Mean of the five fingertips
    inline Vec3 fingertipCenter(const HandSnapshot &hand)
    {
        return centroid(hand, HandIndex::Tips);
    }

    // Monotonic seconds since construction
    class MonotonicClock
    {
    public:
        MonotonicClock()
        {
            timer_.start();
        }

        double now() const
        {
            return timer_.nsecsElapsed() / 1e9;
        }

    private:
        QElapsedTimer timer_;
    };

    // Tick rate meter for the status bar
    class FPSTimer
    {
    public:
        FPSTimer()
        {
            timer_.start();
        }

        float fps()
        {
            qint64 ms = timer_.restart();
            if (ms <= 0)
                return 0.f;
            return 1000.f / ms;
        }

    private:
        QElapsedTimer timer_;
    };
}
