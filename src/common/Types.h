#pragma once
#include <QMetaType>
#include <QString>

#include <array>
#include <optional>

static constexpr int HAND_LANDMARK_COUNT = 21;

// Landmark indices (MediaPipe hand convention)
namespace HandIndex
{
    static constexpr int Wrist = 0;
    static constexpr int ThumbTip = 4;
    static constexpr int IndexTip = 8;
    static constexpr int MiddleTip = 12;
    static constexpr int RingTip = 16;
    static constexpr int PinkyTip = 20;

    static constexpr std::array<int, 5> Tips = {4, 8, 12, 16, 20};
    static constexpr std::array<int, 5> Knuckles = {2, 5, 9, 13, 17};
}

struct Landmark
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct Vec3
{
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * One tracker observation of a single hand.
 * Coordinates are normalised image space, timestamp is in seconds.
 */
struct HandSnapshot
{
    std::array<Landmark, HAND_LANDMARK_COUNT> landmarks{};
    QString handedness = QStringLiteral("Right");
    double timestamp = 0.0;

    const Landmark &wrist() const { return landmarks[HandIndex::Wrist]; }
};

enum class Gesture
{
    Idle,
    Orbit,
    ZoomIn,
    ZoomOut
};

Q_DECLARE_METATYPE(Gesture)

inline QString gestureName(Gesture g)
{
    switch (g)
    {
    case Gesture::Idle:
        return QStringLiteral("idle");
    case Gesture::Orbit:
        return QStringLiteral("orbit");
    case Gesture::ZoomIn:
        return QStringLiteral("zoom_in");
    case Gesture::ZoomOut:
        return QStringLiteral("zoom_out");
    }
    return QStringLiteral("unknown");
}

inline bool isZoom(Gesture g)
{
    return g == Gesture::ZoomIn || g == Gesture::ZoomOut;
}

// Normalised displacement of the smoothed fingertip centroid since the last tick
struct OrbitDelta
{
    double dx = 0.0;
    double dy = 0.0;
};

struct GestureResult
{
    Gesture gesture = Gesture::Idle;
    std::optional<OrbitDelta> orbit;
};
