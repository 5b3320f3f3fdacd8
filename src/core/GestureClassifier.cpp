#include "GestureClassifier.h"

#include <QDebug>

#include <cmath>

#include "../common/Utils.h"

GestureClassifier::GestureClassifier(const ClassifierConfig &config)
    : config_(config),
      openness_(config.opennessRatioMin, config.opennessRatioMax),
      smoother_(config.emaAlpha),
      history_(config.speedMinSamples, config.speedMinSpan),
      stateMachine_(config.confidenceFrames)
{
}

GestureResult GestureClassifier::update(const std::optional<HandSnapshot> &hand,
                                        double now)
{
    if (!hand)
    {
        resetTracking();
        return {confirm(Gesture::Idle), std::nullopt};
    }

    const double openness = openness_.estimate(*hand);
    const Vec3 smoothed = smoother_.update(Utils::fingertipCenter(*hand));
    const std::optional<double> speed = history_.speed();

    lastOpenness_ = openness;
    lastSpeed_ = speed;

    const GestureResult result = classify(openness, speed, smoothed, now);

    prev_ = Point2{smoothed.x, smoothed.y};
    if (!history_.push(now, openness))
        qDebug() << "[GestureClassifier] dropped non-increasing timestamp" << now;

    return result;
}

GestureResult GestureClassifier::classify(double openness,
                                          const std::optional<double> &speed,
                                          const Vec3 &smoothed,
                                          double now)
{
    const double threshold = config_.zoomSpeedThreshold;
    // confirmed gesture from the previous tick
    const Gesture current = stateMachine_.confirmed();

    // Fast opening / closing
    if (speed)
    {
        if (*speed > threshold)
            return {confirm(Gesture::ZoomIn), std::nullopt};
        if (*speed < -threshold)
            return {confirm(Gesture::ZoomOut), std::nullopt};
    }

    // Hand still held in the pose that started the zoom
    if (current == Gesture::ZoomIn && openness > config_.zoomInSustainOpenness)
        return {confirm(Gesture::ZoomIn), std::nullopt};
    if (current == Gesture::ZoomOut && openness < config_.zoomOutSustainOpenness)
        return {confirm(Gesture::ZoomOut), std::nullopt};

    // No orbit right after a zoom: the hand is still settling
    if (isZoom(current) && speed && std::abs(*speed) < threshold)
        zoomEndTime_ = now;

    if (zoomEndTime_ && now - *zoomEndTime_ < config_.orbitAfterZoomCooldown)
        return {confirm(Gesture::Idle), std::nullopt};

    if (openness > config_.orbitMinOpenness && prev_)
    {
        const double dx = smoothed.x - prev_->x;
        const double dy = smoothed.y - prev_->y;

        if (std::hypot(dx, dy) > config_.orbitDeadZone)
        {
            const Gesture g = confirm(Gesture::Orbit);
            if (g == Gesture::Orbit)
                return {g, OrbitDelta{dx, dy}};
            return {g, std::nullopt};
        }
    }

    return {confirm(Gesture::Idle), std::nullopt};
}

void GestureClassifier::resetTracking()
{
    smoother_.reset();
    prev_.reset();
    history_.clear();
    lastSpeed_.reset();
}
