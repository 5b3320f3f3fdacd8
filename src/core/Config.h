#pragma once
#include <QJsonObject>
#include <QString>

#include "../common/Constants.h"

/**
 * Runtime settings, read from config/kido.json.
 * Every value falls back to the defaults in Constants.h.
 */

struct ClassifierConfig
{
    double emaAlpha = EMA_ALPHA;
    int confidenceFrames = GESTURE_CONFIDENCE_FRAMES;
    double orbitDeadZone = ORBIT_DEAD_ZONE;
    double zoomSpeedThreshold = ZOOM_SPEED_THRESHOLD;
    double orbitAfterZoomCooldown = ORBIT_AFTER_ZOOM_COOLDOWN;

    int speedMinSamples = SPEED_MIN_SAMPLES;
    double speedMinSpan = SPEED_MIN_SPAN;

    double opennessRatioMin = OPENNESS_RATIO_MIN;
    double opennessRatioMax = OPENNESS_RATIO_MAX;

    double orbitMinOpenness = ORBIT_MIN_OPENNESS;
    double zoomInSustainOpenness = ZOOM_IN_SUSTAIN_OPENNESS;
    double zoomOutSustainOpenness = ZOOM_OUT_SUSTAIN_OPENNESS;
};

struct ViewportConfig
{
    int captureWidth = CAPTURE_WIDTH;
    int captureHeight = CAPTURE_HEIGHT;
    double orbitSensitivityX = ORBIT_SENSITIVITY_X;
    double orbitSensitivityY = ORBIT_SENSITIVITY_Y;
    int zoomInScroll = ZOOM_IN_SCROLL;
    int zoomOutScroll = ZOOM_OUT_SCROLL;
    double zoomScrollInterval = ZOOM_SCROLL_INTERVAL;
};

struct TrackerConfig
{
    QString host = QString::fromLatin1(TRACKER_SERVER_IP);
    quint16 port = TRACKER_SERVER_PORT;
    int reconnectIntervalMs = TRACKER_RECONNECT_MS;
    int maxLineBytes = TRACKER_MAX_LINE_BYTES;
};

struct AppConfig
{
    TrackerConfig tracker;
    ClassifierConfig classifier;
    ViewportConfig viewport;
    int pollIntervalMs = POLL_INTERVAL_MS;
};

namespace Config
{
    // Missing keys keep their defaults; out-of-range values are clamped.
    AppConfig fromJson(const QJsonObject &root);
    QJsonObject toJson(const AppConfig &config);

    // Searches cwd and the application directory (and up to two parents).
    // Returns an empty string when nothing was found.
    QString resolvePath(const QString &relativePath);

    // Defaults when the file is missing or unreadable.
    AppConfig load(const QString &path);
    bool save(const AppConfig &config, const QString &path, QString *error = nullptr);
}
