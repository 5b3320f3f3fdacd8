#include "Config.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace
{
    double readClamped(const QJsonObject &obj, const char *key,
                       double fallback, double min, double max)
    {
        const double v = obj.value(QLatin1String(key)).toDouble(fallback);
        if (v < min || v > max)
        {
            const double c = v < min ? min : max;
            qWarning() << "[Config]" << key << "=" << v
                       << "out of range, using" << c;
            return c;
        }
        return v;
    }

    int readClamped(const QJsonObject &obj, const char *key,
                    int fallback, int min, int max)
    {
        const int v = obj.value(QLatin1String(key)).toInt(fallback);
        if (v < min || v > max)
        {
            const int c = v < min ? min : max;
            qWarning() << "[Config]" << key << "=" << v
                       << "out of range, using" << c;
            return c;
        }
        return v;
    }

    constexpr double kHuge = 1e9;
}

namespace Config
{

AppConfig fromJson(const QJsonObject &root)
{
    AppConfig cfg;

    const QJsonObject tracker = root["tracker"].toObject();
    cfg.tracker.host = tracker.value("host").toString(cfg.tracker.host);
    cfg.tracker.port = static_cast<quint16>(
        readClamped(tracker, "port", int(cfg.tracker.port), 1, 65535));
    cfg.tracker.reconnectIntervalMs = readClamped(
        tracker, "reconnect_interval_ms", cfg.tracker.reconnectIntervalMs, 100, 600000);
    cfg.tracker.maxLineBytes = readClamped(
        tracker, "max_line_bytes", cfg.tracker.maxLineBytes, 1024, 16 * 1024 * 1024);

    const QJsonObject cls = root["classifier"].toObject();
    ClassifierConfig &c = cfg.classifier;
    c.emaAlpha = readClamped(cls, "ema_alpha", c.emaAlpha, 0.01, 1.0);
    c.confidenceFrames = readClamped(cls, "confidence_frames", c.confidenceFrames, 1, 1000);
    c.orbitDeadZone = readClamped(cls, "orbit_dead_zone", c.orbitDeadZone, 0.0, 1.0);
    c.zoomSpeedThreshold = readClamped(cls, "zoom_speed_threshold", c.zoomSpeedThreshold, 0.0, kHuge);
    c.orbitAfterZoomCooldown = readClamped(cls, "orbit_after_zoom_cooldown", c.orbitAfterZoomCooldown, 0.0, 60.0);
    c.speedMinSamples = readClamped(cls, "speed_min_samples", c.speedMinSamples, 2, OPENNESS_HISTORY_CAPACITY);
    c.speedMinSpan = readClamped(cls, "speed_min_span", c.speedMinSpan, 0.0, 60.0);
    c.opennessRatioMin = readClamped(cls, "openness_ratio_min", c.opennessRatioMin, 0.0, kHuge);
    c.opennessRatioMax = readClamped(cls, "openness_ratio_max", c.opennessRatioMax, 0.0, kHuge);
    if (c.opennessRatioMax <= c.opennessRatioMin)
    {
        qWarning() << "[Config] openness ratio range is empty, using defaults";
        c.opennessRatioMin = OPENNESS_RATIO_MIN;
        c.opennessRatioMax = OPENNESS_RATIO_MAX;
    }
    c.orbitMinOpenness = readClamped(cls, "orbit_openness", c.orbitMinOpenness, 0.0, 1.0);
    c.zoomInSustainOpenness = readClamped(cls, "zoom_in_sustain_openness", c.zoomInSustainOpenness, 0.0, 1.0);
    c.zoomOutSustainOpenness = readClamped(cls, "zoom_out_sustain_openness", c.zoomOutSustainOpenness, 0.0, 1.0);

    const QJsonObject vp = root["viewport"].toObject();
    ViewportConfig &v = cfg.viewport;
    v.captureWidth = readClamped(vp, "capture_width", v.captureWidth, 1, 16384);
    v.captureHeight = readClamped(vp, "capture_height", v.captureHeight, 1, 16384);
    v.orbitSensitivityX = readClamped(vp, "orbit_sensitivity_x", v.orbitSensitivityX, -100.0, 100.0);
    v.orbitSensitivityY = readClamped(vp, "orbit_sensitivity_y", v.orbitSensitivityY, -100.0, 100.0);
    v.zoomInScroll = readClamped(vp, "zoom_in_scroll", v.zoomInScroll, -120, 120);
    v.zoomOutScroll = readClamped(vp, "zoom_out_scroll", v.zoomOutScroll, -120, 120);
    v.zoomScrollInterval = readClamped(vp, "zoom_scroll_interval", v.zoomScrollInterval, 0.0, 10.0);

    const QJsonObject loop = root["loop"].toObject();
    cfg.pollIntervalMs = readClamped(loop, "poll_interval_ms", cfg.pollIntervalMs, 1, 1000);

    return cfg;
}

QJsonObject toJson(const AppConfig &cfg)
{
    QJsonObject tracker;
    tracker["host"] = cfg.tracker.host;
    tracker["port"] = int(cfg.tracker.port);
    tracker["reconnect_interval_ms"] = cfg.tracker.reconnectIntervalMs;
    tracker["max_line_bytes"] = cfg.tracker.maxLineBytes;

    const ClassifierConfig &c = cfg.classifier;
    QJsonObject cls;
    cls["ema_alpha"] = c.emaAlpha;
    cls["confidence_frames"] = c.confidenceFrames;
    cls["orbit_dead_zone"] = c.orbitDeadZone;
    cls["zoom_speed_threshold"] = c.zoomSpeedThreshold;
    cls["orbit_after_zoom_cooldown"] = c.orbitAfterZoomCooldown;
    cls["speed_min_samples"] = c.speedMinSamples;
    cls["speed_min_span"] = c.speedMinSpan;
    cls["openness_ratio_min"] = c.opennessRatioMin;
    cls["openness_ratio_max"] = c.opennessRatioMax;
    cls["orbit_openness"] = c.orbitMinOpenness;
    cls["zoom_in_sustain_openness"] = c.zoomInSustainOpenness;
    cls["zoom_out_sustain_openness"] = c.zoomOutSustainOpenness;

    const ViewportConfig &v = cfg.viewport;
    QJsonObject vp;
    vp["capture_width"] = v.captureWidth;
    vp["capture_height"] = v.captureHeight;
    vp["orbit_sensitivity_x"] = v.orbitSensitivityX;
    vp["orbit_sensitivity_y"] = v.orbitSensitivityY;
    vp["zoom_in_scroll"] = v.zoomInScroll;
    vp["zoom_out_scroll"] = v.zoomOutScroll;
    vp["zoom_scroll_interval"] = v.zoomScrollInterval;

    QJsonObject loop;
    loop["poll_interval_ms"] = cfg.pollIntervalMs;

    QJsonObject root;
    root["tracker"] = tracker;
    root["classifier"] = cls;
    root["viewport"] = vp;
    root["loop"] = loop;
    return root;
}

QString resolvePath(const QString &relativePath)
{
    const QFileInfo info(relativePath);
    if (info.isAbsolute())
        return info.exists() ? info.absoluteFilePath() : QString();

    const auto searchDir = [&relativePath](QDir dir) -> QString
    {
        for (int i = 0; i < 3; ++i)
        {
            const QString candidate = dir.absoluteFilePath(relativePath);
            if (QFileInfo::exists(candidate))
                return QFileInfo(candidate).absoluteFilePath();
            if (!dir.cdUp())
                break;
        }
        return QString();
    };

    if (const QString fromCwd = searchDir(QDir::current()); !fromCwd.isEmpty())
        return fromCwd;

    if (QCoreApplication::instance())
    {
        if (const QString fromApp =
                searchDir(QDir(QCoreApplication::applicationDirPath()));
            !fromApp.isEmpty())
        {
            return fromApp;
        }
    }

    return QString();
}

AppConfig load(const QString &path)
{
    if (path.isEmpty() || !QFileInfo::exists(path))
    {
        qInfo() << "[Config] no config file found, using defaults";
        return AppConfig{};
    }

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
    {
        qWarning() << "[Config] cannot open" << path << ":" << f.errorString();
        return AppConfig{};
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
    {
        qWarning() << "[Config] invalid JSON in" << path << ":"
                   << err.errorString() << "- using defaults";
        return AppConfig{};
    }

    qInfo() << "[Config] loaded" << path;
    return fromJson(doc.object());
}

bool save(const AppConfig &config, const QString &path, QString *error)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath()))
    {
        if (error)
            *error = QStringLiteral("cannot create directory %1").arg(info.absolutePath());
        return false;
    }

    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly))
    {
        if (error)
            *error = f.errorString();
        return false;
    }

    f.write(QJsonDocument(toJson(config)).toJson());
    if (!f.commit())
    {
        if (error)
            *error = f.errorString();
        return false;
    }
    return true;
}

}
