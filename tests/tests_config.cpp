#include <core/Config.h>

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "catch2/catch.hpp"

TEST_CASE("Config defaults")
{
    const AppConfig cfg = Config::fromJson(QJsonObject());

    CHECK(cfg.tracker.host == QStringLiteral("127.0.0.1"));
    CHECK(cfg.tracker.port == 5555);
    CHECK(cfg.classifier.emaAlpha == Approx(0.45));
    CHECK(cfg.classifier.confidenceFrames == 3);
    CHECK(cfg.classifier.orbitDeadZone == Approx(0.015));
    CHECK(cfg.classifier.zoomSpeedThreshold == Approx(0.8));
    CHECK(cfg.classifier.orbitAfterZoomCooldown == Approx(0.3));
    CHECK(cfg.classifier.speedMinSamples == 4);
    CHECK(cfg.classifier.speedMinSpan == Approx(0.05));
    CHECK(cfg.classifier.opennessRatioMin == Approx(0.6));
    CHECK(cfg.classifier.opennessRatioMax == Approx(1.6));
    CHECK(cfg.viewport.zoomInScroll == 3);
    CHECK(cfg.viewport.zoomOutScroll == -3);
    CHECK(cfg.pollIntervalMs == 5);
}

TEST_CASE("Config reads values")
{
    const QByteArray json = R"({
        "tracker": {"host": "10.0.0.7", "port": 6000},
        "classifier": {"ema_alpha": 0.3, "confidence_frames": 5,
                       "zoom_speed_threshold": 1.2},
        "viewport": {"orbit_sensitivity_x": -1.5, "zoom_scroll_interval": 0.1},
        "loop": {"poll_interval_ms": 10}
    })";
    const AppConfig cfg = Config::fromJson(QJsonDocument::fromJson(json).object());

    CHECK(cfg.tracker.host == QStringLiteral("10.0.0.7"));
    CHECK(cfg.tracker.port == 6000);
    CHECK(cfg.classifier.emaAlpha == Approx(0.3));
    CHECK(cfg.classifier.confidenceFrames == 5);
    CHECK(cfg.classifier.zoomSpeedThreshold == Approx(1.2));
    CHECK(cfg.classifier.orbitDeadZone == Approx(0.015));
    CHECK(cfg.viewport.orbitSensitivityX == Approx(-1.5));
    CHECK(cfg.viewport.zoomScrollInterval == Approx(0.1));
    CHECK(cfg.pollIntervalMs == 10);
}

TEST_CASE("Config clamps out-of-range values")
{
    const QByteArray json = R"({
        "tracker": {"port": 70000},
        "classifier": {"ema_alpha": 5.0, "confidence_frames": 0,
                       "orbit_dead_zone": -1.0, "speed_min_samples": 50},
        "loop": {"poll_interval_ms": 0}
    })";
    const AppConfig cfg = Config::fromJson(QJsonDocument::fromJson(json).object());

    CHECK(cfg.tracker.port == 65535);
    CHECK(cfg.classifier.emaAlpha == 1.0);
    CHECK(cfg.classifier.confidenceFrames == 1);
    CHECK(cfg.classifier.orbitDeadZone == 0.0);
    CHECK(cfg.classifier.speedMinSamples == OPENNESS_HISTORY_CAPACITY);
    CHECK(cfg.pollIntervalMs == 1);
}

TEST_CASE("Config rejects an empty openness range")
{
    const QByteArray json = R"({"classifier": {"openness_ratio_min": 2.0,
                                               "openness_ratio_max": 1.0}})";
    const AppConfig cfg = Config::fromJson(QJsonDocument::fromJson(json).object());

    CHECK(cfg.classifier.opennessRatioMin == Approx(OPENNESS_RATIO_MIN));
    CHECK(cfg.classifier.opennessRatioMax == Approx(OPENNESS_RATIO_MAX));
}

TEST_CASE("Config file handling")
{
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION("missing file gives defaults")
    {
        const AppConfig cfg = Config::load(dir.filePath("nope.json"));
        CHECK(cfg.classifier.confidenceFrames == GESTURE_CONFIDENCE_FRAMES);
    }

    SECTION("broken file gives defaults")
    {
        const QString path = dir.filePath("broken.json");
        QFile f(path);
        REQUIRE(f.open(QIODevice::WriteOnly));
        f.write("{ \"classifier\": { \"ema_alpha\": ");
        f.close();

        const AppConfig cfg = Config::load(path);
        CHECK(cfg.classifier.emaAlpha == Approx(EMA_ALPHA));
    }

    SECTION("save then load")
    {
        AppConfig cfg;
        cfg.tracker.host = QStringLiteral("tracker.local");
        cfg.classifier.orbitDeadZone = 0.02;
        cfg.viewport.zoomOutScroll = -5;

        const QString path = dir.filePath("sub/kido.json");
        QString error;
        REQUIRE(Config::save(cfg, path, &error));
        CHECK(error.isEmpty());

        const AppConfig back = Config::load(path);
        CHECK(back.tracker.host == cfg.tracker.host);
        CHECK(back.classifier.orbitDeadZone == Approx(0.02));
        CHECK(back.viewport.zoomOutScroll == -5);
    }

    SECTION("resolvePath finds absolute files only when they exist")
    {
        CHECK(Config::resolvePath(dir.filePath("missing.json")).isEmpty());

        const QString path = dir.filePath("present.json");
        QFile f(path);
        REQUIRE(f.open(QIODevice::WriteOnly));
        f.write("{}");
        f.close();
        CHECK_FALSE(Config::resolvePath(path).isEmpty());
    }
}
