#pragma once
#include <QObject>
#include <QTimer>

#include <memory>

#include "../common/Types.h"
#include "../common/Utils.h"
#include "../network/LandmarkStream.h"
#include "Config.h"

class GestureClassifier;
class InputSimulator;
class ViewportController;

/**
 * NavigationController
 * --------------------
 * Drives one classifier tick per new tracker message:
 *
 *   LandmarkStream (latest, seq) --poll--> GestureClassifier
 *                                      --> ViewportController
 *
 * Polls on a timer and only ticks when the sequence number moved, so a
 * message is classified at most once. Messages that arrive between two
 * polls are skipped.
 */

class NavigationController : public QObject
{
    Q_OBJECT

public:
    explicit NavigationController(InputSimulator *input, QObject *parent = nullptr);
    ~NavigationController() override;

    // Takes effect on the next start()
    void setConfig(const AppConfig &config) { config_ = config; }
    const AppConfig &config() const { return config_; }

    void start();
    void stop();
    bool isRunning() const { return running_; }

    LandmarkStream *stream() { return &stream_; }

    Gesture currentGesture() const { return lastGesture_; }

    // Runs one classifier + viewport step
    GestureResult tick(const std::optional<HandSnapshot> &hand, double now);

signals:
    void gestureChanged(Gesture gesture);
    void handVisibilityChanged(bool visible);
    void tickRateChanged(float ticksPerSecond);
    void connectionStatusChanged(const QString &status);

private slots:
    void poll();

private:
    void buildPipeline();

    InputSimulator *input_;
    AppConfig config_;

    LandmarkStream stream_;
    QTimer pollTimer_;
    Utils::MonotonicClock clock_;
    Utils::FPSTimer tickRate_;
    int ticksSinceReport_ = 0;

    std::unique_ptr<GestureClassifier> classifier_;
    std::unique_ptr<ViewportController> viewport_;

    bool running_ = false;
    quint64 lastSeq_ = 0;
    Gesture lastGesture_ = Gesture::Idle;
    bool handVisible_ = false;
};
