#include "NavigationController.h"

#include <QDebug>

#include "GestureClassifier.h"
#include "ViewportController.h"

namespace
{
    constexpr int kTickRateReportEvery = 30;
}

NavigationController::NavigationController(InputSimulator *input, QObject *parent)
    : QObject(parent), input_(input)
{
    connect(&pollTimer_, &QTimer::timeout,
            this, &NavigationController::poll);

    connect(&stream_, &LandmarkStream::connectionStatusChanged,
            this, &NavigationController::connectionStatusChanged);

    buildPipeline();
}

NavigationController::~NavigationController()
{
    stop();
}

void NavigationController::buildPipeline()
{
    classifier_ = std::make_unique<GestureClassifier>(config_.classifier);
    viewport_ = std::make_unique<ViewportController>(input_, config_.viewport);
}

void NavigationController::start()
{
    if (running_)
        stop();

    // fresh state machine with the current tunables
    buildPipeline();
    lastSeq_ = stream_.latest().seq;
    lastGesture_ = Gesture::Idle;
    running_ = true;

    stream_.start(config_.tracker);
    pollTimer_.start(config_.pollIntervalMs);
    qInfo() << "[NavigationController] started, polling every"
            << config_.pollIntervalMs << "ms";
}

void NavigationController::stop()
{
    if (!running_)
        return;

    running_ = false;
    pollTimer_.stop();
    stream_.stop();
    viewport_->releaseAll();

    if (lastGesture_ != Gesture::Idle)
    {
        lastGesture_ = Gesture::Idle;
        emit gestureChanged(lastGesture_);
    }
    if (handVisible_)
    {
        handVisible_ = false;
        emit handVisibilityChanged(false);
    }
    qInfo() << "[NavigationController] stopped";
}

void NavigationController::poll()
{
    const LandmarkStream::Latest latest = stream_.latest();
    if (latest.seq == lastSeq_)
        return;

    lastSeq_ = latest.seq;
    tick(latest.hand, clock_.now());
}

GestureResult NavigationController::tick(const std::optional<HandSnapshot> &hand,
                                         double now)
{
    const GestureResult result = classifier_->update(hand, now);
    viewport_->act(result, now);

    const bool visible = hand.has_value();
    if (visible != handVisible_)
    {
        handVisible_ = visible;
        emit handVisibilityChanged(visible);
    }

    if (result.gesture != lastGesture_)
    {
        qDebug() << "[NavigationController]" << gestureName(lastGesture_)
                 << "->" << gestureName(result.gesture)
                 << "openness" << classifier_->lastOpenness();
        lastGesture_ = result.gesture;
        emit gestureChanged(result.gesture);
    }

    if (++ticksSinceReport_ >= kTickRateReportEvery)
    {
        emit tickRateChanged(tickRate_.fps() * ticksSinceReport_);
        ticksSinceReport_ = 0;
    }

    return result;
}
