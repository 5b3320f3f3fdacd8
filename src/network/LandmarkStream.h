#pragma once
#include <QObject>

#include <optional>

#include "../common/Types.h"
#include "../core/Config.h"
#include "TcpClient.h"

/**
 * LandmarkStream
 * --------------------
 * Receives hand landmarks from the tracker process and keeps only the
 * most recent snapshot. Every decoded message (and every loss of the
 * connection, which publishes "no hand") bumps the sequence number so
 * a poller can tell new data from stale data.
 */

class LandmarkStream : public QObject
{
    Q_OBJECT

public:
    struct Latest
    {
        std::optional<HandSnapshot> hand;
        quint64 seq = 0;
    };

    explicit LandmarkStream(QObject *parent = nullptr);

    void start(const TrackerConfig &config);
    void stop();

    Latest latest() const { return {hand_, seq_}; }

    // Decodes one protocol line and publishes the result
    void ingestLine(const QByteArray &line);
    void publish(const std::optional<HandSnapshot> &hand);

    quint64 rejectedMessages() const { return rejected_; }

signals:
    void connectionStatusChanged(const QString &status);

private slots:
    void onConnected();
    void onDisconnected();
    void onError(const QString &message);

private:
    TcpClient client_;
    TrackerConfig config_;

    std::optional<HandSnapshot> hand_;
    quint64 seq_ = 0;
    quint64 rejected_ = 0;
};
