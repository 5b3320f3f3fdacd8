#include "LandmarkStream.h"

#include <QDebug>

#include "LandmarkDecoder.h"

LandmarkStream::LandmarkStream(QObject *parent)
    : QObject(parent)
{
    connect(&client_, &TcpClient::connected,
            this, &LandmarkStream::onConnected);

    connect(&client_, &TcpClient::disconnected,
            this, &LandmarkStream::onDisconnected);

    connect(&client_, &TcpClient::connectionError,
            this, &LandmarkStream::onError);

    connect(&client_, &TcpClient::lineReceived,
            this, &LandmarkStream::ingestLine);
}

void LandmarkStream::start(const TrackerConfig &config)
{
    config_ = config;
    client_.setReconnectInterval(config_.reconnectIntervalMs);
    client_.setMaxLineBytes(config_.maxLineBytes);

    emit connectionStatusChanged(
        tr("Connecting to %1:%2").arg(config_.host).arg(config_.port));
    client_.connectToServer(config_.host, config_.port);
}

void LandmarkStream::stop()
{
    client_.disconnectFromServer();
    publish(std::nullopt);
    emit connectionStatusChanged(tr("Disconnected"));
}

void LandmarkStream::ingestLine(const QByteArray &line)
{
    const LandmarkDecoder::Frame frame = LandmarkDecoder::decodeLine(line);
    if (!frame.ok)
    {
        // first few, then every 100th
        ++rejected_;
        if (rejected_ <= 5 || rejected_ % 100 == 0)
            qWarning() << "[LandmarkStream] rejected message" << rejected_
                       << ":" << frame.error;
    }

    publish(frame.hand);
}

void LandmarkStream::publish(const std::optional<HandSnapshot> &hand)
{
    hand_ = hand;
    ++seq_;
}

void LandmarkStream::onConnected()
{
    qInfo() << "[LandmarkStream] connected to" << config_.host << config_.port;
    emit connectionStatusChanged(
        tr("Connected to %1:%2").arg(config_.host).arg(config_.port));
}

void LandmarkStream::onDisconnected()
{
    qInfo() << "[LandmarkStream] tracker disconnected";
    publish(std::nullopt);
    emit connectionStatusChanged(tr("Disconnected"));
}

void LandmarkStream::onError(const QString &message)
{
    qWarning() << "[LandmarkStream] connection error:" << message;
    emit connectionStatusChanged(tr("Connection error: %1").arg(message));
}
