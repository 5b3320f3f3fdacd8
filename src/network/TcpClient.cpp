#include "TcpClient.h"

#include <QDebug>

TcpClient::TcpClient(QObject *parent)
    : QObject(parent)
{
    reconnectTimer_.setSingleShot(true);
    reconnectTimer_.setInterval(2000);

    connect(&socket_, &QTcpSocket::connected,
            this, &TcpClient::onConnected);

    connect(&socket_, &QTcpSocket::disconnected,
            this, &TcpClient::onDisconnected);

    connect(&socket_, &QTcpSocket::readyRead,
            this, &TcpClient::onReadyRead);

    connect(&socket_,
            QOverload<QAbstractSocket::SocketError>::of(&QTcpSocket::errorOccurred),
            this, &TcpClient::onError);

    connect(&reconnectTimer_, &QTimer::timeout,
            this, &TcpClient::onReconnectTimeout);
}

void TcpClient::connectToServer(const QString &host, quint16 port)
{
    host_ = host;
    port_ = port;
    wantConnection_ = true;
    reconnectTimer_.stop();

    if (socket_.state() != QAbstractSocket::UnconnectedState)
        socket_.abort();

    buffer_.clear();
    discarding_ = false;
    socket_.connectToHost(host_, port_);
}

void TcpClient::disconnectFromServer()
{
    wantConnection_ = false;
    reconnectTimer_.stop();

    if (socket_.state() != QAbstractSocket::UnconnectedState)
    {
        socket_.disconnectFromHost();
        if (socket_.state() != QAbstractSocket::UnconnectedState)
            socket_.waitForDisconnected(1000);
    }
}

bool TcpClient::isConnected() const
{
    return socket_.state() == QAbstractSocket::ConnectedState;
}

void TcpClient::onConnected()
{
    emit connected();
}

void TcpClient::onDisconnected()
{
    emit disconnected();
    scheduleReconnect();
}

void TcpClient::onError(QAbstractSocket::SocketError)
{
    emit connectionError(socket_.errorString());
    scheduleReconnect();
}

void TcpClient::onReconnectTimeout()
{
    if (!wantConnection_ || socket_.state() != QAbstractSocket::UnconnectedState)
        return;

    qDebug() << "[TcpClient] reconnecting to" << host_ << port_;
    buffer_.clear();
    discarding_ = false;
    socket_.connectToHost(host_, port_);
}

void TcpClient::scheduleReconnect()
{
    if (wantConnection_ && !reconnectTimer_.isActive())
        reconnectTimer_.start();
}

void TcpClient::onReadyRead()
{
    feed(socket_.readAll());
}

void TcpClient::feed(const QByteArray &data)
{
    buffer_.append(data);

    while (true)
    {
        const int idx = buffer_.indexOf('\n');
        if (idx < 0)
        {
            if (buffer_.size() > maxLineBytes_)
            {
                if (!discarding_)
                    qWarning() << "[TcpClient] line exceeds" << maxLineBytes_
                               << "bytes, discarding";
                discarding_ = true;
                buffer_.clear();
            }
            return;
        }

        const QByteArray line = buffer_.left(idx).trimmed();
        buffer_.remove(0, idx + 1);

        if (discarding_)
        {
            // tail of an oversized line
            discarding_ = false;
            continue;
        }

        if (line.size() > maxLineBytes_)
        {
            qWarning() << "[TcpClient] line exceeds" << maxLineBytes_
                       << "bytes, discarding";
            continue;
        }

        if (!line.isEmpty())
            emit lineReceived(line);
    }
}
