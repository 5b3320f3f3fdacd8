#pragma once
#include <QByteArray>
#include <QObject>
#include <QTcpSocket>
#include <QTimer>

/**
 * TcpClient
 * -----------------------
 * Encapsulates a QTcpSocket and exposes:
 *   - connectToServer() / disconnectFromServer()
 *   - newline-delimited lines as signals
 *   - automatic reconnect while a connection is wanted
 *
 * Lines longer than maxLineBytes are discarded up to the next newline.
 */

class TcpClient : public QObject
{
    Q_OBJECT

public:
    explicit TcpClient(QObject *parent = nullptr);

    void setReconnectInterval(int ms) { reconnectTimer_.setInterval(ms); }
    void setMaxLineBytes(int bytes) { maxLineBytes_ = bytes; }

    void connectToServer(const QString &host, quint16 port);
    void disconnectFromServer();

    bool isConnected() const;

    // Splits raw bytes into lines; exposed for the socket slot and tests
    void feed(const QByteArray &data);

signals:
    void connected();
    void disconnected();
    void lineReceived(const QByteArray &line);
    void connectionError(const QString &message);

private slots:
    void onConnected();
    void onDisconnected();
    void onReadyRead();
    void onError(QAbstractSocket::SocketError);
    void onReconnectTimeout();

private:
    void scheduleReconnect();

    QTcpSocket socket_;
    QTimer reconnectTimer_;
    QByteArray buffer_;

    QString host_;
    quint16 port_ = 0;
    bool wantConnection_ = false;
    bool discarding_ = false;
    int maxLineBytes_ = 64 * 1024;
};
