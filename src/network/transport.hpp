#pragma once

#include "core/result.hpp"
#include "protocol/frame_codec.hpp"
#include "protocol/message.hpp"
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <chrono>
#include <memory>

namespace duet::network {

/**
 * PeerLink - The single live TCP connection to the other party.
 *
 * Host side adopts the accepted socket; client side dials out. Incoming
 * bytes are accumulated and split into frames; each decoded message is
 * emitted in arrival order.
 */
class PeerLink : public QObject {
    Q_OBJECT

public:
    enum class State {
        Disconnected,
        Connecting,
        Connected
    };

    explicit PeerLink(QObject* parent = nullptr);
    ~PeerLink() override;

    /**
     * Dial a host (client side). Emits connected() or connectFailed().
     */
    void connectToHost(const QString& host, uint16_t port,
                       std::chrono::milliseconds timeout);

    /**
     * Take ownership of an accepted socket (host side).
     */
    void adopt(QTcpSocket* socket);

    /**
     * Encode and write a message. A failed write schedules close().
     */
    Result<void, Error> send(const protocol::Message& message);

    /**
     * Close the connection, flushing pending writes. Idempotent;
     * disconnected() fires at most once over the link's lifetime.
     */
    void close();

    /**
     * Drop the connection immediately, discarding pending writes.
     */
    void abort();

    void setMaxFrameBytes(uint32_t max_frame_bytes) { max_frame_bytes_ = max_frame_bytes; }

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] QHostAddress peerAddress() const;
    [[nodiscard]] uint16_t peerPort() const;

    /**
     * "address:port" of the remote end, for logs and notifications.
     */
    [[nodiscard]] QString peerLabel() const;

signals:
    void connected();
    void connectFailed(const duet::Error& error);
    void disconnected();
    void messageReceived(const duet::protocol::Message& message);
    void errorOccurred(const duet::Error& error);

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();
    void onConnectTimeout();

private:
    State state_ = State::Disconnected;
    std::unique_ptr<QTcpSocket> socket_;
    QByteArray read_buffer_;
    QTimer connect_timer_;
    QString dial_label_;
    uint32_t max_frame_bytes_ = protocol::kDefaultMaxFrameBytes;
    bool disconnect_signalled_ = false;

    void wireSocket();
    void unwireSocket();
    void failConnect(const Error& error);
    void finish();
};

/**
 * TransportServer - Listens for the incoming peer (host side).
 */
class TransportServer : public QObject {
    Q_OBJECT

public:
    explicit TransportServer(QObject* parent = nullptr);
    ~TransportServer() override;

    /**
     * Start listening.
     * @param address Interface to bind (loopback or any)
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<uint16_t, Error> listen(const QHostAddress& address, uint16_t port);

    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] QHostAddress address() const;
    [[nodiscard]] bool isListening() const;

signals:
    void newConnection(QTcpSocket* socket);

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
};

} // namespace duet::network
