#include "network/transport.hpp"
#include "core/logging.hpp"
#include <QMetaObject>
#include <QPointer>

namespace duet::network {

namespace {

// How long a closing socket may linger to flush pending writes.
constexpr int kCloseLingerMs = 5000;

QString endpoint_label(const QHostAddress& address, uint16_t port) {
    return QStringLiteral("%1:%2").arg(address.toString()).arg(port);
}

} // namespace

// ============================================================================
// PeerLink
// ============================================================================

PeerLink::PeerLink(QObject* parent)
    : QObject(parent)
{
    connect_timer_.setSingleShot(true);
    connect(&connect_timer_, &QTimer::timeout,
            this, &PeerLink::onConnectTimeout);
}

PeerLink::~PeerLink() {
    connect_timer_.stop();
    if (socket_) {
        unwireSocket();
        socket_->abort();
    }
}

void PeerLink::connectToHost(const QString& host, uint16_t port,
                             std::chrono::milliseconds timeout) {
    if (state_ != State::Disconnected || disconnect_signalled_) {
        QMetaObject::invokeMethod(this, [this]() {
            failConnect(Error{"Link is already in use", ErrorKind::ConnectFailed});
        }, Qt::QueuedConnection);
        return;
    }

    dial_label_ = QStringLiteral("%1:%2").arg(host).arg(port);
    if (host.trimmed().isEmpty() || port == 0) {
        QMetaObject::invokeMethod(this, [this]() {
            failConnect(Error{"Invalid host address " + dial_label_.toStdString(),
                              ErrorKind::ConnectFailed});
        }, Qt::QueuedConnection);
        return;
    }

    socket_ = std::make_unique<QTcpSocket>(this);
    wireSocket();
    state_ = State::Connecting;
    connect_timer_.start(timeout);

    qCDebug(transportLog) << "dialing" << dial_label_
                          << "timeout_ms=" << timeout.count();
    socket_->connectToHost(host.trimmed(), port);
}

void PeerLink::adopt(QTcpSocket* socket) {
    if (socket == nullptr) {
        return;
    }

    // Take ownership of socket
    socket->setParent(this);
    socket_.reset(socket);
    dial_label_ = endpoint_label(socket_->peerAddress(), socket_->peerPort());
    socket_->setSocketOption(QAbstractSocket::LowDelayOption, 1);
    wireSocket();
    state_ = State::Connected;

    if (socket_->state() != QAbstractSocket::ConnectedState) {
        QMetaObject::invokeMethod(this, &PeerLink::close, Qt::QueuedConnection);
    } else if (socket_->bytesAvailable() > 0) {
        // Bytes that arrived before adoption have no readyRead of their own.
        QMetaObject::invokeMethod(this, &PeerLink::onReadyRead, Qt::QueuedConnection);
    }
}

Result<void, Error> PeerLink::send(const protocol::Message& message) {
    if (state_ != State::Connected || !socket_) {
        return Result<void, Error>::err(Error{"Not connected", ErrorKind::WriteError});
    }

    const auto frame = protocol::encode_frame(message);
    const auto body_size = frame.size() - static_cast<qsizetype>(protocol::kLengthPrefixSize);
    if (body_size > static_cast<qsizetype>(max_frame_bytes_)) {
        // Unsendable; treated like a failed write.
        qCWarning(transportLog) << "refusing" << protocol::to_string(message.kind)
                                << "of" << body_size << "bytes to" << peerLabel();
        QMetaObject::invokeMethod(this, &PeerLink::close, Qt::QueuedConnection);
        return Result<void, Error>::err(Error{
            "Message of " + std::to_string(body_size) + " bytes exceeds the frame limit",
            ErrorKind::WriteError});
    }

    const auto written = socket_->write(frame);
    if (written != frame.size()) {
        const auto reason = socket_->errorString();
        qCWarning(transportLog) << "write to" << peerLabel() << "failed:" << reason;
        QMetaObject::invokeMethod(this, &PeerLink::close, Qt::QueuedConnection);
        return Result<void, Error>::err(Error{"Write failed: " + reason.toStdString(),
                                              ErrorKind::WriteError});
    }
    socket_->flush();

    qCDebug(transportLog) << "sent" << protocol::to_string(message.kind)
                          << "bytes=" << frame.size() << "to" << peerLabel();
    return Result<void, Error>::ok();
}

void PeerLink::close() {
    if (state_ == State::Disconnected) {
        return;
    }

    if (socket_) {
        unwireSocket();
        socket_->disconnectFromHost();
        if (socket_->state() != QAbstractSocket::UnconnectedState) {
            // Let the socket finish writing on its own, then delete itself.
            auto* raw = socket_.release();
            raw->setParent(nullptr);
            connect(raw, &QAbstractSocket::disconnected, raw, &QObject::deleteLater);
            QTimer::singleShot(kCloseLingerMs, raw, &QObject::deleteLater);
        }
    }
    qCDebug(transportLog) << "closed link to" << peerLabel();
    finish();
}

void PeerLink::abort() {
    if (state_ == State::Disconnected) {
        return;
    }

    if (socket_) {
        unwireSocket();
        socket_->abort();
    }
    qCDebug(transportLog) << "aborted link to" << peerLabel();
    finish();
}

QHostAddress PeerLink::peerAddress() const {
    return socket_ ? socket_->peerAddress() : QHostAddress{};
}

uint16_t PeerLink::peerPort() const {
    return socket_ ? socket_->peerPort() : 0;
}

QString PeerLink::peerLabel() const {
    return dial_label_;
}

void PeerLink::wireSocket() {
    connect(socket_.get(), &QTcpSocket::connected,
            this, &PeerLink::onSocketConnected);
    connect(socket_.get(), &QTcpSocket::disconnected,
            this, &PeerLink::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred,
            this, &PeerLink::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead,
            this, &PeerLink::onReadyRead);
}

void PeerLink::unwireSocket() {
    QObject::disconnect(socket_.get(), nullptr, this, nullptr);
}

void PeerLink::failConnect(const Error& error) {
    connect_timer_.stop();
    if (socket_) {
        unwireSocket();
        socket_->abort();
    }
    state_ = State::Disconnected;
    // A link that never connected never reports disconnected().
    disconnect_signalled_ = true;

    qCWarning(transportLog) << "connect to" << dial_label_ << "failed:"
                            << QString::fromStdString(error.message);
    emit connectFailed(error);
}

void PeerLink::finish() {
    connect_timer_.stop();
    const bool was_connected = state_ == State::Connected;
    state_ = State::Disconnected;
    if (disconnect_signalled_) {
        return;
    }
    disconnect_signalled_ = true;
    if (was_connected) {
        emit disconnected();
    }
}

void PeerLink::onSocketConnected() {
    connect_timer_.stop();
    socket_->setSocketOption(QAbstractSocket::LowDelayOption, 1);
    dial_label_ = endpoint_label(socket_->peerAddress(), socket_->peerPort());
    state_ = State::Connected;
    qCInfo(transportLog) << "connected to" << dial_label_;
    emit connected();
}

void PeerLink::onSocketDisconnected() {
    if (state_ == State::Connecting) {
        failConnect(Error{"Connection closed during connect", ErrorKind::ConnectFailed});
        return;
    }
    qCInfo(transportLog) << "peer" << peerLabel() << "disconnected";
    if (socket_) {
        unwireSocket();
    }
    finish();
}

void PeerLink::onSocketError(QAbstractSocket::SocketError err) {
    const auto reason = socket_ ? socket_->errorString() : QStringLiteral("unknown socket error");

    if (state_ == State::Connecting) {
        failConnect(Error{reason.toStdString(), ErrorKind::ConnectFailed});
        return;
    }
    if (state_ != State::Connected) {
        return;
    }

    if (err == QAbstractSocket::RemoteHostClosedError) {
        // Orderly shutdown by the peer; disconnected() follows.
        qCInfo(transportLog) << "peer" << peerLabel() << "closed the connection";
        return;
    }

    qCWarning(transportLog) << "socket error on" << peerLabel() << ":" << reason;
    QPointer<PeerLink> self(this);
    emit errorOccurred(Error{reason.toStdString(), ErrorKind::PeerLost});
    if (self) {
        abort();
    }
}

void PeerLink::onReadyRead() {
    if (!socket_) {
        return;
    }
    read_buffer_.append(socket_->readAll());

    QPointer<PeerLink> self(this);
    while (self && state_ == State::Connected && !read_buffer_.isEmpty()) {
        auto decoded = protocol::decode_frame(read_buffer_, max_frame_bytes_);
        if (decoded.is_err()) {
            const auto failure = decoded.unwrap_err();
            if (!failure.recoverable) {
                qCWarning(transportLog) << "unrecoverable framing error from" << peerLabel()
                                        << ":" << QString::fromStdString(failure.error.message);
                read_buffer_.clear();
                emit errorOccurred(failure.error);
                if (self) {
                    abort();
                }
                return;
            }
            qCWarning(transportLog) << "discarding malformed frame from" << peerLabel()
                                    << "bytes=" << failure.consumed
                                    << ":" << QString::fromStdString(failure.error.message);
            read_buffer_.remove(0, failure.consumed);
            continue;
        }

        auto frame = std::move(decoded).unwrap();
        if (!frame.message) {
            // Need more data
            return;
        }
        read_buffer_.remove(0, frame.consumed);

        qCDebug(transportLog) << "received" << protocol::to_string(frame.message->kind)
                              << "bytes=" << frame.consumed << "from" << peerLabel();
        emit messageReceived(*frame.message);
    }
}

void PeerLink::onConnectTimeout() {
    if (state_ != State::Connecting) {
        return;
    }
    failConnect(Error{"Connection to " + dial_label_.toStdString() + " timed out after " +
                          std::to_string(connect_timer_.interval()) + " ms",
                      ErrorKind::ConnectFailed});
}

// ============================================================================
// TransportServer
// ============================================================================

TransportServer::TransportServer(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &TransportServer::onNewConnection);
}

TransportServer::~TransportServer() {
    close();
}

Result<uint16_t, Error> TransportServer::listen(const QHostAddress& address, uint16_t port) {
    if (server_->isListening()) {
        return Result<uint16_t, Error>::err(
            Error{"Server is already listening", ErrorKind::HostStartFailed});
    }
    if (!server_->listen(address, port)) {
        return Result<uint16_t, Error>::err(
            Error{"Server could not start: " + server_->errorString().toStdString(),
                  ErrorKind::HostStartFailed});
    }

    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void TransportServer::close() {
    server_->close();
}

uint16_t TransportServer::port() const {
    return server_->serverPort();
}

QHostAddress TransportServer::address() const {
    return server_->serverAddress();
}

bool TransportServer::isListening() const {
    return server_->isListening();
}

void TransportServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        if (socket) {
            emit newConnection(socket);
        }
    }
}

} // namespace duet::network
