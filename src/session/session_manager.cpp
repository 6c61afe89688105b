#include "session/session_manager.hpp"
#include "core/logging.hpp"

#include <utility>

namespace duet::session {

SessionManager::SessionManager(SessionConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
{
}

SessionManager::~SessionManager() {
    stopping_ = true;
    if (link_) {
        QObject::disconnect(link_.get(), nullptr, this, nullptr);
        link_->abort();
        link_.reset();
    }
    server_.reset();
}

void SessionManager::setEditor(EditorSurface* editor) {
    sync_.setEditor(editor);
    refreshEditor();
}

bool SessionManager::isDialing() const {
    return link_ && link_->state() == network::PeerLink::State::Connecting;
}

uint16_t SessionManager::listeningPort() const {
    return server_ && server_->isListening() ? server_->port() : 0;
}

QString SessionManager::peerLabel() const {
    return link_ ? link_->peerLabel() : QString{};
}

bool SessionManager::isBusy() const {
    return !state_.isIdle() || link_ != nullptr || server_ != nullptr;
}

// ============================================================================
// Hosting
// ============================================================================

Result<uint16_t> SessionManager::startHosting(uint16_t port) {
    if (isBusy()) {
        Error error{"Session is already active", ErrorKind::HostStartFailed};
        fail(error);
        return Result<uint16_t>::err(std::move(error));
    }

    server_ = std::make_unique<network::TransportServer>();
    connect(server_.get(), &network::TransportServer::newConnection,
            this, &SessionManager::onNewConnection);

    auto listen_result = server_->listen(config_.listen_address, port);
    if (listen_result.is_err()) {
        server_.reset();
        fail(listen_result.unwrap_err());
        return listen_result;
    }

    const uint16_t actual_port = listen_result.unwrap();
    const auto address = server_->address().toString();
    qCInfo(sessionLog) << "hosting on" << address << "port=" << actual_port;

    sync_.reset();
    SessionState next;
    next.toListening(actual_port);
    commit(next);

    emit hostingStarted(address, actual_port);
    return Result<uint16_t>::ok(actual_port);
}

void SessionManager::onNewConnection(QTcpSocket* socket) {
    if (!server_ || state_.isIdle() || state_.role() != Role::Host) {
        socket->abort();
        socket->deleteLater();
        return;
    }

    if (link_) {
        // One peer at a time: the newcomer replaces the current one.
        qCWarning(sessionLog) << "preempting peer" << link_->peerLabel() << "for"
                              << QStringLiteral("%1:%2")
                                     .arg(socket->peerAddress().toString())
                                     .arg(socket->peerPort());
        releaseLink(false);
        SessionState next;
        next.toListening(server_->port());
        commit(next);
        emit peerDisconnected();
    }

    link_ = makeLink();
    link_->adopt(socket);

    const auto address = link_->peerAddress().toString();
    const auto port = link_->peerPort();
    qCInfo(sessionLog) << "accepted peer" << link_->peerLabel();

    sync_.reset();
    SessionState next;
    next.toConnected(Role::Host);
    commit(next);
    emit peerConnected(address, port);

    // New peer starts from the host's document.
    if (auto snapshot = sync_.snapshot(); snapshot && !send(*snapshot)) {
        sync_.reset();
    }
}

// ============================================================================
// Dialing
// ============================================================================

Result<void> SessionManager::connectToHost(const QString& host, uint16_t port) {
    if (isBusy()) {
        Error error{"Session is already active", ErrorKind::ConnectFailed};
        fail(error);
        return Result<void>::err(std::move(error));
    }
    if (host.trimmed().isEmpty() || port == 0) {
        Error error{"Invalid host address " +
                        QStringLiteral("%1:%2").arg(host).arg(port).toStdString(),
                    ErrorKind::ConnectFailed};
        fail(error);
        return Result<void>::err(std::move(error));
    }

    qCInfo(sessionLog) << "connecting to" << host << "port=" << port;
    link_ = makeLink();
    link_->connectToHost(host, port, config_.connect_timeout);
    return Result<void>::ok();
}

void SessionManager::onLinkConnected() {
    if (sender() != link_.get()) {
        return;
    }

    qCInfo(sessionLog) << "connected to host" << link_->peerLabel();
    sync_.reset();
    SessionState next;
    next.toConnected(Role::Client);
    commit(next);
    emit peerConnected(link_->peerAddress().toString(), link_->peerPort());
}

void SessionManager::onLinkConnectFailed(const Error& error) {
    if (sender() != link_.get()) {
        return;
    }
    releaseLink(false);
    fail(error);
}

// ============================================================================
// Teardown
// ============================================================================

void SessionManager::stopSession() {
    if (state_.isIdle() && !link_ && !server_) {
        qCDebug(sessionLog) << "stop: already idle";
        return;
    }

    stopping_ = true;
    qCInfo(sessionLog) << "stop" << describe(state_);

    const bool had_peer = state_.isConnected();
    releaseLink(true);
    closeServer();
    sync_.reset();
    commit(SessionState{});

    stopping_ = false;
    if (had_peer) {
        emit peerDisconnected();
    }
}

void SessionManager::onLinkDisconnected() {
    if (stopping_ || sender() != link_.get()) {
        return;
    }
    handlePeerLoss(QStringLiteral("peer disconnected"));
}

void SessionManager::onLinkError(const Error& error) {
    if (stopping_ || sender() != link_.get()) {
        return;
    }
    // The link tears itself down after reporting; disconnected() follows.
    fail(error);
}

void SessionManager::handlePeerLoss(const QString& reason) {
    qCInfo(sessionLog) << reason << link_->peerLabel();
    releaseLink(false);
    sync_.reset();

    SessionState next;
    if (state_.role() == Role::Host && config_.relisten_on_peer_loss &&
        server_ && server_->isListening()) {
        next.toListening(server_->port());
    } else {
        closeServer();
    }
    commit(next);
    emit peerDisconnected();
}

std::unique_ptr<network::PeerLink> SessionManager::makeLink() {
    auto link = std::make_unique<network::PeerLink>();
    link->setMaxFrameBytes(config_.max_frame_bytes);
    connect(link.get(), &network::PeerLink::connected,
            this, &SessionManager::onLinkConnected);
    connect(link.get(), &network::PeerLink::connectFailed,
            this, &SessionManager::onLinkConnectFailed);
    connect(link.get(), &network::PeerLink::disconnected,
            this, &SessionManager::onLinkDisconnected);
    connect(link.get(), &network::PeerLink::errorOccurred,
            this, &SessionManager::onLinkError);
    connect(link.get(), &network::PeerLink::messageReceived,
            this, &SessionManager::onMessageReceived);
    return link;
}

void SessionManager::releaseLink(bool graceful) {
    if (!link_) {
        return;
    }

    // Detach first: close()/abort() may emit synchronously.
    QObject::disconnect(link_.get(), nullptr, this, nullptr);
    if (graceful) {
        link_->close();
    } else {
        link_->abort();
    }
    // May be inside one of the link's own signals.
    link_.release()->deleteLater();
}

void SessionManager::closeServer() {
    if (!server_) {
        return;
    }
    QObject::disconnect(server_.get(), nullptr, this, nullptr);
    server_->close();
    server_.release()->deleteLater();
}

// ============================================================================
// Inbound messages
// ============================================================================

void SessionManager::onMessageReceived(const protocol::Message& message) {
    if (sender() != link_.get()) {
        return;
    }

    if (message.kind == protocol::MessageKind::TextUpdate) {
        const auto outcome = sync_.applyRemote(state_, message.content);
        if (outcome == ApplyOutcome::IgnoredWhileWriter) {
            qCWarning(sessionLog) << "ignoring text update from" << link_->peerLabel()
                                  << "while holding control";
        } else {
            qCDebug(sessionLog) << "text update" << to_string(outcome)
                                << "chars=" << message.content.size();
        }
        return;
    }

    const auto decision = decide_inbound(state_, message.kind);
    if (decision.outcome == ControlOutcome::Anomaly) {
        qCWarning(sessionLog) << "protocol anomaly from" << link_->peerLabel() << ":"
                              << decision.reason;
        applyDecision(decision);
        emit sessionError(Error{decision.reason.toStdString(), ErrorKind::ProtocolAnomaly});
        return;
    }

    applyDecision(decision);

    switch (decision.outcome) {
        case ControlOutcome::AwaitApproval: {
            const auto peer = link_->peerLabel();
            emit controlRequestReceived(peer);
            if (approver_ != nullptr && link_) {
                resolveControlRequest(approver_->approveControlRequest(peer));
            }
            break;
        }
        case ControlOutcome::Declined:
            emit controlRequestDeclined();
            break;
        default:
            break;
    }
}

// ============================================================================
// Control arbitration
// ============================================================================

void SessionManager::requestControl() {
    applyDecision(decide_local_request(state_));
}

void SessionManager::resolveControlRequest(bool approved) {
    const bool peer_present = link_ && link_->isConnected();
    const auto decision = decide_approval(state_, approved, peer_present);
    if (decision.outcome == ControlOutcome::RetainedNoPeer) {
        qCWarning(sessionLog) << "approval with no peer connected; host keeps control";
    }
    applyDecision(decision);
}

void SessionManager::onUserRequestedReclaim() {
    applyDecision(decide_local_reclaim(state_));
}

void SessionManager::applyDecision(const ControlDecision& decision) {
    if (decision.outcome == ControlOutcome::Ignored) {
        if (!decision.reason.isEmpty()) {
            qCDebug(sessionLog) << "control event ignored:" << decision.reason;
        }
        if (decision.request_pending) {
            auto next = state_;
            next.setControlRequestPending(*decision.request_pending);
            commit(next);
        }
        return;
    }

    auto next = state_;
    if (decision.has_control) {
        next.setHasControl(*decision.has_control);
    }
    if (decision.request_pending) {
        next.setControlRequestPending(*decision.request_pending);
    }
    commit(next);

    qCInfo(sessionLog) << "control" << to_string(decision.outcome) << describe(state_);

    if (decision.reply) {
        send(protocol::Message::control(*decision.reply));
    }
}

// ============================================================================
// Outbound document
// ============================================================================

void SessionManager::onLocalDocumentChanged() {
    if (auto message = sync_.onLocalChange(state_)) {
        if (!send(*message)) {
            // The peer never saw this text.
            sync_.reset();
        }
    }
}

bool SessionManager::send(const protocol::Message& message) {
    if (!link_) {
        return false;
    }
    auto result = link_->send(message);
    if (result.is_err()) {
        // The link closes itself; disconnected() drives peer-loss handling.
        qCWarning(sessionLog) << "send" << protocol::to_string(message.kind) << "failed:"
                              << QString::fromStdString(result.unwrap_err().message);
        fail(result.unwrap_err());
        return false;
    }
    return true;
}

// ============================================================================
// State bookkeeping
// ============================================================================

void SessionManager::commit(const SessionState& next) {
    const auto previous = state_;
    state_ = next;
    if (previous == state_) {
        return;
    }

    qCInfo(sessionLog) << "state" << describe(previous) << "->" << describe(state_);
    refreshEditor();
    emit stateChanged();
    if (previous.hasControl() != state_.hasControl()) {
        emit controlChanged(state_.hasControl());
    }
}

void SessionManager::fail(const Error& error) {
    qCWarning(sessionLog) << to_string(error.kind) << QString::fromStdString(error.message);
    emit sessionError(error);
}

void SessionManager::refreshEditor() {
    if (auto* editor = sync_.editor()) {
        editor->setReadOnly(!state_.canEdit());
    }
}

} // namespace duet::session
