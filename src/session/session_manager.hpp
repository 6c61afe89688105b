#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "network/transport.hpp"
#include "protocol/message.hpp"
#include "session/control_policy.hpp"
#include "session/document_sync.hpp"
#include "session/session_state.hpp"
#include <QObject>
#include <QString>
#include <memory>

namespace duet::session {

/**
 * SessionManager - Owns the one peer link and drives the session.
 *
 * Responsibilities:
 * - Hosting (listen, accept, preempt an older peer) and dialing
 * - Routing inbound messages to document sync or control arbitration
 * - Keeping the editor's read-only flag in step with control
 * - Returning to Idle on any disconnect, error or stop
 *
 * All work happens on the thread that owns the manager; socket reads
 * are driven by the Qt event loop.
 */
class SessionManager : public QObject {
    Q_OBJECT

public:
    explicit SessionManager(SessionConfig config = {}, QObject* parent = nullptr);
    ~SessionManager() override;

    /**
     * Attach the editor. Not owned; must outlive the manager or be
     * detached with setEditor(nullptr).
     */
    void setEditor(EditorSurface* editor);

    /**
     * Attach a synchronous approver. Without one, incoming requests wait
     * for resolveControlRequest().
     */
    void setApprover(ControlApprover* approver) { approver_ = approver; }

    /**
     * Idle -> Listening. Port 0 binds an ephemeral port.
     * @return The port actually bound
     */
    Result<uint16_t> startHosting(uint16_t port);
    Result<uint16_t> startHosting() { return startHosting(config_.port); }

    /**
     * Dial a host. The session stays Idle until the link is up;
     * asynchronous failures arrive through sessionError().
     */
    Result<void> connectToHost(const QString& host, uint16_t port);

    /**
     * Tear down whatever is active. Safe in any state.
     */
    void stopSession();

    // Control arbitration
    void requestControl();
    void resolveControlRequest(bool approved);
    void onUserRequestedReclaim();

    // Editor notifications
    void onLocalDocumentChanged();

    [[nodiscard]] const SessionState& state() const { return state_; }
    [[nodiscard]] Role role() const { return state_.role(); }
    [[nodiscard]] LinkState linkState() const { return state_.linkState(); }
    [[nodiscard]] bool hasControl() const { return state_.hasControl(); }
    [[nodiscard]] bool canEdit() const { return state_.canEdit(); }
    [[nodiscard]] bool isDialing() const;
    [[nodiscard]] uint16_t listeningPort() const;
    [[nodiscard]] QString peerLabel() const;
    [[nodiscard]] const SessionConfig& config() const { return config_; }

signals:
    void stateChanged();
    void hostingStarted(const QString& address, quint16 port);
    void peerConnected(const QString& address, quint16 port);
    void peerDisconnected();
    void controlChanged(bool has_control);
    void controlRequestReceived(const QString& peer);
    void controlRequestDeclined();
    void sessionError(const duet::Error& error);

private slots:
    void onNewConnection(QTcpSocket* socket);
    void onLinkConnected();
    void onLinkConnectFailed(const duet::Error& error);
    void onLinkDisconnected();
    void onLinkError(const duet::Error& error);
    void onMessageReceived(const duet::protocol::Message& message);

private:
    SessionConfig config_;
    SessionState state_;
    DocumentSync sync_;
    ControlApprover* approver_ = nullptr;

    std::unique_ptr<network::TransportServer> server_;
    std::unique_ptr<network::PeerLink> link_;

    bool stopping_ = false;

    [[nodiscard]] bool isBusy() const;
    std::unique_ptr<network::PeerLink> makeLink();
    void releaseLink(bool graceful);
    void closeServer();
    void handlePeerLoss(const QString& reason);

    void commit(const SessionState& next);
    void applyDecision(const ControlDecision& decision);
    bool send(const protocol::Message& message);
    void fail(const Error& error);
    void refreshEditor();
};

} // namespace duet::session
