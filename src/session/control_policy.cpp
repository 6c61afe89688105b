#include "session/control_policy.hpp"

namespace duet::session {

using protocol::MessageKind;

namespace {

ControlDecision ignored(QString reason) {
    ControlDecision d;
    d.reason = std::move(reason);
    return d;
}

ControlDecision decide_inbound_as_host(const SessionState& state, MessageKind kind) {
    const bool has_control = state.hasControl();

    if (kind == MessageKind::RequestControl) {
        if (!has_control) {
            // The client already holds control by our account; restate the grant.
            ControlDecision d;
            d.outcome = ControlOutcome::Granted;
            d.reply = MessageKind::GrantControl;
            d.reason = QStringLiteral("Client already holds control; grant re-sent");
            return d;
        }
        if (state.controlRequestPending()) {
            return ignored(QStringLiteral("A control request is already awaiting a decision"));
        }
        ControlDecision d;
        d.outcome = ControlOutcome::AwaitApproval;
        d.request_pending = true;
        return d;
    }

    // Grant/Revoke/Decline are only ever addressed to the client.
    ControlDecision d;
    d.outcome = ControlOutcome::Anomaly;
    d.reason = QStringLiteral("Host received %1").arg(QString::fromLatin1(protocol::to_string(kind)));
    if (!has_control) {
        d.has_control = true;
        d.reply = MessageKind::RevokeControl;
    }
    return d;
}

ControlDecision decide_inbound_as_client(const SessionState& state, MessageKind kind) {
    switch (kind) {
        case MessageKind::GrantControl: {
            ControlDecision d;
            d.outcome = ControlOutcome::Granted;
            d.has_control = true;
            d.request_pending = false;
            return d;
        }
        case MessageKind::RevokeControl: {
            ControlDecision d;
            d.outcome = ControlOutcome::Revoked;
            d.has_control = false;
            d.request_pending = false;
            return d;
        }
        case MessageKind::DeclineControl: {
            ControlDecision d;
            d.outcome = ControlOutcome::Declined;
            d.request_pending = false;
            return d;
        }
        case MessageKind::RequestControl: {
            ControlDecision d;
            d.outcome = ControlOutcome::Anomaly;
            d.reason = QStringLiteral("Client received RequestControl");
            if (state.hasControl()) {
                d.has_control = false;
            }
            return d;
        }
        case MessageKind::TextUpdate:
            break;
    }
    return ignored(QStringLiteral("Not a control message"));
}

} // namespace

ControlDecision decide_local_request(const SessionState& state) {
    if (!state.isConnected()) {
        return ignored(QStringLiteral("Not connected"));
    }
    if (state.role() != Role::Client) {
        return ignored(QStringLiteral("Only the client can request control"));
    }
    if (state.hasControl()) {
        return ignored(QStringLiteral("Already holding control"));
    }
    if (state.controlRequestPending()) {
        return ignored(QStringLiteral("A control request is already pending"));
    }
    ControlDecision d;
    d.outcome = ControlOutcome::RequestSent;
    d.request_pending = true;
    d.reply = MessageKind::RequestControl;
    return d;
}

ControlDecision decide_local_reclaim(const SessionState& state) {
    if (!state.isConnected()) {
        return ignored(QStringLiteral("Not connected"));
    }
    if (state.role() != Role::Host) {
        return ignored(QStringLiteral("Only the host can reclaim control"));
    }
    if (state.hasControl()) {
        return ignored(QStringLiteral("Already holding control"));
    }
    ControlDecision d;
    d.outcome = ControlOutcome::Reclaimed;
    d.has_control = true;
    d.reply = MessageKind::RevokeControl;
    return d;
}

ControlDecision decide_approval(const SessionState& state, bool approved, bool peer_present) {
    if (state.isConnected() && state.role() != Role::Host) {
        return ignored(QStringLiteral("Only the host answers control requests"));
    }
    // The requester may already be gone, with the session back to Idle.
    if (!state.isConnected() || !peer_present) {
        ControlDecision d;
        d.outcome = approved ? ControlOutcome::RetainedNoPeer : ControlOutcome::Ignored;
        d.request_pending = false;
        d.reason = QStringLiteral("No connected peer; host keeps control");
        return d;
    }
    if (!state.controlRequestPending()) {
        return ignored(QStringLiteral("No control request is pending"));
    }
    if (!state.hasControl()) {
        return ignored(QStringLiteral("Host does not hold control"));
    }

    ControlDecision d;
    d.request_pending = false;
    if (approved) {
        d.outcome = ControlOutcome::Granted;
        d.has_control = false;
        d.reply = MessageKind::GrantControl;
    } else {
        d.outcome = ControlOutcome::Declined;
        d.reply = MessageKind::DeclineControl;
    }
    return d;
}

ControlDecision decide_inbound(const SessionState& state, MessageKind kind) {
    if (kind == MessageKind::TextUpdate) {
        return ignored(QStringLiteral("Not a control message"));
    }
    if (!state.isConnected()) {
        return ignored(QStringLiteral("Not connected"));
    }
    if (state.role() == Role::Host) {
        return decide_inbound_as_host(state, kind);
    }
    return decide_inbound_as_client(state, kind);
}

const char* to_string(ControlOutcome outcome) noexcept {
    switch (outcome) {
        case ControlOutcome::Ignored: return "Ignored";
        case ControlOutcome::RequestSent: return "RequestSent";
        case ControlOutcome::AwaitApproval: return "AwaitApproval";
        case ControlOutcome::Granted: return "Granted";
        case ControlOutcome::Declined: return "Declined";
        case ControlOutcome::Revoked: return "Revoked";
        case ControlOutcome::Reclaimed: return "Reclaimed";
        case ControlOutcome::RetainedNoPeer: return "RetainedNoPeer";
        case ControlOutcome::Anomaly: return "Anomaly";
    }
    return "?";
}

} // namespace duet::session
