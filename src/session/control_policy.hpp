#pragma once

#include "protocol/message.hpp"
#include "session/session_state.hpp"

#include <QString>
#include <optional>

namespace duet::session {

enum class ControlOutcome {
    Ignored,          // not applicable in the current state
    RequestSent,      // client asked for control
    AwaitApproval,    // host must ask its approver
    Granted,          // control moved to the client
    Declined,         // request refused; nobody's flag changes
    Revoked,          // client lost control to the host
    Reclaimed,        // host took control back
    RetainedNoPeer,   // host approved but nobody is there to receive control
    Anomaly           // message not valid for this role; state forced to the safe default
};

/**
 * ControlDecision - What to do in response to a control event.
 *
 * Fields left empty mean "unchanged" / "send nothing".
 */
struct ControlDecision {
    ControlOutcome outcome = ControlOutcome::Ignored;
    std::optional<bool> has_control;
    std::optional<bool> request_pending;
    std::optional<protocol::MessageKind> reply;
    QString reason;
};

/**
 * Client presses "request control".
 */
[[nodiscard]] ControlDecision decide_local_request(const SessionState& state);

/**
 * Host tries to edit while read-only.
 */
[[nodiscard]] ControlDecision decide_local_reclaim(const SessionState& state);

/**
 * Host answers a pending request. `peer_present` is false when the link
 * vanished between the request and the answer.
 */
[[nodiscard]] ControlDecision decide_approval(const SessionState& state,
                                              bool approved,
                                              bool peer_present);

/**
 * A control message arrived from the peer. TextUpdate is not a control
 * message and yields Ignored.
 */
[[nodiscard]] ControlDecision decide_inbound(const SessionState& state,
                                             protocol::MessageKind kind);

[[nodiscard]] const char* to_string(ControlOutcome outcome) noexcept;

} // namespace duet::session
