#include "session/session_state.hpp"

namespace duet::session {

Role SessionState::role() const noexcept {
    if (std::holds_alternative<Listening>(value_)) {
        return Role::Host;
    }
    if (const auto* connected = std::get_if<Connected>(&value_)) {
        return connected->role;
    }
    return Role::None;
}

LinkState SessionState::linkState() const noexcept {
    switch (value_.index()) {
        case 1: return LinkState::Listening;
        case 2: return LinkState::Connected;
        default: return LinkState::Idle;
    }
}

bool SessionState::hasControl() const noexcept {
    if (std::holds_alternative<Listening>(value_)) {
        return true;
    }
    const auto* connected = std::get_if<Connected>(&value_);
    return connected != nullptr && connected->has_control;
}

bool SessionState::controlRequestPending() const noexcept {
    const auto* connected = std::get_if<Connected>(&value_);
    return connected != nullptr && connected->control_request_pending;
}

bool SessionState::canEdit() const noexcept {
    const auto* connected = std::get_if<Connected>(&value_);
    return connected == nullptr || connected->has_control;
}

void SessionState::toConnected(Role role) noexcept {
    value_ = Connected{role, role == Role::Host, false};
}

bool SessionState::setHasControl(bool has_control) noexcept {
    auto* connected = std::get_if<Connected>(&value_);
    if (connected == nullptr || connected->has_control == has_control) {
        return false;
    }
    connected->has_control = has_control;
    return true;
}

void SessionState::setControlRequestPending(bool pending) noexcept {
    if (auto* connected = std::get_if<Connected>(&value_)) {
        connected->control_request_pending = pending;
    }
}

const char* to_string(Role role) noexcept {
    switch (role) {
        case Role::None: return "None";
        case Role::Host: return "Host";
        case Role::Client: return "Client";
    }
    return "?";
}

const char* to_string(LinkState state) noexcept {
    switch (state) {
        case LinkState::Idle: return "Idle";
        case LinkState::Listening: return "Listening";
        case LinkState::Connected: return "Connected";
    }
    return "?";
}

QString describe(const SessionState& state) {
    return QStringLiteral("(%1, %2, %3)")
        .arg(QString::fromLatin1(to_string(state.role())),
             QString::fromLatin1(to_string(state.linkState())),
             state.hasControl() ? QStringLiteral("control") : QStringLiteral("viewer"));
}

} // namespace duet::session
