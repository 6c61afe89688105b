#pragma once

#include <QString>
#include <cstdint>
#include <variant>

namespace duet::session {

enum class Role {
    None,
    Host,
    Client
};

enum class LinkState {
    Idle,
    Listening,
    Connected
};

struct Idle {
    bool operator==(const Idle&) const = default;
};

/**
 * Host is bound and waiting for its peer.
 */
struct Listening {
    uint16_t port = 0;
    bool operator==(const Listening&) const = default;
};

/**
 * Host-with-peer or client-with-host. `has_control` says whether local
 * edits are transmitted; `control_request_pending` is set on the client
 * while its request is in flight and on the host while a decision is
 * outstanding.
 */
struct Connected {
    Role role = Role::Host;
    bool has_control = false;
    bool control_request_pending = false;
    bool operator==(const Connected&) const = default;
};

/**
 * SessionState - Role, link status and control ownership as one value.
 *
 * Lifecycle: Idle -> Listening -> Connected(Host, control) on the host,
 * Idle -> Connected(Client, no control) on the client, and back to Idle
 * from anywhere.
 */
class SessionState {
public:
    using Value = std::variant<Idle, Listening, Connected>;

    [[nodiscard]] const Value& value() const noexcept { return value_; }

    [[nodiscard]] Role role() const noexcept;
    [[nodiscard]] LinkState linkState() const noexcept;

    /**
     * Control flag: true while Listening (the host is the writer until
     * it hands control away), false while Idle.
     */
    [[nodiscard]] bool hasControl() const noexcept;
    [[nodiscard]] bool controlRequestPending() const noexcept;

    [[nodiscard]] bool isIdle() const noexcept { return std::holds_alternative<Idle>(value_); }
    [[nodiscard]] bool isListening() const noexcept { return std::holds_alternative<Listening>(value_); }
    [[nodiscard]] bool isConnected() const noexcept { return std::holds_alternative<Connected>(value_); }

    /**
     * Whether the local editor may be written to: always outside a
     * connected session, otherwise only while holding control.
     */
    [[nodiscard]] bool canEdit() const noexcept;

    void toIdle() noexcept { value_ = Idle{}; }
    void toListening(uint16_t port) noexcept { value_ = Listening{port}; }

    /**
     * Enter Connected; the host always starts as the writer.
     */
    void toConnected(Role role) noexcept;

    /**
     * Update the control flag. Returns true if the value changed; no-op
     * unless Connected.
     */
    bool setHasControl(bool has_control) noexcept;
    void setControlRequestPending(bool pending) noexcept;

    bool operator==(const SessionState&) const = default;

private:
    Value value_{Idle{}};
};

[[nodiscard]] const char* to_string(Role role) noexcept;
[[nodiscard]] const char* to_string(LinkState state) noexcept;

/**
 * Short form for logs, e.g. "(Host, Connected, control)".
 */
[[nodiscard]] QString describe(const SessionState& state);

} // namespace duet::session
