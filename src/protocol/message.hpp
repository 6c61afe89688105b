#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace duet::protocol {

/**
 * Message kinds carried by the session protocol.
 *
 * TextUpdate carries the full document; the four control kinds drive
 * the request/grant/revoke/decline handshake and carry no content.
 */
enum class MessageKind : uint8_t {
    TextUpdate,
    RequestControl,
    GrantControl,
    RevokeControl,
    DeclineControl
};

/**
 * Message - One wire frame's worth of protocol data.
 */
struct Message {
    MessageKind kind = MessageKind::TextUpdate;
    QString content;

    [[nodiscard]] static Message textUpdate(QString text) {
        return Message{MessageKind::TextUpdate, std::move(text)};
    }

    [[nodiscard]] static Message control(MessageKind kind) {
        return Message{kind, QString{}};
    }

    [[nodiscard]] bool isControl() const noexcept {
        return kind != MessageKind::TextUpdate;
    }

    bool operator==(const Message& other) const = default;
};

/**
 * Wire spelling of a kind ("TEXT_UPDATE", "REQ_CONTROL", ...).
 */
[[nodiscard]] QString wire_name(MessageKind kind);

/**
 * Parse a wire spelling; nullopt for anything unknown.
 */
[[nodiscard]] std::optional<MessageKind> parse_wire_name(const QString& name);

[[nodiscard]] const char* to_string(MessageKind kind) noexcept;

} // namespace duet::protocol
