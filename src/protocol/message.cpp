#include "protocol/message.hpp"

#include <array>
#include <utility>

namespace duet::protocol {

namespace {

constexpr std::array<std::pair<MessageKind, const char*>, 5> kWireNames{{
    {MessageKind::TextUpdate, "TEXT_UPDATE"},
    {MessageKind::RequestControl, "REQ_CONTROL"},
    {MessageKind::GrantControl, "GRANT_CONTROL"},
    {MessageKind::RevokeControl, "REVOKE_CONTROL"},
    {MessageKind::DeclineControl, "DECLINE_CONTROL"},
}};

} // namespace

QString wire_name(MessageKind kind) {
    for (const auto& [k, name] : kWireNames) {
        if (k == kind) {
            return QString::fromLatin1(name);
        }
    }
    return QString{};
}

std::optional<MessageKind> parse_wire_name(const QString& name) {
    for (const auto& [k, wire] : kWireNames) {
        if (name == QLatin1String(wire)) {
            return k;
        }
    }
    return std::nullopt;
}

const char* to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::TextUpdate: return "TextUpdate";
        case MessageKind::RequestControl: return "RequestControl";
        case MessageKind::GrantControl: return "GrantControl";
        case MessageKind::RevokeControl: return "RevokeControl";
        case MessageKind::DeclineControl: return "DeclineControl";
    }
    return "Unknown";
}

} // namespace duet::protocol
