#pragma once

#include <string>

namespace duet {

/**
 * ErrorKind - Classifies failures surfaced by the sync core.
 */
enum class ErrorKind {
    Other,
    HostStartFailed,   // bind/listen failed, or a session is already active
    ConnectFailed,     // refused, unreachable, resolve failure, timeout
    FramingError,      // malformed frame on the wire
    WriteError,        // socket write failed or socket not connected
    PeerLost,          // socket error while connected
    ProtocolAnomaly,   // control message in an invalid role context
    InvalidConfig
};

[[nodiscard]] constexpr const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Other: return "Other";
        case ErrorKind::HostStartFailed: return "HostStartFailed";
        case ErrorKind::ConnectFailed: return "ConnectFailed";
        case ErrorKind::FramingError: return "FramingError";
        case ErrorKind::WriteError: return "WriteError";
        case ErrorKind::PeerLost: return "PeerLost";
        case ErrorKind::ProtocolAnomaly: return "ProtocolAnomaly";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

/**
 * Error - A failure with a human-readable message and a kind.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Other};

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Other)
        : message(std::move(msg)), kind(k) {}

    bool operator==(const Error& other) const = default;
};

} // namespace duet
