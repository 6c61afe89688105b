#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QSettings>
#include <QString>
#include <chrono>
#include <cstdint>

namespace duet {

inline constexpr uint16_t kDefaultPort = 54321;

/**
 * SessionConfig - Tunables for hosting and dialing.
 *
 * Loaded from QSettings under the "session/" group; DUET_PORT and
 * DUET_DEBUG_SESSION override the corresponding fields.
 */
struct SessionConfig {
    QHostAddress listen_address{QHostAddress::LocalHost};
    uint16_t port = kDefaultPort;
    std::chrono::milliseconds connect_timeout{3000};
    uint32_t max_frame_bytes = 16u * 1024u * 1024u;
    bool relisten_on_peer_loss = false;
    bool debug = false;
};

/**
 * Parse "loopback", "any" or a literal IPv4/IPv6 address.
 */
[[nodiscard]] Result<QHostAddress> parse_listen_address(const QString& text);

struct Endpoint {
    QString host;
    uint16_t port = 0;
};

/**
 * Parse "host", "host:port" or "[v6addr]:port". A missing port falls
 * back to `default_port`.
 */
[[nodiscard]] Result<Endpoint> parse_endpoint(const QString& text, uint16_t default_port);

[[nodiscard]] Result<SessionConfig> load_session_config(const QSettings& settings);

} // namespace duet
