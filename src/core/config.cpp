#include "core/config.hpp"

#include <QtGlobal>

namespace duet {

namespace {

constexpr const char* kSettingsListenAddress = "session/listen_address";
constexpr const char* kSettingsPort = "session/port";
constexpr const char* kSettingsConnectTimeout = "session/connect_timeout_ms";
constexpr const char* kSettingsMaxFrameBytes = "session/max_frame_bytes";
constexpr const char* kSettingsRelisten = "session/relisten_on_peer_loss";

constexpr uint32_t kMinFrameBytes = 64;

Error invalid(const QString& message) {
    return Error{message.toStdString(), ErrorKind::InvalidConfig};
}

Result<uint16_t> parse_port(const QString& text) {
    bool ok = false;
    const auto value = text.trimmed().toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return Result<uint16_t>::err(invalid(QStringLiteral("Invalid port '%1'").arg(text)));
    }
    return Result<uint16_t>::ok(static_cast<uint16_t>(value));
}

} // namespace

Result<QHostAddress> parse_listen_address(const QString& text) {
    const auto trimmed = text.trimmed();
    if (trimmed.isEmpty() || trimmed.compare(QStringLiteral("loopback"), Qt::CaseInsensitive) == 0) {
        return Result<QHostAddress>::ok(QHostAddress(QHostAddress::LocalHost));
    }
    if (trimmed.compare(QStringLiteral("any"), Qt::CaseInsensitive) == 0) {
        return Result<QHostAddress>::ok(QHostAddress(QHostAddress::Any));
    }
    QHostAddress address;
    if (!address.setAddress(trimmed)) {
        return Result<QHostAddress>::err(
            invalid(QStringLiteral("Invalid listen address '%1'").arg(trimmed)));
    }
    return Result<QHostAddress>::ok(address);
}

Result<Endpoint> parse_endpoint(const QString& text, uint16_t default_port) {
    const auto trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return Result<Endpoint>::err(Error{"Host address is empty", ErrorKind::ConnectFailed});
    }

    Endpoint endpoint;
    endpoint.port = default_port;

    if (trimmed.startsWith(QLatin1Char('['))) {
        const auto close = trimmed.indexOf(QLatin1Char(']'));
        if (close < 0) {
            return Result<Endpoint>::err(Error{"Unterminated IPv6 address", ErrorKind::ConnectFailed});
        }
        endpoint.host = trimmed.mid(1, close - 1);
        const auto rest = trimmed.mid(close + 1);
        if (!rest.isEmpty()) {
            if (!rest.startsWith(QLatin1Char(':'))) {
                return Result<Endpoint>::err(Error{"Invalid address format", ErrorKind::ConnectFailed});
            }
            auto port = parse_port(rest.mid(1));
            if (port.is_err()) {
                return Result<Endpoint>::err(Error{port.unwrap_err().message, ErrorKind::ConnectFailed});
            }
            endpoint.port = port.unwrap();
        }
    } else if (trimmed.count(QLatin1Char(':')) == 1) {
        const auto colon = trimmed.indexOf(QLatin1Char(':'));
        endpoint.host = trimmed.left(colon).trimmed();
        auto port = parse_port(trimmed.mid(colon + 1));
        if (port.is_err()) {
            return Result<Endpoint>::err(Error{port.unwrap_err().message, ErrorKind::ConnectFailed});
        }
        endpoint.port = port.unwrap();
    } else {
        // Bare host name, IPv4 address or unbracketed IPv6 address.
        endpoint.host = trimmed;
    }

    if (endpoint.host.isEmpty()) {
        return Result<Endpoint>::err(Error{"Host address is empty", ErrorKind::ConnectFailed});
    }
    if (endpoint.port == 0) {
        return Result<Endpoint>::err(Error{"Port must be between 1 and 65535", ErrorKind::ConnectFailed});
    }
    return Result<Endpoint>::ok(endpoint);
}

Result<SessionConfig> load_session_config(const QSettings& settings) {
    SessionConfig config;

    if (settings.contains(QLatin1String(kSettingsListenAddress))) {
        auto address = parse_listen_address(settings.value(QLatin1String(kSettingsListenAddress)).toString());
        if (address.is_err()) {
            return Result<SessionConfig>::err(address.unwrap_err());
        }
        config.listen_address = address.unwrap();
    }

    if (settings.contains(QLatin1String(kSettingsPort))) {
        auto port = parse_port(settings.value(QLatin1String(kSettingsPort)).toString());
        if (port.is_err()) {
            return Result<SessionConfig>::err(port.unwrap_err());
        }
        config.port = port.unwrap();
    }

    if (settings.contains(QLatin1String(kSettingsConnectTimeout))) {
        bool ok = false;
        const auto ms = settings.value(QLatin1String(kSettingsConnectTimeout)).toString().toLongLong(&ok);
        if (!ok || ms <= 0) {
            return Result<SessionConfig>::err(invalid(QStringLiteral("connect_timeout_ms must be positive")));
        }
        config.connect_timeout = std::chrono::milliseconds(ms);
    }

    if (settings.contains(QLatin1String(kSettingsMaxFrameBytes))) {
        bool ok = false;
        const auto bytes = settings.value(QLatin1String(kSettingsMaxFrameBytes)).toString().toUInt(&ok);
        if (!ok || bytes < kMinFrameBytes) {
            return Result<SessionConfig>::err(
                invalid(QStringLiteral("max_frame_bytes must be at least %1").arg(kMinFrameBytes)));
        }
        config.max_frame_bytes = bytes;
    }

    config.relisten_on_peer_loss = settings.value(QLatin1String(kSettingsRelisten), false).toBool();

    if (qEnvironmentVariableIsSet("DUET_PORT")) {
        auto port = parse_port(qEnvironmentVariable("DUET_PORT"));
        if (port.is_err()) {
            return Result<SessionConfig>::err(port.unwrap_err());
        }
        config.port = port.unwrap();
    }
    config.debug = qEnvironmentVariableIsSet("DUET_DEBUG_SESSION");

    return Result<SessionConfig>::ok(config);
}

} // namespace duet
