#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace duet;

namespace {

class EnvVarGuard {
public:
    explicit EnvVarGuard(const char* name)
        : name_(name)
        , old_(qgetenv(name))
        , had_(qEnvironmentVariableIsSet(name))
    {
        qunsetenv(name);
    }

    ~EnvVarGuard() {
        if (had_) {
            qputenv(name_.constData(), old_);
        } else {
            qunsetenv(name_.constData());
        }
    }

private:
    QByteArray name_;
    QByteArray old_;
    bool had_ = false;
};

} // namespace

TEST_CASE("Default config binds loopback on 54321", "[config]") {
    EnvVarGuard port("DUET_PORT");
    EnvVarGuard debug("DUET_DEBUG_SESSION");
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("duet.ini")), QSettings::IniFormat);

    auto config = load_session_config(settings);
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().port == kDefaultPort);
    REQUIRE(config.unwrap().listen_address == QHostAddress(QHostAddress::LocalHost));
    REQUIRE(config.unwrap().connect_timeout == std::chrono::milliseconds(3000));
    REQUIRE_FALSE(config.unwrap().relisten_on_peer_loss);
    REQUIRE_FALSE(config.unwrap().debug);
}

TEST_CASE("Settings values override defaults", "[config]") {
    EnvVarGuard port("DUET_PORT");
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("duet.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("session/listen_address"), QStringLiteral("any"));
    settings.setValue(QStringLiteral("session/port"), 6000);
    settings.setValue(QStringLiteral("session/connect_timeout_ms"), 750);
    settings.setValue(QStringLiteral("session/max_frame_bytes"), 4096);
    settings.setValue(QStringLiteral("session/relisten_on_peer_loss"), true);

    auto config = load_session_config(settings);
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().listen_address == QHostAddress(QHostAddress::Any));
    REQUIRE(config.unwrap().port == 6000);
    REQUIRE(config.unwrap().connect_timeout == std::chrono::milliseconds(750));
    REQUIRE(config.unwrap().max_frame_bytes == 4096);
    REQUIRE(config.unwrap().relisten_on_peer_loss);
}

TEST_CASE("Environment overrides port and debug", "[config]") {
    EnvVarGuard port("DUET_PORT");
    EnvVarGuard debug("DUET_DEBUG_SESSION");
    qputenv("DUET_PORT", "7001");
    qputenv("DUET_DEBUG_SESSION", "1");
    QTemporaryDir dir;
    QSettings settings(dir.filePath(QStringLiteral("duet.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("session/port"), 6000);

    auto config = load_session_config(settings);
    REQUIRE(config.is_ok());
    REQUIRE(config.unwrap().port == 7001);
    REQUIRE(config.unwrap().debug);
}

TEST_CASE("Invalid settings are rejected", "[config]") {
    EnvVarGuard port("DUET_PORT");
    QTemporaryDir dir;

    SECTION("port out of range") {
        QSettings settings(dir.filePath(QStringLiteral("a.ini")), QSettings::IniFormat);
        settings.setValue(QStringLiteral("session/port"), 70000);
        auto config = load_session_config(settings);
        REQUIRE(config.is_err());
        REQUIRE(config.unwrap_err().kind == ErrorKind::InvalidConfig);
    }
    SECTION("zero timeout") {
        QSettings settings(dir.filePath(QStringLiteral("b.ini")), QSettings::IniFormat);
        settings.setValue(QStringLiteral("session/connect_timeout_ms"), 0);
        REQUIRE(load_session_config(settings).is_err());
    }
    SECTION("tiny frame cap") {
        QSettings settings(dir.filePath(QStringLiteral("c.ini")), QSettings::IniFormat);
        settings.setValue(QStringLiteral("session/max_frame_bytes"), 8);
        REQUIRE(load_session_config(settings).is_err());
    }
    SECTION("bad listen address") {
        QSettings settings(dir.filePath(QStringLiteral("d.ini")), QSettings::IniFormat);
        settings.setValue(QStringLiteral("session/listen_address"), QStringLiteral("nowhere"));
        REQUIRE(load_session_config(settings).is_err());
    }
    SECTION("bad DUET_PORT") {
        qputenv("DUET_PORT", "abc");
        QSettings settings(dir.filePath(QStringLiteral("e.ini")), QSettings::IniFormat);
        REQUIRE(load_session_config(settings).is_err());
    }
}

TEST_CASE("parse_endpoint handles host, host:port and bracketed IPv6", "[config]") {
    auto bare = parse_endpoint(QStringLiteral("127.0.0.1"), 54321);
    REQUIRE(bare.is_ok());
    REQUIRE(bare.unwrap().host == QStringLiteral("127.0.0.1"));
    REQUIRE(bare.unwrap().port == 54321);

    auto with_port = parse_endpoint(QStringLiteral("example.org:9000"), 54321);
    REQUIRE(with_port.is_ok());
    REQUIRE(with_port.unwrap().host == QStringLiteral("example.org"));
    REQUIRE(with_port.unwrap().port == 9000);

    auto v6 = parse_endpoint(QStringLiteral("[::1]:4000"), 54321);
    REQUIRE(v6.is_ok());
    REQUIRE(v6.unwrap().host == QStringLiteral("::1"));
    REQUIRE(v6.unwrap().port == 4000);

    auto bare_v6 = parse_endpoint(QStringLiteral("::1"), 54321);
    REQUIRE(bare_v6.is_ok());
    REQUIRE(bare_v6.unwrap().port == 54321);
}

TEST_CASE("parse_endpoint rejects malformed input as connect failures", "[config]") {
    for (const auto& text : {QStringLiteral(""), QStringLiteral(":80"), QStringLiteral("host:"),
                             QStringLiteral("host:0"), QStringLiteral("host:99999"),
                             QStringLiteral("[::1"), QStringLiteral("[::1]x")}) {
        auto endpoint = parse_endpoint(text, 54321);
        REQUIRE(endpoint.is_err());
        REQUIRE(endpoint.unwrap_err().kind == ErrorKind::ConnectFailed);
    }
}

TEST_CASE("parse_listen_address accepts keywords and literals", "[config]") {
    REQUIRE(parse_listen_address(QStringLiteral("loopback")).unwrap() == QHostAddress(QHostAddress::LocalHost));
    REQUIRE(parse_listen_address(QStringLiteral("ANY")).unwrap() == QHostAddress(QHostAddress::Any));
    REQUIRE(parse_listen_address(QStringLiteral("10.0.0.5")).unwrap() == QHostAddress(QStringLiteral("10.0.0.5")));
    REQUIRE(parse_listen_address(QStringLiteral("10.0.0.500")).is_err());
}
