#include <catch2/catch_test_macros.hpp>

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QTextStream>

#include <functional>

#include "app/console_editor.hpp"
#include "app/console_shell.hpp"
#include "session/session_manager.hpp"

using namespace duet;
using duet::app::ConsoleEditor;
using duet::app::ConsoleShell;
using duet::session::SessionManager;

namespace {

bool spinUntil(const std::function<bool()>& predicate, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 25);
    }
    return true;
}

SessionConfig shell_config() {
    SessionConfig config;
    config.port = 0;
    config.connect_timeout = std::chrono::milliseconds(2000);
    return config;
}

// A shell writing into a string instead of stdout.
struct Console {
    QString output;
    QTextStream out{&output};
    ConsoleEditor editor;
    SessionManager manager{shell_config()};
    ConsoleShell shell{manager, editor, out};
};

} // namespace

TEST_CASE("Shell: host and stop can be repeated", "[integration][shell]") {
    Console host;

    REQUIRE(host.shell.execute(QStringLiteral("host 0")));
    if (!host.manager.state().isListening()) {
        SKIP("TCP listen not permitted in this environment");
    }
    REQUIRE(host.output.contains(QStringLiteral("hosting on")));

    REQUIRE(host.shell.execute(QStringLiteral("stop")));
    REQUIRE(host.manager.state().isIdle());

    REQUIRE(host.shell.execute(QStringLiteral("host")));
    REQUIRE(host.manager.state().isListening());
}

TEST_CASE("Shell: connect dials the given endpoint", "[integration][shell]") {
    Console host;
    Console client;

    host.shell.execute(QStringLiteral("host 0"));
    if (!host.manager.state().isListening()) {
        SKIP("TCP listen not permitted in this environment");
    }
    const auto port = host.manager.listeningPort();

    REQUIRE(client.shell.execute(QStringLiteral("connect 127.0.0.1:%1").arg(port)));
    REQUIRE(client.output.contains(QStringLiteral("connecting to 127.0.0.1:%1").arg(port)));
    REQUIRE(spinUntil([&]() {
        return client.manager.state().isConnected() && host.manager.state().isConnected();
    }, 3000));
    REQUIRE(client.output.contains(QStringLiteral("peer connected")));
}

TEST_CASE("Shell: bad host and connect arguments leave the session idle", "[integration][shell]") {
    Console console;

    REQUIRE(console.shell.execute(QStringLiteral("host abc")));
    REQUIRE(console.output.contains(QStringLiteral("invalid port")));

    REQUIRE(console.shell.execute(QStringLiteral("connect")));
    REQUIRE(console.output.contains(QStringLiteral("usage: connect")));

    REQUIRE(console.shell.execute(QStringLiteral("connect example.org:notaport")));
    REQUIRE(console.output.contains(QStringLiteral("invalid endpoint")));

    REQUIRE(console.manager.state().isIdle());
    REQUIRE_FALSE(console.manager.isDialing());
}
