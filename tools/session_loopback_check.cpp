#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>

#include <functional>

#include "app/console_editor.hpp"
#include "core/logging.hpp"
#include "session/session_manager.hpp"

namespace {

bool waitFor(const std::function<bool()>& done, int timeoutMs) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeoutMs);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    if (!done()) {
        loop.exec();
    }
    return done();
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    duet::enable_debug_logging();

    duet::SessionConfig config;
    config.port = 0;

    duet::app::ConsoleEditor hostEditor(QStringLiteral("print(1)"));
    duet::app::ConsoleEditor clientEditor;
    duet::app::FixedApprover approver(true);

    duet::session::SessionManager host(config);
    duet::session::SessionManager client(config);
    host.setEditor(&hostEditor);
    host.setApprover(&approver);
    client.setEditor(&clientEditor);

    QObject::connect(&hostEditor, &duet::app::ConsoleEditor::documentChanged,
                     &host, &duet::session::SessionManager::onLocalDocumentChanged);
    QObject::connect(&clientEditor, &duet::app::ConsoleEditor::documentChanged,
                     &client, &duet::session::SessionManager::onLocalDocumentChanged);
    QObject::connect(&hostEditor, &duet::app::ConsoleEditor::editAttemptedWhileReadOnly,
                     &host, &duet::session::SessionManager::onUserRequestedReclaim);

    QObject::connect(&host, &duet::session::SessionManager::sessionError, &app,
                     [](const duet::Error& error) {
        qCritical().noquote() << "host error:" << QString::fromStdString(error.message);
    });
    QObject::connect(&client, &duet::session::SessionManager::sessionError, &app,
                     [](const duet::Error& error) {
        qCritical().noquote() << "client error:" << QString::fromStdString(error.message);
    });

    auto hosted = host.startHosting(0);
    if (hosted.is_err()) {
        return 1;
    }
    if (client.connectToHost(QStringLiteral("127.0.0.1"), hosted.unwrap()).is_err()) {
        return 1;
    }

    // Connect and initial push
    if (!waitFor([&]() {
            return host.state().isConnected() && client.state().isConnected() &&
                   clientEditor.documentText() == QStringLiteral("print(1)");
        }, 3000)) {
        qCritical() << "connect/push failed";
        return 2;
    }

    // Host edit reaches the client
    hostEditor.setText(QStringLiteral("print(2)"));
    if (!waitFor([&]() { return clientEditor.documentText() == QStringLiteral("print(2)"); }, 3000)) {
        qCritical() << "host edit not mirrored";
        return 2;
    }

    // Control handover
    client.requestControl();
    if (!waitFor([&]() { return client.hasControl() && !host.hasControl(); }, 3000)) {
        qCritical() << "grant failed";
        return 2;
    }

    clientEditor.setText(QStringLiteral("x=1"));
    if (!waitFor([&]() { return hostEditor.documentText() == QStringLiteral("x=1"); }, 3000)) {
        qCritical() << "client edit not mirrored";
        return 2;
    }

    // Host takes control back by typing
    hostEditor.setText(QStringLiteral("y=2"));
    if (!waitFor([&]() { return host.hasControl() && !client.hasControl(); }, 3000)) {
        qCritical() << "reclaim failed";
        return 2;
    }

    client.stopSession();
    if (!waitFor([&]() { return host.state().isIdle(); }, 3000)) {
        qCritical() << "host did not notice the disconnect";
        return 2;
    }
    return 0;
}
