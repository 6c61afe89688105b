#include "app/console_shell.hpp"

#include <cstdio>
#include <utility>

namespace duet::app {

using session::Role;

namespace {

// Splits "cmd rest of line" into the command word and its argument.
std::pair<QString, QString> split_command(const QString& line) {
    const auto trimmed = line.trimmed();
    const auto space = trimmed.indexOf(QLatin1Char(' '));
    if (space < 0) {
        return {trimmed.toLower(), QString{}};
    }
    return {trimmed.left(space).toLower(), trimmed.mid(space + 1)};
}

} // namespace

ConsoleShell::ConsoleShell(session::SessionManager& manager, ConsoleEditor& editor,
                           QTextStream& out, QObject* parent)
    : QObject(parent)
    , manager_(manager)
    , editor_(editor)
    , out_(out)
{
    wireEvents();
}

void ConsoleShell::wireEvents() {
    connect(&editor_, &ConsoleEditor::documentChanged,
            &manager_, &session::SessionManager::onLocalDocumentChanged);

    connect(&editor_, &ConsoleEditor::editAttemptedWhileReadOnly, this, [this]() {
        if (manager_.role() == Role::Host) {
            out_ << "reclaiming control\n";
            out_.flush();
            manager_.onUserRequestedReclaim();
        } else {
            out_ << "read-only: request control first\n";
            out_.flush();
        }
    });

    connect(&manager_, &session::SessionManager::hostingStarted, this,
            [this](const QString& address, quint16 port) {
        out_ << "hosting on " << address << ':' << port << '\n';
        out_.flush();
    });
    connect(&manager_, &session::SessionManager::peerConnected, this,
            [this](const QString& address, quint16 port) {
        out_ << "peer connected " << address << ':' << port << '\n';
        out_.flush();
    });
    connect(&manager_, &session::SessionManager::peerDisconnected, this, [this]() {
        out_ << "peer disconnected\n";
        out_.flush();
    });
    connect(&manager_, &session::SessionManager::controlChanged, this, [this](bool has_control) {
        out_ << (has_control ? "you have control\n" : "you are viewing\n");
        out_.flush();
    });
    connect(&manager_, &session::SessionManager::controlRequestReceived, this,
            [this](const QString& peer) {
        out_ << "control requested by " << peer << " (approve/decline)\n";
        out_.flush();
    });
    connect(&manager_, &session::SessionManager::controlRequestDeclined, this, [this]() {
        out_ << "control request declined\n";
        out_.flush();
    });
    connect(&manager_, &session::SessionManager::sessionError, this, [this](const Error& error) {
        out_ << "error [" << to_string(error.kind) << "] "
             << QString::fromStdString(error.message) << '\n';
        out_.flush();
    });
    connect(&editor_, &ConsoleEditor::documentChanged, this, [this]() {
        if (editor_.isReadOnly()) {
            out_ << "document: " << editor_.documentText() << '\n';
            out_.flush();
        }
    });
}

void ConsoleShell::start() {
    if (!stdin_.open(fileno(stdin), QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        out_ << "cannot read stdin: " << stdin_.errorString() << '\n';
        out_.flush();
        return;
    }
    notifier_ = std::make_unique<QSocketNotifier>(fileno(stdin), QSocketNotifier::Read);
    connect(notifier_.get(), &QSocketNotifier::activated,
            this, &ConsoleShell::onStdinReadable);
    printHelp();
}

void ConsoleShell::onStdinReadable() {
    const auto raw = stdin_.readLine();
    if (raw.isEmpty() && stdin_.atEnd()) {
        notifier_->setEnabled(false);
        emit quitRequested();
        return;
    }

    auto line = QString::fromUtf8(raw);
    if (line.endsWith(QLatin1Char('\n'))) {
        line.chop(1);
    }
    if (!execute(line)) {
        notifier_->setEnabled(false);
        emit quitRequested();
    }
}

bool ConsoleShell::execute(const QString& line) {
    const auto [command, argument] = split_command(line);

    if (command.isEmpty()) {
        return true;
    }
    if (command == QStringLiteral("set")) {
        editor_.setText(argument);
    } else if (command == QStringLiteral("append")) {
        editor_.appendText(argument);
    } else if (command == QStringLiteral("show")) {
        out_ << editor_.documentText() << '\n';
    } else if (command == QStringLiteral("status")) {
        printStatus();
    } else if (command == QStringLiteral("request")) {
        manager_.requestControl();
    } else if (command == QStringLiteral("reclaim")) {
        manager_.onUserRequestedReclaim();
    } else if (command == QStringLiteral("approve")) {
        manager_.resolveControlRequest(true);
    } else if (command == QStringLiteral("decline")) {
        manager_.resolveControlRequest(false);
    } else if (command == QStringLiteral("host")) {
        startHosting(argument.trimmed());
    } else if (command == QStringLiteral("connect")) {
        startConnecting(argument.trimmed());
    } else if (command == QStringLiteral("stop")) {
        manager_.stopSession();
    } else if (command == QStringLiteral("quit") || command == QStringLiteral("exit")) {
        return false;
    } else {
        out_ << "unknown command: " << command << '\n';
        printHelp();
    }
    out_.flush();
    return true;
}

void ConsoleShell::startHosting(const QString& argument) {
    uint16_t port = manager_.config().port;
    if (!argument.isEmpty()) {
        bool ok = false;
        const auto parsed = argument.toUShort(&ok);
        if (!ok) {
            out_ << "invalid port: " << argument << '\n';
            return;
        }
        port = parsed;
    }
    // Failures are printed by the sessionError handler.
    if (manager_.startHosting(port).is_err()) {
        out_ << "still idle\n";
    }
}

void ConsoleShell::startConnecting(const QString& argument) {
    if (argument.isEmpty()) {
        out_ << "usage: connect HOST[:PORT]\n";
        return;
    }
    auto endpoint = parse_endpoint(argument, manager_.config().port);
    if (endpoint.is_err()) {
        out_ << "invalid endpoint: " << QString::fromStdString(endpoint.unwrap_err().message) << '\n';
        return;
    }
    const auto& target = endpoint.unwrap();
    if (manager_.connectToHost(target.host, target.port).is_ok()) {
        out_ << "connecting to " << target.host << ':' << target.port << '\n';
    }
}

void ConsoleShell::printStatus() {
    out_ << session::describe(manager_.state());
    if (manager_.state().controlRequestPending()) {
        out_ << " request pending";
    }
    if (manager_.isDialing()) {
        out_ << " dialing";
    }
    const auto peer = manager_.peerLabel();
    if (!peer.isEmpty()) {
        out_ << " peer=" << peer;
    }
    if (manager_.listeningPort() != 0) {
        out_ << " port=" << manager_.listeningPort();
    }
    out_ << '\n';
}

void ConsoleShell::printHelp() {
    out_ << "commands: host [PORT] | connect HOST[:PORT] | set TEXT | append TEXT | show"
            " | status | request | reclaim | approve | decline | stop | quit\n";
    out_.flush();
}

} // namespace duet::app
