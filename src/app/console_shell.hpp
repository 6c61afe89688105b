#pragma once

#include "app/console_editor.hpp"
#include "session/session_manager.hpp"
#include <QFile>
#include <QObject>
#include <QSocketNotifier>
#include <QTextStream>
#include <memory>

namespace duet::app {

/**
 * ConsoleShell - Line-oriented command interface over stdin.
 *
 * Commands: host [PORT], connect HOST[:PORT], set TEXT, append TEXT,
 * show, status, request, reclaim, approve, decline, stop, quit. Session events are printed as they
 * happen.
 */
class ConsoleShell : public QObject {
    Q_OBJECT

public:
    ConsoleShell(session::SessionManager& manager, ConsoleEditor& editor,
                 QTextStream& out, QObject* parent = nullptr);

    /**
     * Begin reading stdin.
     */
    void start();

    /**
     * Run one command line. Returns false for quit.
     */
    bool execute(const QString& line);

signals:
    void quitRequested();

private slots:
    void onStdinReadable();

private:
    session::SessionManager& manager_;
    ConsoleEditor& editor_;
    QTextStream& out_;
    QFile stdin_;
    std::unique_ptr<QSocketNotifier> notifier_;

    void wireEvents();
    void startHosting(const QString& argument);
    void startConnecting(const QString& argument);
    void printStatus();
    void printHelp();
};

} // namespace duet::app
