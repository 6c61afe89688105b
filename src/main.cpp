#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QSettings>
#include <QTextStream>

#include "app/console_editor.hpp"
#include "app/console_shell.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "session/session_manager.hpp"

#include <memory>

namespace {

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Duet");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Duet");
    app.setOrganizationDomain("duet.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Duet two-party text session"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Port to listen on when hosting (0 picks a free port)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption listenAddressOption(
        QStringList{QStringLiteral("listen-address")},
        QStringLiteral("Interface to bind when hosting: loopback, any, or an IP address."),
        QStringLiteral("address"));
    parser.addOption(listenAddressOption);

    const QCommandLineOption fileOption(
        QStringList{QStringLiteral("file")},
        QStringLiteral("Load the initial document from a file."),
        QStringLiteral("path"));
    parser.addOption(fileOption);

    const QCommandLineOption autoApproveOption(
        QStringList{QStringLiteral("auto-approve")},
        QStringLiteral("Grant every control request without asking."));
    parser.addOption(autoApproveOption);

    const QCommandLineOption autoDeclineOption(
        QStringList{QStringLiteral("auto-decline")},
        QStringLiteral("Decline every control request without asking."));
    parser.addOption(autoDeclineOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log lines to this file instead of the default location."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugSessionOption(
        QStringList{QStringLiteral("debug-session")},
        QStringLiteral("Enable session debug logging (also sets DUET_DEBUG_SESSION=1)."));
    parser.addOption(debugSessionOption);

    parser.addPositionalArgument(QStringLiteral("mode"),
                                 QStringLiteral("'host' or 'connect'."));
    parser.addPositionalArgument(QStringLiteral("endpoint"),
                                 QStringLiteral("HOST[:PORT] for 'connect'."),
                                 QStringLiteral("[endpoint]"));
    parser.process(app);

    if (parser.isSet(debugSessionOption)) {
        qputenv("DUET_DEBUG_SESSION", "1");
    }
    if (parser.isSet(autoApproveOption) && parser.isSet(autoDeclineOption)) {
        return fail(QStringLiteral("--auto-approve and --auto-decline are mutually exclusive"));
    }

    QSettings settings;
    auto config_result = duet::load_session_config(settings);
    if (config_result.is_err()) {
        return fail(QString::fromStdString(config_result.unwrap_err().message));
    }
    auto config = std::move(config_result).unwrap();

    if (parser.isSet(listenAddressOption)) {
        auto address = duet::parse_listen_address(parser.value(listenAddressOption));
        if (address.is_err()) {
            return fail(QString::fromStdString(address.unwrap_err().message));
        }
        config.listen_address = address.unwrap();
    }

    if (config.debug) {
        duet::enable_debug_logging();
    }
    duet::install_file_logging(parser.value(logFileOption));
    qInfo() << "Duet: logging to"
            << (parser.isSet(logFileOption) ? parser.value(logFileOption)
                                            : duet::default_log_file_path());
    if (config.debug) {
        qInfo() << "Duet: session debug enabled";
    }

    QString initial_text;
    if (parser.isSet(fileOption)) {
        QFile file(parser.value(fileOption));
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
            return fail(QStringLiteral("Cannot open %1: %2")
                            .arg(parser.value(fileOption), file.errorString()));
        }
        initial_text = QString::fromUtf8(file.readAll());
    }

    duet::app::ConsoleEditor editor(initial_text);
    duet::session::SessionManager manager(config);
    manager.setEditor(&editor);

    std::unique_ptr<duet::app::FixedApprover> approver;
    if (parser.isSet(autoApproveOption) || parser.isSet(autoDeclineOption)) {
        approver = std::make_unique<duet::app::FixedApprover>(parser.isSet(autoApproveOption));
        manager.setApprover(approver.get());
    }

    QTextStream out(stdout);
    duet::app::ConsoleShell shell(manager, editor, out);
    QObject::connect(&shell, &duet::app::ConsoleShell::quitRequested, &app, [&]() {
        manager.stopSession();
        app.quit();
    });

    const auto positional = parser.positionalArguments();
    const auto mode = positional.isEmpty() ? QString{} : positional.first();

    if (mode == QStringLiteral("host")) {
        uint16_t port = config.port;
        if (parser.isSet(portOption)) {
            bool ok = false;
            const auto value = parser.value(portOption).toUInt(&ok);
            if (!ok || value > 65535) {
                return fail(QStringLiteral("Invalid port '%1'").arg(parser.value(portOption)));
            }
            port = static_cast<uint16_t>(value);
        }
        if (manager.startHosting(port).is_err()) {
            return 1;
        }
    } else if (mode == QStringLiteral("connect")) {
        if (positional.size() < 2) {
            return fail(QStringLiteral("connect needs HOST[:PORT]"));
        }
        auto endpoint = duet::parse_endpoint(positional.at(1), config.port);
        if (endpoint.is_err()) {
            return fail(QString::fromStdString(endpoint.unwrap_err().message));
        }
        if (manager.connectToHost(endpoint.unwrap().host, endpoint.unwrap().port).is_err()) {
            return 1;
        }
    } else {
        parser.showHelp(1);
    }

    shell.start();
    return app.exec();
}
