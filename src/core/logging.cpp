#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

namespace duet {

Q_LOGGING_CATEGORY(transportLog, "duet.transport")
Q_LOGGING_CATEGORY(sessionLog, "duet.session")

namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/duet.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool initialized = false;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.path);
    s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        ensure_open(s);

        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

        if (s.file.isOpen()) {
            s.file.write(line.toUtf8());
            s.file.flush();
        }
        previous = s.previous;
    }

    if (previous) {
        previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        s.initialized = false;
        if (s.file.isOpen()) {
            s.file.close();
        }
    }
    // Keep the console pattern stable; the file line is stamped by message_handler.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    const auto previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        QMutexLocker lock(&s.mu);
        s.previous = previous;
    }
}

QString default_log_file_path() {
    return compute_log_file_path();
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("duet.*.debug=true\n"));
}

} // namespace duet
