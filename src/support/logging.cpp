#include "support/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>
#include <cstdio>

Q_LOGGING_CATEGORY(offgridSyncLog, "offgrid.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(offgridQueueLog, "offgrid.queue", QtInfoMsg)
Q_LOGGING_CATEGORY(offgridStorageLog, "offgrid.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(offgridNetLog, "offgrid.net", QtInfoMsg)

namespace offgrid::support {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/offgrid.log"));
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
    if (!dir.mkpath(QStringLiteral("."))) {
        std::fprintf(stderr, "offgrid: cannot create log directory %s\n",
                     qPrintable(dir.absolutePath()));
        return;
    }

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "offgrid: cannot open log file %s: %s\n",
                     qPrintable(s.path), qPrintable(s.file.errorString()));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fputs(bytes.constData(), stderr);
}

} // namespace

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("OFFGRID_DEBUG_SYNC");
}

void enable_sync_debug_output() {
    QLoggingCategory::setFilterRules(QStringLiteral("offgrid.*.debug=true"));
}

void install_file_logging(const QString& path) {
    {
        auto& s = state();
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
    }
    // Our message handler already stamps time/level/category.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

} // namespace offgrid::support
