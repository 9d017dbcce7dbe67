#include "sync/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

Q_LOGGING_CATEGORY(folioSyncLog, "folio.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(folioStoreLog, "folio.store", QtInfoMsg)
Q_LOGGING_CATEGORY(folioCliLog, "folio.cli", QtInfoMsg)

namespace folio::sync {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/folio.log"));
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

struct LogFile {
    QMutex mu;
    QFile file;
    bool initialized = false;
    QtMessageHandler previous = nullptr;
};

LogFile& log_file() {
    static LogFile s{};
    return s;
}

void ensure_open(LogFile& s) {
    if (s.initialized) return;
    s.initialized = true;

    const auto path = compute_log_file_path();
    if (path.isEmpty()) {
        return;
    }
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        return;
    }
    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        s.file.setFileName(QString{});
    }
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = log_file();
    {
        QMutexLocker lock(&s.mu);
        ensure_open(s);

        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

        if (s.file.isOpen()) {
            s.file.write(line.toUtf8());
            s.file.flush();
        }
    }
    // Still echo to stderr for terminal runs.
    if (s.previous) {
        s.previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging() {
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    log_file().previous = qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

void enable_sync_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("folio.sync.debug=true\n"));
}

bool sync_debug_requested() {
    return qEnvironmentVariableIntValue("FOLIO_DEBUG_SYNC") == 1;
}

} // namespace folio::sync
