#include "sync/settings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace folio::sync {

namespace {

int read_positive(QSettings& settings, const QString& key, int fallback) {
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    return ok && value > 0 ? value : fallback;
}

} // namespace

SyncSettings SyncSettings::load(QSettings& settings) {
    SyncSettings out;
    settings.beginGroup(QStringLiteral("sync"));
    out.content_debounce_ms = read_positive(settings, QStringLiteral("contentDebounceMs"), out.content_debounce_ms);
    out.reparse_debounce_ms = read_positive(settings, QStringLiteral("reparseDebounceMs"), out.reparse_debounce_ms);
    out.drag_settle_ms = read_positive(settings, QStringLiteral("dragSettleMs"), out.drag_settle_ms);
    out.editor_grace_ms = read_positive(settings, QStringLiteral("editorGraceMs"), out.editor_grace_ms);
    out.ack_timeout_ms = read_positive(settings, QStringLiteral("ackTimeoutMs"), out.ack_timeout_ms);
    settings.endGroup();
    return out;
}

void SyncSettings::save(QSettings& settings) const {
    settings.beginGroup(QStringLiteral("sync"));
    settings.setValue(QStringLiteral("contentDebounceMs"), content_debounce_ms);
    settings.setValue(QStringLiteral("reparseDebounceMs"), reparse_debounce_ms);
    settings.setValue(QStringLiteral("dragSettleMs"), drag_settle_ms);
    settings.setValue(QStringLiteral("editorGraceMs"), editor_grace_ms);
    settings.setValue(QStringLiteral("ackTimeoutMs"), ack_timeout_ms);
    settings.endGroup();
}

QString resolve_database_path(const QString& override_path) {
    if (!override_path.isEmpty()) {
        return override_path;
    }
    const auto env = qEnvironmentVariable("FOLIO_DB_PATH");
    if (!env.isEmpty()) {
        return env;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        return QStringLiteral("folio.db");
    }
    QDir().mkpath(base);
    return QDir(base).filePath(QStringLiteral("folio.db"));
}

} // namespace folio::sync
