#pragma once

#include <QString>

class QSettings;

namespace folio::sync {

/**
 * Coordinator timings, in milliseconds.
 */
struct SyncSettings {
    int content_debounce_ms = 500;   // structured surface edits -> store
    int reparse_debounce_ms = 500;   // source surface text -> cold re-parse
    int drag_settle_ms = 100;        // persisted drag -> block ids pushed
    int editor_grace_ms = 1500;      // leaving source mode -> idle
    int ack_timeout_ms = 1000;       // zoom content push -> idle without an ack

    // Reads the sync/ group; missing or non-positive values keep the default.
    [[nodiscard]] static SyncSettings load(QSettings& settings);
    void save(QSettings& settings) const;
};

/**
 * Database path: explicit override, then FOLIO_DB_PATH, then
 * <AppDataLocation>/folio.db.
 */
[[nodiscard]] QString resolve_database_path(const QString& override_path = {});

} // namespace folio::sync
