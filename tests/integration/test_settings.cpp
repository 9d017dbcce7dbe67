#include <catch2/catch_test_macros.hpp>
#include "sync/settings.hpp"

#include <QSettings>
#include <QStandardPaths>
#include <QTemporaryDir>

using namespace folio::sync;

TEST_CASE("SyncSettings load and save", "[integration][settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("folio.ini")), QSettings::IniFormat);

    SECTION("missing keys keep the defaults") {
        auto loaded = SyncSettings::load(settings);
        REQUIRE(loaded.content_debounce_ms == 500);
        REQUIRE(loaded.reparse_debounce_ms == 500);
        REQUIRE(loaded.drag_settle_ms == 100);
        REQUIRE(loaded.editor_grace_ms == 1500);
        REQUIRE(loaded.ack_timeout_ms == 1000);
    }

    SECTION("saved values load back") {
        SyncSettings custom;
        custom.content_debounce_ms = 250;
        custom.editor_grace_ms = 3000;
        custom.save(settings);
        settings.sync();

        QSettings reread(dir.filePath(QStringLiteral("folio.ini")), QSettings::IniFormat);
        auto loaded = SyncSettings::load(reread);
        REQUIRE(loaded.content_debounce_ms == 250);
        REQUIRE(loaded.editor_grace_ms == 3000);
        REQUIRE(loaded.drag_settle_ms == 100);
    }

    SECTION("non-positive values are ignored") {
        settings.setValue(QStringLiteral("sync/dragSettleMs"), 0);
        settings.setValue(QStringLiteral("sync/ackTimeoutMs"), QStringLiteral("soon"));
        auto loaded = SyncSettings::load(settings);
        REQUIRE(loaded.drag_settle_ms == 100);
        REQUIRE(loaded.ack_timeout_ms == 1000);
    }
}

TEST_CASE("Database path resolution", "[integration][settings]") {
    qunsetenv("FOLIO_DB_PATH");

    SECTION("an explicit path wins") {
        qputenv("FOLIO_DB_PATH", "/tmp/from-env.db");
        REQUIRE(resolve_database_path(QStringLiteral("/tmp/explicit.db")) == QStringLiteral("/tmp/explicit.db"));
        qunsetenv("FOLIO_DB_PATH");
    }

    SECTION("the environment comes next") {
        qputenv("FOLIO_DB_PATH", "/tmp/from-env.db");
        REQUIRE(resolve_database_path() == QStringLiteral("/tmp/from-env.db"));
        qunsetenv("FOLIO_DB_PATH");
    }

    SECTION("otherwise the app data directory") {
        const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        REQUIRE(resolve_database_path() == base + QStringLiteral("/folio.db"));
    }
}
