#include <QtTest/QtTest>

#include "core/store/migration.h"
#include "core/store/schema.h"

#include <sqlite3.h>

namespace {

int tableCount(sqlite3* db, const char* name)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    sqlite3_bind_text(stmt, 1, name, -1, SQLITE_STATIC);
    int count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace

class TestMigration : public QObject {
    Q_OBJECT

private slots:
    void testCurrentVersionMissingSettingsDefaultsToZero();
    void testApplyMigrationsUpToV2();
    void testMigrationSeedsFeatureFlags();
    void testRejectsDowngrade();
    void testRejectsUnsupportedTargetVersion();
};

void TestMigration::testCurrentVersionMissingSettingsDefaultsToZero()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(nr::currentSchemaVersion(db), 0);

    sqlite3_close(db);
}

void TestMigration::testApplyMigrationsUpToV2()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '1');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    QVERIFY(nr::applyMigrations(db, nr::kCurrentSchemaVersion));
    QCOMPARE(nr::currentSchemaVersion(db), 2);
    QCOMPARE(tableCount(db, "feature_flag"), 1);
    QCOMPARE(tableCount(db, "experiment_assignment"), 1);

    // Re-running is a no-op.
    QVERIFY(nr::applyMigrations(db, nr::kCurrentSchemaVersion));

    sqlite3_close(db);
}

void TestMigration::testMigrationSeedsFeatureFlags()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '1');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);
    QVERIFY(nr::applyMigrations(db, 2));

    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(db, "SELECT COUNT(*), SUM(enabled) FROM feature_flag", -1, &stmt,
                                nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(sqlite3_column_int(stmt, 0), 8);
    QCOMPARE(sqlite3_column_int(stmt, 1), 8);
    sqlite3_finalize(stmt);

    QCOMPARE(sqlite3_prepare_v2(db, "SELECT value FROM feature_flag WHERE key='config.mmr_lambda'",
                                -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    QCOMPARE(QString::fromUtf8(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0))),
             QStringLiteral("0.7"));
    sqlite3_finalize(stmt);

    sqlite3_close(db);
}

void TestMigration::testRejectsDowngrade()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '5');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    QVERIFY(!nr::applyMigrations(db, 2));
    QCOMPARE(nr::currentSchemaVersion(db), 5);

    sqlite3_close(db);
}

void TestMigration::testRejectsUnsupportedTargetVersion()
{
    sqlite3* db = nullptr;
    QCOMPARE(sqlite3_open(":memory:", &db), SQLITE_OK);
    QVERIFY(db != nullptr);

    QCOMPARE(sqlite3_exec(db,
                          "CREATE TABLE settings (key TEXT PRIMARY KEY, value TEXT NOT NULL);"
                          "INSERT INTO settings (key, value) VALUES ('schema_version', '2');",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);

    QVERIFY(!nr::applyMigrations(db, 9));
    QCOMPARE(nr::currentSchemaVersion(db), 2);

    sqlite3_close(db);
}

QTEST_MAIN(TestMigration)
#include "test_migration.moc"
