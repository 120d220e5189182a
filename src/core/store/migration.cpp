#include "core/store/migration.h"
#include "core/shared/logging.h"

#include <QString>

#include <sqlite3.h>

namespace nr {

int currentSchemaVersion(sqlite3* db)
{
    const char* sql = "SELECT value FROM settings WHERE key = 'schema_version'";
    sqlite3_stmt* stmt = nullptr;
    int version = 0;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* val = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            if (val) {
                bool ok = false;
                version = QString::fromUtf8(val).toInt(&ok);
                if (!ok) {
                    LOG_WARN(nrStore, "Unparseable schema_version '%s'", val);
                    version = 0;
                }
            }
        }
    }
    sqlite3_finalize(stmt);
    return version;
}

bool applyMigrations(sqlite3* db, int targetVersion)
{
    int current = currentSchemaVersion(db);

    if (current > targetVersion) {
        LOG_ERROR(nrStore, "Schema version %d is newer than supported version %d",
                  current, targetVersion);
        return false;
    }

    if (current == targetVersion) {
        return true;
    }

    auto exec = [db](const char* sql) -> bool {
        char* errMsg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            LOG_ERROR(nrStore, "Migration SQL failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    };

    if (current < 2 && targetVersion >= 2) {
        LOG_INFO(nrStore, "Applying schema migration 1 -> 2");

        if (!exec("BEGIN IMMEDIATE")) {
            return false;
        }

        const bool ok = exec(R"(
            CREATE TABLE IF NOT EXISTS feature_flag (
                key TEXT PRIMARY KEY,
                enabled INTEGER NOT NULL DEFAULT 1,
                value TEXT,
                description TEXT,
                updated_at INTEGER NOT NULL DEFAULT 0
            );
        )")
            && exec(R"(
            INSERT OR IGNORE INTO feature_flag (key, enabled, value, description) VALUES
                ('experiment.rank_ab.enabled', 1, NULL, 'Serve rank A/B experiments'),
                ('feature.personalization.enabled', 1, NULL, 'Blend user relevance into rank scores'),
                ('feature.diversity_filter.enabled', 1, NULL, 'Apply the MMR diversity filter'),
                ('analytics.impression_logging.enabled', 1, NULL, 'Record served impressions'),
                ('analytics.click_logging.enabled', 1, NULL, 'Record clicks'),
                ('config.mmr_lambda', 1, '0.7', 'Default MMR relevance weight'),
                ('experiment.auto_stop.enabled', 1, NULL, 'Run the auto-stop check'),
                ('analytics.metrics_calculation.enabled', 1, NULL, 'Run the hourly aggregation');
        )")
            && exec(R"(
            CREATE TABLE IF NOT EXISTS experiment_assignment (
                subject_id TEXT NOT NULL,
                experiment_key TEXT NOT NULL,
                variant TEXT NOT NULL,
                bucket INTEGER NOT NULL,
                assigned_at INTEGER NOT NULL,
                PRIMARY KEY (subject_id, experiment_key)
            );
        )")
            && exec("INSERT OR REPLACE INTO settings (key, value) VALUES ('schema_version', '2');");

        if (!ok) {
            exec("ROLLBACK");
            return false;
        }
        if (!exec("COMMIT")) {
            exec("ROLLBACK");
            return false;
        }

        current = 2;
    }

    return current == targetVersion;
}

} // namespace nr
