#include "core/store/sqlite_store.h"
#include "core/store/migration.h"
#include "core/store/schema.h"
#include "core/store/sql_helpers.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>

namespace nr {

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<SQLiteStore> SQLiteStore::open(const QString& dbPath)
{
    SQLiteStore store;
    if (!store.init(dbPath)) {
        return std::nullopt;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath)
{
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(nrStore, "Failed to open database %s: %s",
                  qUtf8Printable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(nrStore, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='experiment'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(nrStore, "Failed to set database pragmas");
            return false;
        }

        if (!execSql(kSchemaV1)) {
            LOG_ERROR(nrStore, "Failed to create schema");
            return false;
        }

        if (!execSql(kDefaultSettings) || !execSql(kDefaultArms)) {
            LOG_ERROR(nrStore, "Failed to insert default rows");
            return false;
        }
    }

    if (!applyMigrations(m_db, kCurrentSchemaVersion)) {
        LOG_ERROR(nrStore, "Migration failed");
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(nrStore, "Database opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(nrStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key)
{
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "getSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, key);

    std::optional<QString> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = sql::columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "setSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, key);
    sql::bindText(stmt, 2, value);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

// ── User profiles ───────────────────────────────────────────

std::optional<UserProfile> SQLiteStore::findProfile(const QString& subjectId, bool* okOut)
{
    if (okOut) {
        *okOut = true;
    }

    const char* sql = R"(
        SELECT interested_tickers, interested_keywords, diversity_weight,
               personalization_enabled, is_active, updated_at
        FROM user_profile WHERE subject_id = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "findProfile prepare failed: %s", sqlite3_errmsg(m_db));
        if (okOut) {
            *okOut = false;
        }
        return std::nullopt;
    }
    sql::bindText(stmt, 1, subjectId);

    std::optional<UserProfile> profile;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        UserProfile row;
        row.subjectId = subjectId;
        row.interestedTickers = sql::decodeStringList(sql::columnText(stmt, 0));
        row.interestedKeywords = sql::decodeStringList(sql::columnText(stmt, 1));
        row.diversityWeight = sqlite3_column_double(stmt, 2);
        row.personalizationEnabled = sqlite3_column_int(stmt, 3) != 0;
        row.active = sqlite3_column_int(stmt, 4) != 0;
        row.updatedAt = sql::columnTimestamp(stmt, 5);
        profile = row;
    } else if (rc != SQLITE_DONE) {
        LOG_WARN(nrStore, "findProfile step failed: %s", sqlite3_errmsg(m_db));
        if (okOut) {
            *okOut = false;
        }
    }
    sqlite3_finalize(stmt);
    return profile;
}

UserProfile SQLiteStore::getProfile(const QString& subjectId, bool* okOut)
{
    std::optional<UserProfile> stored = findProfile(subjectId, okOut);
    if (stored && stored->active) {
        return *stored;
    }

    UserProfile defaults;
    defaults.subjectId = subjectId;
    return defaults;
}

bool SQLiteStore::upsertProfile(const UserProfile& profile)
{
    if (profile.subjectId.isEmpty()) {
        LOG_WARN(nrStore, "Refusing to store a profile without a subject id");
        return false;
    }

    const char* sql = R"(
        INSERT INTO user_profile (subject_id, interested_tickers, interested_keywords,
                                  diversity_weight, personalization_enabled, is_active, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(subject_id) DO UPDATE SET
            interested_tickers = excluded.interested_tickers,
            interested_keywords = excluded.interested_keywords,
            diversity_weight = excluded.diversity_weight,
            personalization_enabled = excluded.personalization_enabled,
            is_active = excluded.is_active,
            updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "upsertProfile prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, profile.subjectId);
    sql::bindText(stmt, 2, sql::encodeStringList(profile.interestedTickers));
    sql::bindText(stmt, 3, sql::encodeStringList(profile.interestedKeywords));
    sqlite3_bind_double(stmt, 4, profile.diversityWeight);
    sqlite3_bind_int(stmt, 5, profile.personalizationEnabled ? 1 : 0);
    sqlite3_bind_int(stmt, 6, profile.active ? 1 : 0);
    sqlite3_bind_int64(stmt, 7, QDateTime::currentMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrStore, "upsertProfile failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool SQLiteStore::deactivateProfile(const QString& subjectId)
{
    const char* sql = "UPDATE user_profile SET is_active = 0, updated_at = ?2 WHERE subject_id = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "deactivateProfile prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, subjectId);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

// ── Transactions ────────────────────────────────────────────

bool SQLiteStore::beginTransaction()
{
    return execSql("BEGIN IMMEDIATE");
}

bool SQLiteStore::commitTransaction()
{
    return execSql("COMMIT");
}

bool SQLiteStore::rollbackTransaction()
{
    return execSql("ROLLBACK");
}

bool SQLiteStore::integrityCheck() const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "PRAGMA integrity_check", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bool ok = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = result && QString::fromUtf8(result) == QLatin1String("ok");
    }
    sqlite3_finalize(stmt);
    return ok;
}

} // namespace nr
