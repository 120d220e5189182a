#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>

#include <sqlite3.h>

namespace nr {

// SQLiteStore -- owner of one SQLite connection to the engine database.
//
// Opening a store creates the schema, seeds the default arms and settings and
// applies pending migrations. Repository classes (ExperimentStore, EventLog,
// BanditLedger, ...) borrow the raw handle and never close it.
class SQLiteStore {
public:
    ~SQLiteStore();

    // Move-only (owns sqlite3* handle)
    SQLiteStore(SQLiteStore&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    SQLiteStore& operator=(SQLiteStore&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at dbPath (":memory:" is accepted).
    static std::optional<SQLiteStore> open(const QString& dbPath);

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // ── User profiles ───────────────────────────────────────

    // Returns the stored profile, or nullopt if none exists. okOut is set to
    // false when the lookup itself failed.
    std::optional<UserProfile> findProfile(const QString& subjectId, bool* okOut = nullptr);

    // Returns the stored active profile or a default one (personalization
    // disabled). A deactivated profile is reported as the default.
    UserProfile getProfile(const QString& subjectId, bool* okOut = nullptr);

    bool upsertProfile(const UserProfile& profile);
    bool deactivateProfile(const QString& subjectId);

    // ── Transactions ────────────────────────────────────────

    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath);
    bool execSql(const char* sql);

    sqlite3* m_db = nullptr;
};

} // namespace nr
