#include "core/store/embedding_store.h"
#include "core/store/sql_helpers.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>

#include <sqlite3.h>

#include <cmath>
#include <cstring>

namespace nr {

namespace {

constexpr int kProgressOpsInterval = 64;

struct LookupDeadline {
    QElapsedTimer timer;
    qint64 timeoutMs = 0;
};

// Non-zero return makes sqlite3_step fail with SQLITE_INTERRUPT.
int interruptPastDeadline(void* context)
{
    const auto* deadline = static_cast<const LookupDeadline*>(context);
    return deadline->timer.elapsed() > deadline->timeoutMs ? 1 : 0;
}

} // namespace

SqliteEmbeddingStore::SqliteEmbeddingStore(sqlite3* db)
    : m_db(db)
{
}

VectorLookup SqliteEmbeddingStore::lookup(const QString& embeddingRef, int timeoutMs)
{
    VectorLookup result;
    if (!m_db || timeoutMs == 0) {
        result.status = VectorLookup::Status::Unavailable;
        return result;
    }

    static constexpr const char* kSql = "SELECT dimensions, vector FROM embedding WHERE ref = ?1";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "embedding lookup prepare failed: %s", sqlite3_errmsg(m_db));
        result.status = VectorLookup::Status::Unavailable;
        return result;
    }
    sql::bindText(stmt, 1, embeddingRef);

    LookupDeadline deadline;
    deadline.timeoutMs = timeoutMs;
    if (timeoutMs > 0) {
        deadline.timer.start();
        sqlite3_progress_handler(m_db, kProgressOpsInterval, &interruptPastDeadline, &deadline);
    }
    const int rc = sqlite3_step(stmt);
    if (timeoutMs > 0) {
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }

    if (rc == SQLITE_ROW) {
        const int dimensions = sqlite3_column_int(stmt, 0);
        const void* blob = sqlite3_column_blob(stmt, 1);
        const int bytes = sqlite3_column_bytes(stmt, 1);

        if (!blob || dimensions <= 0 || bytes % static_cast<int>(sizeof(float)) != 0
            || bytes != dimensions * static_cast<int>(sizeof(float))) {
            LOG_WARN(nrStore, "Malformed embedding '%s': %d bytes for %d dimensions",
                     qUtf8Printable(embeddingRef), bytes, dimensions);
            result.status = VectorLookup::Status::Unavailable;
        } else {
            result.vector.resize(dimensions);
            std::memcpy(result.vector.data(), blob, static_cast<size_t>(bytes));
            result.status = VectorLookup::Status::Found;
        }
    } else if (rc == SQLITE_DONE) {
        result.status = VectorLookup::Status::NotFound;
    } else if (rc == SQLITE_INTERRUPT) {
        LOG_WARN(nrStore, "embedding lookup '%s' exceeded %dms", qUtf8Printable(embeddingRef),
                 timeoutMs);
        result.status = VectorLookup::Status::Unavailable;
    } else {
        LOG_WARN(nrStore, "embedding lookup failed: %s", sqlite3_errmsg(m_db));
        result.status = VectorLookup::Status::Unavailable;
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SqliteEmbeddingStore::put(const QString& embeddingRef, const QVector<float>& vector)
{
    if (embeddingRef.isEmpty() || vector.isEmpty()) {
        return false;
    }
    for (float component : vector) {
        if (!std::isfinite(component)) {
            LOG_WARN(nrStore, "Refusing non-finite embedding '%s'", qUtf8Printable(embeddingRef));
            return false;
        }
    }

    static constexpr const char* kSql = R"(
        INSERT INTO embedding (ref, dimensions, vector, updated_at) VALUES (?1, ?2, ?3, ?4)
        ON CONFLICT(ref) DO UPDATE SET
            dimensions = excluded.dimensions,
            vector = excluded.vector,
            updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "embedding put prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, embeddingRef);
    sqlite3_bind_int(stmt, 2, static_cast<int>(vector.size()));
    sqlite3_bind_blob(stmt, 3, vector.constData(),
                      static_cast<int>(vector.size() * sizeof(float)), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

bool SqliteEmbeddingStore::remove(const QString& embeddingRef)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM embedding WHERE ref = ?1", -1, &stmt, nullptr)
        != SQLITE_OK) {
        return false;
    }
    sql::bindText(stmt, 1, embeddingRef);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

} // namespace nr
