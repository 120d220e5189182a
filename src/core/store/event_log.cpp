#include "core/store/event_log.h"
#include "core/store/sql_helpers.h"
#include "core/shared/logging.h"

#include <sqlite3.h>

#include <initializer_list>

namespace nr {

namespace {

QDateTime effectiveTimestamp(const QDateTime& timestamp)
{
    return timestamp.isValid() ? timestamp.toUTC() : QDateTime::currentDateTimeUtc();
}

} // namespace

EventLog::EventLog(sqlite3* db)
    : m_db(db)
{
}

bool EventLog::insertImpression(const ImpressionEvent& event)
{
    static constexpr const char* kSql = R"(
        INSERT INTO impression_log (
            subject_id, item_id, session_id, page_type, position,
            experiment_key, variant, importance_score, rank_score,
            personalized, diversity_applied, timestamp, date_partition
        ) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)
    )";

    if (event.subjectId.isEmpty() || event.itemId.isEmpty() || event.position < 1) {
        LOG_WARN(nrStore, "Rejecting impression with missing subject/item or position %d",
                 event.position);
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "appendImpression prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QDateTime timestamp = effectiveTimestamp(event.timestamp);
    sql::bindText(stmt, 1, event.subjectId);
    sql::bindText(stmt, 2, event.itemId);
    sql::bindText(stmt, 3, event.sessionId);
    sql::bindText(stmt, 4, event.pageType);
    sqlite3_bind_int(stmt, 5, event.position);
    if (event.experimentKey.isEmpty()) {
        sqlite3_bind_null(stmt, 6);
        sqlite3_bind_null(stmt, 7);
    } else {
        sql::bindText(stmt, 6, event.experimentKey);
        sql::bindText(stmt, 7, event.variant);
    }
    sqlite3_bind_double(stmt, 8, event.importanceScore);
    sqlite3_bind_double(stmt, 9, event.rankScore);
    sqlite3_bind_int(stmt, 10, event.personalized ? 1 : 0);
    sqlite3_bind_int(stmt, 11, event.diversityApplied ? 1 : 0);
    sqlite3_bind_int64(stmt, 12, timestamp.toMSecsSinceEpoch());
    sql::bindText(stmt, 13, datePartitionFor(timestamp));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrStore, "appendImpression step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool EventLog::appendImpression(const ImpressionEvent& event)
{
    return insertImpression(event);
}

bool EventLog::appendImpressions(const QVector<ImpressionEvent>& events)
{
    if (events.isEmpty()) {
        return true;
    }
    if (!sql::exec(m_db, "BEGIN IMMEDIATE")) {
        return false;
    }

    int rejected = 0;
    for (const ImpressionEvent& event : events) {
        if (!insertImpression(event)) {
            ++rejected;
        }
    }

    if (rejected == events.size()) {
        sql::exec(m_db, "ROLLBACK");
        return false;
    }
    if (!sql::exec(m_db, "COMMIT")) {
        sql::exec(m_db, "ROLLBACK");
        return false;
    }
    if (rejected > 0) {
        LOG_WARN(nrStore, "Dropped %d of %d impression(s) in batch",
                 rejected, static_cast<int>(events.size()));
    }
    return true;
}

bool EventLog::appendClick(const ClickEvent& event)
{
    static constexpr const char* kSql = R"(
        INSERT INTO click_log (
            subject_id, item_id, session_id, position, experiment_key, variant,
            dwell_time_ms, item_tickers, topic_id, timestamp, date_partition
        ) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
    )";

    if (event.subjectId.isEmpty() || event.itemId.isEmpty()) {
        LOG_WARN(nrStore, "Rejecting click without subject or item id");
        return false;
    }
    if (event.dwellTimeMs.has_value() && *event.dwellTimeMs < 0) {
        LOG_WARN(nrStore, "Rejecting click with negative dwell time %lld",
                 static_cast<long long>(*event.dwellTimeMs));
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "appendClick prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    const QDateTime timestamp = effectiveTimestamp(event.timestamp);
    sql::bindText(stmt, 1, event.subjectId);
    sql::bindText(stmt, 2, event.itemId);
    sql::bindText(stmt, 3, event.sessionId);
    sqlite3_bind_int(stmt, 4, event.position);
    if (event.experimentKey.isEmpty()) {
        sqlite3_bind_null(stmt, 5);
        sqlite3_bind_null(stmt, 6);
    } else {
        sql::bindText(stmt, 5, event.experimentKey);
        sql::bindText(stmt, 6, event.variant);
    }
    if (event.dwellTimeMs.has_value()) {
        sqlite3_bind_int64(stmt, 7, *event.dwellTimeMs);
    } else {
        sqlite3_bind_null(stmt, 7);
    }
    sql::bindText(stmt, 8, sql::encodeStringList(event.itemTickers));
    sql::bindOptionalText(stmt, 9, event.topicId);
    sqlite3_bind_int64(stmt, 10, timestamp.toMSecsSinceEpoch());
    sql::bindText(stmt, 11, datePartitionFor(timestamp));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrStore, "appendClick step failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

QVector<ClickEvent> EventLog::recentClicks(const QString& subjectId, const QDateTime& since,
                                           bool* okOut)
{
    static constexpr const char* kSql = R"(
        SELECT id, item_id, session_id, position, experiment_key, variant,
               dwell_time_ms, item_tickers, topic_id, timestamp, date_partition
        FROM click_log
        WHERE subject_id = ?1 AND timestamp >= ?2
        ORDER BY timestamp DESC, id DESC
    )";

    QVector<ClickEvent> clicks;
    if (okOut) {
        *okOut = false;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "recentClicks prepare failed: %s", sqlite3_errmsg(m_db));
        return clicks;
    }
    sql::bindText(stmt, 1, subjectId);
    sqlite3_bind_int64(stmt, 2, sql::toEpochMs(since));

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ClickEvent click;
        click.id = sqlite3_column_int64(stmt, 0);
        click.subjectId = subjectId;
        click.itemId = sql::columnText(stmt, 1);
        click.sessionId = sql::columnText(stmt, 2);
        click.position = sqlite3_column_int(stmt, 3);
        click.experimentKey = sql::columnText(stmt, 4);
        click.variant = sql::columnText(stmt, 5);
        if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
            click.dwellTimeMs = sqlite3_column_int64(stmt, 6);
        }
        click.itemTickers = sql::decodeStringList(sql::columnText(stmt, 7));
        click.topicId = sql::columnOptionalText(stmt, 8);
        click.timestamp = sql::columnTimestamp(stmt, 9);
        click.datePartition = sql::columnText(stmt, 10);
        clicks.append(click);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_WARN(nrStore, "recentClicks step failed: %s", sqlite3_errmsg(m_db));
        clicks.clear();
        return clicks;
    }
    if (okOut) {
        *okOut = true;
    }
    return clicks;
}

int EventLog::impressionCount(const QString& experimentKey, const QString& datePartition)
{
    static constexpr const char* kSql = R"(
        SELECT COUNT(*) FROM impression_log WHERE experiment_key = ?1 AND date_partition = ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    sql::bindText(stmt, 1, experimentKey);
    sql::bindText(stmt, 2, datePartition);
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

int EventLog::purgeOlderThan(int retentionDays, const QDateTime& now)
{
    if (retentionDays <= 0) {
        return 0;
    }
    const int64_t cutoff = now.addDays(-retentionDays).toMSecsSinceEpoch();

    int removed = 0;
    for (const char* sql : {"DELETE FROM impression_log WHERE timestamp < ?1",
                            "DELETE FROM click_log WHERE timestamp < ?1"}) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_WARN(nrStore, "purge prepare failed: %s", sqlite3_errmsg(m_db));
            return -1;
        }
        sqlite3_bind_int64(stmt, 1, cutoff);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(nrStore, "purge failed: %s", sqlite3_errmsg(m_db));
            return -1;
        }
        removed += sqlite3_changes(m_db);
    }
    return removed;
}

} // namespace nr
