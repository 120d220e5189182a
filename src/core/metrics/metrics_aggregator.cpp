#include "core/metrics/metrics_aggregator.h"
#include "core/shared/logging.h"
#include "core/store/experiment_store.h"
#include "core/store/sql_helpers.h"

#include <QDate>

#include <algorithm>
#include <exception>
#include <initializer_list>

#include <sqlite3.h>

namespace nr {

namespace {

constexpr const char* kLastAggregationKey = "last_aggregation_at";

DailyMetric readMetricRow(sqlite3_stmt* stmt)
{
    DailyMetric metric;
    metric.experimentKey = sql::columnText(stmt, 0);
    metric.variant = sql::columnText(stmt, 1);
    metric.datePartition = sql::columnText(stmt, 2);
    metric.impressions = sqlite3_column_int64(stmt, 3);
    metric.clicks = sqlite3_column_int64(stmt, 4);
    metric.uniqueUsers = sqlite3_column_int64(stmt, 5);
    metric.ctr = sqlite3_column_double(stmt, 6);
    metric.avgDwellTimeMs = sqlite3_column_double(stmt, 7);
    metric.avgPosition = sqlite3_column_double(stmt, 8);
    metric.hideRate = sqlite3_column_double(stmt, 9);
    metric.diversityScore = sqlite3_column_double(stmt, 10);
    metric.personalizationScore = sqlite3_column_double(stmt, 11);
    metric.isFinal = sqlite3_column_int(stmt, 12) != 0;
    metric.updatedAt = sql::columnTimestamp(stmt, 13);
    return metric;
}

bool prepare(sqlite3* db, const char* sqlText, sqlite3_stmt** stmt)
{
    if (sqlite3_prepare_v2(db, sqlText, -1, stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrMetrics, "Failed to prepare metrics query: %s", sqlite3_errmsg(db));
        return false;
    }
    return true;
}

void bindKeyAndDate(sqlite3_stmt* stmt, const QString& key, const QString& variant,
                    const QString& datePartition)
{
    sql::bindText(stmt, 1, key);
    sql::bindText(stmt, 2, variant);
    sql::bindText(stmt, 3, datePartition);
}

} // namespace

MetricsAggregator::MetricsAggregator(sqlite3* db)
    : m_db(db)
{
}

double MetricsAggregator::ctr(int64_t clicks, int64_t impressions)
{
    if (impressions <= 0) {
        return 0.0;
    }
    return static_cast<double>(clicks) / static_cast<double>(impressions);
}

QStringList MetricsAggregator::observedVariants(const QString& experimentKey,
                                                const QString& datePartition, bool* okOut)
{
    *okOut = false;
    QStringList variants;
    const char* sqlText = R"(
        SELECT variant FROM impression_log
        WHERE experiment_key = ?1 AND date_partition = ?2 AND variant IS NOT NULL
        UNION
        SELECT variant FROM click_log
        WHERE experiment_key = ?1 AND date_partition = ?2 AND variant IS NOT NULL
        ORDER BY 1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, sqlText, &stmt)) {
        return variants;
    }
    sql::bindText(stmt, 1, experimentKey);
    sql::bindText(stmt, 2, datePartition);
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        variants.append(sql::columnText(stmt, 0));
    }
    sqlite3_finalize(stmt);
    *okOut = rc == SQLITE_DONE;
    return variants;
}

std::optional<DailyMetric> MetricsAggregator::computeMetric(const QString& experimentKey,
                                                            const QString& variant,
                                                            const QString& datePartition)
{
    DailyMetric metric;
    metric.experimentKey = experimentKey;
    metric.variant = variant;
    metric.datePartition = datePartition;
    metric.updatedAt = QDateTime::currentDateTimeUtc();

    // ── Impressions ─────────────────────────────────────────
    {
        const char* sqlText = R"(
            SELECT COUNT(*), COALESCE(AVG(position), 0),
                   COALESCE(SUM(diversity_applied), 0), COALESCE(SUM(personalized), 0)
            FROM impression_log
            WHERE experiment_key = ?1 AND variant = ?2 AND date_partition = ?3
        )";
        sqlite3_stmt* stmt = nullptr;
        if (!prepare(m_db, sqlText, &stmt)) {
            return std::nullopt;
        }
        bindKeyAndDate(stmt, experimentKey, variant, datePartition);
        if (sqlite3_step(stmt) != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        metric.impressions = sqlite3_column_int64(stmt, 0);
        metric.avgPosition = sqlite3_column_double(stmt, 1);
        const int64_t diversified = sqlite3_column_int64(stmt, 2);
        const int64_t personalized = sqlite3_column_int64(stmt, 3);
        sqlite3_finalize(stmt);

        if (metric.impressions > 0) {
            metric.diversityScore = static_cast<double>(diversified) / metric.impressions;
            metric.personalizationScore = static_cast<double>(personalized) / metric.impressions;
        }
    }

    // ── Clicks ──────────────────────────────────────────────
    {
        const char* sqlText = R"(
            SELECT COUNT(*), COALESCE(AVG(dwell_time_ms), 0)
            FROM click_log
            WHERE experiment_key = ?1 AND variant = ?2 AND date_partition = ?3
        )";
        sqlite3_stmt* stmt = nullptr;
        if (!prepare(m_db, sqlText, &stmt)) {
            return std::nullopt;
        }
        bindKeyAndDate(stmt, experimentKey, variant, datePartition);
        if (sqlite3_step(stmt) != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        metric.clicks = sqlite3_column_int64(stmt, 0);
        metric.avgDwellTimeMs = sqlite3_column_double(stmt, 1);
        sqlite3_finalize(stmt);
    }
    metric.ctr = ctr(metric.clicks, metric.impressions);

    // ── Subjects ────────────────────────────────────────────
    {
        const char* sqlText = R"(
            WITH shown AS (
                SELECT DISTINCT subject_id FROM impression_log
                WHERE experiment_key = ?1 AND variant = ?2 AND date_partition = ?3
            ), clicked AS (
                SELECT DISTINCT subject_id FROM click_log
                WHERE experiment_key = ?1 AND variant = ?2 AND date_partition = ?3
            )
            SELECT (SELECT COUNT(*) FROM shown),
                   (SELECT COUNT(*) FROM (SELECT subject_id FROM shown
                                          UNION SELECT subject_id FROM clicked)),
                   (SELECT COUNT(*) FROM shown WHERE subject_id IN (SELECT subject_id FROM clicked))
        )";
        sqlite3_stmt* stmt = nullptr;
        if (!prepare(m_db, sqlText, &stmt)) {
            return std::nullopt;
        }
        bindKeyAndDate(stmt, experimentKey, variant, datePartition);
        if (sqlite3_step(stmt) != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        const int64_t shownSubjects = sqlite3_column_int64(stmt, 0);
        metric.uniqueUsers = sqlite3_column_int64(stmt, 1);
        const int64_t clickingSubjects = sqlite3_column_int64(stmt, 2);
        sqlite3_finalize(stmt);

        if (shownSubjects > 0) {
            metric.hideRate = static_cast<double>(shownSubjects - clickingSubjects)
                            / static_cast<double>(shownSubjects);
        }
    }

    return metric;
}

bool MetricsAggregator::upsertMetric(const DailyMetric& metric)
{
    const char* sqlText = R"(
        INSERT INTO experiment_metrics_daily (
            experiment_key, variant, date_partition, impressions, clicks, unique_users, ctr,
            avg_dwell_time_ms, avg_position, hide_rate, diversity_score, personalization_score,
            is_final, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, 0, ?13)
        ON CONFLICT(experiment_key, variant, date_partition) DO UPDATE SET
            impressions = excluded.impressions,
            clicks = excluded.clicks,
            unique_users = excluded.unique_users,
            ctr = excluded.ctr,
            avg_dwell_time_ms = excluded.avg_dwell_time_ms,
            avg_position = excluded.avg_position,
            hide_rate = excluded.hide_rate,
            diversity_score = excluded.diversity_score,
            personalization_score = excluded.personalization_score,
            updated_at = excluded.updated_at
        WHERE experiment_metrics_daily.is_final = 0
    )";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, sqlText, &stmt)) {
        return false;
    }
    bindKeyAndDate(stmt, metric.experimentKey, metric.variant, metric.datePartition);
    sqlite3_bind_int64(stmt, 4, metric.impressions);
    sqlite3_bind_int64(stmt, 5, metric.clicks);
    sqlite3_bind_int64(stmt, 6, metric.uniqueUsers);
    sqlite3_bind_double(stmt, 7, metric.ctr);
    sqlite3_bind_double(stmt, 8, metric.avgDwellTimeMs);
    sqlite3_bind_double(stmt, 9, metric.avgPosition);
    sqlite3_bind_double(stmt, 10, metric.hideRate);
    sqlite3_bind_double(stmt, 11, metric.diversityScore);
    sqlite3_bind_double(stmt, 12, metric.personalizationScore);
    sqlite3_bind_int64(stmt, 13, sql::toEpochMs(metric.updatedAt));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrMetrics, "Failed to upsert %s/%s/%s: %s", qUtf8Printable(metric.experimentKey),
                 qUtf8Printable(metric.variant), qUtf8Printable(metric.datePartition),
                 sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

bool MetricsAggregator::aggregateExperiment(const QString& experimentKey,
                                            const QString& datePartition, int* rowsWritten)
{
    if (rowsWritten) {
        *rowsWritten = 0;
    }

    bool ok = false;
    const QStringList variants = observedVariants(experimentKey, datePartition, &ok);
    if (!ok) {
        return false;
    }
    if (variants.isEmpty()) {
        return true;
    }

    sql::Transaction transaction(m_db);
    if (!transaction.isActive()) {
        return false;
    }

    int written = 0;
    for (const QString& variant : variants) {
        const std::optional<DailyMetric> metric = computeMetric(experimentKey, variant, datePartition);
        if (!metric.has_value() || !upsertMetric(*metric)) {
            return false;
        }
        written += sqlite3_changes(m_db);
    }

    if (!transaction.commit()) {
        return false;
    }
    if (rowsWritten) {
        *rowsWritten = written;
    }
    return true;
}

int MetricsAggregator::finalizeBefore(const QString& datePartition)
{
    const char* sqlText = R"(
        UPDATE experiment_metrics_daily SET is_final = 1, updated_at = ?2
        WHERE date_partition < ?1 AND is_final = 0
    )";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, sqlText, &stmt)) {
        return -1;
    }
    sql::bindText(stmt, 1, datePartition);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrMetrics, "Failed to finalize partitions: %s", sqlite3_errmsg(m_db));
        return -1;
    }
    return sqlite3_changes(m_db);
}

AggregationReport MetricsAggregator::runAggregation(const QDateTime& now)
{
    AggregationReport report;
    if (!m_db) {
        LOG_WARN(nrMetrics, "runAggregation called without a database");
        return report;
    }

    const QString today = datePartitionFor(now);
    const QString yesterday = datePartitionFor(now.addDays(-1));

    ExperimentStore experiments(m_db);
    const QVector<ExperimentDefinition> active = experiments.listActive();
    report.experiments = static_cast<int>(active.size());

    for (const ExperimentDefinition& definition : active) {
        try {
            bool ok = true;
            for (const QString& partition : {yesterday, today}) {
                int rows = 0;
                if (!aggregateExperiment(definition.key, partition, &rows)) {
                    ok = false;
                    break;
                }
                report.rowsWritten += rows;
            }
            if (ok) {
                ++report.succeeded;
            } else {
                ++report.failed;
                report.failedKeys.append(definition.key);
                LOG_WARN(nrMetrics, "Aggregation failed for experiment %s",
                         qUtf8Printable(definition.key));
            }
        } catch (const std::exception& e) {
            ++report.failed;
            report.failedKeys.append(definition.key);
            LOG_ERROR(nrMetrics, "Aggregation threw for experiment %s: %s",
                      qUtf8Printable(definition.key), e.what());
        }
    }

    const int finalized = finalizeBefore(yesterday);
    report.rowsFinalized = std::max(0, finalized);

    const QString stamp = QString::number(sql::toEpochMs(now));
    sqlite3_stmt* stmt = nullptr;
    if (prepare(m_db, "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)", &stmt)) {
        sql::bindText(stmt, 1, QString::fromLatin1(kLastAggregationKey));
        sql::bindText(stmt, 2, stamp);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN(nrMetrics, "Failed to record aggregation time: %s", sqlite3_errmsg(m_db));
        }
        sqlite3_finalize(stmt);
    }

    LOG_INFO(nrMetrics, "Aggregation: %d experiments, %d ok, %d failed, %d rows, %d finalized",
             report.experiments, report.succeeded, report.failed, report.rowsWritten,
             report.rowsFinalized);
    return report;
}

QVector<DailyMetric> MetricsAggregator::getDailyMetrics(const QString& experimentKey,
                                                        const QString& dateFrom,
                                                        const QString& dateTo, bool* okOut)
{
    if (okOut) {
        *okOut = false;
    }
    QVector<DailyMetric> metrics;
    const char* sqlText = R"(
        SELECT experiment_key, variant, date_partition, impressions, clicks, unique_users, ctr,
               avg_dwell_time_ms, avg_position, hide_rate, diversity_score,
               personalization_score, is_final, updated_at
        FROM experiment_metrics_daily
        WHERE experiment_key = ?1 AND date_partition >= ?2 AND date_partition <= ?3
        ORDER BY date_partition, variant
    )";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, sqlText, &stmt)) {
        return metrics;
    }
    sql::bindText(stmt, 1, experimentKey);
    sql::bindText(stmt, 2, dateFrom);
    sql::bindText(stmt, 3, dateTo);
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        metrics.append(readMetricRow(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrMetrics, "Daily metrics scan failed: %s", sqlite3_errmsg(m_db));
        metrics.clear();
        return metrics;
    }
    if (okOut) {
        *okOut = true;
    }
    return metrics;
}

QVector<VariantSummary> MetricsAggregator::compareVariants(const QString& experimentKey, int days,
                                                           const QDateTime& now)
{
    QVector<VariantSummary> summaries;
    const int span = std::max(1, days);
    const QString dateFrom = datePartitionFor(now.addDays(-(span - 1)));
    const QString dateTo = datePartitionFor(now);

    const char* sqlText = R"(
        SELECT variant, COUNT(*), SUM(impressions), SUM(clicks), SUM(unique_users),
               AVG(ctr), AVG(avg_dwell_time_ms), AVG(avg_position), AVG(hide_rate),
               AVG(diversity_score), AVG(personalization_score)
        FROM experiment_metrics_daily
        WHERE experiment_key = ?1 AND date_partition >= ?2 AND date_partition <= ?3
        GROUP BY variant
        ORDER BY CASE WHEN variant = 'control' THEN 0 ELSE 1 END, variant
    )";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, sqlText, &stmt)) {
        return summaries;
    }
    sql::bindText(stmt, 1, experimentKey);
    sql::bindText(stmt, 2, dateFrom);
    sql::bindText(stmt, 3, dateTo);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        VariantSummary summary;
        summary.variant = sql::columnText(stmt, 0);
        summary.days = sqlite3_column_int(stmt, 1);
        summary.totalImpressions = sqlite3_column_int64(stmt, 2);
        summary.totalClicks = sqlite3_column_int64(stmt, 3);
        summary.totalUniqueUsers = sqlite3_column_int64(stmt, 4);
        summary.avgCtr = sqlite3_column_double(stmt, 5);
        summary.avgDwellTimeMs = sqlite3_column_double(stmt, 6);
        summary.avgPosition = sqlite3_column_double(stmt, 7);
        summary.avgHideRate = sqlite3_column_double(stmt, 8);
        summary.avgDiversityScore = sqlite3_column_double(stmt, 9);
        summary.avgPersonalizationScore = sqlite3_column_double(stmt, 10);
        summaries.append(summary);
    }
    sqlite3_finalize(stmt);
    return summaries;
}

QDateTime MetricsAggregator::lastAggregationTime()
{
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(m_db, "SELECT value FROM settings WHERE key = ?1", &stmt)) {
        return {};
    }
    sql::bindText(stmt, 1, QString::fromLatin1(kLastAggregationKey));
    QDateTime result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        bool ok = false;
        const qint64 ms = sql::columnText(stmt, 0).toLongLong(&ok);
        if (ok && ms > 0) {
            result = sql::fromEpochMs(ms);
        }
    }
    sqlite3_finalize(stmt);
    return result;
}

} // namespace nr
