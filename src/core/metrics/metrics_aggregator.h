#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

struct sqlite3;

namespace nr {

struct AggregationReport {
    int experiments = 0;
    int succeeded = 0;
    int failed = 0;
    int rowsWritten = 0;
    int rowsFinalized = 0;
    QStringList failedKeys;
};

// MetricsAggregator -- rolls impression and click logs up into one
// experiment_metrics_daily row per (experiment, variant, day).
//
// Each cycle recomputes today and yesterday for every active experiment and
// then marks older partitions final; final rows are never rewritten. One
// experiment's failure is logged and does not stop the others.
class MetricsAggregator {
public:
    explicit MetricsAggregator(sqlite3* db);

    AggregationReport runAggregation(const QDateTime& now = QDateTime::currentDateTimeUtc());

    // Recomputes one partition of one experiment in a single transaction.
    bool aggregateExperiment(const QString& experimentKey, const QString& datePartition,
                             int* rowsWritten = nullptr);

    // Computes without writing. nullopt on storage error.
    std::optional<DailyMetric> computeMetric(const QString& experimentKey, const QString& variant,
                                             const QString& datePartition);

    // Marks every partition strictly before datePartition final. Returns rows
    // changed, -1 on error.
    int finalizeBefore(const QString& datePartition);

    // Inclusive ISO date range, ordered by date then variant.
    QVector<DailyMetric> getDailyMetrics(const QString& experimentKey, const QString& dateFrom,
                                         const QString& dateTo, bool* okOut = nullptr);

    // Per-variant totals and averages over the last `days` partitions.
    QVector<VariantSummary> compareVariants(const QString& experimentKey, int days,
                                            const QDateTime& now = QDateTime::currentDateTimeUtc());

    QDateTime lastAggregationTime();

    static double ctr(int64_t clicks, int64_t impressions);

private:
    QStringList observedVariants(const QString& experimentKey, const QString& datePartition,
                                 bool* okOut);
    bool upsertMetric(const DailyMetric& metric);

    sqlite3* m_db = nullptr;
};

} // namespace nr
