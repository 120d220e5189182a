#include "core/metrics/auto_stop_monitor.h"
#include "core/metrics/metrics_aggregator.h"
#include "core/shared/logging.h"
#include "core/store/experiment_store.h"
#include "core/store/sql_helpers.h"

#include <QDate>
#include <QHash>

#include <algorithm>
#include <exception>

#include <sqlite3.h>

namespace nr {

namespace {

QString controlVariantOf(const ExperimentDefinition& definition)
{
    for (const VariantAllocation& variant : definition.orderedVariants) {
        if (variant.name == QLatin1String("control")) {
            return variant.name;
        }
    }
    return definition.orderedVariants.isEmpty() ? QStringLiteral("control")
                                                : definition.orderedVariants.constFirst().name;
}

} // namespace

AutoStopMonitor::AutoStopMonitor(sqlite3* db, AutoStopConfig config)
    : m_db(db)
    , m_config(config)
{
}

int AutoStopMonitor::longestConsecutiveRun(const QStringList& sortedDates)
{
    int longest = 0;
    int current = 0;
    QDate previous;
    for (const QString& text : sortedDates) {
        const QDate date = QDate::fromString(text, Qt::ISODate);
        if (!date.isValid()) {
            current = 0;
            previous = QDate();
            continue;
        }
        current = (previous.isValid() && previous.daysTo(date) == 1) ? current + 1 : 1;
        longest = std::max(longest, current);
        previous = date;
    }
    return longest;
}

AutoStopEvaluation AutoStopMonitor::evaluate(const ExperimentDefinition& definition,
                                             const QDateTime& now)
{
    AutoStopEvaluation best;
    best.experimentKey = definition.key;
    best.controlVariant = controlVariantOf(definition);

    MetricsAggregator aggregator(m_db);
    const QString dateFrom = datePartitionFor(now.addDays(-std::max(1, m_config.windowDays)));
    const QString dateTo = datePartitionFor(now);
    const QVector<DailyMetric> metrics = aggregator.getDailyMetrics(definition.key, dateFrom, dateTo);

    QHash<QString, QHash<QString, DailyMetric>> byVariant;   // variant -> date -> metric
    for (const DailyMetric& metric : metrics) {
        byVariant[metric.variant].insert(metric.datePartition, metric);
    }
    const QHash<QString, DailyMetric> control = byVariant.value(best.controlVariant);
    if (control.isEmpty()) {
        return best;
    }

    bool haveCandidate = false;
    for (auto variantIt = byVariant.constBegin(); variantIt != byVariant.constEnd(); ++variantIt) {
        if (variantIt.key() == best.controlVariant) {
            continue;
        }

        AutoStopEvaluation eval;
        eval.experimentKey = definition.key;
        eval.controlVariant = best.controlVariant;
        eval.treatmentVariant = variantIt.key();

        QStringList dates = control.keys();
        std::sort(dates.begin(), dates.end());
        for (const QString& date : dates) {
            auto treatmentIt = variantIt.value().constFind(date);
            if (treatmentIt == variantIt.value().constEnd()) {
                continue;
            }
            const DailyMetric& c = control.value(date);
            const DailyMetric& t = treatmentIt.value();
            if (c.impressions < definition.minSampleSize || t.impressions < definition.minSampleSize) {
                ++eval.skippedForSampleSize;
                continue;
            }

            DailyCtrComparison comparison;
            comparison.datePartition = date;
            comparison.controlCtr = c.ctr;
            comparison.treatmentCtr = t.ctr;
            comparison.degradation = c.ctr - t.ctr;
            comparison.degraded = comparison.degradation >= definition.autoStopThreshold;
            eval.comparisons.append(comparison);

            eval.avgControlCtr += c.ctr;
            eval.avgTreatmentCtr += t.ctr;
            eval.maxDegradation = std::max(eval.maxDegradation, comparison.degradation);
            if (comparison.degraded) {
                eval.degradedDates.append(date);
            }
        }

        if (!eval.comparisons.isEmpty()) {
            eval.avgControlCtr /= eval.comparisons.size();
            eval.avgTreatmentCtr /= eval.comparisons.size();
        }
        eval.consecutiveDegradedDays = longestConsecutiveRun(eval.degradedDates);
        eval.shouldStop = eval.consecutiveDegradedDays >= std::max(1, m_config.consecutiveDays);

        const bool better = !haveCandidate
            || (eval.shouldStop && !best.shouldStop)
            || (eval.shouldStop == best.shouldStop && eval.maxDegradation > best.maxDegradation);
        if (better) {
            best = eval;
            haveCandidate = true;
        }
    }
    return best;
}

AutoStopOutcome AutoStopMonitor::checkExperiment(const ExperimentDefinition& definition,
                                                 const QDateTime& now)
{
    AutoStopOutcome outcome;
    outcome.experimentKey = definition.key;
    outcome.evaluation = evaluate(definition, now);

    const AutoStopEvaluation& eval = outcome.evaluation;
    if (!eval.shouldStop) {
        if (eval.skippedForSampleSize > 0 && eval.comparisons.isEmpty()) {
            LOG_DEBUG(nrMetrics, "Experiment %s below sample size on every day, not evaluated",
                      qUtf8Printable(definition.key));
        }
        return outcome;
    }

    const double degradation = eval.avgControlCtr - eval.avgTreatmentCtr;
    const QString reason = QStringLiteral(
        "Auto-stopped: %1 CTR %2 trails %3 CTR %4 by %5 (threshold %6) on %7 consecutive days")
        .arg(eval.treatmentVariant)
        .arg(eval.avgTreatmentCtr, 0, 'f', 4)
        .arg(eval.controlVariant)
        .arg(eval.avgControlCtr, 0, 'f', 4)
        .arg(degradation, 0, 'f', 4)
        .arg(definition.autoStopThreshold, 0, 'f', 4)
        .arg(eval.consecutiveDegradedDays);

    ExperimentStore store(m_db);
    if (!store.stop(definition.key, reason)) {
        LOG_ERROR(nrMetrics, "Failed to deactivate experiment %s", qUtf8Printable(definition.key));
        outcome.failed = true;
        return outcome;
    }
    outcome.stopped = true;

    ExperimentAlert alert;
    alert.experimentKey = definition.key;
    alert.controlCtr = eval.avgControlCtr;
    alert.treatmentCtr = eval.avgTreatmentCtr;
    alert.degradation = degradation;
    alert.threshold = definition.autoStopThreshold;
    alert.degradedDates = eval.degradedDates;
    alert.message = reason;
    alert.createdAt = now;
    outcome.alertId = store.insertAlert(alert);
    if (!outcome.alertId.has_value()) {
        LOG_ERROR(nrMetrics, "Experiment %s stopped but alert could not be written",
                  qUtf8Printable(definition.key));
    }

    LOG_WARN(nrMetrics, "%s", qUtf8Printable(QStringLiteral("Experiment %1: %2")
                                                  .arg(definition.key, reason)));
    return outcome;
}

QVector<AutoStopOutcome> AutoStopMonitor::runCheck(const QDateTime& now)
{
    QVector<AutoStopOutcome> outcomes;
    ExperimentStore store(m_db);
    const QVector<ExperimentDefinition> candidates = store.listAutoStopEnabled();

    for (const ExperimentDefinition& definition : candidates) {
        try {
            outcomes.append(checkExperiment(definition, now));
        } catch (const std::exception& e) {
            LOG_ERROR(nrMetrics, "Auto-stop check threw for %s: %s",
                      qUtf8Printable(definition.key), e.what());
            AutoStopOutcome failed;
            failed.experimentKey = definition.key;
            failed.failed = true;
            outcomes.append(failed);
        }
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db,
                           "INSERT OR REPLACE INTO settings (key, value) VALUES ('last_auto_stop_check_at', ?1)",
                           -1, &stmt, nullptr) == SQLITE_OK) {
        sql::bindText(stmt, 1, QString::number(sql::toEpochMs(now)));
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN(nrMetrics, "Failed to record auto-stop check time: %s", sqlite3_errmsg(m_db));
        }
    }
    sqlite3_finalize(stmt);

    const int stopped = static_cast<int>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const AutoStopOutcome& o) { return o.stopped; }));
    LOG_INFO(nrMetrics, "Auto-stop check: %d experiments, %d stopped",
             static_cast<int>(candidates.size()), stopped);
    return outcomes;
}

} // namespace nr
