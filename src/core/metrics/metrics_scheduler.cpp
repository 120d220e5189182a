#include "core/metrics/metrics_scheduler.h"
#include "core/experiment/feature_flags.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace nr {

MetricsScheduler::MetricsScheduler(MetricsAggregator& aggregator, AutoStopMonitor& monitor,
                                   MetricsScheduleConfig config, FeatureFlags* flags,
                                   QObject* parent)
    : QObject(parent)
    , m_aggregator(aggregator)
    , m_monitor(monitor)
    , m_config(config)
    , m_flags(flags)
{
    m_aggregationTimer.setInterval(std::max(1000, m_config.aggregationIntervalMs));
    connect(&m_aggregationTimer, &QTimer::timeout, this, [this]() { runAggregationNow(); });

    m_autoStopTimer.setInterval(std::max(1000, m_config.autoStopIntervalMs));
    connect(&m_autoStopTimer, &QTimer::timeout, this, [this]() { runAutoStopCheckNow(); });
}

MetricsScheduler::~MetricsScheduler()
{
    stop();
}

void MetricsScheduler::start()
{
    if (m_running) {
        return;
    }
    m_running = true;
    m_aggregationTimer.start();
    m_autoStopTimer.start();
    LOG_INFO(nrMetrics, "Metrics scheduler started (aggregation every %dms, auto-stop every %dms)",
             m_aggregationTimer.interval(), m_autoStopTimer.interval());
}

void MetricsScheduler::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_aggregationTimer.stop();
    m_autoStopTimer.stop();
}

AggregationReport MetricsScheduler::runAggregationNow()
{
    if (m_flags && !m_flags->isEnabled(QString::fromLatin1(flags::kMetricsCalculation))) {
        LOG_DEBUG(nrMetrics, "Aggregation disabled by feature flag");
        return {};
    }
    const AggregationReport report = m_aggregator.runAggregation();
    emit aggregationCompleted(report.succeeded, report.failed);
    return report;
}

QVector<AutoStopOutcome> MetricsScheduler::runAutoStopCheckNow()
{
    if (m_flags && !m_flags->isEnabled(QString::fromLatin1(flags::kAutoStop))) {
        LOG_DEBUG(nrMetrics, "Auto-stop check disabled by feature flag");
        return {};
    }
    const QVector<AutoStopOutcome> outcomes = m_monitor.runCheck();
    for (const AutoStopOutcome& outcome : outcomes) {
        if (outcome.stopped) {
            emit experimentAutoStopped(outcome.experimentKey,
                                       outcome.evaluation.avgControlCtr
                                           - outcome.evaluation.avgTreatmentCtr);
        }
    }
    return outcomes;
}

} // namespace nr
