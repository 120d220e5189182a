#pragma once

#include "core/metrics/auto_stop_monitor.h"
#include "core/metrics/metrics_aggregator.h"

#include <QObject>
#include <QTimer>

namespace nr {

class FeatureFlags;

struct MetricsScheduleConfig {
    int aggregationIntervalMs = 3600000;
    int autoStopIntervalMs = 21600000;
};

// Drives the hourly aggregation and the periodic auto-stop check on two
// independent timers. Either job can also be run on demand; a job switched
// off by its feature flag is skipped without touching the other.
class MetricsScheduler : public QObject {
    Q_OBJECT
public:
    MetricsScheduler(MetricsAggregator& aggregator, AutoStopMonitor& monitor,
                     MetricsScheduleConfig config = {}, FeatureFlags* flags = nullptr,
                     QObject* parent = nullptr);
    ~MetricsScheduler() override;

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    AggregationReport runAggregationNow();
    QVector<AutoStopOutcome> runAutoStopCheckNow();

signals:
    void aggregationCompleted(int succeeded, int failed);
    void experimentAutoStopped(const QString& experimentKey, double degradation);

private:
    MetricsAggregator& m_aggregator;
    AutoStopMonitor& m_monitor;
    MetricsScheduleConfig m_config;
    FeatureFlags* m_flags = nullptr;

    QTimer m_aggregationTimer;
    QTimer m_autoStopTimer;
    bool m_running = false;
};

} // namespace nr
