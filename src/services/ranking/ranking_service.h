#pragma once

#include "core/ipc/service_base.h"
#include "core/shared/circuit_breaker.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"
#include "core/store/sqlite_store.h"

#include <QVector>

#include <memory>
#include <optional>

namespace nr {

class ArmSelector;
class AutoStopMonitor;
class BanditEngine;
class BanditLedger;
class EventLog;
class ExperimentService;
class ExperimentStore;
class FeatureFlags;
class MetricsAggregator;
class MetricsScheduler;
class RankingPipeline;
class SimilarityResolver;
class SqliteEmbeddingStore;
class WriteQueue;

class RankingService : public ServiceBase {
    Q_OBJECT
public:
    explicit RankingService(EngineSettings settings, QObject* parent = nullptr);
    ~RankingService() override;

    QJsonObject handleRequest(const QJsonObject& request) override;

    // Opens the database and wires every component. Idempotent.
    bool ensureReady();

    // Blocks until queued impression, click and reward writes have landed.
    bool flushWrites(int timeoutMs);

    void setSchedulerEnabled(bool enabled) { m_schedulerEnabled = enabled; }

private:
    // ── Serving ──
    QJsonObject handleGetAssignment(uint64_t id, const QJsonObject& params);
    QJsonObject handleRank(uint64_t id, const QJsonObject& params);
    QJsonObject handleDecide(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordReward(uint64_t id, const QJsonObject& params);

    // ── Event logging ──
    QJsonObject handleRecordImpressions(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordClick(uint64_t id, const QJsonObject& params);

    // ── Profiles ──
    QJsonObject handleGetProfile(uint64_t id, const QJsonObject& params);
    QJsonObject handleUpdateProfile(uint64_t id, const QJsonObject& params);

    // ── Experiment administration ──
    QJsonObject handleCreateExperiment(uint64_t id, const QJsonObject& params);
    QJsonObject handleActivateExperiment(uint64_t id, const QJsonObject& params);
    QJsonObject handleStopExperiment(uint64_t id, const QJsonObject& params);
    QJsonObject handleListExperiments(uint64_t id, const QJsonObject& params);
    QJsonObject handleListAlerts(uint64_t id, const QJsonObject& params);
    QJsonObject handleResolveAlert(uint64_t id, const QJsonObject& params);

    // ── Metrics ──
    QJsonObject handleGetDailyMetrics(uint64_t id, const QJsonObject& params);
    QJsonObject handleCompareVariants(uint64_t id, const QJsonObject& params);
    QJsonObject handleRunAggregation(uint64_t id, const QJsonObject& params);
    QJsonObject handleRunAutoStopCheck(uint64_t id, const QJsonObject& params);

    // ── Bandit and flags ──
    QJsonObject handleGetArmStats(uint64_t id);
    QJsonObject handleGetFeatureFlags(uint64_t id);
    QJsonObject handleSetFeatureFlag(uint64_t id, const QJsonObject& params);

    bool queueImpressions(QVector<ImpressionEvent> events);
    void onExperimentAutoStopped(const QString& experimentKey, double degradation);

    EngineSettings m_settings;
    bool m_schedulerEnabled = true;

    // Declaration order is construction order; the destructor tears the
    // graph down explicitly before m_store closes.
    std::optional<SQLiteStore> m_store;
    CircuitBreaker m_embeddingBreaker;
    CircuitBreaker m_selectorBreaker;
    std::unique_ptr<ExperimentStore> m_experimentStore;
    std::unique_ptr<EventLog> m_eventLog;
    std::unique_ptr<SqliteEmbeddingStore> m_embeddingStore;
    std::unique_ptr<FeatureFlags> m_flags;
    std::unique_ptr<SimilarityResolver> m_resolver;
    std::unique_ptr<RankingPipeline> m_pipeline;
    std::unique_ptr<ExperimentService> m_experiments;
    std::unique_ptr<BanditLedger> m_ledger;
    std::unique_ptr<ArmSelector> m_selector;
    std::unique_ptr<WriteQueue> m_writeQueue;
    std::unique_ptr<BanditEngine> m_bandit;
    std::unique_ptr<MetricsAggregator> m_aggregator;
    std::unique_ptr<AutoStopMonitor> m_autoStop;
    std::unique_ptr<MetricsScheduler> m_scheduler;
};

} // namespace nr
