#include "ranking_service.h"

#include "core/bandit/bandit_engine.h"
#include "core/bandit/bandit_ledger.h"
#include "core/bandit/epsilon_greedy_selector.h"
#include "core/bandit/remote_arm_selector.h"
#include "core/bandit/thompson_sampling_selector.h"
#include "core/bandit/ucb1_selector.h"
#include "core/experiment/experiment_service.h"
#include "core/experiment/feature_flags.h"
#include "core/ipc/message.h"
#include "core/metrics/auto_stop_monitor.h"
#include "core/metrics/metrics_aggregator.h"
#include "core/metrics/metrics_scheduler.h"
#include "core/ranking/ranking_pipeline.h"
#include "core/ranking/similarity_resolver.h"
#include "core/shared/json_codec.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/store/embedding_store.h"
#include "core/store/event_log.h"
#include "core/store/experiment_store.h"
#include "core/store/write_queue.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>

#include <sqlite3.h>

#include <utility>

namespace nr {

namespace {

QJsonObject unavailable(uint64_t id)
{
    return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                 QStringLiteral("Database is not available"));
}

QJsonObject missingParam(uint64_t id, const char* name)
{
    return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                 QStringLiteral("Missing '%1' parameter").arg(QLatin1String(name)));
}

QJsonObject toJson(const ArmStats& stats)
{
    QJsonObject json;
    json[QStringLiteral("armId")] = stats.armId;
    json[QStringLiteral("name")] = stats.name;
    json[QStringLiteral("enabled")] = stats.enabled;
    json[QStringLiteral("count")] = static_cast<qint64>(stats.count);
    json[QStringLiteral("sum")] = stats.sum;
    json[QStringLiteral("mean")] = stats.mean;
    json[QStringLiteral("variance")] = stats.variance;
    return json;
}

QJsonObject toJson(const FeatureFlag& flag)
{
    QJsonObject json;
    json[QStringLiteral("key")] = flag.key;
    json[QStringLiteral("enabled")] = flag.enabled;
    json[QStringLiteral("value")] = flag.value.has_value() ? QJsonValue(*flag.value)
                                                           : QJsonValue(QJsonValue::Null);
    json[QStringLiteral("description")] = flag.description;
    return json;
}

QJsonArray toJsonArray(const QVector<RankedItem>& items)
{
    QJsonArray array;
    for (const RankedItem& item : items) {
        array.append(json::toJson(item));
    }
    return array;
}

} // namespace

RankingService::RankingService(EngineSettings settings, QObject* parent)
    : ServiceBase(QStringLiteral("ranking"), parent)
    , m_settings(std::move(settings))
    , m_embeddingBreaker(QStringLiteral("embedding-store"), m_settings.breakerFailureThreshold,
                         m_settings.breakerHalfOpenDelayMs)
    , m_selectorBreaker(QStringLiteral("arm-selector"), m_settings.breakerFailureThreshold,
                        m_settings.breakerHalfOpenDelayMs)
{
    LOG_INFO(nrIpc, "RankingService created");
}

RankingService::~RankingService()
{
    if (m_scheduler) {
        m_scheduler->stop();
    }
    if (m_writeQueue) {
        m_writeQueue->shutdown();
    }
    m_scheduler.reset();
    m_autoStop.reset();
    m_aggregator.reset();
    m_bandit.reset();
    m_writeQueue.reset();
    m_selector.reset();
    m_ledger.reset();
    m_experiments.reset();
    m_pipeline.reset();
    m_resolver.reset();
    m_flags.reset();
    m_embeddingStore.reset();
    m_eventLog.reset();
    m_experimentStore.reset();
    m_store.reset();
}

bool RankingService::ensureReady()
{
    if (m_store.has_value()) {
        return true;
    }

    QString dbPath = m_settings.databasePath;
    if (dbPath.isEmpty()) {
        dbPath = SettingsManager::defaultDatabasePath();
    }
    if (!QDir().mkpath(QFileInfo(dbPath).absolutePath())) {
        LOG_ERROR(nrIpc, "Failed to create database directory for: %s", qPrintable(dbPath));
        return false;
    }

    auto store = SQLiteStore::open(dbPath);
    if (!store.has_value()) {
        LOG_ERROR(nrIpc, "Failed to open database at: %s", qPrintable(dbPath));
        return false;
    }
    m_store.emplace(std::move(store.value()));
    sqlite3* db = m_store->rawDb();

    m_experimentStore = std::make_unique<ExperimentStore>(db);
    m_eventLog = std::make_unique<EventLog>(db);
    m_embeddingStore = std::make_unique<SqliteEmbeddingStore>(db);
    m_flags = std::make_unique<FeatureFlags>(db);
    m_resolver = std::make_unique<SimilarityResolver>(m_embeddingStore.get(), &m_embeddingBreaker,
                                                      m_settings.embeddingLookupBudgetMs);
    m_pipeline = std::make_unique<RankingPipeline>(*m_store, *m_eventLog, *m_resolver,
                                                   m_settings.rankWeights,
                                                   m_settings.personalization, m_flags.get());

    AssignmentCacheConfig cacheConfig;
    cacheConfig.maxEntries = m_settings.assignmentCacheMaxEntries;
    cacheConfig.ttlSeconds = m_settings.assignmentCacheTtlSeconds;
    m_experiments = std::make_unique<ExperimentService>(*m_experimentStore, cacheConfig,
                                                        m_flags.get());
    m_experiments->setRecordAssignments(true);

    m_ledger = std::make_unique<BanditLedger>(db);
    if (m_settings.selector == QLatin1String("remote") && !m_settings.selectorSocketPath.isEmpty()) {
        m_selector = std::make_unique<RemoteArmSelector>(m_settings.selectorSocketPath,
                                                         m_settings.selectorTimeoutMs,
                                                         m_selectorBreaker);
    } else if (m_settings.selector == QLatin1String("ucb1")) {
        m_selector = std::make_unique<Ucb1Selector>();
    } else if (m_settings.selector == QLatin1String("thompson")) {
        m_selector = std::make_unique<ThompsonSamplingSelector>(m_settings.thompsonAlpha,
                                                                m_settings.thompsonBeta);
    } else {
        m_selector = std::make_unique<EpsilonGreedySelector>(m_settings.epsilon);
    }
    LOG_INFO(nrBandit, "Arm selector: %s", qPrintable(m_selector->name()));

    m_writeQueue = std::make_unique<WriteQueue>(dbPath);
    if (!m_writeQueue->start()) {
        // Events and rewards then go straight to the serving connection.
        LOG_WARN(nrIpc, "Write queue unavailable, writing events synchronously");
        m_writeQueue.reset();
    }

    BanditEngineConfig banditConfig;
    banditConfig.defaultLimit = m_settings.defaultLimit;
    banditConfig.topicCap = m_settings.defaultTopicCap;
    banditConfig.diverseArmLambda = m_settings.diverseArmLambda;
    m_bandit = std::make_unique<BanditEngine>(*m_ledger, *m_selector, *m_pipeline, banditConfig,
                                              m_writeQueue.get());

    m_aggregator = std::make_unique<MetricsAggregator>(db);
    AutoStopConfig autoStopConfig;
    autoStopConfig.windowDays = m_settings.autoStopWindowDays;
    autoStopConfig.consecutiveDays = m_settings.autoStopConsecutiveDays;
    m_autoStop = std::make_unique<AutoStopMonitor>(db, autoStopConfig);

    MetricsScheduleConfig scheduleConfig;
    scheduleConfig.aggregationIntervalMs = m_settings.aggregationIntervalMs;
    scheduleConfig.autoStopIntervalMs = m_settings.autoStopIntervalMs;
    m_scheduler = std::make_unique<MetricsScheduler>(*m_aggregator, *m_autoStop, scheduleConfig,
                                                     m_flags.get());
    connect(m_scheduler.get(), &MetricsScheduler::experimentAutoStopped,
            this, &RankingService::onExperimentAutoStopped);
    if (m_schedulerEnabled) {
        m_scheduler->start();
    }

    LOG_INFO(nrIpc, "Database opened at: %s", qPrintable(dbPath));
    return true;
}

bool RankingService::flushWrites(int timeoutMs)
{
    return !m_writeQueue || m_writeQueue->waitUntilIdle(timeoutMs);
}

QJsonObject RankingService::handleRequest(const QJsonObject& request)
{
    const QString method = IpcMessage::method(request);
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = IpcMessage::params(request);

    if (method == QLatin1String("getAssignment"))       return handleGetAssignment(id, params);
    if (method == QLatin1String("rank"))                return handleRank(id, params);
    if (method == QLatin1String("decide"))              return handleDecide(id, params);
    if (method == QLatin1String("recordReward"))        return handleRecordReward(id, params);

    if (method == QLatin1String("recordImpressions"))   return handleRecordImpressions(id, params);
    if (method == QLatin1String("recordClick"))         return handleRecordClick(id, params);
    if (method == QLatin1String("getProfile"))          return handleGetProfile(id, params);
    if (method == QLatin1String("updateProfile"))       return handleUpdateProfile(id, params);

    if (method == QLatin1String("createExperiment"))    return handleCreateExperiment(id, params);
    if (method == QLatin1String("activateExperiment"))  return handleActivateExperiment(id, params);
    if (method == QLatin1String("stopExperiment"))      return handleStopExperiment(id, params);
    if (method == QLatin1String("listExperiments"))     return handleListExperiments(id, params);
    if (method == QLatin1String("listAlerts"))          return handleListAlerts(id, params);
    if (method == QLatin1String("resolveAlert"))        return handleResolveAlert(id, params);

    if (method == QLatin1String("getDailyMetrics"))     return handleGetDailyMetrics(id, params);
    if (method == QLatin1String("compareVariants"))     return handleCompareVariants(id, params);
    if (method == QLatin1String("runAggregation"))      return handleRunAggregation(id, params);
    if (method == QLatin1String("runAutoStopCheck"))    return handleRunAutoStopCheck(id, params);

    if (method == QLatin1String("getArmStats"))         return handleGetArmStats(id);
    if (method == QLatin1String("getFeatureFlags"))     return handleGetFeatureFlags(id);
    if (method == QLatin1String("setFeatureFlag"))      return handleSetFeatureFlag(id, params);

    return ServiceBase::handleRequest(request);
}

// ── Serving ─────────────────────────────────────────────────

QJsonObject RankingService::handleGetAssignment(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString subjectId = params.value(QStringLiteral("subjectId")).toString();
    if (subjectId.isEmpty()) {
        return missingParam(id, "subjectId");
    }
    const QString experimentKey = params.value(QStringLiteral("experimentKey")).toString();
    if (experimentKey.isEmpty()) {
        return missingParam(id, "experimentKey");
    }

    const ExperimentAssignment assignment = m_experiments->getAssignment(subjectId, experimentKey);
    return IpcMessage::makeResponse(id, json::toJson(assignment));
}

QJsonObject RankingService::handleRank(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    if (!params.value(QStringLiteral("candidates")).isArray()) {
        return missingParam(id, "candidates");
    }
    QString error;
    auto candidates = json::candidatesFromJson(params.value(QStringLiteral("candidates")).toArray(),
                                               &error);
    if (!candidates) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error);
    }

    const QString subjectId = params.value(QStringLiteral("subjectId")).toString();
    const int targetSize = params.value(QStringLiteral("targetSize")).toInt(m_settings.defaultLimit);
    const double lambda = params.value(QStringLiteral("diversityWeight")).toDouble(-1.0);
    const int topicCap = params.value(QStringLiteral("topicCap")).toInt(m_settings.defaultTopicCap);
    const QString experimentKey = params.value(QStringLiteral("experimentKey")).toString();

    RankOptions options;
    options.diversify = params.value(QStringLiteral("diversify")).toBool(true);

    // Inside an experiment only an active treatment assignment is personalised.
    std::optional<ExperimentAssignment> assignment;
    if (!experimentKey.isEmpty() && !subjectId.isEmpty()) {
        assignment = m_experiments->getAssignment(subjectId, experimentKey);
        options.selectedVariant = assignment->variant;
        options.personalize = assignment->isActive
            && assignment->variant == QLatin1String("treatment");
    }

    const RankResult ranked = m_pipeline->rank(*candidates, subjectId, targetSize, lambda,
                                               topicCap, options);

    if (assignment && params.value(QStringLiteral("logImpressions")).toBool(true)) {
        const QDateTime now = QDateTime::currentDateTimeUtc();
        QVector<ImpressionEvent> events;
        events.reserve(ranked.items.size());
        for (int i = 0; i < ranked.items.size(); ++i) {
            const RankedItem& item = ranked.items.at(i);
            ImpressionEvent event;
            event.subjectId = subjectId;
            event.itemId = item.candidate.id;
            event.sessionId = params.value(QStringLiteral("sessionId")).toString();
            event.pageType = params.value(QStringLiteral("pageType")).toString(QStringLiteral("home"));
            event.position = i + 1;
            event.experimentKey = experimentKey;
            event.variant = assignment->variant;
            event.importanceScore = item.candidate.importanceScore;
            event.rankScore = item.rankScore;
            event.personalized = item.personalized;
            event.diversityApplied = item.diversityApplied;
            event.timestamp = now;
            events.append(event);
        }
        queueImpressions(std::move(events));
    }

    QJsonObject result;
    result[QStringLiteral("items")] = toJsonArray(ranked.items);
    result[QStringLiteral("isPersonalized")] = ranked.personalized;
    result[QStringLiteral("diversityApplied")] = ranked.diversityApplied;
    result[QStringLiteral("degraded")] = ranked.degraded;
    result[QStringLiteral("diversityWeight")] = ranked.lambda;
    if (assignment) {
        result[QStringLiteral("experimentKey")] = experimentKey;
        result[QStringLiteral("variant")] = assignment->variant;
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleDecide(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    DecideRequest request;
    request.subjectId = params.value(QStringLiteral("subjectId")).toString();
    if (request.subjectId.isEmpty()) {
        return missingParam(id, "subjectId");
    }
    QString error;
    auto candidates = json::candidatesFromJson(params.value(QStringLiteral("candidates")).toArray(),
                                               &error);
    if (!candidates) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error);
    }
    request.candidates = std::move(*candidates);

    const QJsonObject context = params.value(QStringLiteral("context")).toObject();
    request.experimentKey = context.value(QStringLiteral("experimentKey")).toString();
    request.category = context.value(QStringLiteral("category")).toString();
    request.limit = params.value(QStringLiteral("limit")).toInt(0);

    const DecideResult decided = m_bandit->decide(request);

    QJsonObject result = json::toJson(decided.decision);
    result[QStringLiteral("servedItems")] = toJsonArray(decided.servedItems);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleRecordReward(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    if (!params.value(QStringLiteral("decisionId")).isDouble()) {
        return missingParam(id, "decisionId");
    }
    const auto decisionId = static_cast<int64_t>(params.value(QStringLiteral("decisionId")).toDouble());
    const auto type = rewardTypeFromString(params.value(QStringLiteral("rewardType")).toString());
    if (!type) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'rewardType' must be CLICK, DWELL_TIME or ENGAGEMENT"));
    }
    if (!params.value(QStringLiteral("rewardValue")).isDouble()) {
        return missingParam(id, "rewardValue");
    }
    const double value = params.value(QStringLiteral("rewardValue")).toDouble();

    std::optional<QString> itemId;
    if (params.value(QStringLiteral("itemId")).isString()) {
        itemId = params.value(QStringLiteral("itemId")).toString();
    }
    QDateTime createdAt = json::toDateTime(params.value(QStringLiteral("timestamp")));
    if (!createdAt.isValid()) {
        createdAt = QDateTime::currentDateTimeUtc();
    }

    // Rejected rewards are logged by the engine and never fail the caller.
    const RewardSubmitStatus status = m_bandit->recordReward(decisionId, *type, value, itemId,
                                                             createdAt);
    QString statusName;
    switch (status) {
    case RewardSubmitStatus::Accepted:        statusName = QStringLiteral("accepted"); break;
    case RewardSubmitStatus::UnknownDecision: statusName = QStringLiteral("unknown_decision"); break;
    case RewardSubmitStatus::Invalid:         statusName = QStringLiteral("invalid"); break;
    case RewardSubmitStatus::Refused:         statusName = QStringLiteral("refused"); break;
    }

    QJsonObject result;
    result[QStringLiteral("accepted")] = status == RewardSubmitStatus::Accepted;
    result[QStringLiteral("status")] = statusName;
    return IpcMessage::makeResponse(id, result);
}

// ── Event logging ───────────────────────────────────────────

bool RankingService::queueImpressions(QVector<ImpressionEvent> events)
{
    if (events.isEmpty()) {
        return true;
    }
    if (!m_flags->isEnabled(QString::fromLatin1(flags::kImpressionLogging))) {
        return false;
    }
    if (!m_writeQueue) {
        return m_eventLog->appendImpressions(events);
    }

    WriteJob job;
    job.kind = QStringLiteral("impressions");
    job.apply = [events = std::move(events)](sqlite3* db) {
        EventLog log(db);
        return log.appendImpressions(events);
    };
    if (!m_writeQueue->submit(std::move(job))) {
        LOG_WARN(nrIpc, "Impression batch dropped, write queue refused it");
        return false;
    }
    return true;
}

QJsonObject RankingService::handleRecordImpressions(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QJsonValue impressions = params.value(QStringLiteral("impressions"));
    if (!impressions.isArray()) {
        return missingParam(id, "impressions");
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    QVector<ImpressionEvent> events;
    int rejected = 0;
    for (const QJsonValue& entry : impressions.toArray()) {
        QString error;
        auto event = json::impressionFromJson(entry.toObject(), &error);
        if (!event) {
            LOG_WARN(nrIpc, "Rejected impression: %s", qPrintable(error));
            ++rejected;
            continue;
        }
        if (!event->timestamp.isValid()) {
            event->timestamp = now;
        }
        events.append(std::move(*event));
    }

    const int accepted = events.size();
    const bool queued = queueImpressions(std::move(events));

    QJsonObject result;
    result[QStringLiteral("queued")] = queued ? accepted : 0;
    result[QStringLiteral("rejected")] = rejected;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleRecordClick(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    QString error;
    auto click = json::clickFromJson(params, &error);
    if (!click) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error);
    }
    if (!click->timestamp.isValid()) {
        click->timestamp = QDateTime::currentDateTimeUtc();
    }

    QJsonObject result;
    if (!m_flags->isEnabled(QString::fromLatin1(flags::kClickLogging))) {
        result[QStringLiteral("queued")] = false;
        return IpcMessage::makeResponse(id, result);
    }

    bool queued = false;
    if (m_writeQueue) {
        WriteJob job;
        job.kind = QStringLiteral("click");
        job.dedupKey = QStringLiteral("click:%1:%2:%3")
                           .arg(click->subjectId, click->itemId)
                           .arg(click->timestamp.toMSecsSinceEpoch());
        job.apply = [event = *click](sqlite3* db) {
            EventLog log(db);
            return log.appendClick(event);
        };
        queued = m_writeQueue->submit(std::move(job));
    } else {
        queued = m_eventLog->appendClick(*click);
    }
    if (!queued) {
        LOG_WARN(nrIpc, "Click for item %s was not recorded", qPrintable(click->itemId));
    }

    result[QStringLiteral("queued")] = queued;
    return IpcMessage::makeResponse(id, result);
}

// ── Profiles ────────────────────────────────────────────────

QJsonObject RankingService::handleGetProfile(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString subjectId = params.value(QStringLiteral("subjectId")).toString();
    if (subjectId.isEmpty()) {
        return missingParam(id, "subjectId");
    }

    bool ok = false;
    const UserProfile profile = m_store->getProfile(subjectId, &ok);
    if (!ok) {
        return IpcMessage::makeError(id, IpcErrorCode::StorageFailure,
                                     QStringLiteral("Failed to load profile for %1").arg(subjectId));
    }
    return IpcMessage::makeResponse(id, json::toJson(profile));
}

QJsonObject RankingService::handleUpdateProfile(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString subjectId = params.value(QStringLiteral("subjectId")).toString();
    if (subjectId.isEmpty()) {
        return missingParam(id, "subjectId");
    }

    bool ok = false;
    const UserProfile current = m_store->getProfile(subjectId, &ok);
    if (!ok) {
        return IpcMessage::makeError(id, IpcErrorCode::StorageFailure,
                                     QStringLiteral("Failed to load profile for %1").arg(subjectId));
    }

    UserProfile updated = json::profileFromJson(params, current);
    if (updated.diversityWeight < 0.0 || updated.diversityWeight > 1.0) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'diversityWeight' must be within [0, 1]"));
    }
    updated.updatedAt = QDateTime::currentDateTimeUtc();
    if (!m_store->upsertProfile(updated)) {
        return IpcMessage::makeError(id, IpcErrorCode::StorageFailure,
                                     QStringLiteral("Failed to save profile for %1").arg(subjectId));
    }
    return IpcMessage::makeResponse(id, json::toJson(updated));
}

// ── Experiment administration ───────────────────────────────

QJsonObject RankingService::handleCreateExperiment(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    QString error;
    auto definition = json::experimentFromJson(params, &error);
    if (!definition) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error);
    }
    if (m_experiments->experiment(definition->key).has_value()) {
        return IpcMessage::makeError(id, IpcErrorCode::AlreadyExists,
                                     QStringLiteral("Experiment '%1' already exists")
                                         .arg(definition->key));
    }
    if (!m_experiments->createExperiment(*definition, &error)) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error);
    }

    const auto stored = m_experiments->experiment(definition->key);
    return IpcMessage::makeResponse(id, json::toJson(stored.value_or(*definition)));
}

QJsonObject RankingService::handleActivateExperiment(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString key = params.value(QStringLiteral("key")).toString();
    if (key.isEmpty()) {
        return missingParam(id, "key");
    }
    QString error;
    if (!m_experiments->activateExperiment(key, &error)) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound, error);
    }

    QJsonObject result;
    result[QStringLiteral("key")] = key;
    result[QStringLiteral("isActive")] = true;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleStopExperiment(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString key = params.value(QStringLiteral("key")).toString();
    if (key.isEmpty()) {
        return missingParam(id, "key");
    }
    const QString reason = params.value(QStringLiteral("reason")).toString(QStringLiteral("manual"));
    QString error;
    if (!m_experiments->stopExperiment(key, reason, &error)) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound, error);
    }

    QJsonObject result;
    result[QStringLiteral("key")] = key;
    result[QStringLiteral("isActive")] = false;
    result[QStringLiteral("stopReason")] = reason;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleListExperiments(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const bool activeOnly = params.value(QStringLiteral("activeOnly")).toBool(false);
    QJsonArray experiments;
    for (const ExperimentDefinition& definition : m_experiments->listExperiments(activeOnly)) {
        experiments.append(json::toJson(definition));
    }

    QJsonObject result;
    result[QStringLiteral("experiments")] = experiments;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleListAlerts(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const bool unresolvedOnly = params.value(QStringLiteral("unresolvedOnly")).toBool(true);
    QJsonArray alerts;
    for (const ExperimentAlert& alert : m_experimentStore->listAlerts(unresolvedOnly)) {
        alerts.append(json::toJson(alert));
    }

    QJsonObject result;
    result[QStringLiteral("alerts")] = alerts;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleResolveAlert(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    if (!params.value(QStringLiteral("alertId")).isDouble()) {
        return missingParam(id, "alertId");
    }
    const auto alertId = static_cast<int64_t>(params.value(QStringLiteral("alertId")).toDouble());
    if (!m_experimentStore->resolveAlert(alertId)) {
        return IpcMessage::makeError(id, IpcErrorCode::NotFound,
                                     QStringLiteral("Alert %1 not found").arg(alertId));
    }

    QJsonObject result;
    result[QStringLiteral("resolved")] = true;
    return IpcMessage::makeResponse(id, result);
}

// ── Metrics ─────────────────────────────────────────────────

QJsonObject RankingService::handleGetDailyMetrics(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString key = params.value(QStringLiteral("experimentKey")).toString();
    if (key.isEmpty()) {
        return missingParam(id, "experimentKey");
    }
    const QString today = datePartitionFor(QDateTime::currentDateTimeUtc());
    const QString dateFrom = params.value(QStringLiteral("dateFrom")).toString(today);
    const QString dateTo = params.value(QStringLiteral("dateTo")).toString(today);

    bool ok = false;
    const QVector<DailyMetric> metrics = m_aggregator->getDailyMetrics(key, dateFrom, dateTo, &ok);
    if (!ok) {
        return IpcMessage::makeError(id, IpcErrorCode::StorageFailure,
                                     QStringLiteral("Failed to read metrics for '%1'").arg(key));
    }

    QJsonArray rows;
    for (const DailyMetric& metric : metrics) {
        rows.append(json::toJson(metric));
    }
    QJsonObject result;
    result[QStringLiteral("metrics")] = rows;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleCompareVariants(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString key = params.value(QStringLiteral("experimentKey")).toString();
    if (key.isEmpty()) {
        return missingParam(id, "experimentKey");
    }
    const int days = params.value(QStringLiteral("days")).toInt(7);

    QJsonArray variants;
    for (const VariantSummary& summary : m_aggregator->compareVariants(key, days)) {
        variants.append(json::toJson(summary));
    }
    QJsonObject result;
    result[QStringLiteral("experimentKey")] = key;
    result[QStringLiteral("days")] = days;
    result[QStringLiteral("variants")] = variants;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleRunAggregation(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    // Draining first makes the run see everything already acknowledged.
    if (!flushWrites(params.value(QStringLiteral("flushTimeoutMs")).toInt(5000))) {
        LOG_WARN(nrMetrics, "Aggregation started with writes still queued");
    }
    const AggregationReport report = m_scheduler->runAggregationNow();

    QJsonObject result;
    result[QStringLiteral("experiments")] = report.experiments;
    result[QStringLiteral("succeeded")] = report.succeeded;
    result[QStringLiteral("failed")] = report.failed;
    result[QStringLiteral("rowsWritten")] = report.rowsWritten;
    result[QStringLiteral("rowsFinalized")] = report.rowsFinalized;
    result[QStringLiteral("failedKeys")] = json::fromStringList(report.failedKeys);
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleRunAutoStopCheck(uint64_t id, const QJsonObject& params)
{
    Q_UNUSED(params);
    if (!ensureReady()) {
        return unavailable(id);
    }

    QJsonArray outcomes;
    for (const AutoStopOutcome& outcome : m_scheduler->runAutoStopCheckNow()) {
        QJsonObject entry;
        entry[QStringLiteral("experimentKey")] = outcome.experimentKey;
        entry[QStringLiteral("stopped")] = outcome.stopped;
        entry[QStringLiteral("failed")] = outcome.failed;
        entry[QStringLiteral("controlCtr")] = outcome.evaluation.avgControlCtr;
        entry[QStringLiteral("treatmentCtr")] = outcome.evaluation.avgTreatmentCtr;
        entry[QStringLiteral("consecutiveDegradedDays")] = outcome.evaluation.consecutiveDegradedDays;
        entry[QStringLiteral("degradedDates")] = json::fromStringList(outcome.evaluation.degradedDates);
        if (outcome.alertId) {
            entry[QStringLiteral("alertId")] = static_cast<qint64>(*outcome.alertId);
        }
        outcomes.append(entry);
    }

    QJsonObject result;
    result[QStringLiteral("outcomes")] = outcomes;
    return IpcMessage::makeResponse(id, result);
}

// ── Bandit and flags ────────────────────────────────────────

QJsonObject RankingService::handleGetArmStats(uint64_t id)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    QJsonArray arms;
    for (const ArmStats& stats : m_ledger->armStats()) {
        arms.append(toJson(stats));
    }
    QJsonObject result;
    result[QStringLiteral("arms")] = arms;
    result[QStringLiteral("selector")] = m_selector->name();
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleGetFeatureFlags(uint64_t id)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    QJsonArray list;
    for (const FeatureFlag& flag : m_flags->list()) {
        list.append(toJson(flag));
    }
    QJsonObject result;
    result[QStringLiteral("flags")] = list;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RankingService::handleSetFeatureFlag(uint64_t id, const QJsonObject& params)
{
    if (!ensureReady()) {
        return unavailable(id);
    }

    const QString key = params.value(QStringLiteral("key")).toString();
    if (key.isEmpty()) {
        return missingParam(id, "key");
    }
    if (!params.contains(QStringLiteral("enabled")) && !params.contains(QStringLiteral("value"))) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Provide 'enabled' and/or 'value'"));
    }

    if (params.contains(QStringLiteral("enabled"))
        && !m_flags->setEnabled(key, params.value(QStringLiteral("enabled")).toBool())) {
        return IpcMessage::makeError(id, IpcErrorCode::StorageFailure,
                                     QStringLiteral("Failed to update flag '%1'").arg(key));
    }
    if (params.contains(QStringLiteral("value"))) {
        const QJsonValue raw = params.value(QStringLiteral("value"));
        std::optional<QString> value;
        if (raw.isString()) {
            value = raw.toString();
        } else if (raw.isDouble()) {
            value = QString::number(raw.toDouble());
        }
        if (!m_flags->setValue(key, value)) {
            return IpcMessage::makeError(id, IpcErrorCode::StorageFailure,
                                         QStringLiteral("Failed to update flag '%1'").arg(key));
        }
    }

    const auto flag = m_flags->get(key);
    return IpcMessage::makeResponse(id, flag ? toJson(*flag) : QJsonObject{});
}

void RankingService::onExperimentAutoStopped(const QString& experimentKey, double degradation)
{
    m_experiments->cache().invalidateExperiment(experimentKey);

    QJsonObject params;
    params[QStringLiteral("experimentKey")] = experimentKey;
    params[QStringLiteral("degradation")] = degradation;
    sendNotification(QStringLiteral("experimentAutoStopped"), params);
}

} // namespace nr
