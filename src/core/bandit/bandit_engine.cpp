#include "core/bandit/bandit_engine.h"
#include "core/ranking/ranking_pipeline.h"
#include "core/ranking/scorer.h"
#include "core/shared/logging.h"
#include "core/store/write_queue.h"

#include <algorithm>
#include <cmath>

namespace nr {

namespace {

QVector<RankedItem> wrapCandidates(const QVector<Candidate>& candidates, double (*score)(const Candidate&))
{
    QVector<RankedItem> items;
    items.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        RankedItem item;
        item.candidate = candidate;
        item.rankScore = score(candidate);
        items.append(std::move(item));
    }
    return items;
}

double importanceOf(const Candidate& candidate)
{
    return candidate.importanceScore;
}

double publishedOf(const Candidate& candidate)
{
    // Unknown publish times sort last.
    return candidate.publishedAt.isValid()
        ? static_cast<double>(candidate.publishedAt.toMSecsSinceEpoch())
        : -1.0;
}

void truncate(QVector<RankedItem>& items, int limit)
{
    if (items.size() > limit) {
        items.resize(limit);
    }
}

} // namespace

BanditEngine::BanditEngine(BanditLedger& ledger, ArmSelector& selector, RankingPipeline& pipeline,
                           BanditEngineConfig config, WriteQueue* writeQueue)
    : m_ledger(ledger)
    , m_selector(selector)
    , m_pipeline(pipeline)
    , m_config(config)
    , m_writeQueue(writeQueue)
{
}

std::optional<double> BanditEngine::normalizeReward(RewardType type, double value)
{
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    switch (type) {
    case RewardType::Click:
        return 1.0;
    case RewardType::DwellTime:
    case RewardType::Engagement:
        return std::min(value / 60.0, 1.0);
    }
    return std::nullopt;
}

QString BanditEngine::rewardDedupKey(int64_t decisionId, const QDateTime& createdAt, RewardType type)
{
    return QStringLiteral("reward:%1:%2:%3")
        .arg(decisionId)
        .arg(createdAt.toMSecsSinceEpoch())
        .arg(rewardTypeToString(type));
}

QVector<RankedItem> BanditEngine::applyStrategy(const QString& armName, const DecideRequest& request,
                                                int limit)
{
    RankOptions options;
    options.now = request.now;
    options.selectedVariant = armName;

    if (armName == QLatin1String(arms::kPopular)) {
        QVector<RankedItem> items = wrapCandidates(request.candidates, &importanceOf);
        Scorer::sortByRankScore(items);
        truncate(items, limit);
        return items;
    }
    if (armName == QLatin1String(arms::kRecent)) {
        QVector<RankedItem> items = wrapCandidates(request.candidates, &publishedOf);
        Scorer::sortByRankScore(items);
        truncate(items, limit);
        // rankScore held the publish time only for ordering.
        for (RankedItem& item : items) {
            item.rankScore = item.candidate.importanceScore;
        }
        return items;
    }
    if (armName == QLatin1String(arms::kDiverse)) {
        options.personalize = false;
        return m_pipeline.rank(request.candidates, request.subjectId, limit,
                               m_config.diverseArmLambda, m_config.topicCap, options).items;
    }

    if (armName != QLatin1String(arms::kPersonalized)) {
        LOG_WARN(nrBandit, "No strategy for arm '%s', serving personalized ranking",
                 qUtf8Printable(armName));
    }
    return m_pipeline.rank(request.candidates, request.subjectId, limit, -1.0,
                           m_config.topicCap, options).items;
}

DecideResult BanditEngine::fallback(const DecideRequest& request, const BanditContext& context,
                                    int limit)
{
    DecideResult result;
    result.decision.armName = QString::fromLatin1(arms::kPersonalized);
    result.decision.subjectId = request.subjectId;
    result.decision.context = context;
    result.decision.decisionValue = m_config.fallbackDecisionValue;
    result.decision.reason = SelectionReason::Fallback;
    result.decision.createdAt = request.now.isValid() ? request.now : QDateTime::currentDateTimeUtc();

    result.decision.armId = kFallbackArmId;

    result.servedItems = applyStrategy(result.decision.armName, request, limit);
    for (const RankedItem& item : result.servedItems) {
        result.decision.servedItemIds.append(item.candidate.id);
    }
    return result;
}

DecideResult BanditEngine::decide(const DecideRequest& request)
{
    const QDateTime now = request.now.isValid() ? request.now : QDateTime::currentDateTimeUtc();
    const int limit = request.limit > 0 ? request.limit : std::max(1, m_config.defaultLimit);

    BanditContext context;
    context.subjectId = request.subjectId;
    context.timeSlot = now.toUTC().time().hour();
    if (!request.category.isEmpty()) {
        context.category = request.category;
    }
    context.experimentKey = request.experimentKey;

    bool registryOk = false;
    const QVector<BanditArm> registry = m_ledger.listArms(&registryOk);
    if (!registryOk || registry.isEmpty()) {
        LOG_WARN(nrBandit, "Arm registry unavailable, serving fallback to %s",
                 qUtf8Printable(request.subjectId));
        return fallback(request, context, limit);
    }

    const std::optional<ArmSelection> selection = m_selector.selectArm(context, registry);
    if (!selection.has_value()) {
        LOG_WARN(nrBandit, "Selector '%s' gave no arm, serving fallback to %s",
                 qUtf8Printable(m_selector.name()), qUtf8Printable(request.subjectId));
        return fallback(request, context, limit);
    }
    if (selection->reason == SelectionReason::Fallback) {
        return fallback(request, context, limit);
    }

    auto chosen = std::find_if(registry.begin(), registry.end(), [&](const BanditArm& arm) {
        return arm.armId == selection->armId;
    });
    if (chosen == registry.end()) {
        return fallback(request, context, limit);
    }

    DecideResult result;
    result.decision.armId = chosen->armId;
    result.decision.armName = chosen->name;
    result.decision.subjectId = request.subjectId;
    result.decision.context = context;
    result.decision.decisionValue = selection->decisionValue;
    result.decision.reason = selection->reason;
    result.decision.createdAt = now;

    DecideRequest timed = request;
    timed.now = now;
    result.servedItems = applyStrategy(chosen->name, timed, limit);
    for (const RankedItem& item : result.servedItems) {
        result.decision.servedItemIds.append(item.candidate.id);
    }

    result.decision.decisionId = m_ledger.recordDecision(result.decision);
    if (!result.decision.decisionId.has_value()) {
        LOG_WARN(nrBandit, "Decision for %s served without persistence",
                 qUtf8Printable(request.subjectId));
    }

    LOG_DEBUG(nrBandit, "Arm %s (%s) for %s, %d items", qUtf8Printable(chosen->name),
              qUtf8Printable(selectionReasonToString(selection->reason)),
              qUtf8Printable(request.subjectId), static_cast<int>(result.servedItems.size()));
    return result;
}

RewardSubmitStatus BanditEngine::recordReward(int64_t decisionId, RewardType type, double value,
                                              const std::optional<QString>& itemId,
                                              const QDateTime& createdAt)
{
    const std::optional<double> normalized = normalizeReward(type, value);
    if (!normalized.has_value()) {
        LOG_WARN(nrBandit, "Rejecting %s reward value %f for decision %lld",
                 qUtf8Printable(rewardTypeToString(type)), value,
                 static_cast<long long>(decisionId));
        return RewardSubmitStatus::Invalid;
    }
    if (!m_ledger.decision(decisionId).has_value()) {
        LOG_WARN(nrBandit, "Reward for unknown decision %lld dropped",
                 static_cast<long long>(decisionId));
        return RewardSubmitStatus::UnknownDecision;
    }

    BanditReward reward;
    reward.decisionId = decisionId;
    reward.rewardType = type;
    reward.rewardValue = *normalized;
    reward.itemId = itemId;
    reward.createdAt = createdAt.isValid() ? createdAt : QDateTime::currentDateTimeUtc();

    if (!m_writeQueue) {
        return m_ledger.recordReward(reward) == RewardStatus::Recorded
            ? RewardSubmitStatus::Accepted
            : RewardSubmitStatus::Refused;
    }

    WriteJob job;
    job.kind = QStringLiteral("reward");
    job.dedupKey = rewardDedupKey(decisionId, reward.createdAt, type);
    job.apply = [reward](sqlite3* db) {
        BanditLedger ledger(db);
        // Only storage errors are worth retrying.
        return ledger.recordReward(reward) != RewardStatus::StorageError;
    };
    return m_writeQueue->submit(std::move(job)) ? RewardSubmitStatus::Accepted
                                                : RewardSubmitStatus::Refused;
}

} // namespace nr
