#pragma once

#include "core/bandit/arm_selector.h"
#include "core/bandit/bandit_ledger.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QVector>

#include <optional>

namespace nr {

class RankingPipeline;
class WriteQueue;

namespace arms {
constexpr const char* kPersonalized = "personalized";
constexpr const char* kPopular = "popular";
constexpr const char* kDiverse = "diverse";
constexpr const char* kRecent = "recent";
} // namespace arms

struct BanditEngineConfig {
    int defaultLimit = 10;
    int topicCap = 2;
    double diverseArmLambda = 0.5;
    double fallbackDecisionValue = 0.5;
};

struct DecideRequest {
    QString subjectId;
    QVector<Candidate> candidates;
    QString experimentKey;
    QString category;               // empty = context default
    int limit = 0;                  // <= 0 uses the configured default
    QDateTime now;                  // invalid = current time
};

struct DecideResult {
    BanditDecision decision;
    QVector<RankedItem> servedItems;
};

enum class RewardSubmitStatus {
    Accepted,
    UnknownDecision,
    Invalid,
    Refused,                        // write path full, stopped or duplicate
};

// BanditEngine -- per-request arm choice, strategy execution and reward intake.
//
// decide() never fails: an unreadable registry, an empty registry or a
// selector that cannot answer serves the personalized strategy with reason
// FALLBACK and no decision id. Nominal decisions are persisted before the
// served list is returned. Rewards are validated against the ledger, then
// handed to the write queue (when present) so the caller never waits on I/O.
class BanditEngine {
public:
    static constexpr int kFallbackArmId = 1;   // "personalized"

    BanditEngine(BanditLedger& ledger, ArmSelector& selector, RankingPipeline& pipeline,
                 BanditEngineConfig config = {}, WriteQueue* writeQueue = nullptr);

    DecideResult decide(const DecideRequest& request);

    RewardSubmitStatus recordReward(int64_t decisionId, RewardType type, double value,
                                    const std::optional<QString>& itemId = std::nullopt,
                                    const QDateTime& createdAt = QDateTime::currentDateTimeUtc());

    // Click -> 1.0; dwell/engagement (seconds) -> min(seconds / 60, 1).
    // nullopt for negative or non-finite input.
    static std::optional<double> normalizeReward(RewardType type, double value);

    QVector<RankedItem> applyStrategy(const QString& armName, const DecideRequest& request,
                                      int limit);

    static QString rewardDedupKey(int64_t decisionId, const QDateTime& createdAt, RewardType type);

private:
    DecideResult fallback(const DecideRequest& request, const BanditContext& context, int limit);

    BanditLedger& m_ledger;
    ArmSelector& m_selector;
    RankingPipeline& m_pipeline;
    BanditEngineConfig m_config;
    WriteQueue* m_writeQueue = nullptr;
};

} // namespace nr
