#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>
#include <cstdint>
#include <optional>

namespace nr {

// Why the bandit picked the arm it served.
enum class SelectionReason {
    Exploration,
    Exploitation,
    Fallback,
};

QString selectionReasonToString(SelectionReason reason);
SelectionReason selectionReasonFromString(const QString& str);

// Observed outcome kinds fed back into the bandit ledger.
enum class RewardType {
    Click,
    DwellTime,
    Engagement,
};

QString rewardTypeToString(RewardType type);
std::optional<RewardType> rewardTypeFromString(const QString& str);

// UTC day bucket ("yyyy-MM-dd") used to partition logs and daily metrics.
QString datePartitionFor(const QDateTime& timestamp);

// An item eligible for ranking. Read-only to the engine.
struct Candidate {
    QString id;
    double importanceScore = 0.0;
    QDateTime publishedAt;
    std::optional<QString> topicId;
    std::optional<QString> embeddingRef;
    QString title;
    QString body;
    QStringList tickers;
};

struct RankedItem {
    Candidate candidate;
    double rankScore = 0.0;
    double personalizedRelevance = 0.0;
    QString selectedVariant;
    bool personalized = false;
    bool diversityApplied = false;
};

struct UserProfile {
    QString subjectId;
    QStringList interestedTickers;
    QStringList interestedKeywords;
    double diversityWeight = 0.7;
    bool personalizationEnabled = false;
    bool active = true;
    QDateTime updatedAt;
};

struct ImpressionEvent {
    int64_t id = 0;
    QString subjectId;
    QString itemId;
    QString sessionId;
    QString pageType;
    int position = 0;               // 1-based slot in the served list
    QString experimentKey;
    QString variant;
    double importanceScore = 0.0;
    double rankScore = 0.0;
    bool personalized = false;
    bool diversityApplied = false;
    QDateTime timestamp;
    QString datePartition;
};

struct ClickEvent {
    int64_t id = 0;
    QString subjectId;
    QString itemId;
    QString sessionId;
    int position = 0;
    QString experimentKey;
    QString variant;
    std::optional<int64_t> dwellTimeMs;
    QStringList itemTickers;
    std::optional<QString> topicId;
    QDateTime timestamp;
    QString datePartition;
};

struct VariantAllocation {
    QString name;
    int percentage = 0;
};

struct ExperimentDefinition {
    QString key;
    QString name;
    QString description;
    QVector<VariantAllocation> orderedVariants;
    QDateTime startAt;              // invalid = open start
    QDateTime endAt;                // invalid = open end
    bool isActive = false;
    bool autoStopEnabled = true;
    double autoStopThreshold = 0.05;
    int64_t minSampleSize = 1000;
    QString stopReason;
    QDateTime createdAt;
    QDateTime updatedAt;

    int totalPercentage() const;
    bool isRunningAt(const QDateTime& now) const;
};

struct ExperimentAssignment {
    QString subjectId;
    QString experimentKey;
    QString variant = QStringLiteral("control");
    int bucket = -1;
    bool isActive = false;
};

struct BanditArm {
    int armId = 0;
    QString name;
    int64_t rewardCount = 0;
    double rewardSum = 0.0;
    double rewardSumSquared = 0.0;
    bool enabled = true;

    double meanReward() const;
    double rewardVariance() const;
};

struct BanditContext {
    QString subjectId;
    int timeSlot = 0;               // hour of day, 0-23
    QString category = QStringLiteral("finance");
    QString experimentKey;
};

struct BanditDecision {
    std::optional<int64_t> decisionId;
    int armId = 0;
    QString armName;
    QString subjectId;
    BanditContext context;
    double decisionValue = 0.0;
    SelectionReason reason = SelectionReason::Fallback;
    QStringList servedItemIds;
    QDateTime createdAt;
};

struct BanditReward {
    int64_t id = 0;
    int64_t decisionId = 0;
    RewardType rewardType = RewardType::Click;
    double rewardValue = 0.0;
    std::optional<QString> itemId;
    QDateTime createdAt;
};

struct DailyMetric {
    QString experimentKey;
    QString variant;
    QString datePartition;
    int64_t impressions = 0;
    int64_t clicks = 0;
    int64_t uniqueUsers = 0;
    double ctr = 0.0;
    double avgDwellTimeMs = 0.0;
    double avgPosition = 0.0;
    double hideRate = 0.0;
    double diversityScore = 0.0;
    double personalizationScore = 0.0;
    bool isFinal = false;
    QDateTime updatedAt;
};

struct VariantSummary {
    QString variant;
    int days = 0;
    int64_t totalImpressions = 0;
    int64_t totalClicks = 0;
    int64_t totalUniqueUsers = 0;
    double avgCtr = 0.0;
    double avgDwellTimeMs = 0.0;
    double avgPosition = 0.0;
    double avgHideRate = 0.0;
    double avgDiversityScore = 0.0;
    double avgPersonalizationScore = 0.0;
};

struct ExperimentAlert {
    int64_t id = 0;
    QString experimentKey;
    QString alertType = QStringLiteral("AUTO_STOP");
    double controlCtr = 0.0;
    double treatmentCtr = 0.0;
    double degradation = 0.0;
    double threshold = 0.0;
    QStringList degradedDates;
    QString message;
    bool resolved = false;
    QDateTime createdAt;
    QDateTime resolvedAt;
};

} // namespace nr
