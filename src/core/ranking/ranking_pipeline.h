#pragma once

#include "core/ranking/diversity_filter.h"
#include "core/ranking/personalization_scorer.h"
#include "core/ranking/scorer.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QVector>

namespace nr {

class EventLog;
class FeatureFlags;
class SQLiteStore;

struct RankOptions {
    bool personalize = true;
    bool diversify = true;
    QString selectedVariant;        // stamped on every returned item
    QDateTime now;                  // invalid = current time
};

struct RankResult {
    QVector<RankedItem> items;
    bool personalized = false;
    bool diversityApplied = false;
    bool degraded = false;          // profile or click lookup failed
    double lambda = 0.0;
};

// RankingPipeline -- scores a candidate pool for one subject and selects the
// served list.
//
// Stages: load profile + click window -> score -> stable sort -> bound the
// pool -> MMR + topic cap. Profile-store failures degrade to the
// unpersonalized formula; they never fail the request.
class RankingPipeline {
public:
    static constexpr int kMaxPoolSize = 100;
    static constexpr double kDefaultLambda = 0.7;

    RankingPipeline(SQLiteStore& store, EventLog& events, const SimilarityResolver& resolver,
                    const RankWeights& rankWeights = {},
                    const PersonalizationWeights& personalizationWeights = {},
                    FeatureFlags* flags = nullptr);

    // lambda < 0 uses the subject's stored diversity weight. topicCap <= 0
    // disables the cap.
    RankResult rank(const QVector<Candidate>& candidates, const QString& subjectId,
                    int targetSize, double lambda, int topicCap,
                    const RankOptions& options = {});

    // Scores and sorts without any selection; used by the bandit arms.
    QVector<RankedItem> score(const QVector<Candidate>& candidates, const UserProfile& profile,
                              const QVector<ClickEvent>& recentClicks,
                              const QDateTime& now) const;

    // min(3K, 100), never below K.
    static int poolLimit(int targetSize);

    const Scorer& scorer() const { return m_scorer; }
    const DiversityFilter& diversityFilter() const { return m_filter; }

private:
    double resolveLambda(const std::optional<UserProfile>& profile) const;

    SQLiteStore& m_store;
    EventLog& m_events;
    Scorer m_scorer;
    PersonalizationScorer m_personalization;
    DiversityFilter m_filter;
    FeatureFlags* m_flags = nullptr;
    int m_clickHistoryDays = 7;
};

} // namespace nr
