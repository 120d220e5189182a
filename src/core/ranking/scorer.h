#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QVector>

namespace nr {

struct RankBreakdown {
    double importance = 0.0;        // normalised to [0,1]
    double recency = 0.0;
    double personalized = 0.0;
    double novelty = 0.0;
};

// Scorer -- final rank score as a weighted blend of importance, recency,
// personalized relevance and novelty.
class Scorer {
public:
    explicit Scorer(const RankWeights& weights = {});

    RankBreakdown computeBreakdown(const Candidate& candidate, double personalizedRelevance,
                                   const QDateTime& now) const;

    double computeScore(const Candidate& candidate, double personalizedRelevance,
                        const QDateTime& now) const;

    // Tiered by hours since publication: 1.0 / 0.9 / 0.7 / 0.4 / 0.2 / 0.1.
    static double computeRecency(const QDateTime& publishedAt, const QDateTime& now);

    // Tiered by minutes since publication: 1.0 / 0.8 / 0.5 / 0.2.
    static double computeNovelty(const QDateTime& publishedAt, const QDateTime& now);

    double normalizeImportance(double rawImportance) const;

    // Sort by (rankScore DESC, input position ASC).
    static void sortByRankScore(QVector<RankedItem>& items);

    const RankWeights& weights() const { return m_weights; }

private:
    RankWeights m_weights;
};

} // namespace nr
