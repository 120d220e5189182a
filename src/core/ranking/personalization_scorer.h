#pragma once

#include "core/shared/scoring_types.h"
#include "core/shared/types.h"

#include <QVector>

namespace nr {

struct PersonalizationBreakdown {
    double interest = 0.0;
    double clickHistory = 0.0;
    double topic = 0.0;
    double total = 0.0;             // clamped to [0,1]
};

// PersonalizationScorer -- user relevance of a candidate from the profile's
// stated interests and the subject's recent clicks. Returns 0 for profiles
// with personalization disabled.
class PersonalizationScorer {
public:
    explicit PersonalizationScorer(const PersonalizationWeights& weights = {});

    double score(const Candidate& candidate, const UserProfile& profile,
                 const QVector<ClickEvent>& recentClicks) const;

    PersonalizationBreakdown breakdown(const Candidate& candidate, const UserProfile& profile,
                                       const QVector<ClickEvent>& recentClicks) const;

    // Ticker match (+tickerMatchBoost once) plus keyword hits in title/body.
    double interestRelevance(const Candidate& candidate, const UserProfile& profile) const;

    // Fraction f of clicks sharing a ticker, mapped to [min, max]; f = 0 gives 0.
    double clickRelevance(const Candidate& candidate, const QVector<ClickEvent>& recentClicks) const;

    // Fraction of clicks on the candidate's topic, scaled to [0, topicMaxWeight].
    double topicRelevance(const Candidate& candidate, const QVector<ClickEvent>& recentClicks) const;

    const PersonalizationWeights& weights() const { return m_weights; }

private:
    PersonalizationWeights m_weights;
};

} // namespace nr
