#include "core/ranking/scorer.h"

#include <algorithm>

namespace nr {

namespace {

// Age in seconds; publication times in the future count as age 0.
qint64 ageSeconds(const QDateTime& publishedAt, const QDateTime& now)
{
    return std::max<qint64>(0, publishedAt.secsTo(now));
}

} // namespace

Scorer::Scorer(const RankWeights& weights)
    : m_weights(weights)
{
}

double Scorer::computeRecency(const QDateTime& publishedAt, const QDateTime& now)
{
    if (!publishedAt.isValid()) {
        return 0.1;
    }
    const double hours = static_cast<double>(ageSeconds(publishedAt, now)) / 3600.0;
    if (hours <= 1.0) return 1.0;
    if (hours <= 6.0) return 0.9;
    if (hours <= 24.0) return 0.7;
    if (hours <= 72.0) return 0.4;
    if (hours <= 168.0) return 0.2;
    return 0.1;
}

double Scorer::computeNovelty(const QDateTime& publishedAt, const QDateTime& now)
{
    if (!publishedAt.isValid()) {
        return 0.2;
    }
    const double minutes = static_cast<double>(ageSeconds(publishedAt, now)) / 60.0;
    if (minutes <= 30.0) return 1.0;
    if (minutes <= 120.0) return 0.8;
    if (minutes <= 360.0) return 0.5;
    return 0.2;
}

double Scorer::normalizeImportance(double rawImportance) const
{
    if (m_weights.importanceScale <= 0.0) {
        return std::clamp(rawImportance, 0.0, 1.0);
    }
    return std::clamp(rawImportance / m_weights.importanceScale, 0.0, 1.0);
}

RankBreakdown Scorer::computeBreakdown(const Candidate& candidate, double personalizedRelevance,
                                       const QDateTime& now) const
{
    RankBreakdown breakdown;
    breakdown.importance = normalizeImportance(candidate.importanceScore);
    breakdown.recency = computeRecency(candidate.publishedAt, now);
    breakdown.personalized = std::clamp(personalizedRelevance, 0.0, 1.0);
    breakdown.novelty = computeNovelty(candidate.publishedAt, now);
    return breakdown;
}

double Scorer::computeScore(const Candidate& candidate, double personalizedRelevance,
                            const QDateTime& now) const
{
    const RankBreakdown b = computeBreakdown(candidate, personalizedRelevance, now);
    return m_weights.importance * b.importance
         + m_weights.recency * b.recency
         + m_weights.personalized * b.personalized
         + m_weights.novelty * b.novelty;
}

void Scorer::sortByRankScore(QVector<RankedItem>& items)
{
    std::stable_sort(items.begin(), items.end(), [](const RankedItem& a, const RankedItem& b) {
        return a.rankScore > b.rankScore;
    });
}

} // namespace nr
