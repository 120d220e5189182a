#include "core/ranking/personalization_scorer.h"

#include <QSet>

#include <algorithm>

namespace nr {

namespace {

QSet<QString> normalizedTickers(const QStringList& tickers)
{
    QSet<QString> result;
    for (const QString& ticker : tickers) {
        const QString normalized = ticker.trimmed().toUpper();
        if (!normalized.isEmpty()) {
            result.insert(normalized);
        }
    }
    return result;
}

} // namespace

PersonalizationScorer::PersonalizationScorer(const PersonalizationWeights& weights)
    : m_weights(weights)
{
}

double PersonalizationScorer::interestRelevance(const Candidate& candidate,
                                                const UserProfile& profile) const
{
    double relevance = 0.0;

    if (normalizedTickers(candidate.tickers).intersects(normalizedTickers(profile.interestedTickers))) {
        relevance += m_weights.tickerMatchBoost;
    }

    const QString text = (candidate.title + QLatin1Char(' ') + candidate.body).toLower();
    double keywordScore = 0.0;
    for (const QString& keyword : profile.interestedKeywords) {
        const QString needle = keyword.trimmed().toLower();
        if (!needle.isEmpty() && text.contains(needle)) {
            keywordScore += m_weights.keywordBoost;
        }
    }
    relevance += std::min(keywordScore, m_weights.keywordMaxContribution);
    return relevance;
}

double PersonalizationScorer::clickRelevance(const Candidate& candidate,
                                             const QVector<ClickEvent>& recentClicks) const
{
    if (recentClicks.isEmpty()) {
        return 0.0;
    }
    const QSet<QString> tickers = normalizedTickers(candidate.tickers);
    if (tickers.isEmpty()) {
        return 0.0;
    }

    int matching = 0;
    for (const ClickEvent& click : recentClicks) {
        if (normalizedTickers(click.itemTickers).intersects(tickers)) {
            ++matching;
        }
    }
    if (matching == 0) {
        return 0.0;
    }

    const double fraction = static_cast<double>(matching) / static_cast<double>(recentClicks.size());
    return m_weights.clickMinWeight + fraction * (m_weights.clickMaxWeight - m_weights.clickMinWeight);
}

double PersonalizationScorer::topicRelevance(const Candidate& candidate,
                                             const QVector<ClickEvent>& recentClicks) const
{
    if (!candidate.topicId.has_value() || recentClicks.isEmpty()) {
        return 0.0;
    }

    int withTopic = 0;
    int sameTopic = 0;
    for (const ClickEvent& click : recentClicks) {
        if (!click.topicId.has_value()) {
            continue;
        }
        ++withTopic;
        if (*click.topicId == *candidate.topicId) {
            ++sameTopic;
        }
    }
    if (withTopic == 0) {
        return 0.0;
    }
    return m_weights.topicMaxWeight * static_cast<double>(sameTopic) / static_cast<double>(withTopic);
}

PersonalizationBreakdown PersonalizationScorer::breakdown(const Candidate& candidate,
                                                          const UserProfile& profile,
                                                          const QVector<ClickEvent>& recentClicks) const
{
    PersonalizationBreakdown result;
    if (!profile.personalizationEnabled) {
        return result;
    }
    result.interest = interestRelevance(candidate, profile);
    result.clickHistory = clickRelevance(candidate, recentClicks);
    result.topic = topicRelevance(candidate, recentClicks);
    result.total = std::clamp(result.interest + result.clickHistory + result.topic, 0.0, 1.0);
    return result;
}

double PersonalizationScorer::score(const Candidate& candidate, const UserProfile& profile,
                                    const QVector<ClickEvent>& recentClicks) const
{
    return breakdown(candidate, profile, recentClicks).total;
}

} // namespace nr
