#include "core/ranking/ranking_pipeline.h"
#include "core/experiment/feature_flags.h"
#include "core/shared/logging.h"
#include "core/store/event_log.h"
#include "core/store/sqlite_store.h"

#include <algorithm>

namespace nr {

RankingPipeline::RankingPipeline(SQLiteStore& store, EventLog& events,
                                 const SimilarityResolver& resolver,
                                 const RankWeights& rankWeights,
                                 const PersonalizationWeights& personalizationWeights,
                                 FeatureFlags* flags)
    : m_store(store)
    , m_events(events)
    , m_scorer(rankWeights)
    , m_personalization(personalizationWeights)
    , m_filter(resolver)
    , m_flags(flags)
    , m_clickHistoryDays(std::max(1, personalizationWeights.clickHistoryDays))
{
}

int RankingPipeline::poolLimit(int targetSize)
{
    if (targetSize <= 0) {
        return 0;
    }
    return std::max(targetSize, std::min(3 * targetSize, kMaxPoolSize));
}

double RankingPipeline::resolveLambda(const std::optional<UserProfile>& profile) const
{
    if (profile.has_value() && profile->active) {
        return profile->diversityWeight;
    }
    if (m_flags) {
        if (auto configured = m_flags->numberValue(QString::fromLatin1(flags::kMmrLambda))) {
            return std::clamp(*configured, 0.0, 1.0);
        }
    }
    return kDefaultLambda;
}

QVector<RankedItem> RankingPipeline::score(const QVector<Candidate>& candidates,
                                           const UserProfile& profile,
                                           const QVector<ClickEvent>& recentClicks,
                                           const QDateTime& now) const
{
    QVector<RankedItem> items;
    items.reserve(candidates.size());
    for (const Candidate& candidate : candidates) {
        RankedItem item;
        item.candidate = candidate;
        item.personalized = profile.personalizationEnabled;
        item.personalizedRelevance = m_personalization.score(candidate, profile, recentClicks);
        item.rankScore = m_scorer.computeScore(candidate, item.personalizedRelevance, now);
        items.append(std::move(item));
    }
    Scorer::sortByRankScore(items);
    return items;
}

RankResult RankingPipeline::rank(const QVector<Candidate>& candidates, const QString& subjectId,
                                 int targetSize, double lambda, int topicCap,
                                 const RankOptions& options)
{
    RankResult result;
    if (candidates.isEmpty() || targetSize <= 0) {
        return result;
    }

    const QDateTime now = options.now.isValid() ? options.now : QDateTime::currentDateTimeUtc();

    // ── Profile and click window ────────────────────────────
    bool personalizationAllowed = options.personalize;
    if (personalizationAllowed && m_flags
        && !m_flags->isEnabled(QString::fromLatin1(flags::kPersonalization))) {
        personalizationAllowed = false;
    }

    std::optional<UserProfile> storedProfile;
    UserProfile profile;
    profile.subjectId = subjectId;
    QVector<ClickEvent> clicks;

    if (!subjectId.isEmpty()) {
        bool profileOk = true;
        storedProfile = m_store.findProfile(subjectId, &profileOk);
        if (!profileOk) {
            LOG_WARN(nrRanking, "Profile store unavailable for %s, serving unpersonalized ranking",
                     qUtf8Printable(subjectId));
            result.degraded = true;
        } else if (storedProfile.has_value() && storedProfile->active) {
            profile = *storedProfile;
        }
    }

    if (!personalizationAllowed) {
        profile.personalizationEnabled = false;
    }

    if (profile.personalizationEnabled) {
        bool clicksOk = true;
        clicks = m_events.recentClicks(subjectId, now.addDays(-m_clickHistoryDays), &clicksOk);
        if (!clicksOk) {
            LOG_WARN(nrRanking, "Click history unavailable for %s, serving unpersonalized ranking",
                     qUtf8Printable(subjectId));
            profile.personalizationEnabled = false;
            clicks.clear();
            result.degraded = true;
        }
    }
    result.personalized = profile.personalizationEnabled;

    // ── Score and bound the pool ────────────────────────────
    QVector<RankedItem> scored = score(candidates, profile, clicks, now);
    const int pool = poolLimit(targetSize);
    if (scored.size() > pool) {
        scored.resize(pool);
    }

    // ── Diversity ───────────────────────────────────────────
    bool diversify = options.diversify;
    if (diversify && m_flags && !m_flags->isEnabled(QString::fromLatin1(flags::kDiversityFilter))) {
        diversify = false;
    }

    if (diversify) {
        result.lambda = lambda < 0.0 ? resolveLambda(storedProfile) : std::clamp(lambda, 0.0, 1.0);
        result.items = m_filter.filter(scored, targetSize, result.lambda, topicCap);
        result.diversityApplied = true;
    } else {
        if (scored.size() > targetSize) {
            scored.resize(targetSize);
        }
        result.items = std::move(scored);
    }

    for (RankedItem& item : result.items) {
        item.selectedVariant = options.selectedVariant;
        item.personalized = result.personalized;
        item.diversityApplied = result.diversityApplied;
    }

    LOG_DEBUG(nrRanking, "Ranked %d of %d candidates for %s (personalized=%d, lambda=%.2f)",
              static_cast<int>(result.items.size()), static_cast<int>(candidates.size()),
              qUtf8Printable(subjectId), result.personalized ? 1 : 0, result.lambda);
    return result;
}

} // namespace nr
