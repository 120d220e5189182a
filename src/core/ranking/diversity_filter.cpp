#include "core/ranking/diversity_filter.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>
#include <limits>

namespace nr {

namespace {

QVector<double> normalizedRelevance(const QVector<RankedItem>& items)
{
    double maxScore = 0.0;
    for (const RankedItem& item : items) {
        maxScore = std::max(maxScore, item.rankScore);
    }

    QVector<double> relevance(items.size(), 0.0);
    if (maxScore <= 0.0) {
        return relevance;
    }
    for (int i = 0; i < items.size(); ++i) {
        relevance[i] = std::clamp(items.at(i).rankScore / maxScore, 0.0, 1.0);
    }
    return relevance;
}

QString topicKey(const RankedItem& item)
{
    return item.candidate.topicId.value_or(QString());
}

} // namespace

DiversityFilter::DiversityFilter(const SimilarityResolver& resolver)
    : m_resolver(resolver)
{
}

QVector<int> DiversityFilter::selectMmr(const QVector<RankedItem>& items,
                                        const SimilarityMatrix& similarity,
                                        int targetSize, double lambda,
                                        const QVector<int>& alreadySelected,
                                        const QVector<bool>& excluded)
{
    QVector<int> selected = alreadySelected;
    const int n = static_cast<int>(items.size());
    if (n == 0 || targetSize <= 0) {
        return selected;
    }
    lambda = std::clamp(lambda, 0.0, 1.0);

    QVector<bool> taken(n, false);
    for (int index : selected) {
        taken[index] = true;
    }
    auto isExcluded = [&](int index) {
        return index < excluded.size() && excluded.at(index);
    };

    if (selected.isEmpty()) {
        selected.append(0);
        taken[0] = true;
    }

    const QVector<double> relevance = normalizedRelevance(items);

    while (selected.size() < targetSize) {
        int best = -1;
        double bestScore = -std::numeric_limits<double>::infinity();

        for (int i = 0; i < n; ++i) {
            if (taken[i] || isExcluded(i)) {
                continue;
            }
            double maxSimilarity = 0.0;
            for (int s : selected) {
                maxSimilarity = std::max(maxSimilarity, similarity.at(i, s));
            }
            const double score = lambda * relevance[i] - (1.0 - lambda) * maxSimilarity;
            if (score > bestScore) {    // strict: earliest wins ties
                bestScore = score;
                best = i;
            }
        }

        if (best < 0) {
            break;
        }
        selected.append(best);
        taken[best] = true;
    }
    return selected;
}

QVector<RankedItem> DiversityFilter::filter(const QVector<RankedItem>& items, int targetSize,
                                            double lambda, int topicCap) const
{
    if (targetSize <= 0 || items.isEmpty()) {
        return {};
    }

    const int n = static_cast<int>(items.size());
    QVector<int> picked;

    if (n <= targetSize) {
        picked.reserve(n);
        for (int i = 0; i < n; ++i) {
            picked.append(i);
        }
    } else {
        const SimilarityMatrix matrix = m_resolver.buildMatrix([&items] {
            QVector<Candidate> candidates;
            candidates.reserve(items.size());
            for (const RankedItem& item : items) {
                candidates.append(item.candidate);
            }
            return candidates;
        }());
        picked = selectMmr(items, matrix, targetSize, lambda);

        // Topic cap, then backfill from the rest of the pool with full topics excluded.
        if (topicCap > 0) {
            QVector<int> kept;
            QHash<QString, int> perTopic;
            QVector<int> byScore = picked;
            std::stable_sort(byScore.begin(), byScore.end(), [&items](int a, int b) {
                return items.at(a).rankScore > items.at(b).rankScore;
            });
            QVector<bool> capped(n, false);
            for (int index : byScore) {
                const QString topic = topicKey(items.at(index));
                if (!topic.isEmpty() && perTopic.value(topic) >= topicCap) {
                    capped[index] = true;
                    continue;
                }
                if (!topic.isEmpty()) {
                    perTopic[topic] += 1;
                }
                kept.append(index);
            }

            if (kept.size() < picked.size()) {
                QVector<bool> excluded = capped;
                auto refreshExclusions = [&]() {
                    for (int i = 0; i < n; ++i) {
                        const QString topic = topicKey(items.at(i));
                        if (!topic.isEmpty() && perTopic.value(topic) >= topicCap) {
                            excluded[i] = true;
                        }
                    }
                };
                refreshExclusions();

                // Grow one pick at a time so each new pick updates the topic counts.
                QVector<int> current = kept;
                while (current.size() < targetSize) {
                    QVector<int> grown = selectMmr(items, matrix, current.size() + 1, lambda,
                                                   current, excluded);
                    if (grown.size() == current.size()) {
                        break;
                    }
                    const int added = grown.last();
                    const QString topic = topicKey(items.at(added));
                    if (!topic.isEmpty()) {
                        perTopic[topic] += 1;
                    }
                    current = grown;
                    refreshExclusions();
                }
                LOG_DEBUG(nrRanking, "Topic cap %d removed %d item(s), backfilled %d",
                          topicCap, static_cast<int>(picked.size() - kept.size()),
                          static_cast<int>(current.size() - kept.size()));
                picked = current;
            }
        }
    }

    if (n <= targetSize && topicCap > 0) {
        QHash<QString, int> perTopic;
        QVector<int> kept;
        for (int index : picked) {
            const QString topic = topicKey(items.at(index));
            if (!topic.isEmpty() && perTopic.value(topic) >= topicCap) {
                continue;
            }
            if (!topic.isEmpty()) {
                perTopic[topic] += 1;
            }
            kept.append(index);
        }
        picked = kept;
    }

    // Re-merge in rank order; input order breaks ties.
    std::sort(picked.begin(), picked.end(), [&items](int a, int b) {
        if (items.at(a).rankScore != items.at(b).rankScore) {
            return items.at(a).rankScore > items.at(b).rankScore;
        }
        return a < b;
    });
    if (picked.size() > targetSize) {
        picked.resize(targetSize);
    }

    QVector<RankedItem> result;
    result.reserve(picked.size());
    for (int index : picked) {
        RankedItem item = items.at(index);
        item.diversityApplied = true;
        result.append(item);
    }
    return result;
}

double DiversityFilter::diversityScore(const SimilarityMatrix& similarity)
{
    const int n = similarity.size();
    if (n < 2) {
        return 1.0;
    }
    double total = 0.0;
    int pairs = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            total += similarity.at(i, j);
            ++pairs;
        }
    }
    return std::clamp(1.0 - total / static_cast<double>(pairs), 0.0, 1.0);
}

double DiversityFilter::diversityScore(const QVector<Candidate>& items) const
{
    return diversityScore(m_resolver.buildMatrix(items));
}

QVector<QVector<Candidate>> DiversityFilter::clusterBySimilarity(const QVector<Candidate>& items,
                                                                 double threshold) const
{
    QVector<QVector<Candidate>> clusters;
    QVector<int> representatives;
    const SimilarityMatrix matrix = m_resolver.buildMatrix(items);

    for (int i = 0; i < items.size(); ++i) {
        bool placed = false;
        for (int c = 0; c < clusters.size(); ++c) {
            if (matrix.at(i, representatives.at(c)) >= threshold) {
                clusters[c].append(items.at(i));
                placed = true;
                break;
            }
        }
        if (!placed) {
            clusters.append(QVector<Candidate>{items.at(i)});
            representatives.append(i);
        }
    }
    return clusters;
}

} // namespace nr
