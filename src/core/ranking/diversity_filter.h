#pragma once

#include "core/ranking/similarity_resolver.h"
#include "core/shared/types.h"

#include <QVector>

namespace nr {

// DiversityFilter -- Maximal Marginal Relevance selection with a per-topic cap.
//
// Input lists must already be sorted by rank score, highest first; the
// earliest item wins every tie. Callers bound the pool (see
// RankingPipeline::poolLimit) since selection costs O(K * N) lookups into a
// precomputed similarity matrix.
class DiversityFilter {
public:
    static constexpr int kDefaultTopicCap = 2;

    explicit DiversityFilter(const SimilarityResolver& resolver);

    // Selects up to targetSize items, caps each topic at topicCap (<= 0 means
    // no cap) and returns them re-sorted by rank score. Every returned item has
    // diversityApplied set.
    QVector<RankedItem> filter(const QVector<RankedItem>& items, int targetSize,
                               double lambda, int topicCap = kDefaultTopicCap) const;

    // Greedy MMR order: indices into items, first pick is items[0].
    // excluded[i] == true keeps items[i] out of the selection.
    static QVector<int> selectMmr(const QVector<RankedItem>& items,
                                  const SimilarityMatrix& similarity,
                                  int targetSize, double lambda,
                                  const QVector<int>& alreadySelected = {},
                                  const QVector<bool>& excluded = {});

    // 1 - mean pairwise similarity. Lists shorter than two score 1.
    double diversityScore(const QVector<Candidate>& items) const;
    static double diversityScore(const SimilarityMatrix& similarity);

    // Greedy grouping: each item joins the first cluster whose first member
    // is at least threshold-similar, otherwise starts a new cluster.
    QVector<QVector<Candidate>> clusterBySimilarity(const QVector<Candidate>& items,
                                                    double threshold) const;

private:
    const SimilarityResolver& m_resolver;
};

} // namespace nr
