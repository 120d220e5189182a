#pragma once

#include "core/shared/types.h"

#include <QSet>
#include <QString>
#include <QVector>

#include <optional>
#include <vector>

namespace nr {

class EmbeddingStore;
struct CircuitBreaker;

// Symmetric pairwise similarity table for one candidate pool.
class SimilarityMatrix {
public:
    struct TierCounts {
        int embedding = 0;
        int topic = 0;
        int lexical = 0;
    };

    SimilarityMatrix() = default;
    explicit SimilarityMatrix(int size);

    int size() const { return m_size; }
    double at(int i, int j) const;
    void set(int i, int j, double value);

    TierCounts tiers;

private:
    int m_size = 0;
    std::vector<double> m_values;
};

// SimilarityResolver -- similarity in [0,1] between two candidates, using the
// best signal available for the pair:
//   1. cosine of both embeddings
//   2. shared topic id (0.9) or different topic ids (0.0)
//   3. Jaccard over title tokens and body tokens, blended 0.7 / 0.3
// Never fails: an embedding that cannot be loaded drops the pair to tier 2/3.
class SimilarityResolver {
public:
    static constexpr double kSameTopicSimilarity = 0.9;
    static constexpr double kTitleWeight = 0.7;
    static constexpr double kBodyWeight = 0.3;
    static constexpr int kMinTokenLength = 3;

    // store and breaker may be null (lexical/topic tiers only).
    explicit SimilarityResolver(EmbeddingStore* store = nullptr,
                                CircuitBreaker* breaker = nullptr,
                                int lookupBudgetMs = 50);

    double similarity(const Candidate& a, const Candidate& b) const;

    // Resolves each distinct embedding once, within the lookup budget.
    SimilarityMatrix buildMatrix(const QVector<Candidate>& items) const;

    static QSet<QString> tokenize(const QString& text);
    static bool isStopWord(const QString& token);
    static double jaccard(const QSet<QString>& a, const QSet<QString>& b);

    // nullopt when the vectors cannot be compared (dimension mismatch, zero norm).
    static std::optional<double> cosine(const QVector<float>& a, const QVector<float>& b);

private:
    QVector<std::optional<QVector<float>>> resolveVectors(const QVector<Candidate>& items) const;

    EmbeddingStore* m_store = nullptr;
    CircuitBreaker* m_breaker = nullptr;
    int m_lookupBudgetMs = 50;
};

} // namespace nr
