#include "core/ranking/similarity_resolver.h"
#include "core/shared/circuit_breaker.h"
#include "core/shared/logging.h"
#include "core/store/embedding_store.h"

#include <QElapsedTimer>
#include <QHash>
#include <QRegularExpression>

#include <algorithm>
#include <cmath>

namespace nr {

namespace {

const QSet<QString>& stopWords()
{
    static const QSet<QString> words = {
        // Korean particles and determiners
        QStringLiteral("의"), QStringLiteral("가"), QStringLiteral("이"), QStringLiteral("은"),
        QStringLiteral("는"), QStringLiteral("을"), QStringLiteral("를"), QStringLiteral("에"),
        QStringLiteral("와"), QStringLiteral("과"), QStringLiteral("로"), QStringLiteral("으로"),
        QStringLiteral("에서"), QStringLiteral("부터"), QStringLiteral("까지"), QStringLiteral("한"),
        QStringLiteral("그"), QStringLiteral("저"), QStringLiteral("이런"), QStringLiteral("그런"),
        QStringLiteral("저런"),
        // English
        QStringLiteral("the"), QStringLiteral("a"), QStringLiteral("an"), QStringLiteral("and"),
        QStringLiteral("or"), QStringLiteral("but"), QStringLiteral("in"), QStringLiteral("on"),
        QStringLiteral("at"), QStringLiteral("to"), QStringLiteral("for"), QStringLiteral("of"),
        QStringLiteral("with"), QStringLiteral("by"), QStringLiteral("is"), QStringLiteral("are"),
        QStringLiteral("was"), QStringLiteral("were"), QStringLiteral("be"), QStringLiteral("been"),
        QStringLiteral("have"), QStringLiteral("has"),
    };
    return words;
}

struct TokenSets {
    QSet<QString> title;
    QSet<QString> body;
};

double lexicalSimilarity(const TokenSets& a, const TokenSets& b)
{
    return SimilarityResolver::kTitleWeight * SimilarityResolver::jaccard(a.title, b.title)
         + SimilarityResolver::kBodyWeight * SimilarityResolver::jaccard(a.body, b.body);
}

} // namespace

// ── SimilarityMatrix ────────────────────────────────────────

SimilarityMatrix::SimilarityMatrix(int size)
    : m_size(size)
    , m_values(static_cast<size_t>(size) * static_cast<size_t>(size), 0.0)
{
    for (int i = 0; i < size; ++i) {
        m_values[static_cast<size_t>(i) * size + i] = 1.0;
    }
}

double SimilarityMatrix::at(int i, int j) const
{
    return m_values[static_cast<size_t>(i) * m_size + j];
}

void SimilarityMatrix::set(int i, int j, double value)
{
    m_values[static_cast<size_t>(i) * m_size + j] = value;
    m_values[static_cast<size_t>(j) * m_size + i] = value;
}

// ── SimilarityResolver ──────────────────────────────────────

SimilarityResolver::SimilarityResolver(EmbeddingStore* store, CircuitBreaker* breaker,
                                       int lookupBudgetMs)
    : m_store(store)
    , m_breaker(breaker)
    , m_lookupBudgetMs(std::max(0, lookupBudgetMs))
{
}

QSet<QString> SimilarityResolver::tokenize(const QString& text)
{
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));

    QSet<QString> tokens;
    const QStringList parts = text.toLower().split(kWhitespace, Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        if (part.size() >= kMinTokenLength && !isStopWord(part)) {
            tokens.insert(part);
        }
    }
    return tokens;
}

bool SimilarityResolver::isStopWord(const QString& token)
{
    return stopWords().contains(token.toLower());
}

double SimilarityResolver::jaccard(const QSet<QString>& a, const QSet<QString>& b)
{
    if (a.isEmpty() && b.isEmpty()) {
        return 1.0;
    }
    if (a.isEmpty() || b.isEmpty()) {
        return 0.0;
    }

    const QSet<QString>& smaller = a.size() <= b.size() ? a : b;
    const QSet<QString>& larger = a.size() <= b.size() ? b : a;
    int intersection = 0;
    for (const QString& token : smaller) {
        if (larger.contains(token)) {
            ++intersection;
        }
    }
    const int unionSize = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

std::optional<double> SimilarityResolver::cosine(const QVector<float>& a, const QVector<float>& b)
{
    if (a.isEmpty() || a.size() != b.size()) {
        return std::nullopt;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (int i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        normA += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        normB += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }
    if (normA <= 0.0 || normB <= 0.0) {
        return std::nullopt;
    }

    const double value = dot / (std::sqrt(normA) * std::sqrt(normB));
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return std::clamp(value, 0.0, 1.0);
}

QVector<std::optional<QVector<float>>> SimilarityResolver::resolveVectors(
    const QVector<Candidate>& items) const
{
    QVector<std::optional<QVector<float>>> vectors(items.size());
    if (!m_store) {
        return vectors;
    }

    // Only pairs where both sides carry a reference can use the embedding tier.
    int withRef = 0;
    for (const Candidate& item : items) {
        if (item.embeddingRef.has_value() && !item.embeddingRef->isEmpty()) {
            ++withRef;
        }
    }
    if (withRef < 2) {
        return vectors;
    }

    QHash<QString, std::optional<QVector<float>>> resolved;
    QElapsedTimer timer;
    timer.start();
    int skipped = 0;
    int unavailable = 0;

    for (int i = 0; i < items.size(); ++i) {
        const std::optional<QString>& ref = items.at(i).embeddingRef;
        if (!ref.has_value() || ref->isEmpty()) {
            continue;
        }
        auto cached = resolved.constFind(*ref);
        if (cached != resolved.constEnd()) {
            vectors[i] = cached.value();
            continue;
        }

        if ((m_breaker && m_breaker->isOpen()) || timer.elapsed() >= m_lookupBudgetMs) {
            ++skipped;
            resolved.insert(*ref, std::nullopt);
            continue;
        }

        // The store gets only what is left of the budget; a result that still
        // lands late is discarded.
        const int remainingMs = static_cast<int>(m_lookupBudgetMs - timer.elapsed());
        const VectorLookup lookup = m_store->lookup(*ref, remainingMs);
        const bool overBudget = timer.elapsed() > m_lookupBudgetMs;

        std::optional<QVector<float>> vector;
        if (lookup.status == VectorLookup::Status::Found && !overBudget) {
            vector = lookup.vector;
        }
        if (lookup.status == VectorLookup::Status::Unavailable || overBudget) {
            ++unavailable;
            if (m_breaker) {
                m_breaker->recordFailure();
            }
        } else if (m_breaker) {
            m_breaker->recordSuccess();
        }
        resolved.insert(*ref, vector);
        vectors[i] = vector;
    }

    if (skipped > 0 || unavailable > 0) {
        LOG_WARN(nrRanking,
                 "Embedding lookups degraded (embedding -> topic/lexical): %d unavailable, "
                 "%d skipped (breaker open or %dms budget spent)",
                 unavailable, skipped, m_lookupBudgetMs);
    }
    return vectors;
}

SimilarityMatrix SimilarityResolver::buildMatrix(const QVector<Candidate>& items) const
{
    const int n = static_cast<int>(items.size());
    SimilarityMatrix matrix(n);
    if (n < 2) {
        return matrix;
    }

    const QVector<std::optional<QVector<float>>> vectors = resolveVectors(items);

    // Tokenise lazily: only pairs that reach the lexical tier need tokens.
    QVector<std::optional<TokenSets>> tokens(n);
    auto tokensFor = [&](int index) -> const TokenSets& {
        if (!tokens[index].has_value()) {
            TokenSets sets;
            sets.title = tokenize(items.at(index).title);
            sets.body = tokenize(items.at(index).body);
            tokens[index] = std::move(sets);
        }
        return *tokens[index];
    };

    int malformed = 0;
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            const Candidate& a = items.at(i);
            const Candidate& b = items.at(j);

            if (vectors[i].has_value() && vectors[j].has_value()) {
                const std::optional<double> value = cosine(*vectors[i], *vectors[j]);
                if (value.has_value()) {
                    matrix.set(i, j, *value);
                    ++matrix.tiers.embedding;
                    continue;
                }
                ++malformed;
            }

            if (a.topicId.has_value() && b.topicId.has_value()) {
                matrix.set(i, j, *a.topicId == *b.topicId ? kSameTopicSimilarity : 0.0);
                ++matrix.tiers.topic;
                continue;
            }

            matrix.set(i, j, lexicalSimilarity(tokensFor(i), tokensFor(j)));
            ++matrix.tiers.lexical;
        }
    }

    if (malformed > 0) {
        LOG_WARN(nrRanking, "%d embedding pair(s) not comparable, used topic/lexical tier",
                 malformed);
    }
    return matrix;
}

double SimilarityResolver::similarity(const Candidate& a, const Candidate& b) const
{
    return buildMatrix(QVector<Candidate>{a, b}).at(0, 1);
}

} // namespace nr
