#include <QtTest/QtTest>
#include "core/ranking/similarity_resolver.h"
#include "core/shared/circuit_breaker.h"
#include "core/store/embedding_store.h"
#include "core/store/sqlite_store.h"

#include <QElapsedTimer>
#include <QHash>
#include <QTemporaryDir>
#include <QThread>

namespace {

class FakeEmbeddingStore : public nr::EmbeddingStore {
public:
    nr::VectorLookup lookup(const QString& embeddingRef, int timeoutMs) override
    {
        ++calls;
        timeouts.append(timeoutMs);
        nr::VectorLookup result;
        if (stallUntilTimeout && timeoutMs > 0) {
            QThread::msleep(static_cast<unsigned long>(timeoutMs));
            result.status = nr::VectorLookup::Status::Unavailable;
            return result;
        }
        if (unavailable) {
            result.status = nr::VectorLookup::Status::Unavailable;
            return result;
        }
        auto it = vectors.constFind(embeddingRef);
        if (it == vectors.constEnd()) {
            result.status = nr::VectorLookup::Status::NotFound;
            return result;
        }
        result.status = nr::VectorLookup::Status::Found;
        result.vector = it.value();
        return result;
    }

    QHash<QString, QVector<float>> vectors;
    bool unavailable = false;
    bool stallUntilTimeout = false;
    int calls = 0;
    QVector<int> timeouts;
};

nr::Candidate makeCandidate(const QString& id, const QString& title, const QString& body = {})
{
    nr::Candidate candidate;
    candidate.id = id;
    candidate.title = title;
    candidate.body = body;
    return candidate;
}

} // namespace

class TestSimilarityResolver : public QObject {
    Q_OBJECT

private slots:
    void testTokenizeDropsShortTokensAndStopWords();
    void testJaccardEdgeCases();
    void testCosineRejectsMismatchedOrZeroVectors();
    void testLexicalTierWeightsTitleOverBody();
    void testTopicTierWhenBothHaveTopics();
    void testEmbeddingTierTakesPrecedence();
    void testMissingVectorFallsBackToTopic();
    void testUnavailableStoreOpensBreakerAndDegrades();
    void testMatrixIsSymmetricWithUnitDiagonal();
    void testLookupsShareOneBudget();
    void testStalledStoreSkipsRemainingLookups();
    void testSqliteLookupHonorsTimeout();
};

void TestSimilarityResolver::testTokenizeDropsShortTokensAndStopWords()
{
    const QSet<QString> tokens = nr::SimilarityResolver::tokenize(
        QStringLiteral("The Fed and  the RATE hike is on"));
    QCOMPARE(tokens, (QSet<QString>{QStringLiteral("fed"), QStringLiteral("rate"),
                                    QStringLiteral("hike")}));
}

void TestSimilarityResolver::testJaccardEdgeCases()
{
    const QSet<QString> empty;
    const QSet<QString> ab{QStringLiteral("alpha"), QStringLiteral("beta")};
    const QSet<QString> bc{QStringLiteral("beta"), QStringLiteral("gamma")};

    QCOMPARE(nr::SimilarityResolver::jaccard(empty, empty), 1.0);
    QCOMPARE(nr::SimilarityResolver::jaccard(ab, empty), 0.0);
    QCOMPARE(nr::SimilarityResolver::jaccard(ab, ab), 1.0);
    QVERIFY(qFuzzyCompare(nr::SimilarityResolver::jaccard(ab, bc), 1.0 / 3.0));
}

void TestSimilarityResolver::testCosineRejectsMismatchedOrZeroVectors()
{
    QVERIFY(!nr::SimilarityResolver::cosine({1.0f, 0.0f}, {1.0f}).has_value());
    QVERIFY(!nr::SimilarityResolver::cosine({0.0f, 0.0f}, {1.0f, 0.0f}).has_value());
    QVERIFY(!nr::SimilarityResolver::cosine({}, {}).has_value());

    auto same = nr::SimilarityResolver::cosine({1.0f, 2.0f}, {2.0f, 4.0f});
    QVERIFY(same.has_value());
    QVERIFY(qFuzzyCompare(*same, 1.0));

    // Opposite directions clamp to zero.
    auto opposite = nr::SimilarityResolver::cosine({1.0f, 0.0f}, {-1.0f, 0.0f});
    QVERIFY(opposite.has_value());
    QCOMPARE(*opposite, 0.0);
}

void TestSimilarityResolver::testLexicalTierWeightsTitleOverBody()
{
    nr::SimilarityResolver resolver;
    const nr::Candidate a = makeCandidate(QStringLiteral("a"), QStringLiteral("apple earnings beat"),
                                          QStringLiteral("iphone sales rose"));
    const nr::Candidate sameTitle = makeCandidate(QStringLiteral("b"),
                                                  QStringLiteral("apple earnings beat"),
                                                  QStringLiteral("analysts cautious outlook"));
    const nr::Candidate sameBody = makeCandidate(QStringLiteral("c"),
                                                 QStringLiteral("chip shortage eases"),
                                                 QStringLiteral("iphone sales rose"));

    QVERIFY(qFuzzyCompare(resolver.similarity(a, sameTitle), 0.7));
    QVERIFY(qFuzzyCompare(resolver.similarity(a, sameBody), 0.3));
}

void TestSimilarityResolver::testTopicTierWhenBothHaveTopics()
{
    nr::SimilarityResolver resolver;
    nr::Candidate a = makeCandidate(QStringLiteral("a"), QStringLiteral("rates"));
    nr::Candidate b = makeCandidate(QStringLiteral("b"), QStringLiteral("completely different"));
    nr::Candidate c = makeCandidate(QStringLiteral("c"), QStringLiteral("rates"));
    a.topicId = QStringLiteral("T1");
    b.topicId = QStringLiteral("T1");
    c.topicId = QStringLiteral("T2");

    QCOMPARE(resolver.similarity(a, b), nr::SimilarityResolver::kSameTopicSimilarity);
    QCOMPARE(resolver.similarity(a, c), 0.0);
}

void TestSimilarityResolver::testEmbeddingTierTakesPrecedence()
{
    FakeEmbeddingStore store;
    store.vectors.insert(QStringLiteral("e1"), {1.0f, 0.0f});
    store.vectors.insert(QStringLiteral("e2"), {0.0f, 1.0f});
    nr::SimilarityResolver resolver(&store);

    nr::Candidate a = makeCandidate(QStringLiteral("a"), QStringLiteral("same title"));
    nr::Candidate b = makeCandidate(QStringLiteral("b"), QStringLiteral("same title"));
    a.topicId = QStringLiteral("T1");
    b.topicId = QStringLiteral("T1");
    a.embeddingRef = QStringLiteral("e1");
    b.embeddingRef = QStringLiteral("e2");

    const nr::SimilarityMatrix matrix = resolver.buildMatrix({a, b});
    QCOMPARE(matrix.at(0, 1), 0.0);
    QCOMPARE(matrix.tiers.embedding, 1);
    QCOMPARE(matrix.tiers.topic, 0);
}

void TestSimilarityResolver::testMissingVectorFallsBackToTopic()
{
    FakeEmbeddingStore store;
    store.vectors.insert(QStringLiteral("e1"), {1.0f, 0.0f});
    nr::SimilarityResolver resolver(&store);

    nr::Candidate a = makeCandidate(QStringLiteral("a"), QStringLiteral("x"));
    nr::Candidate b = makeCandidate(QStringLiteral("b"), QStringLiteral("y"));
    a.embeddingRef = QStringLiteral("e1");
    b.embeddingRef = QStringLiteral("missing");
    a.topicId = QStringLiteral("T1");
    b.topicId = QStringLiteral("T1");

    const nr::SimilarityMatrix matrix = resolver.buildMatrix({a, b});
    QCOMPARE(matrix.at(0, 1), nr::SimilarityResolver::kSameTopicSimilarity);
    QCOMPARE(matrix.tiers.topic, 1);
}

void TestSimilarityResolver::testUnavailableStoreOpensBreakerAndDegrades()
{
    FakeEmbeddingStore store;
    store.unavailable = true;
    nr::CircuitBreaker breaker(QStringLiteral("embedding-store"), 2, 60000);
    nr::SimilarityResolver resolver(&store, &breaker);

    QVector<nr::Candidate> items;
    for (int i = 0; i < 4; ++i) {
        nr::Candidate candidate = makeCandidate(QStringLiteral("c%1").arg(i),
                                                QStringLiteral("market update"));
        candidate.embeddingRef = QStringLiteral("e%1").arg(i);
        items.append(candidate);
    }

    const nr::SimilarityMatrix matrix = resolver.buildMatrix(items);
    QVERIFY(breaker.isOpen());
    // Lookups stop once the breaker opens.
    QCOMPARE(store.calls, 2);
    QCOMPARE(matrix.tiers.embedding, 0);
    QCOMPARE(matrix.tiers.lexical, 6);
    QVERIFY(qFuzzyCompare(matrix.at(0, 3), 1.0));
}

void TestSimilarityResolver::testMatrixIsSymmetricWithUnitDiagonal()
{
    nr::SimilarityResolver resolver;
    const QVector<nr::Candidate> items{
        makeCandidate(QStringLiteral("a"), QStringLiteral("oil prices climb"), QStringLiteral("opec cut")),
        makeCandidate(QStringLiteral("b"), QStringLiteral("oil prices slide"), QStringLiteral("demand weak")),
        makeCandidate(QStringLiteral("c"), QStringLiteral("tech rally"), QStringLiteral("nasdaq record")),
    };

    const nr::SimilarityMatrix matrix = resolver.buildMatrix(items);
    QCOMPARE(matrix.size(), 3);
    for (int i = 0; i < 3; ++i) {
        QCOMPARE(matrix.at(i, i), 1.0);
        for (int j = 0; j < 3; ++j) {
            QCOMPARE(matrix.at(i, j), matrix.at(j, i));
            QVERIFY(matrix.at(i, j) >= 0.0 && matrix.at(i, j) <= 1.0);
        }
    }
}

void TestSimilarityResolver::testLookupsShareOneBudget()
{
    FakeEmbeddingStore store;
    nr::SimilarityResolver resolver(&store, nullptr, 50);

    QVector<nr::Candidate> items;
    for (int i = 0; i < 3; ++i) {
        nr::Candidate candidate = makeCandidate(QStringLiteral("c%1").arg(i), QStringLiteral("rates"));
        candidate.embeddingRef = QStringLiteral("e%1").arg(i);
        store.vectors.insert(*candidate.embeddingRef, {1.0f, static_cast<float>(i)});
        items.append(candidate);
    }

    resolver.buildMatrix(items);
    QCOMPARE(store.timeouts.size(), 3);
    for (int i = 0; i < store.timeouts.size(); ++i) {
        QVERIFY(store.timeouts.at(i) > 0 && store.timeouts.at(i) <= 50);
        if (i > 0) {
            QVERIFY(store.timeouts.at(i) <= store.timeouts.at(i - 1));
        }
    }
}

void TestSimilarityResolver::testStalledStoreSkipsRemainingLookups()
{
    FakeEmbeddingStore store;
    store.stallUntilTimeout = true;
    nr::SimilarityResolver resolver(&store, nullptr, 30);

    QVector<nr::Candidate> items;
    for (int i = 0; i < 4; ++i) {
        nr::Candidate candidate = makeCandidate(QStringLiteral("c%1").arg(i),
                                                QStringLiteral("market update"));
        candidate.embeddingRef = QStringLiteral("e%1").arg(i);
        items.append(candidate);
    }

    QElapsedTimer timer;
    timer.start();
    const nr::SimilarityMatrix matrix = resolver.buildMatrix(items);
    QVERIFY(timer.elapsed() < 1000);

    // The first lookup consumes the whole budget; the rest never reach the store.
    QCOMPARE(store.calls, 1);
    QVERIFY(store.timeouts.first() <= 30);
    QCOMPARE(matrix.tiers.embedding, 0);
    QCOMPARE(matrix.tiers.lexical, 6);
}

void TestSimilarityResolver::testSqliteLookupHonorsTimeout()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto db = nr::SQLiteStore::open(dir.filePath(QStringLiteral("embeddings.db")));
    QVERIFY(db.has_value());
    nr::SqliteEmbeddingStore store(db->rawDb());
    QVERIFY(store.put(QStringLiteral("e1"), {0.6f, 0.8f}));

    QCOMPARE(store.lookup(QStringLiteral("e1")).status, nr::VectorLookup::Status::Found);
    const nr::VectorLookup bounded = store.lookup(QStringLiteral("e1"), 1000);
    QCOMPARE(bounded.status, nr::VectorLookup::Status::Found);
    QCOMPARE(bounded.vector, (QVector<float>{0.6f, 0.8f}));
    QCOMPARE(store.lookup(QStringLiteral("missing"), 1000).status,
             nr::VectorLookup::Status::NotFound);

    // No time left means no query at all.
    QCOMPARE(store.lookup(QStringLiteral("e1"), 0).status, nr::VectorLookup::Status::Unavailable);

    // The deadline handler is removed after each lookup.
    QCOMPARE(store.lookup(QStringLiteral("e1")).status, nr::VectorLookup::Status::Found);
}

QTEST_MAIN(TestSimilarityResolver)
#include "test_similarity_resolver.moc"
