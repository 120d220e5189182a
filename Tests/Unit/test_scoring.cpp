#include <QtTest/QtTest>
#include "core/ranking/scorer.h"

#include <QTimeZone>

class TestScoring : public QObject {
    Q_OBJECT

private slots:
    void testRecencyTiers();
    void testNoveltyTiers();
    void testMissingAndFuturePublicationTimes();
    void testImportanceNormalisation();
    void testWeightedBlend();
    void testPersonalizedTermIsClamped();
    void testSortIsStableOnTies();
};

namespace {
const QDateTime kNow = QDateTime(QDate(2024, 3, 15), QTime(12, 0), QTimeZone::UTC);
}

void TestScoring::testRecencyTiers()
{
    QCOMPARE(nr::Scorer::computeRecency(kNow.addSecs(-30 * 60), kNow), 1.0);
    QCOMPARE(nr::Scorer::computeRecency(kNow.addSecs(-3600), kNow), 1.0);
    QCOMPARE(nr::Scorer::computeRecency(kNow.addSecs(-3 * 3600), kNow), 0.9);
    QCOMPARE(nr::Scorer::computeRecency(kNow.addSecs(-12 * 3600), kNow), 0.7);
    QCOMPARE(nr::Scorer::computeRecency(kNow.addDays(-2), kNow), 0.4);
    QCOMPARE(nr::Scorer::computeRecency(kNow.addDays(-5), kNow), 0.2);
    QCOMPARE(nr::Scorer::computeRecency(kNow.addDays(-30), kNow), 0.1);
}

void TestScoring::testNoveltyTiers()
{
    QCOMPARE(nr::Scorer::computeNovelty(kNow.addSecs(-10 * 60), kNow), 1.0);
    QCOMPARE(nr::Scorer::computeNovelty(kNow.addSecs(-60 * 60), kNow), 0.8);
    QCOMPARE(nr::Scorer::computeNovelty(kNow.addSecs(-200 * 60), kNow), 0.5);
    QCOMPARE(nr::Scorer::computeNovelty(kNow.addSecs(-400 * 60), kNow), 0.2);
}

void TestScoring::testMissingAndFuturePublicationTimes()
{
    QCOMPARE(nr::Scorer::computeRecency(QDateTime(), kNow), 0.1);
    QCOMPARE(nr::Scorer::computeNovelty(QDateTime(), kNow), 0.2);

    // Clock skew on the publisher side must not push items down.
    QCOMPARE(nr::Scorer::computeRecency(kNow.addSecs(600), kNow), 1.0);
    QCOMPARE(nr::Scorer::computeNovelty(kNow.addSecs(600), kNow), 1.0);
}

void TestScoring::testImportanceNormalisation()
{
    nr::Scorer scorer;
    QCOMPARE(scorer.normalizeImportance(5.0), 0.5);
    QCOMPARE(scorer.normalizeImportance(25.0), 1.0);
    QCOMPARE(scorer.normalizeImportance(-3.0), 0.0);

    nr::RankWeights unscaled;
    unscaled.importanceScale = 0.0;
    QCOMPARE(nr::Scorer(unscaled).normalizeImportance(0.42), 0.42);
}

void TestScoring::testWeightedBlend()
{
    nr::Scorer scorer;
    QVERIFY(qFuzzyCompare(scorer.weights().sum(), 1.0));

    nr::Candidate candidate;
    candidate.importanceScore = 5.0;
    candidate.publishedAt = kNow.addSecs(-10 * 60);

    // 0.45 * 0.5 + 0.20 * 1.0 + 0.25 * 0.4 + 0.10 * 1.0
    QVERIFY(qFuzzyCompare(scorer.computeScore(candidate, 0.4, kNow), 0.625));

    const nr::RankBreakdown breakdown = scorer.computeBreakdown(candidate, 0.4, kNow);
    QCOMPARE(breakdown.importance, 0.5);
    QCOMPARE(breakdown.recency, 1.0);
    QCOMPARE(breakdown.personalized, 0.4);
    QCOMPARE(breakdown.novelty, 1.0);
}

void TestScoring::testPersonalizedTermIsClamped()
{
    nr::Scorer scorer;
    nr::Candidate candidate;
    candidate.importanceScore = 10.0;
    candidate.publishedAt = kNow;

    QVERIFY(qFuzzyCompare(scorer.computeScore(candidate, 7.0, kNow), 1.0));
    QVERIFY(qFuzzyCompare(scorer.computeScore(candidate, -1.0, kNow), 0.75));
}

void TestScoring::testSortIsStableOnTies()
{
    QVector<nr::RankedItem> items(4);
    const double scores[] = {0.5, 0.9, 0.5, 0.9};
    for (int i = 0; i < 4; ++i) {
        items[i].candidate.id = QString::number(i);
        items[i].rankScore = scores[i];
    }

    nr::Scorer::sortByRankScore(items);
    QCOMPARE(items.at(0).candidate.id, QStringLiteral("1"));
    QCOMPARE(items.at(1).candidate.id, QStringLiteral("3"));
    QCOMPARE(items.at(2).candidate.id, QStringLiteral("0"));
    QCOMPARE(items.at(3).candidate.id, QStringLiteral("2"));
}

QTEST_MAIN(TestScoring)
#include "test_scoring.moc"
