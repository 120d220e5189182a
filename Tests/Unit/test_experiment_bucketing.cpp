#include <QtTest/QtTest>
#include "core/experiment/experiment_bucketing.h"

#include <QHash>
#include <QTimeZone>

namespace {

const QDateTime kNow = QDateTime(QDate(2024, 3, 15), QTime(12, 0), QTimeZone::UTC);

nr::ExperimentDefinition makeExperiment(const QVector<nr::VariantAllocation>& variants)
{
    nr::ExperimentDefinition definition;
    definition.key = QStringLiteral("ranking_ab");
    definition.orderedVariants = variants;
    definition.isActive = true;
    return definition;
}

nr::ExperimentDefinition fiftyFifty()
{
    return makeExperiment({{QStringLiteral("control"), 50}, {QStringLiteral("treatment"), 50}});
}

} // namespace

class TestExperimentBucketing : public QObject {
    Q_OBJECT

private slots:
    void testBucketIsStableAcrossProcesses();
    void testRepeatedAssignmentIsIdentical();
    void testAllocationPartitionsBucketSpace();
    void testUncoveredBucketsFallToLastVariant();
    void testMissingOrStoppedExperimentServesControl();
    void testScheduleWindow();
    void testSplitIsRoughlyEven();
};

void TestExperimentBucketing::testBucketIsStableAcrossProcesses()
{
    // First four bytes of SHA-256("<subject>:<experiment>"), big-endian, mod 100.
    QCOMPARE(nr::bucketing::computeBucket(QStringLiteral("u1"), QStringLiteral("ranking_ab")), 58);
    QCOMPARE(nr::bucketing::computeBucket(QStringLiteral("u2"), QStringLiteral("ranking_ab")), 10);
    QCOMPARE(nr::bucketing::computeBucket(QStringLiteral("user-42"), QStringLiteral("homepage_v2")), 12);
}

void TestExperimentBucketing::testRepeatedAssignmentIsIdentical()
{
    const nr::ExperimentDefinition definition = fiftyFifty();
    const nr::ExperimentAssignment first =
        nr::bucketing::assign(definition, QStringLiteral("u1"), QStringLiteral("ranking_ab"), kNow);
    const nr::ExperimentAssignment second =
        nr::bucketing::assign(definition, QStringLiteral("u1"), QStringLiteral("ranking_ab"), kNow);

    QVERIFY(first.isActive);
    QCOMPARE(first.variant, second.variant);
    QCOMPARE(first.bucket, second.bucket);
    QCOMPARE(first.variant, QStringLiteral("treatment"));
}

void TestExperimentBucketing::testAllocationPartitionsBucketSpace()
{
    const QVector<nr::VariantAllocation> allocation{
        {QStringLiteral("control"), 30}, {QStringLiteral("a"), 20}, {QStringLiteral("b"), 50}};

    QHash<QString, int> counts;
    for (int bucket = 0; bucket < nr::bucketing::kBucketCount; ++bucket) {
        bool covered = false;
        counts[nr::bucketing::variantForBucket(allocation, bucket, &covered)] += 1;
        QVERIFY(covered);
    }
    QCOMPARE(counts.value(QStringLiteral("control")), 30);
    QCOMPARE(counts.value(QStringLiteral("a")), 20);
    QCOMPARE(counts.value(QStringLiteral("b")), 50);

    // Ranges follow declaration order.
    QCOMPARE(nr::bucketing::variantForBucket(allocation, 29), QStringLiteral("control"));
    QCOMPARE(nr::bucketing::variantForBucket(allocation, 30), QStringLiteral("a"));
    QCOMPARE(nr::bucketing::variantForBucket(allocation, 50), QStringLiteral("b"));
}

void TestExperimentBucketing::testUncoveredBucketsFallToLastVariant()
{
    const QVector<nr::VariantAllocation> allocation{
        {QStringLiteral("control"), 40}, {QStringLiteral("treatment"), 40}};

    bool covered = true;
    QCOMPARE(nr::bucketing::variantForBucket(allocation, 95, &covered), QStringLiteral("treatment"));
    QVERIFY(!covered);

    QCOMPARE(nr::bucketing::variantForBucket({}, 10, &covered), QStringLiteral("control"));
    QVERIFY(!covered);
}

void TestExperimentBucketing::testMissingOrStoppedExperimentServesControl()
{
    const nr::ExperimentAssignment missing =
        nr::bucketing::assign(std::nullopt, QStringLiteral("u1"), QStringLiteral("nope"), kNow);
    QCOMPARE(missing.variant, QStringLiteral("control"));
    QCOMPARE(missing.bucket, -1);
    QVERIFY(!missing.isActive);

    nr::ExperimentDefinition stopped = fiftyFifty();
    stopped.isActive = false;
    const nr::ExperimentAssignment inactive =
        nr::bucketing::assign(stopped, QStringLiteral("u1"), QStringLiteral("ranking_ab"), kNow);
    QCOMPARE(inactive.variant, QStringLiteral("control"));
    QVERIFY(!inactive.isActive);
}

void TestExperimentBucketing::testScheduleWindow()
{
    nr::ExperimentDefinition definition = fiftyFifty();
    definition.startAt = kNow.addDays(1);
    QVERIFY(!nr::bucketing::assign(definition, QStringLiteral("u1"), definition.key, kNow).isActive);

    definition.startAt = kNow.addDays(-7);
    definition.endAt = kNow.addDays(-1);
    QVERIFY(!nr::bucketing::assign(definition, QStringLiteral("u1"), definition.key, kNow).isActive);

    definition.endAt = kNow.addDays(1);
    QVERIFY(nr::bucketing::assign(definition, QStringLiteral("u1"), definition.key, kNow).isActive);
}

void TestExperimentBucketing::testSplitIsRoughlyEven()
{
    const nr::ExperimentDefinition definition = fiftyFifty();
    int treatment = 0;
    const int subjects = 10000;
    for (int i = 0; i < subjects; ++i) {
        const nr::ExperimentAssignment assignment = nr::bucketing::assign(
            definition, QStringLiteral("subject-%1").arg(i), definition.key, kNow);
        QVERIFY(assignment.bucket >= 0 && assignment.bucket < nr::bucketing::kBucketCount);
        if (assignment.variant == QLatin1String("treatment")) {
            ++treatment;
        }
    }
    QVERIFY2(treatment > 4700 && treatment < 5300, qPrintable(QString::number(treatment)));
}

QTEST_MAIN(TestExperimentBucketing)
#include "test_experiment_bucketing.moc"
