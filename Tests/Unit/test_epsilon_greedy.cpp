#include <QtTest/QtTest>
#include "core/bandit/bandit_ledger.h"
#include "core/bandit/epsilon_greedy_selector.h"
#include "core/store/sqlite_store.h"

#include <QHash>
#include <QRandomGenerator>
#include <QTemporaryDir>
#include <QTimeZone>

namespace {

nr::BanditArm makeArm(int id, const QString& name, int64_t count, double sum, bool enabled = true)
{
    nr::BanditArm arm;
    arm.armId = id;
    arm.name = name;
    arm.rewardCount = count;
    arm.rewardSum = sum;
    arm.rewardSumSquared = sum;
    arm.enabled = enabled;
    return arm;
}

QVector<nr::BanditArm> trainedArms()
{
    return {
        makeArm(1, QStringLiteral("personalized"), 100, 30.0),
        makeArm(2, QStringLiteral("popular"), 100, 60.0),
        makeArm(3, QStringLiteral("diverse"), 100, 10.0),
        makeArm(4, QStringLiteral("recent"), 100, 20.0),
    };
}

} // namespace

class TestEpsilonGreedy : public QObject {
    Q_OBJECT

private slots:
    void testGreedyPicksHighestMean();
    void testTiesGoToLowestId();
    void testUntrainedArmsAreExplored();
    void testFullExplorationIsRoughlyUniform();
    void testDisabledArmsAreNeverChosen();
    void testNoEnabledArmsYieldsNothing();
    void testEpsilonIsClamped();
    void testGreedyArmEmergesFromRecordedRewards();
};

void TestEpsilonGreedy::testGreedyPicksHighestMean()
{
    nr::EpsilonGreedySelector selector(0.0, 7u);
    const QVector<nr::BanditArm> arms = trainedArms();

    int popular = 0;
    const int rounds = 1000;
    for (int i = 0; i < rounds; ++i) {
        auto selection = selector.selectArm(nr::BanditContext{}, arms);
        QVERIFY(selection.has_value());
        if (selection->armId == 2) {
            ++popular;
            QCOMPARE(selection->reason, nr::SelectionReason::Exploitation);
            QCOMPARE(selection->decisionValue, 0.6);
        }
    }
    QVERIFY(popular >= rounds * 99 / 100);
}

void TestEpsilonGreedy::testTiesGoToLowestId()
{
    const QVector<nr::BanditArm> arms{
        makeArm(3, QStringLiteral("diverse"), 10, 5.0),
        makeArm(2, QStringLiteral("popular"), 20, 10.0),
    };
    QCOMPARE(nr::EpsilonGreedySelector::bestArmIndex(arms), 1);
}

void TestEpsilonGreedy::testUntrainedArmsAreExplored()
{
    nr::EpsilonGreedySelector selector(0.0, 11u);
    const QVector<nr::BanditArm> arms{
        makeArm(1, QStringLiteral("personalized"), 0, 0.0),
        makeArm(2, QStringLiteral("popular"), 0, 0.0),
    };

    auto selection = selector.selectArm(nr::BanditContext{}, arms);
    QVERIFY(selection.has_value());
    QCOMPARE(selection->reason, nr::SelectionReason::Exploration);
}

void TestEpsilonGreedy::testFullExplorationIsRoughlyUniform()
{
    nr::EpsilonGreedySelector selector(1.0, 5u);
    const QVector<nr::BanditArm> arms = trainedArms();

    QHash<int, int> counts;
    const int rounds = 4000;
    for (int i = 0; i < rounds; ++i) {
        auto selection = selector.selectArm(nr::BanditContext{}, arms);
        QVERIFY(selection.has_value());
        QCOMPARE(selection->reason, nr::SelectionReason::Exploration);
        counts[selection->armId] += 1;
    }
    QCOMPARE(counts.size(), 4);
    for (auto it = counts.cbegin(); it != counts.cend(); ++it) {
        QVERIFY2(it.value() > 800 && it.value() < 1200,
                 qPrintable(QStringLiteral("arm %1 chosen %2 times").arg(it.key()).arg(it.value())));
    }
}

void TestEpsilonGreedy::testDisabledArmsAreNeverChosen()
{
    QVector<nr::BanditArm> arms = trainedArms();
    arms[1].enabled = false;  // popular has the best mean

    nr::EpsilonGreedySelector greedy(0.0, 3u);
    auto selection = greedy.selectArm(nr::BanditContext{}, arms);
    QVERIFY(selection.has_value());
    QCOMPARE(selection->armId, 1);

    nr::EpsilonGreedySelector explorer(1.0, 3u);
    for (int i = 0; i < 200; ++i) {
        QVERIFY(explorer.selectArm(nr::BanditContext{}, arms)->armId != 2);
    }
}

void TestEpsilonGreedy::testNoEnabledArmsYieldsNothing()
{
    nr::EpsilonGreedySelector selector(0.1, 1u);
    QVERIFY(!selector.selectArm(nr::BanditContext{}, {}).has_value());

    QVector<nr::BanditArm> arms = trainedArms();
    for (nr::BanditArm& arm : arms) {
        arm.enabled = false;
    }
    QVERIFY(!selector.selectArm(nr::BanditContext{}, arms).has_value());
    QCOMPARE(nr::EpsilonGreedySelector::bestArmIndex(arms), -1);
}

void TestEpsilonGreedy::testEpsilonIsClamped()
{
    QCOMPARE(nr::EpsilonGreedySelector(-0.5).epsilon(), 0.0);
    QCOMPARE(nr::EpsilonGreedySelector(3.0).epsilon(), 1.0);
    QCOMPARE(nr::EpsilonGreedySelector(0.1).name(), QStringLiteral("epsilon-greedy"));
}

void TestEpsilonGreedy::testGreedyArmEmergesFromRecordedRewards()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    auto store = nr::SQLiteStore::open(dir.filePath(QStringLiteral("bandit.db")));
    QVERIFY(store.has_value());
    nr::BanditLedger ledger(store->rawDb());

    nr::EpsilonGreedySelector selector(0.1, 13u);
    QRandomGenerator environment(29u);
    // Seeded arms: 1 personalized, 2 popular, 3 diverse, 4 recent.
    const QHash<int, double> clickRate{{1, 0.2}, {2, 0.7}, {3, 0.1}, {4, 0.3}};
    const QDateTime now(QDate(2024, 3, 15), QTime(9, 0), QTimeZone::UTC);

    const int rounds = 800;
    int popularLate = 0;
    for (int i = 0; i < rounds; ++i) {
        bool ok = false;
        const QVector<nr::BanditArm> arms = ledger.listArms(&ok);
        QVERIFY(ok);
        QCOMPARE(arms.size(), 4);

        auto selection = selector.selectArm(nr::BanditContext{}, arms);
        QVERIFY(selection.has_value());

        nr::BanditDecision decision;
        decision.armId = selection->armId;
        decision.subjectId = QStringLiteral("u%1").arg(i % 50);
        decision.context.subjectId = decision.subjectId;
        decision.decisionValue = selection->decisionValue;
        decision.reason = selection->reason;
        decision.createdAt = now.addSecs(i);
        const std::optional<int64_t> decisionId = ledger.recordDecision(decision);
        QVERIFY(decisionId.has_value());

        nr::BanditReward reward;
        reward.decisionId = *decisionId;
        reward.rewardType = nr::RewardType::Click;
        reward.rewardValue =
            environment.generateDouble() < clickRate.value(selection->armId) ? 1.0 : 0.0;
        reward.createdAt = decision.createdAt.addSecs(1);
        QCOMPARE(ledger.recordReward(reward), nr::RewardStatus::Recorded);

        if (i >= rounds / 2 && selection->armId == 2) {
            ++popularLate;
        }
    }

    const QVector<nr::BanditArm> learned = ledger.listArms();
    QCOMPARE(learned.at(nr::EpsilonGreedySelector::bestArmIndex(learned)).armId, 2);
    QVERIFY2(popularLate > rounds / 2 * 3 / 4,
             qPrintable(QStringLiteral("popular chosen %1 times late").arg(popularLate)));

    int64_t popularPulls = 0;
    int64_t otherPulls = 0;
    for (const nr::ArmStats& stats : ledger.armStats()) {
        (stats.armId == 2 ? popularPulls : otherPulls) += stats.count;
    }
    QCOMPARE(popularPulls + otherPulls, static_cast<int64_t>(rounds));
    QVERIFY(popularPulls > otherPulls);
}

QTEST_MAIN(TestEpsilonGreedy)
#include "test_epsilon_greedy.moc"
