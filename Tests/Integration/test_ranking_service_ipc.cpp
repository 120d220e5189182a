#include <QtTest/QtTest>

#include "core/experiment/feature_flags.h"
#include "core/ipc/message.h"
#include "services/ranking/ranking_service.h"

#include <QJsonArray>
#include <QTemporaryDir>

#include <memory>

namespace {

QJsonObject candidateJson(const QString& id, double importance, const QString& topic,
                          const QStringList& tickers = {})
{
    QJsonObject json;
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("importanceScore")] = importance;
    json[QStringLiteral("publishedAt")] =
        QDateTime::currentDateTimeUtc().addSecs(-3600).toString(Qt::ISODateWithMs);
    json[QStringLiteral("topicId")] = topic;
    json[QStringLiteral("title")] = id + QStringLiteral(" earnings update");
    json[QStringLiteral("tickers")] = QJsonArray::fromStringList(tickers);
    return json;
}

QJsonArray sampleCandidates()
{
    return QJsonArray{
        candidateJson(QStringLiteral("n1"), 9.0, QStringLiteral("T1"), {QStringLiteral("AAPL")}),
        candidateJson(QStringLiteral("n2"), 8.0, QStringLiteral("T1")),
        candidateJson(QStringLiteral("n3"), 7.0, QStringLiteral("T1")),
        candidateJson(QStringLiteral("n4"), 6.0, QStringLiteral("T2")),
        candidateJson(QStringLiteral("n5"), 5.0, QStringLiteral("T3")),
    };
}

} // namespace

class TestRankingServiceIpc : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testExperimentLifecycle();
    void testRankLogsImpressionsThatAggregate();
    void testDecideAndRewardUpdateArmStats();
    void testInvalidRequests();
    void testFeatureFlagsOverIpc();

private:
    QJsonObject call(const QString& method, const QJsonObject& params = {});
    QJsonObject result(const QJsonObject& response) const;
    void createAndActivate(const QString& key);

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<nr::RankingService> m_service;
    uint64_t m_nextId = 1;
};

void TestRankingServiceIpc::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());

    nr::EngineSettings settings;
    settings.databasePath = m_dir->filePath(QStringLiteral("newsrank.db"));
    m_service = std::make_unique<nr::RankingService>(settings);
    m_service->setSchedulerEnabled(false);
    QVERIFY(m_service->ensureReady());
}

void TestRankingServiceIpc::cleanup()
{
    m_service.reset();
    m_dir.reset();
}

QJsonObject TestRankingServiceIpc::call(const QString& method, const QJsonObject& params)
{
    return m_service->handleRequest(nr::IpcMessage::makeRequest(m_nextId++, method, params));
}

QJsonObject TestRankingServiceIpc::result(const QJsonObject& response) const
{
    return response.value(QStringLiteral("result")).toObject();
}

void TestRankingServiceIpc::createAndActivate(const QString& key)
{
    QJsonObject params;
    params[QStringLiteral("key")] = key;
    params[QStringLiteral("variants")] = QJsonArray{
        QJsonObject{{QStringLiteral("name"), QStringLiteral("control")},
                    {QStringLiteral("percentage"), 50}},
        QJsonObject{{QStringLiteral("name"), QStringLiteral("treatment")},
                    {QStringLiteral("percentage"), 50}},
    };
    const QJsonObject created = call(QStringLiteral("createExperiment"), params);
    QVERIFY2(!nr::IpcMessage::isError(created), qPrintable(nr::IpcMessage::errorMessage(created)));
    QCOMPARE(result(created).value(QStringLiteral("isActive")).toBool(), false);

    const QJsonObject activated = call(QStringLiteral("activateExperiment"),
                                       QJsonObject{{QStringLiteral("key"), key}});
    QVERIFY(!nr::IpcMessage::isError(activated));
    QCOMPARE(result(activated).value(QStringLiteral("isActive")).toBool(), true);
}

// ── Experiments ──────────────────────────────────────────────────

void TestRankingServiceIpc::testExperimentLifecycle()
{
    createAndActivate(QStringLiteral("ranking_ab"));

    QJsonObject params;
    params[QStringLiteral("subjectId")] = QStringLiteral("u1");
    params[QStringLiteral("experimentKey")] = QStringLiteral("ranking_ab");
    const QJsonObject assigned = result(call(QStringLiteral("getAssignment"), params));
    QCOMPARE(assigned.value(QStringLiteral("bucket")).toInt(), 58);
    QCOMPARE(assigned.value(QStringLiteral("variant")).toString(), QStringLiteral("treatment"));
    QVERIFY(assigned.value(QStringLiteral("isActive")).toBool());

    params[QStringLiteral("subjectId")] = QStringLiteral("u2");
    QCOMPARE(result(call(QStringLiteral("getAssignment"), params))
                 .value(QStringLiteral("variant")).toString(),
             QStringLiteral("control"));

    const QJsonObject duplicate = call(QStringLiteral("createExperiment"),
        QJsonObject{{QStringLiteral("key"), QStringLiteral("ranking_ab")},
                    {QStringLiteral("variants"), QJsonArray{QJsonObject{
                        {QStringLiteral("name"), QStringLiteral("control")},
                        {QStringLiteral("percentage"), 100}}}}});
    QVERIFY(nr::IpcMessage::isError(duplicate));
    QCOMPARE(duplicate.value(QStringLiteral("error")).toObject()
                 .value(QStringLiteral("code")).toInt(),
             static_cast<int>(nr::IpcErrorCode::AlreadyExists));

    const QJsonObject stopped = call(QStringLiteral("stopExperiment"),
                                     QJsonObject{{QStringLiteral("key"), QStringLiteral("ranking_ab")}});
    QCOMPARE(result(stopped).value(QStringLiteral("stopReason")).toString(), QStringLiteral("manual"));

    params[QStringLiteral("subjectId")] = QStringLiteral("u1");
    const QJsonObject afterStop = result(call(QStringLiteral("getAssignment"), params));
    QCOMPARE(afterStop.value(QStringLiteral("variant")).toString(), QStringLiteral("control"));
    QVERIFY(!afterStop.value(QStringLiteral("isActive")).toBool());

    const QJsonArray listed = result(call(QStringLiteral("listExperiments")))
                                  .value(QStringLiteral("experiments")).toArray();
    QCOMPARE(listed.size(), 1);
}

// ── Ranking and metrics ──────────────────────────────────────────

void TestRankingServiceIpc::testRankLogsImpressionsThatAggregate()
{
    createAndActivate(QStringLiteral("ranking_ab"));

    QJsonObject params;
    params[QStringLiteral("subjectId")] = QStringLiteral("u1");
    params[QStringLiteral("experimentKey")] = QStringLiteral("ranking_ab");
    params[QStringLiteral("candidates")] = sampleCandidates();
    params[QStringLiteral("targetSize")] = 3;
    params[QStringLiteral("topicCap")] = 2;
    const QJsonObject ranked = call(QStringLiteral("rank"), params);
    QVERIFY2(!nr::IpcMessage::isError(ranked), qPrintable(nr::IpcMessage::errorMessage(ranked)));

    const QJsonObject rankResult = result(ranked);
    QCOMPARE(rankResult.value(QStringLiteral("variant")).toString(), QStringLiteral("treatment"));
    const QJsonArray items = rankResult.value(QStringLiteral("items")).toArray();
    QCOMPARE(items.size(), 3);
    int t1 = 0;
    for (const QJsonValue& item : items) {
        if (item.toObject().value(QStringLiteral("topicId")).toString() == QLatin1String("T1")) {
            ++t1;
        }
    }
    QVERIFY(t1 <= 2);

    QJsonObject click;
    click[QStringLiteral("subjectId")] = QStringLiteral("u1");
    click[QStringLiteral("itemId")] = items.first().toObject().value(QStringLiteral("id")).toString();
    click[QStringLiteral("experimentKey")] = QStringLiteral("ranking_ab");
    click[QStringLiteral("variant")] = QStringLiteral("treatment");
    click[QStringLiteral("position")] = 1;
    click[QStringLiteral("dwellTimeMs")] = 3000;
    QVERIFY(result(call(QStringLiteral("recordClick"), click)).value(QStringLiteral("queued")).toBool());
    QVERIFY(m_service->flushWrites(5000));

    const QJsonObject report = result(call(QStringLiteral("runAggregation")));
    QCOMPARE(report.value(QStringLiteral("experiments")).toInt(), 1);
    QCOMPARE(report.value(QStringLiteral("failed")).toInt(), 0);

    const QJsonArray rows = result(call(QStringLiteral("getDailyMetrics"),
        QJsonObject{{QStringLiteral("experimentKey"), QStringLiteral("ranking_ab")}}))
                                .value(QStringLiteral("metrics")).toArray();
    QJsonObject treatment;
    for (const QJsonValue& row : rows) {
        if (row.toObject().value(QStringLiteral("variant")).toString() == QLatin1String("treatment")) {
            treatment = row.toObject();
        }
    }
    QVERIFY(!treatment.isEmpty());
    QCOMPARE(treatment.value(QStringLiteral("impressions")).toInt(), 3);
    QCOMPARE(treatment.value(QStringLiteral("clicks")).toInt(), 1);
    QCOMPARE(treatment.value(QStringLiteral("uniqueUsers")).toInt(), 1);
}

// ── Bandit ───────────────────────────────────────────────────────

void TestRankingServiceIpc::testDecideAndRewardUpdateArmStats()
{
    QJsonObject params;
    params[QStringLiteral("subjectId")] = QStringLiteral("u1");
    params[QStringLiteral("candidates")] = sampleCandidates();
    params[QStringLiteral("limit")] = 3;
    params[QStringLiteral("context")] = QJsonObject{{QStringLiteral("category"), QStringLiteral("tech")}};
    const QJsonObject decided = call(QStringLiteral("decide"), params);
    QVERIFY2(!nr::IpcMessage::isError(decided), qPrintable(nr::IpcMessage::errorMessage(decided)));

    const QJsonObject decision = result(decided);
    QVERIFY(decision.value(QStringLiteral("decisionId")).isDouble());
    QCOMPARE(decision.value(QStringLiteral("context")).toObject()
                 .value(QStringLiteral("category")).toString(),
             QStringLiteral("tech"));
    QVERIFY(decision.value(QStringLiteral("servedItems")).toArray().size() <= 3);
    const int armId = decision.value(QStringLiteral("armId")).toInt();

    QJsonObject reward;
    reward[QStringLiteral("decisionId")] = decision.value(QStringLiteral("decisionId"));
    reward[QStringLiteral("rewardType")] = QStringLiteral("CLICK");
    reward[QStringLiteral("rewardValue")] = 1.0;
    reward[QStringLiteral("itemId")] = QStringLiteral("n1");
    const QJsonObject accepted = result(call(QStringLiteral("recordReward"), reward));
    QCOMPARE(accepted.value(QStringLiteral("status")).toString(), QStringLiteral("accepted"));
    QVERIFY(m_service->flushWrites(5000));

    const QJsonArray arms = result(call(QStringLiteral("getArmStats")))
                                .value(QStringLiteral("arms")).toArray();
    QCOMPARE(arms.size(), 4);
    bool found = false;
    for (const QJsonValue& arm : arms) {
        const QJsonObject stats = arm.toObject();
        if (stats.value(QStringLiteral("armId")).toInt() == armId) {
            found = true;
            QCOMPARE(stats.value(QStringLiteral("count")).toInt(), 1);
            QCOMPARE(stats.value(QStringLiteral("mean")).toDouble(), 1.0);
        } else {
            QCOMPARE(stats.value(QStringLiteral("count")).toInt(), 0);
        }
    }
    QVERIFY(found);

    reward[QStringLiteral("decisionId")] = 999999;
    const QJsonObject unknown = result(call(QStringLiteral("recordReward"), reward));
    QCOMPARE(unknown.value(QStringLiteral("status")).toString(), QStringLiteral("unknown_decision"));
    QVERIFY(!unknown.value(QStringLiteral("accepted")).toBool());
}

// ── Errors ───────────────────────────────────────────────────────

void TestRankingServiceIpc::testInvalidRequests()
{
    const QJsonObject missing = call(QStringLiteral("getAssignment"),
                                     QJsonObject{{QStringLiteral("subjectId"), QStringLiteral("u1")}});
    QVERIFY(nr::IpcMessage::isError(missing));
    QCOMPARE(missing.value(QStringLiteral("error")).toObject()
                 .value(QStringLiteral("code")).toInt(),
             static_cast<int>(nr::IpcErrorCode::InvalidParams));

    const QJsonObject unknown = call(QStringLiteral("activateExperiment"),
                                     QJsonObject{{QStringLiteral("key"), QStringLiteral("missing")}});
    QVERIFY(nr::IpcMessage::isError(unknown));
    QCOMPARE(unknown.value(QStringLiteral("error")).toObject()
                 .value(QStringLiteral("code")).toInt(),
             static_cast<int>(nr::IpcErrorCode::NotFound));

    QJsonObject badSplit;
    badSplit[QStringLiteral("key")] = QStringLiteral("bad_split");
    badSplit[QStringLiteral("variants")] = QJsonArray{
        QJsonObject{{QStringLiteral("name"), QStringLiteral("control")},
                    {QStringLiteral("percentage"), 60}},
        QJsonObject{{QStringLiteral("name"), QStringLiteral("treatment")},
                    {QStringLiteral("percentage"), 30}},
    };
    const QJsonObject rejected = call(QStringLiteral("createExperiment"), badSplit);
    QVERIFY(nr::IpcMessage::isError(rejected));
    QVERIFY(nr::IpcMessage::errorMessage(rejected).contains(QStringLiteral("90")));

    QJsonObject badReward;
    badReward[QStringLiteral("decisionId")] = 1;
    badReward[QStringLiteral("rewardType")] = QStringLiteral("SHARE");
    badReward[QStringLiteral("rewardValue")] = 1.0;
    QVERIFY(nr::IpcMessage::isError(call(QStringLiteral("recordReward"), badReward)));

    QVERIFY(nr::IpcMessage::isError(call(QStringLiteral("rank"))));

    const QJsonObject pong = result(call(QStringLiteral("ping")));
    QCOMPARE(pong.value(QStringLiteral("service")).toString(), QStringLiteral("ranking"));
}

void TestRankingServiceIpc::testFeatureFlagsOverIpc()
{
    createAndActivate(QStringLiteral("ranking_ab"));

    QJsonObject flag;
    flag[QStringLiteral("key")] = QString::fromLatin1(nr::flags::kRankAb);
    flag[QStringLiteral("enabled")] = false;
    QVERIFY(!nr::IpcMessage::isError(call(QStringLiteral("setFeatureFlag"), flag)));

    QJsonObject params;
    params[QStringLiteral("subjectId")] = QStringLiteral("u1");
    params[QStringLiteral("experimentKey")] = QStringLiteral("ranking_ab");
    QCOMPARE(result(call(QStringLiteral("getAssignment"), params))
                 .value(QStringLiteral("variant")).toString(),
             QStringLiteral("control"));

    const QJsonArray flags = result(call(QStringLiteral("getFeatureFlags")))
                                 .value(QStringLiteral("flags")).toArray();
    QCOMPARE(flags.size(), 8);
}

QTEST_MAIN(TestRankingServiceIpc)
#include "test_ranking_service_ipc.moc"
