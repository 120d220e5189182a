#include <QtTest/QtTest>
#include "core/bandit/remote_arm_selector.h"
#include "core/ipc/message.h"
#include "core/ipc/socket_server.h"
#include "core/shared/circuit_breaker.h"

#include <QJsonArray>
#include <QMutex>
#include <QSemaphore>
#include <QTemporaryDir>
#include <QThread>

#include <utility>

namespace {

// Serves selectArm from its own thread so the blocking client can be
// driven from the test thread.
class SelectorServerThread : public QThread {
public:
    SelectorServerThread(QString socketPath, QJsonObject reply)
        : m_socketPath(std::move(socketPath))
        , m_reply(std::move(reply))
    {
    }

    bool waitUntilListening() { return m_ready.tryAcquire(1, 5000) && m_listening; }

    QJsonObject lastParams() const
    {
        QMutexLocker locker(&m_mutex);
        return m_lastParams;
    }

protected:
    void run() override
    {
        nr::SocketServer server;
        server.setRequestHandler([this](const QJsonObject& request) {
            {
                QMutexLocker locker(&m_mutex);
                m_lastParams = nr::IpcMessage::params(request);
            }
            return nr::IpcMessage::makeResponse(nr::IpcMessage::requestId(request), m_reply);
        });
        m_listening = server.listen(m_socketPath);
        m_ready.release();
        if (!m_listening) {
            return;
        }
        exec();
        server.close();
    }

private:
    QString m_socketPath;
    QJsonObject m_reply;
    QSemaphore m_ready;
    bool m_listening = false;
    mutable QMutex m_mutex;
    QJsonObject m_lastParams;
};

QVector<nr::BanditArm> seededArms()
{
    QVector<nr::BanditArm> arms;
    const QStringList names{QStringLiteral("personalized"), QStringLiteral("popular"),
                            QStringLiteral("diverse"), QStringLiteral("recent")};
    for (int i = 0; i < names.size(); ++i) {
        nr::BanditArm arm;
        arm.armId = i + 1;
        arm.name = names.at(i);
        arms.append(arm);
    }
    return arms;
}

nr::BanditContext sampleContext()
{
    nr::BanditContext context;
    context.subjectId = QStringLiteral("u1");
    context.timeSlot = 9;
    context.category = QStringLiteral("finance");
    return context;
}

} // namespace

class TestRemoteArmSelector : public QObject {
    Q_OBJECT

private slots:
    void testUnreachableServiceCountsAsFailure();
    void testOpenBreakerSkipsCall();
    void testSelectionFromLiveService();
    void testUnknownArmIsRejected();
};

void TestRemoteArmSelector::testUnreachableServiceCountsAsFailure()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    nr::CircuitBreaker breaker(QStringLiteral("arm-selector"), 3, 60000);
    nr::RemoteArmSelector selector(dir.filePath(QStringLiteral("absent.sock")), 100, breaker);

    QVERIFY(!selector.selectArm(sampleContext(), seededArms()).has_value());
    QCOMPARE(breaker.consecutiveFailures.load(), 1);
    QVERIFY(!breaker.isOpen());
}

void TestRemoteArmSelector::testOpenBreakerSkipsCall()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    nr::CircuitBreaker breaker(QStringLiteral("arm-selector"), 2, 60000);
    breaker.recordFailure();
    breaker.recordFailure();
    QVERIFY(breaker.isOpen());

    nr::RemoteArmSelector selector(dir.filePath(QStringLiteral("absent.sock")), 100, breaker);
    QVERIFY(!selector.selectArm(sampleContext(), seededArms()).has_value());
    // Skipped calls do not add failures.
    QCOMPARE(breaker.consecutiveFailures.load(), 2);
}

void TestRemoteArmSelector::testSelectionFromLiveService()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("selector.sock"));

    QJsonObject reply;
    reply[QStringLiteral("armId")] = 3;
    reply[QStringLiteral("decisionValue")] = 0.42;
    reply[QStringLiteral("reason")] = QStringLiteral("EXPLORATION");
    SelectorServerThread server(path, reply);
    server.start();
    QVERIFY(server.waitUntilListening());

    nr::CircuitBreaker breaker(QStringLiteral("arm-selector"), 3, 60000);
    breaker.recordFailure();
    {
        nr::RemoteArmSelector selector(path, 2000, breaker);
        QVector<nr::BanditArm> arms = seededArms();
        arms[3].enabled = false;

        const auto selection = selector.selectArm(sampleContext(), arms);
        QVERIFY(selection.has_value());
        QCOMPARE(selection->armId, 3);
        QCOMPARE(selection->decisionValue, 0.42);
        QVERIFY(selection->reason == nr::SelectionReason::Exploration);
        QCOMPARE(breaker.consecutiveFailures.load(), 0);

        const QJsonObject params = server.lastParams();
        QCOMPARE(params.value(QStringLiteral("arms")).toArray().size(), 3);
        QCOMPARE(params.value(QStringLiteral("context")).toObject()
                     .value(QStringLiteral("timeSlot")).toInt(), 9);
    }

    server.quit();
    QVERIFY(server.wait(5000));
}

void TestRemoteArmSelector::testUnknownArmIsRejected()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("selector.sock"));

    QJsonObject reply;
    reply[QStringLiteral("armId")] = 9;
    SelectorServerThread server(path, reply);
    server.start();
    QVERIFY(server.waitUntilListening());

    nr::CircuitBreaker breaker(QStringLiteral("arm-selector"), 3, 60000);
    {
        nr::RemoteArmSelector selector(path, 2000, breaker);
        QVERIFY(!selector.selectArm(sampleContext(), seededArms()).has_value());
        QCOMPARE(breaker.consecutiveFailures.load(), 1);
    }

    server.quit();
    QVERIFY(server.wait(5000));
}

QTEST_MAIN(TestRemoteArmSelector)
#include "test_remote_arm_selector.moc"
