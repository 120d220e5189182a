#include <QtTest/QtTest>
#include "core/store/sqlite_store.h"
#include "core/store/write_queue.h"

#include <QTemporaryDir>

#include <atomic>
#include <memory>

#include <sqlite3.h>

namespace {

bool insertSetting(sqlite3* db, const QString& key)
{
    const QByteArray sql = QStringLiteral(
        "INSERT OR REPLACE INTO settings (key, value) VALUES ('%1', 'x')").arg(key).toUtf8();
    return sqlite3_exec(db, sql.constData(), nullptr, nullptr, nullptr) == SQLITE_OK;
}

nr::WriteJob settingJob(const QString& key, const QString& dedupKey = {})
{
    nr::WriteJob job;
    job.kind = QStringLiteral("test");
    job.dedupKey = dedupKey;
    job.apply = [key](sqlite3* db) { return insertSetting(db, key); };
    return job;
}

} // namespace

class TestWriteQueue : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testJobsAreAppliedInOrder();
    void testSubmitBeforeStartIsRefused();
    void testDuplicateKeysAreSuppressed();
    void testFailingJobIsRetriedThenDropped();
    void testShutdownDrainsQueue();
    void testJobWithoutApplyIsRefused();

private:
    QString dbPath() const { return m_dir->filePath(QStringLiteral("queue.db")); }

    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<nr::SQLiteStore> m_store;
};

void TestWriteQueue::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = nr::SQLiteStore::open(dbPath());
    QVERIFY(m_store.has_value());
}

void TestWriteQueue::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void TestWriteQueue::testJobsAreAppliedInOrder()
{
    nr::WriteQueue queue(dbPath());
    QVERIFY(queue.start());

    auto order = std::make_shared<QStringList>();
    for (int i = 0; i < 20; ++i) {
        nr::WriteJob job;
        job.kind = QStringLiteral("ordered");
        job.apply = [order, i](sqlite3* db) {
            order->append(QString::number(i));
            return insertSetting(db, QStringLiteral("job-%1").arg(i));
        };
        QVERIFY(queue.submit(std::move(job)));
    }

    QVERIFY(queue.waitUntilIdle(5000));
    QCOMPARE(order->size(), 20);
    QCOMPARE(order->first(), QStringLiteral("0"));
    QCOMPARE(order->last(), QStringLiteral("19"));
    QCOMPARE(queue.stats().applied, static_cast<size_t>(20));

    // Writes are visible to other connections.
    QVERIFY(m_store->getSetting(QStringLiteral("job-19")).has_value());
}

void TestWriteQueue::testSubmitBeforeStartIsRefused()
{
    nr::WriteQueue queue(dbPath());
    QVERIFY(!queue.submit(settingJob(QStringLiteral("early"))));
    QCOMPARE(queue.stats().dropped, static_cast<size_t>(1));
    QVERIFY(!queue.stats().running);
}

void TestWriteQueue::testDuplicateKeysAreSuppressed()
{
    nr::WriteQueue queue(dbPath());
    QVERIFY(queue.start());

    QVERIFY(queue.submit(settingJob(QStringLiteral("a"), QStringLiteral("click:u1:i1:1"))));
    QVERIFY(!queue.submit(settingJob(QStringLiteral("b"), QStringLiteral("click:u1:i1:1"))));
    QVERIFY(queue.submit(settingJob(QStringLiteral("c"), QStringLiteral("click:u1:i1:2"))));
    // Jobs without a key are never suppressed.
    QVERIFY(queue.submit(settingJob(QStringLiteral("d"))));
    QVERIFY(queue.submit(settingJob(QStringLiteral("d"))));

    QVERIFY(queue.waitUntilIdle(5000));
    const nr::WriteQueueStats stats = queue.stats();
    QCOMPARE(stats.duplicates, static_cast<size_t>(1));
    QCOMPARE(stats.applied, static_cast<size_t>(4));
    QVERIFY(!m_store->getSetting(QStringLiteral("b")).has_value());
}

void TestWriteQueue::testFailingJobIsRetriedThenDropped()
{
    nr::WriteQueue queue(dbPath());
    QVERIFY(queue.start());

    auto attempts = std::make_shared<std::atomic<int>>(0);
    nr::WriteJob job;
    job.kind = QStringLiteral("broken");
    job.apply = [attempts](sqlite3*) {
        attempts->fetch_add(1);
        return false;
    };
    QVERIFY(queue.submit(std::move(job)));
    QVERIFY(queue.submit(settingJob(QStringLiteral("after"))));

    QVERIFY(queue.waitUntilIdle(5000));
    QCOMPARE(attempts->load(), nr::WriteQueue::kMaxAttempts);
    const nr::WriteQueueStats stats = queue.stats();
    QCOMPARE(stats.failed, static_cast<size_t>(1));
    QCOMPARE(stats.retried, static_cast<size_t>(nr::WriteQueue::kMaxAttempts - 1));
    QCOMPARE(stats.applied, static_cast<size_t>(1));
    QVERIFY(m_store->getSetting(QStringLiteral("after")).has_value());
}

void TestWriteQueue::testShutdownDrainsQueue()
{
    {
        nr::WriteQueue queue(dbPath());
        QVERIFY(queue.start());
        for (int i = 0; i < 50; ++i) {
            QVERIFY(queue.submit(settingJob(QStringLiteral("drain-%1").arg(i))));
        }
        queue.shutdown();
        QVERIFY(!queue.stats().running);
        QVERIFY(!queue.submit(settingJob(QStringLiteral("late"))));
    }
    QVERIFY(m_store->getSetting(QStringLiteral("drain-49")).has_value());
    QVERIFY(!m_store->getSetting(QStringLiteral("late")).has_value());
}

void TestWriteQueue::testJobWithoutApplyIsRefused()
{
    nr::WriteQueue queue(dbPath());
    QVERIFY(queue.start());
    nr::WriteJob job;
    job.kind = QStringLiteral("empty");
    QVERIFY(!queue.submit(std::move(job)));
}

QTEST_MAIN(TestWriteQueue)
#include "test_write_queue.moc"
