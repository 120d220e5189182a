#include <QtTest/QtTest>
#include "core/store/event_log.h"
#include "core/store/sqlite_store.h"

#include <QFile>
#include <QTemporaryDir>
#include <QTimeZone>

#include <memory>

#include <sqlite3.h>

namespace {

const QDateTime kNow = QDateTime(QDate(2024, 3, 15), QTime(12, 0), QTimeZone::UTC);

int scalar(sqlite3* db, const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }
    int value = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

} // namespace

class TestSQLiteStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Schema ───────────────────────────────────────────────────
    void testOpenCreatesDatabase();
    void testWalModeActive();
    void testSchemaVersionSet();
    void testDefaultArmsSeeded();
    void testReopenKeepsData();

    // ── Settings and profiles ────────────────────────────────────
    void testSettings();
    void testUnknownProfileIsDefault();
    void testProfileUpsertAndDeactivate();
    void testProfileWithoutSubjectIsRejected();

    // ── Event log ────────────────────────────────────────────────
    void testImpressionsAreCountedPerPartition();
    void testRecentClicksNewestFirst();
    void testPurgeOlderThan();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<nr::SQLiteStore> m_store;
};

void TestSQLiteStore::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = nr::SQLiteStore::open(m_dir->filePath(QStringLiteral("store.db")));
    QVERIFY(m_store.has_value());
}

void TestSQLiteStore::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

// ── Schema ───────────────────────────────────────────────────────

void TestSQLiteStore::testOpenCreatesDatabase()
{
    QVERIFY(QFile::exists(m_dir->filePath(QStringLiteral("store.db"))));
    QVERIFY(m_store->integrityCheck());
}

void TestSQLiteStore::testWalModeActive()
{
    sqlite3_stmt* stmt = nullptr;
    QCOMPARE(sqlite3_prepare_v2(m_store->rawDb(), "PRAGMA journal_mode", -1, &stmt, nullptr),
             SQLITE_OK);
    QCOMPARE(sqlite3_step(stmt), SQLITE_ROW);
    const QString mode = QString::fromUtf8(
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    QCOMPARE(mode.toLower(), QStringLiteral("wal"));
}

void TestSQLiteStore::testSchemaVersionSet()
{
    auto version = m_store->getSetting(QStringLiteral("schema_version"));
    QVERIFY(version.has_value());
    QCOMPARE(*version, QStringLiteral("2"));
}

void TestSQLiteStore::testDefaultArmsSeeded()
{
    QCOMPARE(scalar(m_store->rawDb(), "SELECT COUNT(*) FROM bandit_arm"), 4);
    QCOMPARE(scalar(m_store->rawDb(), "SELECT arm_id FROM bandit_arm WHERE name='personalized'"), 1);
    QCOMPARE(scalar(m_store->rawDb(), "SELECT COUNT(*) FROM feature_flag"), 8);
}

void TestSQLiteStore::testReopenKeepsData()
{
    QVERIFY(m_store->setSetting(QStringLiteral("marker"), QStringLiteral("kept")));
    m_store.reset();

    m_store = nr::SQLiteStore::open(m_dir->filePath(QStringLiteral("store.db")));
    QVERIFY(m_store.has_value());
    QCOMPARE(m_store->getSetting(QStringLiteral("marker")).value_or(QString()),
             QStringLiteral("kept"));
    QCOMPARE(scalar(m_store->rawDb(), "SELECT COUNT(*) FROM bandit_arm"), 4);
}

// ── Settings and profiles ────────────────────────────────────────

void TestSQLiteStore::testSettings()
{
    QVERIFY(!m_store->getSetting(QStringLiteral("missing")).has_value());
    QVERIFY(m_store->setSetting(QStringLiteral("last_aggregation_at"), QStringLiteral("1700000000000")));
    QCOMPARE(*m_store->getSetting(QStringLiteral("last_aggregation_at")),
             QStringLiteral("1700000000000"));
}

void TestSQLiteStore::testUnknownProfileIsDefault()
{
    bool ok = false;
    QVERIFY(!m_store->findProfile(QStringLiteral("nobody"), &ok).has_value());
    QVERIFY(ok);

    const nr::UserProfile profile = m_store->getProfile(QStringLiteral("nobody"), &ok);
    QVERIFY(ok);
    QCOMPARE(profile.subjectId, QStringLiteral("nobody"));
    QVERIFY(!profile.personalizationEnabled);
    QCOMPARE(profile.diversityWeight, 0.7);
    QVERIFY(profile.interestedTickers.isEmpty());

    // Reading the default does not create a row.
    QVERIFY(!m_store->findProfile(QStringLiteral("nobody")).has_value());
}

void TestSQLiteStore::testProfileUpsertAndDeactivate()
{
    nr::UserProfile profile;
    profile.subjectId = QStringLiteral("u1");
    profile.interestedTickers = {QStringLiteral("AAPL"), QStringLiteral("MSFT")};
    profile.interestedKeywords = {QStringLiteral("earnings")};
    profile.diversityWeight = 0.4;
    profile.personalizationEnabled = true;
    QVERIFY(m_store->upsertProfile(profile));

    nr::UserProfile stored = m_store->getProfile(QStringLiteral("u1"));
    QCOMPARE(stored.interestedTickers, profile.interestedTickers);
    QCOMPARE(stored.interestedKeywords, profile.interestedKeywords);
    QCOMPARE(stored.diversityWeight, 0.4);
    QVERIFY(stored.personalizationEnabled);

    profile.diversityWeight = 0.9;
    QVERIFY(m_store->upsertProfile(profile));
    QCOMPARE(m_store->getProfile(QStringLiteral("u1")).diversityWeight, 0.9);

    QVERIFY(m_store->deactivateProfile(QStringLiteral("u1")));
    QVERIFY(!m_store->getProfile(QStringLiteral("u1")).personalizationEnabled);
    auto raw = m_store->findProfile(QStringLiteral("u1"));
    QVERIFY(raw.has_value());
    QVERIFY(!raw->active);
}

void TestSQLiteStore::testProfileWithoutSubjectIsRejected()
{
    nr::UserProfile profile;
    QVERIFY(!m_store->upsertProfile(profile));
}

// ── Event log ────────────────────────────────────────────────────

void TestSQLiteStore::testImpressionsAreCountedPerPartition()
{
    nr::EventLog log(m_store->rawDb());

    QVector<nr::ImpressionEvent> served;
    for (int i = 0; i < 3; ++i) {
        nr::ImpressionEvent event;
        event.subjectId = QStringLiteral("u1");
        event.itemId = QStringLiteral("item-%1").arg(i);
        event.position = i + 1;
        event.experimentKey = QStringLiteral("ranking_ab");
        event.variant = QStringLiteral("control");
        event.timestamp = kNow;
        served.append(event);
    }
    QVERIFY(log.appendImpressions(served));

    nr::ImpressionEvent yesterday = served.first();
    yesterday.timestamp = kNow.addDays(-1);
    QVERIFY(log.appendImpression(yesterday));

    QCOMPARE(log.impressionCount(QStringLiteral("ranking_ab"), QStringLiteral("2024-03-15")), 3);
    QCOMPARE(log.impressionCount(QStringLiteral("ranking_ab"), QStringLiteral("2024-03-14")), 1);
    QCOMPARE(log.impressionCount(QStringLiteral("other"), QStringLiteral("2024-03-15")), 0);
}

void TestSQLiteStore::testRecentClicksNewestFirst()
{
    nr::EventLog log(m_store->rawDb());

    for (int hoursAgo : {30, 5, 1}) {
        nr::ClickEvent click;
        click.subjectId = QStringLiteral("u1");
        click.itemId = QStringLiteral("h%1").arg(hoursAgo);
        click.itemTickers = {QStringLiteral("AAPL")};
        click.topicId = QStringLiteral("T1");
        click.dwellTimeMs = 12000;
        click.timestamp = kNow.addSecs(-hoursAgo * 3600);
        QVERIFY(log.appendClick(click));
    }

    bool ok = false;
    const QVector<nr::ClickEvent> recent =
        log.recentClicks(QStringLiteral("u1"), kNow.addDays(-1), &ok);
    QVERIFY(ok);
    QCOMPARE(recent.size(), 2);
    QCOMPARE(recent.at(0).itemId, QStringLiteral("h1"));
    QCOMPARE(recent.at(1).itemId, QStringLiteral("h5"));
    QCOMPARE(recent.at(0).itemTickers, QStringList{QStringLiteral("AAPL")});
    QCOMPARE(recent.at(0).topicId.value_or(QString()), QStringLiteral("T1"));
    QCOMPARE(recent.at(0).dwellTimeMs.value_or(0), static_cast<int64_t>(12000));

    QVERIFY(log.recentClicks(QStringLiteral("u2"), kNow.addDays(-1), &ok).isEmpty());
    QVERIFY(ok);
}

void TestSQLiteStore::testPurgeOlderThan()
{
    nr::EventLog log(m_store->rawDb());

    nr::ImpressionEvent old;
    old.subjectId = QStringLiteral("u1");
    old.itemId = QStringLiteral("old");
    old.timestamp = kNow.addDays(-120);
    QVERIFY(log.appendImpression(old));

    nr::ImpressionEvent fresh = old;
    fresh.itemId = QStringLiteral("fresh");
    fresh.timestamp = kNow.addDays(-2);
    QVERIFY(log.appendImpression(fresh));

    QCOMPARE(log.purgeOlderThan(90, kNow), 1);
    QCOMPARE(scalar(m_store->rawDb(), "SELECT COUNT(*) FROM impression_log"), 1);
}

QTEST_MAIN(TestSQLiteStore)
#include "test_sqlite_store.moc"
