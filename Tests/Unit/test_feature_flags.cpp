#include <QtTest/QtTest>
#include "core/experiment/feature_flags.h"
#include "core/store/sqlite_store.h"

#include <QTemporaryDir>

#include <memory>

class TestFeatureFlags : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testSeededFlagsAreEnabled();
    void testUnknownKeyReportsDefault();
    void testSetEnabledPersists();
    void testNumberValue();
    void testSnapshotServesUntilTtlOrInvalidate();
    void testListIsSortedByKey();
    void testEmptyKeyIsRejected();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::optional<nr::SQLiteStore> m_store;
};

void TestFeatureFlags::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = nr::SQLiteStore::open(m_dir->filePath(QStringLiteral("flags.db")));
    QVERIFY(m_store.has_value());
}

void TestFeatureFlags::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void TestFeatureFlags::testSeededFlagsAreEnabled()
{
    nr::FeatureFlags flags(m_store->rawDb());
    for (const char* key : {nr::flags::kRankAb, nr::flags::kPersonalization,
                            nr::flags::kDiversityFilter, nr::flags::kImpressionLogging,
                            nr::flags::kClickLogging, nr::flags::kAutoStop,
                            nr::flags::kMetricsCalculation}) {
        QVERIFY2(flags.isEnabled(QString::fromLatin1(key), false), key);
    }
}

void TestFeatureFlags::testUnknownKeyReportsDefault()
{
    nr::FeatureFlags flags(m_store->rawDb());
    QVERIFY(flags.isEnabled(QStringLiteral("feature.unknown"), true));
    QVERIFY(!flags.isEnabled(QStringLiteral("feature.unknown"), false));
    QVERIFY(!flags.get(QStringLiteral("feature.unknown")).has_value());
}

void TestFeatureFlags::testSetEnabledPersists()
{
    nr::FeatureFlags flags(m_store->rawDb());
    QVERIFY(flags.setEnabled(QString::fromLatin1(nr::flags::kPersonalization), false));
    QVERIFY(!flags.isEnabled(QString::fromLatin1(nr::flags::kPersonalization)));

    // A second reader over the same table sees the write.
    nr::FeatureFlags other(m_store->rawDb());
    QVERIFY(!other.isEnabled(QString::fromLatin1(nr::flags::kPersonalization)));

    auto flag = other.get(QString::fromLatin1(nr::flags::kPersonalization));
    QVERIFY(flag.has_value());
    QVERIFY(!flag->description.isEmpty());
}

void TestFeatureFlags::testNumberValue()
{
    nr::FeatureFlags flags(m_store->rawDb());
    const QString key = QString::fromLatin1(nr::flags::kMmrLambda);
    QCOMPARE(flags.numberValue(key, 0.0), 0.7);

    QVERIFY(flags.setValue(key, QStringLiteral("not-a-number")));
    QVERIFY(!flags.numberValue(key).has_value());
    QCOMPARE(flags.numberValue(key, 0.3), 0.3);

    QVERIFY(flags.setValue(key, QStringLiteral("0.45")));
    QCOMPARE(flags.numberValue(key, 0.0), 0.45);

    // A disabled flag does not contribute its value.
    QVERIFY(flags.setEnabled(key, false));
    QVERIFY(!flags.numberValue(key).has_value());
}

void TestFeatureFlags::testSnapshotServesUntilTtlOrInvalidate()
{
    nr::FeatureFlags cached(m_store->rawDb(), 3600);
    const QString key = QString::fromLatin1(nr::flags::kDiversityFilter);
    QVERIFY(cached.isEnabled(key));

    nr::FeatureFlags writer(m_store->rawDb());
    QVERIFY(writer.setEnabled(key, false));

    QVERIFY(cached.isEnabled(key));
    cached.invalidate();
    QVERIFY(!cached.isEnabled(key));

    nr::FeatureFlags uncached(m_store->rawDb(), 0);
    QVERIFY(!uncached.isEnabled(key));
    QVERIFY(writer.setEnabled(key, true));
    QVERIFY(uncached.isEnabled(key));
}

void TestFeatureFlags::testListIsSortedByKey()
{
    nr::FeatureFlags flags(m_store->rawDb());
    const QVector<nr::FeatureFlag> all = flags.list();
    QCOMPARE(all.size(), 8);
    for (int i = 1; i < all.size(); ++i) {
        QVERIFY(all.at(i - 1).key < all.at(i).key);
    }
}

void TestFeatureFlags::testEmptyKeyIsRejected()
{
    nr::FeatureFlags flags(m_store->rawDb());
    QVERIFY(!flags.setEnabled(QStringLiteral("  "), true));
    QVERIFY(!flags.setValue(QString(), QStringLiteral("1")));
}

QTEST_MAIN(TestFeatureFlags)
#include "test_feature_flags.moc"
