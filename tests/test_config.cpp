#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <limits>

#include "common/config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();

    void testDefaults();
    void testEnvironmentOverrides();
    void testInvalidValuesFallBack();
    void testPageSizeCapped();
    void testRebuildIntervalCapped();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

namespace {

const char *const kVariables[] = {
    "LEAFLINE_DB_PATH",
    "LEAFLINE_BUSY_TIMEOUT_MS",
    "LEAFLINE_REBUILD_BATCH_SIZE",
    "LEAFLINE_TIMELINE_PAGE_SIZE",
    "LEAFLINE_REBUILD_INTERVAL_MINUTES",
    "LEAFLINE_ORPHAN_POLICY",
    "LEAFLINE_AUTO_REFRESH",
    "LEAFLINE_TRACE",
};

} // namespace

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    cleanup();
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ConfigTests::cleanup()
{
    for (const char *name : kVariables) {
        qunsetenv(name);
    }
}

void ConfigTests::testDefaults()
{
    const auto config = leafline::Config::fromEnvironment();
    QCOMPARE(QString::fromStdString(config.databasePath),
             m_tempDir.path() + "/.local/share/leafline/leafline.db");
    QCOMPARE(config.busyTimeoutMs, 5000);
    QCOMPARE(config.rebuildBatchSize, 100);
    QCOMPARE(config.timelinePageSize, 20);
    QCOMPARE(config.rebuildIntervalMinutes, 0);
    QCOMPARE(config.orphanPolicy, leafline::OrphanPolicy::Freeze);
    QVERIFY(config.autoRefreshTimeline);
    QVERIFY(!config.traceEnabled);
}

void ConfigTests::testEnvironmentOverrides()
{
    qputenv("LEAFLINE_DB_PATH", "/tmp/leafline-config-test.db");
    qputenv("LEAFLINE_BUSY_TIMEOUT_MS", "250");
    qputenv("LEAFLINE_REBUILD_BATCH_SIZE", "7");
    qputenv("LEAFLINE_TIMELINE_PAGE_SIZE", "50");
    qputenv("LEAFLINE_REBUILD_INTERVAL_MINUTES", "15");
    qputenv("LEAFLINE_ORPHAN_POLICY", "PRUNE");
    qputenv("LEAFLINE_AUTO_REFRESH", "0");
    qputenv("LEAFLINE_TRACE", "1");

    const auto config = leafline::Config::fromEnvironment();
    QCOMPARE(QString::fromStdString(config.databasePath), QStringLiteral("/tmp/leafline-config-test.db"));
    QCOMPARE(config.busyTimeoutMs, 250);
    QCOMPARE(config.rebuildBatchSize, 7);
    QCOMPARE(config.timelinePageSize, 50);
    QCOMPARE(config.rebuildIntervalMinutes, 15);
    QCOMPARE(config.orphanPolicy, leafline::OrphanPolicy::Prune);
    QVERIFY(!config.autoRefreshTimeline);
    QVERIFY(config.traceEnabled);
}

void ConfigTests::testInvalidValuesFallBack()
{
    qputenv("LEAFLINE_REBUILD_BATCH_SIZE", "-3");
    qputenv("LEAFLINE_BUSY_TIMEOUT_MS", "soon");
    qputenv("LEAFLINE_REBUILD_INTERVAL_MINUTES", "never");
    qputenv("LEAFLINE_ORPHAN_POLICY", "shred");

    const auto config = leafline::Config::fromEnvironment();
    QCOMPARE(config.rebuildBatchSize, 100);
    QCOMPARE(config.busyTimeoutMs, 5000);
    QCOMPARE(config.rebuildIntervalMinutes, 0);
    QCOMPARE(config.orphanPolicy, leafline::OrphanPolicy::Freeze);
}

void ConfigTests::testPageSizeCapped()
{
    qputenv("LEAFLINE_TIMELINE_PAGE_SIZE", "1000");
    const auto config = leafline::Config::fromEnvironment();
    QCOMPARE(config.timelinePageSize, leafline::kMaxTimelinePageSize);
}

void ConfigTests::testRebuildIntervalCapped()
{
    // Fits an int as minutes but not once converted to milliseconds.
    qputenv("LEAFLINE_REBUILD_INTERVAL_MINUTES", "2000000000");
    const auto config = leafline::Config::fromEnvironment();
    QCOMPARE(config.rebuildIntervalMinutes, leafline::kMaxRebuildIntervalMinutes);
    QVERIFY(static_cast<long long>(config.rebuildIntervalMinutes) * 60 * 1000
            <= std::numeric_limits<int>::max());

    qputenv("LEAFLINE_REBUILD_INTERVAL_MINUTES", "10080");
    QCOMPARE(leafline::Config::fromEnvironment().rebuildIntervalMinutes, 10080);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
