#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>

#include "api/engine.hpp"
#include "api/query_facade.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "library/library_store.hpp"
#include "stats/stats_cache.hpp"

class QueryFacadeTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testCursorPaging();
    void testLimitClamped();
    void testExactPageEndsWithEmptyPage();
    void testMineScope();
    void testLazyStats();
    void testStatsForYear();
    void testRebuildEntryPoints();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::chrono::system_clock::time_point m_now;

    void resetDb();
    std::filesystem::path dbPath() const;
    leafline::Config config() const;
    leafline::Clock clock();
    static std::vector<std::int64_t> createGenres(leafline::Engine &engine, int count);
};

void QueryFacadeTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void QueryFacadeTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path QueryFacadeTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/leafline/leafline.db";
}

void QueryFacadeTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(dbPath().string() + "-wal", error);
    std::filesystem::remove(dbPath().string() + "-shm", error);
    m_now = leafline::fromIso8601Utc("2024-05-01T09:00:00.000Z");
}

leafline::Config QueryFacadeTests::config() const
{
    leafline::Config config;
    config.databasePath = dbPath().string();
    return config;
}

leafline::Clock QueryFacadeTests::clock()
{
    return [this] {
        m_now += std::chrono::seconds(1);
        return m_now;
    };
}

std::vector<std::int64_t> QueryFacadeTests::createGenres(leafline::Engine &engine, int count)
{
    std::vector<std::int64_t> ids;
    for (int i = 1; i <= count; ++i) {
        ids.push_back(engine.library().createGenre("Genre " + std::to_string(i)));
    }
    return ids;
}

void QueryFacadeTests::testCursorPaging()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    const auto genres = createGenres(engine, 6);

    leafline::TimelineQuery query;
    query.limit = 3;
    const auto first = engine.facade().timeline(query);
    QCOMPARE(first.entries.size(), static_cast<size_t>(3));
    QCOMPARE(first.entries.front().entityId, genres.at(5));
    QVERIFY(first.nextCursor.has_value());
    QCOMPARE(first.nextCursor->id, first.entries.back().id);

    // Two entries after the cursor of the third-newest event: ranks 4 and 5.
    query.limit = 2;
    query.cursor = first.nextCursor;
    const auto second = engine.facade().timeline(query);
    QCOMPARE(second.entries.size(), static_cast<size_t>(2));
    QCOMPARE(second.entries.at(0).entityId, genres.at(2));
    QCOMPARE(second.entries.at(1).entityId, genres.at(1));
    QCOMPARE(QString::fromStdString(second.entries.at(0).title), QStringLiteral("Genre 3"));

    // The wire form of the cursor round-trips to the same page.
    query.cursor = leafline::parseCursor(leafline::encodeCursor(*first.nextCursor));
    const auto again = engine.facade().timeline(query);
    QCOMPARE(again.entries.at(0).id, second.entries.at(0).id);
}

void QueryFacadeTests::testLimitClamped()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    createGenres(engine, 4);

    leafline::TimelineQuery query;
    query.limit = 0;
    QCOMPARE(engine.facade().timeline(query).entries.size(), static_cast<size_t>(1));

    query.limit = -5;
    QCOMPARE(engine.facade().timeline(query).entries.size(), static_cast<size_t>(1));

    query.limit = 5000;
    const auto page = engine.facade().timeline(query);
    QCOMPARE(page.entries.size(), static_cast<size_t>(4));
    QVERIFY(!page.nextCursor.has_value());

    // No limit: the configured default page size.
    leafline::Config small = config();
    small.timelinePageSize = 2;
    leafline::Engine paged(small, clock());
    QCOMPARE(paged.facade().timeline(leafline::TimelineQuery{}).entries.size(),
             static_cast<size_t>(2));
}

void QueryFacadeTests::testExactPageEndsWithEmptyPage()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    createGenres(engine, 2);

    leafline::TimelineQuery query;
    query.limit = 2;
    const auto full = engine.facade().timeline(query);
    QVERIFY(full.nextCursor.has_value());

    query.cursor = full.nextCursor;
    const auto empty = engine.facade().timeline(query);
    QVERIFY(empty.entries.empty());
    QVERIFY(!empty.nextCursor.has_value());
}

void QueryFacadeTests::testMineScope()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    auto &library = engine.library();

    const auto ana = library.addUser("ana");
    const auto ben = library.addUser("ben");
    const auto book = library.createBook(leafline::NewBook{"Emma", {}, std::nullopt,
                                                           std::nullopt, std::nullopt,
                                                           std::nullopt});
    library.startReading(leafline::NewReading{ana, book, std::nullopt, std::nullopt});
    library.startReading(leafline::NewReading{ben, book, std::nullopt, std::nullopt});

    leafline::TimelineQuery query;
    query.scope = leafline::TimelineScope::Mine;
    query.userId = ana;
    const auto mine = engine.facade().timeline(query);
    QCOMPARE(mine.entries.size(), static_cast<size_t>(1));
    QCOMPARE(mine.entries.front().entityType, leafline::EntityType::Reading);
    QVERIFY(mine.entries.front().readingData.has_value());

    query.scope = leafline::TimelineScope::Global;
    QCOMPARE(engine.facade().timeline(query).entries.size(), static_cast<size_t>(3));

    query.scope = leafline::TimelineScope::Mine;
    query.userId.reset();
    bool threw = false;
    try {
        engine.facade().timeline(query);
    } catch (const leafline::ValidationError &) {
        threw = true;
    }
    QVERIFY(threw);
}

void QueryFacadeTests::testLazyStats()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    auto &library = engine.library();

    const auto ana = library.addUser("ana");
    const auto book = library.createBook(leafline::NewBook{"Emma", {}, std::nullopt,
                                                           std::nullopt, 474, std::nullopt});
    QCOMPARE(engine.statsCache().countForUser(ana), std::int64_t{0});

    const auto first = engine.facade().stats(ana);
    QCOMPARE(engine.statsCache().countForUser(ana), std::int64_t{1});
    QCOMPARE(first.data.get<leafline::CachedStats>().reading.booksAllTime, std::int64_t{0});

    // Served from the cache while nothing changed.
    const auto cached = engine.facade().stats(ana);
    QCOMPARE(QString::fromStdString(cached.computedAt), QString::fromStdString(first.computedAt));

    const auto reading = library.startReading(leafline::NewReading{ana, book, std::nullopt,
                                                                   std::nullopt});
    library.finishReading(reading, 5.0);
    QCOMPARE(engine.statsCache().countForUser(ana), std::int64_t{0});

    const auto fresh = engine.facade().stats(ana);
    QVERIFY(fresh.computedAt > first.computedAt);
    const auto data = fresh.data.get<leafline::CachedStats>();
    QCOMPARE(data.reading.booksAllTime, std::int64_t{1});
    QCOMPARE(*data.reading.averageRating, 5.0);

    bool threw = false;
    try {
        engine.facade().stats(ana + 100);
    } catch (const leafline::NotFoundError &) {
        threw = true;
    }
    QVERIFY(threw);
}

void QueryFacadeTests::testStatsForYear()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    auto &library = engine.library();

    const auto ana = library.addUser("ana");
    const auto book = library.createBook(leafline::NewBook{"Emma", {}, std::nullopt,
                                                           std::nullopt, 474, std::nullopt});
    const auto reading = library.startReading(leafline::NewReading{
        ana, book, std::nullopt, leafline::fromIso8601Utc("2022-06-01T12:00:00.000Z")});
    library.finishReading(reading, 3.5, leafline::fromIso8601Utc("2022-06-11T12:00:00.000Z"));

    const auto year = engine.facade().statsForYear(ana, 2022);
    QCOMPARE(year.userId, ana);
    QCOMPARE(year.data.get<leafline::CachedStats>().reading.booksAllTime, std::int64_t{1});
    // Year views are never cached.
    QCOMPARE(engine.statsCache().countForUser(ana), std::int64_t{0});

    const auto empty = engine.facade().statsForYear(ana, 2021);
    QCOMPARE(empty.data.get<leafline::CachedStats>().bookSummary.totalBooks, std::int64_t{0});

    const auto years = engine.facade().availableYears(ana);
    QCOMPARE(years.size(), static_cast<size_t>(1));
    QCOMPARE(years.front(), 2022);

    bool threw = false;
    try {
        engine.facade().statsForYear(ana + 100, 2022);
    } catch (const leafline::NotFoundError &) {
        threw = true;
    }
    QVERIFY(threw);
}

void QueryFacadeTests::testRebuildEntryPoints()
{
    resetDb();
    leafline::Config frozen = config();
    frozen.autoRefreshTimeline = false;
    leafline::Engine engine(frozen, clock());
    auto &library = engine.library();

    const auto genre = library.createGenre("SF");
    const auto book = library.createBook(leafline::NewBook{"Dune", {}, genre, std::nullopt,
                                                           std::nullopt, std::nullopt});
    library.renameGenre(genre, "Science Fiction");

    const auto targeted = engine.facade().refreshEntity({leafline::EntityType::Genre, genre});
    QCOMPARE(targeted.updated, 2);

    library.deleteBook(book);
    auto options = engine.defaultRebuildOptions();
    options.orphanPolicy = leafline::OrphanPolicy::Prune;
    const auto full = engine.facade().rebuild(options);
    QCOMPARE(full.orphaned, 1);
    QCOMPARE(full.updated, 0);

    leafline::TimelineQuery query;
    const auto page = engine.facade().timeline(query);
    QCOMPARE(page.entries.size(), static_cast<size_t>(2));
    for (const auto &entry : page.entries) {
        QCOMPARE(entry.entityType, leafline::EntityType::Genre);
        QCOMPARE(QString::fromStdString(entry.title), QStringLiteral("Science Fiction"));
    }
}

QTEST_MAIN(QueryFacadeTests)
#include "test_query_facade.moc"
