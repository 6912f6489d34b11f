#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <thread>

#include "api/engine.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "library/library_store.hpp"
#include "stats/stats_aggregator.hpp"
#include "stats/stats_cache.hpp"

namespace {

struct Library {
    std::int64_t ana = 0;
    std::int64_t ben = 0;
    std::int64_t dune = 0;
    std::int64_t emma = 0;
    std::int64_t persuasion = 0;
    std::int64_t middlemarch = 0;
    std::int64_t duneReading = 0;
};

std::chrono::system_clock::time_point at(const char *iso)
{
    return leafline::fromIso8601Utc(iso);
}

const leafline::NameCount *findName(const std::vector<leafline::NameCount> &rows,
                                    const std::string &name)
{
    for (const auto &row : rows) {
        if (row.first == name) {
            return &row;
        }
    }
    return nullptr;
}

} // namespace

class StatsAggregatorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testBookSummary();
    void testReadingStats();
    void testRefreshUpsertsSingleRow();
    void testRefreshUnknownUser();
    void testYearView();
    void testAvailableYears();
    void testConcurrentRefresh();
    void testRefreshSerializesWithMutations();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::chrono::system_clock::time_point m_now;

    void resetDb();
    std::filesystem::path dbPath() const;
    leafline::Config config() const;
    leafline::Clock clock();
    static Library populate(leafline::Engine &engine);
};

void StatsAggregatorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StatsAggregatorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path StatsAggregatorTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString())
        / ".local/share/leafline/leafline.db";
}

void StatsAggregatorTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(dbPath().string() + "-wal", error);
    std::filesystem::remove(dbPath().string() + "-shm", error);
    m_now = at("2024-05-01T09:00:00.000Z");
}

leafline::Config StatsAggregatorTests::config() const
{
    leafline::Config config;
    config.databasePath = dbPath().string();
    return config;
}

leafline::Clock StatsAggregatorTests::clock()
{
    return [this] {
        m_now += std::chrono::seconds(1);
        return m_now;
    };
}

// ana: Dune (read, 10 days, 4.5, eReader), Emma (read in 2023, 31 days,
// 4.0, physical), Persuasion (abandoned), Middlemarch (shelved, unread).
// ben: Dune (read, 3.0).
Library StatsAggregatorTests::populate(leafline::Engine &engine)
{
    auto &library = engine.library();
    Library ids;
    ids.ana = library.addUser("ana");
    ids.ben = library.addUser("ben");

    const auto herbert = library.createAuthor("Frank Herbert");
    const auto austen = library.createAuthor("Jane Austen");
    const auto scifi = library.createGenre("Science Fiction");
    const auto romance = library.createGenre("Romance");

    ids.dune = library.createBook(leafline::NewBook{"Dune", {herbert}, scifi, std::nullopt,
                                                    612, 1965});
    ids.emma = library.createBook(leafline::NewBook{"Emma", {austen}, romance, std::nullopt,
                                                    474, 1815});
    ids.persuasion = library.createBook(leafline::NewBook{"Persuasion", {austen}, romance,
                                                          std::nullopt, 249, 1817});
    ids.middlemarch = library.createBook(leafline::NewBook{"Middlemarch", {}, std::nullopt,
                                                           std::nullopt, 880, 1871});

    for (const auto book : {ids.dune, ids.emma, ids.persuasion, ids.middlemarch}) {
        library.shelveBook(ids.ana, book, leafline::Shelf::Library);
    }

    ids.duneReading = library.startReading(leafline::NewReading{
        ids.ana, ids.dune, leafline::ReadingFormat::EReader, at("2024-04-10T12:00:00.000Z")});
    library.finishReading(ids.duneReading, 4.5, at("2024-04-20T12:00:00.000Z"));

    const auto emmaReading = library.startReading(leafline::NewReading{
        ids.ana, ids.emma, leafline::ReadingFormat::Physical, at("2023-01-01T12:00:00.000Z")});
    library.finishReading(emmaReading, 4.0, at("2023-02-01T12:00:00.000Z"));

    const auto persuasionReading = library.startReading(leafline::NewReading{
        ids.ana, ids.persuasion, std::nullopt, at("2024-03-01T12:00:00.000Z")});
    library.abandonReading(persuasionReading);

    const auto benReading = library.startReading(leafline::NewReading{
        ids.ben, ids.dune, std::nullopt, at("2024-04-01T12:00:00.000Z")});
    library.finishReading(benReading, 3.0, at("2024-04-25T12:00:00.000Z"));
    return ids;
}

void StatsAggregatorTests::testBookSummary()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    const auto ids = populate(engine);

    const auto stats = engine.aggregator().compute(ids.ana).bookSummary;
    QCOMPARE(stats.totalBooks, std::int64_t{4});
    QCOMPARE(stats.totalAuthors, std::int64_t{2});
    QCOMPARE(stats.uniqueGenres, std::int64_t{2});
    QCOMPARE(QString::fromStdString(*stats.topGenre), QStringLiteral("Romance"));
    QCOMPARE(stats.maxGenreCount, std::int64_t{2});
    QCOMPARE(QString::fromStdString(*stats.topAuthor), QStringLiteral("Jane Austen"));

    QCOMPARE(QString::fromStdString(stats.longestBook->first), QStringLiteral("Middlemarch"));
    QCOMPARE(stats.longestBook->second, std::int64_t{880});
    QCOMPARE(QString::fromStdString(stats.shortestBook->first), QStringLiteral("Persuasion"));

    QCOMPARE(stats.pageCountDistribution.size(), static_cast<size_t>(3));
    QCOMPARE(QString::fromStdString(stats.pageCountDistribution.at(0).first),
             QStringLiteral("200 - 350"));
    QCOMPARE(findName(stats.pageCountDistribution, "500+")->second, std::int64_t{2});

    QVERIFY(findName(stats.yearPublishedDistribution, "1810s") != nullptr);
    QCOMPARE(findName(stats.yearPublishedDistribution, "1810s")->second, std::int64_t{2});

    // Finished readings only: Dune and Emma.
    QCOMPARE(stats.topAuthors.size(), static_cast<size_t>(2));

    const auto ben = engine.aggregator().compute(ids.ben).bookSummary;
    QCOMPARE(ben.totalBooks, std::int64_t{0});
    QVERIFY(!ben.topGenre.has_value());
    QVERIFY(!ben.longestBook.has_value());
}

void StatsAggregatorTests::testReadingStats()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    const auto ids = populate(engine);

    const auto stats = engine.aggregator().compute(ids.ana).reading;
    QCOMPARE(stats.booksAllTime, std::int64_t{2});
    QCOMPARE(stats.pagesAllTime, std::int64_t{1086});
    QCOMPARE(stats.booksLast30Days, std::int64_t{1});
    QCOMPARE(stats.pagesLast30Days, std::int64_t{612});
    QCOMPARE(stats.booksInProgress, std::int64_t{0});
    QCOMPARE(stats.booksOnShelf, std::int64_t{1});
    QCOMPARE(stats.booksOnWishlist, std::int64_t{0});
    QCOMPARE(stats.booksAbandoned, std::int64_t{1});
    QCOMPARE(*stats.averageRating, 4.25);
    QCOMPARE(*stats.averageDaysToFinish, 20.5);

    QCOMPARE(stats.ratingDistribution.size(), static_cast<size_t>(2));
    QCOMPARE(stats.ratingDistribution.front().first, 4.0);

    QCOMPARE(stats.monthlyBooks.size(), static_cast<size_t>(12));
    QCOMPARE(QString::fromStdString(stats.monthlyBooks.at(3).first), QStringLiteral("Apr"));
    QCOMPARE(stats.monthlyBooks.at(3).second, std::int64_t{1});
    QCOMPARE(stats.monthlyBooks.at(1).second, std::int64_t{0});

    QCOMPARE(stats.yearlyBooks.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(stats.yearlyBooks.front().first), QStringLiteral("2023"));

    QCOMPARE(stats.paceDistribution.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(stats.paceDistribution.at(0).first), QStringLiteral("Medium"));
    QCOMPARE(QString::fromStdString(stats.paceDistribution.at(1).first), QStringLiteral("Fast"));

    QCOMPARE(stats.formatCounts.size(), static_cast<size_t>(2));
    QVERIFY(findName(stats.formatCounts, "eReader") != nullptr);

    // A rating change is picked up on the next full computation.
    engine.library().rateReading(ids.duneReading, 2.0);
    QCOMPARE(*engine.aggregator().compute(ids.ana).reading.averageRating, 3.0);
}

void StatsAggregatorTests::testRefreshUpsertsSingleRow()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    const auto ids = populate(engine);

    const auto first = engine.aggregator().refresh(ids.ana);
    QVERIFY(!first.computedAt.empty());
    QCOMPARE(engine.statsCache().countForUser(ids.ana), std::int64_t{1});

    const auto second = engine.aggregator().refresh(ids.ana);
    QCOMPARE(engine.statsCache().countForUser(ids.ana), std::int64_t{1});
    QVERIFY(second.computedAt > first.computedAt);

    const auto cached = engine.statsCache().get(ids.ana);
    QVERIFY(cached.has_value());
    QCOMPARE(QString::fromStdString(cached->computedAt), QString::fromStdString(second.computedAt));
    const auto data = cached->data.get<leafline::CachedStats>();
    QCOMPARE(data.reading.booksAllTime, std::int64_t{2});
    QCOMPARE(data.bookSummary.totalBooks, std::int64_t{4});
}

void StatsAggregatorTests::testRefreshUnknownUser()
{
    resetDb();
    leafline::Engine engine(config(), clock());

    bool threw = false;
    try {
        engine.aggregator().refresh(999);
    } catch (const leafline::NotFoundError &) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(engine.statsCache().countForUser(999), std::int64_t{0});
}

void StatsAggregatorTests::testYearView()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    const auto ids = populate(engine);

    const auto year = engine.aggregator().computeForYear(ids.ana, 2023);
    QCOMPARE(year.bookSummary.totalBooks, std::int64_t{1});
    QCOMPARE(QString::fromStdString(*year.bookSummary.topGenre), QStringLiteral("Romance"));
    QCOMPARE(year.reading.booksAllTime, std::int64_t{1});
    QCOMPARE(*year.reading.averageRating, 4.0);
    QCOMPARE(year.reading.booksAbandoned, std::int64_t{0});
    QCOMPARE(year.reading.monthlyBooks.at(1).second, std::int64_t{1});
    QCOMPARE(year.bookSummary.topAuthors.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(year.bookSummary.topAuthors.front().first),
             QStringLiteral("Jane Austen"));
}

void StatsAggregatorTests::testAvailableYears()
{
    resetDb();
    leafline::Engine engine(config(), clock());
    const auto ids = populate(engine);

    const auto years = engine.aggregator().availableYears(ids.ana);
    QCOMPARE(years.size(), static_cast<size_t>(2));
    QCOMPARE(years.at(0), 2024);
    QCOMPARE(years.at(1), 2023);

    QCOMPARE(engine.aggregator().availableYears(ids.ben).size(), static_cast<size_t>(1));

    bool threw = false;
    try {
        engine.aggregator().computeForYear(ids.ana, 0);
    } catch (const leafline::ValidationError &) {
        threw = true;
    }
    QVERIFY(threw);
}

void StatsAggregatorTests::testConcurrentRefresh()
{
    resetDb();
    Library ids;
    {
        leafline::Engine setup(config(), clock());
        ids = populate(setup);
    }

    // One connection per thread on the same file.
    leafline::Engine first(config());
    leafline::Engine second(config());

    std::mutex errorMutex;
    QStringList errors;
    auto worker = [&](leafline::Engine &engine) {
        for (int i = 0; i < 10; ++i) {
            try {
                engine.aggregator().refresh(ids.ana);
            } catch (const std::exception &error) {
                std::lock_guard<std::mutex> lock(errorMutex);
                errors.push_back(QString::fromUtf8(error.what()));
            }
        }
    };

    std::thread a(worker, std::ref(first));
    std::thread b(worker, std::ref(second));
    a.join();
    b.join();

    QVERIFY2(errors.isEmpty(), qPrintable(errors.join(QStringLiteral("; "))));
    QCOMPARE(first.statsCache().countForUser(ids.ana), std::int64_t{1});

    const auto cached = second.statsCache().get(ids.ana);
    QVERIFY(cached.has_value());
    const auto data = cached->data.get<leafline::CachedStats>();
    QCOMPARE(data.reading.booksAllTime, std::int64_t{2});
    QCOMPARE(data.bookSummary.totalBooks, std::int64_t{4});
    QCOMPARE(QString::fromStdString(data.computedAt), QString::fromStdString(cached->computedAt));
}

void StatsAggregatorTests::testRefreshSerializesWithMutations()
{
    resetDb();
    Library ids;
    std::int64_t pending = 0;
    {
        leafline::Engine setup(config(), clock());
        ids = populate(setup);
        pending = setup.library().startReading(leafline::NewReading{
            ids.ana, ids.middlemarch, std::nullopt, at("2024-04-21T12:00:00.000Z")});
    }

    leafline::Config writerConfig = config();
    writerConfig.busyTimeoutMs = 50;
    leafline::Engine writer(writerConfig);

    // The refresh reads its clock once it is under way; a second connection
    // tries to finish a reading at that moment.
    bool armed = false;
    bool writerBlocked = false;
    leafline::Engine refresher(config(), [&] {
        if (armed) {
            armed = false;
            try {
                writer.library().finishReading(pending, 4.0, at("2024-04-28T12:00:00.000Z"));
            } catch (const leafline::StorageError &) {
                writerBlocked = true;
            }
        }
        return at("2024-05-01T12:00:00.000Z");
    });

    armed = true;
    const auto during = refresher.aggregator().refresh(ids.ana);
    QVERIFY(!armed);
    QVERIFY(writerBlocked);
    QCOMPARE(during.data.get<leafline::CachedStats>().reading.booksAllTime, std::int64_t{2});

    // Retried after the refresh committed, the mutation invalidates the row it wrote.
    writer.library().finishReading(pending, 4.0, at("2024-04-28T12:00:00.000Z"));
    QCOMPARE(refresher.statsCache().countForUser(ids.ana), std::int64_t{0});

    const auto after = refresher.facade().stats(ids.ana);
    QCOMPARE(after.data.get<leafline::CachedStats>().reading.booksAllTime, std::int64_t{3});
}

QTEST_MAIN(StatsAggregatorTests)
#include "test_stats_aggregator.moc"
