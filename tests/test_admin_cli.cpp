#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "admin/AdminCli.hpp"
#include "api/engine.hpp"
#include "common/json_utils.hpp"
#include "library/library_store.hpp"

class AdminCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testTimelineJson();
    void testStatsAndYearsJson();
    void testRebuildAndRefresh();
    void testMarkdownOutput();
    void testUsageErrors();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    void resetDb();
    std::filesystem::path dbPath() const;
    QString dbArg() const;
    int runCli(const QStringList &args, std::string &out);
    std::int64_t seedLibrary();
};

void AdminCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void AdminCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

std::filesystem::path AdminCliTests::dbPath() const
{
    return std::filesystem::path(m_tempDir.path().toStdString()) / "admin" / "leafline.db";
}

QString AdminCliTests::dbArg() const
{
    return QString::fromStdString(dbPath().string());
}

void AdminCliTests::resetDb()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
    std::filesystem::remove(dbPath().string() + "-wal", error);
    std::filesystem::remove(dbPath().string() + "-shm", error);
}

int AdminCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    leafline::AdminCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

// Seeds one finished reading and returns the reader's id.
std::int64_t AdminCliTests::seedLibrary()
{
    leafline::Config config;
    config.databasePath = dbPath().string();
    leafline::Engine engine(config);
    auto &library = engine.library();

    const auto user = library.addUser("ana");
    const auto genre = library.createGenre("Fantasy");
    const auto book = library.createBook(leafline::NewBook{"The Hobbit", {}, genre, std::nullopt,
                                                           310, 1937});
    const auto reading = library.startReading(leafline::NewReading{
        user, book, leafline::ReadingFormat::Physical,
        leafline::fromIso8601Utc("2023-07-01T12:00:00.000Z")});
    library.finishReading(reading, 5.0, leafline::fromIso8601Utc("2023-07-08T12:00:00.000Z"));
    return user;
}

void AdminCliTests::testTimelineJson()
{
    resetDb();
    const auto user = seedLibrary();

    std::string output;
    const int code = runCli({"leafline-admin", "timeline",
                             "--db", dbArg(),
                             "--user", QString::number(user),
                             "--limit", "1",
                             "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QVERIFY(parsed.is_object());
    QCOMPARE(parsed["events"].size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(parsed["events"][0]["title"].get<std::string>()),
             QStringLiteral("The Hobbit"));
    QVERIFY(parsed["next_cursor"].is_string());

    std::string nextOutput;
    QCOMPARE(runCli({"leafline-admin", "timeline",
                     "--db", dbArg(),
                     "--scope", "global",
                     "--cursor", QString::fromStdString(parsed["next_cursor"].get<std::string>()),
                     "--format", "json"}, nextOutput), 0);
    const auto next = nlohmann::json::parse(nextOutput);
    QVERIFY(!next["events"].empty());
    QVERIFY(next["events"][0]["id"].get<std::int64_t>()
            < parsed["events"][0]["id"].get<std::int64_t>());
}

void AdminCliTests::testStatsAndYearsJson()
{
    resetDb();
    const auto user = seedLibrary();

    std::string output;
    QCOMPARE(runCli({"leafline-admin", "stats",
                     "--db", dbArg(),
                     "--user", QString::number(user),
                     "--format", "json"}, output), 0);
    const auto stats = nlohmann::json::parse(output);
    QCOMPARE(stats["user_id"].get<std::int64_t>(), user);
    QCOMPARE(stats["data"]["reading"]["books_all_time"].get<std::int64_t>(), std::int64_t{1});
    QCOMPARE(stats["data"]["reading"]["pages_all_time"].get<std::int64_t>(), std::int64_t{310});
    QCOMPARE(QString::fromStdString(stats["data"]["book_summary"]["top_genre"].get<std::string>()),
             QStringLiteral("Fantasy"));

    std::string yearOutput;
    QCOMPARE(runCli({"leafline-admin", "stats",
                     "--db", dbArg(),
                     "--user", QString::number(user),
                     "--year", "2022",
                     "--format", "json"}, yearOutput), 0);
    const auto yearStats = nlohmann::json::parse(yearOutput);
    QCOMPARE(yearStats["data"]["reading"]["books_all_time"].get<std::int64_t>(), std::int64_t{0});

    std::string yearsOutput;
    QCOMPARE(runCli({"leafline-admin", "years",
                     "--db", dbArg(),
                     "--user", QString::number(user),
                     "--format", "json"}, yearsOutput), 0);
    const auto years = nlohmann::json::parse(yearsOutput);
    QCOMPARE(years["years"].size(), static_cast<size_t>(1));
    QCOMPARE(years["years"][0].get<int>(), 2023);
}

void AdminCliTests::testRebuildAndRefresh()
{
    resetDb();
    seedLibrary();

    std::string output;
    QCOMPARE(runCli({"leafline-admin", "rebuild",
                     "--db", dbArg(),
                     "--batch-size", "2",
                     "--orphans", "freeze",
                     "--format", "json"}, output), 0);
    const auto report = nlohmann::json::parse(output);
    QVERIFY(report["scanned"].get<int>() >= 4);
    QCOMPARE(report["errors"].get<int>(), 0);
    QCOMPARE(report["interrupted"].get<bool>(), false);

    std::string secondOutput;
    QCOMPARE(runCli({"leafline-admin", "rebuild",
                     "--db", dbArg(),
                     "--restart",
                     "--format", "json"}, secondOutput), 0);
    QCOMPARE(nlohmann::json::parse(secondOutput)["updated"].get<int>(), 0);

    std::string refreshOutput;
    QCOMPARE(runCli({"leafline-admin", "refresh",
                     "--db", dbArg(),
                     "--entity-type", "book",
                     "--entity-id", "1",
                     "--format", "json"}, refreshOutput), 0);
    const auto refresh = nlohmann::json::parse(refreshOutput);
    QCOMPARE(refresh["updated"].get<int>(), 0);
    QCOMPARE(refresh["errors"].get<int>(), 0);
}

void AdminCliTests::testMarkdownOutput()
{
    resetDb();
    const auto user = seedLibrary();

    std::string timeline;
    QCOMPARE(runCli({"leafline-admin", "timeline", "--db", dbArg()}, timeline), 0);
    QVERIFY(timeline.find("# Leafline Timeline (global)") != std::string::npos);
    QVERIFY(timeline.find("The Hobbit") != std::string::npos);

    std::string stats;
    QCOMPARE(runCli({"leafline-admin", "stats", "--db", dbArg(),
                     "--user", QString::number(user), "--refresh"}, stats), 0);
    QVERIFY(stats.find("## Library") != std::string::npos);
    QVERIFY(stats.find("- Top genre: Fantasy") != std::string::npos);

    std::string rebuild;
    QCOMPARE(runCli({"leafline-admin", "rebuild", "--db", dbArg()}, rebuild), 0);
    QVERIFY(rebuild.find("# Leafline Timeline Rebuild") != std::string::npos);
}

void AdminCliTests::testUsageErrors()
{
    resetDb();
    seedLibrary();

    std::string output;
    QCOMPARE(runCli({"leafline-admin"}, output), 1);
    QVERIFY(output.find("Usage:") != std::string::npos);

    QCOMPARE(runCli({"leafline-admin", "export", "--db", dbArg()}, output), 1);
    QCOMPARE(runCli({"leafline-admin", "stats", "--db", dbArg()}, output), 1);
    QCOMPARE(runCli({"leafline-admin", "timeline", "--db", dbArg(), "--format", "xml"}, output), 1);
    QVERIFY(output.find("Invalid format") != std::string::npos);
    QCOMPARE(runCli({"leafline-admin", "rebuild", "--db", dbArg(), "--batch-size", "0"}, output), 1);
    QCOMPARE(runCli({"leafline-admin", "refresh", "--db", dbArg(),
                     "--entity-type", "shelf", "--entity-id", "1"}, output), 1);

    // Unknown users surface as an error exit rather than an exception.
    QCOMPARE(runCli({"leafline-admin", "stats", "--db", dbArg(), "--user", "999"}, output), 1);
    QVERIFY(output.find("Error:") != std::string::npos);
}

QTEST_MAIN(AdminCliTests)
#include "test_admin_cli.moc"
