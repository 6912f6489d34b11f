#include "admin/AdminCli.hpp"

#include <iostream>

#include <QDateTime>

#include "api/engine.hpp"
#include "api/query_facade.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"

namespace leafline {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  leafline-admin rebuild [--batch-size N] [--orphans freeze|prune] [--restart]"
        " [--format markdown|json]\n"
        "  leafline-admin timeline [--scope mine|global] [--user ID] [--limit N]"
        " [--cursor CURSOR] [--format markdown|json]\n"
        "  leafline-admin stats --user ID [--year YYYY] [--refresh] [--format markdown|json]\n"
        "  leafline-admin refresh --entity-type book|author|genre|reading --entity-id ID"
        " [--orphans freeze|prune] [--format markdown|json]\n"
        "  leafline-admin years --user ID [--format markdown|json]\n"
        "Every command accepts --db PATH.\n");
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(toEpochMillis(timestamp), Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm").toStdString();
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

bool isValidFormat(const QString &format)
{
    return format == QStringLiteral("markdown") || format == QStringLiteral("json");
}

std::optional<OrphanPolicy> getOrphanPolicy(const QStringList &args, OrphanPolicy fallback)
{
    const QString value = getArgValue(args, QStringLiteral("--orphans"));
    if (value.isEmpty()) {
        return fallback;
    }
    return parseOrphanPolicyString(value.toLower().toStdString());
}

void renderReportMarkdown(const RebuildReport &report, const std::string &title)
{
    std::cout << "# " << title << "\n\n";
    std::cout << "- Events scanned: " << report.scanned << "\n";
    std::cout << "- Payloads updated: " << report.updated << "\n";
    std::cout << "- Orphaned events: " << report.orphaned << "\n";
    std::cout << "- Errors: " << report.errors << "\n";
    if (report.interrupted) {
        std::cout << "\nRebuild was interrupted; rerun to resume.\n";
    }
}

void renderTimelineMarkdown(const TimelinePage &page, TimelineScope scope)
{
    std::cout << "# Leafline Timeline (" << toScopeString(scope) << ")\n\n";
    if (page.entries.empty()) {
        std::cout << "No events.\n";
        return;
    }

    for (const auto &entry : page.entries) {
        std::cout << "- [" << formatLocalTime(entry.occurredAt) << "] ("
                  << toEntityTypeString(entry.entityType) << ", "
                  << entry.action << ") " << entry.title << "\n";
        for (const auto &detail : entry.details) {
            std::cout << "  - " << detail.label << ": " << detail.value << "\n";
        }
    }

    if (page.nextCursor.has_value()) {
        std::cout << "\nNext page: --cursor " << encodeCursor(*page.nextCursor) << "\n";
    }
}

void renderNameCounts(const char *heading, const std::vector<NameCount> &counts)
{
    if (counts.empty()) {
        return;
    }
    std::cout << "\n## " << heading << "\n\n";
    for (const auto &[name, count] : counts) {
        std::cout << "- " << name << ": " << count << "\n";
    }
}

void renderStatsMarkdown(const StatsCacheEntry &entry, std::optional<int> year)
{
    const CachedStats stats = entry.data.get<CachedStats>();
    const BookSummaryStats &books = stats.bookSummary;
    const ReadingStats &reading = stats.reading;

    std::cout << "# Leafline Statistics for user " << entry.userId;
    if (year.has_value()) {
        std::cout << " (" << *year << ")";
    }
    std::cout << "\n\n";
    std::cout << "Computed at: " << entry.computedAt << "\n\n";

    std::cout << "## Library\n\n";
    std::cout << "- Books: " << books.totalBooks << "\n";
    std::cout << "- Authors: " << books.totalAuthors << "\n";
    std::cout << "- Genres: " << books.uniqueGenres << "\n";
    if (books.topGenre.has_value()) {
        std::cout << "- Top genre: " << *books.topGenre << "\n";
    }
    if (books.topAuthor.has_value()) {
        std::cout << "- Top author: " << *books.topAuthor << "\n";
    }
    if (books.longestBook.has_value()) {
        std::cout << "- Longest book: " << books.longestBook->first << " ("
                  << books.longestBook->second << " pages)\n";
    }
    if (books.shortestBook.has_value()) {
        std::cout << "- Shortest book: " << books.shortestBook->first << " ("
                  << books.shortestBook->second << " pages)\n";
    }

    std::cout << "\n## Reading\n\n";
    if (!year.has_value()) {
        std::cout << "- Books in the last 30 days: " << reading.booksLast30Days << "\n";
        std::cout << "- Pages in the last 30 days: " << reading.pagesLast30Days << "\n";
    }
    std::cout << "- Books finished: " << reading.booksAllTime << "\n";
    std::cout << "- Pages read: " << reading.pagesAllTime << "\n";
    if (!year.has_value()) {
        std::cout << "- In progress: " << reading.booksInProgress << "\n";
        std::cout << "- On shelf: " << reading.booksOnShelf << "\n";
        std::cout << "- Wishlist: " << reading.booksOnWishlist << "\n";
    }
    std::cout << "- Abandoned: " << reading.booksAbandoned << "\n";
    if (reading.averageRating.has_value()) {
        std::cout << "- Average rating: " << *reading.averageRating << "\n";
    }
    if (reading.averageDaysToFinish.has_value()) {
        std::cout << "- Average days to finish: " << *reading.averageDaysToFinish << "\n";
    }

    renderNameCounts("Genres", books.genreCounts);
    renderNameCounts("Top Authors", books.topAuthors);
    renderNameCounts("Monthly Books", reading.monthlyBooks);
    renderNameCounts("Yearly Books", reading.yearlyBooks);
    renderNameCounts("Pace", reading.paceDistribution);
    renderNameCounts("Formats", reading.formatCounts);
}

} // namespace

int AdminCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    LLOG_INFO(QStringLiteral("AdminCli"),
              QStringLiteral("run"),
              QStringLiteral("admin_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("rebuild")) {
            return runRebuild(args);
        }
        if (command == QStringLiteral("timeline")) {
            return runTimeline(args);
        }
        if (command == QStringLiteral("stats")) {
            return runStats(args);
        }
        if (command == QStringLiteral("refresh")) {
            return runRefresh(args);
        }
        if (command == QStringLiteral("years")) {
            return runYears(args);
        }
    } catch (const std::exception &ex) {
        LLOG_ERROR(QStringLiteral("AdminCli"),
                   QStringLiteral("run"),
                   QStringLiteral("admin_cli_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("cli"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"command", command.toStdString()}, {"what", ex.what()}}));
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int AdminCli::runRebuild(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    Engine engine(loadConfig(args));
    RebuildOptions options = engine.defaultRebuildOptions();

    const QString batchValue = getArgValue(args, QStringLiteral("--batch-size"));
    if (!batchValue.isEmpty()) {
        const auto batch = parseInteger(batchValue);
        if (!batch.has_value() || *batch <= 0) {
            std::cerr << "Invalid --batch-size." << std::endl;
            return 1;
        }
        options.batchSize = static_cast<int>(*batch);
    }

    const auto policy = getOrphanPolicy(args, options.orphanPolicy);
    if (!policy.has_value()) {
        std::cerr << "Invalid --orphans. Use freeze or prune." << std::endl;
        return 1;
    }
    options.orphanPolicy = *policy;
    options.restart = args.contains(QStringLiteral("--restart"));

    const RebuildReport report = engine.facade().rebuild(options);

    LLOG_INFO(QStringLiteral("AdminCli"),
              QStringLiteral("runRebuild"),
              QStringLiteral("admin_rebuild"),
              QStringLiteral("user_invocation"),
              QStringLiteral("batched_rebuild"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"report", report}, {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
    } else {
        renderReportMarkdown(report, "Leafline Timeline Rebuild");
    }
    return report.errors == 0 ? 0 : 2;
}

int AdminCli::runTimeline(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    TimelineQuery query;
    const QString userValue = getArgValue(args, QStringLiteral("--user"));
    if (!userValue.isEmpty()) {
        const auto user = parseInteger(userValue);
        if (!user.has_value()) {
            std::cerr << "Invalid --user." << std::endl;
            return 1;
        }
        query.userId = *user;
    }

    const QString scopeValue = getArgValue(args, QStringLiteral("--scope"));
    if (scopeValue.isEmpty()) {
        query.scope = query.userId.has_value() ? TimelineScope::Mine : TimelineScope::Global;
    } else {
        const auto scope = parseScopeString(scopeValue.toLower().toStdString());
        if (!scope.has_value()) {
            std::cerr << "Invalid --scope. Use mine or global." << std::endl;
            return 1;
        }
        query.scope = *scope;
    }

    const QString limitValue = getArgValue(args, QStringLiteral("--limit"));
    if (!limitValue.isEmpty()) {
        const auto limit = parseInteger(limitValue);
        if (!limit.has_value()) {
            std::cerr << "Invalid --limit." << std::endl;
            return 1;
        }
        query.limit = static_cast<int>(*limit);
    }

    const QString cursorValue = getArgValue(args, QStringLiteral("--cursor"));
    if (!cursorValue.isEmpty()) {
        query.cursor = parseCursor(cursorValue.toStdString());
        if (!query.cursor.has_value()) {
            std::cerr << "Invalid --cursor." << std::endl;
            return 1;
        }
    }

    Engine engine(loadConfig(args));
    const TimelinePage page = engine.facade().timeline(query);

    LLOG_INFO(QStringLiteral("AdminCli"),
              QStringLiteral("runTimeline"),
              QStringLiteral("admin_timeline"),
              QStringLiteral("user_invocation"),
              QStringLiteral("sqlite_query"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"events", page.entries.size()},
                             {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(page).dump(2) << std::endl;
    } else {
        renderTimelineMarkdown(page, query.scope);
    }
    return 0;
}

int AdminCli::runStats(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const auto user = parseInteger(getArgValue(args, QStringLiteral("--user")));
    if (!user.has_value()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::optional<int> year;
    const QString yearValue = getArgValue(args, QStringLiteral("--year"));
    if (!yearValue.isEmpty()) {
        const auto parsed = parseInteger(yearValue);
        if (!parsed.has_value()) {
            std::cerr << "Invalid --year." << std::endl;
            return 1;
        }
        year = static_cast<int>(*parsed);
    }

    Engine engine(loadConfig(args));
    StatsCacheEntry entry;
    if (year.has_value()) {
        entry = engine.facade().statsForYear(*user, *year);
    } else if (args.contains(QStringLiteral("--refresh"))) {
        entry = engine.aggregator().refresh(*user);
    } else {
        entry = engine.facade().stats(*user);
    }

    LLOG_INFO(QStringLiteral("AdminCli"),
              QStringLiteral("runStats"),
              QStringLiteral("admin_stats"),
              QStringLiteral("user_invocation"),
              QStringLiteral("stats_cache"),
              logging::userWho(*user),
              QString(),
              (nlohmann::json{{"year", year.has_value() ? nlohmann::json(*year) : nlohmann::json()},
                             {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(entry).dump(2) << std::endl;
    } else {
        renderStatsMarkdown(entry, year);
    }
    return 0;
}

int AdminCli::runRefresh(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const auto type =
        parseEntityTypeString(getArgValue(args, QStringLiteral("--entity-type")).toLower().toStdString());
    const auto id = parseInteger(getArgValue(args, QStringLiteral("--entity-id")));
    if (!type.has_value() || !id.has_value()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    Engine engine(loadConfig(args));
    const auto policy = getOrphanPolicy(args, engine.config().orphanPolicy);
    if (!policy.has_value()) {
        std::cerr << "Invalid --orphans. Use freeze or prune." << std::endl;
        return 1;
    }

    const EntityKey key{*type, *id};
    const RebuildReport report = engine.facade().refreshEntity(key, *policy);

    LLOG_INFO(QStringLiteral("AdminCli"),
              QStringLiteral("runRefresh"),
              QStringLiteral("admin_refresh"),
              QStringLiteral("user_invocation"),
              QStringLiteral("targeted_refresh"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"entity", encodeEntityKey(key)}, {"report", report}}));
    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(report).dump(2) << std::endl;
    } else {
        renderReportMarkdown(report, "Leafline Refresh of " + encodeEntityKey(key));
    }
    return report.errors == 0 ? 0 : 2;
}

int AdminCli::runYears(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!isValidFormat(format)) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const auto user = parseInteger(getArgValue(args, QStringLiteral("--user")));
    if (!user.has_value()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    Engine engine(loadConfig(args));
    const std::vector<int> years = engine.facade().availableYears(*user);

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json{{"user_id", *user}, {"years", years}}.dump(2) << std::endl;
        return 0;
    }

    std::cout << "# Reading years for user " << *user << "\n\n";
    if (years.empty()) {
        std::cout << "No finished readings.\n";
    }
    for (const int year : years) {
        std::cout << "- " << year << "\n";
    }
    return 0;
}

Config AdminCli::loadConfig(const QStringList &args) const
{
    Config config = Config::fromEnvironment();
    const QString dbPath = getArgValue(args, QStringLiteral("--db"));
    if (!dbPath.isEmpty()) {
        config.databasePath = dbPath.toStdString();
    }
    return config;
}

std::optional<long long> AdminCli::parseInteger(const QString &value) const
{
    bool ok = false;
    const long long parsed = value.toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace leafline
