#include "stats/stats_aggregator.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "stats/stats_cache.hpp"
#include "store/database.hpp"
#include "store/sqlite_utils.hpp"

namespace leafline {

namespace {

// Every query binds the user as ?1. Queries that mention ?2 get the
// second argument as text: a four-digit year or an ISO-8601 cutoff.
struct QueryArgs {
    std::int64_t userId = 0;
    std::optional<std::string> second;
};

constexpr const char *kLibraryBooks =
    "WITH scope_books AS ("
    "    SELECT book_id FROM user_books WHERE user_id = ?1 AND shelf = 'library'"
    ") ";

constexpr const char *kYearBooks =
    "WITH scope_books AS ("
    "    SELECT DISTINCT book_id FROM readings"
    "    WHERE user_id = ?1 AND status = 'read' AND strftime('%Y', finished_at) = ?2"
    ") ";

void bindArgs(sqlite3_stmt *stmt, const QueryArgs &args)
{
    sqlite3_bind_int64(stmt, 1, args.userId);
    if (args.second.has_value()) {
        sqlite::bindText(stmt, 2, *args.second);
    }
}

std::int64_t scalarInt(sqlite3 *db, const std::string &sql, const QueryArgs &args)
{
    sqlite::Statement stmt(db, sql);
    bindArgs(stmt.get(), args);
    if (!stmt.step()) {
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::optional<double> scalarDouble(sqlite3 *db, const std::string &sql, const QueryArgs &args)
{
    sqlite::Statement stmt(db, sql);
    bindArgs(stmt.get(), args);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return sqlite::columnOptionalDouble(stmt.get(), 0);
}

std::vector<NameCount> nameCounts(sqlite3 *db, const std::string &sql, const QueryArgs &args)
{
    sqlite::Statement stmt(db, sql);
    bindArgs(stmt.get(), args);

    std::vector<NameCount> rows;
    while (stmt.step()) {
        rows.emplace_back(sqlite::columnText(stmt.get(), 0), sqlite3_column_int64(stmt.get(), 1));
    }
    return rows;
}

std::optional<NameCount> firstNameCount(sqlite3 *db, const std::string &sql, const QueryArgs &args)
{
    auto rows = nameCounts(db, sql, args);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.front();
}

// " AND strftime('%Y', <column>) = ?2" when the view is limited to a year.
std::string yearFilter(const QueryArgs &args, const char *column)
{
    if (!args.second.has_value()) {
        return {};
    }
    return std::string(" AND strftime('%Y', ") + column + ") = ?2";
}

std::string yearString(int year)
{
    std::string value = std::to_string(year);
    while (value.size() < 4) {
        value.insert(value.begin(), '0');
    }
    return value;
}

BookSummaryStats bookSummary(sqlite3 *db, const QueryArgs &args)
{
    const std::string cte = args.second.has_value() ? kYearBooks : kLibraryBooks;
    BookSummaryStats stats;

    stats.totalBooks = scalarInt(db, cte + "SELECT COUNT(*) FROM scope_books;", args);
    stats.totalAuthors = scalarInt(db,
                                   cte + "SELECT COUNT(DISTINCT ba.author_id) FROM scope_books sb"
                                         " JOIN book_authors ba ON ba.book_id = sb.book_id;",
                                   args);

    stats.genreCounts = nameCounts(db,
                                   cte + "SELECT g.name, COUNT(*) AS count FROM scope_books sb"
                                         " JOIN books b ON b.id = sb.book_id"
                                         " JOIN genres g"
                                         "   ON g.id IN (b.primary_genre_id, b.secondary_genre_id)"
                                         " GROUP BY g.id ORDER BY count DESC, g.name ASC;",
                                   args);
    stats.uniqueGenres = static_cast<std::int64_t>(stats.genreCounts.size());
    if (!stats.genreCounts.empty()) {
        stats.topGenre = stats.genreCounts.front().first;
    }
    for (const auto &entry : stats.genreCounts) {
        stats.maxGenreCount = std::max(stats.maxGenreCount, entry.second);
    }

    const auto topAuthor =
        firstNameCount(db,
                       cte + "SELECT a.name, COUNT(*) AS count FROM scope_books sb"
                             " JOIN book_authors ba ON ba.book_id = sb.book_id"
                             " JOIN authors a ON a.id = ba.author_id"
                             " GROUP BY a.id ORDER BY count DESC, a.name ASC LIMIT 1;",
                       args);
    if (topAuthor.has_value()) {
        stats.topAuthor = topAuthor->first;
    }

    stats.pageCountDistribution =
        nameCounts(db,
                   cte + "SELECT CASE"
                         "   WHEN b.page_count < 200 THEN '< 200'"
                         "   WHEN b.page_count <= 350 THEN '200 - 350'"
                         "   WHEN b.page_count <= 500 THEN '350 - 500'"
                         "   ELSE '500+'"
                         " END AS name, COUNT(*) AS count"
                         " FROM scope_books sb JOIN books b ON b.id = sb.book_id"
                         " WHERE b.page_count IS NOT NULL"
                         " GROUP BY name ORDER BY MIN(b.page_count);",
                   args);

    stats.yearPublishedDistribution =
        nameCounts(db,
                   cte + "SELECT (b.year_published / 10 * 10) || 's' AS name, COUNT(*) AS count"
                         " FROM scope_books sb JOIN books b ON b.id = sb.book_id"
                         " WHERE b.year_published IS NOT NULL"
                         " GROUP BY b.year_published / 10 ORDER BY count DESC, name ASC;",
                   args);

    stats.topAuthors =
        nameCounts(db,
                   "SELECT a.name, COUNT(*) AS count FROM readings r"
                   " JOIN book_authors ba ON ba.book_id = r.book_id"
                   " JOIN authors a ON a.id = ba.author_id"
                   " WHERE r.user_id = ?1 AND r.status = 'read'"
                       + yearFilter(args, "r.finished_at")
                       + " GROUP BY a.id ORDER BY count DESC, a.name ASC LIMIT 13;",
                   args);

    stats.longestBook =
        firstNameCount(db,
                       cte + "SELECT b.title, b.page_count FROM scope_books sb"
                             " JOIN books b ON b.id = sb.book_id"
                             " WHERE b.page_count IS NOT NULL"
                             " ORDER BY b.page_count DESC, b.title ASC LIMIT 1;",
                       args);
    stats.shortestBook =
        firstNameCount(db,
                       cte + "SELECT b.title, b.page_count FROM scope_books sb"
                             " JOIN books b ON b.id = sb.book_id"
                             " WHERE b.page_count IS NOT NULL"
                             " ORDER BY b.page_count ASC, b.title ASC LIMIT 1;",
                       args);
    return stats;
}

// Counters shared by the all-time and per-year views. `monthYear` selects the
// year of the monthly histogram.
ReadingStats readingStats(sqlite3 *db, const QueryArgs &args, const std::string &monthYear)
{
    ReadingStats stats;
    const std::string finished = yearFilter(args, "finished_at");
    const std::string readingFinished = yearFilter(args, "r.finished_at");

    stats.booksAllTime = scalarInt(db,
                                   "SELECT COUNT(*) FROM readings"
                                   " WHERE user_id = ?1 AND status = 'read'" + finished + ";",
                                   args);
    stats.pagesAllTime = scalarInt(db,
                                   "SELECT COALESCE(SUM(bk.page_count), 0) FROM readings r"
                                   " JOIN books bk ON bk.id = r.book_id"
                                   " WHERE r.user_id = ?1 AND r.status = 'read'"
                                   " AND bk.page_count IS NOT NULL" + readingFinished + ";",
                                   args);
    stats.averageRating = scalarDouble(db,
                                       "SELECT AVG(rating) FROM readings"
                                       " WHERE user_id = ?1 AND status = 'read'"
                                       " AND rating IS NOT NULL" + finished + ";",
                                       args);
    stats.averageDaysToFinish =
        scalarDouble(db,
                     "SELECT AVG(julianday(finished_at) - julianday(started_at)) FROM readings"
                     " WHERE user_id = ?1 AND status = 'read'"
                     " AND started_at IS NOT NULL AND finished_at IS NOT NULL" + finished + ";",
                     args);

    {
        sqlite::Statement stmt(db,
                               "SELECT rating, COUNT(*) FROM readings"
                               " WHERE user_id = ?1 AND status = 'read' AND rating IS NOT NULL"
                                   + finished + " GROUP BY rating ORDER BY rating;");
        bindArgs(stmt.get(), args);
        while (stmt.step()) {
            stats.ratingDistribution.emplace_back(sqlite3_column_double(stmt.get(), 0),
                                                  sqlite3_column_int64(stmt.get(), 1));
        }
    }

    stats.monthlyBooks =
        nameCounts(db,
                   "WITH months(m) AS ("
                   "    VALUES (1), (2), (3), (4), (5), (6), (7), (8), (9), (10), (11), (12)"
                   ")"
                   " SELECT CASE m"
                   "   WHEN 1 THEN 'Jan' WHEN 2 THEN 'Feb' WHEN 3 THEN 'Mar'"
                   "   WHEN 4 THEN 'Apr' WHEN 5 THEN 'May' WHEN 6 THEN 'Jun'"
                   "   WHEN 7 THEN 'Jul' WHEN 8 THEN 'Aug' WHEN 9 THEN 'Sep'"
                   "   WHEN 10 THEN 'Oct' WHEN 11 THEN 'Nov' WHEN 12 THEN 'Dec'"
                   " END AS name, COUNT(r.id) AS count"
                   " FROM months LEFT JOIN readings r"
                   "   ON CAST(strftime('%m', r.finished_at) AS INTEGER) = m"
                   "   AND strftime('%Y', r.finished_at) = ?2"
                   "   AND r.status = 'read' AND r.user_id = ?1"
                   " GROUP BY m ORDER BY m;",
                   QueryArgs{args.userId, monthYear});

    stats.paceDistribution =
        nameCounts(db,
                   "SELECT pace, COUNT(*) FROM ("
                   "  SELECT CASE"
                   "    WHEN bk.page_count * 1.0"
                   "         / MAX(1, julianday(r.finished_at) - julianday(r.started_at)) < 15"
                   "      THEN 'Slow'"
                   "    WHEN bk.page_count * 1.0"
                   "         / MAX(1, julianday(r.finished_at) - julianday(r.started_at)) <= 40"
                   "      THEN 'Medium'"
                   "    ELSE 'Fast'"
                   "  END AS pace"
                   "  FROM readings r JOIN books bk ON bk.id = r.book_id"
                   "  WHERE r.user_id = ?1 AND r.status = 'read'"
                   "    AND r.started_at IS NOT NULL AND r.finished_at IS NOT NULL"
                   "    AND bk.page_count IS NOT NULL"
                   "    AND julianday(r.finished_at) >= julianday(r.started_at)"
                       + readingFinished
                       + ") GROUP BY pace"
                         " ORDER BY CASE pace WHEN 'Slow' THEN 1 WHEN 'Medium' THEN 2 ELSE 3 END;",
                   args);

    stats.formatCounts =
        nameCounts(db,
                   "SELECT CASE format"
                   "   WHEN 'physical' THEN 'Physical'"
                   "   WHEN 'ereader' THEN 'eReader'"
                   "   WHEN 'audiobook' THEN 'Audiobook'"
                   " END AS name, COUNT(*) AS count FROM readings"
                   " WHERE user_id = ?1 AND status = 'read' AND format IS NOT NULL"
                       + finished + " GROUP BY format ORDER BY count DESC, name ASC;",
                   args);

    stats.booksAbandoned = scalarInt(db,
                                     "SELECT COUNT(*) FROM readings"
                                     " WHERE user_id = ?1 AND status = 'abandoned'"
                                         + yearFilter(args, "started_at") + ";",
                                     args);
    return stats;
}

} // namespace

StatsAggregator::StatsAggregator(Database &db, StatsCache &cache, Clock clock)
    : m_db(db)
    , m_cache(cache)
    , m_clock(std::move(clock))
{
}

StatsCacheEntry StatsAggregator::refresh(std::int64_t userId)
{
    const auto started = std::chrono::steady_clock::now();

    // The reads and the upsert share one write transaction, so a mutation
    // (and its invalidation) commits either before the reads or after the
    // upsert, never in between.
    Transaction tx(m_db);
    if (!userExists(userId)) {
        throw NotFoundError("user " + std::to_string(userId) + " not found");
    }
    const CachedStats stats = computeInTransaction(userId);

    StatsCacheEntry entry;
    entry.userId = userId;
    entry.data = stats;
    entry.computedAt = stats.computedAt;
    m_cache.upsert(userId, entry.data, entry.computedAt);
    tx.commit();

    const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();
    LLOG_INFO(QStringLiteral("StatsAggregator"),
              QStringLiteral("StatsAggregator::refresh"),
              QStringLiteral("stats_refreshed"),
              QStringLiteral("cache_miss_or_request"),
              QStringLiteral("recompute"),
              logging::userWho(userId),
              QString(),
              (nlohmann::json{{"durationMs", durationMs},
                             {"booksAllTime", stats.reading.booksAllTime},
                             {"computedAt", entry.computedAt}}));
    return entry;
}

CachedStats StatsAggregator::compute(std::int64_t userId) const
{
    Transaction tx(m_db, Transaction::Mode::Deferred);
    CachedStats stats = computeInTransaction(userId);
    tx.commit();
    return stats;
}

CachedStats StatsAggregator::computeInTransaction(std::int64_t userId) const
{
    const auto now = m_clock();
    const std::string nowIso = toIso8601Utc(now);
    const QueryArgs args{userId, std::nullopt};

    CachedStats stats;
    stats.bookSummary = bookSummary(m_db.handle(), args);
    stats.reading = readingStats(m_db.handle(), args, nowIso.substr(0, 4));

    const QueryArgs last30{userId, toIso8601Utc(now - std::chrono::hours(24 * 30))};
    stats.reading.booksLast30Days =
        scalarInt(m_db.handle(),
                  "SELECT COUNT(*) FROM readings"
                  " WHERE user_id = ?1 AND status = 'read' AND finished_at >= ?2;",
                  last30);
    stats.reading.pagesLast30Days =
        scalarInt(m_db.handle(),
                  "SELECT COALESCE(SUM(bk.page_count), 0) FROM readings r"
                  " JOIN books bk ON bk.id = r.book_id"
                  " WHERE r.user_id = ?1 AND r.status = 'read' AND r.finished_at >= ?2"
                  " AND bk.page_count IS NOT NULL;",
                  last30);
    stats.reading.booksInProgress =
        scalarInt(m_db.handle(),
                  "SELECT COUNT(*) FROM readings WHERE user_id = ?1 AND status = 'reading';",
                  args);
    stats.reading.booksOnShelf =
        scalarInt(m_db.handle(),
                  "SELECT COUNT(*) FROM user_books ub"
                  " WHERE ub.user_id = ?1 AND ub.shelf = 'library'"
                  " AND NOT EXISTS (SELECT 1 FROM readings r"
                  "                 WHERE r.book_id = ub.book_id AND r.user_id = ub.user_id);",
                  args);
    stats.reading.booksOnWishlist =
        scalarInt(m_db.handle(),
                  "SELECT COUNT(*) FROM user_books WHERE user_id = ?1 AND shelf = 'wishlist';",
                  args);
    stats.reading.yearlyBooks =
        nameCounts(m_db.handle(),
                   "SELECT strftime('%Y', finished_at) AS name, COUNT(*) FROM readings"
                   " WHERE user_id = ?1 AND status = 'read' AND finished_at IS NOT NULL"
                   " GROUP BY name ORDER BY name;",
                   args);

    stats.computedAt = nowIso;
    return stats;
}

CachedStats StatsAggregator::computeForYear(std::int64_t userId, int year) const
{
    if (year < 1 || year > 9999) {
        throw ValidationError("year out of range: " + std::to_string(year));
    }

    const QueryArgs args{userId, yearString(year)};

    Transaction tx(m_db, Transaction::Mode::Deferred);
    CachedStats stats;
    stats.bookSummary = bookSummary(m_db.handle(), args);
    stats.reading = readingStats(m_db.handle(), args, *args.second);
    tx.commit();

    stats.computedAt = toIso8601Utc(m_clock());
    return stats;
}

std::vector<int> StatsAggregator::availableYears(std::int64_t userId) const
{
    sqlite::Statement stmt(m_db.handle(),
                           "SELECT DISTINCT CAST(strftime('%Y', finished_at) AS INTEGER)"
                           " FROM readings"
                           " WHERE user_id = ? AND status = 'read' AND finished_at IS NOT NULL"
                           " ORDER BY 1 DESC;");
    sqlite3_bind_int64(stmt.get(), 1, userId);

    std::vector<int> years;
    while (stmt.step()) {
        years.push_back(sqlite3_column_int(stmt.get(), 0));
    }
    return years;
}

bool StatsAggregator::userExists(std::int64_t userId) const
{
    sqlite::Statement stmt(m_db.handle(), "SELECT 1 FROM users WHERE id = ? LIMIT 1;");
    sqlite3_bind_int64(stmt.get(), 1, userId);
    return stmt.step();
}

} // namespace leafline
