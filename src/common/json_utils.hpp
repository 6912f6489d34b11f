#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace leafline {

inline std::int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(std::int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

// Millisecond precision, e.g. 2026-03-01T10:15:30.125Z. Lexically sortable and
// understood by SQLite's date functions.
inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    const std::int64_t millis = toEpochMillis(timestamp);
    std::int64_t seconds = millis / 1000;
    std::int64_t fraction = millis % 1000;
    if (fraction < 0) {
        fraction += 1000;
        seconds -= 1;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return out.str();
}

// Accepts both the millisecond form and plain second precision. Returns an
// empty time_point when the value cannot be parsed.
inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            const int digit = in.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return std::chrono::system_clock::time_point{};
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (in.peek() != 'Z') {
        return std::chrono::system_clock::time_point{};
    }

#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time)
        + std::chrono::milliseconds(millis);
}

inline std::string toEntityTypeString(EntityType type)
{
    switch (type) {
    case EntityType::Author:
        return "author";
    case EntityType::Book:
        return "book";
    case EntityType::Reading:
        return "reading";
    case EntityType::Genre:
        return "genre";
    }
    return "book";
}

inline std::optional<EntityType> parseEntityTypeString(const std::string &value)
{
    if (value == "author") {
        return EntityType::Author;
    }
    if (value == "book") {
        return EntityType::Book;
    }
    if (value == "reading") {
        return EntityType::Reading;
    }
    if (value == "genre") {
        return EntityType::Genre;
    }
    return std::nullopt;
}

inline std::string toReadingStatusString(ReadingStatus status)
{
    switch (status) {
    case ReadingStatus::Reading:
        return "reading";
    case ReadingStatus::Read:
        return "read";
    case ReadingStatus::Abandoned:
        return "abandoned";
    }
    return "reading";
}

inline std::optional<ReadingStatus> parseReadingStatusString(const std::string &value)
{
    if (value == "reading") {
        return ReadingStatus::Reading;
    }
    if (value == "read") {
        return ReadingStatus::Read;
    }
    if (value == "abandoned") {
        return ReadingStatus::Abandoned;
    }
    return std::nullopt;
}

inline std::string toReadingFormatString(ReadingFormat format)
{
    switch (format) {
    case ReadingFormat::Physical:
        return "physical";
    case ReadingFormat::EReader:
        return "ereader";
    case ReadingFormat::Audiobook:
        return "audiobook";
    }
    return "physical";
}

inline std::optional<ReadingFormat> parseReadingFormatString(const std::string &value)
{
    if (value == "physical") {
        return ReadingFormat::Physical;
    }
    if (value == "ereader") {
        return ReadingFormat::EReader;
    }
    if (value == "audiobook") {
        return ReadingFormat::Audiobook;
    }
    return std::nullopt;
}

inline std::string toShelfString(Shelf shelf)
{
    return shelf == Shelf::Wishlist ? "wishlist" : "library";
}

inline std::string toScopeString(TimelineScope scope)
{
    return scope == TimelineScope::Mine ? "mine" : "global";
}

inline std::optional<TimelineScope> parseScopeString(const std::string &value)
{
    if (value == "mine") {
        return TimelineScope::Mine;
    }
    if (value == "global") {
        return TimelineScope::Global;
    }
    return std::nullopt;
}

inline std::string toOrphanPolicyString(OrphanPolicy policy)
{
    return policy == OrphanPolicy::Prune ? "prune" : "freeze";
}

inline std::optional<OrphanPolicy> parseOrphanPolicyString(const std::string &value)
{
    if (value == "freeze") {
        return OrphanPolicy::Freeze;
    }
    if (value == "prune") {
        return OrphanPolicy::Prune;
    }
    return std::nullopt;
}

// Cursor wire form: "<epoch-ms>:<id>".
inline std::string encodeCursor(const TimelineCursor &cursor)
{
    return std::to_string(toEpochMillis(cursor.occurredAt)) + ":"
        + std::to_string(cursor.id);
}

inline std::optional<TimelineCursor> parseCursor(const std::string &value)
{
    const auto separator = value.find(':');
    if (separator == std::string::npos || separator == 0
        || separator + 1 >= value.size()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const std::string millisPart = value.substr(0, separator);
        const std::int64_t millis = std::stoll(millisPart, &consumed);
        if (consumed != millisPart.size()) {
            return std::nullopt;
        }
        // Beyond this the conversion to system_clock ticks overflows.
        const std::int64_t maxMillis =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::duration::max())
                .count();
        if (millis > maxMillis || millis < -maxMillis) {
            return std::nullopt;
        }
        const std::string idPart = value.substr(separator + 1);
        const std::int64_t id = std::stoll(idPart, &consumed);
        if (consumed != idPart.size()) {
            return std::nullopt;
        }
        return TimelineCursor{fromEpochMillis(millis), id};
    } catch (const std::logic_error &) {
        return std::nullopt;
    }
}

// Entity key form used in meta and CLI output: "<type>:<id>".
inline std::string encodeEntityKey(const EntityKey &key)
{
    return toEntityTypeString(key.type) + ":" + std::to_string(key.id);
}

inline std::optional<EntityKey> parseEntityKey(const std::string &value)
{
    const auto separator = value.find(':');
    if (separator == std::string::npos) {
        return std::nullopt;
    }
    const auto type = parseEntityTypeString(value.substr(0, separator));
    if (!type.has_value()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        const std::string idPart = value.substr(separator + 1);
        const std::int64_t id = std::stoll(idPart, &consumed);
        if (consumed != idPart.size()) {
            return std::nullopt;
        }
        return EntityKey{*type, id};
    } catch (const std::logic_error &) {
        return std::nullopt;
    }
}

template <typename T>
nlohmann::json optionalToJson(const std::optional<T> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return nlohmann::json(*value);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json &j, const char *key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

inline void to_json(nlohmann::json &j, const EntityType &type)
{
    j = toEntityTypeString(type);
}

inline void from_json(const nlohmann::json &j, EntityType &type)
{
    const auto parsed = j.is_string() ? parseEntityTypeString(j.get<std::string>())
                                      : std::nullopt;
    type = parsed.value_or(EntityType::Book);
}

inline void to_json(nlohmann::json &j, const ReadingStatus &status)
{
    j = toReadingStatusString(status);
}

inline void from_json(const nlohmann::json &j, ReadingStatus &status)
{
    const auto parsed = j.is_string() ? parseReadingStatusString(j.get<std::string>())
                                      : std::nullopt;
    status = parsed.value_or(ReadingStatus::Reading);
}

inline void to_json(nlohmann::json &j, const TimelineDetail &detail)
{
    j = nlohmann::json{{"label", detail.label}, {"value", detail.value}};
}

inline void from_json(const nlohmann::json &j, TimelineDetail &detail)
{
    detail.label = j.value("label", "");
    detail.value = j.value("value", "");
}

inline void to_json(nlohmann::json &j, const TimelineReadingData &data)
{
    j = nlohmann::json{
        {"book_id", data.bookId},
        {"status", data.status},
        {"rating", optionalToJson(data.rating)}
    };
}

inline void from_json(const nlohmann::json &j, TimelineReadingData &data)
{
    data.bookId = j.value("book_id", static_cast<std::int64_t>(0));
    if (j.contains("status")) {
        data.status = j.at("status").get<ReadingStatus>();
    } else {
        data.status = ReadingStatus::Reading;
    }
    data.rating = optionalFromJson<double>(j, "rating");
}

inline void to_json(nlohmann::json &j, const TimelineEntry &entry)
{
    j = nlohmann::json{
        {"id", entry.id},
        {"entity_type", entry.entityType},
        {"entity_id", entry.entityId},
        {"action", entry.action},
        {"occurred_at", toIso8601Utc(entry.occurredAt)},
        {"title", entry.title},
        {"details", entry.details}
    };
    if (entry.genres.has_value()) {
        j["genres"] = *entry.genres;
    }
    if (entry.readingData.has_value()) {
        j["reading_data"] = *entry.readingData;
    }
}

inline void from_json(const nlohmann::json &j, TimelineEntry &entry)
{
    entry.id = j.value("id", static_cast<std::int64_t>(0));
    if (j.contains("entity_type")) {
        entry.entityType = j.at("entity_type").get<EntityType>();
    }
    entry.entityId = j.value("entity_id", static_cast<std::int64_t>(0));
    entry.action = j.value("action", "");
    entry.occurredAt = fromIso8601Utc(j.value("occurred_at", ""));
    entry.title = j.value("title", "");
    if (j.contains("details") && j.at("details").is_array()) {
        entry.details = j.at("details").get<std::vector<TimelineDetail>>();
    } else {
        entry.details.clear();
    }
    entry.genres = optionalFromJson<std::vector<std::string>>(j, "genres");
    entry.readingData = optionalFromJson<TimelineReadingData>(j, "reading_data");
}

inline void to_json(nlohmann::json &j, const TimelinePage &page)
{
    j = nlohmann::json{{"events", page.entries}};
    if (page.nextCursor.has_value()) {
        j["next_cursor"] = encodeCursor(*page.nextCursor);
    } else {
        j["next_cursor"] = nullptr;
    }
}

inline void to_json(nlohmann::json &j, const BookSummaryStats &stats)
{
    j = nlohmann::json{
        {"total_books", stats.totalBooks},
        {"total_authors", stats.totalAuthors},
        {"unique_genres", stats.uniqueGenres},
        {"top_genre", optionalToJson(stats.topGenre)},
        {"top_author", optionalToJson(stats.topAuthor)},
        {"genre_counts", stats.genreCounts},
        {"max_genre_count", stats.maxGenreCount},
        {"page_count_distribution", stats.pageCountDistribution},
        {"year_published_distribution", stats.yearPublishedDistribution},
        {"top_authors", stats.topAuthors},
        {"longest_book", optionalToJson(stats.longestBook)},
        {"shortest_book", optionalToJson(stats.shortestBook)}
    };
}

inline void from_json(const nlohmann::json &j, BookSummaryStats &stats)
{
    stats.totalBooks = j.value("total_books", static_cast<std::int64_t>(0));
    stats.totalAuthors = j.value("total_authors", static_cast<std::int64_t>(0));
    stats.uniqueGenres = j.value("unique_genres", static_cast<std::int64_t>(0));
    stats.topGenre = optionalFromJson<std::string>(j, "top_genre");
    stats.topAuthor = optionalFromJson<std::string>(j, "top_author");
    stats.genreCounts = j.value("genre_counts", std::vector<NameCount>{});
    stats.maxGenreCount = j.value("max_genre_count", static_cast<std::int64_t>(0));
    stats.pageCountDistribution =
        j.value("page_count_distribution", std::vector<NameCount>{});
    stats.yearPublishedDistribution =
        j.value("year_published_distribution", std::vector<NameCount>{});
    stats.topAuthors = j.value("top_authors", std::vector<NameCount>{});
    stats.longestBook = optionalFromJson<NameCount>(j, "longest_book");
    stats.shortestBook = optionalFromJson<NameCount>(j, "shortest_book");
}

inline void to_json(nlohmann::json &j, const ReadingStats &stats)
{
    j = nlohmann::json{
        {"books_last_30_days", stats.booksLast30Days},
        {"books_all_time", stats.booksAllTime},
        {"pages_last_30_days", stats.pagesLast30Days},
        {"pages_all_time", stats.pagesAllTime},
        {"books_in_progress", stats.booksInProgress},
        {"books_on_shelf", stats.booksOnShelf},
        {"books_on_wishlist", stats.booksOnWishlist},
        {"books_abandoned", stats.booksAbandoned},
        {"average_rating", optionalToJson(stats.averageRating)},
        {"average_days_to_finish", optionalToJson(stats.averageDaysToFinish)},
        {"rating_distribution", stats.ratingDistribution},
        {"monthly_books", stats.monthlyBooks},
        {"yearly_books", stats.yearlyBooks},
        {"pace_distribution", stats.paceDistribution},
        {"format_counts", stats.formatCounts}
    };
}

inline void from_json(const nlohmann::json &j, ReadingStats &stats)
{
    const auto zero = static_cast<std::int64_t>(0);
    stats.booksLast30Days = j.value("books_last_30_days", zero);
    stats.booksAllTime = j.value("books_all_time", zero);
    stats.pagesLast30Days = j.value("pages_last_30_days", zero);
    stats.pagesAllTime = j.value("pages_all_time", zero);
    stats.booksInProgress = j.value("books_in_progress", zero);
    stats.booksOnShelf = j.value("books_on_shelf", zero);
    stats.booksOnWishlist = j.value("books_on_wishlist", zero);
    stats.booksAbandoned = j.value("books_abandoned", zero);
    stats.averageRating = optionalFromJson<double>(j, "average_rating");
    stats.averageDaysToFinish = optionalFromJson<double>(j, "average_days_to_finish");
    stats.ratingDistribution = j.value("rating_distribution",
                                       std::vector<std::pair<double, std::int64_t>>{});
    stats.monthlyBooks = j.value("monthly_books", std::vector<NameCount>{});
    stats.yearlyBooks = j.value("yearly_books", std::vector<NameCount>{});
    stats.paceDistribution = j.value("pace_distribution", std::vector<NameCount>{});
    stats.formatCounts = j.value("format_counts", std::vector<NameCount>{});
}

inline void to_json(nlohmann::json &j, const CachedStats &stats)
{
    j = nlohmann::json{
        {"book_summary", stats.bookSummary},
        {"reading", stats.reading},
        {"computed_at", stats.computedAt}
    };
}

inline void from_json(const nlohmann::json &j, CachedStats &stats)
{
    if (j.contains("book_summary") && j.at("book_summary").is_object()) {
        stats.bookSummary = j.at("book_summary").get<BookSummaryStats>();
    } else {
        stats.bookSummary = BookSummaryStats{};
    }
    if (j.contains("reading") && j.at("reading").is_object()) {
        stats.reading = j.at("reading").get<ReadingStats>();
    } else {
        stats.reading = ReadingStats{};
    }
    stats.computedAt = j.value("computed_at", "");
}

inline void to_json(nlohmann::json &j, const StatsCacheEntry &entry)
{
    j = nlohmann::json{
        {"user_id", entry.userId},
        {"data", entry.data},
        {"computed_at", entry.computedAt}
    };
}

inline void to_json(nlohmann::json &j, const RebuildReport &report)
{
    j = nlohmann::json{
        {"scanned", report.scanned},
        {"updated", report.updated},
        {"orphaned", report.orphaned},
        {"errors", report.errors},
        {"interrupted", report.interrupted}
    };
}

inline void from_json(const nlohmann::json &j, RebuildReport &report)
{
    report.scanned = j.value("scanned", 0);
    report.updated = j.value("updated", 0);
    report.orphaned = j.value("orphaned", 0);
    report.errors = j.value("errors", 0);
    report.interrupted = j.value("interrupted", false);
}

} // namespace leafline
