#include "timeline/snapshot_codec.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace leafline {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

TimelineDetail authorDetail(const std::vector<std::string> &authors)
{
    return TimelineDetail{"Author", authors.empty() ? std::string("Unknown") : joinNames(authors)};
}

std::string dumpDetails(const std::vector<TimelineDetail> &details)
{
    return nlohmann::json(details).dump();
}

TimelinePayload bookPayload(const BookSnapshot &book)
{
    if (book.title.empty()) {
        throw ValidationError("book snapshot has no title");
    }

    std::vector<std::string> genres;
    if (book.primaryGenre.has_value() && !book.primaryGenre->empty()) {
        genres.push_back(*book.primaryGenre);
    }
    if (book.secondaryGenre.has_value() && !book.secondaryGenre->empty()) {
        genres.push_back(*book.secondaryGenre);
    }

    std::vector<TimelineDetail> details{authorDetail(book.authors)};
    if (!genres.empty()) {
        details.push_back({"Genres", joinNames(genres)});
    }
    if (book.pageCount.has_value()) {
        details.push_back({"Pages", std::to_string(*book.pageCount)});
    }

    TimelinePayload payload;
    payload.title = book.title;
    payload.detailsJson = dumpDetails(details);
    payload.genresJson = nlohmann::json(genres).dump();
    return payload;
}

TimelinePayload namedPayload(const std::string &name, const char *kind)
{
    if (name.empty()) {
        throw ValidationError(std::string(kind) + " snapshot has no name");
    }
    TimelinePayload payload;
    payload.title = name;
    payload.detailsJson = "[]";
    return payload;
}

TimelinePayload readingPayload(const ReadingSnapshot &reading)
{
    if (reading.bookTitle.empty()) {
        throw ValidationError("reading snapshot has no parent book title");
    }
    if (reading.bookId <= 0) {
        throw ValidationError("reading snapshot has no parent book");
    }
    if (reading.rating.has_value() && !isValidRating(*reading.rating)) {
        throw ValidationError("reading rating out of range");
    }

    std::vector<TimelineDetail> details{authorDetail(reading.authors)};
    if (reading.format.has_value()) {
        details.push_back({"Format", formatLabel(*reading.format)});
    }
    if (reading.rating.has_value()) {
        details.push_back({"Rating", formatRating(*reading.rating)});
    }

    TimelinePayload payload;
    payload.title = reading.bookTitle;
    payload.detailsJson = dumpDetails(details);
    payload.readingDataJson =
        nlohmann::json(TimelineReadingData{reading.bookId, reading.status, reading.rating}).dump();
    return payload;
}

} // namespace

EntityType snapshotType(const EntitySnapshot &snapshot)
{
    return std::visit(
        [](const auto &value) -> EntityType {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, BookSnapshot>) {
                return EntityType::Book;
            } else if constexpr (std::is_same_v<T, AuthorSnapshot>) {
                return EntityType::Author;
            } else if constexpr (std::is_same_v<T, GenreSnapshot>) {
                return EntityType::Genre;
            } else if constexpr (std::is_same_v<T, ReadingSnapshot>) {
                return EntityType::Reading;
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled snapshot type");
            }
        },
        snapshot);
}

std::int64_t snapshotId(const EntitySnapshot &snapshot)
{
    return std::visit([](const auto &value) { return value.id; }, snapshot);
}

TimelinePayload buildPayload(const EntitySnapshot &snapshot)
{
    return std::visit(
        [](const auto &value) -> TimelinePayload {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, BookSnapshot>) {
                return bookPayload(value);
            } else if constexpr (std::is_same_v<T, AuthorSnapshot>) {
                return namedPayload(value.name, "author");
            } else if constexpr (std::is_same_v<T, GenreSnapshot>) {
                return namedPayload(value.name, "genre");
            } else if constexpr (std::is_same_v<T, ReadingSnapshot>) {
                return readingPayload(value);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled snapshot type");
            }
        },
        snapshot);
}

std::vector<TimelineDetail> decodeDetails(const std::string &detailsJson)
{
    if (detailsJson.empty()) {
        return {};
    }
    try {
        const auto parsed = nlohmann::json::parse(detailsJson);
        if (!parsed.is_array()) {
            return {};
        }
        return parsed.get<std::vector<TimelineDetail>>();
    } catch (const nlohmann::json::exception &) {
        return {};
    }
}

std::optional<std::vector<std::string>> decodeGenres(const std::optional<std::string> &genresJson)
{
    if (!genresJson.has_value()) {
        return std::nullopt;
    }
    try {
        const auto parsed = nlohmann::json::parse(*genresJson);
        if (!parsed.is_array()) {
            return std::nullopt;
        }
        return parsed.get<std::vector<std::string>>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

std::optional<TimelineReadingData> decodeReadingData(
    const std::optional<std::string> &readingDataJson)
{
    if (!readingDataJson.has_value()) {
        return std::nullopt;
    }
    try {
        const auto parsed = nlohmann::json::parse(*readingDataJson);
        if (!parsed.is_object()) {
            return std::nullopt;
        }
        return parsed.get<TimelineReadingData>();
    } catch (const nlohmann::json::exception &) {
        return std::nullopt;
    }
}

TimelineEntry toEntry(const TimelineEvent &event)
{
    TimelineEntry entry;
    entry.id = event.id;
    entry.entityType = event.entityType;
    entry.entityId = event.entityId;
    entry.action = event.action;
    entry.occurredAt = event.occurredAt;
    entry.title = event.payload.title;
    entry.details = decodeDetails(event.payload.detailsJson);
    entry.genres = decodeGenres(event.payload.genresJson);
    entry.readingData = decodeReadingData(event.payload.readingDataJson);
    return entry;
}

std::string formatRating(double rating)
{
    double whole = 0.0;
    if (std::modf(rating, &whole) == 0.0) {
        return std::to_string(static_cast<int>(whole)) + "/5";
    }
    std::ostringstream out;
    out << rating << "/5";
    return out.str();
}

bool isValidRating(double rating)
{
    if (!(rating >= 0.5 && rating <= 5.0)) {
        return false;
    }
    const double doubled = rating * 2.0;
    return doubled == std::floor(doubled);
}

std::string formatLabel(ReadingFormat format)
{
    switch (format) {
    case ReadingFormat::Physical:
        return "Physical";
    case ReadingFormat::EReader:
        return "eReader";
    case ReadingFormat::Audiobook:
        return "Audiobook";
    }
    return "Physical";
}

} // namespace leafline
