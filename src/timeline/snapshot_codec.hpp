#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace leafline {

EntityType snapshotType(const EntitySnapshot &snapshot);
std::int64_t snapshotId(const EntitySnapshot &snapshot);

// Derives the denormalized payload for one snapshot. Output is deterministic
// (sorted object keys), so rebuilding from unchanged state is a no-op.
// Throws ValidationError when a required field is missing.
TimelinePayload buildPayload(const EntitySnapshot &snapshot);

std::vector<TimelineDetail> decodeDetails(const std::string &detailsJson);
std::optional<std::vector<std::string>> decodeGenres(const std::optional<std::string> &genresJson);
std::optional<TimelineReadingData> decodeReadingData(
    const std::optional<std::string> &readingDataJson);

TimelineEntry toEntry(const TimelineEvent &event);

// "4/5", "3.5/5".
std::string formatRating(double rating);
// 0.5 to 5.0 in half steps.
bool isValidRating(double rating);
// Physical, eReader, Audiobook.
std::string formatLabel(ReadingFormat format);

} // namespace leafline
