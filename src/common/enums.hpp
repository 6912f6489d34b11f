#pragma once

namespace leafline {

// Declared in the same order as the stored type names sort.
enum class EntityType {
    Author,
    Book,
    Genre,
    Reading
};

enum class ReadingStatus {
    Reading,
    Read,
    Abandoned
};

enum class ReadingFormat {
    Physical,
    EReader,
    Audiobook
};

enum class Shelf {
    Library,
    Wishlist
};

enum class TimelineScope {
    Mine,
    Global
};

// What the rebuilder does with events whose source entity is gone.
enum class OrphanPolicy {
    Freeze,
    Prune
};

} // namespace leafline
