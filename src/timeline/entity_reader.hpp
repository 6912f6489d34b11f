#pragma once

#include <optional>
#include <vector>

#include "common/models.hpp"

namespace leafline {

// Read-by-key access to current entity state, as consumed by the rebuilder.
class EntityReader {
public:
    virtual ~EntityReader() = default;

    // Current snapshot, or nullopt when the entity no longer exists.
    virtual std::optional<EntitySnapshot> fetch(const EntityKey &key) const = 0;

    // Entities whose payload embeds data of `key`: an author's books and
    // their readings, a genre's books, a book's readings.
    virtual std::vector<EntityKey> dependents(const EntityKey &key) const = 0;
};

} // namespace leafline
