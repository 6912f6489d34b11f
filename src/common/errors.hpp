#pragma once

#include <stdexcept>
#include <string>

namespace leafline {

// SQLite prepare/step/commit failures and constraint violations.
class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Incomplete or malformed input: an entity snapshot the recorder cannot
// turn into an event, or a request the query facade cannot serve.
class ValidationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace leafline
