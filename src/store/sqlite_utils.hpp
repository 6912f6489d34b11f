#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace leafline::sqlite {

// Prepared statement owner. Failures surface as StorageError carrying the
// SQLite message.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    Statement(sqlite3 *db, const std::string &sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

    // true while rows are produced, false once the statement is done.
    bool step();
    // Runs a statement that produces no rows.
    void run(const char *what);

private:
    sqlite3 *db = nullptr;
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql);
bool columnExists(sqlite3 *db, const std::string &table, const std::string &column);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value);
void bindOptionalInt64(sqlite3_stmt *stmt, int index, const std::optional<std::int64_t> &value);
void bindOptionalInt(sqlite3_stmt *stmt, int index, const std::optional<int> &value);
void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value);

std::string columnText(sqlite3_stmt *stmt, int index);
std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int index);
std::optional<std::int64_t> columnOptionalInt64(sqlite3_stmt *stmt, int index);
std::optional<int> columnOptionalInt(sqlite3_stmt *stmt, int index);
std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index);

} // namespace leafline::sqlite
