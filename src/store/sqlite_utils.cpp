#include "store/sqlite_utils.hpp"

#include "common/errors.hpp"

namespace leafline::sqlite {

Statement::Statement(sqlite3 *db, const char *sql)
    : db(db)
{
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
    }
}

Statement::Statement(sqlite3 *db, const std::string &sql)
    : Statement(db, sql.c_str())
{
}

Statement::~Statement()
{
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

bool Statement::step()
{
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StorageError(std::string("sqlite step failed: ") + sqlite3_errmsg(db));
}

void Statement::run(const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageError(message);
    }
}

bool columnExists(sqlite3 *db, const std::string &table, const std::string &column)
{
    Statement stmt(db, "PRAGMA table_info(" + table + ");");
    while (stmt.step()) {
        if (columnText(stmt.get(), 1) == column) {
            return true;
        }
    }
    return false;
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, *value);
}

void bindOptionalInt64(sqlite3_stmt *stmt, int index, const std::optional<std::int64_t> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, *value);
}

void bindOptionalInt(sqlite3_stmt *stmt, int index, const std::optional<int> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int(stmt, index, *value);
}

void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
{
    if (!value.has_value()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_double(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, index);
}

std::optional<std::int64_t> columnOptionalInt64(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, index);
}

std::optional<int> columnOptionalInt(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt, index);
}

std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

} // namespace leafline::sqlite
