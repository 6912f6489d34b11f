#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <sqlite3.h>

namespace leafline {

// Database owns one SQLite connection: schema bootstrap, pragmas, the meta
// key/value table. Connections are not shared between threads; open one per
// thread on the same file.
class Database {
public:
    explicit Database(const std::string &path, int busyTimeoutMs = 5000);
    ~Database();

    Database(const Database &) = delete;
    Database &operator=(const Database &) = delete;

    sqlite3 *handle() const;
    const std::string &path() const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);
    void deleteMeta(const std::string &key);

    bool integrityCheck(std::string *message = nullptr) const;

    bool inTransaction() const;
    std::int64_t lastInsertRowId() const;
    int changes() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

// Scoped transaction. Rolls back on destruction unless commit() succeeded.
class Transaction {
public:
    enum class Mode {
        Deferred,
        Immediate
    };

    explicit Transaction(Database &db, Mode mode = Mode::Immediate);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();
    bool isOpen() const
    {
        return m_open;
    }

    Database &database() const
    {
        return m_db;
    }

private:
    Database &m_db;
    bool m_open = false;
};

// Named savepoint inside an open transaction. Rolls back to the savepoint on
// destruction unless release() was called.
class Savepoint {
public:
    Savepoint(Transaction &tx, std::string name);
    ~Savepoint();

    Savepoint(const Savepoint &) = delete;
    Savepoint &operator=(const Savepoint &) = delete;

    void release();
    void rollback();

private:
    Database &m_db;
    std::string m_name;
    bool m_active = false;
};

} // namespace leafline
