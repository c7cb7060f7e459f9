#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <functional>
#include <string>

#include "common/errors.hpp"

namespace envkeeper {
namespace cache {

// Prepared statement owning its sqlite3_stmt. Bind indices are 1-based.
class Statement {
public:
    enum class StepResult { ROW, DONE, ERROR };

    Statement() = default;
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;
    Statement(Statement &&other) noexcept;
    Statement &operator=(Statement &&other) noexcept;

    bool bind_text(int index, const std::string &value);
    bool bind_int64(int index, int64_t value);
    bool bind_null(int index);

    StepResult step();
    bool reset();

    bool column_is_null(int column) const;
    std::string column_text(int column) const;
    int64_t column_int64(int column) const;

    bool valid() const { return stmt_ != nullptr; }

private:
    friend class Connection;
    explicit Statement(sqlite3_stmt *stmt) : stmt_(stmt) {}

    sqlite3_stmt *stmt_ = nullptr;
};

// One SQLite connection. Opened with foreign keys enabled and a busy timeout.
class Connection {
public:
    Connection() = default;
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // path may be a plain file path or a "file:" URI
    bool open(const std::string &path, int busy_timeout_ms, common::Error &error);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Runs one or more statements without results
    bool exec(const std::string &sql, common::Error &error);

    bool prepare(const std::string &sql, Statement &stmt, common::Error &error);

    // Steps a prepared statement to completion, ignoring rows
    bool run(Statement &stmt, common::Error &error);

    int changes() const;

    bool user_version(int &version, common::Error &error);
    bool set_user_version(int version, common::Error &error);

    // Filename of the main database, empty for in-memory databases
    std::string filename() const;

    // "<what>: <sqlite message> (<file>)"
    std::string error_message(const std::string &what) const;

    // Extended result code of the last failing call
    int last_error_code() const;

    sqlite3 *handle() { return db_; }

private:
    sqlite3 *db_ = nullptr;
};

// BEGIN IMMEDIATE / COMMIT around body. Any false return or exception from
// body rolls back; the exception message is carried in error.
bool with_transaction(Connection &conn, const std::function<bool(common::Error &)> &body, common::Error &error);

}  // namespace cache
}  // namespace envkeeper
