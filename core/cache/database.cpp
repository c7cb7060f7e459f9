#include "database.hpp"

#include <exception>
#include <utility>

#include "logging/logger.hpp"

namespace envkeeper {
namespace cache {

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement &&other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }

Statement &Statement::operator=(Statement &&other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

bool Statement::bind_text(int index, const std::string &value) {
    return sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) ==
           SQLITE_OK;
}

bool Statement::bind_int64(int index, int64_t value) {
    return sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) == SQLITE_OK;
}

bool Statement::bind_null(int index) { return sqlite3_bind_null(stmt_, index) == SQLITE_OK; }

Statement::StepResult Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return StepResult::ROW;
    }
    if (rc == SQLITE_DONE) {
        return StepResult::DONE;
    }
    return StepResult::ERROR;
}

bool Statement::reset() {
    sqlite3_clear_bindings(stmt_);
    return sqlite3_reset(stmt_) == SQLITE_OK;
}

bool Statement::column_is_null(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

std::string Statement::column_text(int column) const {
    const unsigned char *text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char *>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

int64_t Statement::column_int64(int column) const { return sqlite3_column_int64(stmt_, column); }

Connection::~Connection() { close(); }

bool Connection::open(const std::string &path, int busy_timeout_ms, common::Error &error) {
    close();

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "unable to open database '" + path + "'";
        if (db_ != nullptr) {
            message += ": " + std::string(sqlite3_errmsg(db_));
        }
        close();
        return common::fail(error, common::ErrorCode::SQL, message);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    if (!exec("PRAGMA foreign_keys = ON;", error)) {
        close();
        return false;
    }
    return true;
}

void Connection::close() {
    if (db_ != nullptr) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool Connection::exec(const std::string &sql, common::Error &error) {
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        std::string file = filename();
        if (!file.empty()) {
            message += " (" + file + ")";
        }
        return common::fail(error, common::ErrorCode::SQL, message);
    }
    return true;
}

bool Connection::prepare(const std::string &sql, Statement &stmt, common::Error &error) {
    sqlite3_stmt *raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        if (raw != nullptr) {
            sqlite3_finalize(raw);
        }
        return common::fail(error, common::ErrorCode::SQL, error_message("unable to prepare statement"));
    }
    stmt = Statement(raw);
    return true;
}

bool Connection::run(Statement &stmt, common::Error &error) {
    while (true) {
        auto result = stmt.step();
        if (result == Statement::StepResult::DONE) {
            return true;
        }
        if (result == Statement::StepResult::ERROR) {
            return common::fail(error, common::ErrorCode::SQL, error_message("statement failed"));
        }
    }
}

int Connection::changes() const { return sqlite3_changes(db_); }

bool Connection::user_version(int &version, common::Error &error) {
    Statement stmt;
    if (!prepare("PRAGMA user_version;", stmt, error)) {
        return false;
    }
    if (stmt.step() != Statement::StepResult::ROW) {
        return common::fail(error, common::ErrorCode::SQL, error_message("unable to read user_version"));
    }
    version = static_cast<int>(stmt.column_int64(0));
    return true;
}

bool Connection::set_user_version(int version, common::Error &error) {
    return exec("PRAGMA user_version = " + std::to_string(version) + ";", error);
}

std::string Connection::filename() const {
    if (db_ == nullptr) {
        return std::string();
    }
    const char *name = sqlite3_db_filename(db_, "main");
    if (name == nullptr) {
        return std::string();
    }
    return std::string(name);
}

std::string Connection::error_message(const std::string &what) const {
    std::string message = what;
    if (db_ != nullptr) {
        message += ": " + std::string(sqlite3_errmsg(db_));
        std::string file = filename();
        if (!file.empty()) {
            message += " (" + file + ")";
        }
    }
    return message;
}

int Connection::last_error_code() const { return db_ != nullptr ? sqlite3_extended_errcode(db_) : SQLITE_MISUSE; }

bool with_transaction(Connection &conn, const std::function<bool(common::Error &)> &body, common::Error &error) {
    if (!conn.exec("BEGIN IMMEDIATE;", error)) {
        return false;
    }

    bool ok = false;
    try {
        ok = body(error);
    } catch (const std::exception &e) {
        common::fail(error, common::ErrorCode::SERIALIZATION, e.what());
        ok = false;
    }

    if (!ok) {
        common::Error rollback_error;
        if (!conn.exec("ROLLBACK;", rollback_error)) {
            LOG_WARN("[Database] Rollback failed: " << rollback_error.message);
        }
        if (error.ok()) {
            common::fail(error, common::ErrorCode::SQL, "transaction aborted");
        }
        return false;
    }

    if (!conn.exec("COMMIT;", error)) {
        common::Error rollback_error;
        if (!conn.exec("ROLLBACK;", rollback_error)) {
            LOG_WARN("[Database] Rollback after failed commit failed: " << rollback_error.message);
        }
        return false;
    }
    return true;
}

}  // namespace cache
}  // namespace envkeeper
