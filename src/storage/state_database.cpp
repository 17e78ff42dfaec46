// File: src/storage/state_database.cpp
#include "storage/state_database.hpp"
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace ctxmem {

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(sqlite3* db, const std::string& sql)
    : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw std::runtime_error("Failed to prepare statement: " + error);
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::BindInt64(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

Statement& Statement::BindDouble(int index, double value) {
    sqlite3_bind_double(stmt_, index, value);
    return *this;
}

Statement& Statement::BindText(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::BindBlob(int index, const std::string& bytes) {
    sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()),
                      SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::BindNull(int index) {
    sqlite3_bind_null(stmt_, index);
    return *this;
}

bool Statement::Step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
}

void Statement::Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::ColumnInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::ColumnDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::ColumnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) {
        return std::string();
    }
    int size = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::string Statement::ColumnBlob(int column) const {
    const void* blob_data = sqlite3_column_blob(stmt_, column);
    int blob_size = sqlite3_column_bytes(stmt_, column);
    if (!blob_data || blob_size <= 0) {
        return std::string();
    }
    return std::string(static_cast<const char*>(blob_data), static_cast<size_t>(blob_size));
}

bool Statement::ColumnIsNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// ============================================================================
// StateDatabase
// ============================================================================

StateDatabase::StateDatabase(const Config& config)
    : config_(config) {

    std::filesystem::path db_path(config_.db_path);
    if (db_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create state directory: " + ec.message());
        }
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // A stale lock must never hang the host
    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        Execute("PRAGMA journal_mode=WAL;");
    }
    Execute("PRAGMA synchronous=" + config_.synchronous + ";");
}

StateDatabase::~StateDatabase() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

bool StateDatabase::Execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

void StateDatabase::ExecuteOrThrow(const std::string& sql) {
    if (!Execute(sql)) {
        throw std::runtime_error("SQL failed on " + config_.db_path + ": " + LastError());
    }
}

Statement StateDatabase::Prepare(const std::string& sql) {
    return Statement(db_, sql);
}

int StateDatabase::Changes() const {
    return sqlite3_changes(db_);
}

std::string StateDatabase::LastError() const {
    return db_ ? sqlite3_errmsg(db_) : "database closed";
}

// ============================================================================
// Transaction
// ============================================================================

StateDatabase::Transaction::Transaction(StateDatabase& db)
    : db_(db) {
    db_.ExecuteOrThrow("BEGIN TRANSACTION;");
}

StateDatabase::Transaction::~Transaction() {
    if (!done_) {
        db_.Execute("ROLLBACK;");
    }
}

void StateDatabase::Transaction::Commit() {
    db_.ExecuteOrThrow("COMMIT;");
    done_ = true;
}

} // namespace ctxmem
