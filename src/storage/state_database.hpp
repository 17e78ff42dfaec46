// File: src/storage/state_database.hpp
#pragma once

#include <cstdint>
#include <string>
#include <sqlite3.h>

namespace ctxmem {

/// RAII wrapper around a prepared SQLite statement
///
/// Binding indices are 1-based, column indices 0-based (SQLite convention).
/// Step() throws std::runtime_error on any result other than ROW/DONE.
class Statement {
public:
    /// Prepare a statement
    /// @throws std::runtime_error if the SQL cannot be prepared
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement& BindInt64(int index, int64_t value);
    Statement& BindDouble(int index, double value);
    Statement& BindText(int index, const std::string& value);
    Statement& BindBlob(int index, const std::string& bytes);
    Statement& BindNull(int index);

    /// Advance the statement
    /// @return true if a row is available, false when done
    bool Step();

    /// Reset for re-execution and clear bindings
    void Reset();

    int64_t ColumnInt64(int column) const;
    double ColumnDouble(int column) const;
    std::string ColumnText(int column) const;
    std::string ColumnBlob(int column) const;
    bool ColumnIsNull(int column) const;

private:
    sqlite3* db_{nullptr};
    sqlite3_stmt* stmt_{nullptr};
};

/// Small SQLite database holding one component's persisted state
///
/// Each component (access tracker, tier index, forecaster, ...) owns one of
/// these under its own directory. Opening uses WAL journaling and a busy
/// timeout so a stale lock never blocks the host.
class StateDatabase {
public:
    /// Configuration for StateDatabase
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};
    };

    /// Open (or create) the database, creating parent directories
    /// @throws std::runtime_error if the database cannot be opened
    explicit StateDatabase(const Config& config);

    /// Closes the database connection
    ~StateDatabase();

    StateDatabase(const StateDatabase&) = delete;
    StateDatabase& operator=(const StateDatabase&) = delete;

    /// Execute one or more SQL statements without results
    /// @return true if successful
    bool Execute(const std::string& sql);

    /// Execute SQL, throwing on failure (for schema creation)
    void ExecuteOrThrow(const std::string& sql);

    /// Prepare a statement bound to this connection
    Statement Prepare(const std::string& sql);

    /// Rows changed by the last statement
    int Changes() const;

    /// Last error message reported by SQLite
    std::string LastError() const;

    const std::string& GetPath() const { return config_.db_path; }

    /// Scoped transaction: rolls back unless Commit() was called
    class Transaction {
    public:
        explicit Transaction(StateDatabase& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        /// @throws std::runtime_error if COMMIT fails
        void Commit();

    private:
        StateDatabase& db_;
        bool done_{false};
    };

private:
    Config config_;
    sqlite3* db_{nullptr};
};

} // namespace ctxmem
