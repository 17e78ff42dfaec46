// File: src/context/context_stats.cpp
#include "context/context_stats.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace ctxmem {

namespace {

template <typename Record>
bool InRange(const Record& record, const std::optional<Timestamp>& since,
             const std::optional<Timestamp>& until) {
    if (since && record.timestamp < *since) return false;
    if (until && record.timestamp > *until) return false;
    return true;
}

void BindOptionalText(Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        stmt.BindText(index, *value);
    } else {
        stmt.BindNull(index);
    }
}

std::optional<std::string> OptionalText(const Statement& stmt, int column) {
    if (stmt.ColumnIsNull(column)) {
        return std::nullopt;
    }
    return stmt.ColumnText(column);
}

} // anonymous namespace

// ============================================================================
// Enums
// ============================================================================

const char* ToString(ClearTrigger trigger) {
    switch (trigger) {
        case ClearTrigger::INPUT_TOKENS:
            return "input_tokens";
        case ClearTrigger::MANUAL:
            return "manual";
        default:
            return "unknown";
    }
}

std::optional<ClearTrigger> ParseClearTrigger(const std::string& str) {
    if (str == "input_tokens" || str == "INPUT_TOKENS") {
        return ClearTrigger::INPUT_TOKENS;
    } else if (str == "manual" || str == "MANUAL") {
        return ClearTrigger::MANUAL;
    }
    return std::nullopt;
}

const char* ToString(MemoryOperationType op) {
    switch (op) {
        case MemoryOperationType::VIEW:
            return "view";
        case MemoryOperationType::CREATE:
            return "create";
        case MemoryOperationType::STR_REPLACE:
            return "str_replace";
        case MemoryOperationType::INSERT:
            return "insert";
        case MemoryOperationType::DELETE:
            return "delete";
        case MemoryOperationType::RENAME:
            return "rename";
        default:
            return "unknown";
    }
}

std::optional<MemoryOperationType> ParseMemoryOperationType(const std::string& str) {
    if (str == "view") {
        return MemoryOperationType::VIEW;
    } else if (str == "create") {
        return MemoryOperationType::CREATE;
    } else if (str == "str_replace") {
        return MemoryOperationType::STR_REPLACE;
    } else if (str == "insert") {
        return MemoryOperationType::INSERT;
    } else if (str == "delete") {
        return MemoryOperationType::DELETE;
    } else if (str == "rename") {
        return MemoryOperationType::RENAME;
    }
    return std::nullopt;
}

AccessOperation ToAccessOperation(MemoryOperationType op) {
    switch (op) {
        case MemoryOperationType::CREATE:
            return AccessOperation::CREATE;
        case MemoryOperationType::STR_REPLACE:
        case MemoryOperationType::INSERT:
        case MemoryOperationType::DELETE:
        case MemoryOperationType::RENAME:
            return AccessOperation::UPDATE;
        case MemoryOperationType::VIEW:
        default:
            return AccessOperation::VIEW;
    }
}

// ============================================================================
// Construction
// ============================================================================

ContextStats::ContextStats()
    : ContextStats(Config{}) {
}

ContextStats::ContextStats(const Config& config)
    : config_(config), started_at_(Timestamp::Now()) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid ContextStats configuration");
    }
    OpenDatabase();
}

void ContextStats::OpenDatabase() {
    if (config_.storage_dir.empty()) {
        return;
    }

    try {
        StateDatabase::Config db_config;
        db_config.db_path = (std::filesystem::path(config_.storage_dir) / "stats.db").string();
        db_ = std::make_unique<StateDatabase>(db_config);
        db_->ExecuteOrThrow(R"(
            CREATE TABLE IF NOT EXISTS clear_events (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                timestamp INTEGER NOT NULL,
                input_tokens INTEGER NOT NULL,
                tool_uses_cleared INTEGER NOT NULL,
                tokens_saved INTEGER NOT NULL,
                trigger_type TEXT NOT NULL,
                agent_id TEXT,
                patterns_preserved INTEGER NOT NULL,
                hook_executed INTEGER NOT NULL
            );
            CREATE TABLE IF NOT EXISTS memory_operations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                timestamp INTEGER NOT NULL,
                operation TEXT NOT NULL,
                path TEXT NOT NULL,
                success INTEGER NOT NULL,
                agent_id TEXT,
                tokens_used INTEGER NOT NULL
            );
            CREATE TABLE IF NOT EXISTS sessions (
                session_id TEXT PRIMARY KEY,
                start_time INTEGER NOT NULL,
                end_time INTEGER,
                total_input_tokens INTEGER NOT NULL,
                total_output_tokens INTEGER NOT NULL,
                clear_events INTEGER NOT NULL,
                tokens_saved INTEGER NOT NULL,
                memory_operations INTEGER NOT NULL,
                agent_id TEXT,
                peak_tokens INTEGER NOT NULL
            );
        )");
    } catch (const std::exception& e) {
        std::cerr << "[ContextStats] Statistics persistence disabled: " << e.what() << std::endl;
        db_.reset();
    }
}

void ContextStats::Initialize() {
    if (!db_) {
        return;
    }

    try {
        std::deque<ContextClearEvent> events;
        auto clear_stmt = db_->Prepare(
            "SELECT timestamp, input_tokens, tool_uses_cleared, tokens_saved, trigger_type, "
            "agent_id, patterns_preserved, hook_executed FROM clear_events ORDER BY id ASC;");
        while (clear_stmt.Step()) {
            ContextClearEvent event;
            event.timestamp = Timestamp::FromMicros(clear_stmt.ColumnInt64(0));
            event.input_tokens = static_cast<uint64_t>(clear_stmt.ColumnInt64(1));
            event.tool_uses_cleared = static_cast<uint64_t>(clear_stmt.ColumnInt64(2));
            event.tokens_saved = static_cast<uint64_t>(clear_stmt.ColumnInt64(3));
            event.trigger = ParseClearTrigger(clear_stmt.ColumnText(4)).value_or(ClearTrigger::MANUAL);
            event.agent_id = OptionalText(clear_stmt, 5);
            event.patterns_preserved = static_cast<size_t>(clear_stmt.ColumnInt64(6));
            event.pre_clear_hook_executed = clear_stmt.ColumnInt64(7) != 0;
            events.push_back(std::move(event));
        }

        std::deque<MemoryOperationRecord> operations;
        auto op_stmt = db_->Prepare(
            "SELECT timestamp, operation, path, success, agent_id, tokens_used "
            "FROM memory_operations ORDER BY id ASC;");
        while (op_stmt.Step()) {
            auto op = ParseMemoryOperationType(op_stmt.ColumnText(1));
            if (!op) {
                continue;
            }
            MemoryOperationRecord record;
            record.timestamp = Timestamp::FromMicros(op_stmt.ColumnInt64(0));
            record.operation = *op;
            record.path = op_stmt.ColumnText(2);
            record.success = op_stmt.ColumnInt64(3) != 0;
            record.agent_id = OptionalText(op_stmt, 4);
            record.tokens_used = static_cast<uint64_t>(op_stmt.ColumnInt64(5));
            operations.push_back(std::move(record));
        }

        while (events.size() > config_.max_clear_events) {
            events.pop_front();
        }
        while (operations.size() > config_.max_memory_operations) {
            operations.pop_front();
        }
        clear_events_ = std::move(events);
        memory_operations_ = std::move(operations);

        if (config_.verbose) {
            std::cerr << "[ContextStats] Loaded " << clear_events_.size() << " clear events, "
                      << memory_operations_.size() << " memory operations" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ContextStats] Failed to load statistics: " << e.what() << std::endl;
    }
}

// ============================================================================
// Sessions
// ============================================================================

std::string ContextStats::StartSession(const std::optional<std::string>& agent_id, Timestamp now) {
    if (current_session_) {
        EndSession(now);
    }

    SessionMetrics session;
    session.session_id = "session-" + std::to_string(now.ToMicros()) + "-" +
                         std::to_string(++session_counter_);
    session.start_time = now;
    session.agent_id = agent_id;
    current_session_ = session;
    return session.session_id;
}

std::optional<SessionMetrics> ContextStats::EndSession(Timestamp now) {
    if (!current_session_) {
        return std::nullopt;
    }

    SessionMetrics completed = std::move(*current_session_);
    current_session_.reset();
    completed.end_time = now;
    PersistSession(completed);
    return completed;
}

void ContextStats::UpdateTokenUsage(uint64_t input_tokens, uint64_t output_tokens) {
    if (!current_session_) {
        return;
    }
    current_session_->total_input_tokens += input_tokens;
    current_session_->total_output_tokens += output_tokens;
    current_session_->peak_tokens = std::max(current_session_->peak_tokens, input_tokens);
}

std::optional<SessionMetrics> ContextStats::GetSession(const std::string& session_id) const {
    if (current_session_ && current_session_->session_id == session_id) {
        return current_session_;
    }
    if (!db_) {
        return std::nullopt;
    }

    try {
        auto stmt = db_->Prepare(
            "SELECT start_time, end_time, total_input_tokens, total_output_tokens, clear_events, "
            "tokens_saved, memory_operations, agent_id, peak_tokens FROM sessions WHERE session_id = ?;");
        stmt.BindText(1, session_id);
        if (!stmt.Step()) {
            return std::nullopt;
        }

        SessionMetrics session;
        session.session_id = session_id;
        session.start_time = Timestamp::FromMicros(stmt.ColumnInt64(0));
        if (!stmt.ColumnIsNull(1)) {
            session.end_time = Timestamp::FromMicros(stmt.ColumnInt64(1));
        }
        session.total_input_tokens = static_cast<uint64_t>(stmt.ColumnInt64(2));
        session.total_output_tokens = static_cast<uint64_t>(stmt.ColumnInt64(3));
        session.clear_events = static_cast<size_t>(stmt.ColumnInt64(4));
        session.tokens_saved = static_cast<uint64_t>(stmt.ColumnInt64(5));
        session.memory_operations = static_cast<size_t>(stmt.ColumnInt64(6));
        session.agent_id = OptionalText(stmt, 7);
        session.peak_tokens = static_cast<uint64_t>(stmt.ColumnInt64(8));
        return session;
    } catch (const std::exception& e) {
        std::cerr << "[ContextStats] Failed to load session " << session_id << ": "
                  << e.what() << std::endl;
        return std::nullopt;
    }
}

// ============================================================================
// Events
// ============================================================================

ContextClearEvent ContextStats::TrackClearEvent(ContextClearEvent event, Timestamp now) {
    event.timestamp = now;
    event.patterns_preserved = 0;
    event.pre_clear_hook_executed = !hooks_.empty();

    // Hooks may register or unregister hooks while running
    const auto hooks = hooks_;
    for (const auto& [id, hook] : hooks) {
        try {
            event.patterns_preserved += hook(static_cast<size_t>(event.input_tokens), event.agent_id);
        } catch (const std::exception& e) {
            std::cerr << "[ContextStats] Pre-clear hook " << id << " failed: " << e.what() << std::endl;
        }
    }

    clear_events_.push_back(event);
    while (clear_events_.size() > config_.max_clear_events) {
        clear_events_.pop_front();
    }

    if (current_session_) {
        current_session_->clear_events++;
        current_session_->tokens_saved += event.tokens_saved;
    }

    PersistClearEvent(event);

    if (config_.verbose) {
        std::cerr << "[ContextStats] Clear at " << event.input_tokens << " tokens ("
                  << ToString(event.trigger) << "), " << event.patterns_preserved
                  << " patterns preserved" << std::endl;
    }
    return event;
}

void ContextStats::TrackMemoryOperation(MemoryOperationRecord record, Timestamp now) {
    record.timestamp = now;

    memory_operations_.push_back(record);
    while (memory_operations_.size() > config_.max_memory_operations) {
        memory_operations_.pop_front();
    }

    if (current_session_) {
        current_session_->memory_operations++;
    }

    PersistMemoryOperation(record);
}

ContextStatistics ContextStats::GetStatistics(Timestamp now) const {
    ContextStatistics stats;

    for (const auto& event : clear_events_) {
        stats.total_tokens_processed += event.input_tokens;
        stats.total_tokens_saved += event.tokens_saved;
        if (event.agent_id) {
            stats.clear_events_by_agent[*event.agent_id]++;
        }
    }
    for (const auto& record : memory_operations_) {
        stats.memory_operations_by_type[ToString(record.operation)]++;
    }

    stats.total_clear_events = clear_events_.size();
    stats.total_memory_operations = memory_operations_.size();
    if (!clear_events_.empty()) {
        stats.avg_tokens_per_clear = static_cast<double>(stats.total_tokens_saved) /
                                     static_cast<double>(clear_events_.size());
        stats.last_clear_event = clear_events_.back();
    }
    stats.uptime_seconds = std::max(0.0, SecondsBetween(now, started_at_));
    return stats;
}

std::vector<ContextClearEvent> ContextStats::GetClearEvents(std::optional<Timestamp> since,
                                                            std::optional<Timestamp> until) const {
    std::vector<ContextClearEvent> result;
    for (const auto& event : clear_events_) {
        if (InRange(event, since, until)) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<MemoryOperationRecord> ContextStats::GetMemoryOperations(
    std::optional<Timestamp> since, std::optional<Timestamp> until) const {
    std::vector<MemoryOperationRecord> result;
    for (const auto& record : memory_operations_) {
        if (InRange(record, since, until)) {
            result.push_back(record);
        }
    }
    return result;
}

size_t ContextStats::Cleanup(double days_to_keep, Timestamp now) {
    auto cutoff = now - std::chrono::duration<double, std::ratio<86400>>(days_to_keep);

    size_t before = clear_events_.size() + memory_operations_.size();
    clear_events_.erase(
        std::remove_if(clear_events_.begin(), clear_events_.end(),
                       [&](const ContextClearEvent& e) { return e.timestamp < cutoff; }),
        clear_events_.end());
    memory_operations_.erase(
        std::remove_if(memory_operations_.begin(), memory_operations_.end(),
                       [&](const MemoryOperationRecord& r) { return r.timestamp < cutoff; }),
        memory_operations_.end());
    size_t removed = before - (clear_events_.size() + memory_operations_.size());

    if (db_) {
        try {
            StateDatabase::Transaction txn(*db_);
            auto events = db_->Prepare("DELETE FROM clear_events WHERE timestamp < ?;");
            events.BindInt64(1, cutoff.ToMicros());
            events.Step();
            auto operations = db_->Prepare("DELETE FROM memory_operations WHERE timestamp < ?;");
            operations.BindInt64(1, cutoff.ToMicros());
            operations.Step();
            txn.Commit();
        } catch (const std::exception& e) {
            std::cerr << "[ContextStats] Failed to clean up statistics: " << e.what() << std::endl;
        }
    }

    if (config_.verbose && removed > 0) {
        std::cerr << "[ContextStats] Removed " << removed << " records older than "
                  << days_to_keep << " days" << std::endl;
    }
    return removed;
}

// ============================================================================
// Pre-clear hooks
// ============================================================================

PreClearHookId ContextStats::RegisterPreClearHook(PreClearHook hook) {
    PreClearHookId id = next_hook_id_++;
    hooks_.emplace(id, std::move(hook));
    return id;
}

bool ContextStats::UnregisterPreClearHook(PreClearHookId id) {
    return hooks_.erase(id) > 0;
}

// ============================================================================
// Persistence
// ============================================================================

void ContextStats::PersistClearEvent(const ContextClearEvent& event) {
    if (!db_) {
        return;
    }

    try {
        StateDatabase::Transaction txn(*db_);

        auto insert = db_->Prepare(
            "INSERT INTO clear_events (timestamp, input_tokens, tool_uses_cleared, tokens_saved, "
            "trigger_type, agent_id, patterns_preserved, hook_executed) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        insert.BindInt64(1, event.timestamp.ToMicros())
            .BindInt64(2, static_cast<int64_t>(event.input_tokens))
            .BindInt64(3, static_cast<int64_t>(event.tool_uses_cleared))
            .BindInt64(4, static_cast<int64_t>(event.tokens_saved))
            .BindText(5, ToString(event.trigger));
        BindOptionalText(insert, 6, event.agent_id);
        insert.BindInt64(7, static_cast<int64_t>(event.patterns_preserved))
            .BindInt64(8, event.pre_clear_hook_executed ? 1 : 0);
        insert.Step();

        auto trim = db_->Prepare(
            "DELETE FROM clear_events WHERE id NOT IN ("
            "SELECT id FROM clear_events ORDER BY id DESC LIMIT ?);");
        trim.BindInt64(1, static_cast<int64_t>(config_.max_clear_events));
        trim.Step();

        txn.Commit();
    } catch (const std::exception& e) {
        std::cerr << "[ContextStats] Failed to persist clear event: " << e.what() << std::endl;
    }
}

void ContextStats::PersistMemoryOperation(const MemoryOperationRecord& record) {
    if (!db_) {
        return;
    }

    try {
        StateDatabase::Transaction txn(*db_);

        auto insert = db_->Prepare(
            "INSERT INTO memory_operations (timestamp, operation, path, success, agent_id, tokens_used) "
            "VALUES (?, ?, ?, ?, ?, ?);");
        insert.BindInt64(1, record.timestamp.ToMicros())
            .BindText(2, ToString(record.operation))
            .BindText(3, record.path)
            .BindInt64(4, record.success ? 1 : 0);
        BindOptionalText(insert, 5, record.agent_id);
        insert.BindInt64(6, static_cast<int64_t>(record.tokens_used));
        insert.Step();

        auto trim = db_->Prepare(
            "DELETE FROM memory_operations WHERE id NOT IN ("
            "SELECT id FROM memory_operations ORDER BY id DESC LIMIT ?);");
        trim.BindInt64(1, static_cast<int64_t>(config_.max_memory_operations));
        trim.Step();

        txn.Commit();
    } catch (const std::exception& e) {
        std::cerr << "[ContextStats] Failed to persist memory operation: " << e.what() << std::endl;
    }
}

void ContextStats::PersistSession(const SessionMetrics& session) {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare(
            "INSERT OR REPLACE INTO sessions (session_id, start_time, end_time, total_input_tokens, "
            "total_output_tokens, clear_events, tokens_saved, memory_operations, agent_id, peak_tokens) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
        stmt.BindText(1, session.session_id).BindInt64(2, session.start_time.ToMicros());
        if (session.end_time) {
            stmt.BindInt64(3, session.end_time->ToMicros());
        } else {
            stmt.BindNull(3);
        }
        stmt.BindInt64(4, static_cast<int64_t>(session.total_input_tokens))
            .BindInt64(5, static_cast<int64_t>(session.total_output_tokens))
            .BindInt64(6, static_cast<int64_t>(session.clear_events))
            .BindInt64(7, static_cast<int64_t>(session.tokens_saved))
            .BindInt64(8, static_cast<int64_t>(session.memory_operations));
        BindOptionalText(stmt, 9, session.agent_id);
        stmt.BindInt64(10, static_cast<int64_t>(session.peak_tokens));
        stmt.Step();
    } catch (const std::exception& e) {
        std::cerr << "[ContextStats] Failed to persist session: " << e.what() << std::endl;
    }
}

} // namespace ctxmem
