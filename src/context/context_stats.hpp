// File: src/context/context_stats.hpp
//
// Context Statistics
//
// Records context clear events, memory operations and per-session token
// usage, and owns the registry of pre-clear hooks that run before every
// clear so knowledge can be preserved first.

#pragma once

#include "core/types.hpp"
#include "storage/state_database.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxmem {

/// What caused a context clear
enum class ClearTrigger : uint8_t {
    INPUT_TOKENS = 0,   ///< Automatic, token threshold reached
    MANUAL = 1
};

const char* ToString(ClearTrigger trigger);
std::optional<ClearTrigger> ParseClearTrigger(const std::string& str);

/// Memory tool operations
enum class MemoryOperationType : uint8_t {
    VIEW = 0,
    CREATE = 1,
    STR_REPLACE = 2,
    INSERT = 3,
    DELETE = 4,
    RENAME = 5
};

const char* ToString(MemoryOperationType op);
std::optional<MemoryOperationType> ParseMemoryOperationType(const std::string& str);

/// Map a memory tool operation onto the access kind the tracker records
AccessOperation ToAccessOperation(MemoryOperationType op);

/// One context clear
struct ContextClearEvent {
    Timestamp timestamp;
    uint64_t input_tokens{0};
    uint64_t tool_uses_cleared{0};
    uint64_t tokens_saved{0};
    ClearTrigger trigger{ClearTrigger::MANUAL};
    std::optional<std::string> agent_id;

    /// Filled in by TrackClearEvent
    size_t patterns_preserved{0};
    bool pre_clear_hook_executed{false};
};

/// One memory tool operation
struct MemoryOperationRecord {
    Timestamp timestamp;
    MemoryOperationType operation{MemoryOperationType::VIEW};
    std::string path;
    bool success{true};
    std::optional<std::string> agent_id;
    uint64_t tokens_used{0};
};

/// Token accounting for one host session
struct SessionMetrics {
    std::string session_id;
    Timestamp start_time;
    std::optional<Timestamp> end_time;
    uint64_t total_input_tokens{0};
    uint64_t total_output_tokens{0};
    size_t clear_events{0};
    uint64_t tokens_saved{0};
    size_t memory_operations{0};
    std::optional<std::string> agent_id;
    uint64_t peak_tokens{0};
};

/// Aggregate view over the retained log
struct ContextStatistics {
    uint64_t total_tokens_processed{0};
    size_t total_clear_events{0};
    uint64_t total_tokens_saved{0};
    size_t total_memory_operations{0};
    double avg_tokens_per_clear{0.0};
    std::map<std::string, size_t> memory_operations_by_type;
    std::map<std::string, size_t> clear_events_by_agent;
    std::optional<ContextClearEvent> last_clear_event;
    double uptime_seconds{0.0};
};

/// Runs before a clear: (token_count_at_clear, agent_id) -> patterns preserved
using PreClearHook = std::function<size_t(size_t, const std::optional<std::string>&)>;
using PreClearHookId = uint64_t;

class ContextStats {
public:
    /// Configuration for ContextStats
    struct Config {
        /// Directory for stats.db (empty: in-memory only)
        std::string storage_dir;

        /// Retention caps
        size_t max_clear_events{1000};
        size_t max_memory_operations{5000};

        /// Emit informational log lines
        bool verbose{false};

        bool IsValid() const {
            return max_clear_events > 0 && max_memory_operations > 0;
        }
    };

    /// Construct with default configuration (in-memory)
    ContextStats();

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit ContextStats(const Config& config);

    ContextStats(const ContextStats&) = delete;
    ContextStats& operator=(const ContextStats&) = delete;

    /// Load retained events and operations
    void Initialize();

    // ========================================================================
    // Sessions
    // ========================================================================

    /// Start a new session, ending any open one
    /// @return Session id
    std::string StartSession(const std::optional<std::string>& agent_id = std::nullopt,
                             Timestamp now = Timestamp::Now());

    /// End the current session and persist it
    /// @return The completed session, or nullopt if none was open
    std::optional<SessionMetrics> EndSession(Timestamp now = Timestamp::Now());

    /// Add token usage to the current session (no-op without one)
    void UpdateTokenUsage(uint64_t input_tokens, uint64_t output_tokens);

    const std::optional<SessionMetrics>& GetCurrentSession() const { return current_session_; }

    /// Look up a completed session by id
    std::optional<SessionMetrics> GetSession(const std::string& session_id) const;

    // ========================================================================
    // Events
    // ========================================================================

    /// Run every pre-clear hook, then record the clear
    ///
    /// A hook that throws is logged and contributes nothing; the clear is
    /// still recorded.
    ///
    /// @return The recorded event, with hook results filled in
    ContextClearEvent TrackClearEvent(ContextClearEvent event, Timestamp now = Timestamp::Now());

    /// Record a memory operation
    void TrackMemoryOperation(MemoryOperationRecord record, Timestamp now = Timestamp::Now());

    ContextStatistics GetStatistics(Timestamp now = Timestamp::Now()) const;

    /// Clear events within [since, until]
    std::vector<ContextClearEvent> GetClearEvents(
        std::optional<Timestamp> since = std::nullopt,
        std::optional<Timestamp> until = std::nullopt) const;

    /// Memory operations within [since, until]
    std::vector<MemoryOperationRecord> GetMemoryOperations(
        std::optional<Timestamp> since = std::nullopt,
        std::optional<Timestamp> until = std::nullopt) const;

    /// Drop events and operations older than days_to_keep
    /// @return Number of records removed
    size_t Cleanup(double days_to_keep = 30.0, Timestamp now = Timestamp::Now());

    // ========================================================================
    // Pre-clear hooks
    // ========================================================================

    PreClearHookId RegisterPreClearHook(PreClearHook hook);

    /// @return false if no hook has this id
    bool UnregisterPreClearHook(PreClearHookId id);

    void ClearPreClearHooks() { hooks_.clear(); }
    size_t GetPreClearHookCount() const { return hooks_.size(); }

    bool IsPersistent() const { return db_ != nullptr; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    Timestamp started_at_;
    std::deque<ContextClearEvent> clear_events_;
    std::deque<MemoryOperationRecord> memory_operations_;
    std::optional<SessionMetrics> current_session_;
    std::map<PreClearHookId, PreClearHook> hooks_;
    PreClearHookId next_hook_id_{1};
    uint64_t session_counter_{0};
    std::unique_ptr<StateDatabase> db_;

    void OpenDatabase();
    void PersistClearEvent(const ContextClearEvent& event);
    void PersistMemoryOperation(const MemoryOperationRecord& record);
    void PersistSession(const SessionMetrics& session);
};

} // namespace ctxmem
