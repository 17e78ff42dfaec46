// File: src/memory/access_tracker.hpp
//
// Access Tracker
//
// Records every touch of a knowledge item and keeps a derived rollup
// (AccessPattern) per path. The append-only event log is the source of
// truth for recency windows; patterns are mutable summaries rebuilt from
// it. Used by the cache warmer for candidate selection and by the host
// to rank and predict upcoming accesses.

#pragma once

#include "core/types.hpp"
#include "storage/flush_policy.hpp"
#include "storage/state_database.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace ctxmem {

// ============================================================================
// Agent Attribution
// ============================================================================

/// Only the most recent toucher is kept (last writer wins)
struct LastToucher {
    std::optional<std::string> agent_id;
};

/// Most recent toucher plus every agent that ever touched the item
struct ContributorSet {
    std::optional<std::string> agent_id;
    std::set<std::string> contributors;
};

using AgentAttribution = std::variant<LastToucher, ContributorSet>;

/// Attribution flavour used for newly tracked patterns
enum class AttributionMode {
    LAST_TOUCHER,
    CONTRIBUTOR_SET
};

/// Convert AttributionMode to string ("last_toucher", "contributor_set")
const char* ToString(AttributionMode mode);

/// Parse AttributionMode from string
std::optional<AttributionMode> ParseAttributionMode(const std::string& str);

/// Most recent toucher of either attribution flavour
std::optional<std::string> PrimaryAgent(const AgentAttribution& attribution);

/// Record a touch by agent_id (no-op for anonymous touches on ContributorSet)
void RecordToucher(AgentAttribution& attribution, const std::optional<std::string>& agent_id);

/// Check whether agent_id appears in the attribution
bool HasContributor(const AgentAttribution& attribution, const std::string& agent_id);

// ============================================================================
// Data Types
// ============================================================================

/// Derived rollup of all accesses to one path
struct AccessPattern {
    std::string path;
    uint64_t access_count{0};             ///< Monotonic total
    Timestamp first_accessed;
    Timestamp last_accessed;
    double avg_access_interval{0.0};      ///< Mean gap between accesses (seconds)
    uint64_t recent_access_count{0};      ///< Accesses in the trailing window
    AgentAttribution attribution;

    std::optional<std::string> GetAgent() const { return PrimaryAgent(attribution); }
};

/// Immutable access log entry
struct AccessEvent {
    std::string path;
    Timestamp timestamp;
    std::optional<std::string> agent_id;
    AccessOperation operation{AccessOperation::VIEW};
    std::optional<std::string> context;
};

/// Pattern with the score it was ranked by
struct ScoredPattern {
    AccessPattern pattern;
    double score{0.0};
};

/// Step function used by ranking: 100 (<1h), 80 (<24h), 50 (<1wk), 20 (<30d), 0
double RecencyScore(const Timestamp& last_accessed, const Timestamp& now);

// ============================================================================
// AccessTracker
// ============================================================================

class AccessTracker {
public:
    /// Configuration for AccessTracker
    struct Config {
        /// Directory for patterns.db (empty: in-memory only)
        std::string storage_dir;

        /// Event log ring buffer capacity
        size_t max_events{1000};

        /// Trailing window for recent_access_count (days)
        double recent_window_days{7.0};

        /// Attribution flavour for new patterns
        AttributionMode attribution_mode{AttributionMode::LAST_TOUCHER};

        /// Batched persistence
        FlushPolicy::Config flush;

        /// Emit informational log lines
        bool verbose{false};

        bool IsValid() const {
            return max_events > 0 && recent_window_days > 0.0 && flush.IsValid();
        }
    };

    /// Construct with default configuration (in-memory)
    AccessTracker();

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit AccessTracker(const Config& config);

    /// Flushes pending writes
    ~AccessTracker();

    AccessTracker(const AccessTracker&) = delete;
    AccessTracker& operator=(const AccessTracker&) = delete;

    /// Load persisted patterns and the event log (cold start if none)
    void Initialize();

    // ========================================================================
    // Recording
    // ========================================================================

    /// Record a touch of path
    ///
    /// Updates the pattern in place and queues it for batched persistence.
    /// Persistence failures are logged; the call itself never fails.
    void RecordAccess(const std::string& path,
                      const std::optional<std::string>& agent_id = std::nullopt,
                      AccessOperation operation = AccessOperation::VIEW,
                      const std::optional<std::string>& context = std::nullopt,
                      Timestamp now = Timestamp::Now());

    // ========================================================================
    // Queries
    // ========================================================================

    /// Patterns ranked by 0.6*recent + 0.3*total + 0.1*RecencyScore
    ///
    /// @param limit Maximum number of patterns
    /// @param now Evaluation time
    /// @return Patterns in descending score order
    std::vector<AccessPattern> GetTopPatterns(size_t limit, Timestamp now = Timestamp::Now());

    /// Patterns attributed to agent_id, most accessed first
    std::vector<AccessPattern> GetPatternsByAgent(const std::string& agent_id) const;

    /// Patterns accessed within the last `days`, most recent first
    std::vector<AccessPattern> GetRecentPatterns(double days, Timestamp now = Timestamp::Now()) const;

    /// Predict the items most likely to be touched next
    ///
    /// Score: 40 * min(recent/10, 1), +30 if the time since last access is
    /// within 2h of the average interval, +20 for the same agent, +10 if
    /// touched within the last hour. Only scores above 20, at most 10 items.
    std::vector<ScoredPattern> PredictNextPatterns(
        const std::optional<std::string>& current_agent = std::nullopt,
        Timestamp now = Timestamp::Now());

    /// Count logged accesses of path at or after `since`
    size_t CountAccessesSince(const std::string& path, const Timestamp& since) const;

    /// Get the pattern for path
    std::optional<AccessPattern> GetPattern(const std::string& path) const;

    /// Event log, oldest first
    const std::deque<AccessEvent>& GetEvents() const { return events_; }

    size_t GetTrackedPatternCount() const { return patterns_.size(); }

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Remove patterns not accessed for max_age_days
    /// @return Number of patterns removed
    size_t PruneOldPatterns(double max_age_days = 90.0, Timestamp now = Timestamp::Now());

    /// Write all pending changes
    /// @return true if written (or nothing to write), false on persistence fault
    bool Flush(Timestamp now = Timestamp::Now());

    /// Number of events waiting to be persisted
    size_t GetPendingWriteCount() const { return pending_events_.size(); }

    /// Patterns changed since the last flush
    size_t GetDirtyPatternCount() const { return dirty_paths_.size(); }

    /// Drop all patterns and events (memory and disk)
    void Clear();

    bool IsPersistent() const { return db_ != nullptr; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::unordered_map<std::string, AccessPattern> patterns_;
    std::deque<AccessEvent> events_;

    std::unique_ptr<StateDatabase> db_;
    FlushPolicy flush_policy_;
    std::deque<AccessEvent> pending_events_;
    std::unordered_set<std::string> dirty_paths_;

    void OpenDatabase();
    void CreateTables();
    void RefreshRecentCounts(const Timestamp& now);
    AgentAttribution NewAttribution() const;
    bool WritePending();
};

} // namespace ctxmem
