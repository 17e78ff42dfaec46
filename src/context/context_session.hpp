// File: src/context/context_session.hpp
//
// Context Session
//
// Owns one instance of every context memory component for a host session
// and wires them together: each memory operation feeds the access tracker,
// the drift detector and the statistics log; Evaluate() folds the token
// forecast and the drift assessment into a single clear decision.

#pragma once

#include "config/ctxmem_config.hpp"
#include "context/context_stats.hpp"
#include "context/drift_detector.hpp"
#include "memory/access_tracker.hpp"
#include "memory/cache_warmer.hpp"
#include "memory/tiered_store.hpp"
#include "prediction/token_forecaster.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ctxmem {

/// What the host should do with its context window
enum class ClearAction : uint8_t {
    CONTINUE = 0,
    EXTRACT_THEN_CLEAR = 1,
    CLEAR_NOW = 2
};

const char* ToString(ClearAction action);

/// Combined forecast and drift verdict
struct ClearDecision {
    ClearAction action{ClearAction::CONTINUE};
    ForecastResult forecast;
    DriftDetectionResult drift;
    std::string reason;
};

/// Outcome of a maintenance pass
struct MaintenanceReport {
    MigrationResult migration;
    size_t patterns_pruned{0};
    size_t training_points_pruned{0};
    size_t stale_fragments_cleared{0};
    size_t stats_records_removed{0};
    bool tracker_flushed{false};
    std::chrono::microseconds elapsed{0};
};

class ContextSession {
public:
    /// Build every component from config
    /// @throws std::invalid_argument if config does not validate
    explicit ContextSession(const CtxmemConfig& config);

    /// Ends the statistics session
    ~ContextSession();

    ContextSession(const ContextSession&) = delete;
    ContextSession& operator=(const ContextSession&) = delete;

    /// Reload persisted state of every component and start a stats session
    void Initialize(Timestamp now = Timestamp::Now());

    // ========================================================================
    // Memory operations
    // ========================================================================

    /// Record a memory tool operation with tracker, drift detector and stats
    void RecordMemoryOperation(const std::string& path,
                               MemoryOperationType operation,
                               const std::optional<std::string>& agent_id = std::nullopt,
                               const std::optional<std::string>& context = std::nullopt,
                               bool success = true,
                               uint64_t tokens_used = 0,
                               Timestamp now = Timestamp::Now());

    /// Write an item to the hot tier and record the operation
    /// @throws std::invalid_argument on an invalid path
    bool StoreKnowledge(const std::string& path, const std::string& content,
                        const std::optional<std::string>& agent_id = std::nullopt,
                        Timestamp now = Timestamp::Now());

    /// Read an item (may promote it) and record the operation
    RetrieveResult RetrieveKnowledge(const std::string& path,
                                     const std::optional<std::string>& agent_id = std::nullopt,
                                     Timestamp now = Timestamp::Now());

    // ========================================================================
    // Conversation events
    // ========================================================================

    /// Count a host message, optionally tagged with the task it works on
    void OnUserMessage(const std::optional<std::string>& task = std::nullopt);

    /// Track an agent activation and warm that agent's items when enabled
    WarmingResult ActivateAgent(const std::string& agent_id, Timestamp now = Timestamp::Now());

    // ========================================================================
    // Decisions
    // ========================================================================

    /// CLEAR_NOW when drift says clear or the forecast is EMERGENCY,
    /// EXTRACT_THEN_CLEAR when the forecast is EXTRACT_NOW, else CONTINUE
    ClearDecision Evaluate(const ForecastMetrics& metrics, Timestamp now = Timestamp::Now()) const;

    /// Record a clear (running pre-clear hooks) and reset drift tracking
    ContextClearEvent ExecuteClear(uint64_t current_tokens,
                                   const std::optional<std::string>& agent_id = std::nullopt,
                                   ClearTrigger trigger = ClearTrigger::MANUAL,
                                   uint64_t tool_uses_cleared = 0,
                                   Timestamp now = Timestamp::Now());

    /// Migration sweep, pattern purge, training prune, fragment cleanup,
    /// statistics cleanup and tracker flush
    MaintenanceReport RunMaintenance(Timestamp now = Timestamp::Now());

    // ========================================================================
    // Components
    // ========================================================================

    AccessTracker& GetTracker() { return *tracker_; }
    TieredStore& GetStore() { return *store_; }
    CacheWarmer& GetWarmer() { return *warmer_; }
    TokenForecaster& GetForecaster() { return *forecaster_; }
    DriftDetector& GetDriftDetector() { return *drift_; }
    ContextStats& GetStats() { return *stats_; }
    const CtxmemConfig& GetConfig() const { return config_; }

private:
    CtxmemConfig config_;
    std::unique_ptr<AccessTracker> tracker_;
    std::unique_ptr<TieredStore> store_;
    std::unique_ptr<TieredStoreSource> source_;
    std::unique_ptr<CacheWarmer> warmer_;
    std::unique_ptr<TokenForecaster> forecaster_;
    std::unique_ptr<DriftDetector> drift_;
    std::unique_ptr<ContextStats> stats_;

    /// Flushes tracker patterns so they survive the clear
    size_t PreservePatterns();
};

} // namespace ctxmem
