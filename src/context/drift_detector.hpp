// File: src/context/drift_detector.hpp
//
// Context Drift Detector
//
// Tracks file accesses, task and agent switches and conversation length,
// runs every registered IDriftCheck against that state and aggregates the
// indicators into a bounded drift score with a clear/keep recommendation.

#pragma once

#include "context/drift_checks.hpp"
#include "storage/state_database.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ctxmem {

/// Aggregated drift assessment
struct DriftDetectionResult {
    DriftSeverity overall_severity{DriftSeverity::NONE};
    int drift_score{0};                         ///< [0, 100]
    std::vector<DriftIndicator> indicators;
    std::vector<std::string> recommendations;
    bool should_clear_context{false};
    uint64_t token_waste_estimate{0};
};

class DriftDetector {
public:
    /// Configuration for DriftDetector
    struct Config {
        /// Directory for state.db (empty: in-memory only)
        std::string storage_dir;

        /// Messages without access before a file counts as stale
        uint64_t file_staleness_threshold{50};

        /// Distinct tasks in the window that signal fragmentation
        size_t task_switch_threshold{5};

        /// Conversation depth bands
        uint64_t conversation_depth_threshold{200};
        uint64_t conversation_depth_high{250};
        uint64_t conversation_depth_critical{300};

        /// Distinct agents in the window that signal thrashing
        size_t agent_switch_threshold{4};

        /// Recent entries inspected by the switch checks
        size_t switch_window{10};

        /// Task/agent history retained
        size_t history_limit{20};

        /// Optional checks
        bool detect_obsolete_patterns{true};
        bool detect_agent_switches{true};

        /// Score at which clearing is recommended
        int clear_score_threshold{70};

        /// Token count above which a high-usage recommendation is added
        uint64_t high_token_usage{150000};

        /// Emit informational log lines
        bool verbose{false};

        bool IsValid() const;
    };

    /// Construct with default configuration (in-memory)
    DriftDetector();

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit DriftDetector(const Config& config);

    DriftDetector(const DriftDetector&) = delete;
    DriftDetector& operator=(const DriftDetector&) = delete;

    /// Load persisted tracking state
    void Initialize();

    // ========================================================================
    // Tracking
    // ========================================================================

    /// Record that a path was touched at the current message index
    void TrackFileAccess(const std::string& path, Timestamp now = Timestamp::Now());

    /// Record the task the current message works on
    void TrackTask(const std::string& task);

    /// Record an agent activation
    void TrackAgentActivation(const std::string& agent_id);

    /// Advance the message counter
    void TrackMessage();

    /// Clear all tracking state (in memory and on disk). Idempotent.
    void Reset();

    // ========================================================================
    // Detection
    // ========================================================================

    /// Run every check and aggregate the result
    /// @param current_tokens Current context size, used for waste estimates
    DriftDetectionResult DetectDrift(uint64_t current_tokens, Timestamp now = Timestamp::Now()) const;

    /// Register an additional check
    void AddCheck(std::unique_ptr<IDriftCheck> check);

    size_t GetCheckCount() const { return checks_.size(); }
    const DriftState& GetState() const { return state_; }
    const Config& GetConfig() const { return config_; }
    bool IsPersistent() const { return db_ != nullptr; }

private:
    Config config_;
    DriftState state_;
    std::vector<std::unique_ptr<IDriftCheck>> checks_;
    std::unique_ptr<StateDatabase> db_;

    void OpenDatabase();
    void PushHistory(std::deque<std::string>& history, const std::string& kind,
                     const std::string& value);
    void PersistFile(const std::string& path, const FileAccessRecord& record);
    void PersistMessageCount();
};

} // namespace ctxmem
