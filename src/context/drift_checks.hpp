// File: src/context/drift_checks.hpp
//
// Drift Checks
//
// Independent detectors that inspect the drift tracking state and each
// optionally emit one DriftIndicator. The DriftDetector runs every
// registered check and aggregates their indicators into a score.

#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ctxmem {

/// Drift severity levels
enum class DriftSeverity : uint8_t {
    NONE = 0,       ///< No drift detected
    LOW = 1,        ///< Minor drift, monitor only
    MEDIUM = 2,     ///< Moderate drift, suggest clearing
    HIGH = 3,       ///< Significant drift, recommend clearing
    CRITICAL = 4    ///< Severe drift, immediate clearing needed
};

/// Convert DriftSeverity to string
const char* ToString(DriftSeverity severity);

/// Score contribution: CRITICAL 40, HIGH 25, MEDIUM 15, LOW 5, NONE 0
int SeverityPoints(DriftSeverity severity);

/// Overall severity for a score: >=80 CRITICAL, >=60 HIGH, >=30 MEDIUM, >=10 LOW
DriftSeverity SeverityForScore(int score);

/// Kind of drift an indicator reports
enum class DriftType : uint8_t {
    FILE_STALENESS = 0,
    TASK_SWITCH = 1,
    CONVERSATION_DEPTH = 2,
    AGENT_SWITCH = 3,
    OBSOLETE_PATTERN = 4
};

/// Convert DriftType to string
const char* ToString(DriftType type);

/// One detected drift signal
struct DriftIndicator {
    DriftType type{DriftType::FILE_STALENESS};
    DriftSeverity severity{DriftSeverity::NONE};
    std::string description;
    std::vector<std::string> affected_paths;
    std::vector<std::string> affected_agents;
    std::string recommendation;
    Timestamp timestamp;
};

/// Per-file access record, indexed by message count
struct FileAccessRecord {
    uint64_t last_message_index{0};   ///< message_count at the last access
    uint64_t access_count{0};
    Timestamp last_access;
};

/// Transient counters the checks inspect
struct DriftState {
    std::map<std::string, FileAccessRecord> files;
    std::deque<std::string> task_history;     ///< Oldest first
    std::deque<std::string> agent_history;    ///< Oldest first
    uint64_t message_count{0};
};

/// Distinct entries among the last `window` of history
std::vector<std::string> DistinctInWindow(const std::deque<std::string>& history, size_t window);

/// Abstract drift detector
class IDriftCheck {
public:
    virtual ~IDriftCheck() = default;

    /// Check name (for logs)
    virtual std::string GetName() const = 0;

    /// Inspect state and emit at most one indicator
    virtual std::optional<DriftIndicator> Check(const DriftState& state,
                                                const Timestamp& now) const = 0;

    /// Tokens likely wasted because of this indicator
    virtual double EstimateWaste(const DriftIndicator& indicator, uint64_t current_tokens) const {
        (void)indicator;
        (void)current_tokens;
        return 0.0;
    }
};

// ============================================================================
// Built-in checks
// ============================================================================

/// Files not touched in `threshold` messages (>10 HIGH, >5 MEDIUM, else LOW)
class FileStalenessCheck : public IDriftCheck {
public:
    explicit FileStalenessCheck(uint64_t threshold = 50) : threshold_(threshold) {}

    std::string GetName() const override { return "file_staleness"; }
    std::optional<DriftIndicator> Check(const DriftState& state, const Timestamp& now) const override;

    /// 500 tokens per stale file
    double EstimateWaste(const DriftIndicator& indicator, uint64_t current_tokens) const override;

private:
    uint64_t threshold_;
};

/// Many distinct tasks among the recent ones (>8 HIGH, >5 MEDIUM, else LOW)
class TaskSwitchCheck : public IDriftCheck {
public:
    TaskSwitchCheck(size_t threshold = 5, size_t window = 10)
        : threshold_(threshold), window_(window) {}

    std::string GetName() const override { return "task_switch"; }
    std::optional<DriftIndicator> Check(const DriftState& state, const Timestamp& now) const override;

    /// 10% of current tokens
    double EstimateWaste(const DriftIndicator& indicator, uint64_t current_tokens) const override;

private:
    size_t threshold_;
    size_t window_;
};

/// Long conversations (MEDIUM, HIGH at high_at, CRITICAL at critical_at)
class ConversationDepthCheck : public IDriftCheck {
public:
    ConversationDepthCheck(uint64_t threshold = 200, uint64_t high_at = 250, uint64_t critical_at = 300)
        : threshold_(threshold), high_at_(high_at), critical_at_(critical_at) {}

    std::string GetName() const override { return "conversation_depth"; }
    std::optional<DriftIndicator> Check(const DriftState& state, const Timestamp& now) const override;

    /// 25% of current tokens
    double EstimateWaste(const DriftIndicator& indicator, uint64_t current_tokens) const override;

private:
    uint64_t threshold_;
    uint64_t high_at_;
    uint64_t critical_at_;
};

/// Many distinct agents among recent activations (>6 HIGH, >4 MEDIUM, else LOW)
class AgentSwitchCheck : public IDriftCheck {
public:
    AgentSwitchCheck(size_t threshold = 4, size_t window = 10)
        : threshold_(threshold), window_(window) {}

    std::string GetName() const override { return "agent_switch"; }
    std::optional<DriftIndicator> Check(const DriftState& state, const Timestamp& now) const override;

    /// 5% of current tokens
    double EstimateWaste(const DriftIndicator& indicator, uint64_t current_tokens) const override;

private:
    size_t threshold_;
    size_t window_;
};

/// Extension point for references to deleted or renamed paths; reports nothing
class ObsoletePatternCheck : public IDriftCheck {
public:
    std::string GetName() const override { return "obsolete_pattern"; }
    std::optional<DriftIndicator> Check(const DriftState& state, const Timestamp& now) const override;
};

} // namespace ctxmem
