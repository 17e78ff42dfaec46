// File: src/context/drift_checks.cpp
#include "context/drift_checks.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace ctxmem {

// ============================================================================
// Severity helpers
// ============================================================================

const char* ToString(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::NONE:
            return "none";
        case DriftSeverity::LOW:
            return "low";
        case DriftSeverity::MEDIUM:
            return "medium";
        case DriftSeverity::HIGH:
            return "high";
        case DriftSeverity::CRITICAL:
            return "critical";
        default:
            return "unknown";
    }
}

int SeverityPoints(DriftSeverity severity) {
    switch (severity) {
        case DriftSeverity::CRITICAL:
            return 40;
        case DriftSeverity::HIGH:
            return 25;
        case DriftSeverity::MEDIUM:
            return 15;
        case DriftSeverity::LOW:
            return 5;
        default:
            return 0;
    }
}

DriftSeverity SeverityForScore(int score) {
    if (score >= 80) return DriftSeverity::CRITICAL;
    if (score >= 60) return DriftSeverity::HIGH;
    if (score >= 30) return DriftSeverity::MEDIUM;
    if (score >= 10) return DriftSeverity::LOW;
    return DriftSeverity::NONE;
}

const char* ToString(DriftType type) {
    switch (type) {
        case DriftType::FILE_STALENESS:
            return "file_staleness";
        case DriftType::TASK_SWITCH:
            return "task_switch";
        case DriftType::CONVERSATION_DEPTH:
            return "conversation_depth";
        case DriftType::AGENT_SWITCH:
            return "agent_switch";
        case DriftType::OBSOLETE_PATTERN:
            return "obsolete_pattern";
        default:
            return "unknown";
    }
}

std::vector<std::string> DistinctInWindow(const std::deque<std::string>& history, size_t window) {
    size_t start = history.size() > window ? history.size() - window : 0;

    std::vector<std::string> distinct;
    std::unordered_set<std::string> seen;
    for (size_t i = start; i < history.size(); ++i) {
        if (seen.insert(history[i]).second) {
            distinct.push_back(history[i]);
        }
    }
    return distinct;
}

// ============================================================================
// FileStalenessCheck
// ============================================================================

std::optional<DriftIndicator> FileStalenessCheck::Check(const DriftState& state,
                                                        const Timestamp& now) const {
    std::vector<std::string> stale;
    for (const auto& [path, record] : state.files) {
        uint64_t since_access = state.message_count >= record.last_message_index
            ? state.message_count - record.last_message_index
            : 0;
        if (since_access >= threshold_) {
            stale.push_back(path);
        }
    }

    if (stale.empty()) {
        return std::nullopt;
    }

    DriftIndicator indicator;
    indicator.type = DriftType::FILE_STALENESS;
    indicator.severity = stale.size() > 10 ? DriftSeverity::HIGH
                       : stale.size() > 5 ? DriftSeverity::MEDIUM
                       : DriftSeverity::LOW;

    std::ostringstream description;
    description << stale.size() << " files not accessed in " << threshold_ << "+ messages";
    indicator.description = description.str();
    indicator.affected_paths = std::move(stale);
    indicator.recommendation = indicator.severity == DriftSeverity::HIGH
        ? "Clear context and re-establish current file focus"
        : "Consider clearing stale file context if working on a new area";
    indicator.timestamp = now;
    return indicator;
}

double FileStalenessCheck::EstimateWaste(const DriftIndicator& indicator,
                                         uint64_t current_tokens) const {
    (void)current_tokens;
    return static_cast<double>(indicator.affected_paths.size()) * 500.0;
}

// ============================================================================
// TaskSwitchCheck
// ============================================================================

std::optional<DriftIndicator> TaskSwitchCheck::Check(const DriftState& state,
                                                     const Timestamp& now) const {
    auto distinct = DistinctInWindow(state.task_history, window_);
    if (distinct.size() < threshold_) {
        return std::nullopt;
    }

    DriftIndicator indicator;
    indicator.type = DriftType::TASK_SWITCH;
    indicator.severity = distinct.size() > 8 ? DriftSeverity::HIGH
                       : distinct.size() > 5 ? DriftSeverity::MEDIUM
                       : DriftSeverity::LOW;
    indicator.description = std::to_string(distinct.size()) + " different tasks in recent conversation";
    indicator.recommendation = "Context is fragmented. Consider clearing and focusing on a single task.";
    indicator.timestamp = now;
    return indicator;
}

double TaskSwitchCheck::EstimateWaste(const DriftIndicator& indicator,
                                      uint64_t current_tokens) const {
    (void)indicator;
    return static_cast<double>(current_tokens) * 0.10;
}

// ============================================================================
// ConversationDepthCheck
// ============================================================================

std::optional<DriftIndicator> ConversationDepthCheck::Check(const DriftState& state,
                                                            const Timestamp& now) const {
    if (state.message_count < threshold_) {
        return std::nullopt;
    }

    DriftIndicator indicator;
    indicator.type = DriftType::CONVERSATION_DEPTH;
    indicator.severity = state.message_count >= critical_at_ ? DriftSeverity::CRITICAL
                       : state.message_count >= high_at_ ? DriftSeverity::HIGH
                       : DriftSeverity::MEDIUM;
    indicator.description = "Very long conversation (" + std::to_string(state.message_count) + " messages)";
    indicator.recommendation = indicator.severity == DriftSeverity::CRITICAL
        ? "CRITICAL: Context likely degraded. Clear immediately and start fresh."
        : "Long conversation detected. Consider clearing to maintain context quality.";
    indicator.timestamp = now;
    return indicator;
}

double ConversationDepthCheck::EstimateWaste(const DriftIndicator& indicator,
                                             uint64_t current_tokens) const {
    (void)indicator;
    return static_cast<double>(current_tokens) * 0.25;
}

// ============================================================================
// AgentSwitchCheck
// ============================================================================

std::optional<DriftIndicator> AgentSwitchCheck::Check(const DriftState& state,
                                                      const Timestamp& now) const {
    auto distinct = DistinctInWindow(state.agent_history, window_);
    if (distinct.size() < threshold_) {
        return std::nullopt;
    }

    DriftIndicator indicator;
    indicator.type = DriftType::AGENT_SWITCH;
    indicator.severity = distinct.size() > 6 ? DriftSeverity::HIGH
                       : distinct.size() > 4 ? DriftSeverity::MEDIUM
                       : DriftSeverity::LOW;
    indicator.description = std::to_string(distinct.size()) + " different agents in recent history";
    indicator.affected_agents = std::move(distinct);
    indicator.recommendation = "Frequent agent switching detected. Consider focusing the workflow or clearing context.";
    indicator.timestamp = now;
    return indicator;
}

double AgentSwitchCheck::EstimateWaste(const DriftIndicator& indicator,
                                       uint64_t current_tokens) const {
    (void)indicator;
    return static_cast<double>(current_tokens) * 0.05;
}

// ============================================================================
// ObsoletePatternCheck
// ============================================================================

std::optional<DriftIndicator> ObsoletePatternCheck::Check(const DriftState& state,
                                                          const Timestamp& now) const {
    (void)state;
    (void)now;
    return std::nullopt;
}

} // namespace ctxmem
