// File: src/context/drift_detector.cpp
#include "context/drift_detector.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace ctxmem {

namespace {

constexpr const char* kTaskHistory = "task";
constexpr const char* kAgentHistory = "agent";

const char* OverallRecommendation(int score) {
    if (score >= 70) {
        return "HIGH DRIFT DETECTED: Clear context immediately to restore focus";
    }
    if (score >= 50) {
        return "MODERATE DRIFT: Consider clearing context soon";
    }
    if (score >= 30) {
        return "MINOR DRIFT: Monitor and clear if needed";
    }
    return "NO SIGNIFICANT DRIFT: Context is healthy";
}

} // anonymous namespace

bool DriftDetector::Config::IsValid() const {
    if (file_staleness_threshold == 0 || task_switch_threshold == 0 || agent_switch_threshold == 0) {
        return false;
    }
    if (conversation_depth_threshold == 0 ||
        conversation_depth_high < conversation_depth_threshold ||
        conversation_depth_critical < conversation_depth_high) {
        return false;
    }
    if (switch_window == 0 || history_limit < switch_window) {
        return false;
    }
    if (clear_score_threshold <= 0 || clear_score_threshold > 100) {
        return false;
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

DriftDetector::DriftDetector()
    : DriftDetector(Config{}) {
}

DriftDetector::DriftDetector(const Config& config)
    : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid DriftDetector configuration");
    }

    checks_.push_back(std::make_unique<FileStalenessCheck>(config_.file_staleness_threshold));
    checks_.push_back(std::make_unique<TaskSwitchCheck>(config_.task_switch_threshold,
                                                        config_.switch_window));
    checks_.push_back(std::make_unique<ConversationDepthCheck>(config_.conversation_depth_threshold,
                                                               config_.conversation_depth_high,
                                                               config_.conversation_depth_critical));
    if (config_.detect_agent_switches) {
        checks_.push_back(std::make_unique<AgentSwitchCheck>(config_.agent_switch_threshold,
                                                             config_.switch_window));
    }
    if (config_.detect_obsolete_patterns) {
        checks_.push_back(std::make_unique<ObsoletePatternCheck>());
    }

    OpenDatabase();
}

void DriftDetector::OpenDatabase() {
    if (config_.storage_dir.empty()) {
        return;
    }

    try {
        StateDatabase::Config db_config;
        db_config.db_path = (std::filesystem::path(config_.storage_dir) / "state.db").string();
        db_ = std::make_unique<StateDatabase>(db_config);
        db_->ExecuteOrThrow(R"(
            CREATE TABLE IF NOT EXISTS drift_files (
                path TEXT PRIMARY KEY,
                last_message_index INTEGER NOT NULL,
                access_count INTEGER NOT NULL,
                last_access INTEGER NOT NULL
            );
            CREATE TABLE IF NOT EXISTS drift_history (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                kind TEXT NOT NULL,
                value TEXT NOT NULL
            );
            CREATE TABLE IF NOT EXISTS drift_counters (
                name TEXT PRIMARY KEY,
                value INTEGER NOT NULL
            );
        )");
    } catch (const std::exception& e) {
        std::cerr << "[DriftDetector] State persistence disabled: " << e.what() << std::endl;
        db_.reset();
    }
}

void DriftDetector::Initialize() {
    if (!db_) {
        return;
    }

    try {
        DriftState loaded;

        auto files = db_->Prepare(
            "SELECT path, last_message_index, access_count, last_access FROM drift_files;");
        while (files.Step()) {
            FileAccessRecord record;
            record.last_message_index = static_cast<uint64_t>(files.ColumnInt64(1));
            record.access_count = static_cast<uint64_t>(files.ColumnInt64(2));
            record.last_access = Timestamp::FromMicros(files.ColumnInt64(3));
            loaded.files[files.ColumnText(0)] = record;
        }

        auto history = db_->Prepare("SELECT kind, value FROM drift_history ORDER BY id ASC;");
        while (history.Step()) {
            std::string kind = history.ColumnText(0);
            if (kind == kTaskHistory) {
                loaded.task_history.push_back(history.ColumnText(1));
            } else if (kind == kAgentHistory) {
                loaded.agent_history.push_back(history.ColumnText(1));
            }
        }
        while (loaded.task_history.size() > config_.history_limit) {
            loaded.task_history.pop_front();
        }
        while (loaded.agent_history.size() > config_.history_limit) {
            loaded.agent_history.pop_front();
        }

        auto counters = db_->Prepare("SELECT value FROM drift_counters WHERE name = 'message_count';");
        if (counters.Step()) {
            loaded.message_count = static_cast<uint64_t>(counters.ColumnInt64(0));
        }

        state_ = std::move(loaded);

        if (config_.verbose) {
            std::cerr << "[DriftDetector] Restored " << state_.files.size() << " files, "
                      << state_.task_history.size() << " tasks, "
                      << state_.agent_history.size() << " agent activations, "
                      << state_.message_count << " messages" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[DriftDetector] Failed to load state: " << e.what() << std::endl;
    }
}

// ============================================================================
// Tracking
// ============================================================================

void DriftDetector::TrackFileAccess(const std::string& path, Timestamp now) {
    auto& record = state_.files[path];
    record.last_message_index = state_.message_count;
    record.access_count++;
    record.last_access = now;
    PersistFile(path, record);
}

void DriftDetector::TrackTask(const std::string& task) {
    PushHistory(state_.task_history, kTaskHistory, task);
}

void DriftDetector::TrackAgentActivation(const std::string& agent_id) {
    PushHistory(state_.agent_history, kAgentHistory, agent_id);
}

void DriftDetector::TrackMessage() {
    state_.message_count++;
    PersistMessageCount();
}

void DriftDetector::Reset() {
    state_ = DriftState{};

    if (db_) {
        if (!db_->Execute("DELETE FROM drift_files; DELETE FROM drift_history; DELETE FROM drift_counters;")) {
            std::cerr << "[DriftDetector] Failed to clear persisted state: "
                      << db_->LastError() << std::endl;
        }
    }

    if (config_.verbose) {
        std::cerr << "[DriftDetector] Tracking state reset" << std::endl;
    }
}

void DriftDetector::PushHistory(std::deque<std::string>& history, const std::string& kind,
                                const std::string& value) {
    history.push_back(value);
    while (history.size() > config_.history_limit) {
        history.pop_front();
    }

    if (!db_) {
        return;
    }

    try {
        StateDatabase::Transaction txn(*db_);

        auto insert = db_->Prepare("INSERT INTO drift_history (kind, value) VALUES (?, ?);");
        insert.BindText(1, kind).BindText(2, value);
        insert.Step();

        auto trim = db_->Prepare(
            "DELETE FROM drift_history WHERE kind = ? AND id NOT IN ("
            "SELECT id FROM drift_history WHERE kind = ? ORDER BY id DESC LIMIT ?);");
        trim.BindText(1, kind).BindText(2, kind).BindInt64(3, static_cast<int64_t>(config_.history_limit));
        trim.Step();

        txn.Commit();
    } catch (const std::exception& e) {
        std::cerr << "[DriftDetector] Failed to persist " << kind << " history: "
                  << e.what() << std::endl;
    }
}

void DriftDetector::PersistFile(const std::string& path, const FileAccessRecord& record) {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare(
            "INSERT OR REPLACE INTO drift_files (path, last_message_index, access_count, last_access) "
            "VALUES (?, ?, ?, ?);");
        stmt.BindText(1, path)
            .BindInt64(2, static_cast<int64_t>(record.last_message_index))
            .BindInt64(3, static_cast<int64_t>(record.access_count))
            .BindInt64(4, record.last_access.ToMicros());
        stmt.Step();
    } catch (const std::exception& e) {
        std::cerr << "[DriftDetector] Failed to persist file access: " << e.what() << std::endl;
    }
}

void DriftDetector::PersistMessageCount() {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare(
            "INSERT OR REPLACE INTO drift_counters (name, value) VALUES ('message_count', ?);");
        stmt.BindInt64(1, static_cast<int64_t>(state_.message_count));
        stmt.Step();
    } catch (const std::exception& e) {
        std::cerr << "[DriftDetector] Failed to persist message count: " << e.what() << std::endl;
    }
}

// ============================================================================
// Detection
// ============================================================================

void DriftDetector::AddCheck(std::unique_ptr<IDriftCheck> check) {
    if (check) {
        checks_.push_back(std::move(check));
    }
}

DriftDetectionResult DriftDetector::DetectDrift(uint64_t current_tokens, Timestamp now) const {
    DriftDetectionResult result;

    int score = 0;
    double waste = 0.0;
    for (const auto& check : checks_) {
        auto indicator = check->Check(state_, now);
        if (!indicator || indicator->severity == DriftSeverity::NONE) {
            continue;
        }
        score += SeverityPoints(indicator->severity);
        waste += check->EstimateWaste(*indicator, current_tokens);
        result.indicators.push_back(std::move(*indicator));
    }

    result.drift_score = std::min(100, score);
    result.overall_severity = SeverityForScore(result.drift_score);
    result.should_clear_context = result.drift_score >= config_.clear_score_threshold ||
                                  result.overall_severity == DriftSeverity::CRITICAL;
    result.token_waste_estimate = static_cast<uint64_t>(std::llround(waste));

    result.recommendations.push_back(OverallRecommendation(result.drift_score));
    for (const auto& indicator : result.indicators) {
        if (indicator.severity == DriftSeverity::HIGH || indicator.severity == DriftSeverity::CRITICAL) {
            result.recommendations.push_back("-> " + indicator.recommendation);
        }
    }
    if (current_tokens > config_.high_token_usage) {
        result.recommendations.push_back("-> High token usage combined with drift. Clear context now.");
    }

    if (config_.verbose) {
        std::cerr << "[DriftDetector] Score " << result.drift_score << " ("
                  << ToString(result.overall_severity) << "), " << result.indicators.size()
                  << " indicators, ~" << result.token_waste_estimate << " tokens wasted" << std::endl;
    }

    return result;
}

} // namespace ctxmem
