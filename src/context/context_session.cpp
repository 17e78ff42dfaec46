// File: src/context/context_session.cpp
#include "context/context_session.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ctxmem {

const char* ToString(ClearAction action) {
    switch (action) {
        case ClearAction::CONTINUE:
            return "continue";
        case ClearAction::EXTRACT_THEN_CLEAR:
            return "extract_then_clear";
        case ClearAction::CLEAR_NOW:
            return "clear_now";
        default:
            return "unknown";
    }
}

// ============================================================================
// Construction
// ============================================================================

ContextSession::ContextSession(const CtxmemConfig& config)
    : config_(config) {
    if (!config_.Validate()) {
        throw std::invalid_argument("Invalid ctxmem configuration");
    }

    tracker_ = std::make_unique<AccessTracker>(config_.ToAccessTrackerConfig());
    store_ = std::make_unique<TieredStore>(config_.ToTieredStoreConfig());
    source_ = std::make_unique<TieredStoreSource>(*store_);
    warmer_ = std::make_unique<CacheWarmer>(config_.ToCacheWarmerConfig(), *tracker_, *source_);
    forecaster_ = std::make_unique<TokenForecaster>(config_.ToForecasterConfig());
    drift_ = std::make_unique<DriftDetector>(config_.ToDriftDetectorConfig());
    stats_ = std::make_unique<ContextStats>(config_.ToContextStatsConfig());

    stats_->RegisterPreClearHook(
        [this](size_t, const std::optional<std::string>&) { return PreservePatterns(); });
}

ContextSession::~ContextSession() {
    stats_->EndSession();
}

void ContextSession::Initialize(Timestamp now) {
    tracker_->Initialize();
    store_->Initialize();
    warmer_->Initialize(now);
    forecaster_->Initialize();
    drift_->Initialize();
    stats_->Initialize();
    stats_->StartSession(std::nullopt, now);

    if (config_.logging.verbose) {
        std::cerr << "[ContextSession] Initialized under " << config_.ResolveRootDir() << ": "
                  << tracker_->GetTrackedPatternCount() << " patterns, "
                  << store_->ListPaths().size() << " stored items, "
                  << forecaster_->GetTrainingSampleCount() << " training samples" << std::endl;
    }
}

size_t ContextSession::PreservePatterns() {
    if (!tracker_->IsPersistent()) {
        return 0;
    }
    size_t dirty = tracker_->GetDirtyPatternCount();
    return tracker_->Flush() ? dirty : 0;
}

// ============================================================================
// Memory operations
// ============================================================================

void ContextSession::RecordMemoryOperation(const std::string& path,
                                           MemoryOperationType operation,
                                           const std::optional<std::string>& agent_id,
                                           const std::optional<std::string>& context,
                                           bool success,
                                           uint64_t tokens_used,
                                           Timestamp now) {
    if (success) {
        tracker_->RecordAccess(path, agent_id, ToAccessOperation(operation), context, now);
        drift_->TrackFileAccess(path, now);
    }

    MemoryOperationRecord record;
    record.operation = operation;
    record.path = path;
    record.success = success;
    record.agent_id = agent_id;
    record.tokens_used = tokens_used;
    stats_->TrackMemoryOperation(std::move(record), now);
}

bool ContextSession::StoreKnowledge(const std::string& path, const std::string& content,
                                    const std::optional<std::string>& agent_id, Timestamp now) {
    MemoryOperationType operation = store_->Contains(path) ? MemoryOperationType::STR_REPLACE
                                                           : MemoryOperationType::CREATE;

    bool stored = store_->Store(path, content, agent_id, now);
    warmer_->Invalidate(path);
    RecordMemoryOperation(path, operation, agent_id, std::nullopt, stored,
                          EstimateTokens(content), now);
    return stored;
}

RetrieveResult ContextSession::RetrieveKnowledge(const std::string& path,
                                                 const std::optional<std::string>& agent_id,
                                                 Timestamp now) {
    RetrieveResult result = store_->Retrieve(path, now);
    RecordMemoryOperation(path, MemoryOperationType::VIEW, agent_id, std::nullopt, result.found,
                          result.found ? EstimateTokens(result.content) : 0, now);
    return result;
}

// ============================================================================
// Conversation events
// ============================================================================

void ContextSession::OnUserMessage(const std::optional<std::string>& task) {
    drift_->TrackMessage();
    if (task) {
        drift_->TrackTask(*task);
    }
}

WarmingResult ContextSession::ActivateAgent(const std::string& agent_id, Timestamp now) {
    drift_->TrackAgentActivation(agent_id);
    return warmer_->WarmForAgent(agent_id, now);
}

// ============================================================================
// Decisions
// ============================================================================

ClearDecision ContextSession::Evaluate(const ForecastMetrics& metrics, Timestamp now) const {
    ClearDecision decision;
    decision.forecast = forecaster_->Forecast(metrics, now);
    decision.drift = drift_->DetectDrift(metrics.current_tokens, now);

    std::ostringstream reason;
    if (decision.drift.should_clear_context) {
        decision.action = ClearAction::CLEAR_NOW;
        reason << "Drift score " << decision.drift.drift_score << " ("
               << ToString(decision.drift.overall_severity) << ")";
    } else if (decision.forecast.recommendation == ForecastRecommendation::EMERGENCY) {
        decision.action = ClearAction::CLEAR_NOW;
        reason << decision.forecast.reasoning;
    } else if (decision.forecast.recommendation == ForecastRecommendation::EXTRACT_NOW) {
        decision.action = ClearAction::EXTRACT_THEN_CLEAR;
        reason << decision.forecast.reasoning;
    } else {
        decision.action = ClearAction::CONTINUE;
        reason << "Forecast " << ToString(decision.forecast.recommendation)
               << ", drift score " << decision.drift.drift_score;
    }
    decision.reason = reason.str();

    if (config_.logging.verbose) {
        std::cerr << "[ContextSession] Decision " << ToString(decision.action) << ": "
                  << decision.reason << std::endl;
    }
    return decision;
}

ContextClearEvent ContextSession::ExecuteClear(uint64_t current_tokens,
                                               const std::optional<std::string>& agent_id,
                                               ClearTrigger trigger,
                                               uint64_t tool_uses_cleared,
                                               Timestamp now) {
    ContextClearEvent event;
    event.input_tokens = current_tokens;
    event.tool_uses_cleared = tool_uses_cleared;
    event.tokens_saved = current_tokens;
    event.trigger = trigger;
    event.agent_id = agent_id;

    ContextClearEvent recorded = stats_->TrackClearEvent(std::move(event), now);
    drift_->Reset();
    return recorded;
}

MaintenanceReport ContextSession::RunMaintenance(Timestamp now) {
    auto start = std::chrono::steady_clock::now();
    MaintenanceReport report;

    report.migration = store_->RunMigration(now);
    report.patterns_pruned = tracker_->PruneOldPatterns(config_.access_tracker.prune_after_days, now);
    report.training_points_pruned = forecaster_->PruneTrainingData(now);
    report.stale_fragments_cleared = warmer_->ClearStaleContent(now);
    report.stats_records_removed = stats_->Cleanup(config_.stats.retention_days, now);
    report.tracker_flushed = tracker_->Flush(now);

    report.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    for (const auto& error : report.migration.errors) {
        std::cerr << "[ContextSession] Migration error: " << error << std::endl;
    }
    if (config_.logging.verbose) {
        std::cerr << "[ContextSession] Maintenance: " << report.migration.Total() << " moves, "
                  << report.patterns_pruned << " patterns pruned, "
                  << report.training_points_pruned << " training points pruned, "
                  << report.stale_fragments_cleared << " stale fragments cleared in "
                  << report.elapsed.count() << " us" << std::endl;
    }
    return report;
}

} // namespace ctxmem
