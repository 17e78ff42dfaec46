// File: src/memory/access_tracker.cpp
#include "memory/access_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ctxmem {

namespace {

std::string JoinContributors(const std::set<std::string>& contributors) {
    std::string joined;
    for (const auto& agent : contributors) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += agent;
    }
    return joined;
}

std::set<std::string> SplitContributors(const std::string& joined) {
    std::set<std::string> contributors;
    std::istringstream in(joined);
    std::string agent;
    while (std::getline(in, agent)) {
        if (!agent.empty()) {
            contributors.insert(agent);
        }
    }
    return contributors;
}

void BindOptional(Statement& stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        stmt.BindText(index, *value);
    } else {
        stmt.BindNull(index);
    }
}

std::optional<std::string> OptionalColumn(const Statement& stmt, int column) {
    if (stmt.ColumnIsNull(column)) {
        return std::nullopt;
    }
    return stmt.ColumnText(column);
}

} // anonymous namespace

// ============================================================================
// Agent Attribution
// ============================================================================

const char* ToString(AttributionMode mode) {
    switch (mode) {
        case AttributionMode::LAST_TOUCHER:
            return "last_toucher";
        case AttributionMode::CONTRIBUTOR_SET:
            return "contributor_set";
        default:
            return "unknown";
    }
}

std::optional<AttributionMode> ParseAttributionMode(const std::string& str) {
    if (str == "last_toucher") {
        return AttributionMode::LAST_TOUCHER;
    } else if (str == "contributor_set") {
        return AttributionMode::CONTRIBUTOR_SET;
    }
    return std::nullopt;
}

std::optional<std::string> PrimaryAgent(const AgentAttribution& attribution) {
    return std::visit([](const auto& a) { return a.agent_id; }, attribution);
}

void RecordToucher(AgentAttribution& attribution, const std::optional<std::string>& agent_id) {
    if (auto* last = std::get_if<LastToucher>(&attribution)) {
        last->agent_id = agent_id;
        return;
    }
    auto& set = std::get<ContributorSet>(attribution);
    set.agent_id = agent_id;
    if (agent_id) {
        set.contributors.insert(*agent_id);
    }
}

bool HasContributor(const AgentAttribution& attribution, const std::string& agent_id) {
    if (const auto* set = std::get_if<ContributorSet>(&attribution)) {
        return set->contributors.count(agent_id) > 0;
    }
    auto primary = PrimaryAgent(attribution);
    return primary && *primary == agent_id;
}

double RecencyScore(const Timestamp& last_accessed, const Timestamp& now) {
    double hours = HoursBetween(now, last_accessed);
    if (hours < 1.0) {
        return 100.0;
    } else if (hours < 24.0) {
        return 80.0;
    } else if (hours < 24.0 * 7) {
        return 50.0;
    } else if (hours < 24.0 * 30) {
        return 20.0;
    }
    return 0.0;
}

// ============================================================================
// Construction
// ============================================================================

AccessTracker::AccessTracker()
    : AccessTracker(Config{}) {
}

AccessTracker::AccessTracker(const Config& config)
    : config_(config), flush_policy_(config.flush) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid AccessTracker configuration");
    }
    OpenDatabase();
}

AccessTracker::~AccessTracker() {
    if (!pending_events_.empty() || !dirty_paths_.empty()) {
        Flush();
    }
}

void AccessTracker::OpenDatabase() {
    if (config_.storage_dir.empty()) {
        return;
    }

    try {
        StateDatabase::Config db_config;
        db_config.db_path = (std::filesystem::path(config_.storage_dir) / "patterns.db").string();
        db_ = std::make_unique<StateDatabase>(db_config);
        CreateTables();
    } catch (const std::exception& e) {
        std::cerr << "[AccessTracker] Persistence disabled: " << e.what() << std::endl;
        db_.reset();
    }
}

void AccessTracker::CreateTables() {
    db_->ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS access_patterns (
            path TEXT PRIMARY KEY,
            access_count INTEGER NOT NULL,
            first_accessed INTEGER NOT NULL,
            last_accessed INTEGER NOT NULL,
            avg_access_interval REAL NOT NULL,
            recent_access_count INTEGER NOT NULL,
            agent_id TEXT,
            contributors TEXT
        );
    )");

    db_->ExecuteOrThrow(R"(
        CREATE TABLE IF NOT EXISTS access_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            agent_id TEXT,
            operation TEXT NOT NULL,
            context TEXT
        );
    )");

    db_->ExecuteOrThrow(
        "CREATE INDEX IF NOT EXISTS idx_access_events_path ON access_events(path);");
}

void AccessTracker::Initialize() {
    if (!db_) {
        return;
    }

    try {
        std::unordered_map<std::string, AccessPattern> loaded;
        auto stmt = db_->Prepare(
            "SELECT path, access_count, first_accessed, last_accessed, avg_access_interval, "
            "recent_access_count, agent_id, contributors FROM access_patterns;");
        while (stmt.Step()) {
            AccessPattern pattern;
            pattern.path = stmt.ColumnText(0);
            pattern.access_count = static_cast<uint64_t>(stmt.ColumnInt64(1));
            pattern.first_accessed = Timestamp::FromMicros(stmt.ColumnInt64(2));
            pattern.last_accessed = Timestamp::FromMicros(stmt.ColumnInt64(3));
            pattern.avg_access_interval = stmt.ColumnDouble(4);
            pattern.recent_access_count = static_cast<uint64_t>(stmt.ColumnInt64(5));

            auto agent = OptionalColumn(stmt, 6);
            if (stmt.ColumnIsNull(7)) {
                pattern.attribution = LastToucher{agent};
            } else {
                pattern.attribution = ContributorSet{agent, SplitContributors(stmt.ColumnText(7))};
            }

            loaded[pattern.path] = std::move(pattern);
        }

        std::deque<AccessEvent> events;
        auto events_stmt = db_->Prepare(
            "SELECT path, timestamp, agent_id, operation, context FROM "
            "(SELECT * FROM access_events ORDER BY id DESC LIMIT ?) ORDER BY id ASC;");
        events_stmt.BindInt64(1, static_cast<int64_t>(config_.max_events));
        while (events_stmt.Step()) {
            AccessEvent event;
            event.path = events_stmt.ColumnText(0);
            event.timestamp = Timestamp::FromMicros(events_stmt.ColumnInt64(1));
            event.agent_id = OptionalColumn(events_stmt, 2);
            event.operation = ParseAccessOperation(events_stmt.ColumnText(3))
                                  .value_or(AccessOperation::VIEW);
            event.context = OptionalColumn(events_stmt, 4);
            events.push_back(std::move(event));
        }

        patterns_ = std::move(loaded);
        events_ = std::move(events);

        if (config_.verbose) {
            std::cerr << "[AccessTracker] Loaded " << patterns_.size() << " patterns and "
                      << events_.size() << " events" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[AccessTracker] Failed to load state: " << e.what() << std::endl;
    }
}

AgentAttribution AccessTracker::NewAttribution() const {
    if (config_.attribution_mode == AttributionMode::CONTRIBUTOR_SET) {
        return ContributorSet{};
    }
    return LastToucher{};
}

// ============================================================================
// Recording
// ============================================================================

void AccessTracker::RecordAccess(const std::string& path,
                                 const std::optional<std::string>& agent_id,
                                 AccessOperation operation,
                                 const std::optional<std::string>& context,
                                 Timestamp now) {
    AccessEvent event{path, now, agent_id, operation, context};

    events_.push_back(event);
    while (events_.size() > config_.max_events) {
        events_.pop_front();
    }

    auto it = patterns_.find(path);
    if (it == patterns_.end()) {
        AccessPattern pattern;
        pattern.path = path;
        pattern.access_count = 1;
        pattern.first_accessed = now;
        pattern.last_accessed = now;
        pattern.attribution = NewAttribution();
        RecordToucher(pattern.attribution, agent_id);
        it = patterns_.emplace(path, std::move(pattern)).first;
    } else {
        auto& pattern = it->second;

        // n = number of intervals observed including this one
        double interval = std::max(0.0, SecondsBetween(now, pattern.last_accessed));
        double n = static_cast<double>(pattern.access_count);
        pattern.avg_access_interval = (pattern.avg_access_interval * (n - 1.0) + interval) / n;

        pattern.access_count++;
        if (now > pattern.last_accessed) {
            pattern.last_accessed = now;
        }
        RecordToucher(pattern.attribution, agent_id);
    }

    auto since = now - std::chrono::duration<double>(config_.recent_window_days * 86400.0);
    it->second.recent_access_count =
        std::min<uint64_t>(CountAccessesSince(path, since), it->second.access_count);

    if (db_) {
        if (pending_events_.size() >= config_.flush.max_queue_size) {
            // Queue full and the last flush failed; drop the oldest pending write
            pending_events_.pop_front();
            std::cerr << "[AccessTracker] Write queue full, dropping oldest pending event"
                      << std::endl;
        }
        pending_events_.push_back(std::move(event));
        dirty_paths_.insert(path);
        flush_policy_.NotePending();

        if (flush_policy_.ShouldFlush(now)) {
            Flush(now);
        }
    }
}

// ============================================================================
// Queries
// ============================================================================

void AccessTracker::RefreshRecentCounts(const Timestamp& now) {
    auto since = now - std::chrono::duration<double>(config_.recent_window_days * 86400.0);

    std::unordered_map<std::string, uint64_t> counts;
    for (const auto& event : events_) {
        if (event.timestamp >= since && event.timestamp <= now) {
            counts[event.path]++;
        }
    }

    for (auto& [path, pattern] : patterns_) {
        auto it = counts.find(path);
        uint64_t recent = (it == counts.end()) ? 0 : it->second;
        pattern.recent_access_count = std::min(recent, pattern.access_count);
    }
}

std::vector<AccessPattern> AccessTracker::GetTopPatterns(size_t limit, Timestamp now) {
    RefreshRecentCounts(now);

    std::vector<ScoredPattern> scored;
    scored.reserve(patterns_.size());
    for (const auto& [path, pattern] : patterns_) {
        double score = 0.6 * static_cast<double>(pattern.recent_access_count) +
                       0.3 * static_cast<double>(pattern.access_count) +
                       0.1 * RecencyScore(pattern.last_accessed, now);
        scored.push_back({pattern, score});
    }

    std::sort(scored.begin(), scored.end(),
              [](const ScoredPattern& a, const ScoredPattern& b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.pattern.path < b.pattern.path;
              });

    std::vector<AccessPattern> result;
    for (size_t i = 0; i < scored.size() && i < limit; ++i) {
        result.push_back(std::move(scored[i].pattern));
    }
    return result;
}

std::vector<AccessPattern> AccessTracker::GetPatternsByAgent(const std::string& agent_id) const {
    std::vector<AccessPattern> result;
    for (const auto& [path, pattern] : patterns_) {
        if (HasContributor(pattern.attribution, agent_id)) {
            result.push_back(pattern);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const AccessPattern& a, const AccessPattern& b) {
                  if (a.access_count != b.access_count) {
                      return a.access_count > b.access_count;
                  }
                  return a.path < b.path;
              });
    return result;
}

std::vector<AccessPattern> AccessTracker::GetRecentPatterns(double days, Timestamp now) const {
    auto cutoff = now - std::chrono::duration<double>(days * 86400.0);

    std::vector<AccessPattern> result;
    for (const auto& [path, pattern] : patterns_) {
        if (pattern.last_accessed >= cutoff) {
            result.push_back(pattern);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const AccessPattern& a, const AccessPattern& b) {
                  return a.last_accessed > b.last_accessed;
              });
    return result;
}

std::vector<ScoredPattern> AccessTracker::PredictNextPatterns(
    const std::optional<std::string>& current_agent, Timestamp now) {

    constexpr double kMinScore = 20.0;
    constexpr size_t kMaxPredictions = 10;
    constexpr double kIntervalToleranceSeconds = 2.0 * 3600.0;

    RefreshRecentCounts(now);

    std::vector<ScoredPattern> predictions;
    for (const auto& [path, pattern] : patterns_) {
        double score = 0.0;

        double density = std::min(static_cast<double>(pattern.recent_access_count) / 10.0, 1.0);
        score += density * 100.0 * 0.4;

        double since_last = SecondsBetween(now, pattern.last_accessed);
        if (pattern.avg_access_interval > 0.0 &&
            std::abs(since_last - pattern.avg_access_interval) <= kIntervalToleranceSeconds) {
            score += 30.0;
        }

        auto agent = pattern.GetAgent();
        if (current_agent && agent && *agent == *current_agent) {
            score += 20.0;
        }

        if (since_last < 3600.0) {
            score += 10.0;
        }

        if (score > kMinScore) {
            predictions.push_back({pattern, score});
        }
    }

    std::sort(predictions.begin(), predictions.end(),
              [](const ScoredPattern& a, const ScoredPattern& b) {
                  if (a.score != b.score) {
                      return a.score > b.score;
                  }
                  return a.pattern.path < b.pattern.path;
              });

    if (predictions.size() > kMaxPredictions) {
        predictions.resize(kMaxPredictions);
    }
    return predictions;
}

size_t AccessTracker::CountAccessesSince(const std::string& path, const Timestamp& since) const {
    return static_cast<size_t>(std::count_if(
        events_.begin(), events_.end(),
        [&](const AccessEvent& event) {
            return event.path == path && event.timestamp >= since;
        }));
}

std::optional<AccessPattern> AccessTracker::GetPattern(const std::string& path) const {
    auto it = patterns_.find(path);
    if (it == patterns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t AccessTracker::PruneOldPatterns(double max_age_days, Timestamp now) {
    auto cutoff = now - std::chrono::duration<double>(max_age_days * 86400.0);

    std::vector<std::string> removed;
    for (auto it = patterns_.begin(); it != patterns_.end();) {
        if (it->second.last_accessed < cutoff) {
            removed.push_back(it->first);
            dirty_paths_.erase(it->first);
            it = patterns_.erase(it);
        } else {
            ++it;
        }
    }

    if (db_ && !removed.empty()) {
        try {
            StateDatabase::Transaction txn(*db_);
            auto stmt = db_->Prepare("DELETE FROM access_patterns WHERE path = ?;");
            for (const auto& path : removed) {
                stmt.BindText(1, path);
                stmt.Step();
                stmt.Reset();
            }
            txn.Commit();
        } catch (const std::exception& e) {
            std::cerr << "[AccessTracker] Failed to prune persisted patterns: "
                      << e.what() << std::endl;
        }
    }

    if (config_.verbose && !removed.empty()) {
        std::cerr << "[AccessTracker] Pruned " << removed.size() << " stale patterns" << std::endl;
    }

    return removed.size();
}

bool AccessTracker::Flush(Timestamp now) {
    if (!db_) {
        return true;
    }
    if (pending_events_.empty() && dirty_paths_.empty()) {
        flush_policy_.MarkFlushed(now);
        return true;
    }

    if (!WritePending()) {
        return false;
    }

    pending_events_.clear();
    dirty_paths_.clear();
    flush_policy_.MarkFlushed(now);
    return true;
}

bool AccessTracker::WritePending() {
    try {
        StateDatabase::Transaction txn(*db_);

        auto insert_event = db_->Prepare(
            "INSERT INTO access_events (path, timestamp, agent_id, operation, context) "
            "VALUES (?, ?, ?, ?, ?);");
        for (const auto& event : pending_events_) {
            insert_event.BindText(1, event.path);
            insert_event.BindInt64(2, event.timestamp.ToMicros());
            BindOptional(insert_event, 3, event.agent_id);
            insert_event.BindText(4, ToString(event.operation));
            BindOptional(insert_event, 5, event.context);
            insert_event.Step();
            insert_event.Reset();
        }

        auto upsert = db_->Prepare(
            "INSERT OR REPLACE INTO access_patterns (path, access_count, first_accessed, "
            "last_accessed, avg_access_interval, recent_access_count, agent_id, contributors) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        for (const auto& path : dirty_paths_) {
            auto it = patterns_.find(path);
            if (it == patterns_.end()) {
                continue;
            }
            const auto& pattern = it->second;
            upsert.BindText(1, pattern.path);
            upsert.BindInt64(2, static_cast<int64_t>(pattern.access_count));
            upsert.BindInt64(3, pattern.first_accessed.ToMicros());
            upsert.BindInt64(4, pattern.last_accessed.ToMicros());
            upsert.BindDouble(5, pattern.avg_access_interval);
            upsert.BindInt64(6, static_cast<int64_t>(pattern.recent_access_count));
            BindOptional(upsert, 7, pattern.GetAgent());
            if (const auto* set = std::get_if<ContributorSet>(&pattern.attribution)) {
                upsert.BindText(8, JoinContributors(set->contributors));
            } else {
                upsert.BindNull(8);
            }
            upsert.Step();
            upsert.Reset();
        }

        // Keep the persisted log the same size as the in-memory ring buffer
        auto trim = db_->Prepare(
            "DELETE FROM access_events WHERE id NOT IN "
            "(SELECT id FROM access_events ORDER BY id DESC LIMIT ?);");
        trim.BindInt64(1, static_cast<int64_t>(config_.max_events));
        trim.Step();

        txn.Commit();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[AccessTracker] Failed to persist access patterns: " << e.what() << std::endl;
        return false;
    }
}

void AccessTracker::Clear() {
    patterns_.clear();
    events_.clear();
    pending_events_.clear();
    dirty_paths_.clear();
    flush_policy_.MarkFlushed(Timestamp::Now());

    if (db_) {
        if (!db_->Execute("DELETE FROM access_patterns; DELETE FROM access_events;")) {
            std::cerr << "[AccessTracker] Failed to clear persisted state: "
                      << db_->LastError() << std::endl;
        }
    }
}

} // namespace ctxmem
