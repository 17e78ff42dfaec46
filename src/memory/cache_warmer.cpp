// File: src/memory/cache_warmer.cpp
#include "memory/cache_warmer.hpp"
#include "memory/tiered_store.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace ctxmem {
namespace fs = std::filesystem;

namespace {

template <typename Rep, typename Period>
Timestamp Before(const Timestamp& now, std::chrono::duration<Rep, Period> d) {
    return now - d;
}

std::string ParentDirectory(const std::string& path) {
    return fs::path(path).parent_path().generic_string();
}

} // anonymous namespace

// ============================================================================
// Content Sources
// ============================================================================

DirectoryContentSource::DirectoryContentSource(std::string root_dir)
    : root_dir_(std::move(root_dir)) {
}

std::optional<std::string> DirectoryContentSource::Load(const std::string& path) {
    fs::path file = fs::path(root_dir_) / path;

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + file.string());
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("read error on " + file.string());
    }
    return content;
}

TieredStoreSource::TieredStoreSource(TieredStore& store)
    : store_(store) {
}

std::optional<std::string> TieredStoreSource::Load(const std::string& path) {
    if (!store_.Contains(path)) {
        return std::nullopt;
    }
    auto content = store_.Peek(path);
    if (!content) {
        throw std::runtime_error("stored item " + path + " is unreadable");
    }
    return content;
}

// ============================================================================
// Strategies
// ============================================================================

std::vector<WarmingStrategy> DefaultWarmingStrategies(
    const std::vector<std::string>& essential_prefixes) {

    std::vector<WarmingStrategy> strategies;

    strategies.push_back({
        "high-frequency",
        "Accessed at least 10 times in the last 7 days",
        [](const AccessPattern& pattern, const WarmingContext& ctx) {
            auto since = Before(ctx.now, std::chrono::hours(24 * 7));
            return ctx.tracker.CountAccessesSince(pattern.path, since) >= 10;
        },
        10
    });

    strategies.push_back({
        "recent-hot",
        "Accessed at least 3 times in the last 24 hours",
        [](const AccessPattern& pattern, const WarmingContext& ctx) {
            auto since = Before(ctx.now, std::chrono::hours(24));
            return ctx.tracker.CountAccessesSince(pattern.path, since) >= 3;
        },
        9
    });

    strategies.push_back({
        "agent-specific",
        "Belongs to the requesting agent and accessed within 14 days",
        [](const AccessPattern& pattern, const WarmingContext& ctx) {
            if (!ctx.agent_id) {
                return false;
            }
            auto agent = pattern.GetAgent();
            return agent && *agent == *ctx.agent_id &&
                   pattern.last_accessed >= Before(ctx.now, std::chrono::hours(24 * 14));
        },
        8
    });

    strategies.push_back({
        "session-continuation",
        "Accessed within the last 4 hours",
        [](const AccessPattern& pattern, const WarmingContext& ctx) {
            return pattern.last_accessed >= Before(ctx.now, std::chrono::hours(4));
        },
        7
    });

    strategies.push_back({
        "project-essentials",
        "Core project knowledge",
        [essential_prefixes](const AccessPattern& pattern, const WarmingContext&) {
            return std::any_of(essential_prefixes.begin(), essential_prefixes.end(),
                               [&](const std::string& prefix) {
                                   return pattern.path.find(prefix) != std::string::npos;
                               });
        },
        6
    });

    return strategies;
}

// ============================================================================
// Construction
// ============================================================================

CacheWarmer::CacheWarmer(const Config& config, AccessTracker& tracker, IContentSource& source)
    : config_(config),
      tracker_(tracker),
      source_(source),
      strategies_(DefaultWarmingStrategies(config.essential_prefixes)) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid CacheWarmer configuration");
    }
    OpenDatabase();
}

void CacheWarmer::OpenDatabase() {
    if (config_.storage_dir.empty()) {
        return;
    }

    try {
        StateDatabase::Config db_config;
        db_config.db_path = (fs::path(config_.storage_dir) / "warmed_cache.db").string();
        db_ = std::make_unique<StateDatabase>(db_config);
        db_->ExecuteOrThrow(R"(
            CREATE TABLE IF NOT EXISTS warmed_fragments (
                path TEXT PRIMARY KEY,
                content BLOB NOT NULL,
                estimated_tokens INTEGER NOT NULL,
                warmed_at INTEGER NOT NULL
            );
        )");
    } catch (const std::exception& e) {
        std::cerr << "[CacheWarmer] Snapshot persistence disabled: " << e.what() << std::endl;
        db_.reset();
    }
}

void CacheWarmer::Initialize(Timestamp now) {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare(
            "SELECT path, content, estimated_tokens, warmed_at FROM warmed_fragments;");
        size_t restored = 0;
        while (stmt.Step()) {
            CachedFragment fragment;
            fragment.path = stmt.ColumnText(0);
            fragment.content = stmt.ColumnBlob(1);
            fragment.estimated_tokens = static_cast<size_t>(stmt.ColumnInt64(2));
            fragment.warmed_at = Timestamp::FromMicros(stmt.ColumnInt64(3));
            if (IsFresh(fragment, now)) {
                fragments_[fragment.path] = std::move(fragment);
                ++restored;
            }
        }

        if (config_.verbose) {
            std::cerr << "[CacheWarmer] Restored " << restored << " fresh fragments" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[CacheWarmer] Failed to load warmed cache: " << e.what() << std::endl;
    }
}

bool CacheWarmer::IsFresh(const CachedFragment& fragment, const Timestamp& now) const {
    return HoursBetween(now, fragment.warmed_at) <= config_.freshness_window_hours;
}

void CacheWarmer::AddStrategy(WarmingStrategy strategy) {
    strategies_.push_back(std::move(strategy));
}

int CacheWarmer::ScorePattern(const AccessPattern& pattern, const WarmingContext& context) const {
    int score = 0;
    for (const auto& strategy : strategies_) {
        if (strategy.predicate && strategy.predicate(pattern, context)) {
            score += strategy.priority;
        }
    }

    auto agent = pattern.GetAgent();
    if (context.agent_id && agent && *agent == *context.agent_id) {
        score += config_.agent_match_bonus;
    }
    return score;
}

// ============================================================================
// Warming
// ============================================================================

WarmingResult CacheWarmer::Disabled(const std::string& reason) const {
    WarmingResult result;
    result.reason = reason;
    if (config_.verbose) {
        std::cerr << "[CacheWarmer] " << reason << std::endl;
    }
    return result;
}

WarmingResult CacheWarmer::Warm(const std::optional<std::string>& agent_id, Timestamp now) {
    if (!config_.enabled) {
        return Disabled("Cache warming is disabled");
    }

    WarmingContext context{now, agent_id, tracker_};

    struct Candidate {
        AccessPattern pattern;
        int score;
    };

    std::vector<Candidate> scored;
    for (auto& pattern : tracker_.GetTopPatterns(config_.candidate_pool, now)) {
        int score = ScorePattern(pattern, context);
        if (score > 0) {
            scored.push_back({std::move(pattern), score});
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    std::vector<AccessPattern> selected;
    for (size_t i = 0; i < scored.size() && i < config_.max_files_to_warm; ++i) {
        selected.push_back(std::move(scored[i].pattern));
    }

    auto result = Admit(selected, now);

    if (config_.verbose) {
        std::cerr << "[CacheWarmer] Warmed " << result.items_warmed << " items, "
                  << result.total_tokens << " tokens, " << result.items_skipped << " skipped, "
                  << "expected +" << result.hit_rate_improvement_estimate << "% hit rate" << std::endl;
    }
    return result;
}

WarmingResult CacheWarmer::WarmForAgent(const std::string& agent_id, Timestamp now) {
    if (!config_.enabled || !config_.warm_on_agent_activation) {
        return Disabled("Agent-specific warming is disabled");
    }

    auto patterns = tracker_.GetPatternsByAgent(agent_id);
    if (patterns.size() > config_.agent_warm_limit) {
        patterns.resize(config_.agent_warm_limit);
    }
    return Admit(patterns, now);
}

WarmingResult CacheWarmer::IntelligentPrefetch(const PrefetchContext& context, Timestamp now) {
    if (!config_.enabled || !config_.intelligent_prefetch) {
        return Disabled("Intelligent prefetch is disabled");
    }

    std::vector<std::string> recent_dirs;
    for (const auto& file : context.recent_files) {
        auto dir = ParentDirectory(file);
        if (!dir.empty()) {
            recent_dirs.push_back(dir + "/");
        }
    }

    std::vector<AccessPattern> predicted;
    for (auto& pattern : tracker_.GetTopPatterns(config_.prefetch_candidate_pool, now)) {
        if (predicted.size() >= config_.prefetch_limit) {
            break;
        }

        bool match = false;

        auto agent = pattern.GetAgent();
        if (context.agent_id && agent && *agent == *context.agent_id) {
            match = true;
        }

        for (const auto& dir : recent_dirs) {
            if (pattern.path.compare(0, dir.size(), dir) == 0) {
                match = true;
                break;
            }
        }

        if (context.task_type && !context.task_type->empty() &&
            pattern.path.find(*context.task_type) != std::string::npos) {
            match = true;
        }

        if (match) {
            predicted.push_back(std::move(pattern));
        }
    }

    return Admit(predicted, now);
}

WarmingResult CacheWarmer::Admit(const std::vector<AccessPattern>& candidates, const Timestamp& now) {
    auto started = std::chrono::steady_clock::now();
    WarmingResult result;

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& path = candidates[i].path;

        std::optional<CachedFragment> fragment;

        auto cached = fragments_.find(path);
        if (cached != fragments_.end() && IsFresh(cached->second, now)) {
            fragment = cached->second;
        } else {
            std::optional<std::string> content;
            try {
                content = source_.Load(path);
            } catch (const std::exception& e) {
                result.errors.push_back("Failed to warm " + path + ": " + e.what());
                continue;
            }

            if (!content) {
                result.items_skipped++;
                continue;
            }

            CachedFragment loaded;
            loaded.path = path;
            loaded.estimated_tokens = EstimateTokens(*content);
            loaded.content = std::move(*content);
            loaded.warmed_at = now;
            fragment = std::move(loaded);
        }

        // No partial admission: the first candidate over budget ends the pass
        if (result.total_tokens + fragment->estimated_tokens > config_.max_tokens_per_warm) {
            result.items_skipped += candidates.size() - i;
            break;
        }

        result.total_tokens += fragment->estimated_tokens;
        result.items_warmed++;
        result.warmed_paths.push_back(path);
        fragments_[path] = std::move(*fragment);
    }

    result.hit_rate_improvement_estimate =
        std::min(15.0, static_cast<double>(result.items_warmed) * 1.5);
    result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    last_warming_time_ = now;
    total_passes_++;
    total_items_warmed_ += result.items_warmed;

    SaveSnapshot();
    return result;
}

// ============================================================================
// Fragment Access
// ============================================================================

std::optional<CachedFragment> CacheWarmer::GetFragment(const std::string& path, Timestamp now) const {
    auto it = fragments_.find(path);
    if (it == fragments_.end() || !IsFresh(it->second, now)) {
        return std::nullopt;
    }
    return it->second;
}

bool CacheWarmer::Invalidate(const std::string& path) {
    if (fragments_.erase(path) == 0) {
        return false;
    }

    if (db_) {
        try {
            auto stmt = db_->Prepare("DELETE FROM warmed_fragments WHERE path = ?;");
            stmt.BindText(1, path);
            stmt.Step();
        } catch (const std::exception& e) {
            std::cerr << "[CacheWarmer] Failed to drop fragment " << path << ": "
                      << e.what() << std::endl;
        }
    }
    return true;
}

size_t CacheWarmer::ClearStaleContent(Timestamp now) {
    size_t removed = 0;
    for (auto it = fragments_.begin(); it != fragments_.end();) {
        if (!IsFresh(it->second, now)) {
            it = fragments_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        SaveSnapshot();
    }
    return removed;
}

CacheWarmer::Statistics CacheWarmer::GetStatistics() const {
    Statistics stats;
    stats.last_warming_time = last_warming_time_;
    stats.cached_fragments = fragments_.size();
    stats.total_passes = total_passes_;
    stats.total_items_warmed = total_items_warmed_;

    for (const auto& [path, fragment] : fragments_) {
        stats.total_cached_tokens += fragment.estimated_tokens;
        if (!stats.oldest_fragment || fragment.warmed_at < *stats.oldest_fragment) {
            stats.oldest_fragment = fragment.warmed_at;
        }
    }
    if (!fragments_.empty()) {
        stats.avg_fragment_tokens = stats.total_cached_tokens / fragments_.size();
    }
    return stats;
}

void CacheWarmer::SaveSnapshot() {
    if (!db_) {
        return;
    }

    try {
        StateDatabase::Transaction txn(*db_);
        db_->ExecuteOrThrow("DELETE FROM warmed_fragments;");

        auto stmt = db_->Prepare(
            "INSERT INTO warmed_fragments (path, content, estimated_tokens, warmed_at) "
            "VALUES (?, ?, ?, ?);");
        for (const auto& [path, fragment] : fragments_) {
            stmt.BindText(1, path);
            stmt.BindBlob(2, fragment.content);
            stmt.BindInt64(3, static_cast<int64_t>(fragment.estimated_tokens));
            stmt.BindInt64(4, fragment.warmed_at.ToMicros());
            stmt.Step();
            stmt.Reset();
        }
        txn.Commit();
    } catch (const std::exception& e) {
        std::cerr << "[CacheWarmer] Failed to save warmed cache: " << e.what() << std::endl;
    }
}

} // namespace ctxmem
