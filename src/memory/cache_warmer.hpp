// File: src/memory/cache_warmer.hpp
//
// Cache Warmer - budgeted prefetch of knowledge items
//
// Selects items the host is likely to need soon (from AccessTracker
// patterns, scored by a set of warming strategies) and pre-loads their
// content into an in-memory fragment cache, under both an item-count cap
// and a token budget. Fragments expire after a freshness window regardless
// of where the item lives in the TieredStore.

#pragma once

#include "core/types.hpp"
#include "memory/access_tracker.hpp"
#include "storage/state_database.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxmem {

class TieredStore;

// ============================================================================
// Content Sources
// ============================================================================

/// Where the warmer reads item content from
class IContentSource {
public:
    virtual ~IContentSource() = default;

    /// Load content for path
    ///
    /// @return Content, or nullopt if the item does not exist
    /// @throws std::runtime_error if the item exists but cannot be read
    virtual std::optional<std::string> Load(const std::string& path) = 0;
};

/// Items stored as files under a root directory
class DirectoryContentSource : public IContentSource {
public:
    explicit DirectoryContentSource(std::string root_dir);

    std::optional<std::string> Load(const std::string& path) override;

private:
    std::string root_dir_;
};

/// Items held by a TieredStore (read with Peek, so placement is untouched)
class TieredStoreSource : public IContentSource {
public:
    explicit TieredStoreSource(TieredStore& store);

    std::optional<std::string> Load(const std::string& path) override;

private:
    TieredStore& store_;
};

// ============================================================================
// Strategies
// ============================================================================

/// Inputs available to a strategy predicate
struct WarmingContext {
    Timestamp now;
    std::optional<std::string> agent_id;   ///< Agent requesting the warm pass
    const AccessTracker& tracker;
};

/// Named rule that votes for a pattern with its priority
struct WarmingStrategy {
    std::string name;
    std::string description;
    std::function<bool(const AccessPattern&, const WarmingContext&)> predicate;
    int priority{0};
};

/// Built-in strategies: high-frequency (10), recent-hot (9),
/// agent-specific (8), session-continuation (7), project-essentials (6)
std::vector<WarmingStrategy> DefaultWarmingStrategies(
    const std::vector<std::string>& essential_prefixes);

// ============================================================================
// Data Types
// ============================================================================

/// One prefetched item
struct CachedFragment {
    std::string path;
    std::string content;
    size_t estimated_tokens{0};
    Timestamp warmed_at;
};

/// Outcome of a warming pass
struct WarmingResult {
    size_t items_warmed{0};
    size_t total_tokens{0};
    double hit_rate_improvement_estimate{0.0};   ///< Percentage points
    std::chrono::microseconds elapsed{0};
    size_t items_skipped{0};
    std::vector<std::string> errors;
    std::vector<std::string> warmed_paths;       ///< Admission order

    /// Set when the pass did not run (feature disabled)
    std::optional<std::string> reason;
};

/// Hints for IntelligentPrefetch
struct PrefetchContext {
    std::optional<std::string> agent_id;
    std::vector<std::string> recent_files;
    std::optional<std::string> task_type;
};

// ============================================================================
// CacheWarmer
// ============================================================================

class CacheWarmer {
public:
    /// Configuration for CacheWarmer
    struct Config {
        /// Directory for warmed_cache.db (empty: in-memory only)
        std::string storage_dir;

        bool enabled{true};
        bool warm_on_agent_activation{true};
        bool intelligent_prefetch{true};

        /// Item-count cap per pass
        size_t max_files_to_warm{10};

        /// Token budget per pass (tokens = ceil(length / 4))
        size_t max_tokens_per_warm{10000};

        /// Fragments younger than this are reused
        double freshness_window_hours{1.0};

        /// Patterns considered by Warm()
        size_t candidate_pool{50};

        /// Bonus when the pattern belongs to the requesting agent
        int agent_match_bonus{5};

        /// Items warmed by WarmForAgent()
        size_t agent_warm_limit{5};

        /// Patterns considered / admitted by IntelligentPrefetch()
        size_t prefetch_candidate_pool{100};
        size_t prefetch_limit{10};

        /// Path substrings matched by the project-essentials strategy
        std::vector<std::string> essential_prefixes{"project-knowledge", "core-patterns"};

        /// Emit informational log lines
        bool verbose{false};

        bool IsValid() const {
            return max_files_to_warm > 0 && max_tokens_per_warm > 0 &&
                   freshness_window_hours > 0.0 && candidate_pool > 0 &&
                   agent_match_bonus >= 0 && prefetch_candidate_pool > 0;
        }
    };

    /// Warming statistics
    struct Statistics {
        std::optional<Timestamp> last_warming_time;
        size_t cached_fragments{0};
        size_t total_cached_tokens{0};
        size_t avg_fragment_tokens{0};
        std::optional<Timestamp> oldest_fragment;
        size_t total_passes{0};
        size_t total_items_warmed{0};
    };

    /// Construct a warmer over tracker patterns and a content source
    /// @throws std::invalid_argument if config is invalid
    CacheWarmer(const Config& config, AccessTracker& tracker, IContentSource& source);

    CacheWarmer(const CacheWarmer&) = delete;
    CacheWarmer& operator=(const CacheWarmer&) = delete;

    /// Restore the fragment snapshot (fresh entries only)
    void Initialize(Timestamp now = Timestamp::Now());

    // ========================================================================
    // Warming
    // ========================================================================

    /// Score tracker patterns with every strategy and admit the best
    WarmingResult Warm(const std::optional<std::string>& agent_id = std::nullopt,
                       Timestamp now = Timestamp::Now());

    /// Warm the agent's own most accessed items before it activates
    WarmingResult WarmForAgent(const std::string& agent_id, Timestamp now = Timestamp::Now());

    /// Warm items predicted from agent, directory proximity and task type
    WarmingResult IntelligentPrefetch(const PrefetchContext& context,
                                      Timestamp now = Timestamp::Now());

    /// Register an extra strategy
    void AddStrategy(WarmingStrategy strategy);

    const std::vector<WarmingStrategy>& GetStrategies() const { return strategies_; }

    /// Score a single pattern (sum of matching priorities plus agent bonus)
    int ScorePattern(const AccessPattern& pattern, const WarmingContext& context) const;

    // ========================================================================
    // Fragment Access
    // ========================================================================

    /// All fragments, keyed by path
    const std::map<std::string, CachedFragment>& GetWarmedContent() const { return fragments_; }

    /// Fresh fragment for path
    std::optional<CachedFragment> GetFragment(const std::string& path,
                                              Timestamp now = Timestamp::Now()) const;

    /// Drop the fragment for path (after the item changed)
    bool Invalidate(const std::string& path);

    /// Drop every fragment older than the freshness window
    /// @return Number of fragments removed
    size_t ClearStaleContent(Timestamp now = Timestamp::Now());

    Statistics GetStatistics() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    AccessTracker& tracker_;
    IContentSource& source_;
    std::vector<WarmingStrategy> strategies_;
    std::map<std::string, CachedFragment> fragments_;
    std::unique_ptr<StateDatabase> db_;

    std::optional<Timestamp> last_warming_time_;
    size_t total_passes_{0};
    size_t total_items_warmed_{0};

    bool IsFresh(const CachedFragment& fragment, const Timestamp& now) const;

    /// Greedy admission under the token budget, in candidate order
    WarmingResult Admit(const std::vector<AccessPattern>& candidates, const Timestamp& now);

    WarmingResult Disabled(const std::string& reason) const;
    void OpenDatabase();
    void SaveSnapshot();
};

} // namespace ctxmem
