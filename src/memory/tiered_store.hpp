// File: src/memory/tiered_store.hpp
//
// Tiered Store - Hot/Warm/Cold placement of knowledge items
//
// Provides a single interface for storing and retrieving knowledge item
// content across three tiers, with age-based demotion, frequency-based
// promotion and byte-budget eviction of the hot tier.
//
// Tier Transition Rules:
//   Hot  -> Warm : no access for hot_tier_max_days, or LRU eviction when the
//                  hot tier exceeds hot_tier_max_size_bytes
//   Warm -> Cold : no access for warm_tier_max_days
//   Cold -> Hot  : on retrieval, >= 3 accesses in the last 24h
//   Warm -> Hot  : on retrieval, >= 5 accesses in the last 7 days
//   Cold -> Warm : migration sweep, cold entry that still shows the cold
//                  promotion frequency
//
// Every move writes the destination, commits the index row, then removes
// the source. The index is authoritative: exactly one tier holds an item.

#pragma once

#include "core/types.hpp"
#include "memory/memory_tier.hpp"
#include "storage/compression.hpp"
#include "storage/state_database.hpp"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctxmem {

/// Raised when an item would be (or is) authoritative in two tiers, or a
/// move's source tier disagrees with the index. Indicates a bug.
class InvalidTransitionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// How equally-old hot entries are ordered for eviction
enum class EvictionTieBreak {
    LOWEST_ACCESS_COUNT,   ///< Fewer accesses evicted first
    OLDEST_CREATED,        ///< Earlier creation evicted first
    PATH_ORDER             ///< Lexicographically smaller path evicted first
};

/// Convert tie-break to string
std::string EvictionTieBreakToString(EvictionTieBreak tie_break);

/// Parse tie-break from string
std::optional<EvictionTieBreak> ParseEvictionTieBreak(const std::string& str);

/// Index metadata for one knowledge item (content lives in its tier)
struct MemoryEntry {
    std::string path;
    MemoryTier tier{MemoryTier::HOT};
    Timestamp created_at;
    Timestamp last_accessed;
    uint64_t access_count{0};
    size_t size_bytes{0};
    std::optional<std::string> agent_id;

    /// Most recent retrieval times, oldest first (bounded)
    std::deque<Timestamp> recent_accesses;

    /// Retrievals at or after `since`
    size_t CountAccessesSince(const Timestamp& since) const;
};

/// Result of a retrieval
struct RetrieveResult {
    bool found{false};
    std::string content;
    MemoryTier tier{MemoryTier::HOT};   ///< Tier the content was served from
    bool promoted{false};               ///< Moved to hot by this retrieval
};

/// Result of a migration sweep
struct MigrationResult {
    size_t hot_to_warm{0};
    size_t warm_to_cold{0};
    size_t cold_to_warm{0};
    std::vector<std::string> errors;

    size_t Total() const { return hot_to_warm + warm_to_cold + cold_to_warm; }
};

/// Hot/warm/cold knowledge item store
class TieredStore {
public:
    /// Configuration for the tiered store
    struct Config {
        /// Root directory holding index.db and hot/, warm/, cold/
        std::string storage_dir;

        /// Days without access before hot -> warm
        double hot_tier_max_days{7.0};

        /// Days without access before warm -> cold
        double warm_tier_max_days{30.0};

        /// Hot tier byte budget
        size_t hot_tier_max_size_bytes{50 * 1024 * 1024};

        /// Cold -> hot promotion: accesses within the window
        size_t cold_promotion_accesses{3};
        double cold_promotion_window_hours{24.0};

        /// Warm -> hot promotion: accesses within the window
        size_t warm_promotion_accesses{5};
        double warm_promotion_window_days{7.0};

        /// Retrieval timestamps kept per entry for the predicates above
        size_t max_recent_accesses{32};

        /// Ordering of equally-old eviction candidates
        EvictionTieBreak eviction_tie_break{EvictionTieBreak::LOWEST_ACCESS_COUNT};

        /// zstd level for cold content
        int compression_level{kDefaultCompressionLevel};

        /// Emit informational log lines
        bool verbose{false};

        /// Validate configuration
        bool IsValid() const;
    };

    /// Per-tier statistics
    struct TierStatistics {
        size_t item_count{0};
        size_t bytes{0};
        size_t hits{0};
        double avg_access_micros{0.0};   ///< Mean retrieval latency
    };

    /// Store-wide statistics
    struct Statistics {
        TierStatistics hot;
        TierStatistics warm;
        TierStatistics cold;
        size_t misses{0};
        size_t promotions{0};
        size_t demotions{0};
        size_t evictions{0};
    };

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit TieredStore(const Config& config);

    /// Construct over caller-supplied tier backends
    ///
    /// index.db still lives in config.storage_dir.
    ///
    /// @throws std::invalid_argument if config is invalid, a tier is null, or
    ///         a tier reports the wrong level
    TieredStore(const Config& config, std::unique_ptr<IMemoryTier> hot,
                std::unique_ptr<IMemoryTier> warm, std::unique_ptr<IMemoryTier> cold);

    TieredStore(const TieredStore&) = delete;
    TieredStore& operator=(const TieredStore&) = delete;

    /// Reload the index and reconcile it with tier contents
    ///
    /// Copies left behind by an interrupted move are removed; the index row
    /// decides which copy is authoritative.
    void Initialize();

    // ========================================================================
    // Item Operations
    // ========================================================================

    /// Store content in the hot tier
    ///
    /// An existing warm/cold copy is moved out of its tier. New entries start
    /// with access_count 0. May evict older hot entries to warm.
    ///
    /// @param path Item path (relative, no "..")
    /// @param content Content bytes
    /// @param agent_id Agent that wrote the item
    /// @param now Time of the write
    /// @return true if stored, false on a persistence fault
    /// @throws std::invalid_argument if ValidateItemPath rejects path
    bool Store(const std::string& path, const std::string& content,
               const std::optional<std::string>& agent_id = std::nullopt,
               Timestamp now = Timestamp::Now());

    /// Retrieve content, updating access accounting then promoting if due
    ///
    /// @param path Item path
    /// @param now Time of the access
    /// @return Result with found == false if the path is unknown
    RetrieveResult Retrieve(const std::string& path, Timestamp now = Timestamp::Now());

    /// Read content without touching access accounting or placement
    std::optional<std::string> Peek(const std::string& path);

    /// Remove the item from whichever tier holds it
    /// @return false if the path is unknown
    bool Delete(const std::string& path);

    // ========================================================================
    // Migration
    // ========================================================================

    /// Apply demotion rules to every entry (and the cold rescue rule)
    ///
    /// Per-item failures are collected in errors; siblings still migrate.
    MigrationResult RunMigration(Timestamp now = Timestamp::Now());

    // ========================================================================
    // Queries
    // ========================================================================

    /// Current tier of path
    std::optional<MemoryTier> GetTier(const std::string& path) const;

    /// Index metadata for path
    std::optional<MemoryEntry> GetEntryInfo(const std::string& path) const;

    bool Contains(const std::string& path) const { return index_.count(path) > 0; }

    /// Tiers whose backend physically holds path (exactly one when consistent)
    std::vector<MemoryTier> GetTiersHolding(const std::string& path) const;

    /// All indexed paths in order
    std::vector<std::string> ListPaths() const;

    /// Bytes currently held by the hot tier
    size_t GetHotBytes() const;

    Statistics GetStatistics() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::unique_ptr<IMemoryTier> hot_;
    std::unique_ptr<IMemoryTier> warm_;
    std::unique_ptr<IMemoryTier> cold_;
    std::unique_ptr<StateDatabase> db_;

    // path -> entry (ordered so sweeps and listings are deterministic)
    std::map<std::string, MemoryEntry> index_;

    Statistics stats_;
    double access_micros_total_[3]{0.0, 0.0, 0.0};

    IMemoryTier& TierFor(MemoryTier tier) const;
    void OpenDatabase();
    void PersistEntry(const MemoryEntry& entry);
    void EraseEntryRow(const std::string& path);

    /// Move entry from `from` to `to`
    /// @return false (with error filled) on a persistence fault
    /// @throws InvalidTransitionError if from disagrees with the index
    bool MoveEntry(MemoryEntry& entry, MemoryTier from, MemoryTier to,
                   const std::optional<std::string>& content, std::string& error);

    /// Demote least-recently-accessed hot entries until within budget
    void EnforceHotBudget(const std::string& protected_path);

    void VerifyExclusive(const std::string& path) const;
    void RecordRetrieval(MemoryEntry& entry, const Timestamp& now);
};

/// Reject paths that are empty, absolute, or contain ".." components
///
/// Also reserved: a leading ".staging" component, and directory components
/// ending in ".item" or ".item.zst" (the names tier files use).
///
/// @throws std::invalid_argument on a rejected path
void ValidateItemPath(const std::string& path);

} // namespace ctxmem
