// File: src/memory/tiered_store.cpp
#include "memory/tiered_store.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <sstream>

namespace ctxmem {
namespace fs = std::filesystem;

namespace {

std::string EncodeAccessTimes(const std::deque<Timestamp>& times) {
    std::ostringstream out;
    bool first = true;
    for (const auto& t : times) {
        if (!first) {
            out << ',';
        }
        out << t.ToMicros();
        first = false;
    }
    return out.str();
}

std::deque<Timestamp> DecodeAccessTimes(const std::string& encoded) {
    std::deque<Timestamp> times;
    std::istringstream in(encoded);
    std::string token;
    while (std::getline(in, token, ',')) {
        if (token.empty()) {
            continue;
        }
        try {
            times.push_back(Timestamp::FromMicros(std::stoll(token)));
        } catch (const std::exception&) {
            // Skip a corrupt element; the rest of the history is still valid
        }
    }
    return times;
}

size_t TierIndex(MemoryTier tier) {
    return static_cast<size_t>(tier);
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

std::string EvictionTieBreakToString(EvictionTieBreak tie_break) {
    switch (tie_break) {
        case EvictionTieBreak::LOWEST_ACCESS_COUNT:
            return "lowest_access_count";
        case EvictionTieBreak::OLDEST_CREATED:
            return "oldest_created";
        case EvictionTieBreak::PATH_ORDER:
            return "path_order";
        default:
            return "unknown";
    }
}

std::optional<EvictionTieBreak> ParseEvictionTieBreak(const std::string& str) {
    if (str == "lowest_access_count") {
        return EvictionTieBreak::LOWEST_ACCESS_COUNT;
    } else if (str == "oldest_created") {
        return EvictionTieBreak::OLDEST_CREATED;
    } else if (str == "path_order") {
        return EvictionTieBreak::PATH_ORDER;
    }
    return std::nullopt;
}

void ValidateItemPath(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("Item path must not be empty");
    }

    fs::path p(path);
    if (p.is_absolute() || path.front() == '/') {
        throw std::invalid_argument("Item path must be relative: " + path);
    }

    const std::string item_suffix = kItemFileSuffix;
    const std::string cold_suffix = item_suffix + ".zst";
    auto ends_with = [](const std::string& str, const std::string& suffix) {
        return str.size() >= suffix.size() &&
               str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    for (auto it = p.begin(); it != p.end(); ++it) {
        const std::string component = it->string();
        if (component == "..") {
            throw std::invalid_argument("Item path must not contain '..': " + path);
        }
        if (it == p.begin() && component == kStagingDirName) {
            throw std::invalid_argument("Item path must not start with " +
                                        std::string(kStagingDirName) + ": " + path);
        }

        // A directory named like an item file would collide with that item
        bool is_directory = std::next(it) != p.end();
        if (is_directory && (ends_with(component, item_suffix) || ends_with(component, cold_suffix))) {
            throw std::invalid_argument("Item path directory must not end in " + item_suffix +
                                        " or " + cold_suffix + ": " + path);
        }
    }
}

size_t MemoryEntry::CountAccessesSince(const Timestamp& since) const {
    return static_cast<size_t>(std::count_if(
        recent_accesses.begin(), recent_accesses.end(),
        [&](const Timestamp& t) { return t >= since; }));
}

bool TieredStore::Config::IsValid() const {
    if (storage_dir.empty()) {
        return false;
    }
    if (hot_tier_max_days <= 0.0 || warm_tier_max_days <= 0.0) {
        return false;
    }
    if (hot_tier_max_size_bytes == 0) {
        return false;
    }
    if (cold_promotion_accesses == 0 || warm_promotion_accesses == 0) {
        return false;
    }
    if (cold_promotion_window_hours <= 0.0 || warm_promotion_window_days <= 0.0) {
        return false;
    }
    // The predicates need enough history to count up to their thresholds
    if (max_recent_accesses < std::max(cold_promotion_accesses, warm_promotion_accesses)) {
        return false;
    }
    if (compression_level < 1 || compression_level > 19) {
        return false;
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

TieredStore::TieredStore(const Config& config)
    : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid TieredStore configuration");
    }

    fs::path root(config_.storage_dir);
    hot_ = CreateHotTier((root / "hot").string());
    warm_ = CreateWarmTier((root / "warm").string());
    cold_ = CreateColdTier((root / "cold").string(), config_.compression_level);

    OpenDatabase();
}

TieredStore::TieredStore(const Config& config, std::unique_ptr<IMemoryTier> hot,
                         std::unique_ptr<IMemoryTier> warm, std::unique_ptr<IMemoryTier> cold)
    : config_(config), hot_(std::move(hot)), warm_(std::move(warm)), cold_(std::move(cold)) {
    if (!config_.IsValid() || !hot_ || !warm_ || !cold_) {
        throw std::invalid_argument("Invalid TieredStore configuration");
    }
    if (hot_->GetTierLevel() != MemoryTier::HOT || warm_->GetTierLevel() != MemoryTier::WARM ||
        cold_->GetTierLevel() != MemoryTier::COLD) {
        throw std::invalid_argument("TieredStore tiers passed in the wrong order");
    }

    OpenDatabase();
}

void TieredStore::OpenDatabase() {
    try {
        StateDatabase::Config db_config;
        db_config.db_path = (fs::path(config_.storage_dir) / "index.db").string();
        db_ = std::make_unique<StateDatabase>(db_config);
        db_->ExecuteOrThrow(R"(
            CREATE TABLE IF NOT EXISTS memory_entries (
                path TEXT PRIMARY KEY,
                tier TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                last_accessed INTEGER NOT NULL,
                access_count INTEGER NOT NULL,
                size_bytes INTEGER NOT NULL,
                agent_id TEXT,
                recent_accesses TEXT NOT NULL
            );
        )");
    } catch (const std::exception& e) {
        std::cerr << "[TieredStore] Index persistence disabled: " << e.what() << std::endl;
        db_.reset();
    }
}

IMemoryTier& TieredStore::TierFor(MemoryTier tier) const {
    switch (tier) {
        case MemoryTier::HOT:
            return *hot_;
        case MemoryTier::WARM:
            return *warm_;
        case MemoryTier::COLD:
            return *cold_;
    }
    throw InvalidTransitionError("Unknown tier");
}

void TieredStore::Initialize() {
    index_.clear();

    if (db_) {
        try {
            auto stmt = db_->Prepare(
                "SELECT path, tier, created_at, last_accessed, access_count, size_bytes, "
                "agent_id, recent_accesses FROM memory_entries;");
            while (stmt.Step()) {
                MemoryEntry entry;
                entry.path = stmt.ColumnText(0);
                auto tier = StringToTier(stmt.ColumnText(1));
                if (!tier) {
                    std::cerr << "[TieredStore] Ignoring index row with unknown tier for "
                              << entry.path << std::endl;
                    continue;
                }
                entry.tier = *tier;
                entry.created_at = Timestamp::FromMicros(stmt.ColumnInt64(2));
                entry.last_accessed = Timestamp::FromMicros(stmt.ColumnInt64(3));
                entry.access_count = static_cast<uint64_t>(stmt.ColumnInt64(4));
                entry.size_bytes = static_cast<size_t>(stmt.ColumnInt64(5));
                if (!stmt.ColumnIsNull(6)) {
                    entry.agent_id = stmt.ColumnText(6);
                }
                entry.recent_accesses = DecodeAccessTimes(stmt.ColumnText(7));
                index_[entry.path] = std::move(entry);
            }
        } catch (const std::exception& e) {
            std::cerr << "[TieredStore] Failed to load index: " << e.what() << std::endl;
        }
    }

    const MemoryTier kTiers[] = {MemoryTier::HOT, MemoryTier::WARM, MemoryTier::COLD};
    size_t repaired = 0;

    // Indexed entries: drop stray copies outside the authoritative tier
    for (auto it = index_.begin(); it != index_.end();) {
        auto& entry = it->second;
        auto holding = GetTiersHolding(entry.path);

        bool in_indexed_tier = std::find(holding.begin(), holding.end(), entry.tier) != holding.end();
        if (!in_indexed_tier) {
            if (holding.empty()) {
                std::cerr << "[TieredStore] Content missing for " << entry.path
                          << ", dropping index row" << std::endl;
                EraseEntryRow(entry.path);
                it = index_.erase(it);
                ++repaired;
                continue;
            }
            // Prefer the hottest surviving copy
            entry.tier = holding.front();
            PersistEntry(entry);
            ++repaired;
        }

        for (MemoryTier tier : holding) {
            if (tier != entry.tier) {
                TierFor(tier).Remove(entry.path);
                ++repaired;
            }
        }
        ++it;
    }

    // Unindexed content from an interrupted first store: adopt the hottest copy
    for (MemoryTier tier : kTiers) {
        for (const auto& path : TierFor(tier).ListPaths()) {
            if (index_.count(path) > 0) {
                if (index_[path].tier != tier) {
                    TierFor(tier).Remove(path);
                    ++repaired;
                }
                continue;
            }
            auto content = TierFor(tier).Read(path);
            if (!content) {
                continue;
            }
            MemoryEntry entry;
            entry.path = path;
            entry.tier = tier;
            entry.created_at = Timestamp::Now();
            entry.last_accessed = entry.created_at;
            entry.size_bytes = content->size();
            index_[path] = entry;
            PersistEntry(entry);
            ++repaired;
        }
    }

    if (config_.verbose || repaired > 0) {
        std::cerr << "[TieredStore] Loaded " << index_.size() << " entries ("
                  << hot_->GetItemCount() << " hot, " << warm_->GetItemCount() << " warm, "
                  << cold_->GetItemCount() << " cold), repaired " << repaired << std::endl;
    }
}

// ============================================================================
// Index Persistence
// ============================================================================

void TieredStore::PersistEntry(const MemoryEntry& entry) {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare(
            "INSERT OR REPLACE INTO memory_entries (path, tier, created_at, last_accessed, "
            "access_count, size_bytes, agent_id, recent_accesses) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        stmt.BindText(1, entry.path);
        stmt.BindText(2, TierToString(entry.tier));
        stmt.BindInt64(3, entry.created_at.ToMicros());
        stmt.BindInt64(4, entry.last_accessed.ToMicros());
        stmt.BindInt64(5, static_cast<int64_t>(entry.access_count));
        stmt.BindInt64(6, static_cast<int64_t>(entry.size_bytes));
        if (entry.agent_id) {
            stmt.BindText(7, *entry.agent_id);
        } else {
            stmt.BindNull(7);
        }
        stmt.BindText(8, EncodeAccessTimes(entry.recent_accesses));
        stmt.Step();
    } catch (const std::exception& e) {
        std::cerr << "[TieredStore] Failed to persist index row for " << entry.path
                  << ": " << e.what() << std::endl;
    }
}

void TieredStore::EraseEntryRow(const std::string& path) {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare("DELETE FROM memory_entries WHERE path = ?;");
        stmt.BindText(1, path);
        stmt.Step();
    } catch (const std::exception& e) {
        std::cerr << "[TieredStore] Failed to delete index row for " << path
                  << ": " << e.what() << std::endl;
    }
}

// ============================================================================
// Moves
// ============================================================================

void TieredStore::VerifyExclusive(const std::string& path) const {
    auto holding = GetTiersHolding(path);
    if (holding.size() > 1) {
        std::ostringstream msg;
        msg << "Item " << path << " is authoritative in " << holding.size() << " tiers";
        throw InvalidTransitionError(msg.str());
    }
}

bool TieredStore::MoveEntry(MemoryEntry& entry, MemoryTier from, MemoryTier to,
                            const std::optional<std::string>& content, std::string& error) {
    if (entry.tier != from) {
        throw InvalidTransitionError("Move of " + entry.path + " from " + TierToString(from) +
                                     " but index says " + TierToString(entry.tier));
    }
    if (from == to) {
        return true;
    }

    std::optional<std::string> bytes = content;
    if (!bytes) {
        bytes = TierFor(from).Read(entry.path);
        if (!bytes) {
            error = entry.path + ": cannot read from " + TierToString(from) + " tier";
            return false;
        }
    }

    // 1. destination
    if (!TierFor(to).Write(entry.path, *bytes)) {
        error = entry.path + ": cannot write to " + TierToString(to) + " tier";
        return false;
    }

    // 2. index
    entry.tier = to;
    PersistEntry(entry);

    // 3. source
    TierFor(from).Remove(entry.path);
    VerifyExclusive(entry.path);

    if (TierIndex(to) < TierIndex(from)) {
        stats_.promotions++;
    } else {
        stats_.demotions++;
    }

    if (config_.verbose) {
        std::cerr << "[TieredStore] " << entry.path << ": " << TierToString(from)
                  << " -> " << TierToString(to) << std::endl;
    }
    return true;
}

void TieredStore::EnforceHotBudget(const std::string& protected_path) {
    while (hot_->EstimateStorageUsage() > config_.hot_tier_max_size_bytes) {
        MemoryEntry* victim = nullptr;

        for (auto& [path, entry] : index_) {
            if (entry.tier != MemoryTier::HOT || path == protected_path) {
                continue;
            }
            if (!victim) {
                victim = &entry;
                continue;
            }

            if (entry.last_accessed != victim->last_accessed) {
                if (entry.last_accessed < victim->last_accessed) {
                    victim = &entry;
                }
                continue;
            }

            switch (config_.eviction_tie_break) {
                case EvictionTieBreak::LOWEST_ACCESS_COUNT:
                    if (entry.access_count < victim->access_count) {
                        victim = &entry;
                    }
                    break;
                case EvictionTieBreak::OLDEST_CREATED:
                    if (entry.created_at < victim->created_at) {
                        victim = &entry;
                    }
                    break;
                case EvictionTieBreak::PATH_ORDER:
                    // index_ is ordered; the first candidate already wins
                    break;
            }
        }

        if (!victim) {
            break;
        }

        std::string error;
        if (!MoveEntry(*victim, MemoryTier::HOT, MemoryTier::WARM, std::nullopt, error)) {
            std::cerr << "[TieredStore] Eviction failed: " << error << std::endl;
            break;
        }
        stats_.evictions++;
    }
}

// ============================================================================
// Item Operations
// ============================================================================

bool TieredStore::Store(const std::string& path, const std::string& content,
                        const std::optional<std::string>& agent_id, Timestamp now) {
    ValidateItemPath(path);

    auto it = index_.find(path);
    if (it == index_.end()) {
        if (!hot_->Write(path, content)) {
            std::cerr << "[TieredStore] Failed to store " << path << std::endl;
            return false;
        }

        MemoryEntry entry;
        entry.path = path;
        entry.tier = MemoryTier::HOT;
        entry.created_at = now;
        entry.last_accessed = now;
        entry.access_count = 0;
        entry.size_bytes = content.size();
        entry.agent_id = agent_id;

        it = index_.emplace(path, std::move(entry)).first;
        PersistEntry(it->second);
    } else {
        auto& entry = it->second;
        entry.size_bytes = content.size();
        entry.last_accessed = std::max(entry.last_accessed, now);
        if (agent_id) {
            entry.agent_id = agent_id;
        }

        if (entry.tier == MemoryTier::HOT) {
            if (!hot_->Write(path, content)) {
                std::cerr << "[TieredStore] Failed to update " << path << std::endl;
                return false;
            }
            PersistEntry(entry);
        } else {
            std::string error;
            if (!MoveEntry(entry, entry.tier, MemoryTier::HOT, content, error)) {
                std::cerr << "[TieredStore] Failed to store " << error << std::endl;
                return false;
            }
        }
    }

    EnforceHotBudget(path);
    return true;
}

void TieredStore::RecordRetrieval(MemoryEntry& entry, const Timestamp& now) {
    entry.access_count++;
    entry.last_accessed = std::max(entry.last_accessed, now);
    entry.recent_accesses.push_back(now);
    while (entry.recent_accesses.size() > config_.max_recent_accesses) {
        entry.recent_accesses.pop_front();
    }
}

RetrieveResult TieredStore::Retrieve(const std::string& path, Timestamp now) {
    RetrieveResult result;

    auto it = index_.find(path);
    if (it == index_.end()) {
        stats_.misses++;
        return result;
    }

    auto& entry = it->second;
    MemoryTier source = entry.tier;

    auto started = std::chrono::steady_clock::now();
    auto content = TierFor(source).Read(path);
    auto elapsed = std::chrono::duration<double, std::micro>(
        std::chrono::steady_clock::now() - started).count();

    if (!content) {
        std::cerr << "[TieredStore] Indexed item " << path << " unreadable in "
                  << TierToString(source) << " tier" << std::endl;
        stats_.misses++;
        return result;
    }

    auto& tier_stats = source == MemoryTier::HOT ? stats_.hot
                     : source == MemoryTier::WARM ? stats_.warm : stats_.cold;
    tier_stats.hits++;
    access_micros_total_[TierIndex(source)] += elapsed;

    // Accounting first so the promotion predicate sees this access
    RecordRetrieval(entry, now);

    bool promote = false;
    if (source == MemoryTier::COLD) {
        auto since = now - std::chrono::duration<double, std::ratio<3600>>(
            config_.cold_promotion_window_hours);
        promote = entry.CountAccessesSince(since) >= config_.cold_promotion_accesses;
    } else if (source == MemoryTier::WARM) {
        auto since = now - std::chrono::duration<double, std::ratio<86400>>(
            config_.warm_promotion_window_days);
        promote = entry.CountAccessesSince(since) >= config_.warm_promotion_accesses;
    }

    if (promote) {
        std::string error;
        if (MoveEntry(entry, source, MemoryTier::HOT, content, error)) {
            result.promoted = true;
            EnforceHotBudget(path);
        } else {
            std::cerr << "[TieredStore] Promotion failed: " << error << std::endl;
            PersistEntry(entry);
        }
    } else {
        PersistEntry(entry);
    }

    result.found = true;
    result.content = std::move(*content);
    result.tier = source;
    return result;
}

std::optional<std::string> TieredStore::Peek(const std::string& path) {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return TierFor(it->second.tier).Read(path);
}

bool TieredStore::Delete(const std::string& path) {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return false;
    }

    TierFor(it->second.tier).Remove(path);
    EraseEntryRow(path);
    index_.erase(it);
    return true;
}

// ============================================================================
// Migration
// ============================================================================

MigrationResult TieredStore::RunMigration(Timestamp now) {
    MigrationResult result;

    auto hot_cutoff = now - std::chrono::duration<double, std::ratio<86400>>(
        config_.hot_tier_max_days);
    auto warm_cutoff = now - std::chrono::duration<double, std::ratio<86400>>(
        config_.warm_tier_max_days);
    auto rescue_since = now - std::chrono::duration<double, std::ratio<3600>>(
        config_.cold_promotion_window_hours);

    for (auto& [path, entry] : index_) {
        std::string error;

        // Stale-but-hot rescue: cold entries still showing promotion frequency
        if (entry.tier == MemoryTier::COLD &&
            entry.CountAccessesSince(rescue_since) >= config_.cold_promotion_accesses) {
            if (MoveEntry(entry, MemoryTier::COLD, MemoryTier::WARM, std::nullopt, error)) {
                result.cold_to_warm++;
            } else {
                result.errors.push_back(error);
            }
            continue;
        }

        if (entry.tier == MemoryTier::HOT && entry.last_accessed < hot_cutoff) {
            if (!MoveEntry(entry, MemoryTier::HOT, MemoryTier::WARM, std::nullopt, error)) {
                result.errors.push_back(error);
                continue;
            }
            result.hot_to_warm++;
        }

        if (entry.tier == MemoryTier::WARM && entry.last_accessed < warm_cutoff) {
            if (!MoveEntry(entry, MemoryTier::WARM, MemoryTier::COLD, std::nullopt, error)) {
                result.errors.push_back(error);
                continue;
            }
            result.warm_to_cold++;
        }
    }

    if (config_.verbose) {
        std::cerr << "[TieredStore] Migration: " << result.hot_to_warm << " hot->warm, "
                  << result.warm_to_cold << " warm->cold, " << result.cold_to_warm
                  << " cold->warm, " << result.errors.size() << " errors" << std::endl;
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<MemoryTier> TieredStore::GetTier(const std::string& path) const {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second.tier;
}

std::optional<MemoryEntry> TieredStore::GetEntryInfo(const std::string& path) const {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<MemoryTier> TieredStore::GetTiersHolding(const std::string& path) const {
    std::vector<MemoryTier> holding;
    if (hot_->Contains(path)) {
        holding.push_back(MemoryTier::HOT);
    }
    if (warm_->Contains(path)) {
        holding.push_back(MemoryTier::WARM);
    }
    if (cold_->Contains(path)) {
        holding.push_back(MemoryTier::COLD);
    }
    return holding;
}

std::vector<std::string> TieredStore::ListPaths() const {
    std::vector<std::string> paths;
    paths.reserve(index_.size());
    for (const auto& [path, entry] : index_) {
        paths.push_back(path);
    }
    return paths;
}

size_t TieredStore::GetHotBytes() const {
    return hot_->EstimateStorageUsage();
}

TieredStore::Statistics TieredStore::GetStatistics() const {
    Statistics stats = stats_;

    auto fill = [this](TierStatistics& tier_stats, const IMemoryTier& tier) {
        tier_stats.item_count = tier.GetItemCount();
        tier_stats.bytes = tier.EstimateStorageUsage();
        size_t idx = TierIndex(tier.GetTierLevel());
        tier_stats.avg_access_micros = tier_stats.hits > 0
            ? access_micros_total_[idx] / static_cast<double>(tier_stats.hits)
            : 0.0;
    };

    fill(stats.hot, *hot_);
    fill(stats.warm, *warm_);
    fill(stats.cold, *cold_);
    return stats;
}

} // namespace ctxmem
