// File: include/config/ctxmem_config.hpp
//
// YAML Configuration Support for ctxmem
// Loads component settings for a context memory session from YAML files

#ifndef CTXMEM_CONFIG_HPP
#define CTXMEM_CONFIG_HPP

#include "context/context_stats.hpp"
#include "context/drift_detector.hpp"
#include "memory/access_tracker.hpp"
#include "memory/cache_warmer.hpp"
#include "memory/tiered_store.hpp"
#include "prediction/token_forecaster.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ctxmem {

/// Configuration structure for a ctxmem session
struct CtxmemConfig {
    // === Storage Settings ===
    struct Storage {
        std::string root_dir = "~/.ctxmem";   // "~/" expands to $HOME
    } storage;

    // === Logging Settings ===
    struct Logging {
        bool verbose = false;
    } logging;

    // === Access Tracking ===
    struct AccessTrackerSettings {
        size_t max_events = 1000;
        double recent_window_days = 7.0;
        std::string attribution_mode = "last_toucher";
        size_t flush_batch_threshold = 10;
        size_t flush_interval_seconds = 30;
        size_t flush_max_queue_size = 1000;
        double prune_after_days = 90.0;       // Pattern purge during maintenance
    } access_tracker;

    // === Tiered Storage ===
    struct TieredStoreSettings {
        double hot_tier_max_days = 7.0;
        double warm_tier_max_days = 30.0;
        size_t hot_tier_max_size_bytes = 50 * 1024 * 1024;
        size_t cold_promotion_accesses = 3;
        double cold_promotion_window_hours = 24.0;
        size_t warm_promotion_accesses = 5;
        double warm_promotion_window_days = 7.0;
        size_t max_recent_accesses = 32;
        std::string eviction_tie_break = "lowest_access_count";
        int compression_level = 10;
    } tiered_store;

    // === Cache Warming ===
    struct CacheWarmerSettings {
        bool enabled = true;
        bool warm_on_agent_activation = true;
        bool intelligent_prefetch = true;
        size_t max_files_to_warm = 10;
        size_t max_tokens_per_warm = 10000;
        double freshness_window_hours = 1.0;
        size_t agent_warm_limit = 5;
        size_t prefetch_limit = 10;
        std::vector<std::string> essential_prefixes{"project-knowledge", "core-patterns"};
    } cache_warmer;

    // === Token Forecasting ===
    struct ForecasterSettings {
        size_t token_limit = 200000;
        size_t min_training_samples = 10;
        double ridge_strength = 0.1;
        double retention_days = 90.0;
        double minutes_per_message = 2.0;
        double extract_soon_threshold = 0.85;
        double extract_now_threshold = 0.95;
    } forecaster;

    // === Drift Detection ===
    struct DriftSettings {
        size_t file_staleness_threshold = 50;
        size_t task_switch_threshold = 5;
        size_t conversation_depth_threshold = 200;
        size_t conversation_depth_high = 250;
        size_t conversation_depth_critical = 300;
        size_t agent_switch_threshold = 4;
        bool detect_obsolete_patterns = true;
        bool detect_agent_switches = true;
        int clear_score_threshold = 70;
        size_t high_token_usage = 150000;
    } drift;

    // === Context Statistics ===
    struct StatsSettings {
        size_t max_clear_events = 1000;
        size_t max_memory_operations = 5000;
        double retention_days = 30.0;
    } stats;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return CtxmemConfig structure if successful, std::nullopt on error
    static std::optional<CtxmemConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return CtxmemConfig structure if successful, std::nullopt on error
    static std::optional<CtxmemConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @param filepath Path to save YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static CtxmemConfig Default();

    /// Root directory with a leading "~/" expanded
    std::string ResolveRootDir() const;

    // Component configurations rooted under ResolveRootDir()
    AccessTracker::Config ToAccessTrackerConfig() const;
    TieredStore::Config ToTieredStoreConfig() const;
    CacheWarmer::Config ToCacheWarmerConfig() const;
    TokenForecaster::Config ToForecasterConfig() const;
    DriftDetector::Config ToDriftDetectorConfig() const;
    ContextStats::Config ToContextStatsConfig() const;
};

} // namespace ctxmem

#endif // CTXMEM_CONFIG_HPP
