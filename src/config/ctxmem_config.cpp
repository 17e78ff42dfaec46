// File: src/config/ctxmem_config.cpp
//
// YAML Configuration Implementation for ctxmem

#include "config/ctxmem_config.hpp"
#include <yaml.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ctxmem {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// std::stoul accepts "-5" and wraps it; unsigned keys must not be negative
static unsigned long ParseUnsigned(const std::string& value) {
    size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-') {
        throw std::invalid_argument("negative value for unsigned key: " + value);
    }
    size_t consumed = 0;
    unsigned long parsed = std::stoul(value, &consumed);
    if (value.find_first_not_of(" \t", consumed) != std::string::npos) {
        throw std::invalid_argument("trailing characters in number: " + value);
    }
    return parsed;
}

// Apply one scalar key/value pair to the matching section
static void ApplyScalar(CtxmemConfig& config, const std::string& section,
                        const std::string& key, const std::string& value) {
    if (section == "storage") {
        if (key == "root_dir") config.storage.root_dir = value;
    }
    else if (section == "logging") {
        if (key == "verbose") config.logging.verbose = ParseBool(value);
    }
    else if (section == "access_tracker") {
        auto& s = config.access_tracker;
        if (key == "max_events") s.max_events = ParseUnsigned(value);
        else if (key == "recent_window_days") s.recent_window_days = std::stod(value);
        else if (key == "attribution_mode") s.attribution_mode = value;
        else if (key == "flush_batch_threshold") s.flush_batch_threshold = ParseUnsigned(value);
        else if (key == "flush_interval_seconds") s.flush_interval_seconds = ParseUnsigned(value);
        else if (key == "flush_max_queue_size") s.flush_max_queue_size = ParseUnsigned(value);
        else if (key == "prune_after_days") s.prune_after_days = std::stod(value);
    }
    else if (section == "tiered_store") {
        auto& s = config.tiered_store;
        if (key == "hot_tier_max_days") s.hot_tier_max_days = std::stod(value);
        else if (key == "warm_tier_max_days") s.warm_tier_max_days = std::stod(value);
        else if (key == "hot_tier_max_size_bytes") s.hot_tier_max_size_bytes = ParseUnsigned(value);
        else if (key == "cold_promotion_accesses") s.cold_promotion_accesses = ParseUnsigned(value);
        else if (key == "cold_promotion_window_hours") s.cold_promotion_window_hours = std::stod(value);
        else if (key == "warm_promotion_accesses") s.warm_promotion_accesses = ParseUnsigned(value);
        else if (key == "warm_promotion_window_days") s.warm_promotion_window_days = std::stod(value);
        else if (key == "max_recent_accesses") s.max_recent_accesses = ParseUnsigned(value);
        else if (key == "eviction_tie_break") s.eviction_tie_break = value;
        else if (key == "compression_level") s.compression_level = std::stoi(value);
    }
    else if (section == "cache_warmer") {
        auto& s = config.cache_warmer;
        if (key == "enabled") s.enabled = ParseBool(value);
        else if (key == "warm_on_agent_activation") s.warm_on_agent_activation = ParseBool(value);
        else if (key == "intelligent_prefetch") s.intelligent_prefetch = ParseBool(value);
        else if (key == "max_files_to_warm") s.max_files_to_warm = ParseUnsigned(value);
        else if (key == "max_tokens_per_warm") s.max_tokens_per_warm = ParseUnsigned(value);
        else if (key == "freshness_window_hours") s.freshness_window_hours = std::stod(value);
        else if (key == "agent_warm_limit") s.agent_warm_limit = ParseUnsigned(value);
        else if (key == "prefetch_limit") s.prefetch_limit = ParseUnsigned(value);
    }
    else if (section == "forecaster") {
        auto& s = config.forecaster;
        if (key == "token_limit") s.token_limit = ParseUnsigned(value);
        else if (key == "min_training_samples") s.min_training_samples = ParseUnsigned(value);
        else if (key == "ridge_strength") s.ridge_strength = std::stod(value);
        else if (key == "retention_days") s.retention_days = std::stod(value);
        else if (key == "minutes_per_message") s.minutes_per_message = std::stod(value);
        else if (key == "extract_soon_threshold") s.extract_soon_threshold = std::stod(value);
        else if (key == "extract_now_threshold") s.extract_now_threshold = std::stod(value);
    }
    else if (section == "drift") {
        auto& s = config.drift;
        if (key == "file_staleness_threshold") s.file_staleness_threshold = ParseUnsigned(value);
        else if (key == "task_switch_threshold") s.task_switch_threshold = ParseUnsigned(value);
        else if (key == "conversation_depth_threshold") s.conversation_depth_threshold = ParseUnsigned(value);
        else if (key == "conversation_depth_high") s.conversation_depth_high = ParseUnsigned(value);
        else if (key == "conversation_depth_critical") s.conversation_depth_critical = ParseUnsigned(value);
        else if (key == "agent_switch_threshold") s.agent_switch_threshold = ParseUnsigned(value);
        else if (key == "detect_obsolete_patterns") s.detect_obsolete_patterns = ParseBool(value);
        else if (key == "detect_agent_switches") s.detect_agent_switches = ParseBool(value);
        else if (key == "clear_score_threshold") s.clear_score_threshold = std::stoi(value);
        else if (key == "high_token_usage") s.high_token_usage = ParseUnsigned(value);
    }
    else if (section == "stats") {
        auto& s = config.stats;
        if (key == "max_clear_events") s.max_clear_events = ParseUnsigned(value);
        else if (key == "max_memory_operations") s.max_memory_operations = ParseUnsigned(value);
        else if (key == "retention_days") s.retention_days = std::stod(value);
    }
}

// Apply one sequence value to the matching section
static void ApplySequence(CtxmemConfig& config, const std::string& section,
                          const std::string& key, const std::vector<std::string>& values) {
    if (section == "cache_warmer" && key == "essential_prefixes") {
        config.cache_warmer.essential_prefixes = values;
    }
}

std::optional<CtxmemConfig> CtxmemConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CtxmemConfig] Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<CtxmemConfig> CtxmemConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "[CtxmemConfig] Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    CtxmemConfig config = Default();
    std::string current_section;
    std::string current_key;
    std::vector<std::string> sequence_values;
    bool in_sequence = false;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "[CtxmemConfig] YAML parse error at line "
                      << parser.problem_mark.line + 1 << ": "
                      << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        try {
            switch (event.type) {
                case YAML_STREAM_START_EVENT:
                case YAML_DOCUMENT_START_EVENT:
                    break;

                case YAML_MAPPING_START_EVENT:
                    depth++;
                    break;

                case YAML_MAPPING_END_EVENT:
                    depth--;
                    if (depth == 1) {
                        current_section.clear();
                    }
                    break;

                case YAML_SEQUENCE_START_EVENT:
                    if (depth == 2 && !current_key.empty()) {
                        in_sequence = true;
                        sequence_values.clear();
                    }
                    break;

                case YAML_SEQUENCE_END_EVENT:
                    if (in_sequence) {
                        ApplySequence(config, current_section, current_key, sequence_values);
                        in_sequence = false;
                        current_key.clear();
                    }
                    break;

                case YAML_SCALAR_EVENT: {
                    std::string value = GetScalarValue(&event);

                    if (in_sequence) {
                        sequence_values.push_back(value);
                    } else if (depth == 1) {
                        // Top-level key (section name)
                        current_section = value;
                    } else if (depth == 2) {
                        if (current_key.empty()) {
                            current_key = value;
                        } else {
                            ApplyScalar(config, current_section, current_key, value);
                            current_key.clear();
                        }
                    }
                    break;
                }

                case YAML_STREAM_END_EVENT:
                case YAML_DOCUMENT_END_EVENT:
                    done = true;
                    break;

                default:
                    break;
            }
        } catch (const std::exception& e) {
            std::cerr << "[CtxmemConfig] Invalid value for " << current_section << "."
                      << current_key << ": " << e.what() << std::endl;
            yaml_event_delete(&event);
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "[CtxmemConfig] Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool CtxmemConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CtxmemConfig] Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return true;
}

std::string CtxmemConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# ctxmem Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "storage:\n";
    ss << "  root_dir: \"" << storage.root_dir << "\"\n\n";

    ss << "logging:\n";
    ss << "  verbose: " << BoolString(logging.verbose) << "\n\n";

    ss << "access_tracker:\n";
    ss << "  max_events: " << access_tracker.max_events << "\n";
    ss << "  recent_window_days: " << access_tracker.recent_window_days << "\n";
    ss << "  attribution_mode: \"" << access_tracker.attribution_mode << "\"\n";
    ss << "  flush_batch_threshold: " << access_tracker.flush_batch_threshold << "\n";
    ss << "  flush_interval_seconds: " << access_tracker.flush_interval_seconds << "\n";
    ss << "  flush_max_queue_size: " << access_tracker.flush_max_queue_size << "\n";
    ss << "  prune_after_days: " << access_tracker.prune_after_days << "\n\n";

    ss << "tiered_store:\n";
    ss << "  hot_tier_max_days: " << tiered_store.hot_tier_max_days << "\n";
    ss << "  warm_tier_max_days: " << tiered_store.warm_tier_max_days << "\n";
    ss << "  hot_tier_max_size_bytes: " << tiered_store.hot_tier_max_size_bytes << "\n";
    ss << "  cold_promotion_accesses: " << tiered_store.cold_promotion_accesses << "\n";
    ss << "  cold_promotion_window_hours: " << tiered_store.cold_promotion_window_hours << "\n";
    ss << "  warm_promotion_accesses: " << tiered_store.warm_promotion_accesses << "\n";
    ss << "  warm_promotion_window_days: " << tiered_store.warm_promotion_window_days << "\n";
    ss << "  max_recent_accesses: " << tiered_store.max_recent_accesses << "\n";
    ss << "  eviction_tie_break: \"" << tiered_store.eviction_tie_break << "\"\n";
    ss << "  compression_level: " << tiered_store.compression_level << "\n\n";

    ss << "cache_warmer:\n";
    ss << "  enabled: " << BoolString(cache_warmer.enabled) << "\n";
    ss << "  warm_on_agent_activation: " << BoolString(cache_warmer.warm_on_agent_activation) << "\n";
    ss << "  intelligent_prefetch: " << BoolString(cache_warmer.intelligent_prefetch) << "\n";
    ss << "  max_files_to_warm: " << cache_warmer.max_files_to_warm << "\n";
    ss << "  max_tokens_per_warm: " << cache_warmer.max_tokens_per_warm << "\n";
    ss << "  freshness_window_hours: " << cache_warmer.freshness_window_hours << "\n";
    ss << "  agent_warm_limit: " << cache_warmer.agent_warm_limit << "\n";
    ss << "  prefetch_limit: " << cache_warmer.prefetch_limit << "\n";
    ss << "  essential_prefixes:\n";
    for (const auto& prefix : cache_warmer.essential_prefixes) {
        ss << "    - \"" << prefix << "\"\n";
    }
    ss << "\n";

    ss << "forecaster:\n";
    ss << "  token_limit: " << forecaster.token_limit << "\n";
    ss << "  min_training_samples: " << forecaster.min_training_samples << "\n";
    ss << "  ridge_strength: " << forecaster.ridge_strength << "\n";
    ss << "  retention_days: " << forecaster.retention_days << "\n";
    ss << "  minutes_per_message: " << forecaster.minutes_per_message << "\n";
    ss << "  extract_soon_threshold: " << forecaster.extract_soon_threshold << "\n";
    ss << "  extract_now_threshold: " << forecaster.extract_now_threshold << "\n\n";

    ss << "drift:\n";
    ss << "  file_staleness_threshold: " << drift.file_staleness_threshold << "\n";
    ss << "  task_switch_threshold: " << drift.task_switch_threshold << "\n";
    ss << "  conversation_depth_threshold: " << drift.conversation_depth_threshold << "\n";
    ss << "  conversation_depth_high: " << drift.conversation_depth_high << "\n";
    ss << "  conversation_depth_critical: " << drift.conversation_depth_critical << "\n";
    ss << "  agent_switch_threshold: " << drift.agent_switch_threshold << "\n";
    ss << "  detect_obsolete_patterns: " << BoolString(drift.detect_obsolete_patterns) << "\n";
    ss << "  detect_agent_switches: " << BoolString(drift.detect_agent_switches) << "\n";
    ss << "  clear_score_threshold: " << drift.clear_score_threshold << "\n";
    ss << "  high_token_usage: " << drift.high_token_usage << "\n\n";

    ss << "stats:\n";
    ss << "  max_clear_events: " << stats.max_clear_events << "\n";
    ss << "  max_memory_operations: " << stats.max_memory_operations << "\n";
    ss << "  retention_days: " << stats.retention_days << "\n";

    return ss.str();
}

bool CtxmemConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> CtxmemConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (storage.root_dir.empty()) {
        errors.push_back("storage root_dir must not be empty");
    }

    // Access tracker
    if (access_tracker.max_events == 0) {
        errors.push_back("max_events must be greater than 0");
    }
    if (access_tracker.recent_window_days <= 0.0) {
        errors.push_back("recent_window_days must be greater than 0");
    }
    if (!ParseAttributionMode(access_tracker.attribution_mode)) {
        errors.push_back("attribution_mode must be one of: last_toucher, contributor_set");
    }
    if (access_tracker.flush_batch_threshold == 0 || access_tracker.flush_interval_seconds == 0) {
        errors.push_back("flush_batch_threshold and flush_interval_seconds must be greater than 0");
    }
    if (access_tracker.flush_max_queue_size < access_tracker.flush_batch_threshold) {
        errors.push_back("flush_max_queue_size must be >= flush_batch_threshold");
    }
    if (access_tracker.prune_after_days <= 0.0) {
        errors.push_back("prune_after_days must be greater than 0");
    }

    // Tiered store
    if (tiered_store.hot_tier_max_days <= 0.0) {
        errors.push_back("hot_tier_max_days must be greater than 0");
    }
    if (tiered_store.warm_tier_max_days <= tiered_store.hot_tier_max_days) {
        errors.push_back("warm_tier_max_days must be greater than hot_tier_max_days");
    }
    if (tiered_store.hot_tier_max_size_bytes == 0) {
        errors.push_back("hot_tier_max_size_bytes must be greater than 0");
    }
    if (tiered_store.cold_promotion_accesses == 0 || tiered_store.warm_promotion_accesses == 0) {
        errors.push_back("promotion access counts must be greater than 0");
    }
    if (tiered_store.cold_promotion_window_hours <= 0.0 || tiered_store.warm_promotion_window_days <= 0.0) {
        errors.push_back("promotion windows must be greater than 0");
    }
    if (tiered_store.max_recent_accesses <
        std::max(tiered_store.cold_promotion_accesses, tiered_store.warm_promotion_accesses)) {
        errors.push_back("max_recent_accesses must cover the promotion access counts");
    }
    if (!ParseEvictionTieBreak(tiered_store.eviction_tie_break)) {
        errors.push_back("eviction_tie_break must be one of: lowest_access_count, oldest_created, path_order");
    }
    if (tiered_store.compression_level < 1 || tiered_store.compression_level > 19) {
        errors.push_back("compression_level must be between 1 and 19");
    }

    // Cache warmer
    if (cache_warmer.max_files_to_warm == 0 || cache_warmer.max_tokens_per_warm == 0) {
        errors.push_back("max_files_to_warm and max_tokens_per_warm must be greater than 0");
    }
    if (cache_warmer.freshness_window_hours <= 0.0) {
        errors.push_back("freshness_window_hours must be greater than 0");
    }
    if (cache_warmer.agent_warm_limit == 0 || cache_warmer.prefetch_limit == 0) {
        errors.push_back("agent_warm_limit and prefetch_limit must be greater than 0");
    }

    // Forecaster
    if (forecaster.token_limit == 0) {
        errors.push_back("token_limit must be greater than 0");
    }
    if (forecaster.min_training_samples == 0) {
        errors.push_back("min_training_samples must be greater than 0");
    }
    if (forecaster.ridge_strength < 0.0) {
        errors.push_back("ridge_strength must be non-negative");
    }
    if (forecaster.retention_days <= 0.0 || forecaster.minutes_per_message <= 0.0) {
        errors.push_back("retention_days and minutes_per_message must be greater than 0");
    }
    if (forecaster.extract_soon_threshold <= 0.0 ||
        forecaster.extract_soon_threshold > forecaster.extract_now_threshold ||
        forecaster.extract_now_threshold > 1.0) {
        errors.push_back("thresholds must satisfy 0 < extract_soon_threshold <= extract_now_threshold <= 1");
    }

    // Drift
    if (drift.file_staleness_threshold == 0 || drift.task_switch_threshold == 0 ||
        drift.agent_switch_threshold == 0) {
        errors.push_back("drift thresholds must be greater than 0");
    }
    if (drift.conversation_depth_threshold == 0 ||
        drift.conversation_depth_high < drift.conversation_depth_threshold ||
        drift.conversation_depth_critical < drift.conversation_depth_high) {
        errors.push_back("conversation depth bands must be positive and non-decreasing");
    }
    if (drift.clear_score_threshold <= 0 || drift.clear_score_threshold > 100) {
        errors.push_back("clear_score_threshold must be between 1 and 100");
    }

    // Stats
    if (stats.max_clear_events == 0 || stats.max_memory_operations == 0) {
        errors.push_back("stats retention caps must be greater than 0");
    }
    if (stats.retention_days <= 0.0) {
        errors.push_back("stats retention_days must be greater than 0");
    }

    return errors;
}

CtxmemConfig CtxmemConfig::Default() {
    return CtxmemConfig{};  // Uses default member initializers
}

// ============================================================================
// Component configurations
// ============================================================================

std::string CtxmemConfig::ResolveRootDir() const {
    const std::string& root = storage.root_dir;
    if (root == "~" || root.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home != nullptr) {
            return std::string(home) + root.substr(1);
        }
    }
    return root;
}

AccessTracker::Config CtxmemConfig::ToAccessTrackerConfig() const {
    AccessTracker::Config config;
    config.storage_dir = (std::filesystem::path(ResolveRootDir()) / "access").string();
    config.max_events = access_tracker.max_events;
    config.recent_window_days = access_tracker.recent_window_days;
    config.attribution_mode = ParseAttributionMode(access_tracker.attribution_mode)
                                  .value_or(AttributionMode::LAST_TOUCHER);
    config.flush.batch_threshold = access_tracker.flush_batch_threshold;
    config.flush.flush_interval = std::chrono::seconds(access_tracker.flush_interval_seconds);
    config.flush.max_queue_size = access_tracker.flush_max_queue_size;
    config.verbose = logging.verbose;
    return config;
}

TieredStore::Config CtxmemConfig::ToTieredStoreConfig() const {
    TieredStore::Config config;
    config.storage_dir = (std::filesystem::path(ResolveRootDir()) / "tiers").string();
    config.hot_tier_max_days = tiered_store.hot_tier_max_days;
    config.warm_tier_max_days = tiered_store.warm_tier_max_days;
    config.hot_tier_max_size_bytes = tiered_store.hot_tier_max_size_bytes;
    config.cold_promotion_accesses = tiered_store.cold_promotion_accesses;
    config.cold_promotion_window_hours = tiered_store.cold_promotion_window_hours;
    config.warm_promotion_accesses = tiered_store.warm_promotion_accesses;
    config.warm_promotion_window_days = tiered_store.warm_promotion_window_days;
    config.max_recent_accesses = tiered_store.max_recent_accesses;
    config.eviction_tie_break = ParseEvictionTieBreak(tiered_store.eviction_tie_break)
                                    .value_or(EvictionTieBreak::LOWEST_ACCESS_COUNT);
    config.compression_level = tiered_store.compression_level;
    config.verbose = logging.verbose;
    return config;
}

CacheWarmer::Config CtxmemConfig::ToCacheWarmerConfig() const {
    CacheWarmer::Config config;
    config.storage_dir = (std::filesystem::path(ResolveRootDir()) / "warming").string();
    config.enabled = cache_warmer.enabled;
    config.warm_on_agent_activation = cache_warmer.warm_on_agent_activation;
    config.intelligent_prefetch = cache_warmer.intelligent_prefetch;
    config.max_files_to_warm = cache_warmer.max_files_to_warm;
    config.max_tokens_per_warm = cache_warmer.max_tokens_per_warm;
    config.freshness_window_hours = cache_warmer.freshness_window_hours;
    config.agent_warm_limit = cache_warmer.agent_warm_limit;
    config.prefetch_limit = cache_warmer.prefetch_limit;
    config.essential_prefixes = cache_warmer.essential_prefixes;
    config.verbose = logging.verbose;
    return config;
}

TokenForecaster::Config CtxmemConfig::ToForecasterConfig() const {
    TokenForecaster::Config config;
    config.storage_dir = (std::filesystem::path(ResolveRootDir()) / "forecast").string();
    config.token_limit = forecaster.token_limit;
    config.min_training_samples = forecaster.min_training_samples;
    config.ridge_strength = forecaster.ridge_strength;
    config.retention_days = forecaster.retention_days;
    config.minutes_per_message = forecaster.minutes_per_message;
    config.extract_soon_threshold = forecaster.extract_soon_threshold;
    config.extract_now_threshold = forecaster.extract_now_threshold;
    config.verbose = logging.verbose;
    return config;
}

DriftDetector::Config CtxmemConfig::ToDriftDetectorConfig() const {
    DriftDetector::Config config;
    config.storage_dir = (std::filesystem::path(ResolveRootDir()) / "drift").string();
    config.file_staleness_threshold = drift.file_staleness_threshold;
    config.task_switch_threshold = drift.task_switch_threshold;
    config.conversation_depth_threshold = drift.conversation_depth_threshold;
    config.conversation_depth_high = drift.conversation_depth_high;
    config.conversation_depth_critical = drift.conversation_depth_critical;
    config.agent_switch_threshold = drift.agent_switch_threshold;
    config.detect_obsolete_patterns = drift.detect_obsolete_patterns;
    config.detect_agent_switches = drift.detect_agent_switches;
    config.clear_score_threshold = drift.clear_score_threshold;
    config.high_token_usage = drift.high_token_usage;
    config.verbose = logging.verbose;
    return config;
}

ContextStats::Config CtxmemConfig::ToContextStatsConfig() const {
    ContextStats::Config config;
    config.storage_dir = (std::filesystem::path(ResolveRootDir()) / "stats").string();
    config.max_clear_events = stats.max_clear_events;
    config.max_memory_operations = stats.max_memory_operations;
    config.verbose = logging.verbose;
    return config;
}

} // namespace ctxmem
