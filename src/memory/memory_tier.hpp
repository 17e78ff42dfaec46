// File: src/memory/memory_tier.hpp
//
// Memory Tier Interface for the Tiered Knowledge Store
//
// This module defines the abstract interface for content tiers. Each tier
// holds knowledge item content keyed by path, with different performance
// characteristics:
//
// Tier Structure:
//   1. Hot (RAM, mirrored to disk): fully materialized, sub-5ms access
//   2. Warm (plain files): read from disk on demand
//   3. Cold (zstd-compressed files): read and decompress on demand
//
// Tiers only store bytes. Which tier is authoritative for a path is decided
// by the TieredStore index, never by the tiers themselves.

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxmem {

/// Memory tier levels
enum class MemoryTier {
    HOT = 0,    ///< In-memory, fastest
    WARM = 1,   ///< Plain files on disk
    COLD = 2    ///< Compressed files on disk
};

/// Convert tier to string
std::string TierToString(MemoryTier tier);

/// Convert string to tier
std::optional<MemoryTier> StringToTier(const std::string& str);

/// Abstract interface for a content tier
class IMemoryTier {
public:
    virtual ~IMemoryTier() = default;

    // ========================================================================
    // Content Operations
    // ========================================================================

    /// Write content for path, replacing any previous copy
    ///
    /// The write is atomic relative to the item: either the old or the new
    /// bytes are visible afterwards, never a partial file.
    ///
    /// @param path Item path (relative, already validated)
    /// @param content Raw content
    /// @return true if successfully written
    virtual bool Write(const std::string& path, const std::string& content) = 0;

    /// Read content for path
    ///
    /// @param path Item path
    /// @return Content if present and readable, nullopt otherwise
    virtual std::optional<std::string> Read(const std::string& path) = 0;

    /// Remove path from this tier
    ///
    /// @param path Item path
    /// @return true if something was removed
    virtual bool Remove(const std::string& path) = 0;

    /// Check if path has content in this tier
    virtual bool Contains(const std::string& path) const = 0;

    /// List every path held by this tier
    virtual std::vector<std::string> ListPaths() const = 0;

    // ========================================================================
    // Statistics and Information
    // ========================================================================

    /// Get number of items in this tier
    virtual size_t GetItemCount() const = 0;

    /// Estimate memory/disk usage in bytes
    virtual size_t EstimateStorageUsage() const = 0;

    /// Get tier level
    virtual MemoryTier GetTierLevel() const = 0;

    /// Get tier name
    virtual std::string GetTierName() const = 0;

    // ========================================================================
    // Maintenance Operations
    // ========================================================================

    /// Clear all data from this tier
    virtual void Clear() = 0;
};

// ============================================================================
// Factory Functions
// ============================================================================

/// Create a Hot tier (in-memory map mirrored to storage_path)
///
/// @param storage_path Directory for the on-disk mirror
/// @return Unique pointer to hot tier instance
std::unique_ptr<IMemoryTier> CreateHotTier(const std::string& storage_path);

/// Create a Warm tier (one plain file per item)
///
/// @param storage_path Path to storage directory
/// @return Unique pointer to warm tier instance
std::unique_ptr<IMemoryTier> CreateWarmTier(const std::string& storage_path);

/// Create a Cold tier (one zstd-compressed file per item, ".item.zst" suffix)
///
/// @param storage_path Path to storage directory
/// @param compression_level zstd level
/// @return Unique pointer to cold tier instance
std::unique_ptr<IMemoryTier> CreateColdTier(const std::string& storage_path,
                                            int compression_level);

// ============================================================================
// File Utilities (shared by the disk-backed tiers)
// ============================================================================
//
// Item "a/b" is stored as "<root>/a/b.item" (".item.zst" in the cold tier),
// so an item file never shares a name with the directory of a nested item.
// Writes are staged in "<root>/.staging/", which listings never descend into.

/// Suffix of every item file
constexpr const char* kItemFileSuffix = ".item";

/// Per-tier directory for in-flight writes
constexpr const char* kStagingDirName = ".staging";

/// File that holds item path under root
std::filesystem::path ItemFilePath(const std::filesystem::path& root, const std::string& path,
                                   const std::string& suffix = kItemFileSuffix);

/// Write bytes to a file staged under root, then rename over target
bool WriteFileAtomic(const std::filesystem::path& root, const std::filesystem::path& target,
                     const std::string& bytes);

/// Read a whole file
std::optional<std::string> ReadWholeFile(const std::filesystem::path& source);

/// Item paths of all files under root ending in suffix (suffix stripped,
/// staging directory skipped)
std::vector<std::string> ListRelativeFiles(const std::filesystem::path& root,
                                           const std::string& suffix = kItemFileSuffix);

/// Delete writes left in the staging directory by an interrupted process
/// @return Number of files removed
size_t RemoveStagedFiles(const std::filesystem::path& root);

/// Remove a file and any directories it leaves empty, up to root
bool RemoveFileAndEmptyParents(const std::filesystem::path& file,
                               const std::filesystem::path& root);

} // namespace ctxmem
