// File: src/memory/memory_tier.cpp
//
// Implementation of Memory Tier utilities and Hot Tier

#include "memory/memory_tier.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <unordered_map>

namespace ctxmem {
namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> g_staging_counter{0};

fs::path NewStagingFile(const fs::path& staging_dir) {
    std::ostringstream name;
    name << "write-" << std::chrono::steady_clock::now().time_since_epoch().count()
         << "-" << ++g_staging_counter << ".tmp";
    return staging_dir / name.str();
}

bool EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() > suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

// ============================================================================
// Utility Functions
// ============================================================================

std::string TierToString(MemoryTier tier) {
    switch (tier) {
        case MemoryTier::HOT:
            return "Hot";
        case MemoryTier::WARM:
            return "Warm";
        case MemoryTier::COLD:
            return "Cold";
        default:
            return "Unknown";
    }
}

std::optional<MemoryTier> StringToTier(const std::string& str) {
    if (str == "Hot" || str == "HOT" || str == "hot") {
        return MemoryTier::HOT;
    } else if (str == "Warm" || str == "WARM" || str == "warm") {
        return MemoryTier::WARM;
    } else if (str == "Cold" || str == "COLD" || str == "cold") {
        return MemoryTier::COLD;
    }
    return std::nullopt;
}

fs::path ItemFilePath(const fs::path& root, const std::string& path, const std::string& suffix) {
    fs::path file = root / path;
    file += suffix;
    return file;
}

bool WriteFileAtomic(const fs::path& root, const fs::path& target, const std::string& bytes) {
    std::error_code ec;
    fs::path staging_dir = root / kStagingDirName;
    for (const auto& dir : {staging_dir, target.parent_path()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[MemoryTier] Cannot create " << dir << ": " << ec.message() << std::endl;
            return false;
        }
    }

    fs::path temp = NewStagingFile(staging_dir);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            std::cerr << "[MemoryTier] Cannot open " << temp << " for writing" << std::endl;
            return false;
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            std::cerr << "[MemoryTier] Short write to " << temp << std::endl;
            file.close();
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::cerr << "[MemoryTier] Cannot replace " << target << ": " << ec.message() << std::endl;
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

std::optional<std::string> ReadWholeFile(const fs::path& source) {
    std::ifstream file(source, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        std::cerr << "[MemoryTier] Read error on " << source << std::endl;
        return std::nullopt;
    }
    return bytes;
}

std::vector<std::string> ListRelativeFiles(const fs::path& root, const std::string& suffix) {
    std::vector<std::string> paths;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return paths;
    }

    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it.depth() == 0 && it->path().filename() == kStagingDirName) {
            it.disable_recursion_pending();
            continue;
        }

        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        std::string relative = fs::relative(it->path(), root, entry_ec).generic_string();
        if (entry_ec || !EndsWith(relative, suffix)) {
            continue;
        }
        relative.resize(relative.size() - suffix.size());
        paths.push_back(relative);
    }

    if (ec) {
        std::cerr << "[MemoryTier] Directory scan of " << root << " stopped: "
                  << ec.message() << std::endl;
    }
    return paths;
}

size_t RemoveStagedFiles(const fs::path& root) {
    fs::path staging_dir = root / kStagingDirName;
    std::error_code ec;
    if (!fs::exists(staging_dir, ec)) {
        return 0;
    }

    size_t removed = 0;
    for (fs::directory_iterator it(staging_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code remove_ec;
        if (fs::remove(it->path(), remove_ec)) {
            ++removed;
        } else if (remove_ec) {
            std::cerr << "[MemoryTier] Cannot remove staged file " << it->path()
                      << ": " << remove_ec.message() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[MemoryTier] Cannot scan " << staging_dir << ": " << ec.message() << std::endl;
    }
    return removed;
}

bool RemoveFileAndEmptyParents(const fs::path& file, const fs::path& root) {
    std::error_code ec;
    bool removed = fs::remove(file, ec);
    if (ec) {
        std::cerr << "[MemoryTier] Cannot remove " << file << ": " << ec.message() << std::endl;
        return false;
    }

    fs::path dir = file.parent_path();
    fs::path stop = root.lexically_normal();
    while (!dir.empty() && dir.lexically_normal() != stop && fs::is_empty(dir, ec) && !ec) {
        fs::remove(dir, ec);
        dir = dir.parent_path();
    }
    return removed;
}

// ============================================================================
// Hot Tier Implementation (RAM-based, mirrored to disk)
// ============================================================================

class HotTier : public IMemoryTier {
public:
    explicit HotTier(const std::string& storage_path)
        : storage_path_(storage_path) {

        fs::create_directories(storage_path_);
        RemoveStagedFiles(storage_path_);

        // Materialize the mirror so every hot read is served from memory
        for (const auto& path : ListRelativeFiles(storage_path_)) {
            auto bytes = ReadWholeFile(ItemFilePath(storage_path_, path));
            if (bytes) {
                bytes_used_ += bytes->size();
                items_.emplace(path, std::move(*bytes));
            }
        }
    }

    bool Write(const std::string& path, const std::string& content) override {
        if (!WriteFileAtomic(storage_path_, ItemFilePath(storage_path_, path), content)) {
            return false;
        }

        auto it = items_.find(path);
        if (it != items_.end()) {
            bytes_used_ -= it->second.size();
            it->second = content;
        } else {
            items_.emplace(path, content);
        }
        bytes_used_ += content.size();
        return true;
    }

    std::optional<std::string> Read(const std::string& path) override {
        auto it = items_.find(path);
        if (it != items_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool Remove(const std::string& path) override {
        auto it = items_.find(path);
        if (it == items_.end()) {
            return false;
        }
        bytes_used_ -= it->second.size();
        items_.erase(it);
        RemoveFileAndEmptyParents(ItemFilePath(storage_path_, path), storage_path_);
        return true;
    }

    bool Contains(const std::string& path) const override {
        return items_.find(path) != items_.end();
    }

    std::vector<std::string> ListPaths() const override {
        std::vector<std::string> paths;
        paths.reserve(items_.size());
        for (const auto& [path, content] : items_) {
            paths.push_back(path);
        }
        return paths;
    }

    // Statistics
    size_t GetItemCount() const override {
        return items_.size();
    }

    size_t EstimateStorageUsage() const override {
        return bytes_used_;
    }

    // Tier information
    MemoryTier GetTierLevel() const override {
        return MemoryTier::HOT;
    }

    std::string GetTierName() const override {
        return "Hot";
    }

    void Clear() override {
        for (const auto& [path, content] : items_) {
            RemoveFileAndEmptyParents(ItemFilePath(storage_path_, path), storage_path_);
        }
        items_.clear();
        bytes_used_ = 0;
    }

private:
    fs::path storage_path_;
    std::unordered_map<std::string, std::string> items_;
    size_t bytes_used_{0};
};

// ============================================================================
// Factory Functions
// ============================================================================

std::unique_ptr<IMemoryTier> CreateHotTier(const std::string& storage_path) {
    return std::make_unique<HotTier>(storage_path);
}

} // namespace ctxmem
