// File: src/memory/warm_tier.cpp
//
// Warm Tier Implementation (File-based storage)
//
// Uses simple file-based storage with one "<path>.item" file per knowledge
// item, laid out under the storage directory by item path.

#include "memory/memory_tier.hpp"
#include <unordered_set>

namespace ctxmem {
namespace fs = std::filesystem;

class WarmTier : public IMemoryTier {
public:
    explicit WarmTier(const std::string& storage_path)
        : storage_path_(storage_path) {

        fs::create_directories(storage_path_);
        RemoveStagedFiles(storage_path_);

        // Build index of existing files
        RebuildIndex();
    }

    bool Write(const std::string& path, const std::string& content) override {
        if (!WriteFileAtomic(storage_path_, ItemFilePath(storage_path_, path), content)) {
            return false;
        }
        index_.insert(path);
        return true;
    }

    std::optional<std::string> Read(const std::string& path) override {
        if (index_.find(path) == index_.end()) {
            return std::nullopt;
        }
        return ReadWholeFile(ItemFilePath(storage_path_, path));
    }

    bool Remove(const std::string& path) override {
        if (index_.erase(path) == 0) {
            return false;
        }
        RemoveFileAndEmptyParents(ItemFilePath(storage_path_, path), storage_path_);
        return true;
    }

    bool Contains(const std::string& path) const override {
        return index_.find(path) != index_.end();
    }

    std::vector<std::string> ListPaths() const override {
        return std::vector<std::string>(index_.begin(), index_.end());
    }

    // Statistics
    size_t GetItemCount() const override {
        return index_.size();
    }

    size_t EstimateStorageUsage() const override {
        size_t total = 0;
        std::error_code ec;
        for (const auto& path : index_) {
            auto size = fs::file_size(ItemFilePath(storage_path_, path), ec);
            if (!ec) {
                total += static_cast<size_t>(size);
            }
        }
        return total;
    }

    // Tier information
    MemoryTier GetTierLevel() const override {
        return MemoryTier::WARM;
    }

    std::string GetTierName() const override {
        return "Warm";
    }

    void Clear() override {
        for (const auto& path : index_) {
            RemoveFileAndEmptyParents(ItemFilePath(storage_path_, path), storage_path_);
        }
        index_.clear();
    }

private:
    fs::path storage_path_;
    std::unordered_set<std::string> index_;

    void RebuildIndex() {
        index_.clear();
        for (auto& path : ListRelativeFiles(storage_path_)) {
            index_.insert(std::move(path));
        }
    }
};

std::unique_ptr<IMemoryTier> CreateWarmTier(const std::string& storage_path) {
    return std::make_unique<WarmTier>(storage_path);
}

} // namespace ctxmem
