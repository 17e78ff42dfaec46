// File: src/memory/cold_tier.cpp
//
// Cold Tier Implementation (Compressed long-term storage)
//
// One zstd frame per knowledge item, stored as "<path>.item.zst" under the
// storage directory. Content is decompressed on every read.

#include "memory/memory_tier.hpp"
#include "storage/compression.hpp"
#include <iostream>
#include <unordered_map>

namespace ctxmem {
namespace fs = std::filesystem;

namespace {
const std::string kColdSuffix = std::string(kItemFileSuffix) + ".zst";
}

class ColdTier : public IMemoryTier {
public:
    ColdTier(const std::string& storage_path, int compression_level)
        : storage_path_(storage_path), compression_level_(compression_level) {

        fs::create_directories(storage_path_);
        RemoveStagedFiles(storage_path_);
        RebuildIndex();
    }

    bool Write(const std::string& path, const std::string& content) override {
        auto frame = Compress(content, compression_level_);
        if (!frame) {
            return false;
        }
        if (!WriteFileAtomic(storage_path_, FileFor(path), *frame)) {
            return false;
        }
        index_[path] = frame->size();
        return true;
    }

    std::optional<std::string> Read(const std::string& path) override {
        if (index_.find(path) == index_.end()) {
            return std::nullopt;
        }

        auto frame = ReadWholeFile(FileFor(path));
        if (!frame) {
            return std::nullopt;
        }

        auto content = Decompress(*frame);
        if (!content) {
            std::cerr << "[ColdTier] Corrupt archive for " << path << std::endl;
        }
        return content;
    }

    bool Remove(const std::string& path) override {
        if (index_.erase(path) == 0) {
            return false;
        }
        RemoveFileAndEmptyParents(FileFor(path), storage_path_);
        return true;
    }

    bool Contains(const std::string& path) const override {
        return index_.find(path) != index_.end();
    }

    std::vector<std::string> ListPaths() const override {
        std::vector<std::string> paths;
        paths.reserve(index_.size());
        for (const auto& [path, size] : index_) {
            paths.push_back(path);
        }
        return paths;
    }

    // Statistics
    size_t GetItemCount() const override {
        return index_.size();
    }

    size_t EstimateStorageUsage() const override {
        size_t total = 0;
        for (const auto& [path, size] : index_) {
            total += size;
        }
        return total;
    }

    // Tier information
    MemoryTier GetTierLevel() const override {
        return MemoryTier::COLD;
    }

    std::string GetTierName() const override {
        return "Cold";
    }

    void Clear() override {
        for (const auto& [path, size] : index_) {
            RemoveFileAndEmptyParents(FileFor(path), storage_path_);
        }
        index_.clear();
    }

private:
    fs::path storage_path_;
    int compression_level_;

    // path -> compressed size on disk
    std::unordered_map<std::string, size_t> index_;

    fs::path FileFor(const std::string& path) const {
        return ItemFilePath(storage_path_, path, kColdSuffix);
    }

    void RebuildIndex() {
        index_.clear();
        std::error_code ec;
        for (const auto& path : ListRelativeFiles(storage_path_, kColdSuffix)) {
            auto size = fs::file_size(FileFor(path), ec);
            index_[path] = ec ? 0 : static_cast<size_t>(size);
        }
    }
};

std::unique_ptr<IMemoryTier> CreateColdTier(const std::string& storage_path,
                                            int compression_level) {
    return std::make_unique<ColdTier>(storage_path, compression_level);
}

} // namespace ctxmem
