// File: tests/memory/memory_tier_test.cpp
//
// Unit tests for the content tiers (Hot, Warm, Cold) and validates:
// - Write, Read, Remove, Contains
// - Nested item paths, including items nested under other items
// - Reload of existing content from disk
// - Staged writes and item file naming
// - Statistics and tier information
// - Utility functions

#include "memory/memory_tier.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

using namespace ctxmem;
namespace fs = std::filesystem;

// ============================================================================
// Test Fixtures
// ============================================================================

class TierTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "ctxmem_memory_tier_test";
        fs::remove_all(temp_dir_);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        tier_.reset();
        if (fs::exists(temp_dir_)) {
            fs::remove_all(temp_dir_);
        }
    }

    std::unique_ptr<IMemoryTier> tier_;
    fs::path temp_dir_;
};

class HotTierTest : public TierTestBase {
protected:
    void SetUp() override {
        TierTestBase::SetUp();
        tier_ = CreateHotTier((temp_dir_ / "hot").string());
    }
};

class WarmTierTest : public TierTestBase {
protected:
    void SetUp() override {
        TierTestBase::SetUp();
        tier_ = CreateWarmTier((temp_dir_ / "warm").string());
    }
};

class ColdTierTest : public TierTestBase {
protected:
    void SetUp() override {
        TierTestBase::SetUp();
        tier_ = CreateColdTier((temp_dir_ / "cold").string(), 3);
    }
};

// ============================================================================
// Hot Tier Tests
// ============================================================================

TEST_F(HotTierTest, TierInformation) {
    EXPECT_EQ(MemoryTier::HOT, tier_->GetTierLevel());
    EXPECT_EQ("Hot", tier_->GetTierName());
    EXPECT_EQ(0u, tier_->GetItemCount());
}

TEST_F(HotTierTest, WriteAndRead) {
    ASSERT_TRUE(tier_->Write("project-knowledge/api.md", "# API\nUse v2 endpoints."));
    EXPECT_TRUE(tier_->Contains("project-knowledge/api.md"));

    auto content = tier_->Read("project-knowledge/api.md");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ("# API\nUse v2 endpoints.", *content);
}

TEST_F(HotTierTest, OverwriteTracksBytes) {
    tier_->Write("a.md", std::string(100, 'x'));
    EXPECT_EQ(100u, tier_->EstimateStorageUsage());

    tier_->Write("a.md", std::string(40, 'y'));
    EXPECT_EQ(40u, tier_->EstimateStorageUsage());
    EXPECT_EQ(1u, tier_->GetItemCount());
}

TEST_F(HotTierTest, MirrorIsReloaded) {
    tier_->Write("notes/kept.md", "persisted");
    tier_.reset();

    tier_ = CreateHotTier((temp_dir_ / "hot").string());
    auto content = tier_->Read("notes/kept.md");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ("persisted", *content);
    EXPECT_EQ(9u, tier_->EstimateStorageUsage());
}

TEST_F(HotTierTest, RemoveDeletesMirrorFile) {
    tier_->Write("deep/nested/item.md", "gone soon");
    EXPECT_TRUE(fs::exists(temp_dir_ / "hot" / "deep" / "nested" / "item.md.item"));

    EXPECT_TRUE(tier_->Remove("deep/nested/item.md"));
    EXPECT_FALSE(tier_->Contains("deep/nested/item.md"));
    EXPECT_FALSE(fs::exists(temp_dir_ / "hot" / "deep"));
    EXPECT_TRUE(fs::exists(temp_dir_ / "hot"));
    EXPECT_FALSE(tier_->Remove("deep/nested/item.md"));
}

TEST_F(HotTierTest, TempSuffixedItemIsReloaded) {
    ASSERT_TRUE(tier_->Write("notes/b.tmp", "scratch notes"));
    tier_.reset();

    tier_ = CreateHotTier((temp_dir_ / "hot").string());
    EXPECT_TRUE(tier_->Contains("notes/b.tmp"));
    EXPECT_EQ(std::optional<std::string>("scratch notes"), tier_->Read("notes/b.tmp"));
}

TEST_F(HotTierTest, ItemAndNestedItemCoexist) {
    ASSERT_TRUE(tier_->Write("team/notes", "index of notes"));
    ASSERT_TRUE(tier_->Write("team/notes/today", "standup"));
    tier_.reset();

    tier_ = CreateHotTier((temp_dir_ / "hot").string());
    EXPECT_EQ(std::optional<std::string>("index of notes"), tier_->Read("team/notes"));
    EXPECT_EQ(std::optional<std::string>("standup"), tier_->Read("team/notes/today"));

    EXPECT_TRUE(tier_->Remove("team/notes"));
    EXPECT_EQ(std::optional<std::string>("standup"), tier_->Read("team/notes/today"));
}

TEST_F(HotTierTest, ClearEmptiesTier) {
    tier_->Write("a.md", "a");
    tier_->Write("b.md", "b");
    tier_->Clear();

    EXPECT_EQ(0u, tier_->GetItemCount());
    EXPECT_EQ(0u, tier_->EstimateStorageUsage());
    EXPECT_FALSE(tier_->Read("a.md").has_value());
}

// ============================================================================
// Warm Tier Tests
// ============================================================================

TEST_F(WarmTierTest, TierInformation) {
    EXPECT_EQ(MemoryTier::WARM, tier_->GetTierLevel());
    EXPECT_EQ("Warm", tier_->GetTierName());
}

TEST_F(WarmTierTest, WriteReadRemove) {
    ASSERT_TRUE(tier_->Write("core-patterns/errors.md", "Wrap and rethrow."));
    EXPECT_TRUE(fs::exists(temp_dir_ / "warm" / "core-patterns" / "errors.md.item"));

    auto content = tier_->Read("core-patterns/errors.md");
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ("Wrap and rethrow.", *content);

    EXPECT_TRUE(tier_->Remove("core-patterns/errors.md"));
    EXPECT_FALSE(tier_->Read("core-patterns/errors.md").has_value());
}

TEST_F(WarmTierTest, ReadUnknownPath) {
    EXPECT_FALSE(tier_->Read("missing.md").has_value());
    EXPECT_FALSE(tier_->Contains("missing.md"));
}

TEST_F(WarmTierTest, ExistingFilesAreIndexed) {
    tier_->Write("a.md", "alpha");
    tier_->Write("dir/b.md", "beta");
    tier_.reset();

    tier_ = CreateWarmTier((temp_dir_ / "warm").string());
    auto paths = tier_->ListPaths();
    std::sort(paths.begin(), paths.end());
    ASSERT_EQ(2u, paths.size());
    EXPECT_EQ("a.md", paths[0]);
    EXPECT_EQ("dir/b.md", paths[1]);
    EXPECT_EQ(9u, tier_->EstimateStorageUsage());
}

TEST_F(WarmTierTest, LeftoverStagedWritesDiscarded) {
    tier_.reset();
    fs::create_directories(temp_dir_ / "warm" / kStagingDirName);
    std::ofstream(temp_dir_ / "warm" / kStagingDirName / "write-1-1.tmp") << "partial";
    std::ofstream(temp_dir_ / "warm" / "README") << "not an item";

    tier_ = CreateWarmTier((temp_dir_ / "warm").string());
    EXPECT_EQ(0u, tier_->GetItemCount());
    EXPECT_FALSE(fs::exists(temp_dir_ / "warm" / kStagingDirName / "write-1-1.tmp"));
}

TEST_F(WarmTierTest, TempSuffixedItemSurvivesSiblingWrite) {
    ASSERT_TRUE(tier_->Write("notes/a.tmp", "draft"));
    ASSERT_TRUE(tier_->Write("notes/a", "final"));

    EXPECT_EQ(std::optional<std::string>("draft"), tier_->Read("notes/a.tmp"));
    EXPECT_EQ(std::optional<std::string>("final"), tier_->Read("notes/a"));

    tier_.reset();
    tier_ = CreateWarmTier((temp_dir_ / "warm").string());
    EXPECT_EQ(2u, tier_->GetItemCount());
    EXPECT_EQ(std::optional<std::string>("draft"), tier_->Read("notes/a.tmp"));
}

// ============================================================================
// Cold Tier Tests
// ============================================================================

TEST_F(ColdTierTest, TierInformation) {
    EXPECT_EQ(MemoryTier::COLD, tier_->GetTierLevel());
    EXPECT_EQ("Cold", tier_->GetTierName());
}

TEST_F(ColdTierTest, ContentIsCompressedOnDisk) {
    std::string content;
    for (int i = 0; i < 100; ++i) {
        content += "Archived decision record line. ";
    }

    ASSERT_TRUE(tier_->Write("archive/decisions.md", content));
    fs::path file = temp_dir_ / "cold" / "archive" / "decisions.md.item.zst";
    ASSERT_TRUE(fs::exists(file));
    EXPECT_LT(fs::file_size(file), content.size());
    EXPECT_EQ(fs::file_size(file), tier_->EstimateStorageUsage());

    auto restored = tier_->Read("archive/decisions.md");
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(content, *restored);
}

TEST_F(ColdTierTest, SuffixStrippedOnReload) {
    tier_->Write("x/y.md", "cold bytes");
    tier_.reset();

    tier_ = CreateColdTier((temp_dir_ / "cold").string(), 3);
    EXPECT_TRUE(tier_->Contains("x/y.md"));
    EXPECT_EQ(std::optional<std::string>("cold bytes"), tier_->Read("x/y.md"));
}

TEST_F(ColdTierTest, CorruptArchiveReadsAsMissing) {
    tier_->Write("broken.md", "will be damaged");
    std::ofstream(temp_dir_ / "cold" / "broken.md.item.zst", std::ios::trunc) << "not a frame";

    EXPECT_TRUE(tier_->Contains("broken.md"));
    EXPECT_FALSE(tier_->Read("broken.md").has_value());
}

TEST_F(ColdTierTest, HugeClaimedSizeReadsAsMissing) {
    tier_->Write("huge.md", "small really");

    // Valid frame header claiming 2^40 bytes of content
    const char header[] = {'\x28', '\xB5', '\x2F', '\xFD', '\xE0',
                           0, 0, 0, 0, 0, 1, 0, 0, 1, 0, 0};
    std::ofstream(temp_dir_ / "cold" / "huge.md.item.zst", std::ios::binary | std::ios::trunc)
        .write(header, sizeof(header));

    EXPECT_FALSE(tier_->Read("huge.md").has_value());
}

TEST_F(ColdTierTest, ItemAndNestedItemCoexist) {
    ASSERT_TRUE(tier_->Write("team/notes", "index of notes"));
    ASSERT_TRUE(tier_->Write("team/notes/today", "standup"));
    tier_.reset();

    tier_ = CreateColdTier((temp_dir_ / "cold").string(), 3);
    EXPECT_EQ(std::optional<std::string>("index of notes"), tier_->Read("team/notes"));
    EXPECT_EQ(std::optional<std::string>("standup"), tier_->Read("team/notes/today"));
}

TEST_F(ColdTierTest, RemoveAndClear) {
    tier_->Write("a.md", "a");
    tier_->Write("b.md", "b");

    EXPECT_TRUE(tier_->Remove("a.md"));
    EXPECT_EQ(1u, tier_->GetItemCount());

    tier_->Clear();
    EXPECT_EQ(0u, tier_->GetItemCount());
    EXPECT_FALSE(fs::exists(temp_dir_ / "cold" / "b.md.item.zst"));
}

// ============================================================================
// Utility Function Tests
// ============================================================================

TEST(MemoryTierUtilsTest, TierToString) {
    EXPECT_EQ("Hot", TierToString(MemoryTier::HOT));
    EXPECT_EQ("Warm", TierToString(MemoryTier::WARM));
    EXPECT_EQ("Cold", TierToString(MemoryTier::COLD));
}

TEST(MemoryTierUtilsTest, StringToTier) {
    EXPECT_EQ(MemoryTier::HOT, StringToTier("hot"));
    EXPECT_EQ(MemoryTier::WARM, StringToTier("WARM"));
    EXPECT_EQ(MemoryTier::COLD, StringToTier("Cold"));
    EXPECT_FALSE(StringToTier("Archive").has_value());
}

TEST(MemoryTierUtilsTest, ItemFilePathAppendsSuffix) {
    EXPECT_EQ(fs::path("/root/a/b.md.item"), ItemFilePath("/root", "a/b.md"));
    EXPECT_EQ(fs::path("/root/a.item.zst"), ItemFilePath("/root", "a", ".item.zst"));
}

TEST(MemoryTierUtilsTest, WriteFileAtomicLeavesNoStagedFile) {
    fs::path dir = fs::temp_directory_path() / "ctxmem_atomic_write_test";
    fs::remove_all(dir);

    ASSERT_TRUE(WriteFileAtomic(dir, dir / "sub" / "file.item", "payload"));
    EXPECT_EQ(std::optional<std::string>("payload"), ReadWholeFile(dir / "sub" / "file.item"));
    EXPECT_TRUE(fs::is_empty(dir / kStagingDirName));
    EXPECT_EQ(0u, RemoveStagedFiles(dir));

    fs::remove_all(dir);
}

TEST(MemoryTierUtilsTest, ListRelativeFilesStripsSuffix) {
    fs::path dir = fs::temp_directory_path() / "ctxmem_list_files_test";
    fs::remove_all(dir);
    WriteFileAtomic(dir, dir / "a.md.item.zst", "1");
    WriteFileAtomic(dir, dir / "b.txt", "2");
    fs::create_directories(dir / kStagingDirName);
    std::ofstream(dir / kStagingDirName / "c.item.zst") << "3";

    auto paths = ListRelativeFiles(dir, ".item.zst");
    ASSERT_EQ(1u, paths.size());
    EXPECT_EQ("a.md", paths[0]);

    EXPECT_EQ(1u, RemoveStagedFiles(dir));
    fs::remove_all(dir);
}
