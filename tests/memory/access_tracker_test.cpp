// File: tests/memory/access_tracker_test.cpp
//
// Unit tests for AccessTracker: pattern rollups, ranking, agent
// attribution, prediction, pruning and batched persistence.

#include "memory/access_tracker.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace ctxmem {
namespace {

namespace fs = std::filesystem;

const Timestamp kBase = Timestamp::FromMicros(1700000000LL * 1000000);

Timestamp At(std::chrono::seconds offset) {
    return kBase + offset;
}

// ============================================================================
// Test Fixtures
// ============================================================================

class AccessTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker_ = std::make_unique<AccessTracker>();
    }

    std::unique_ptr<AccessTracker> tracker_;
};

class PersistentAccessTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "ctxmem_access_tracker_test";
        fs::remove_all(temp_dir_);
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    AccessTracker::Config MakeConfig() const {
        AccessTracker::Config config;
        config.storage_dir = temp_dir_.string();
        config.flush.batch_threshold = 5;
        config.flush.max_queue_size = 50;
        return config;
    }

    fs::path temp_dir_;
};

// ============================================================================
// Recording
// ============================================================================

TEST_F(AccessTrackerTest, FirstAccessCreatesPattern) {
    tracker_->RecordAccess("project-knowledge/api.md", std::string("alice"),
                           AccessOperation::CREATE, std::nullopt, kBase);

    auto pattern = tracker_->GetPattern("project-knowledge/api.md");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(1u, pattern->access_count);
    EXPECT_EQ(kBase, pattern->first_accessed);
    EXPECT_EQ(kBase, pattern->last_accessed);
    EXPECT_DOUBLE_EQ(0.0, pattern->avg_access_interval);
    EXPECT_EQ(std::optional<std::string>("alice"), pattern->GetAgent());
    EXPECT_EQ(1u, tracker_->GetTrackedPatternCount());
}

TEST_F(AccessTrackerTest, IncrementalIntervalMean) {
    tracker_->RecordAccess("notes/a.md", std::nullopt, AccessOperation::VIEW, std::nullopt, At(std::chrono::seconds(0)));
    tracker_->RecordAccess("notes/a.md", std::nullopt, AccessOperation::VIEW, std::nullopt, At(std::chrono::seconds(100)));
    tracker_->RecordAccess("notes/a.md", std::nullopt, AccessOperation::VIEW, std::nullopt, At(std::chrono::seconds(400)));

    auto pattern = tracker_->GetPattern("notes/a.md");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(3u, pattern->access_count);
    // Intervals 100 and 300
    EXPECT_DOUBLE_EQ(200.0, pattern->avg_access_interval);
    EXPECT_EQ(At(std::chrono::seconds(400)), pattern->last_accessed);
    EXPECT_EQ(At(std::chrono::seconds(0)), pattern->first_accessed);
}

TEST_F(AccessTrackerTest, CountsStayConsistent) {
    for (int i = 0; i < 20; ++i) {
        tracker_->RecordAccess("notes/b.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                               At(std::chrono::hours(24 * i)));
    }

    auto pattern = tracker_->GetPattern("notes/b.md");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(20u, pattern->access_count);
    EXPECT_LE(pattern->recent_access_count, pattern->access_count);
    EXPECT_GE(pattern->last_accessed, pattern->first_accessed);
    // Only the accesses of the trailing 7 days
    EXPECT_EQ(8u, pattern->recent_access_count);
}

TEST_F(AccessTrackerTest, EventLogIsBounded) {
    AccessTracker::Config config;
    config.max_events = 5;
    AccessTracker tracker(config);

    for (int i = 0; i < 8; ++i) {
        tracker.RecordAccess("item/" + std::to_string(i), std::nullopt, AccessOperation::VIEW,
                             std::nullopt, At(std::chrono::seconds(i)));
    }

    const auto& events = tracker.GetEvents();
    ASSERT_EQ(5u, events.size());
    EXPECT_EQ("item/3", events.front().path);
    EXPECT_EQ("item/7", events.back().path);
    // Patterns outlive their events
    EXPECT_EQ(8u, tracker.GetTrackedPatternCount());
}

TEST_F(AccessTrackerTest, EventKeepsOperationAndContext) {
    tracker_->RecordAccess("notes/c.md", std::string("bob"), AccessOperation::UPDATE,
                           std::string("refactor"), kBase);

    ASSERT_EQ(1u, tracker_->GetEvents().size());
    const auto& event = tracker_->GetEvents().front();
    EXPECT_EQ(AccessOperation::UPDATE, event.operation);
    EXPECT_EQ(std::optional<std::string>("refactor"), event.context);
    EXPECT_EQ(std::optional<std::string>("bob"), event.agent_id);
}

// ============================================================================
// Ranking
// ============================================================================

TEST_F(AccessTrackerTest, FrequentPatternRanksFirst) {
    // Ten daily accesses of one item, a single access of another
    for (int day = 0; day < 10; ++day) {
        tracker_->RecordAccess("core-patterns/errors.md", std::nullopt, AccessOperation::VIEW,
                               std::nullopt, At(std::chrono::hours(24 * day)));
    }
    tracker_->RecordAccess("notes/once.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                           At(std::chrono::hours(24 * 9)));

    auto top = tracker_->GetTopPatterns(10, At(std::chrono::hours(24 * 9 + 1)));
    ASSERT_EQ(2u, top.size());
    EXPECT_EQ("core-patterns/errors.md", top[0].path);
    EXPECT_EQ("notes/once.md", top[1].path);
}

TEST_F(AccessTrackerTest, TopPatternsRespectsLimit) {
    for (int i = 0; i < 6; ++i) {
        tracker_->RecordAccess("item/" + std::to_string(i), std::nullopt, AccessOperation::VIEW,
                               std::nullopt, kBase);
    }
    EXPECT_EQ(3u, tracker_->GetTopPatterns(3, kBase).size());
    EXPECT_TRUE(tracker_->GetTopPatterns(0, kBase).empty());
}

TEST_F(AccessTrackerTest, RecencyScoreSteps) {
    EXPECT_DOUBLE_EQ(100.0, RecencyScore(kBase, At(std::chrono::minutes(30))));
    EXPECT_DOUBLE_EQ(80.0, RecencyScore(kBase, At(std::chrono::hours(5))));
    EXPECT_DOUBLE_EQ(50.0, RecencyScore(kBase, At(std::chrono::hours(24 * 3))));
    EXPECT_DOUBLE_EQ(20.0, RecencyScore(kBase, At(std::chrono::hours(24 * 20))));
    EXPECT_DOUBLE_EQ(0.0, RecencyScore(kBase, At(std::chrono::hours(24 * 40))));
}

TEST_F(AccessTrackerTest, RecentPatternsWithinWindow) {
    tracker_->RecordAccess("old.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);
    tracker_->RecordAccess("new.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                           At(std::chrono::hours(24 * 5)));
    tracker_->RecordAccess("newer.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                           At(std::chrono::hours(24 * 6)));

    auto recent = tracker_->GetRecentPatterns(3.0, At(std::chrono::hours(24 * 7)));
    ASSERT_EQ(2u, recent.size());
    EXPECT_EQ("newer.md", recent[0].path);
    EXPECT_EQ("new.md", recent[1].path);
}

// ============================================================================
// Attribution
// ============================================================================

TEST_F(AccessTrackerTest, LastToucherWins) {
    tracker_->RecordAccess("shared.md", std::string("alice"), AccessOperation::CREATE, std::nullopt, kBase);
    tracker_->RecordAccess("shared.md", std::string("bob"), AccessOperation::UPDATE, std::nullopt,
                           At(std::chrono::seconds(10)));

    auto pattern = tracker_->GetPattern("shared.md");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(std::optional<std::string>("bob"), pattern->GetAgent());
    EXPECT_TRUE(std::holds_alternative<LastToucher>(pattern->attribution));

    EXPECT_EQ(1u, tracker_->GetPatternsByAgent("bob").size());
    EXPECT_TRUE(tracker_->GetPatternsByAgent("alice").empty());
}

TEST_F(AccessTrackerTest, ContributorSetKeepsEveryAgent) {
    AccessTracker::Config config;
    config.attribution_mode = AttributionMode::CONTRIBUTOR_SET;
    AccessTracker tracker(config);

    tracker.RecordAccess("shared.md", std::string("alice"), AccessOperation::CREATE, std::nullopt, kBase);
    tracker.RecordAccess("shared.md", std::string("bob"), AccessOperation::UPDATE, std::nullopt,
                         At(std::chrono::seconds(10)));
    tracker.RecordAccess("shared.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                         At(std::chrono::seconds(20)));

    auto pattern = tracker.GetPattern("shared.md");
    ASSERT_TRUE(pattern.has_value());
    const auto* set = std::get_if<ContributorSet>(&pattern->attribution);
    ASSERT_NE(nullptr, set);
    EXPECT_EQ(2u, set->contributors.size());
    EXPECT_FALSE(pattern->GetAgent().has_value());

    EXPECT_EQ(1u, tracker.GetPatternsByAgent("alice").size());
    EXPECT_EQ(1u, tracker.GetPatternsByAgent("bob").size());
}

TEST_F(AccessTrackerTest, PatternsByAgentSortedByCount) {
    for (int i = 0; i < 3; ++i) {
        tracker_->RecordAccess("a.md", std::string("alice"), AccessOperation::VIEW, std::nullopt,
                               At(std::chrono::seconds(i)));
    }
    tracker_->RecordAccess("b.md", std::string("alice"), AccessOperation::VIEW, std::nullopt, kBase);

    auto patterns = tracker_->GetPatternsByAgent("alice");
    ASSERT_EQ(2u, patterns.size());
    EXPECT_EQ("a.md", patterns[0].path);
    EXPECT_EQ("b.md", patterns[1].path);
}

TEST(AttributionModeTest, StringConversion) {
    EXPECT_STREQ("contributor_set", ToString(AttributionMode::CONTRIBUTOR_SET));
    EXPECT_EQ(AttributionMode::LAST_TOUCHER, ParseAttributionMode("last_toucher"));
    EXPECT_FALSE(ParseAttributionMode("everyone").has_value());
}

// ============================================================================
// Prediction
// ============================================================================

TEST_F(AccessTrackerTest, PredictsRegularlyAccessedItem) {
    // Hourly accesses for ten hours
    for (int h = 0; h < 10; ++h) {
        tracker_->RecordAccess("routine.md", std::string("alice"), AccessOperation::VIEW,
                               std::nullopt, At(std::chrono::hours(h)));
    }
    tracker_->RecordAccess("stale.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);

    auto predictions = tracker_->PredictNextPatterns(std::string("alice"), At(std::chrono::hours(10)));
    ASSERT_FALSE(predictions.empty());
    EXPECT_EQ("routine.md", predictions[0].pattern.path);
    // 40 (density) + 30 (interval) + 20 (agent)
    EXPECT_DOUBLE_EQ(90.0, predictions[0].score);

    for (const auto& prediction : predictions) {
        EXPECT_NE("stale.md", prediction.pattern.path);
        EXPECT_GT(prediction.score, 20.0);
    }
}

TEST_F(AccessTrackerTest, PredictionsCappedAtTen) {
    for (int i = 0; i < 15; ++i) {
        for (int h = 0; h < 10; ++h) {
            tracker_->RecordAccess("item/" + std::to_string(i), std::nullopt, AccessOperation::VIEW,
                                   std::nullopt, At(std::chrono::minutes(h)));
        }
    }
    EXPECT_EQ(10u, tracker_->PredictNextPatterns(std::nullopt, At(std::chrono::minutes(10))).size());
}

// ============================================================================
// Maintenance
// ============================================================================

TEST_F(AccessTrackerTest, PruneOldPatterns) {
    tracker_->RecordAccess("ancient.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);
    tracker_->RecordAccess("fresh.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                           At(std::chrono::hours(24 * 95)));

    EXPECT_EQ(1u, tracker_->PruneOldPatterns(90.0, At(std::chrono::hours(24 * 100))));
    EXPECT_FALSE(tracker_->GetPattern("ancient.md").has_value());
    EXPECT_TRUE(tracker_->GetPattern("fresh.md").has_value());
}

TEST_F(AccessTrackerTest, InMemoryTrackerIsNotPersistent) {
    EXPECT_FALSE(tracker_->IsPersistent());
    tracker_->RecordAccess("a.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);
    EXPECT_EQ(0u, tracker_->GetPendingWriteCount());
    EXPECT_TRUE(tracker_->Flush(kBase));
}

TEST(AccessTrackerConfigTest, InvalidConfigThrows) {
    AccessTracker::Config config;
    config.max_events = 0;
    EXPECT_THROW(AccessTracker tracker(config), std::invalid_argument);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(PersistentAccessTrackerTest, WritesAreBatched) {
    AccessTracker tracker(MakeConfig());
    ASSERT_TRUE(tracker.IsPersistent());

    for (int i = 0; i < 4; ++i) {
        tracker.RecordAccess("a.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                             At(std::chrono::seconds(i)));
    }
    EXPECT_EQ(4u, tracker.GetPendingWriteCount());
    EXPECT_EQ(1u, tracker.GetDirtyPatternCount());

    tracker.RecordAccess("a.md", std::nullopt, AccessOperation::VIEW, std::nullopt,
                         At(std::chrono::seconds(4)));
    EXPECT_EQ(0u, tracker.GetPendingWriteCount());
    EXPECT_EQ(0u, tracker.GetDirtyPatternCount());
}

TEST_F(PersistentAccessTrackerTest, StateSurvivesRestart) {
    {
        AccessTracker tracker(MakeConfig());
        tracker.RecordAccess("project-knowledge/api.md", std::string("alice"),
                             AccessOperation::CREATE, std::string("setup"), kBase);
        tracker.RecordAccess("project-knowledge/api.md", std::string("bob"),
                             AccessOperation::VIEW, std::nullopt, At(std::chrono::seconds(60)));
        ASSERT_TRUE(tracker.Flush(At(std::chrono::seconds(61))));
    }

    AccessTracker restored(MakeConfig());
    restored.Initialize();

    auto pattern = restored.GetPattern("project-knowledge/api.md");
    ASSERT_TRUE(pattern.has_value());
    EXPECT_EQ(2u, pattern->access_count);
    EXPECT_DOUBLE_EQ(60.0, pattern->avg_access_interval);
    EXPECT_EQ(std::optional<std::string>("bob"), pattern->GetAgent());

    ASSERT_EQ(2u, restored.GetEvents().size());
    EXPECT_EQ(AccessOperation::CREATE, restored.GetEvents().front().operation);
    EXPECT_EQ(std::optional<std::string>("setup"), restored.GetEvents().front().context);
}

TEST_F(PersistentAccessTrackerTest, DestructorFlushesPendingWrites) {
    {
        AccessTracker tracker(MakeConfig());
        tracker.RecordAccess("pending.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);
        EXPECT_EQ(1u, tracker.GetPendingWriteCount());
    }

    AccessTracker restored(MakeConfig());
    restored.Initialize();
    EXPECT_TRUE(restored.GetPattern("pending.md").has_value());
}

TEST_F(PersistentAccessTrackerTest, ContributorsSurviveRestart) {
    auto config = MakeConfig();
    config.attribution_mode = AttributionMode::CONTRIBUTOR_SET;
    {
        AccessTracker tracker(config);
        tracker.RecordAccess("shared.md", std::string("alice"), AccessOperation::CREATE, std::nullopt, kBase);
        tracker.RecordAccess("shared.md", std::string("bob"), AccessOperation::UPDATE, std::nullopt,
                             At(std::chrono::seconds(5)));
    }

    AccessTracker restored(config);
    restored.Initialize();
    EXPECT_EQ(1u, restored.GetPatternsByAgent("alice").size());
    EXPECT_EQ(1u, restored.GetPatternsByAgent("bob").size());
}

TEST_F(PersistentAccessTrackerTest, PrunedPatternsStayDeleted) {
    {
        AccessTracker tracker(MakeConfig());
        tracker.RecordAccess("ancient.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);
        ASSERT_TRUE(tracker.Flush(kBase));
        EXPECT_EQ(1u, tracker.PruneOldPatterns(90.0, At(std::chrono::hours(24 * 91))));
    }

    AccessTracker restored(MakeConfig());
    restored.Initialize();
    EXPECT_FALSE(restored.GetPattern("ancient.md").has_value());
}

TEST_F(PersistentAccessTrackerTest, UnusableDirectoryFallsBackToMemory) {
    fs::create_directories(temp_dir_);
    fs::path blocker = temp_dir_ / "blocker";
    std::ofstream(blocker) << "file";

    AccessTracker::Config config;
    config.storage_dir = (blocker / "sub").string();
    AccessTracker tracker(config);
    EXPECT_FALSE(tracker.IsPersistent());

    tracker.RecordAccess("a.md", std::nullopt, AccessOperation::VIEW, std::nullopt, kBase);
    EXPECT_TRUE(tracker.GetPattern("a.md").has_value());
}

} // namespace
} // namespace ctxmem
