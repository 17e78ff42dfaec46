// File: tests/context/context_stats_test.cpp
//
// Unit tests for ContextStats: sessions, clear events with pre-clear
// hooks, memory operations, aggregation, cleanup and persistence.

#include "context/context_stats.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>

using namespace ctxmem;
namespace fs = std::filesystem;

namespace {

const Timestamp kNow = Timestamp::FromMicros(1700000000LL * 1000000);

ContextClearEvent MakeClear(uint64_t input_tokens, uint64_t tokens_saved,
                            std::optional<std::string> agent = std::nullopt) {
    ContextClearEvent event;
    event.input_tokens = input_tokens;
    event.tokens_saved = tokens_saved;
    event.trigger = ClearTrigger::INPUT_TOKENS;
    event.agent_id = std::move(agent);
    return event;
}

MemoryOperationRecord MakeOperation(MemoryOperationType op, const std::string& path) {
    MemoryOperationRecord record;
    record.operation = op;
    record.path = path;
    return record;
}

} // namespace

// ============================================================================
// Enums
// ============================================================================

TEST(ContextStatsEnumsTest, StringConversions) {
    EXPECT_STREQ("input_tokens", ToString(ClearTrigger::INPUT_TOKENS));
    EXPECT_EQ(ClearTrigger::MANUAL, ParseClearTrigger("manual"));
    EXPECT_FALSE(ParseClearTrigger("automatic").has_value());

    EXPECT_STREQ("str_replace", ToString(MemoryOperationType::STR_REPLACE));
    EXPECT_EQ(MemoryOperationType::RENAME, ParseMemoryOperationType("rename"));
    EXPECT_FALSE(ParseMemoryOperationType("copy").has_value());
}

TEST(ContextStatsEnumsTest, AccessOperationMapping) {
    EXPECT_EQ(AccessOperation::VIEW, ToAccessOperation(MemoryOperationType::VIEW));
    EXPECT_EQ(AccessOperation::CREATE, ToAccessOperation(MemoryOperationType::CREATE));
    EXPECT_EQ(AccessOperation::UPDATE, ToAccessOperation(MemoryOperationType::STR_REPLACE));
    EXPECT_EQ(AccessOperation::UPDATE, ToAccessOperation(MemoryOperationType::INSERT));
    EXPECT_EQ(AccessOperation::UPDATE, ToAccessOperation(MemoryOperationType::DELETE));
    EXPECT_EQ(AccessOperation::UPDATE, ToAccessOperation(MemoryOperationType::RENAME));
}

// ============================================================================
// Sessions
// ============================================================================

TEST(ContextStatsTest, SessionLifecycle) {
    ContextStats stats;
    EXPECT_FALSE(stats.GetCurrentSession().has_value());

    // Without a session, usage is ignored
    stats.UpdateTokenUsage(100, 10);

    std::string id = stats.StartSession(std::string("planner"), kNow);
    EXPECT_EQ(0u, id.find("session-"));

    stats.UpdateTokenUsage(5000, 200);
    stats.UpdateTokenUsage(3000, 100);
    stats.TrackClearEvent(MakeClear(90000, 60000), kNow);
    stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::VIEW, "a.md"), kNow);

    const auto& current = stats.GetCurrentSession();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(8000u, current->total_input_tokens);
    EXPECT_EQ(300u, current->total_output_tokens);
    EXPECT_EQ(5000u, current->peak_tokens);
    EXPECT_EQ(1u, current->clear_events);
    EXPECT_EQ(60000u, current->tokens_saved);
    EXPECT_EQ(1u, current->memory_operations);

    auto completed = stats.EndSession(kNow + std::chrono::minutes(30));
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(id, completed->session_id);
    EXPECT_EQ(kNow + std::chrono::minutes(30), completed->end_time);
    EXPECT_FALSE(stats.GetCurrentSession().has_value());
    EXPECT_FALSE(stats.EndSession(kNow).has_value());
}

TEST(ContextStatsTest, StartingSessionEndsOpenOne) {
    ContextStats stats;
    std::string first = stats.StartSession(std::nullopt, kNow);
    std::string second = stats.StartSession(std::nullopt, kNow);
    EXPECT_NE(first, second);
    EXPECT_EQ(second, stats.GetCurrentSession()->session_id);
}

// ============================================================================
// Clear events and hooks
// ============================================================================

TEST(ContextStatsTest, ClearEventWithoutHooks) {
    ContextStats stats;
    auto recorded = stats.TrackClearEvent(MakeClear(120000, 80000), kNow);

    EXPECT_EQ(kNow, recorded.timestamp);
    EXPECT_FALSE(recorded.pre_clear_hook_executed);
    EXPECT_EQ(0u, recorded.patterns_preserved);
    EXPECT_EQ(1u, stats.GetClearEvents().size());
}

TEST(ContextStatsTest, HooksRunAndSumPreservedPatterns) {
    ContextStats stats;
    size_t seen_tokens = 0;
    std::optional<std::string> seen_agent;

    stats.RegisterPreClearHook([&](size_t tokens, const std::optional<std::string>& agent) {
        seen_tokens = tokens;
        seen_agent = agent;
        return size_t{3};
    });
    stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{4}; });

    auto recorded = stats.TrackClearEvent(MakeClear(150000, 100000, std::string("coder")), kNow);
    EXPECT_TRUE(recorded.pre_clear_hook_executed);
    EXPECT_EQ(7u, recorded.patterns_preserved);
    EXPECT_EQ(150000u, seen_tokens);
    EXPECT_EQ(std::optional<std::string>("coder"), seen_agent);
}

TEST(ContextStatsTest, FailingHookDoesNotBlockClear) {
    ContextStats stats;
    stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) -> size_t {
        throw std::runtime_error("extraction failed");
    });
    stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{2}; });

    auto recorded = stats.TrackClearEvent(MakeClear(100000, 50000), kNow);
    EXPECT_TRUE(recorded.pre_clear_hook_executed);
    EXPECT_EQ(2u, recorded.patterns_preserved);
    EXPECT_EQ(1u, stats.GetClearEvents().size());
}

TEST(ContextStatsTest, HookIdsStayValidAfterRemoval) {
    ContextStats stats;
    auto first = stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{1}; });
    auto second = stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{10}; });
    EXPECT_NE(first, second);
    EXPECT_EQ(2u, stats.GetPreClearHookCount());

    EXPECT_TRUE(stats.UnregisterPreClearHook(first));
    EXPECT_FALSE(stats.UnregisterPreClearHook(first));
    EXPECT_EQ(10u, stats.TrackClearEvent(MakeClear(1000, 0), kNow).patterns_preserved);

    EXPECT_TRUE(stats.UnregisterPreClearHook(second));
    EXPECT_EQ(0u, stats.GetPreClearHookCount());

    stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{1}; });
    stats.ClearPreClearHooks();
    EXPECT_EQ(0u, stats.GetPreClearHookCount());
}

TEST(ContextStatsTest, OneShotHookCanUnregisterItself) {
    ContextStats stats;
    PreClearHookId one_shot = 0;
    one_shot = stats.RegisterPreClearHook(
        [&stats, &one_shot](size_t, const std::optional<std::string>&) {
            stats.UnregisterPreClearHook(one_shot);
            return size_t{4};
        });
    stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{1}; });

    auto first = stats.TrackClearEvent(MakeClear(120000, 60000), kNow);
    EXPECT_EQ(5u, first.patterns_preserved);
    EXPECT_EQ(1u, stats.GetPreClearHookCount());

    auto second = stats.TrackClearEvent(MakeClear(120000, 60000), kNow);
    EXPECT_EQ(1u, second.patterns_preserved);
    EXPECT_EQ(2u, stats.GetClearEvents().size());
}

TEST(ContextStatsTest, RetentionCapsInMemoryLog) {
    ContextStats::Config config;
    config.max_clear_events = 3;
    config.max_memory_operations = 2;
    ContextStats stats(config);

    for (uint64_t i = 1; i <= 5; ++i) {
        stats.TrackClearEvent(MakeClear(i * 1000, 0), kNow);
        stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::VIEW, "a.md"), kNow);
    }

    auto events = stats.GetClearEvents();
    ASSERT_EQ(3u, events.size());
    EXPECT_EQ(3000u, events.front().input_tokens);
    EXPECT_EQ(2u, stats.GetMemoryOperations().size());
}

// ============================================================================
// Aggregation and queries
// ============================================================================

TEST(ContextStatsTest, StatisticsAggregate) {
    ContextStats stats;
    stats.TrackClearEvent(MakeClear(100000, 60000, std::string("coder")), kNow);
    stats.TrackClearEvent(MakeClear(120000, 80000, std::string("coder")), kNow);
    stats.TrackClearEvent(MakeClear(90000, 40000), kNow);
    stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::VIEW, "a.md"), kNow);
    stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::VIEW, "b.md"), kNow);
    stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::CREATE, "c.md"), kNow);

    auto aggregate = stats.GetStatistics();
    EXPECT_EQ(310000u, aggregate.total_tokens_processed);
    EXPECT_EQ(180000u, aggregate.total_tokens_saved);
    EXPECT_EQ(3u, aggregate.total_clear_events);
    EXPECT_DOUBLE_EQ(60000.0, aggregate.avg_tokens_per_clear);
    EXPECT_EQ(3u, aggregate.total_memory_operations);
    EXPECT_EQ(2u, aggregate.memory_operations_by_type["view"]);
    EXPECT_EQ(1u, aggregate.memory_operations_by_type["create"]);
    EXPECT_EQ(2u, aggregate.clear_events_by_agent["coder"]);
    ASSERT_TRUE(aggregate.last_clear_event.has_value());
    EXPECT_EQ(90000u, aggregate.last_clear_event->input_tokens);
    EXPECT_GE(aggregate.uptime_seconds, 0.0);
}

TEST(ContextStatsTest, EmptyStatistics) {
    ContextStats stats;
    auto aggregate = stats.GetStatistics(kNow);
    EXPECT_EQ(0u, aggregate.total_clear_events);
    EXPECT_DOUBLE_EQ(0.0, aggregate.avg_tokens_per_clear);
    EXPECT_FALSE(aggregate.last_clear_event.has_value());
    // A time before construction clamps to zero
    EXPECT_DOUBLE_EQ(0.0, aggregate.uptime_seconds);
}

TEST(ContextStatsTest, RangeQueriesAreInclusive) {
    ContextStats stats;
    for (int hour = 0; hour < 5; ++hour) {
        Timestamp at = kNow + std::chrono::hours(hour);
        stats.TrackClearEvent(MakeClear(1000, 0), at);
        stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::VIEW, "a.md"), at);
    }

    auto since = kNow + std::chrono::hours(1);
    auto until = kNow + std::chrono::hours(3);
    EXPECT_EQ(3u, stats.GetClearEvents(since, until).size());
    EXPECT_EQ(4u, stats.GetClearEvents(since).size());
    EXPECT_EQ(2u, stats.GetMemoryOperations(std::nullopt, kNow + std::chrono::hours(1)).size());
}

TEST(ContextStatsTest, CleanupRemovesOldRecords) {
    ContextStats stats;
    stats.TrackClearEvent(MakeClear(1000, 0), kNow);
    stats.TrackMemoryOperation(MakeOperation(MemoryOperationType::VIEW, "a.md"), kNow);
    stats.TrackClearEvent(MakeClear(2000, 0), kNow + std::chrono::hours(24 * 40));

    EXPECT_EQ(2u, stats.Cleanup(30.0, kNow + std::chrono::hours(24 * 45)));
    ASSERT_EQ(1u, stats.GetClearEvents().size());
    EXPECT_EQ(2000u, stats.GetClearEvents()[0].input_tokens);
    EXPECT_TRUE(stats.GetMemoryOperations().empty());
}

TEST(ContextStatsConfigTest, InvalidConfigThrows) {
    ContextStats::Config config;
    config.max_clear_events = 0;
    EXPECT_THROW(ContextStats stats(config), std::invalid_argument);
}

// ============================================================================
// Persistence
// ============================================================================

class ContextStatsPersistenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "ctxmem_context_stats_test";
        fs::remove_all(temp_dir_);
        config_.storage_dir = temp_dir_.string();
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    fs::path temp_dir_;
    ContextStats::Config config_;
};

TEST_F(ContextStatsPersistenceTest, EventsAndSessionsSurviveRestart) {
    std::string session_id;
    {
        ContextStats stats(config_);
        ASSERT_TRUE(stats.IsPersistent());
        session_id = stats.StartSession(std::string("planner"), kNow);
        stats.UpdateTokenUsage(4000, 500);
        stats.RegisterPreClearHook([](size_t, const std::optional<std::string>&) { return size_t{5}; });
        stats.TrackClearEvent(MakeClear(100000, 70000, std::string("planner")), kNow);

        auto op = MakeOperation(MemoryOperationType::STR_REPLACE, "notes/a.md");
        op.success = false;
        op.tokens_used = 42;
        stats.TrackMemoryOperation(op, kNow);
        stats.EndSession(kNow + std::chrono::hours(1));
    }

    ContextStats restored(config_);
    restored.Initialize();

    auto events = restored.GetClearEvents();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(ClearTrigger::INPUT_TOKENS, events[0].trigger);
    EXPECT_EQ(5u, events[0].patterns_preserved);
    EXPECT_TRUE(events[0].pre_clear_hook_executed);
    EXPECT_EQ(std::optional<std::string>("planner"), events[0].agent_id);

    auto operations = restored.GetMemoryOperations();
    ASSERT_EQ(1u, operations.size());
    EXPECT_EQ(MemoryOperationType::STR_REPLACE, operations[0].operation);
    EXPECT_FALSE(operations[0].success);
    EXPECT_EQ(42u, operations[0].tokens_used);

    auto session = restored.GetSession(session_id);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(4000u, session->total_input_tokens);
    EXPECT_EQ(1u, session->clear_events);
    EXPECT_EQ(70000u, session->tokens_saved);
    EXPECT_EQ(kNow + std::chrono::hours(1), session->end_time);
    EXPECT_FALSE(restored.GetSession("session-unknown").has_value());
}

TEST_F(ContextStatsPersistenceTest, PersistedLogIsTrimmed) {
    config_.max_clear_events = 2;
    {
        ContextStats stats(config_);
        for (uint64_t i = 1; i <= 4; ++i) {
            stats.TrackClearEvent(MakeClear(i, 0), kNow);
        }
    }

    ContextStats restored(config_);
    restored.Initialize();
    auto events = restored.GetClearEvents();
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(3u, events[0].input_tokens);
    EXPECT_EQ(4u, events[1].input_tokens);
}

TEST_F(ContextStatsPersistenceTest, CleanupRemovesPersistedRows) {
    {
        ContextStats stats(config_);
        stats.TrackClearEvent(MakeClear(1000, 0), kNow);
        stats.Cleanup(30.0, kNow + std::chrono::hours(24 * 31));
    }

    ContextStats restored(config_);
    restored.Initialize();
    EXPECT_TRUE(restored.GetClearEvents().empty());
}
