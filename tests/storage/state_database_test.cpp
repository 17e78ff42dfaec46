// File: tests/storage/state_database_test.cpp
#include "storage/state_database.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace ctxmem {
namespace {

namespace fs = std::filesystem;

class StateDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "ctxmem_state_database_test";
        fs::remove_all(temp_dir_);

        StateDatabase::Config config;
        config.db_path = (temp_dir_ / "nested" / "state.db").string();
        db_ = std::make_unique<StateDatabase>(config);
        db_->ExecuteOrThrow(
            "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT, score REAL, payload BLOB);");
    }

    void TearDown() override {
        db_.reset();
        fs::remove_all(temp_dir_);
    }

    size_t CountRows() {
        auto stmt = db_->Prepare("SELECT COUNT(*) FROM items;");
        EXPECT_TRUE(stmt.Step());
        return static_cast<size_t>(stmt.ColumnInt64(0));
    }

    fs::path temp_dir_;
    std::unique_ptr<StateDatabase> db_;
};

TEST_F(StateDatabaseTest, CreatesParentDirectories) {
    EXPECT_TRUE(fs::exists(temp_dir_ / "nested" / "state.db"));
    EXPECT_EQ((temp_dir_ / "nested" / "state.db").string(), db_->GetPath());
}

TEST_F(StateDatabaseTest, BindAndReadColumns) {
    std::string payload("\x00\x01\x02zstd", 7);

    auto insert = db_->Prepare("INSERT INTO items (id, name, score, payload) VALUES (?, ?, ?, ?);");
    insert.BindInt64(1, 42).BindText(2, "alpha").BindDouble(3, 2.5).BindBlob(4, payload);
    EXPECT_FALSE(insert.Step());
    EXPECT_EQ(1, db_->Changes());

    auto select = db_->Prepare("SELECT id, name, score, payload FROM items WHERE id = ?;");
    select.BindInt64(1, 42);
    ASSERT_TRUE(select.Step());
    EXPECT_EQ(42, select.ColumnInt64(0));
    EXPECT_EQ("alpha", select.ColumnText(1));
    EXPECT_DOUBLE_EQ(2.5, select.ColumnDouble(2));
    EXPECT_EQ(payload, select.ColumnBlob(3));
    EXPECT_FALSE(select.Step());
}

TEST_F(StateDatabaseTest, NullColumns) {
    auto insert = db_->Prepare("INSERT INTO items (id, name) VALUES (?, ?);");
    insert.BindInt64(1, 1).BindNull(2);
    insert.Step();

    auto select = db_->Prepare("SELECT name FROM items WHERE id = 1;");
    ASSERT_TRUE(select.Step());
    EXPECT_TRUE(select.ColumnIsNull(0));
    EXPECT_EQ("", select.ColumnText(0));
}

TEST_F(StateDatabaseTest, ResetAllowsReuse) {
    auto insert = db_->Prepare("INSERT INTO items (id, name) VALUES (?, ?);");
    for (int i = 0; i < 5; ++i) {
        insert.BindInt64(1, i).BindText(2, "item" + std::to_string(i));
        insert.Step();
        insert.Reset();
    }
    EXPECT_EQ(5u, CountRows());
}

TEST_F(StateDatabaseTest, TransactionCommit) {
    {
        StateDatabase::Transaction txn(*db_);
        db_->ExecuteOrThrow("INSERT INTO items (id, name) VALUES (1, 'a');");
        db_->ExecuteOrThrow("INSERT INTO items (id, name) VALUES (2, 'b');");
        txn.Commit();
    }
    EXPECT_EQ(2u, CountRows());
}

TEST_F(StateDatabaseTest, TransactionRollsBackWithoutCommit) {
    {
        StateDatabase::Transaction txn(*db_);
        db_->ExecuteOrThrow("INSERT INTO items (id, name) VALUES (1, 'a');");
    }
    EXPECT_EQ(0u, CountRows());
}

TEST_F(StateDatabaseTest, ExecuteReportsFailure) {
    EXPECT_FALSE(db_->Execute("INSERT INTO missing_table VALUES (1);"));
    EXPECT_FALSE(db_->LastError().empty());
    EXPECT_THROW(db_->ExecuteOrThrow("INSERT INTO missing_table VALUES (1);"), std::runtime_error);
}

TEST_F(StateDatabaseTest, PrepareInvalidSqlThrows) {
    EXPECT_THROW(db_->Prepare("SELEC nothing"), std::runtime_error);
}

TEST_F(StateDatabaseTest, StepConstraintViolationThrows) {
    db_->ExecuteOrThrow("INSERT INTO items (id, name) VALUES (1, 'a');");
    auto insert = db_->Prepare("INSERT INTO items (id, name) VALUES (1, 'duplicate');");
    EXPECT_THROW(insert.Step(), std::runtime_error);
}

TEST_F(StateDatabaseTest, StatementIsMovable) {
    auto stmt = db_->Prepare("SELECT 7;");
    Statement moved = std::move(stmt);
    ASSERT_TRUE(moved.Step());
    EXPECT_EQ(7, moved.ColumnInt64(0));
}

TEST_F(StateDatabaseTest, UnwritableLocationThrows) {
    // A regular file where a directory is needed
    fs::path blocker = temp_dir_ / "blocker";
    std::ofstream(blocker) << "not a directory";

    StateDatabase::Config config;
    config.db_path = (blocker / "state.db").string();
    EXPECT_THROW(StateDatabase db(config), std::runtime_error);
}

TEST_F(StateDatabaseTest, DataSurvivesReopen) {
    db_->ExecuteOrThrow("INSERT INTO items (id, name) VALUES (9, 'kept');");
    std::string path = db_->GetPath();
    db_.reset();

    StateDatabase::Config config;
    config.db_path = path;
    db_ = std::make_unique<StateDatabase>(config);

    auto select = db_->Prepare("SELECT name FROM items WHERE id = 9;");
    ASSERT_TRUE(select.Step());
    EXPECT_EQ("kept", select.ColumnText(0));
}

} // namespace
} // namespace ctxmem
