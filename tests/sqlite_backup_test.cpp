#include <gtest/gtest.h>
#include "sqlite_backup.hpp"
#include "test_support.hpp"

class SQLiteBackupTest : public ::testing::Test {
protected:
    void SetUp() override {
        createSqliteDatabase(dir.path() / "a.db", 200);
        createSqliteDatabase(dir.path() / "b.db", 50);
        config.host = dir.path().string();
        config.databases = {"a.db", "b.db"};
    }

    OnlineCopyOptions fastCopy(int pagesPerStep) const {
        OnlineCopyOptions options;
        options.pagesPerStep = pagesPerStep;
        options.stepSleep = std::chrono::milliseconds(0);
        return options;
    }

    TempDir dir;
    TempDir out;
    FakeProcessRunner runner;
    Logger logger{"", "", true};
    BackendContext context{runner, logger, ToolPaths{}};
    DatabaseConfig config;
};

TEST_F(SQLiteBackupTest, StepCountMatchesPageCount) {
    int pages = sqlitePageCount(dir.path() / "a.db");
    ASSERT_GT(pages, 3);

    for (int pagesPerStep : {1, 2, 3, 10, pages, pages + 5}) {
        SQLiteDatabase db(config, context, fastCopy(pagesPerStep));
        auto stats = db.copyDatabaseFile(dir.path() / "a.db", out.path() / "a.db.bak");
        ASSERT_TRUE(stats) << stats.error().what();
        EXPECT_EQ(stats->totalPages, pages);
        EXPECT_EQ(stats->steps, (pages + pagesPerStep - 1) / pagesPerStep) << "pagesPerStep=" << pagesPerStep;
    }
}

TEST_F(SQLiteBackupTest, BackupCopiesEveryDatabaseWithIdenticalRows) {
    SQLiteDatabase db(config, context, fastCopy(10));
    ASSERT_TRUE(db.validateConfig(config));
    ASSERT_TRUE(db.probe().isConnected());

    auto target = out.path() / "run";
    auto result = db.backup(target);
    ASSERT_TRUE(result) << result.error().what();

    for (const char* name : {"a.db", "b.db"}) {
        auto copy = target / (std::string(name) + ".bak");
        ASSERT_TRUE(std::filesystem::exists(copy)) << copy;
        auto rows = readSqliteRows(copy);
        EXPECT_FALSE(rows.empty());
        EXPECT_EQ(rows, readSqliteRows(dir.path() / name));
    }
}

TEST_F(SQLiteBackupTest, EstimateIsRawFileSize) {
    SQLiteDatabase db(config, context, fastCopy(10));
    auto expected = std::filesystem::file_size(dir.path() / "a.db") + std::filesystem::file_size(dir.path() / "b.db");
    EXPECT_EQ(db.estimateSize(), expected);
}

TEST_F(SQLiteBackupTest, ListDatabasesReportsSizeAndVersion) {
    config.databases.push_back("missing.db");
    SQLiteDatabase db(config, context, fastCopy(10));
    auto info = db.listDatabases();
    ASSERT_EQ(info.size(), 3u);
    EXPECT_EQ(info[0].name, "a.db");
    ASSERT_TRUE(info[0].size);
    EXPECT_EQ(*info[0].size, std::filesystem::file_size(dir.path() / "a.db"));
    ASSERT_TRUE(info[0].schemaVersion);
    EXPECT_EQ(*info[0].schemaVersion, sqlite3_libversion());
    EXPECT_FALSE(info[2].size);
    EXPECT_FALSE(info[2].schemaVersion);
}

TEST_F(SQLiteBackupTest, ProbeFailsForMissingFile) {
    config.databases = {"a.db", "missing.db"};
    SQLiteDatabase db(config, context, fastCopy(10));
    auto status = db.probe();
    EXPECT_EQ(status.state(), ConnectionStatus::State::Error);
    EXPECT_FALSE(status.message().empty());
}

TEST_F(SQLiteBackupTest, FailureStopsLoopAndKeepsEarlierCopies) {
    config.databases = {"a.db", "missing.db", "b.db"};
    SQLiteDatabase db(config, context, fastCopy(10));
    auto target = out.path() / "run";
    auto result = db.backup(target);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ErrorKind::Database);
    EXPECT_TRUE(std::filesystem::exists(target / "a.db.bak"));
    EXPECT_FALSE(std::filesystem::exists(target / "missing.db.bak"));
    EXPECT_FALSE(std::filesystem::exists(target / "b.db.bak"));
}

TEST_F(SQLiteBackupTest, CorruptSourceLeavesNoDestination) {
    std::ofstream(dir.path() / "junk.db", std::ios::binary) << std::string(8192, 'x');
    SQLiteDatabase db(config, context, fastCopy(10));
    auto dest = out.path() / "junk.db.bak";
    auto stats = db.copyDatabaseFile(dir.path() / "junk.db", dest);
    ASSERT_FALSE(stats);
    EXPECT_EQ(stats.error().kind(), ErrorKind::Database);
    EXPECT_FALSE(std::filesystem::exists(dest));
}
