#include <gtest/gtest.h>
#include "backup_performer.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

class BackupPerformerTest : public ::testing::Test {
protected:
    void SetUp() override {
        createSqliteDatabase(data.path() / "a.db", 40);
        createSqliteDatabase(data.path() / "b.db", 10);
        config.sqliteCopy.stepSleep = std::chrono::milliseconds(0);
    }

    void configureSqlite() {
        DatabaseConfig sqlite;
        sqlite.host = data.path().string();
        sqlite.databases = {"a.db", "b.db"};
        config.sqlite = sqlite;
    }

    void configurePostgres() {
        DatabaseConfig postgres;
        postgres.host = "pg.example.com";
        postgres.port = 5432;
        postgres.user = "backup";
        postgres.password = "pw";
        postgres.databases = {"crm"};
        config.postgres = postgres;
    }

    BackupPerformer makePerformer() {
        return BackupPerformer(config, out.path() / "run", BackendContext{runner, logger, config.tools});
    }

    TempDir data;
    TempDir out;
    FakeProcessRunner runner;
    Logger logger{"", "", true};
    BackupConfig config;
};

TEST_F(BackupPerformerTest, EmptyConfigurationFailsBeforeAnyIo) {
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind(), ErrorKind::Config);
    EXPECT_EQ(report.error().message(), "No database configurations found");
    EXPECT_FALSE(fs::exists(out.path() / "run"));
    EXPECT_TRUE(runner.requests.empty());
}

TEST_F(BackupPerformerTest, SqliteOnlyRunProducesBakFiles) {
    configureSqlite();
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_TRUE(report) << report.error().what();
    EXPECT_EQ(report->completed, (std::vector<std::string>{"sqlite"}));
    EXPECT_TRUE(report->failed.empty());
    EXPECT_EQ(readSqliteRows(out.path() / "run" / "a.db.bak"), readSqliteRows(data.path() / "a.db"));
    EXPECT_EQ(readSqliteRows(out.path() / "run" / "b.db.bak"), readSqliteRows(data.path() / "b.db"));
    EXPECT_TRUE(runner.requests.empty());
}

TEST_F(BackupPerformerTest, BackendsRunInFixedOrder) {
    configurePostgres();
    configureSqlite();
    DatabaseConfig mysql;
    mysql.host = "my.example.com";
    config.mysql = mysql;
    config.mysqlStrategy = MySQLStrategy::Native;
    DatabaseConfig mongo;
    config.mongodb = mongo;

    auto performer = makePerformer();
    auto backends = performer.configuredBackends();
    ASSERT_EQ(backends.size(), 4u);
    EXPECT_EQ(backends[0].first, BackendKind::SQLite);
    EXPECT_EQ(backends[1].first, BackendKind::MySQLNative);
    EXPECT_EQ(backends[2].first, BackendKind::PostgreSQL);
    EXPECT_EQ(backends[3].first, BackendKind::MongoDB);
}

TEST_F(BackupPerformerTest, ProbeFailureNamesBackendAndStopsRun) {
    configureSqlite();
    configurePostgres();
    DatabaseConfig mongo;
    mongo.host = "mongo.example.com";
    mongo.user = "u";
    mongo.password = "p";
    mongo.databases = {"events"};
    config.mongodb = mongo;

    runner.handler = [](const ProcessRequest&) -> Result<ProcessResult> {
        return failed(2, "psql: error: could not connect to server: Connection refused");
    };
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind(), ErrorKind::Database);
    EXPECT_NE(report.error().message().find("Failed to connect to postgres database"), std::string::npos);
    EXPECT_NE(report.error().message().find("Connection refused"), std::string::npos);

    // SQLite ran first and keeps its artifacts; MongoDB was never attempted.
    EXPECT_TRUE(fs::exists(out.path() / "run" / "a.db.bak"));
    for (const auto& request : runner.requests) {
        EXPECT_NE(request.program, "mongo");
    }
}

TEST_F(BackupPerformerTest, InvalidConfigIsReportedBeforeProbe) {
    configurePostgres();
    config.postgres->databases.clear();
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind(), ErrorKind::Config);
    EXPECT_TRUE(runner.requests.empty());
}

TEST_F(BackupPerformerTest, ContinueOnErrorCollectsFailures) {
    configureSqlite();
    configurePostgres();
    config.continueOnError = true;
    runner.handler = [](const ProcessRequest&) -> Result<ProcessResult> {
        return failed(2, "Connection refused");
    };
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_TRUE(report) << report.error().what();
    EXPECT_EQ(report->completed, (std::vector<std::string>{"sqlite"}));
    ASSERT_EQ(report->failed.size(), 1u);
    EXPECT_EQ(report->failed[0].first, "postgres");
    EXPECT_EQ(report->failed[0].second.kind(), ErrorKind::Database);
}

TEST_F(BackupPerformerTest, ContinueOnErrorFailsWhenNothingCompleted) {
    configurePostgres();
    config.continueOnError = true;
    runner.handler = [](const ProcessRequest&) -> Result<ProcessResult> {
        return failed(2, "Connection refused");
    };
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().kind(), ErrorKind::Backup);
    EXPECT_NE(report.error().message().find("postgres"), std::string::npos);
}

TEST_F(BackupPerformerTest, PostgresDumpScenario) {
    configurePostgres();
    runner.handler = [](const ProcessRequest& request) -> Result<ProcessResult> {
        if (request.program == "psql") {
            return succeeded(FakeProcessRunner::hasArg(request, "--command=SELECT version();")
                                 ? "PostgreSQL 15.4\n" : "1\n");
        }
        return succeeded();
    };
    auto performer = makePerformer();
    auto report = performer.execute();
    ASSERT_TRUE(report) << report.error().what();
    EXPECT_EQ(report->completed, (std::vector<std::string>{"postgres"}));
    EXPECT_TRUE(fs::exists(out.path() / "run" / "crm.dump"));
    EXPECT_EQ(runner.requests.back().program, "pg_dump");
}
