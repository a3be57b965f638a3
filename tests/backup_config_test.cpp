#include <gtest/gtest.h>
#include <fstream>
#include "backup_config.hpp"
#include "test_support.hpp"

namespace {

Json::Value parse(const std::string& text) {
    Json::Value value;
    Json::Reader reader;
    EXPECT_TRUE(reader.parse(text, value)) << reader.getFormattedErrorMessages();
    return value;
}

} // namespace

TEST(BackupConfigTest, DefaultsForEmptyDocument) {
    auto config = BackupConfig::fromJson(parse("{}"));
    ASSERT_TRUE(config) << config.error().what();
    EXPECT_EQ(config->backupBase, "./backups/");
    EXPECT_EQ(config->logFile, "./backups/backup.log");
    EXPECT_EQ(config->errorLogFile, "./backups/errors.log");
    EXPECT_EQ(config->toolTimeout, std::chrono::seconds(3600));
    EXPECT_FALSE(config->continueOnError);
    EXPECT_TRUE(config->noBackends());
    EXPECT_EQ(config->storage.type, "local");
    EXPECT_EQ(config->storage.path, "./backups/");
    EXPECT_FALSE(config->telegram);
}

TEST(BackupConfigTest, ParsesBackendsWithDefaultPorts) {
    auto config = BackupConfig::fromJson(parse(R"({
        "backup_base": "/var/backups",
        "databases": {
            "sqlite": { "host": "/data", "databases": ["a.db", "b.db"], "pages_per_step": 5, "step_sleep_ms": 0 },
            "mysql": { "host": "db1", "user": "root", "password": "pw", "databases": ["shop"] },
            "postgres": { "host": "db2", "user": "pg", "databases": ["crm"] },
            "mongodb": { "host": "db3", "user": "mongo", "password": "pw", "databases": ["events"] }
        }
    })"));
    ASSERT_TRUE(config) << config.error().what();
    EXPECT_EQ(config->backupBase, "/var/backups/");
    ASSERT_TRUE(config->sqlite);
    EXPECT_EQ(config->sqlite->port, 0);
    EXPECT_EQ(config->sqlite->databases, (std::vector<std::string>{"a.db", "b.db"}));
    EXPECT_EQ(config->sqliteCopy.pagesPerStep, 5);
    EXPECT_EQ(config->sqliteCopy.stepSleep, std::chrono::milliseconds(0));
    ASSERT_TRUE(config->mysql);
    EXPECT_EQ(config->mysql->port, 3306);
    EXPECT_EQ(config->mysqlStrategy, MySQLStrategy::Dump);
    ASSERT_TRUE(config->postgres);
    EXPECT_EQ(config->postgres->port, 5432);
    ASSERT_TRUE(config->mongodb);
    EXPECT_EQ(config->mongodb->port, 27017);
    EXPECT_FALSE(config->noBackends());
}

TEST(BackupConfigTest, NativeMySQLStrategy) {
    auto config = BackupConfig::fromJson(parse(R"({
        "databases": { "mysql": { "host": "h", "user": "u", "databases": ["d"], "strategy": "native", "batch_size": 50 } }
    })"));
    ASSERT_TRUE(config) << config.error().what();
    EXPECT_EQ(config->mysqlStrategy, MySQLStrategy::Native);
    EXPECT_EQ(config->mysqlBatchSize, 50u);
}

TEST(BackupConfigTest, RejectsInvalidDocuments) {
    const char* documents[] = {
        R"({ "databases": { "mysql": { "host": "h", "strategy": "parallel" } } })",
        R"({ "databases": { "postgres": { "host": "h", "databases": "crm" } } })",
        R"({ "databases": [] })",
        R"({ "storage": { "type": "s3" } })",
        R"({ "storage": { "type": "sftp", "host": "h" } })",
        R"({ "tool_timeout_seconds": 0 })",
        R"({ "databases": { "sqlite": { "host": "/d", "pages_per_step": 0 } } })",
    };
    for (const char* document : documents) {
        auto config = BackupConfig::fromJson(parse(document));
        ASSERT_FALSE(config) << document;
        EXPECT_EQ(config.error().kind(), ErrorKind::Config) << document;
    }
}

TEST(BackupConfigTest, RejectsMistypedValuesAsConfigErrors) {
    const char* documents[] = {
        R"({ "databases": { "mysql": { "host": "h", "port": "3306", "user": "u", "databases": ["d"] } } })",
        R"({ "tools": "mysqldump" })",
        R"({ "storage": "local" })",
        R"({ "databases": { "postgres": { "host": "h", "databases": [{ "x": 1 }] } } })",
        R"({ "telegram": "chat" })",
    };
    for (const char* document : documents) {
        auto config = BackupConfig::fromJson(parse(document));
        ASSERT_FALSE(config) << document;
        EXPECT_EQ(config.error().kind(), ErrorKind::Config) << document;
        EXPECT_NE(config.error().message().find("Invalid configuration value"), std::string::npos) << document;
    }
}

TEST(BackupConfigTest, LoadReportsMistypedFileAsConfigError) {
    TempDir dir;
    auto path = dir.path() / "mistyped.json";
    std::ofstream(path) << R"({ "databases": { "mysql": { "host": "h", "port": "3306" } } })";
    auto config = BackupConfig::load(path.string());
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().kind(), ErrorKind::Config);
}

TEST(BackupConfigTest, ParsesSftpStorageAndTelegram) {
    auto config = BackupConfig::fromJson(parse(R"({
        "storage": { "type": "sftp", "host": "vault", "user": "backup", "remote_dir": "/srv/backups" },
        "telegram": { "bot_token": "123:abc", "chat_id": "42" }
    })"));
    ASSERT_TRUE(config) << config.error().what();
    EXPECT_EQ(config->storage.type, "sftp");
    EXPECT_EQ(config->storage.port, 22);
    EXPECT_EQ(config->storage.remoteDir, "/srv/backups");
    ASSERT_TRUE(config->telegram);
    EXPECT_EQ(config->telegram->botToken, "123:abc");
    EXPECT_EQ(config->telegram->chatId, "42");
}

TEST(BackupConfigTest, LoadReportsMissingAndMalformedFiles) {
    TempDir dir;
    auto missing = BackupConfig::load((dir.path() / "absent.json").string());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind(), ErrorKind::Config);

    auto brokenPath = dir.path() / "broken.json";
    std::ofstream(brokenPath) << "{ \"databases\": ";
    auto broken = BackupConfig::load(brokenPath.string());
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().kind(), ErrorKind::Config);

    auto goodPath = dir.path() / "good.json";
    std::ofstream(goodPath) << R"({ "continue_on_error": true, "tools": { "pg_dump": "/opt/pg/bin/pg_dump" } })";
    auto good = BackupConfig::load(goodPath.string());
    ASSERT_TRUE(good) << good.error().what();
    EXPECT_TRUE(good->continueOnError);
    EXPECT_EQ(good->tools.pgDump, "/opt/pg/bin/pg_dump");
    EXPECT_EQ(good->tools.mysqldump, "mysqldump");
}
