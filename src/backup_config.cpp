#include "backup_config.hpp"
#include <fstream>
#include <fmt/format.h>

namespace {

Result<DatabaseConfig> parseDatabase(const Json::Value& db, const std::string& kind, int defaultPort) {
    if (!db.isObject()) {
        return std::unexpected(BackupError::config(fmt::format("databases.{} must be an object", kind)));
    }
    DatabaseConfig dbConfig;
    dbConfig.host = db.get("host", "").asString();
    dbConfig.port = db.get("port", defaultPort).asInt();
    dbConfig.user = db.get("user", "").asString();
    dbConfig.password = db.get("password", "").asString();

    const Json::Value& names = db["databases"];
    if (!names.isNull() && !names.isArray()) {
        return std::unexpected(BackupError::config(fmt::format("databases.{}.databases must be an array", kind)));
    }
    for (const auto& name : names) {
        dbConfig.databases.push_back(name.asString());
    }
    return dbConfig;
}

} // namespace

Result<BackupConfig> BackupConfig::load(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        return std::unexpected(BackupError::config(fmt::format("Failed to open config file: {}", configFile)));
    }
    Json::Value configJson;
    Json::Reader reader;
    if (!reader.parse(file, configJson)) {
        return std::unexpected(BackupError::config(
            fmt::format("Failed to parse config file {}: {}", configFile, reader.getFormattedErrorMessages())));
    }
    return fromJson(configJson);
}

Result<BackupConfig> BackupConfig::fromJson(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        return std::unexpected(BackupError::config("Configuration root must be an object"));
    }
    // jsoncpp throws on conversions between mismatched value types.
    try {
        return parseConfig(configJson);
    } catch (const Json::Exception& e) {
        return std::unexpected(BackupError::config(fmt::format("Invalid configuration value: {}", e.what())));
    }
}

Result<BackupConfig> BackupConfig::parseConfig(const Json::Value& configJson) {
    BackupConfig config;
    config.backupBase = configJson.get("backup_base", "./backups/").asString();
    if (!config.backupBase.empty() && config.backupBase.back() != '/') {
        config.backupBase += '/';
    }
    config.logFile = configJson.get("log_file", config.backupBase + "backup.log").asString();
    config.errorLogFile = configJson.get("error_log_file", config.backupBase + "errors.log").asString();
    int timeout = configJson.get("tool_timeout_seconds", 3600).asInt();
    if (timeout <= 0) {
        return std::unexpected(BackupError::config("tool_timeout_seconds must be positive"));
    }
    config.toolTimeout = std::chrono::seconds(timeout);
    config.continueOnError = configJson.get("continue_on_error", false).asBool();

    const Json::Value& tools = configJson["tools"];
    config.tools.mysql = tools.get("mysql", config.tools.mysql).asString();
    config.tools.mysqldump = tools.get("mysqldump", config.tools.mysqldump).asString();
    config.tools.psql = tools.get("psql", config.tools.psql).asString();
    config.tools.pgDump = tools.get("pg_dump", config.tools.pgDump).asString();
    config.tools.mongo = tools.get("mongo", config.tools.mongo).asString();
    config.tools.mongodump = tools.get("mongodump", config.tools.mongodump).asString();

    const Json::Value& databases = configJson["databases"];
    if (!databases.isNull() && !databases.isObject()) {
        return std::unexpected(BackupError::config("databases must be an object"));
    }

    if (databases.isMember("sqlite")) {
        const Json::Value& db = databases["sqlite"];
        auto parsed = parseDatabase(db, "sqlite", 0);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.sqlite = std::move(*parsed);
        config.sqliteCopy.pagesPerStep = db.get("pages_per_step", config.sqliteCopy.pagesPerStep).asInt();
        config.sqliteCopy.stepSleep = std::chrono::milliseconds(
            db.get("step_sleep_ms", static_cast<Json::Int64>(config.sqliteCopy.stepSleep.count())).asInt64());
        if (config.sqliteCopy.pagesPerStep <= 0 || config.sqliteCopy.stepSleep.count() < 0) {
            return std::unexpected(BackupError::config("Invalid SQLite online copy settings"));
        }
    }

    if (databases.isMember("mysql")) {
        const Json::Value& db = databases["mysql"];
        auto parsed = parseDatabase(db, "mysql", 3306);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.mysql = std::move(*parsed);
        std::string strategy = db.get("strategy", "dump").asString();
        if (strategy == "dump") {
            config.mysqlStrategy = MySQLStrategy::Dump;
        } else if (strategy == "native") {
            config.mysqlStrategy = MySQLStrategy::Native;
        } else {
            return std::unexpected(BackupError::config(fmt::format("Unknown MySQL strategy: {}", strategy)));
        }
        int batchSize = db.get("batch_size", 1000).asInt();
        if (batchSize <= 0) {
            return std::unexpected(BackupError::config("databases.mysql.batch_size must be positive"));
        }
        config.mysqlBatchSize = static_cast<std::size_t>(batchSize);
    }

    if (databases.isMember("postgres")) {
        auto parsed = parseDatabase(databases["postgres"], "postgres", 5432);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.postgres = std::move(*parsed);
    }

    if (databases.isMember("mongodb")) {
        auto parsed = parseDatabase(databases["mongodb"], "mongodb", 27017);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.mongodb = std::move(*parsed);
    }

    const Json::Value& storage = configJson["storage"];
    config.storage.type = storage.get("type", "local").asString();
    if (config.storage.type == "local") {
        config.storage.path = storage.get("path", config.backupBase).asString();
    } else if (config.storage.type == "sftp") {
        config.storage.host = storage.get("host", "").asString();
        config.storage.port = storage.get("port", 22).asInt();
        config.storage.user = storage.get("user", "").asString();
        config.storage.password = storage.get("password", "").asString();
        config.storage.remoteDir = storage.get("remote_dir", "").asString();
        if (config.storage.host.empty() || config.storage.user.empty() || config.storage.remoteDir.empty()) {
            return std::unexpected(BackupError::config("SFTP storage requires host, user and remote_dir"));
        }
    } else {
        return std::unexpected(BackupError::config(fmt::format("Unsupported storage type: {}", config.storage.type)));
    }

    const Json::Value& telegram = configJson["telegram"];
    if (!telegram.empty()) {
        config.telegram = TelegramConfig{telegram["bot_token"].asString(), telegram["chat_id"].asString()};
    }

    return config;
}

bool BackupConfig::noBackends() const {
    return !sqlite && !mysql && !postgres && !mongodb;
}
