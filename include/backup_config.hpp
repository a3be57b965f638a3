/**
 * @file backup_config.hpp
 * @brief Configuration management for the KronVault backup system.
 *
 * Defines the per-backend connection settings and the run configuration loaded from a
 * JSON file. Only the backend kinds present in the "databases" section take part in a run.
 *
 * @note Configuration is loaded from a JSON file with jsoncpp.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <json/json.h>
#include "backup_error.hpp"

/**
 * @brief Connection settings of one configured backend instance.
 *
 * For the SQLite backend, host is the directory holding the database files and
 * databases lists file names inside it.
 */
struct DatabaseConfig {
    std::string host;                   ///< Server host, or directory for SQLite.
    int port = 0;                       ///< Server port (unused by SQLite).
    std::string user;                   ///< Login name.
    std::string password;               ///< Login password.
    std::vector<std::string> databases; ///< Logical databases to back up.
};

/**
 * @brief Tuning of the SQLite online page copy.
 */
struct OnlineCopyOptions {
    int pagesPerStep = 10;                             ///< Pages transferred per step.
    std::chrono::milliseconds stepSleep{1000};          ///< Pause between steps.
};

/**
 * @brief Selects how MySQL databases are exported.
 */
enum class MySQLStrategy {
    Dump,  ///< Invoke mysqldump.
    Native ///< Stream rows through libmysqlclient.
};

/**
 * @brief Executable names or paths of the external client and dump tools.
 */
struct ToolPaths {
    std::string mysql = "mysql";
    std::string mysqldump = "mysqldump";
    std::string psql = "psql";
    std::string pgDump = "pg_dump";
    std::string mongo = "mongo";
    std::string mongodump = "mongodump";
};

/**
 * @brief Where the archived run is placed.
 */
struct StorageConfig {
    std::string type = "local"; ///< "local" or "sftp".
    std::string path;           ///< Local base directory.
    std::string host;           ///< SFTP host.
    int port = 22;              ///< SFTP port.
    std::string user;           ///< SFTP user.
    std::string password;       ///< SFTP password, empty for public key auth.
    std::string remoteDir;      ///< SFTP remote directory.
};

/**
 * @brief Telegram notification settings.
 */
struct TelegramConfig {
    std::string botToken;
    std::string chatId;
};

/**
 * @brief Configuration of one backup run.
 */
class BackupConfig {
public:
    /**
     * @brief Loads the configuration from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @return Result<BackupConfig> The configuration or a Config-kind error.
     */
    static Result<BackupConfig> load(const std::string& configFile);

    /**
     * @brief Builds the configuration from an already parsed JSON document.
     *
     * @param configJson Parsed document.
     * @return Result<BackupConfig> The configuration or a Config-kind error.
     */
    static Result<BackupConfig> fromJson(const Json::Value& configJson);

    /**
     * @brief Returns true if no backend kind is configured.
     */
    bool noBackends() const;

    std::string backupBase = "./backups/";        ///< Base directory for backups and logs.
    std::string logFile;                          ///< Path to the log file.
    std::string errorLogFile;                     ///< Path to the error log file.
    std::chrono::seconds toolTimeout{3600};       ///< Deadline of every external step.
    bool continueOnError = false;                 ///< Keep going after a backend fails.
    ToolPaths tools;                              ///< External tool locations.

    std::optional<DatabaseConfig> sqlite;         ///< SQLite backend, if configured.
    std::optional<DatabaseConfig> mysql;          ///< MySQL backend, if configured.
    std::optional<DatabaseConfig> postgres;       ///< PostgreSQL backend, if configured.
    std::optional<DatabaseConfig> mongodb;        ///< MongoDB backend, if configured.

    OnlineCopyOptions sqliteCopy;                 ///< SQLite online copy tuning.
    MySQLStrategy mysqlStrategy = MySQLStrategy::Dump; ///< MySQL export strategy.
    std::size_t mysqlBatchSize = 1000;            ///< Rows buffered per flush by the native export.

    StorageConfig storage;                        ///< Storage sink settings.
    std::optional<TelegramConfig> telegram;       ///< Notification settings, if configured.

private:
    static Result<BackupConfig> parseConfig(const Json::Value& configJson);
};

#endif // BACKUP_CONFIG_HPP
