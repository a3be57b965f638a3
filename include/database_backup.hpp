/**
 * @file database_backup.hpp
 * @brief Dump-tool database backends for KronVault.
 *
 * MySQL, PostgreSQL and MongoDB are backed up by invoking their native dump utilities once
 * per logical database. Connectivity, size and version are obtained through the matching
 * command line client. Argument vectors are built by static functions so they can be checked
 * without spawning processes.
 *
 * @note Requires the database client tools (mysql/mysqldump, psql/pg_dump, mongo/mongodump)
 * in the system PATH, or explicit paths in the "tools" configuration section.
 */

#ifndef DATABASE_BACKUP_HPP
#define DATABASE_BACKUP_HPP

#include <string>
#include <vector>
#include <optional>
#include "database_connection.hpp"
#include "process_runner.hpp"

/**
 * @brief MySQL backend using mysqldump.
 *
 * Each database is written to <database>.sql from the captured standard output of mysqldump.
 */
class MySQLDatabase : public DatabaseConnection {
public:
    /**
     * @brief Constructs a MySQL backend.
     *
     * @param config Connection settings, borrowed for the lifetime of the backend.
     * @param context Process runner, logger and tool locations.
     */
    MySQLDatabase(const DatabaseConfig& config, BackendContext context);

    ConnectionStatus probe() override;
    std::vector<DatabaseInfo> listDatabases() override;
    std::uint64_t estimateSize() override;
    Result<void> backup(const std::filesystem::path& backupPath) override;
    Result<void> validateConfig(const DatabaseConfig& config) const override;
    std::string_view databaseType() const override { return "mysql"; }

    static std::vector<std::string> connectionArgs(const DatabaseConfig& config);
    static std::vector<std::string> queryArgs(const DatabaseConfig& config, const std::string& query);
    static std::vector<std::string> dumpArgs(const DatabaseConfig& config, const std::string& database);
    static std::string sizeQuery(const std::string& database);

    static constexpr double kOverhead = 1.2; ///< SQL text is larger than the storage footprint.

private:
    Result<std::string> executeQuery(const std::string& query);
    std::optional<std::uint64_t> querySize(const std::string& database);

    const DatabaseConfig& config;
    BackendContext context;
};

/**
 * @brief PostgreSQL backend using pg_dump in custom format.
 *
 * The password is passed to psql and pg_dump through PGPASSWORD in the child environment
 * only, never on the command line. Each database is written to <database>.dump.
 */
class PostgreSQLDatabase : public DatabaseConnection {
public:
    PostgreSQLDatabase(const DatabaseConfig& config, BackendContext context);

    ConnectionStatus probe() override;
    std::vector<DatabaseInfo> listDatabases() override;
    std::uint64_t estimateSize() override;
    Result<void> backup(const std::filesystem::path& backupPath) override;
    Result<void> validateConfig(const DatabaseConfig& config) const override;
    std::string_view databaseType() const override { return "postgres"; }

    static std::vector<std::string> connectionArgs(const DatabaseConfig& config);
    static std::vector<std::string> psqlArgs(const DatabaseConfig& config, const std::string& database, const std::string& query);
    static std::vector<std::string> dumpArgs(const DatabaseConfig& config, const std::string& database,
                                             const std::filesystem::path& outputFile);

    static constexpr double kOverhead = 1.15; ///< Custom dump format overhead.

private:
    Result<std::string> executePsql(const std::string& database, const std::string& query);
    std::optional<std::uint64_t> querySize(const std::string& database);

    const DatabaseConfig& config;
    BackendContext context;
};

/**
 * @brief MongoDB backend using mongodump.
 *
 * mongodump manages its own output: each database becomes a subdirectory of gzipped BSON
 * files inside the destination directory.
 */
class MongoDatabase : public DatabaseConnection {
public:
    MongoDatabase(const DatabaseConfig& config, BackendContext context);

    ConnectionStatus probe() override;
    std::vector<DatabaseInfo> listDatabases() override;
    std::uint64_t estimateSize() override;
    Result<void> backup(const std::filesystem::path& backupPath) override;
    Result<void> validateConfig(const DatabaseConfig& config) const override;
    std::string_view databaseType() const override { return "mongodb"; }

    static std::vector<std::string> connectionArgs(const DatabaseConfig& config);
    static std::vector<std::string> shellArgs(const DatabaseConfig& config, const std::string& database, const std::string& script);
    static std::vector<std::string> dumpArgs(const DatabaseConfig& config, const std::string& database,
                                             const std::filesystem::path& outputDir);

    /**
     * @brief Extracts dataSize from the JSON text printed for db.stats().
     */
    static std::optional<std::uint64_t> parseDataSize(const std::string& statsJson);

    static constexpr double kOverhead = 1.25; ///< BSON and compression overhead.

private:
    Result<std::string> executeShell(const std::string& database, const std::string& script);
    std::optional<std::uint64_t> querySize(const std::string& database);
    std::optional<std::string> queryVersion(const std::string& database);

    const DatabaseConfig& config;
    BackendContext context;
};

/**
 * @brief Parses a trimmed unsigned integer from client output.
 */
std::optional<std::uint64_t> parseUnsigned(std::string_view text);

/**
 * @brief Returns the first non-empty line of client output, trimmed.
 */
std::optional<std::string> firstLine(std::string_view text);

#endif // DATABASE_BACKUP_HPP
