#include "database_backup.hpp"
#include "logger.hpp"
#include <charconv>
#include <system_error>
#include <json/json.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string sqlQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted += c;
        }
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string stderrSummary(const ProcessResult& result) {
    auto text = trim(result.stderrText);
    if (text.empty()) {
        return fmt::format("exit status {}", result.exitCode);
    }
    return std::string(text);
}

/**
 * @brief Runs a client tool and returns its standard output.
 *
 * Non-zero exit status becomes a Database-kind error carrying the captured standard error.
 */
Result<std::string> runClient(BackendContext& context, ProcessRequest request, std::string_view toolName) {
    request.timeout = context.toolTimeout;
    auto result = context.runner.run(request);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->success()) {
        return std::unexpected(BackupError::database(fmt::format("{} command failed: {}", toolName, stderrSummary(*result))));
    }
    return std::move(result->stdoutText);
}

/**
 * @brief Runs a dump tool writing to a temporary name and moves the artifact into place on success.
 *
 * On any failure the partial artifact is removed so no misleadingly named file is left behind.
 */
Result<void> runDump(BackendContext& context, ProcessRequest request, std::string_view toolName,
                     const std::string& database, const fs::path& partialPath, const fs::path& finalPath) {
    request.timeout = context.toolTimeout;
    context.logger.info(fmt::format("Executing {}", describeCommand(request)));

    auto discardPartial = [&partialPath]() {
        std::error_code ec;
        fs::remove_all(partialPath, ec);
    };

    auto result = context.runner.run(request);
    if (!result) {
        discardPartial();
        return std::unexpected(result.error());
    }
    if (!result->success()) {
        discardPartial();
        return std::unexpected(BackupError::database(
            fmt::format("{} failed for {}: {}", toolName, database, stderrSummary(*result))));
    }

    std::error_code ec;
    fs::rename(partialPath, finalPath, ec);
    if (ec) {
        discardPartial();
        return std::unexpected(BackupError::io(fmt::format("rename {} to {}", partialPath.string(), finalPath.string()), ec));
    }
    return {};
}

Result<void> createBackupDirectory(const fs::path& backupPath) {
    std::error_code ec;
    fs::create_directories(backupPath, ec);
    if (ec) {
        return std::unexpected(BackupError::io(fmt::format("create directory {}", backupPath.string()), ec));
    }
    return {};
}

Result<void> requireField(const std::string& value, std::string_view backend, std::string_view field) {
    if (value.empty()) {
        return std::unexpected(BackupError::config(fmt::format("{} {} cannot be empty", backend, field)));
    }
    return {};
}

Result<void> requireDatabases(const DatabaseConfig& config) {
    if (config.databases.empty()) {
        return std::unexpected(BackupError::config("At least one database must be specified"));
    }
    return {};
}

} // namespace

std::optional<std::uint64_t> parseUnsigned(std::string_view text) {
    auto trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> firstLine(std::string_view text) {
    while (!text.empty()) {
        auto end = text.find('\n');
        auto line = trim(text.substr(0, end));
        if (!line.empty()) {
            return std::string(line);
        }
        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }
    return std::nullopt;
}

// MySQL

MySQLDatabase::MySQLDatabase(const DatabaseConfig& config, BackendContext context)
    : config(config), context(std::move(context)) {}

std::vector<std::string> MySQLDatabase::connectionArgs(const DatabaseConfig& config) {
    return {
        fmt::format("--host={}", config.host),
        fmt::format("--port={}", config.port),
        fmt::format("--user={}", config.user),
        fmt::format("--password={}", config.password),
    };
}

std::vector<std::string> MySQLDatabase::queryArgs(const DatabaseConfig& config, const std::string& query) {
    auto args = connectionArgs(config);
    args.push_back("--batch");
    args.push_back("--skip-column-names");
    args.push_back(fmt::format("--execute={}", query));
    return args;
}

std::vector<std::string> MySQLDatabase::dumpArgs(const DatabaseConfig& config, const std::string& database) {
    auto args = connectionArgs(config);
    for (const char* flag : {"--single-transaction", "--routines", "--triggers", "--events",
                             "--add-drop-database", "--create-options"}) {
        args.emplace_back(flag);
    }
    args.push_back(database);
    return args;
}

std::string MySQLDatabase::sizeQuery(const std::string& database) {
    return fmt::format("SELECT COALESCE(SUM(data_length + index_length), 0) FROM information_schema.tables "
                       "WHERE table_schema={}",
                       sqlQuote(database));
}

Result<std::string> MySQLDatabase::executeQuery(const std::string& query) {
    return runClient(context, ProcessRequest{context.tools.mysql, queryArgs(config, query)}, "mysql");
}

std::optional<std::uint64_t> MySQLDatabase::querySize(const std::string& database) {
    auto output = executeQuery(sizeQuery(database));
    if (!output) {
        context.logger.warn(fmt::format("Failed to get size of MySQL database {}: {}", database, output.error().what()));
        return std::nullopt;
    }
    auto size = parseUnsigned(firstLine(*output).value_or(""));
    if (!size) {
        context.logger.warn(fmt::format("Unexpected size output for MySQL database {}: {}", database, *output));
    }
    return size;
}

ConnectionStatus MySQLDatabase::probe() {
    auto output = executeQuery("SELECT 1");
    if (!output) {
        return ConnectionStatus::error(output.error().what());
    }
    return ConnectionStatus::connected();
}

std::vector<DatabaseInfo> MySQLDatabase::listDatabases() {
    std::vector<DatabaseInfo> info;
    for (const auto& database : config.databases) {
        DatabaseInfo entry{database, querySize(database), std::nullopt};
        auto version = executeQuery("SELECT VERSION()");
        if (version) {
            entry.schemaVersion = firstLine(*version);
        } else {
            context.logger.warn(fmt::format("Failed to get MySQL version for {}: {}", database, version.error().what()));
        }
        info.push_back(std::move(entry));
    }
    return info;
}

std::uint64_t MySQLDatabase::estimateSize() {
    std::uint64_t total = 0;
    for (const auto& database : config.databases) {
        total += querySize(database).value_or(0);
    }
    return applyOverhead(total, kOverhead);
}

Result<void> MySQLDatabase::backup(const fs::path& backupPath) {
    if (auto created = createBackupDirectory(backupPath); !created) {
        return created;
    }
    for (const auto& database : config.databases) {
        fs::path finalPath = backupPath / fmt::format("{}.sql", database);
        fs::path partialPath = backupPath / fmt::format("{}.sql.partial", database);
        ProcessRequest request{context.tools.mysqldump, dumpArgs(config, database)};
        request.stdoutFile = partialPath;
        auto dumped = runDump(context, std::move(request), "mysqldump", database, partialPath, finalPath);
        if (!dumped) {
            return dumped;
        }
        context.logger.info(fmt::format("MySQL database {} dumped to {}", database, finalPath.string()));
    }
    return {};
}

Result<void> MySQLDatabase::validateConfig(const DatabaseConfig& config) const {
    if (auto r = requireField(config.host, "MySQL", "host"); !r) {
        return r;
    }
    if (auto r = requireField(config.user, "MySQL", "user"); !r) {
        return r;
    }
    return requireDatabases(config);
}

// PostgreSQL

PostgreSQLDatabase::PostgreSQLDatabase(const DatabaseConfig& config, BackendContext context)
    : config(config), context(std::move(context)) {}

std::vector<std::string> PostgreSQLDatabase::connectionArgs(const DatabaseConfig& config) {
    return {
        fmt::format("--host={}", config.host),
        fmt::format("--port={}", config.port),
        fmt::format("--username={}", config.user),
    };
}

std::vector<std::string> PostgreSQLDatabase::psqlArgs(const DatabaseConfig& config, const std::string& database,
                                                      const std::string& query) {
    auto args = connectionArgs(config);
    args.push_back(fmt::format("--dbname={}", database));
    args.push_back("--no-password");
    args.push_back("--tuples-only");
    args.push_back("--no-align");
    args.push_back(fmt::format("--command={}", query));
    return args;
}

std::vector<std::string> PostgreSQLDatabase::dumpArgs(const DatabaseConfig& config, const std::string& database,
                                                      const fs::path& outputFile) {
    auto args = connectionArgs(config);
    args.push_back(fmt::format("--dbname={}", database));
    for (const char* flag : {"--no-password", "--verbose", "--clean", "--create", "--if-exists", "--format=custom"}) {
        args.emplace_back(flag);
    }
    args.push_back(fmt::format("--file={}", outputFile.string()));
    return args;
}

Result<std::string> PostgreSQLDatabase::executePsql(const std::string& database, const std::string& query) {
    ProcessRequest request{context.tools.psql, psqlArgs(config, database, query)};
    request.env.emplace_back("PGPASSWORD", config.password);
    return runClient(context, std::move(request), "psql");
}

std::optional<std::uint64_t> PostgreSQLDatabase::querySize(const std::string& database) {
    auto output = executePsql(database, "SELECT pg_database_size(current_database());");
    if (!output) {
        context.logger.warn(fmt::format("Failed to get size of PostgreSQL database {}: {}", database, output.error().what()));
        return std::nullopt;
    }
    auto size = parseUnsigned(firstLine(*output).value_or(""));
    if (!size) {
        context.logger.warn(fmt::format("Unexpected size output for PostgreSQL database {}: {}", database, *output));
    }
    return size;
}

ConnectionStatus PostgreSQLDatabase::probe() {
    auto output = executePsql("postgres", "SELECT 1;");
    if (!output) {
        return ConnectionStatus::error(output.error().what());
    }
    return ConnectionStatus::connected();
}

std::vector<DatabaseInfo> PostgreSQLDatabase::listDatabases() {
    std::vector<DatabaseInfo> info;
    for (const auto& database : config.databases) {
        DatabaseInfo entry{database, querySize(database), std::nullopt};
        auto version = executePsql(database, "SELECT version();");
        if (version) {
            entry.schemaVersion = firstLine(*version);
        } else {
            context.logger.warn(fmt::format("Failed to get PostgreSQL version for {}: {}", database, version.error().what()));
        }
        info.push_back(std::move(entry));
    }
    return info;
}

std::uint64_t PostgreSQLDatabase::estimateSize() {
    std::uint64_t total = 0;
    for (const auto& database : config.databases) {
        total += querySize(database).value_or(0);
    }
    return applyOverhead(total, kOverhead);
}

Result<void> PostgreSQLDatabase::backup(const fs::path& backupPath) {
    if (auto created = createBackupDirectory(backupPath); !created) {
        return created;
    }
    for (const auto& database : config.databases) {
        fs::path finalPath = backupPath / fmt::format("{}.dump", database);
        fs::path partialPath = backupPath / fmt::format("{}.dump.partial", database);
        ProcessRequest request{context.tools.pgDump, dumpArgs(config, database, partialPath)};
        request.env.emplace_back("PGPASSWORD", config.password);
        auto dumped = runDump(context, std::move(request), "pg_dump", database, partialPath, finalPath);
        if (!dumped) {
            return dumped;
        }
        context.logger.info(fmt::format("PostgreSQL database {} dumped to {}", database, finalPath.string()));
    }
    return {};
}

Result<void> PostgreSQLDatabase::validateConfig(const DatabaseConfig& config) const {
    if (auto r = requireField(config.host, "PostgreSQL", "host"); !r) {
        return r;
    }
    if (auto r = requireField(config.user, "PostgreSQL", "user"); !r) {
        return r;
    }
    return requireDatabases(config);
}

// MongoDB

MongoDatabase::MongoDatabase(const DatabaseConfig& config, BackendContext context)
    : config(config), context(std::move(context)) {}

std::vector<std::string> MongoDatabase::connectionArgs(const DatabaseConfig& config) {
    return {
        fmt::format("--host={}:{}", config.host, config.port),
        fmt::format("--username={}", config.user),
        fmt::format("--password={}", config.password),
        "--authenticationDatabase=admin",
    };
}

std::vector<std::string> MongoDatabase::shellArgs(const DatabaseConfig& config, const std::string& database,
                                                  const std::string& script) {
    auto args = connectionArgs(config);
    args.push_back(database);
    args.push_back("--quiet");
    args.push_back("--eval");
    args.push_back(script);
    return args;
}

std::vector<std::string> MongoDatabase::dumpArgs(const DatabaseConfig& config, const std::string& database,
                                                 const fs::path& outputDir) {
    auto args = connectionArgs(config);
    args.push_back(fmt::format("--db={}", database));
    args.push_back(fmt::format("--out={}", outputDir.string()));
    args.push_back("--gzip");
    return args;
}

std::optional<std::uint64_t> MongoDatabase::parseDataSize(const std::string& statsJson) {
    Json::Value stats;
    Json::Reader reader;
    if (!reader.parse(statsJson, stats) || !stats.isObject()) {
        return std::nullopt;
    }
    const Json::Value& dataSize = stats["dataSize"];
    if (dataSize.isUInt64()) {
        return dataSize.asUInt64();
    }
    if (dataSize.isDouble() && dataSize.asDouble() >= 0) {
        return static_cast<std::uint64_t>(dataSize.asDouble());
    }
    return std::nullopt;
}

Result<std::string> MongoDatabase::executeShell(const std::string& database, const std::string& script) {
    return runClient(context, ProcessRequest{context.tools.mongo, shellArgs(config, database, script)}, "mongo");
}

std::optional<std::uint64_t> MongoDatabase::querySize(const std::string& database) {
    auto stats = executeShell(database, "JSON.stringify(db.stats())");
    if (!stats) {
        context.logger.warn(fmt::format("Failed to get stats for MongoDB database {}: {}", database, stats.error().what()));
        return std::nullopt;
    }
    auto size = parseDataSize(*stats);
    if (!size) {
        context.logger.warn(fmt::format("Unexpected stats output for MongoDB database {}: {}", database, *stats));
    }
    return size;
}

std::optional<std::string> MongoDatabase::queryVersion(const std::string& database) {
    auto version = executeShell(database, "JSON.stringify(db.version())");
    if (!version) {
        context.logger.warn(fmt::format("Failed to get MongoDB version for {}: {}", database, version.error().what()));
        return std::nullopt;
    }
    std::string versionText(trim(*version));
    if (versionText.size() >= 2 && versionText.front() == '"' && versionText.back() == '"') {
        versionText = versionText.substr(1, versionText.size() - 2);
    }
    return versionText;
}

ConnectionStatus MongoDatabase::probe() {
    auto output = executeShell("admin", "db.runCommand('ping')");
    if (!output) {
        return ConnectionStatus::error(output.error().what());
    }
    return ConnectionStatus::connected();
}

std::vector<DatabaseInfo> MongoDatabase::listDatabases() {
    std::vector<DatabaseInfo> info;
    for (const auto& database : config.databases) {
        info.push_back(DatabaseInfo{database, querySize(database), queryVersion(database)});
    }
    return info;
}

std::uint64_t MongoDatabase::estimateSize() {
    std::uint64_t total = 0;
    for (const auto& database : config.databases) {
        total += querySize(database).value_or(0);
    }
    return applyOverhead(total, kOverhead);
}

Result<void> MongoDatabase::backup(const fs::path& backupPath) {
    if (auto created = createBackupDirectory(backupPath); !created) {
        return created;
    }
    for (const auto& database : config.databases) {
        // mongodump always writes <out>/<database>/; dump into a staging root and move the subdirectory.
        fs::path stagingRoot = backupPath / fmt::format(".{}.partial", database);
        fs::path finalPath = backupPath / database;
        std::error_code ec;
        fs::remove_all(stagingRoot, ec);
        ProcessRequest request{context.tools.mongodump, dumpArgs(config, database, stagingRoot)};
        auto dumped = runDump(context, std::move(request), "mongodump", database, stagingRoot / database, finalPath);
        fs::remove_all(stagingRoot, ec);
        if (!dumped) {
            return dumped;
        }
        context.logger.info(fmt::format("MongoDB database {} dumped to {}", database, finalPath.string()));
    }
    return {};
}

Result<void> MongoDatabase::validateConfig(const DatabaseConfig& config) const {
    if (auto r = requireField(config.host, "MongoDB", "host"); !r) {
        return r;
    }
    if (auto r = requireField(config.user, "MongoDB", "user"); !r) {
        return r;
    }
    if (auto r = requireField(config.password, "MongoDB", "password"); !r) {
        return r;
    }
    return requireDatabases(config);
}
