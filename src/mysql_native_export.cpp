#include "mysql_native_export.hpp"
#include "database_backup.hpp"
#include "logger.hpp"
#include <fstream>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

BackupError queryError(MYSQL* conn, std::string_view query) {
    return BackupError::database(fmt::format("Query failed: {}: ERR={}", query, mysql_error(conn)));
}

SqlRow fetchValues(MYSQL_RES* result, MYSQL_ROW row, unsigned int numFields) {
    unsigned long* lengths = mysql_fetch_lengths(result);
    SqlRow values;
    values.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
        if (row[i] && lengths) {
            values.emplace_back(std::string(row[i], lengths[i]));
        } else {
            values.emplace_back(std::nullopt);
        }
    }
    return values;
}

Result<std::optional<std::string>> queryScalar(SqlSession& session, const std::string& query) {
    auto rows = session.query(query);
    if (!rows) {
        return std::unexpected(rows.error());
    }
    if (rows->empty() || rows->front().empty()) {
        return std::optional<std::string>{};
    }
    return rows->front().front();
}

std::string sizeQuery(const std::string& database) {
    return fmt::format("SELECT COALESCE(SUM(data_length + index_length), 0) FROM information_schema.tables "
                       "WHERE table_schema='{}'",
                       escapeSqlString(database));
}

std::optional<std::uint64_t> toUnsigned(const std::optional<std::string>& text) {
    if (!text) {
        return std::nullopt;
    }
    return parseUnsigned(*text);
}

} // namespace

std::string escapeSqlString(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '\0':
            escaped += "\\0";
            break;
        case '\n':
            escaped += "\\n";
            break;
        case '\r':
            escaped += "\\r";
            break;
        case '\\':
            escaped += "\\\\";
            break;
        case '\'':
            escaped += "\\'";
            break;
        case '"':
            escaped += "\\\"";
            break;
        case '\032':
            escaped += "\\Z";
            break;
        default:
            escaped += c;
        }
    }
    return escaped;
}

std::string quoteIdentifier(std::string_view name) {
    std::string quoted = "`";
    for (char c : name) {
        if (c == '`') {
            quoted += '`';
        }
        quoted += c;
    }
    quoted += '`';
    return quoted;
}

std::string renderInsertStatement(std::string_view table, const SqlRow& values) {
    std::string statement = fmt::format("INSERT INTO {} VALUES (", quoteIdentifier(table));
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            statement += ", ";
        }
        if (values[i]) {
            statement += '\'';
            statement += escapeSqlString(*values[i]);
            statement += '\'';
        } else {
            statement += "NULL";
        }
    }
    statement += ");\n";
    return statement;
}

// InsertBatchWriter

InsertBatchWriter::InsertBatchWriter(std::ostream& out, std::size_t batchSize)
    : out(out), batchSize(batchSize == 0 ? 1 : batchSize) {
    batch.reserve(this->batchSize);
}

void InsertBatchWriter::add(std::string statement) {
    batch.push_back(std::move(statement));
    if (batch.size() >= batchSize) {
        flush();
    }
}

void InsertBatchWriter::flush() {
    if (batch.empty()) {
        return;
    }
    for (const auto& statement : batch) {
        out << statement;
    }
    batch.clear();
    ++flushes;
}

// MySQLSession

Result<std::vector<SqlRow>> MySQLSession::query(const std::string& sql) {
    if (mysql_real_query(conn, sql.data(), sql.size()) != 0) {
        return std::unexpected(queryError(conn, sql));
    }
    MYSQL_RES* result = mysql_store_result(conn);
    if (!result) {
        if (mysql_field_count(conn) == 0) {
            return std::vector<SqlRow>{};
        }
        return std::unexpected(queryError(conn, sql));
    }

    std::vector<SqlRow> rows;
    unsigned int numFields = mysql_num_fields(result);
    while (MYSQL_ROW row = mysql_fetch_row(result)) {
        rows.push_back(fetchValues(result, row, numFields));
    }
    mysql_free_result(result);
    return rows;
}

Result<void> MySQLSession::streamRows(const std::string& sql, const std::function<void(const SqlRow&)>& onRow) {
    if (mysql_real_query(conn, sql.data(), sql.size()) != 0) {
        return std::unexpected(queryError(conn, sql));
    }
    MYSQL_RES* result = mysql_use_result(conn);
    if (!result) {
        return std::unexpected(queryError(conn, sql));
    }

    unsigned int numFields = mysql_num_fields(result);
    while (MYSQL_ROW row = mysql_fetch_row(result)) {
        onRow(fetchValues(result, row, numFields));
    }
    // mysql_fetch_row returns NULL both at the end and on a read error.
    bool failed = mysql_errno(conn) != 0;
    std::string error = failed ? mysql_error(conn) : "";
    mysql_free_result(result);
    if (failed) {
        return std::unexpected(BackupError::database(error));
    }
    return {};
}

// Export

Result<void> exportTableRows(SqlSession& session, const std::string& table, InsertBatchWriter& writer) {
    auto streamed = session.streamRows(fmt::format("SELECT * FROM {}", quoteIdentifier(table)),
                                       [&](const SqlRow& row) { writer.add(renderInsertStatement(table, row)); });
    writer.flush();
    if (!streamed) {
        return std::unexpected(BackupError::database(
            fmt::format("Failed to stream rows of {}: {}", table, streamed.error().message())));
    }
    return {};
}

Result<void> writeDatabaseExport(SqlSession& session, const std::string& database, std::ostream& out,
                                 std::size_t batchSize, Logger& logger) {
    auto switched = session.query(fmt::format("USE {}", quoteIdentifier(database)));
    if (!switched) {
        return std::unexpected(switched.error());
    }
    auto tableRows = session.query("SHOW TABLES");
    if (!tableRows) {
        return std::unexpected(tableRows.error());
    }
    std::vector<std::string> tables;
    for (const auto& row : *tableRows) {
        if (!row.empty() && row.front()) {
            tables.push_back(*row.front());
        }
    }

    out << fmt::format("-- KronVault native export of database {}\n\n", quoteIdentifier(database));
    out << "SET FOREIGN_KEY_CHECKS=0;\n\n-- Schema\n\n";
    for (const auto& table : tables) {
        auto create = session.query(fmt::format("SHOW CREATE TABLE {}", quoteIdentifier(table)));
        if (!create) {
            return std::unexpected(create.error());
        }
        if (create->empty() || create->front().size() < 2 || !create->front()[1]) {
            return std::unexpected(BackupError::database(fmt::format("No CREATE statement returned for {}", table)));
        }
        out << fmt::format("DROP TABLE IF EXISTS {};\n{};\n\n", quoteIdentifier(table), *create->front()[1]);
    }

    out << "-- Data\n\n";
    InsertBatchWriter writer(out, batchSize);
    for (const auto& table : tables) {
        if (auto exported = exportTableRows(session, table, writer); !exported) {
            return exported;
        }
        logger.info(fmt::format("Exported table {}.{}", database, table));
    }
    out << "\nSET FOREIGN_KEY_CHECKS=1;\n";
    return {};
}

// MySQLConnectionPool

MySQLConnectionPool::MySQLConnectionPool(const DatabaseConfig& config, std::size_t maxConnections,
                                         std::chrono::seconds timeout)
    : config(config), maxConnections(maxConnections == 0 ? 1 : maxConnections), timeout(timeout) {}

MySQLConnectionPool::~MySQLConnectionPool() {
    close();
}

Result<MYSQL*> MySQLConnectionPool::connect() {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        return std::unexpected(BackupError::database("mysql_init failed: out of memory"));
    }
    unsigned int seconds = static_cast<unsigned int>(timeout.count());
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &seconds);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &seconds);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &seconds);

    if (!mysql_real_connect(conn, config.host.c_str(), config.user.c_str(), config.password.c_str(), nullptr,
                            static_cast<unsigned int>(config.port), nullptr, 0)) {
        std::string msg = fmt::format("Unable to connect to MySQL server {}:{} as {}: {}",
                                      config.host, config.port, config.user, mysql_error(conn));
        mysql_close(conn);
        return std::unexpected(BackupError::database(std::move(msg)));
    }
    return conn;
}

Result<std::shared_ptr<MYSQL>> MySQLConnectionPool::acquire() {
    std::unique_lock lock(mutex);
    for (;;) {
        if (closed) {
            return std::unexpected(BackupError::database("MySQL connection pool is closed"));
        }
        if (!idle.empty()) {
            MYSQL* conn = idle.back();
            idle.pop_back();
            return wrap(conn);
        }
        if (liveConnections < maxConnections) {
            ++liveConnections;
            lock.unlock();
            auto conn = connect();
            if (!conn) {
                std::lock_guard rollback(mutex);
                --liveConnections;
                cv.notify_one();
                return std::unexpected(conn.error());
            }
            return wrap(*conn);
        }
        cv.wait(lock, [this] { return closed || !idle.empty() || liveConnections < maxConnections; });
    }
}

std::shared_ptr<MYSQL> MySQLConnectionPool::wrap(MYSQL* conn) {
    std::weak_ptr<MySQLConnectionPool> weakSelf = shared_from_this();
    return std::shared_ptr<MYSQL>(conn, [weakSelf](MYSQL* released) {
        if (auto self = weakSelf.lock()) {
            self->release(released);
            return;
        }
        mysql_close(released);
    });
}

void MySQLConnectionPool::release(MYSQL* conn) {
    {
        std::lock_guard lock(mutex);
        if (!closed) {
            idle.push_back(conn);
            cv.notify_one();
            return;
        }
        --liveConnections;
    }
    mysql_close(conn);
    cv.notify_one();
}

void MySQLConnectionPool::close() {
    std::vector<MYSQL*> toClose;
    {
        std::lock_guard lock(mutex);
        closed = true;
        toClose.swap(idle);
        liveConnections -= toClose.size();
    }
    for (MYSQL* conn : toClose) {
        mysql_close(conn);
    }
    cv.notify_all();
}

// MySQLNativeDatabase

MySQLNativeDatabase::MySQLNativeDatabase(const DatabaseConfig& config, BackendContext context, std::size_t batchSize)
    : config(config), context(std::move(context)), batchSize(batchSize) {}

std::shared_ptr<MySQLConnectionPool> MySQLNativeDatabase::makePool() const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(context.toolTimeout);
    return std::make_shared<MySQLConnectionPool>(config, 2, seconds.count() > 0 ? seconds : std::chrono::seconds(1));
}

ConnectionStatus MySQLNativeDatabase::probe() {
    auto pool = makePool();
    auto conn = pool->acquire();
    if (!conn) {
        pool->close();
        return ConnectionStatus::error(conn.error().what());
    }
    MySQLSession session(conn->get());
    auto one = queryScalar(session, "SELECT 1");
    conn->reset();
    pool->close();
    if (!one) {
        return ConnectionStatus::error(one.error().what());
    }
    return ConnectionStatus::connected();
}

std::vector<DatabaseInfo> MySQLNativeDatabase::listDatabases() {
    std::vector<DatabaseInfo> info;
    auto pool = makePool();
    auto conn = pool->acquire();
    if (!conn) {
        context.logger.warn(fmt::format("Failed to connect for MySQL database listing: {}", conn.error().what()));
    }
    MySQLSession session(conn ? conn->get() : nullptr);

    std::optional<std::string> version;
    if (conn) {
        auto result = queryScalar(session, "SELECT VERSION()");
        if (result) {
            version = *result;
        } else {
            context.logger.warn(fmt::format("Failed to get MySQL version: {}", result.error().what()));
        }
    }

    for (const auto& database : config.databases) {
        DatabaseInfo entry{database, std::nullopt, version};
        if (conn) {
            auto size = queryScalar(session, sizeQuery(database));
            if (size) {
                entry.size = toUnsigned(*size);
            } else {
                context.logger.warn(fmt::format("Failed to get size of MySQL database {}: {}", database, size.error().what()));
            }
        }
        info.push_back(std::move(entry));
    }

    if (conn) {
        conn->reset();
    }
    pool->close();
    return info;
}

std::uint64_t MySQLNativeDatabase::estimateSize() {
    std::uint64_t total = 0;
    auto pool = makePool();
    auto conn = pool->acquire();
    if (!conn) {
        context.logger.warn(fmt::format("Failed to connect for MySQL size estimate: {}", conn.error().what()));
        pool->close();
        return 0;
    }
    MySQLSession session(conn->get());
    for (const auto& database : config.databases) {
        auto size = queryScalar(session, sizeQuery(database));
        if (size) {
            total += toUnsigned(*size).value_or(0);
        } else {
            context.logger.warn(fmt::format("Failed to get size of MySQL database {}: {}", database, size.error().what()));
        }
    }
    conn->reset();
    pool->close();
    return applyOverhead(total, kOverhead);
}

Result<void> MySQLNativeDatabase::exportDatabase(MYSQL* conn, const std::string& database, const fs::path& outputFile) {
    std::ofstream out(outputFile, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(BackupError::io(fmt::format("Failed to open output file: {}", outputFile.string())));
    }
    MySQLSession session(conn);
    if (auto written = writeDatabaseExport(session, database, out, batchSize, context.logger); !written) {
        return written;
    }
    out.close();
    if (out.fail()) {
        return std::unexpected(BackupError::io(fmt::format("Failed to write output file: {}", outputFile.string())));
    }
    return {};
}

Result<void> MySQLNativeDatabase::backup(const fs::path& backupPath) {
    std::error_code ec;
    fs::create_directories(backupPath, ec);
    if (ec) {
        return std::unexpected(BackupError::io(fmt::format("create directory {}", backupPath.string()), ec));
    }

    auto pool = makePool();
    for (const auto& database : config.databases) {
        auto conn = pool->acquire();
        if (!conn) {
            pool->close();
            return std::unexpected(conn.error());
        }

        fs::path finalPath = backupPath / fmt::format("{}.sql", database);
        fs::path partialPath = backupPath / fmt::format("{}.sql.partial", database);
        auto exported = exportDatabase(conn->get(), database, partialPath);
        conn->reset();
        if (!exported) {
            fs::remove(partialPath, ec);
            pool->close();
            return exported;
        }
        fs::rename(partialPath, finalPath, ec);
        if (ec) {
            auto error = BackupError::io(fmt::format("rename {}", partialPath.string()), ec);
            fs::remove(partialPath, ec);
            pool->close();
            return std::unexpected(error);
        }
        context.logger.info(fmt::format("MySQL database {} exported to {}", database, finalPath.string()));
    }
    pool->close();
    return {};
}

Result<void> MySQLNativeDatabase::validateConfig(const DatabaseConfig& config) const {
    if (config.host.empty()) {
        return std::unexpected(BackupError::config("MySQL host cannot be empty"));
    }
    if (config.user.empty()) {
        return std::unexpected(BackupError::config("MySQL user cannot be empty"));
    }
    if (config.databases.empty()) {
        return std::unexpected(BackupError::config("At least one database must be specified"));
    }
    return {};
}
