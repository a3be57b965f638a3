/**
 * @file mysql_native_export.hpp
 * @brief MySQL backend exporting through libmysqlclient instead of mysqldump.
 *
 * For each database the export switches to it, writes every table's CREATE statement into a
 * schema section, then streams each table's rows through an unbuffered cursor, rendering them
 * as INSERT statements that are buffered in batches before being written to the output file.
 * Selected with "strategy": "native" in the MySQL configuration.
 *
 * @note Requires libmysqlclient. Heavier on CPU and memory than mysqldump, but needs no
 * external binary.
 */

#ifndef MYSQL_NATIVE_EXPORT_HPP
#define MYSQL_NATIVE_EXPORT_HPP

#include <mysql.h>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "database_connection.hpp"

/// One result row; absent values are SQL NULL.
using SqlRow = std::vector<std::optional<std::string>>;

/**
 * @brief Escapes a value for use inside a single-quoted SQL string literal.
 */
std::string escapeSqlString(std::string_view value);

/**
 * @brief Quotes an identifier with backticks.
 */
std::string quoteIdentifier(std::string_view name);

/**
 * @brief Renders one row as an INSERT statement; absent values become NULL.
 */
std::string renderInsertStatement(std::string_view table, const SqlRow& values);

/**
 * @brief Buffers rendered statements and writes them to a stream in batches.
 */
class InsertBatchWriter {
public:
    /**
     * @param out Destination stream.
     * @param batchSize Statements buffered before a flush.
     */
    InsertBatchWriter(std::ostream& out, std::size_t batchSize);

    /**
     * @brief Buffers a statement, flushing when the batch is full.
     */
    void add(std::string statement);

    /**
     * @brief Writes and clears the buffered statements.
     */
    void flush();

    std::size_t pending() const { return batch.size(); }
    std::size_t flushCount() const { return flushes; }

private:
    std::ostream& out;
    std::size_t batchSize;
    std::vector<std::string> batch;
    std::size_t flushes = 0;
};

/**
 * @brief Query interface the native export runs against.
 */
class SqlSession {
public:
    virtual ~SqlSession() = default;

    /**
     * @brief Runs a statement and returns its whole result set.
     *
     * Statements without a result set return no rows.
     */
    virtual Result<std::vector<SqlRow>> query(const std::string& sql) = 0;

    /**
     * @brief Runs a query and hands each row to the callback as it is read.
     *
     * Rows are not buffered; a read error after some rows were delivered is still an error.
     */
    virtual Result<void> streamRows(const std::string& sql, const std::function<void(const SqlRow&)>& onRow) = 0;
};

/**
 * @brief SqlSession over a connected libmysqlclient handle.
 */
class MySQLSession : public SqlSession {
public:
    explicit MySQLSession(MYSQL* conn) : conn(conn) {}

    Result<std::vector<SqlRow>> query(const std::string& sql) override;
    Result<void> streamRows(const std::string& sql, const std::function<void(const SqlRow&)>& onRow) override;

private:
    MYSQL* conn; ///< Borrowed; owned by the connection pool.
};

/**
 * @brief Streams every row of a table into the writer and flushes the remainder.
 */
Result<void> exportTableRows(SqlSession& session, const std::string& table, InsertBatchWriter& writer);

/**
 * @brief Writes the export of one database: schema section, then the rows of every table.
 *
 * @param session Session used for USE, SHOW TABLES, SHOW CREATE TABLE and row streaming.
 * @param database Database to export.
 * @param out Destination stream.
 * @param batchSize INSERT statements buffered per flush.
 * @param logger Receives one line per exported table.
 */
Result<void> writeDatabaseExport(SqlSession& session, const std::string& database, std::ostream& out,
                                 std::size_t batchSize, Logger& logger);

/**
 * @brief Small pool of libmysqlclient connections scoped to one backend operation.
 *
 * Connections are returned to the pool when the last shared_ptr is released. close()
 * drops every idle connection; connections still held are closed when released.
 */
class MySQLConnectionPool : public std::enable_shared_from_this<MySQLConnectionPool> {
public:
    /**
     * @param config Connection settings.
     * @param maxConnections Upper bound on open connections.
     * @param timeout Connect, read and write timeout of every connection.
     */
    MySQLConnectionPool(const DatabaseConfig& config, std::size_t maxConnections, std::chrono::seconds timeout);
    ~MySQLConnectionPool();

    MySQLConnectionPool(const MySQLConnectionPool&) = delete;
    MySQLConnectionPool& operator=(const MySQLConnectionPool&) = delete;

    /**
     * @brief Returns an idle connection or opens a new one.
     *
     * @return Result<std::shared_ptr<MYSQL>> A connected handle or a Database-kind error.
     */
    Result<std::shared_ptr<MYSQL>> acquire();

    /**
     * @brief Closes all idle connections and stops recycling released ones.
     */
    void close();

private:
    Result<MYSQL*> connect();
    std::shared_ptr<MYSQL> wrap(MYSQL* conn);
    void release(MYSQL* conn);

    const DatabaseConfig& config;
    std::size_t maxConnections;
    std::chrono::seconds timeout;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<MYSQL*> idle;
    std::size_t liveConnections = 0;
    bool closed = false;
};

/**
 * @brief MySQL backend streaming rows through libmysqlclient.
 *
 * Each database is written to <database>.sql.
 */
class MySQLNativeDatabase : public DatabaseConnection {
public:
    /**
     * @param config Connection settings, borrowed for the lifetime of the backend.
     * @param context Logger and step deadline.
     * @param batchSize Rows buffered per flush.
     */
    MySQLNativeDatabase(const DatabaseConfig& config, BackendContext context, std::size_t batchSize = 1000);

    ConnectionStatus probe() override;
    std::vector<DatabaseInfo> listDatabases() override;
    std::uint64_t estimateSize() override;
    Result<void> backup(const std::filesystem::path& backupPath) override;
    Result<void> validateConfig(const DatabaseConfig& config) const override;
    std::string_view databaseType() const override { return "mysql-native"; }

    static constexpr double kOverhead = 1.3; ///< One INSERT statement per row.

private:
    std::shared_ptr<MySQLConnectionPool> makePool() const;
    Result<void> exportDatabase(MYSQL* conn, const std::string& database, const std::filesystem::path& outputFile);

    const DatabaseConfig& config;
    BackendContext context;
    std::size_t batchSize;
};

#endif // MYSQL_NATIVE_EXPORT_HPP
