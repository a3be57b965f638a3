/**
 * @file sqlite_backup.hpp
 * @brief SQLite backend performing an online page-level copy.
 *
 * The source file is opened read-only and copied with the SQLite online backup API a bounded
 * number of pages at a time, sleeping between steps so writers on the source are never blocked
 * for the whole copy. Each configured file <name> is written to <name>.bak.
 *
 * @note Requires libsqlite3.
 */

#ifndef SQLITE_BACKUP_HPP
#define SQLITE_BACKUP_HPP

#include <filesystem>
#include "database_connection.hpp"

/**
 * @brief Page counters of a completed online copy.
 */
struct OnlineCopyStats {
    int totalPages = 0; ///< Pages in the source database.
    int steps = 0;      ///< Backup steps performed.
};

/**
 * @brief SQLite backend.
 *
 * Files are processed in configuration order; the first hard failure stops the loop and is
 * returned. Artifacts already written for earlier files are kept.
 */
class SQLiteDatabase : public DatabaseConnection {
public:
    /**
     * @brief Constructs a SQLite backend.
     *
     * @param config host is the directory holding the database files.
     * @param context Logger and shared collaborators.
     * @param options Pages per step and pause between steps.
     */
    SQLiteDatabase(const DatabaseConfig& config, BackendContext context, OnlineCopyOptions options = {});

    ConnectionStatus probe() override;
    std::vector<DatabaseInfo> listDatabases() override;
    std::uint64_t estimateSize() override;
    Result<void> backup(const std::filesystem::path& backupPath) override;
    Result<void> validateConfig(const DatabaseConfig& config) const override;
    std::string_view databaseType() const override { return "sqlite"; }

    /**
     * @brief Copies one database file with the online backup API.
     *
     * Both connections are closed, source first, on success and on failure. A failed copy
     * removes the incomplete destination file.
     *
     * @param sourcePath Database file to copy.
     * @param destPath Destination file, replaced if it exists.
     * @return Result<OnlineCopyStats> Page counters or a Database-kind error.
     */
    Result<OnlineCopyStats> copyDatabaseFile(const std::filesystem::path& sourcePath,
                                             const std::filesystem::path& destPath) const;

private:
    std::filesystem::path databasePath(const std::string& name) const;

    const DatabaseConfig& config;
    BackendContext context;
    OnlineCopyOptions options;
};

#endif // SQLITE_BACKUP_HPP
