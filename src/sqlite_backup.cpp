#include "sqlite_backup.hpp"
#include "logger.hpp"
#include <sqlite3.h>
#include <thread>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string connectionError(sqlite3* db, int rc) {
    return db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
}

/**
 * @brief Opens a database file read-only without taking the connection mutex.
 */
Result<sqlite3*> openReadOnly(const fs::path& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = connectionError(db, rc);
        sqlite3_close(db);
        return std::unexpected(BackupError::database(
            fmt::format("Failed to open SQLite database {}: {}", path.string(), msg)));
    }
    return db;
}

std::optional<std::string> queryVersion(const fs::path& path) {
    auto db = openReadOnly(path);
    if (!db) {
        return std::nullopt;
    }
    std::optional<std::string> version;
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(*db, "SELECT sqlite_version()", -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        version = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    sqlite3_close(*db);
    return version;
}

} // namespace

SQLiteDatabase::SQLiteDatabase(const DatabaseConfig& config, BackendContext context, OnlineCopyOptions options)
    : config(config), context(std::move(context)), options(options) {}

fs::path SQLiteDatabase::databasePath(const std::string& name) const {
    return fs::path(config.host) / name;
}

Result<OnlineCopyStats> SQLiteDatabase::copyDatabaseFile(const fs::path& sourcePath, const fs::path& destPath) const {
    if (!fs::exists(sourcePath)) {
        return std::unexpected(BackupError::database(fmt::format("Database file not found: {}", sourcePath.string())));
    }

    auto source = openReadOnly(sourcePath);
    if (!source) {
        return std::unexpected(source.error());
    }

    std::error_code ec;
    fs::remove(destPath, ec);

    sqlite3* dest = nullptr;
    int rc = sqlite3_open_v2(destPath.c_str(), &dest, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = connectionError(dest, rc);
        sqlite3_close(*source);
        sqlite3_close(dest);
        fs::remove(destPath, ec);
        return std::unexpected(BackupError::database(
            fmt::format("Failed to open destination SQLite database {}: {}", destPath.string(), msg)));
    }

    // Closes source before destination; returns the first close failure.
    auto closeBoth = [&]() -> std::optional<std::string> {
        std::optional<std::string> failure;
        if (sqlite3_close(*source) != SQLITE_OK) {
            failure = fmt::format("Failed to close source connection: {}", sqlite3_errmsg(*source));
        }
        if (sqlite3_close(dest) != SQLITE_OK && !failure) {
            failure = fmt::format("Failed to close destination connection: {}", sqlite3_errmsg(dest));
        }
        return failure;
    };

    auto fail = [&](std::string message) -> Result<OnlineCopyStats> {
        closeBoth();
        std::error_code removeEc;
        fs::remove(destPath, removeEc);
        return std::unexpected(BackupError::database(std::move(message)));
    };

    sqlite3_backup* backup = sqlite3_backup_init(dest, "main", *source, "main");
    if (!backup) {
        return fail(fmt::format("Failed to initialize backup of {}: {}", sourcePath.string(), sqlite3_errmsg(dest)));
    }

    OnlineCopyStats stats;
    for (;;) {
        rc = sqlite3_backup_step(backup, options.pagesPerStep);
        ++stats.steps;
        stats.totalPages = sqlite3_backup_pagecount(backup);
        if (rc == SQLITE_DONE) {
            break;
        }
        if (rc != SQLITE_OK && rc != SQLITE_BUSY && rc != SQLITE_LOCKED) {
            sqlite3_backup_finish(backup);
            return fail(fmt::format("Failed to execute backup of {}: {}", sourcePath.string(), sqlite3_errstr(rc)));
        }
        if (options.stepSleep.count() > 0) {
            std::this_thread::sleep_for(options.stepSleep);
        }
    }

    rc = sqlite3_backup_finish(backup);
    if (rc != SQLITE_OK) {
        return fail(fmt::format("Failed to finish backup of {}: {}", sourcePath.string(), sqlite3_errmsg(dest)));
    }

    if (auto closeFailure = closeBoth()) {
        return std::unexpected(BackupError::database(*closeFailure));
    }
    return stats;
}

ConnectionStatus SQLiteDatabase::probe() {
    for (const auto& name : config.databases) {
        auto db = openReadOnly(databasePath(name));
        if (!db) {
            return ConnectionStatus::error(db.error().what());
        }
        sqlite3_close(*db);
    }
    return ConnectionStatus::connected();
}

std::vector<DatabaseInfo> SQLiteDatabase::listDatabases() {
    std::vector<DatabaseInfo> info;
    for (const auto& name : config.databases) {
        fs::path path = databasePath(name);
        DatabaseInfo entry{name, std::nullopt, std::nullopt};
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec) {
            context.logger.warn(fmt::format("Failed to get size of SQLite database {}: {}", path.string(), ec.message()));
        } else {
            entry.size = size;
            entry.schemaVersion = queryVersion(path);
            if (!entry.schemaVersion) {
                context.logger.warn(fmt::format("Failed to get SQLite version for {}", path.string()));
            }
        }
        info.push_back(std::move(entry));
    }
    return info;
}

std::uint64_t SQLiteDatabase::estimateSize() {
    std::uint64_t total = 0;
    for (const auto& name : config.databases) {
        std::error_code ec;
        auto size = fs::file_size(databasePath(name), ec);
        if (!ec) {
            total += size;
        }
    }
    // The online copy keeps the page format, so no overhead applies.
    return total;
}

Result<void> SQLiteDatabase::backup(const fs::path& backupPath) {
    std::error_code ec;
    fs::create_directories(backupPath, ec);
    if (ec) {
        return std::unexpected(BackupError::io(fmt::format("create directory {}", backupPath.string()), ec));
    }

    for (const auto& name : config.databases) {
        fs::path destPath = backupPath / fmt::format("{}.bak", name);
        auto stats = copyDatabaseFile(databasePath(name), destPath);
        if (!stats) {
            return std::unexpected(stats.error());
        }
        context.logger.info(fmt::format("SQLite database {} copied to {} ({} pages in {} steps)",
                                        name, destPath.string(), stats->totalPages, stats->steps));
    }
    return {};
}

Result<void> SQLiteDatabase::validateConfig(const DatabaseConfig& config) const {
    if (config.host.empty()) {
        return std::unexpected(BackupError::config("SQLite host (directory path) cannot be empty"));
    }
    if (config.databases.empty()) {
        return std::unexpected(BackupError::config("At least one database file must be specified"));
    }
    fs::path hostPath(config.host);
    std::error_code ec;
    if (!fs::is_directory(hostPath, ec)) {
        return std::unexpected(BackupError::config(fmt::format("SQLite host directory does not exist: {}", config.host)));
    }
    for (const auto& name : config.databases) {
        fs::path dbPath = hostPath / name;
        if (!fs::exists(dbPath, ec)) {
            return std::unexpected(BackupError::config(fmt::format("SQLite database file does not exist: {}", dbPath.string())));
        }
    }
    return {};
}
