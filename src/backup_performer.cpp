#include "backup_performer.hpp"
#include "logger.hpp"
#include <fmt/format.h>

namespace fs = std::filesystem;

BackupPerformer::BackupPerformer(const BackupConfig& config, fs::path backupPath, BackendContext context)
    : config(config), backupPath(std::move(backupPath)), context(std::move(context)) {}

std::vector<std::pair<BackendKind, const DatabaseConfig*>> BackupPerformer::configuredBackends() const {
    std::vector<std::pair<BackendKind, const DatabaseConfig*>> backends;
    if (config.sqlite) {
        backends.emplace_back(BackendKind::SQLite, &*config.sqlite);
    }
    if (config.mysql) {
        auto kind = config.mysqlStrategy == MySQLStrategy::Native ? BackendKind::MySQLNative : BackendKind::MySQL;
        backends.emplace_back(kind, &*config.mysql);
    }
    if (config.postgres) {
        backends.emplace_back(BackendKind::PostgreSQL, &*config.postgres);
    }
    if (config.mongodb) {
        backends.emplace_back(BackendKind::MongoDB, &*config.mongodb);
    }
    return backends;
}

Result<BackupReport> BackupPerformer::execute() {
    auto backends = configuredBackends();
    if (backends.empty()) {
        return std::unexpected(BackupError::config("No database configurations found"));
    }

    BackendOptions options{config.sqliteCopy, config.mysqlBatchSize};
    BackupReport report;
    for (const auto& [kind, dbConfig] : backends) {
        auto tag = std::string(DatabaseConnectionFactory::kindTag(kind));
        context.logger.info(fmt::format("Starting {} backup", tag));
        auto db = DatabaseConnectionFactory::createConnection(kind, *dbConfig, context, options);

        auto result = performBackup(*db, *dbConfig);
        if (result) {
            report.completed.push_back(tag);
            continue;
        }
        if (!config.continueOnError) {
            return std::unexpected(result.error());
        }
        context.logger.error(fmt::format("{} backup failed, continuing: {}", tag, result.error().what()));
        report.failed.emplace_back(tag, result.error());
    }

    if (!report.anyCompleted()) {
        std::string summary;
        for (const auto& [tag, error] : report.failed) {
            summary += fmt::format("{}{}: {}", summary.empty() ? "" : "; ", tag, error.what());
        }
        return std::unexpected(BackupError::backup(fmt::format("No backend completed: {}", summary)));
    }
    return report;
}

Result<void> BackupPerformer::performBackup(DatabaseConnection& db, const DatabaseConfig& dbConfig) {
    const auto dbType = db.databaseType();

    if (auto valid = db.validateConfig(dbConfig); !valid) {
        return valid;
    }

    auto status = db.probe();
    switch (status.state()) {
    case ConnectionStatus::State::Connected:
        context.logger.info(fmt::format("Successfully connected to {} database", dbType));
        break;
    case ConnectionStatus::State::Error:
        return std::unexpected(BackupError::database(
            fmt::format("Failed to connect to {} database: {}", dbType, status.message())));
    case ConnectionStatus::State::Disconnected:
        return std::unexpected(BackupError::database(fmt::format("{} database is disconnected", dbType)));
    }

    auto databases = db.listDatabases();
    context.logger.info(fmt::format("Found {} databases for backup:", databases.size()));
    for (const auto& info : databases) {
        std::string sizeText = info.size ? humanizeBytes(*info.size) : "unknown size";
        if (info.schemaVersion) {
            context.logger.info(fmt::format("  - {} ({}, version {})", info.name, sizeText, *info.schemaVersion));
        } else {
            context.logger.info(fmt::format("  - {} ({})", info.name, sizeText));
        }
    }

    auto estimated = db.estimateSize();
    context.logger.info(fmt::format("Estimated backup size: {} ({} bytes)", humanizeBytes(estimated), estimated));

    context.logger.info(fmt::format("Starting backup for {} databases", dbType));
    if (auto backedUp = db.backup(backupPath); !backedUp) {
        return backedUp;
    }
    context.logger.info(fmt::format("Backup completed successfully for {} databases", dbType));
    return {};
}
