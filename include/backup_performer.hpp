/**
 * @file backup_performer.hpp
 * @brief Runs every configured backend through the backup sequence.
 *
 * Backends are processed strictly one at a time in a fixed order (SQLite, MySQL, PostgreSQL,
 * MongoDB) and all write into one shared destination directory. For each backend the performer
 * validates the configuration, probes connectivity, lists databases, logs the size estimate and
 * runs the backup.
 */

#ifndef BACKUP_PERFORMER_HPP
#define BACKUP_PERFORMER_HPP

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "backup_config.hpp"
#include "connection_factory.hpp"

/**
 * @brief Per-backend outcome of a run.
 */
struct BackupReport {
    std::vector<std::string> completed;                        ///< Tags of backends that finished.
    std::vector<std::pair<std::string, BackupError>> failed;   ///< Tags and errors of failed backends.

    bool anyCompleted() const { return !completed.empty(); }
};

/**
 * @brief Backup orchestrator.
 */
class BackupPerformer {
public:
    /**
     * @brief Constructs a performer.
     *
     * @param config Run configuration, borrowed for the lifetime of the performer.
     * @param backupPath Destination directory shared by all backends.
     * @param context Collaborators handed to every backend.
     */
    BackupPerformer(const BackupConfig& config, std::filesystem::path backupPath, BackendContext context);

    /**
     * @brief Backs up every configured backend.
     *
     * Fails with a Config-kind error, before any I/O, if no backend is configured. By default
     * the first backend failure is returned immediately; with continue_on_error the remaining
     * backends still run and the call fails only if none completed.
     *
     * @return Result<BackupReport> Outcome of every backend that ran.
     */
    Result<BackupReport> execute();

    /**
     * @brief Drives one backend through validate, probe, list, estimate and backup.
     *
     * @param db Backend to run.
     * @param dbConfig Its configuration.
     * @return Result<void> Success or the failure that aborted this backend.
     */
    Result<void> performBackup(DatabaseConnection& db, const DatabaseConfig& dbConfig);

    /**
     * @brief Returns the configured backends as (kind, config) pairs in processing order.
     */
    std::vector<std::pair<BackendKind, const DatabaseConfig*>> configuredBackends() const;

private:
    const BackupConfig& config;
    std::filesystem::path backupPath;
    BackendContext context;
};

#endif // BACKUP_PERFORMER_HPP
