/**
 * @file backup.hpp
 * @brief Top-level backup run for KronVault.
 *
 * Ties the backup engine to its surroundings: a run directory named after the backup id,
 * the orchestrator writing every backend's artifacts into it, the storage sink receiving the
 * archived run, and the optional notification channel.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <chrono>
#include <memory>
#include <string>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_performer.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "process_runner.hpp"
#include "storage.hpp"

/**
 * @brief One configured backup run.
 */
class Backup {
public:
    /**
     * @brief Constructs a backup run.
     *
     * @param config Run configuration.
     * @param logger Logger shared with the backends.
     * @param runner Process runner used by the dump-tool backends.
     * @param storage Sink receiving the archive.
     * @param notifier Optional notification channel, may be null.
     */
    Backup(BackupConfig config, Logger& logger, ProcessRunner& runner, std::unique_ptr<StorageSink> storage,
           std::unique_ptr<NotificationStrategy> notifier = nullptr);

    /**
     * @brief Executes the backup.
     *
     * Backs up every configured backend into a fresh run directory below backup_base, hands
     * the directory to the storage sink and removes it afterwards. Success and failure are
     * reported through the notification channel.
     *
     * @return Result<std::string> Location of the stored archive or the error that ended the run.
     */
    Result<std::string> execute();

    /**
     * @brief Validates and probes every configured backend without backing anything up.
     *
     * All backends are checked; the first failure is returned.
     *
     * @return Result<void> Success or the first failure.
     */
    Result<void> checkConnections();

    /**
     * @brief Returns the backup id for a point in time, `backup-YYYYmmddTHHMMSS` in UTC.
     */
    static std::string makeBackupId(std::chrono::system_clock::time_point when);

private:
    /**
     * @brief Sends a notification; failures are logged only.
     */
    void notify(const std::string& message);

    BackendContext makeContext() const;

    BackupConfig config;                                ///< Run configuration.
    Logger& logger;                                     ///< Shared logger.
    ProcessRunner& runner;                              ///< Subprocess runner.
    std::unique_ptr<StorageSink> storage;               ///< Archive destination.
    std::unique_ptr<NotificationStrategy> notifier;     ///< Notification channel.
};

#endif // BACKUP_HPP
