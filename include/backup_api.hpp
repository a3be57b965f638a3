/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the KronVault backup system.
 *
 * Loads the JSON configuration, wires the logger, process runner, storage sink and
 * notification channel, and runs the requested operation.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <string>
#include <string_view>
#include <vector>
#include "backup_error.hpp"

/**
 * @brief API for managing backups in KronVault.
 */
class BackupAPI {
public:
    /**
     * @brief Runs a full backup using the given configuration file.
     *
     * @param configFile Path to the JSON configuration file.
     * @return Result<std::string> Location of the stored archive or an error.
     */
    static Result<std::string> startBackup(const std::string& configFile);

    /**
     * @brief Validates and probes every configured backend.
     *
     * @param configFile Path to the JSON configuration file.
     * @return Result<void> Success or the first failure.
     */
    static Result<void> checkConnections(const std::string& configFile);

    /**
     * @brief Returns the backend tags accepted by the connection factory.
     */
    static std::vector<std::string_view> supportedTypes();
};

#endif // BACKUP_API_HPP
