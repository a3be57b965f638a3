/**
 * @file storage.hpp
 * @brief Storage sinks receiving the archived backup run.
 *
 * A sink packs the run directory into `<backup id>.tar.gz` and places it at its destination.
 */

#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <filesystem>
#include <memory>
#include <string>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "remote_transfer.hpp"

/**
 * @brief Interface for storage sinks.
 */
class StorageSink {
public:
    virtual ~StorageSink() = default;

    /**
     * @brief Archives a run directory and stores the archive.
     *
     * @param runDir Directory holding the artifacts of the run.
     * @param backupId Identifier used as the archive base name.
     * @return Result<std::string> Location of the stored archive, or a Storage-kind error.
     */
    virtual Result<std::string> store(const std::filesystem::path& runDir, const std::string& backupId) = 0;
};

/**
 * @brief Keeps archives in a local directory.
 */
class LocalStorage : public StorageSink {
public:
    explicit LocalStorage(std::filesystem::path basePath);

    Result<std::string> store(const std::filesystem::path& runDir, const std::string& backupId) override;

private:
    std::filesystem::path basePath; ///< Directory receiving the archives.
};

/**
 * @brief Uploads archives to a remote directory over SFTP.
 *
 * The archive is built next to the run directory, uploaded and then removed locally.
 */
class SFTPStorage : public StorageSink {
public:
    SFTPStorage(std::string remoteDir, std::unique_ptr<RemoteTransferStrategy> transfer);

    Result<std::string> store(const std::filesystem::path& runDir, const std::string& backupId) override;

private:
    std::string remoteDir;                             ///< Remote target directory.
    std::unique_ptr<RemoteTransferStrategy> transfer;  ///< Upload channel.
};

/**
 * @brief Creates the sink described by the storage configuration.
 *
 * @param config Storage settings ("local" or "sftp").
 * @return Result<std::unique_ptr<StorageSink>> The sink or a Config-kind error.
 */
Result<std::unique_ptr<StorageSink>> createStorageSink(const StorageConfig& config);

#endif // STORAGE_HPP
