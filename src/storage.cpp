#include "storage.hpp"
#include "backup_archive.hpp"
#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string archiveName(const std::string& backupId) {
    return backupId + ".tar.gz";
}

// Builds the archive and reads it back; a broken archive is removed.
Result<void> packArchive(const fs::path& runDir, const fs::path& archive) {
    if (auto packed = compressDirectory(runDir, archive); !packed) {
        return std::unexpected(BackupError::storage(packed.error().message()));
    }
    if (auto verified = verifyArchive(archive); !verified) {
        std::error_code ec;
        fs::remove(archive, ec);
        return std::unexpected(BackupError::storage(
            fmt::format("Backup verification failed: {}", verified.error().message())));
    }
    return {};
}

} // namespace

LocalStorage::LocalStorage(fs::path basePath) : basePath(std::move(basePath)) {}

Result<std::string> LocalStorage::store(const fs::path& runDir, const std::string& backupId) {
    std::error_code ec;
    fs::create_directories(basePath, ec);
    if (ec) {
        return std::unexpected(BackupError::storage(
            fmt::format("Failed to create storage directory {}: {}", basePath.string(), ec.message())));
    }

    fs::path target = basePath / archiveName(backupId);
    fs::path partial = target;
    partial += ".partial";

    if (auto packed = packArchive(runDir, partial); !packed) {
        return std::unexpected(packed.error());
    }
    fs::rename(partial, target, ec);
    if (ec) {
        auto error = BackupError::storage(
            fmt::format("Failed to move archive to {}: {}", target.string(), ec.message()));
        fs::remove(partial, ec);
        return std::unexpected(std::move(error));
    }
    return target.string();
}

SFTPStorage::SFTPStorage(std::string remoteDir, std::unique_ptr<RemoteTransferStrategy> transfer)
    : remoteDir(std::move(remoteDir)), transfer(std::move(transfer)) {}

Result<std::string> SFTPStorage::store(const fs::path& runDir, const std::string& backupId) {
    fs::path localArchive = runDir.parent_path() / archiveName(backupId);
    if (auto packed = packArchive(runDir, localArchive); !packed) {
        return std::unexpected(packed.error());
    }

    auto sent = transfer->transfer(localArchive, remoteDir);
    std::error_code ec;
    fs::remove(localArchive, ec);
    if (!sent) {
        return std::unexpected(sent.error());
    }
    return fmt::format("{}/{}", remoteDir, localArchive.filename().string());
}

Result<std::unique_ptr<StorageSink>> createStorageSink(const StorageConfig& config) {
    if (config.type == "local") {
        return std::make_unique<LocalStorage>(config.path);
    }
    if (config.type == "sftp") {
        return std::make_unique<SFTPStorage>(config.remoteDir, std::make_unique<SFTPTransferStrategy>(config));
    }
    return std::unexpected(BackupError::config(fmt::format("Unsupported storage type: {}", config.type)));
}
