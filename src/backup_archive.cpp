#include "backup_archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <system_error>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

Result<void> writeFileData(struct archive* a, const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(BackupError::backup(fmt::format("Failed to open file: {}", path.string())));
    }
    char buf[8192];
    while (file) {
        file.read(buf, sizeof(buf));
        auto count = file.gcount();
        if (count > 0 && archive_write_data(a, buf, static_cast<size_t>(count)) < 0) {
            return std::unexpected(BackupError::backup(
                fmt::format("Failed to write {} to archive: {}", path.string(), archiveError(a))));
        }
    }
    if (file.bad()) {
        return std::unexpected(BackupError::backup(fmt::format("Failed to read file: {}", path.string())));
    }
    return {};
}

Result<void> writeEntries(struct archive* a, const fs::path& sourceDir) {
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(sourceDir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        const fs::path& path = it->path();
        std::string name = fs::relative(path, sourceDir).generic_string();
        bool isDirectory = it->is_directory();
        if (!isDirectory && !it->is_regular_file()) {
            continue;
        }

        struct archive_entry* ae = archive_entry_new();
        archive_entry_set_pathname(ae, name.c_str());
        if (isDirectory) {
            archive_entry_set_filetype(ae, AE_IFDIR);
            archive_entry_set_perm(ae, 0755);
            archive_entry_set_size(ae, 0);
        } else {
            archive_entry_set_filetype(ae, AE_IFREG);
            archive_entry_set_perm(ae, 0644);
            archive_entry_set_size(ae, static_cast<la_int64_t>(it->file_size()));
        }
        auto mtime = fs::last_write_time(path, ec);
        if (!ec) {
            auto sysTime = std::chrono::file_clock::to_sys(mtime);
            archive_entry_set_mtime(ae, std::chrono::system_clock::to_time_t(sysTime), 0);
        }

        if (archive_write_header(a, ae) != ARCHIVE_OK) {
            std::string msg = fmt::format("Failed to write header for {}: {}", name, archiveError(a));
            archive_entry_free(ae);
            return std::unexpected(BackupError::backup(std::move(msg)));
        }
        archive_entry_free(ae);

        if (!isDirectory) {
            if (auto written = writeFileData(a, path); !written) {
                return written;
            }
        }
    }
    if (ec) {
        return std::unexpected(BackupError::backup(fmt::format("Failed to walk {}: {}", sourceDir.string(), ec.message())));
    }
    return {};
}

} // namespace

Result<void> compressDirectory(const fs::path& sourceDir, const fs::path& outputFile) {
    std::error_code ec;
    if (!fs::is_directory(sourceDir, ec)) {
        return std::unexpected(BackupError::backup(fmt::format("Backup directory does not exist: {}", sourceDir.string())));
    }
    if (outputFile.has_parent_path()) {
        fs::create_directories(outputFile.parent_path(), ec);
        if (ec) {
            return std::unexpected(BackupError::backup(
                fmt::format("Failed to create {}: {}", outputFile.parent_path().string(), ec.message())));
        }
    }

    struct archive* a = archive_write_new();
    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);
    if (archive_write_open_filename(a, outputFile.c_str()) != ARCHIVE_OK) {
        std::string errorMsg = fmt::format("Failed to open archive file: {} (error: {})", outputFile.string(), archiveError(a));
        archive_write_free(a);
        return std::unexpected(BackupError::backup(std::move(errorMsg)));
    }

    auto written = writeEntries(a, sourceDir);
    bool closed = archive_write_close(a) == ARCHIVE_OK;
    std::string closeError = closed ? "" : archiveError(a);
    archive_write_free(a);

    if (!written || !closed) {
        fs::remove(outputFile, ec);
        if (!written) {
            return written;
        }
        return std::unexpected(BackupError::backup(fmt::format("Failed to finish tar archive: {}", closeError)));
    }
    return {};
}

Result<std::size_t> verifyArchive(const fs::path& archiveFile) {
    struct archive* a = archive_read_new();
    archive_read_support_filter_gzip(a);
    archive_read_support_format_tar(a);
    if (archive_read_open_filename(a, archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        std::string errorMsg = fmt::format("Failed to open archive for verification: {} (error: {})",
                                           archiveFile.string(), archiveError(a));
        archive_read_free(a);
        return std::unexpected(BackupError::backup(std::move(errorMsg)));
    }

    struct archive_entry* entry;
    std::size_t entries = 0;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        if (archive_read_data_skip(a) != ARCHIVE_OK) {
            rc = ARCHIVE_FATAL;
            break;
        }
        ++entries;
    }

    std::string errorMsg = rc == ARCHIVE_EOF ? "" : fmt::format("Corrupt archive {}: {}", archiveFile.string(),
                                                                archiveError(a));
    archive_read_close(a);
    archive_read_free(a);
    if (!errorMsg.empty()) {
        return std::unexpected(BackupError::backup(std::move(errorMsg)));
    }
    return entries;
}
