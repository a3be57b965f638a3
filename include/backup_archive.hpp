/**
 * @file backup_archive.hpp
 * @brief Packs a completed backup directory into a single tar.gz artifact.
 *
 * @note Requires libarchive.
 */

#ifndef BACKUP_ARCHIVE_HPP
#define BACKUP_ARCHIVE_HPP

#include <cstddef>
#include <filesystem>
#include "backup_error.hpp"

/**
 * @brief Writes every file and directory below sourceDir into a tar.gz archive.
 *
 * Entry names are relative to sourceDir. The output is removed if writing fails.
 *
 * @param sourceDir Directory to archive.
 * @param outputFile Archive to create, replaced if it exists.
 * @return Result<void> Success or a Backup-kind error.
 */
Result<void> compressDirectory(const std::filesystem::path& sourceDir, const std::filesystem::path& outputFile);

/**
 * @brief Checks that an archive can be read back completely.
 *
 * @param archiveFile Archive to read.
 * @return Result<std::size_t> Number of entries, or a Backup-kind error.
 */
Result<std::size_t> verifyArchive(const std::filesystem::path& archiveFile);

#endif // BACKUP_ARCHIVE_HPP
