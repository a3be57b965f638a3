/**
 * @file backup_error.hpp
 * @brief Error taxonomy shared by every KronVault component.
 *
 * All fallible operations return Result<T>, a std::expected carrying either the value
 * or a BackupError tagged with the subsystem that failed.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <string_view>
#include <expected>
#include <system_error>

/**
 * @brief Category of a failure.
 */
enum class ErrorKind {
    Config,   ///< Bad, missing or malformed input.
    Database, ///< Connectivity, query or dump-tool failure.
    Storage,  ///< Artifact placement failure.
    Backup,   ///< Archive creation failure.
    Io,       ///< Filesystem or process I/O failure.
    Restore   ///< Reserved.
};

/**
 * @brief Typed error value carried by Result<T>.
 */
class BackupError {
public:
    BackupError(ErrorKind kind, std::string message);

    static BackupError config(std::string message) { return {ErrorKind::Config, std::move(message)}; }
    static BackupError database(std::string message) { return {ErrorKind::Database, std::move(message)}; }
    static BackupError storage(std::string message) { return {ErrorKind::Storage, std::move(message)}; }
    static BackupError backup(std::string message) { return {ErrorKind::Backup, std::move(message)}; }
    static BackupError io(std::string message) { return {ErrorKind::Io, std::move(message)}; }

    /**
     * @brief Builds an Io-kind error from a system error code.
     *
     * @param context Operation that failed (e.g. "create directory /tmp/x").
     * @param ec Error code reported by the OS or std::filesystem.
     */
    static BackupError io(std::string_view context, const std::error_code& ec);

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    /**
     * @brief Returns the user-facing display text, e.g. "Database error: pg_dump failed".
     */
    std::string what() const;

private:
    ErrorKind kind_;
    std::string message_;
};

/**
 * @brief Human readable label of an error kind ("Configuration", "I/O", ...).
 */
std::string_view errorKindLabel(ErrorKind kind);

template <typename T>
using Result = std::expected<T, BackupError>;

#endif // BACKUP_ERROR_HPP
