#include "backup_error.hpp"
#include <fmt/format.h>

BackupError::BackupError(ErrorKind kind, std::string message)
    : kind_(kind), message_(std::move(message)) {}

BackupError BackupError::io(std::string_view context, const std::error_code& ec) {
    return {ErrorKind::Io, fmt::format("{}: {}", context, ec.message())};
}

std::string BackupError::what() const {
    return fmt::format("{} error: {}", errorKindLabel(kind_), message_);
}

std::string_view errorKindLabel(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Config:
        return "Configuration";
    case ErrorKind::Database:
        return "Database";
    case ErrorKind::Storage:
        return "Storage";
    case ErrorKind::Backup:
        return "Backup";
    case ErrorKind::Io:
        return "I/O";
    case ErrorKind::Restore:
        return "Restore";
    }
    return "Unknown";
}
