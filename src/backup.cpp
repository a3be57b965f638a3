#include "backup.hpp"
#include <ctime>
#include <optional>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Owns a run directory and removes it with everything below it.
 *
 * The staging parent is removed as well once it is empty.
 */
class RunDirectory {
public:
    explicit RunDirectory(fs::path path) : path(std::move(path)) {}
    ~RunDirectory() {
        std::error_code ec;
        fs::remove_all(path, ec);
        fs::remove(path.parent_path(), ec);
    }
    RunDirectory(const RunDirectory&) = delete;
    RunDirectory& operator=(const RunDirectory&) = delete;

    const fs::path& get() const { return path; }

private:
    fs::path path;
};

} // namespace

Backup::Backup(BackupConfig config, Logger& logger, ProcessRunner& runner, std::unique_ptr<StorageSink> storage,
               std::unique_ptr<NotificationStrategy> notifier)
    : config(std::move(config)),
      logger(logger),
      runner(runner),
      storage(std::move(storage)),
      notifier(std::move(notifier)) {}

std::string Backup::makeBackupId(std::chrono::system_clock::time_point when) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&timeT, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &utc);
    return fmt::format("backup-{}", buf);
}

BackendContext Backup::makeContext() const {
    return BackendContext{runner, logger, config.tools,
                          std::chrono::duration_cast<std::chrono::milliseconds>(config.toolTimeout)};
}

Result<std::string> Backup::execute() {
    if (config.noBackends()) {
        return std::unexpected(BackupError::config("No database configurations found"));
    }

    std::string backupId = makeBackupId(std::chrono::system_clock::now());
    fs::path stagingRoot = fs::path(config.backupBase) / ".staging";
    std::error_code ec;
    fs::create_directories(stagingRoot / backupId, ec);
    if (ec) {
        auto error = BackupError::io(fmt::format("Failed to create run directory for {}", backupId), ec);
        logger.error(error.what());
        notify(error.what());
        return std::unexpected(error);
    }
    RunDirectory runDir(stagingRoot / backupId);
    logger.info(fmt::format("Starting backup {}", backupId));

    BackupPerformer performer(config, runDir.get(), makeContext());
    auto report = performer.execute();
    if (!report) {
        auto errorMsg = fmt::format("Backup {} failed: {}", backupId, report.error().what());
        logger.error(errorMsg);
        notify(errorMsg);
        return std::unexpected(report.error());
    }

    auto stored = storage->store(runDir.get(), backupId);
    if (!stored) {
        auto errorMsg = fmt::format("Storing backup {} failed: {}", backupId, stored.error().what());
        logger.error(errorMsg);
        notify(errorMsg);
        return std::unexpected(stored.error());
    }

    std::string successMsg = fmt::format("Backup completed: {} ({})", *stored, fmt::join(report->completed, ", "));
    if (!report->failed.empty()) {
        std::vector<std::string> failedTags;
        for (const auto& [tag, error] : report->failed) {
            failedTags.push_back(tag);
        }
        successMsg += fmt::format(", failed: {}", fmt::join(failedTags, ", "));
    }
    logger.info(successMsg);
    notify(successMsg);
    return *stored;
}

Result<void> Backup::checkConnections() {
    BackupPerformer performer(config, fs::path(config.backupBase), makeContext());
    auto backends = performer.configuredBackends();
    if (backends.empty()) {
        return std::unexpected(BackupError::config("No database configurations found"));
    }

    BackendOptions options{config.sqliteCopy, config.mysqlBatchSize};
    std::optional<BackupError> firstFailure;
    for (const auto& [kind, dbConfig] : backends) {
        auto db = DatabaseConnectionFactory::createConnection(kind, *dbConfig, makeContext(), options);
        auto tag = DatabaseConnectionFactory::kindTag(kind);

        if (auto valid = db->validateConfig(*dbConfig); !valid) {
            logger.error(fmt::format("{}: {}", tag, valid.error().what()));
            if (!firstFailure) {
                firstFailure = valid.error();
            }
            continue;
        }

        auto status = db->probe();
        if (status.isConnected()) {
            logger.info(fmt::format("{}: connected", tag));
            continue;
        }
        auto error = status.state() == ConnectionStatus::State::Error
            ? BackupError::database(fmt::format("Failed to connect to {} database: {}", db->databaseType(), status.message()))
            : BackupError::database(fmt::format("{} database is disconnected", db->databaseType()));
        logger.error(fmt::format("{}: {}", tag, error.what()));
        if (!firstFailure) {
            firstFailure = error;
        }
    }

    if (firstFailure) {
        return std::unexpected(*firstFailure);
    }
    return {};
}

void Backup::notify(const std::string& message) {
    if (!notifier) {
        return;
    }
    if (auto sent = notifier->notify(message); !sent) {
        logger.warn(fmt::format("Notification failed: {}", sent.error().what()));
    }
}
