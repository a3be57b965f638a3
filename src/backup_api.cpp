#include "backup_api.hpp"
#include "backup.hpp"
#include "connection_factory.hpp"
#include <memory>
#include <utility>

namespace {

/**
 * @brief Runs an operation against a fully wired Backup instance.
 */
template<typename Operation>
auto withBackup(const std::string& configFile, Operation operation) -> decltype(operation(std::declval<Backup&>())) {
    auto config = BackupConfig::load(configFile);
    if (!config) {
        return std::unexpected(config.error());
    }

    auto storage = createStorageSink(config->storage);
    if (!storage) {
        return std::unexpected(storage.error());
    }

    std::unique_ptr<NotificationStrategy> notifier;
    if (config->telegram) {
        notifier = std::make_unique<TelegramNotificationStrategy>(*config->telegram);
    }

    Logger logger(config->logFile, config->errorLogFile);
    PosixProcessRunner runner;
    Backup backup(std::move(*config), logger, runner, std::move(*storage), std::move(notifier));
    return operation(backup);
}

} // namespace

Result<std::string> BackupAPI::startBackup(const std::string& configFile) {
    return withBackup(configFile, [](Backup& backup) { return backup.execute(); });
}

Result<void> BackupAPI::checkConnections(const std::string& configFile) {
    return withBackup(configFile, [](Backup& backup) { return backup.checkConnections(); });
}

std::vector<std::string_view> BackupAPI::supportedTypes() {
    return DatabaseConnectionFactory::supportedTypes();
}
