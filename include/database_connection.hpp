/**
 * @file database_connection.hpp
 * @brief Capability contract shared by every database backend.
 *
 * A DatabaseConnection lets the orchestrator drive structurally different database systems
 * through one sequence: validate, probe, list, estimate and back up. Instances are created
 * fresh per run by DatabaseConnectionFactory and borrow their DatabaseConfig read-only.
 */

#ifndef DATABASE_CONNECTION_HPP
#define DATABASE_CONNECTION_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>
#include "backup_config.hpp"
#include "backup_error.hpp"

class Logger;
class ProcessRunner;

/**
 * @brief Metadata of one logical database, gathered during the listing pass.
 */
struct DatabaseInfo {
    std::string name;                          ///< Logical database name.
    std::optional<std::uint64_t> size;         ///< Size in bytes, if it could be obtained.
    std::optional<std::string> schemaVersion;  ///< Server or engine version, if it could be obtained.
};

/**
 * @brief Outcome of a connectivity probe.
 */
class ConnectionStatus {
public:
    enum class State {
        Connected,
        Disconnected,
        Error
    };

    static ConnectionStatus connected() { return ConnectionStatus(State::Connected, {}); }
    static ConnectionStatus disconnected() { return ConnectionStatus(State::Disconnected, {}); }
    static ConnectionStatus error(std::string message) { return ConnectionStatus(State::Error, std::move(message)); }

    State state() const { return state_; }
    bool isConnected() const { return state_ == State::Connected; }

    /**
     * @brief Failure description; empty unless state() is Error.
     */
    const std::string& message() const { return message_; }

private:
    ConnectionStatus(State state, std::string message) : state_(state), message_(std::move(message)) {}

    State state_;
    std::string message_;
};

/**
 * @brief Collaborators handed to every backend instance.
 */
struct BackendContext {
    ProcessRunner& runner;                   ///< Executes external client and dump tools.
    Logger& logger;                          ///< Receives progress and diagnostic lines.
    ToolPaths tools;                         ///< External tool locations.
    std::chrono::milliseconds toolTimeout{std::chrono::hours(1)}; ///< Deadline of each external step.
};

/**
 * @brief Interface implemented by every supported database backend.
 */
class DatabaseConnection {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~DatabaseConnection() = default;

    /**
     * @brief Checks that the backend is reachable.
     *
     * Never fails the run by itself: any failure is reported as an Error status.
     *
     * @return ConnectionStatus Result of the probe.
     */
    virtual ConnectionStatus probe() = 0;

    /**
     * @brief Gathers size and version of every configured database.
     *
     * One entry is returned per configured name, in configuration order. Fields that
     * could not be obtained are left empty and a warning is logged.
     *
     * @return std::vector<DatabaseInfo> One entry per configured database.
     */
    virtual std::vector<DatabaseInfo> listDatabases() = 0;

    /**
     * @brief Predicts the on-disk footprint of the backup artifacts.
     *
     * Query failures reduce the estimate rather than failing.
     *
     * @return std::uint64_t Estimated size in bytes.
     */
    virtual std::uint64_t estimateSize() = 0;

    /**
     * @brief Backs up every configured database into a directory.
     *
     * The directory is created if absent. Safe to call without a prior probe().
     *
     * @param backupPath Destination directory shared by all backends of the run.
     * @return Result<void> Success or the first hard failure.
     */
    virtual Result<void> backup(const std::filesystem::path& backupPath) = 0;

    /**
     * @brief Checks configuration preconditions without side effects.
     *
     * @param config Configuration to check.
     * @return Result<void> Success or a Config-kind error.
     */
    virtual Result<void> validateConfig(const DatabaseConfig& config) const = 0;

    /**
     * @brief Factory tag of this backend ("sqlite", "mysql", ...).
     */
    virtual std::string_view databaseType() const = 0;
};

/**
 * @brief Applies a backend overhead multiplier to a raw byte count.
 */
std::uint64_t applyOverhead(std::uint64_t rawBytes, double multiplier);

/**
 * @brief Formats a byte count for log output, e.g. "1.5 MiB".
 */
std::string humanizeBytes(std::uint64_t bytes);

#endif // DATABASE_CONNECTION_HPP
