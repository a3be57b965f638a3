/**
 * @file connection_factory.hpp
 * @brief Maps backend type tags to constructed DatabaseConnection instances.
 *
 * The set of backends is closed: adding one means extending BackendKind, whose switch in
 * createConnection() is checked for exhaustiveness by the compiler.
 */

#ifndef CONNECTION_FACTORY_HPP
#define CONNECTION_FACTORY_HPP

#include <memory>
#include <string_view>
#include <vector>
#include "database_connection.hpp"

/**
 * @brief Supported backend variants.
 */
enum class BackendKind {
    SQLite,
    MySQL,
    MySQLNative,
    PostgreSQL,
    MongoDB
};

/**
 * @brief Per-variant tuning passed through the factory.
 */
struct BackendOptions {
    OnlineCopyOptions sqliteCopy;      ///< SQLite online copy tuning.
    std::size_t mysqlBatchSize = 1000; ///< Native MySQL export batch size.
};

/**
 * @brief Factory for database connections.
 */
class DatabaseConnectionFactory {
public:
    /**
     * @brief Creates a backend from its type tag.
     *
     * @param dbType One of supportedTypes().
     * @param config Connection settings, borrowed for the lifetime of the backend.
     * @param context Shared collaborators.
     * @param options Per-variant tuning.
     * @return Result<std::unique_ptr<DatabaseConnection>> The backend, or a Database-kind error
     *         naming an unsupported tag.
     */
    static Result<std::unique_ptr<DatabaseConnection>> createConnection(std::string_view dbType,
                                                                        const DatabaseConfig& config,
                                                                        const BackendContext& context,
                                                                        const BackendOptions& options = {});

    /**
     * @brief Creates a backend of a known kind.
     */
    static std::unique_ptr<DatabaseConnection> createConnection(BackendKind kind,
                                                                const DatabaseConfig& config,
                                                                const BackendContext& context,
                                                                const BackendOptions& options = {});

    /**
     * @brief Parses a type tag.
     *
     * @return Result<BackendKind> The kind, or a Database-kind error naming the tag.
     */
    static Result<BackendKind> parseKind(std::string_view dbType);

    /**
     * @brief Returns the tag of a backend kind.
     */
    static std::string_view kindTag(BackendKind kind);

    /**
     * @brief Returns every supported type tag.
     */
    static std::vector<std::string_view> supportedTypes();
};

#endif // CONNECTION_FACTORY_HPP
