#include "connection_factory.hpp"
#include "database_backup.hpp"
#include "mysql_native_export.hpp"
#include "sqlite_backup.hpp"
#include <array>
#include <fmt/format.h>

namespace {

constexpr std::array<BackendKind, 5> kAllKinds = {
    BackendKind::SQLite, BackendKind::MySQL, BackendKind::MySQLNative, BackendKind::PostgreSQL, BackendKind::MongoDB,
};

} // namespace

std::string_view DatabaseConnectionFactory::kindTag(BackendKind kind) {
    switch (kind) {
    case BackendKind::SQLite:
        return "sqlite";
    case BackendKind::MySQL:
        return "mysql";
    case BackendKind::MySQLNative:
        return "mysql-native";
    case BackendKind::PostgreSQL:
        return "postgres";
    case BackendKind::MongoDB:
        return "mongodb";
    }
    return "unknown";
}

Result<BackendKind> DatabaseConnectionFactory::parseKind(std::string_view dbType) {
    for (BackendKind kind : kAllKinds) {
        if (kindTag(kind) == dbType) {
            return kind;
        }
    }
    return std::unexpected(BackupError::database(fmt::format("Unsupported database type: {}", dbType)));
}

std::unique_ptr<DatabaseConnection> DatabaseConnectionFactory::createConnection(BackendKind kind,
                                                                                const DatabaseConfig& config,
                                                                                const BackendContext& context,
                                                                                const BackendOptions& options) {
    switch (kind) {
    case BackendKind::SQLite:
        return std::make_unique<SQLiteDatabase>(config, context, options.sqliteCopy);
    case BackendKind::MySQL:
        return std::make_unique<MySQLDatabase>(config, context);
    case BackendKind::MySQLNative:
        return std::make_unique<MySQLNativeDatabase>(config, context, options.mysqlBatchSize);
    case BackendKind::PostgreSQL:
        return std::make_unique<PostgreSQLDatabase>(config, context);
    case BackendKind::MongoDB:
        return std::make_unique<MongoDatabase>(config, context);
    }
    return nullptr;
}

Result<std::unique_ptr<DatabaseConnection>> DatabaseConnectionFactory::createConnection(std::string_view dbType,
                                                                                        const DatabaseConfig& config,
                                                                                        const BackendContext& context,
                                                                                        const BackendOptions& options) {
    auto kind = parseKind(dbType);
    if (!kind) {
        return std::unexpected(kind.error());
    }
    return createConnection(*kind, config, context, options);
}

std::vector<std::string_view> DatabaseConnectionFactory::supportedTypes() {
    std::vector<std::string_view> types;
    for (BackendKind kind : kAllKinds) {
        types.push_back(kindTag(kind));
    }
    return types;
}
