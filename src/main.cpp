#include "backup_api.hpp"
#include <fmt/core.h>
#include <string>

namespace {

void printUsage(const char* program) {
    fmt::print(stderr, "Usage: {} {{backup|check|types}} [--config <path>]\n", program);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string configFile = "kronvault.json";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else {
            fmt::print(stderr, "Error: Unexpected argument: {}\n", arg);
            printUsage(argv[0]);
            return 1;
        }
    }

    if (command == "types") {
        for (auto type : BackupAPI::supportedTypes()) {
            fmt::print("{}\n", type);
        }
        return 0;
    }

    if (command == "check") {
        auto result = BackupAPI::checkConnections(configFile);
        if (!result) {
            fmt::print(stderr, "Error: {}\n", result.error().what());
            return 1;
        }
        fmt::print("All configured databases are reachable.\n");
        return 0;
    }

    if (command == "backup") {
        auto result = BackupAPI::startBackup(configFile);
        if (!result) {
            fmt::print(stderr, "Error: {}\n", result.error().what());
            return 1;
        }
        fmt::print("Backup completed successfully: {}\n", *result);
        return 0;
    }

    printUsage(argv[0]);
    return 1;
}
