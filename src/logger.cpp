#include "logger.hpp"
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string_view levelLabel(LogLevel level) {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

} // namespace

Logger::Logger(std::string logFile, std::string errorLogFile, bool quiet)
    : logFile(std::move(logFile)), errorLogFile(std::move(errorLogFile)), quiet(quiet) {}

void Logger::info(const std::string& message) {
    log(LogLevel::Info, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    std::string logEntry = fmt::format("[{}] {}: {}", timeBuf, levelLabel(level), message);

    std::lock_guard lock(mutex);
    if (!quiet) {
        if (level == LogLevel::Info) {
            std::cout << logEntry << std::endl;
        } else {
            std::cerr << logEntry << std::endl;
        }
    }

    append(logFile, logEntry);
    if (level != LogLevel::Info) {
        append(errorLogFile, logEntry);
    }
}

void Logger::append(const std::string& path, const std::string& entry) {
    if (path.empty()) {
        return;
    }
    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else if (!quiet) {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}
