/**
 * @file logger.hpp
 * @brief Progress and diagnostic logging for KronVault.
 *
 * Every line is timestamped, echoed to the console and appended to the configured
 * log files. Informational lines go to the main log, warnings and errors to the error log.
 *
 * @note Missing log directories are created on first write.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>

/**
 * @brief Severity of a log line.
 */
enum class LogLevel {
    Info,
    Warning,
    Error
};

/**
 * @brief Console and file logger.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path of the main log file. Empty disables file output.
     * @param errorLogFile Path of the error log file. Empty disables file output.
     * @param quiet If true, nothing is echoed to the console.
     */
    Logger(std::string logFile = "", std::string errorLogFile = "", bool quiet = false);

    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    /**
     * @brief Writes a message with the given severity.
     */
    void log(LogLevel level, const std::string& message);

private:
    void append(const std::string& path, const std::string& entry);

    std::string logFile;      ///< Main log file.
    std::string errorLogFile; ///< Error log file.
    bool quiet;               ///< Suppresses console output.
    std::mutex mutex;         ///< Serializes writes.
};

#endif // LOGGER_HPP
