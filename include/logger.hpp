/**
 * @file logger.hpp
 * @brief Line-oriented logging for MailVault.
 *
 * Informational lines go to stdout and the log file, errors to stderr and the
 * error log file. Every line is prefixed with a local timestamp.
 *
 * @note Either file path may be empty, in which case only the console is used.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <chrono>
#include <mutex>
#include <string>

/**
 * @brief Formats a time point in local time with a strftime pattern.
 *
 * @param timePoint Time to format.
 * @param pattern strftime pattern, e.g. "%Y-%m-%d %H:%M:%S".
 * @return std::string Formatted text.
 */
std::string formatLocalTime(std::chrono::system_clock::time_point timePoint, const char* pattern);

/**
 * @brief Thread-safe writer for the message and error logs.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path of the message log (may be empty).
     * @param errorLogFile Path of the error log (may be empty).
     */
    Logger(std::string logFile, std::string errorLogFile);

    /**
     * @brief Logs an informational message.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error, prefixed with "ERROR:".
     */
    void logError(const std::string& message) const;

private:
    void append(const std::string& path, const std::string& entry) const;

    std::string logFile;      ///< Message log path.
    std::string errorLogFile; ///< Error log path.
    mutable std::mutex mutex; ///< Serializes writers from daemon workers.
};

#endif // LOGGER_HPP
