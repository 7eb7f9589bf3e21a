#include "logger.hpp"
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

std::string formatLocalTime(std::chrono::system_clock::time_point timePoint, const char* pattern) {
    auto timeT = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timeBuf[64];
    auto length = std::strftime(timeBuf, sizeof(timeBuf), pattern, &tmLocal);
    return std::string(timeBuf, length);
}

Logger::Logger(std::string logFile, std::string errorLogFile)
    : logFile(std::move(logFile)), errorLogFile(std::move(errorLogFile)) {}

void Logger::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", formatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"), message);

    std::lock_guard<std::mutex> lock(mutex);
    std::println("{}", logEntry);
    append(logFile, logEntry);
}

void Logger::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", formatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S"), message);

    std::lock_guard<std::mutex> lock(mutex);
    std::println(stderr, "{}", logEntry);
    append(errorLogFile, logEntry);
}

void Logger::append(const std::string& path, const std::string& entry) const {
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
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}
