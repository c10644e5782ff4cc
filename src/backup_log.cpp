#include "backup_log.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <system_error>

namespace fs = std::filesystem;

BackupLog::BackupLog(std::string logDir) {
    if (!logDir.empty()) {
        messageLogPath = (fs::path(logDir) / "backup.log").string();
        errorLogPath = (fs::path(logDir) / "errors.log").string();
    }
}

void BackupLog::logMessage(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex);
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    std::string logEntry = std::format("[{}] {}", timeBuf, message);

    std::println("{}", logEntry);
    write(messageLogPath, logEntry, false);
}

void BackupLog::logError(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex);
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    std::string logEntry = std::format("[{}] ERROR: {}", timeBuf, message);

    std::println(stderr, "{}", logEntry);
    write(errorLogPath, logEntry, true);
}

void BackupLog::write(const std::string& path, const std::string& entry, bool error) const {
    if (path.empty()) {
        return;
    }

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to {}log file: {}", error ? "error " : "", path);
    }
}
