/**
 * @file backup_log.hpp
 * @brief Timestamped message and error log for the backup subsystem.
 *
 * Messages go to stdout, errors to stderr, and both are appended to files in
 * the configured log directory when one is set. Safe to share between threads.
 */

#ifndef BACKUP_LOG_HPP
#define BACKUP_LOG_HPP

#include <string>
#include <mutex>

/**
 * @brief Log sink used by the backends, the resolver and the orchestrator.
 */
class BackupLog {
public:
    /**
     * @brief Constructs a log writing into the given directory.
     *
     * @param logDir Directory holding backup.log and errors.log. If empty, only
     *               the console is written.
     * @note The directory is created on first use.
     */
    explicit BackupLog(std::string logDir = {});

    /**
     * @brief Logs an informational message.
     *
     * @param message Message to log.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    const std::string& logFile() const { return messageLogPath; }
    const std::string& errorLogFile() const { return errorLogPath; }

private:
    void write(const std::string& path, const std::string& entry, bool error) const;

    std::string messageLogPath; ///< Path to the message log, empty for console only.
    std::string errorLogPath;   ///< Path to the error log, empty for console only.
    mutable std::mutex logMutex;
};

#endif // BACKUP_LOG_HPP
