/**
 * @file backup_error.hpp
 * @brief Error taxonomy shared by the LedgerVault backup subsystem.
 *
 * Every internal operation reports failure as a BackupError carried in a
 * std::expected. The orchestrator converts these into outcome values at its
 * public boundary.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <string_view>

/**
 * @brief Category of a backup subsystem failure.
 */
enum class BackupErrorCode {
    SourceMissing,            ///< The database file to snapshot does not exist.
    IOError,                  ///< Disk or stream failure while building or moving an archive.
    BackendProvisioningError, ///< Remote container existence check or creation failed.
    BackendTransferError,     ///< Upload or download failure, including timeouts.
    NotFound,                 ///< Requested backup or owner namespace is absent.
    InvalidArgument,          ///< Owner or backup id is not a single safe path component.
    ConfigError               ///< Remote storage configuration is malformed or unusable.
};

/**
 * @brief A categorized failure with a human readable description.
 */
struct BackupError {
    BackupErrorCode code;
    std::string message;
};

/**
 * @brief Returns a stable name for an error code (e.g. "NotFound").
 */
std::string_view toString(BackupErrorCode code);

/**
 * @brief Formats an error as "<CodeName>: <message>".
 */
std::string describe(const BackupError& error);

#endif // BACKUP_ERROR_HPP
