/**
 * @file backup_config.hpp
 * @brief Configuration management for the LedgerVault backup subsystem.
 *
 * Defines the configuration structures for the database snapshot source, the
 * local backup root, staging and logging locations, and the optional remote
 * object storage service.
 *
 * @note Configuration is loaded from a JSON file. The remote URL and key may be
 * overridden with the LEDGERVAULT_STORAGE_URL and LEDGERVAULT_STORAGE_KEY
 * environment variables.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <json/json.h>

/**
 * @brief Settings for the remote object storage service.
 *
 * The remote mode is only selected when both url and key are present; see
 * resolveStorage().
 */
struct RemoteStorageConfig {
    std::optional<std::string> url;               ///< Service base URL (e.g. "https://project.supabase.co").
    std::optional<std::string> key;               ///< Service access key.
    std::string bucket = "backups";               ///< Container holding every owner's archives.
    long timeoutSeconds = 30;                     ///< Upper bound for every remote call.
    std::uint64_t maxObjectSize = 52428800;       ///< Object size ceiling (50 MiB).
    int listLimit = 100;                          ///< Page size for listings.
};

/**
 * @brief Configuration class for the backup subsystem.
 *
 * Loads settings from a JSON document, applying defaults for missing keys.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration with every setting at its default.
     */
    BackupConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Loads settings from the specified file, applies defaults, then applies
     * environment overrides for the remote URL and key.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is missing or cannot be parsed.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration from an already parsed JSON document.
     *
     * No environment overrides are applied.
     *
     * @param configJson Parsed configuration.
     * @throws std::runtime_error If a value has the wrong type.
     */
    explicit BackupConfig(const Json::Value& configJson);

    /**
     * @brief Replaces the remote URL and key with LEDGERVAULT_STORAGE_URL and
     *        LEDGERVAULT_STORAGE_KEY when those are set and non-empty.
     */
    void applyEnvironmentOverrides();

    std::string databasePath = "./database.db";       ///< Database file to snapshot.
    std::string backupRoot = "./backups/";            ///< Root of the local backend.
    std::string stagingDir = "./staging/";            ///< Staging archives and restore downloads.
    std::string logDir = "./logs/";                   ///< Directory for backup.log and errors.log.
    std::string usageLedger = "./backups/usage.json"; ///< Owner storage-usage ledger.
    RemoteStorageConfig remote;                       ///< Remote object storage settings.

private:
    void load(const Json::Value& configJson);
};

#endif // BACKUP_CONFIG_HPP
