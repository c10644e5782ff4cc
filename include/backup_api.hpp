/**
 * @file backup_api.hpp
 * @brief HTTP-facing API for the LedgerVault backup subsystem.
 *
 * Translates BackupService results into status codes and JSON bodies, the
 * shape the web application's routes return to clients.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <string>
#include <json/json.h>
#include "backup.hpp"

/**
 * @brief Status code and JSON body of an API call.
 */
struct ApiResponse {
    int status = 200;
    Json::Value body;
};

/**
 * @brief API for managing owner backups.
 *
 * Offers the create, list and restore operations, serving as the entry point
 * for the HTTP layer and the command line tool.
 */
class BackupAPI {
public:
    /**
     * @brief Constructs the API over a service.
     *
     * @param service Backup service; must outlive the API.
     */
    explicit BackupAPI(BackupService& service);

    /**
     * @brief Starts a backup for the owner.
     *
     * @param ownerId Authenticated owner.
     * @return ApiResponse 200 {"success","size","message"} or 400 {"message"}.
     */
    ApiResponse createBackup(const std::string& ownerId);

    /**
     * @brief Lists the owner's backups.
     *
     * @param ownerId Authenticated owner.
     * @return ApiResponse 200 with an array of {"id","name","size","created_at"}.
     */
    ApiResponse listBackups(const std::string& ownerId);

    /**
     * @brief Restores one of the owner's backups.
     *
     * @param ownerId Authenticated owner.
     * @param request JSON body carrying a string "backupId".
     * @return ApiResponse 200 or 400 with {"message"}.
     */
    ApiResponse restoreBackup(const std::string& ownerId, const Json::Value& request);

    /**
     * @brief Reports the owner's recorded storage usage.
     *
     * @param ownerId Authenticated owner.
     * @return ApiResponse 200 {"storage_used"}.
     */
    ApiResponse storageUsage(const std::string& ownerId);

    /**
     * @brief Converts a backup record to its JSON representation.
     */
    static Json::Value toJson(const BackupRecord& record);

private:
    BackupService& service;
};

#endif // BACKUP_API_HPP
