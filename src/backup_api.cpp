#include "backup_api.hpp"
#include <format>
#include "backup_time.hpp"

namespace {

ApiResponse message(int status, const std::string& text) {
    ApiResponse response;
    response.status = status;
    response.body["message"] = text;
    return response;
}

ApiResponse internalError(const BackupLog& log, const std::string& operation, const std::exception& e) {
    log.logError(std::format("[API] {} failed unexpectedly: {}", operation, e.what()));
    return message(500, "Internal server error");
}

} // namespace

BackupAPI::BackupAPI(BackupService& service) : service(service) {}

Json::Value BackupAPI::toJson(const BackupRecord& record) {
    Json::Value json;
    json["id"] = record.id;
    json["name"] = record.name;
    json["size"] = Json::Value::UInt64(record.sizeBytes);
    json["created_at"] = formatIso8601(record.createdAt);
    return json;
}

ApiResponse BackupAPI::createBackup(const std::string& ownerId) {
    try {
        BackupOutcome outcome = service.createBackup(ownerId);
        if (!outcome.success) {
            return message(400, outcome.message);
        }
        ApiResponse response;
        response.body["success"] = true;
        response.body["size"] = Json::Value::UInt64(outcome.sizeBytes);
        response.body["message"] = outcome.message;
        return response;
    } catch (const std::exception& e) {
        return internalError(service.log(), "createBackup", e);
    }
}

ApiResponse BackupAPI::listBackups(const std::string& ownerId) {
    try {
        ApiResponse response;
        response.body = Json::Value(Json::arrayValue);
        for (const auto& record : service.listBackups(ownerId)) {
            response.body.append(toJson(record));
        }
        return response;
    } catch (const std::exception& e) {
        return internalError(service.log(), "listBackups", e);
    }
}

ApiResponse BackupAPI::restoreBackup(const std::string& ownerId, const Json::Value& request) {
    try {
        if (!request.isObject() || !request["backupId"].isString() || request["backupId"].asString().empty()) {
            return message(400, "backupId is required");
        }
        if (!service.restoreBackup(ownerId, request["backupId"].asString())) {
            return message(400, "Restore failed");
        }
        return message(200, "Restore initiated");
    } catch (const std::exception& e) {
        return internalError(service.log(), "restoreBackup", e);
    }
}

ApiResponse BackupAPI::storageUsage(const std::string& ownerId) {
    try {
        ApiResponse response;
        response.body["storage_used"] = Json::Value::UInt64(service.usage().getOwnerStorageUsage(ownerId));
        return response;
    } catch (const std::exception& e) {
        return internalError(service.log(), "storageUsage", e);
    }
}
