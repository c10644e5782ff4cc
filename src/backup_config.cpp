#include "backup_config.hpp"
#include <cstdlib>
#include <format>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

std::optional<std::string> optionalString(const Json::Value& parent, const char* name) {
    const Json::Value& value = parent[name];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        throw std::runtime_error(std::format("Config value '{}' must be a string", name));
    }
    std::string text = value.asString();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::string stringOr(const Json::Value& parent, const char* name, const std::string& fallback) {
    return optionalString(parent, name).value_or(fallback);
}

Json::Value::UInt64 unsignedOr(const Json::Value& parent, const char* name, Json::Value::UInt64 fallback) {
    const Json::Value& value = parent[name];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isUInt64()) {
        throw std::runtime_error(std::format("Config value '{}' must be a non-negative integer", name));
    }
    return value.asUInt64();
}

} // namespace

BackupConfig::BackupConfig(const std::string& configFile) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    load(configJson);
    applyEnvironmentOverrides();
}

BackupConfig::BackupConfig(const Json::Value& configJson) {
    load(configJson);
}

void BackupConfig::load(const Json::Value& configJson) {
    if (!configJson.isObject()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    databasePath = stringOr(configJson, "database_path", databasePath);
    backupRoot = stringOr(configJson, "backup_root", backupRoot);
    stagingDir = stringOr(configJson, "staging_dir", stagingDir);
    logDir = stringOr(configJson, "log_dir", logDir);
    usageLedger = stringOr(configJson, "usage_ledger", usageLedger);

    const Json::Value& remoteJson = configJson["remote"];
    if (remoteJson.isNull()) {
        return;
    }
    if (!remoteJson.isObject()) {
        throw std::runtime_error("Config value 'remote' must be an object");
    }
    remote.url = optionalString(remoteJson, "url");
    remote.key = optionalString(remoteJson, "key");
    remote.bucket = stringOr(remoteJson, "bucket", remote.bucket);
    const auto timeoutSeconds = unsignedOr(remoteJson, "timeout_seconds", remote.timeoutSeconds);
    if (timeoutSeconds > static_cast<Json::Value::UInt64>(std::numeric_limits<long>::max())) {
        throw std::runtime_error(std::format("Config value 'timeout_seconds' is out of range: {}", timeoutSeconds));
    }
    const auto listLimit = unsignedOr(remoteJson, "list_limit", remote.listLimit);
    if (listLimit > static_cast<Json::Value::UInt64>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::format("Config value 'list_limit' is out of range: {}", listLimit));
    }
    remote.timeoutSeconds = static_cast<long>(timeoutSeconds);
    remote.maxObjectSize = unsignedOr(remoteJson, "max_object_size", remote.maxObjectSize);
    remote.listLimit = static_cast<int>(listLimit);
    if (remote.timeoutSeconds <= 0 || remote.listLimit <= 0) {
        throw std::runtime_error("Config values 'timeout_seconds' and 'list_limit' must be positive");
    }
}

void BackupConfig::applyEnvironmentOverrides() {
    if (const char* url = std::getenv("LEDGERVAULT_STORAGE_URL"); url && *url) {
        remote.url = url;
    }
    if (const char* key = std::getenv("LEDGERVAULT_STORAGE_KEY"); key && *key) {
        remote.key = key;
    }
}
