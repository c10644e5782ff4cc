#include "mode_resolver.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include "local_storage_backend.hpp"
#include "object_storage_backend.hpp"

bool hasRecognizedScheme(std::string_view url) {
    auto startsWithIgnoreCase = [url](std::string_view prefix) {
        return url.size() > prefix.size() &&
               std::equal(prefix.begin(), prefix.end(), url.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
               });
    };
    return startsWithIgnoreCase("http://") || startsWithIgnoreCase("https://");
}

std::expected<DeploymentMode, BackupError> decideMode(const RemoteStorageConfig& remote) {
    const bool hasUrl = remote.url && !remote.url->empty();
    const bool hasKey = remote.key && !remote.key->empty();

    if (!hasUrl && !hasKey) {
        return DeploymentMode::Local;
    }
    if (!hasUrl || !hasKey) {
        return std::unexpected(BackupError{BackupErrorCode::ConfigError,
                                           std::format("Remote storage {} is missing", hasUrl ? "key" : "url")});
    }
    if (!hasRecognizedScheme(*remote.url)) {
        return std::unexpected(BackupError{BackupErrorCode::ConfigError,
                                           std::format("Remote storage url is not an http(s) URL: {}", *remote.url)});
    }
    return DeploymentMode::Cloud;
}

StorageResolution resolveStorage(const BackupConfig& config,
                                 const ObjectStoreClientFactory& clientFactory,
                                 const std::string& mimeType,
                                 const std::shared_ptr<BackupLog>& log) {
    StorageResolution resolution;

    auto decided = decideMode(config.remote);
    if (!decided) {
        resolution.configError = decided.error();
    } else if (*decided == DeploymentMode::Cloud) {
        try {
            std::unique_ptr<ObjectStoreClient> client = clientFactory ? clientFactory(config.remote) : nullptr;
            if (!client) {
                resolution.configError = BackupError{BackupErrorCode::ConfigError, "Remote storage client factory returned no client"};
            } else {
                resolution.backend = std::make_unique<ObjectStorageBackend>(std::move(client), config.remote, mimeType, log);
                resolution.mode = DeploymentMode::Cloud;
            }
        } catch (const std::exception& e) {
            resolution.configError = BackupError{BackupErrorCode::ConfigError,
                                                 std::format("Remote storage client construction failed: {}", e.what())};
        }
    }

    if (!resolution.backend) {
        if (resolution.configError) {
            log->logError(std::format("[Backup] {}; falling back to local storage", describe(*resolution.configError)));
        }
        resolution.backend = std::make_unique<LocalStorageBackend>(config.backupRoot, log);
        resolution.mode = DeploymentMode::Local;
    }

    log->logMessage(std::format("[Backup] Storage mode: {}", toString(resolution.mode)));
    return resolution;
}
