/**
 * @file mode_resolver.hpp
 * @brief Start-up selection of the storage backend.
 *
 * The decision is made once per process and never re-evaluated. Whenever the
 * remote configuration is unusable the resolver falls back to local storage,
 * but it reports why so operators can notice a misconfigured cloud deployment.
 */

#ifndef MODE_RESOLVER_HPP
#define MODE_RESOLVER_HPP

#include <memory>
#include <optional>
#include <string_view>
#include "backup_config.hpp"
#include "backup_log.hpp"
#include "object_store_client.hpp"
#include "storage_backend.hpp"

/**
 * @brief Outcome of backend selection.
 */
struct StorageResolution {
    DeploymentMode mode = DeploymentMode::Local;
    std::unique_ptr<StorageBackend> backend;
    std::optional<BackupError> configError;  ///< Set when remote settings were present but unusable.
};

/**
 * @brief True if the URL starts with http:// or https:// (scheme is case-insensitive).
 */
bool hasRecognizedScheme(std::string_view url);

/**
 * @brief Decides the deployment mode from remote settings alone.
 *
 * Cloud iff url and key are both present and the url has a recognized scheme.
 *
 * @param remote Remote storage settings.
 * @return std::expected<DeploymentMode, BackupError> The mode, or a ConfigError
 *         describing why partially supplied settings cannot be used.
 */
std::expected<DeploymentMode, BackupError> decideMode(const RemoteStorageConfig& remote);

/**
 * @brief Builds the storage backend for this process.
 *
 * Falls back to a LocalStorageBackend when the remote settings are absent or
 * malformed, or when the client factory throws or returns null.
 *
 * @param config Full configuration.
 * @param clientFactory Factory for the remote client.
 * @param mimeType Content type of the archives stored remotely.
 * @param log Shared log sink.
 * @return StorageResolution The active backend plus any configuration error.
 * @throws std::filesystem::filesystem_error If the local backup root cannot be created.
 */
StorageResolution resolveStorage(const BackupConfig& config,
                                 const ObjectStoreClientFactory& clientFactory,
                                 const std::string& mimeType,
                                 const std::shared_ptr<BackupLog>& log);

#endif // MODE_RESOLVER_HPP
