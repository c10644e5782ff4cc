/**
 * @file object_storage_backend.hpp
 * @brief Remote object storage backend for LedgerVault.
 *
 * Archives are stored under the key <ownerId>/<filename> inside one container
 * shared by every owner. The container is provisioned lazily on first write.
 */

#ifndef OBJECT_STORAGE_BACKEND_HPP
#define OBJECT_STORAGE_BACKEND_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include "backup_log.hpp"
#include "object_store_client.hpp"
#include "storage_backend.hpp"

/**
 * @brief Stores backups in a remote object storage container.
 */
class ObjectStorageBackend : public StorageBackend {
public:
    /**
     * @brief Constructs a backend over an object store client.
     *
     * @param client Client for the remote service; must not be null.
     * @param config Container name, size ceiling and listing page size.
     * @param mimeType Content type of the stored archives.
     * @param log Shared log sink.
     * @throws std::invalid_argument If client is null.
     */
    ObjectStorageBackend(std::unique_ptr<ObjectStoreClient> client,
                         RemoteStorageConfig config,
                         std::string mimeType,
                         std::shared_ptr<BackupLog> log);

    DeploymentMode mode() const override { return DeploymentMode::Cloud; }

    /**
     * @brief Makes sure the named container exists, creating it if missing.
     *
     * The container is created private, with the configured object size
     * ceiling and an allow-list holding only the archive content type. Calling
     * this again once the container exists is a no-op.
     *
     * @param name Container name.
     * @return std::expected<void, BackupError> Success or BackendProvisioningError.
     */
    std::expected<void, BackupError> ensureContainer(const std::string& name);

    /**
     * @brief Uploads the staged archive to <ownerId>/<filename>, overwriting an
     *        object at that exact key, then deletes the staging file.
     */
    std::expected<StoredArchive, BackupError> put(const std::string& ownerId, const fs::path& archivePath) override;

    /**
     * @brief Lists the owner's objects, newest first, one page of at most
     *        list_limit entries.
     */
    std::expected<std::vector<BackupRecord>, BackupError> list(const std::string& ownerId) override;

    /**
     * @brief Downloads <ownerId>/<storedId> into the staging directory.
     *
     * Every call gets its own file, so concurrent restores of one backup do
     * not share a download. The returned file is owned and removed when the
     * handle goes away.
     */
    std::expected<StagedFile, BackupError> fetch(const std::string& ownerId,
                                                 const std::string& storedId,
                                                 const fs::path& stagingDir) override;

    const std::string& container() const { return config.bucket; }

private:
    std::unique_ptr<ObjectStoreClient> client; ///< Remote service client.
    RemoteStorageConfig config;                ///< Container and limits.
    std::string mimeType;                      ///< Archive content type.
    std::shared_ptr<BackupLog> log;            ///< Shared log sink.
    std::atomic<std::uint64_t> downloads{0};   ///< Sequence for restore file names.
};

#endif // OBJECT_STORAGE_BACKEND_HPP
