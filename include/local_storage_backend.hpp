/**
 * @file local_storage_backend.hpp
 * @brief Filesystem backend used when no remote storage is configured.
 *
 * Archives live at <root>/<ownerId>/<filename>.
 */

#ifndef LOCAL_STORAGE_BACKEND_HPP
#define LOCAL_STORAGE_BACKEND_HPP

#include <memory>
#include "backup_log.hpp"
#include "storage_backend.hpp"

/**
 * @brief Stores backups in per-owner directories on local disk.
 */
class LocalStorageBackend : public StorageBackend {
public:
    /**
     * @brief Constructs a local backend rooted at the given directory.
     *
     * @param root Backup root directory; created if missing.
     * @param log Shared log sink.
     * @throws std::filesystem::filesystem_error If the root cannot be created.
     */
    LocalStorageBackend(fs::path root, std::shared_ptr<BackupLog> log);

    DeploymentMode mode() const override { return DeploymentMode::Local; }

    /**
     * @brief Moves the staged archive into <root>/<ownerId>/.
     *
     * The move is a rename, so either the staging file or the stored archive
     * exists afterwards, never both. Across filesystems the archive is copied to
     * a temporary sibling first and renamed into place. An existing archive with
     * the same name is never replaced.
     */
    std::expected<StoredArchive, BackupError> put(const std::string& ownerId, const fs::path& archivePath) override;

    /**
     * @brief Lists regular files in the owner's directory, newest first.
     *
     * A missing owner directory yields an empty list.
     */
    std::expected<std::vector<BackupRecord>, BackupError> list(const std::string& ownerId) override;

    /**
     * @brief Resolves the path of a stored archive without copying it.
     */
    std::expected<StagedFile, BackupError> fetch(const std::string& ownerId,
                                                 const std::string& storedId,
                                                 const fs::path& stagingDir) override;

    const fs::path& root() const { return rootDir; }

private:
    fs::path rootDir;               ///< Backup root directory.
    std::shared_ptr<BackupLog> log; ///< Shared log sink.
};

/**
 * @brief Returns a file's creation time, or its last write time where the
 *        filesystem does not report one.
 *
 * @param path File to inspect.
 * @param ec Set on failure.
 */
std::chrono::system_clock::time_point fileCreationTime(const fs::path& path, std::error_code& ec);

#endif // LOCAL_STORAGE_BACKEND_HPP
