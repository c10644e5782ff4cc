/**
 * @file storage_backend.hpp
 * @brief Storage backend capability shared by the cloud and local variants.
 *
 * A backend owns its storage medium and scopes every operation by owner id.
 * The orchestrator only mediates between the archive builder and whichever
 * backend the mode resolver selected at start-up.
 */

#ifndef STORAGE_BACKEND_HPP
#define STORAGE_BACKEND_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "backup_error.hpp"

namespace fs = std::filesystem;

/**
 * @brief Process-wide choice of backend, fixed at start-up.
 */
enum class DeploymentMode {
    Cloud,
    Local
};

/**
 * @brief Returns "cloud" or "local".
 */
std::string_view toString(DeploymentMode mode);

/**
 * @brief One backup as reported by a backend listing.
 */
struct BackupRecord {
    std::string id;                                  ///< Backend-specific stored id (the archive filename).
    std::string name;                                ///< Display name.
    std::uint64_t sizeBytes = 0;                     ///< Archive size in bytes.
    std::chrono::system_clock::time_point createdAt; ///< Creation time reported by the backend.
};

/**
 * @brief Result of persisting an archive into a backend.
 */
struct StoredArchive {
    std::string storedId;        ///< Id under which the archive can be fetched again.
    std::uint64_t sizeBytes = 0; ///< Size of the stored archive.
};

/**
 * @brief Move-only handle on a local file, optionally removed on destruction.
 *
 * Staging archives and restore downloads are owned and disappear on every exit
 * path. Archives that already live in their final location are borrowed.
 */
class StagedFile {
public:
    StagedFile() = default;
    StagedFile(fs::path path, bool owned) : filePath(std::move(path)), isOwned(owned) {}
    ~StagedFile();

    StagedFile(StagedFile&& other) noexcept;
    StagedFile& operator=(StagedFile&& other) noexcept;
    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const fs::path& path() const { return filePath; }
    bool owned() const { return isOwned; }

    /**
     * @brief Removes the file now if owned. Safe to call more than once.
     */
    void reset();

private:
    fs::path filePath;
    bool isOwned = false;
};

/**
 * @brief Interface for backup storage backends.
 *
 * Implementations must confine every operation to the owner's namespace.
 */
class StorageBackend {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~StorageBackend() = default;

    /**
     * @brief Reports which deployment mode this backend implements.
     */
    virtual DeploymentMode mode() const = 0;

    /**
     * @brief Persists a staged archive under the owner's namespace.
     *
     * The staging file does not survive a successful call: it is either moved
     * into place or deleted after upload.
     *
     * @param ownerId Tenant identifier.
     * @param archivePath Path to the staged archive; its filename is preserved.
     * @return std::expected<StoredArchive, BackupError> Stored id and size, or an error.
     */
    virtual std::expected<StoredArchive, BackupError> put(const std::string& ownerId, const fs::path& archivePath) = 0;

    /**
     * @brief Lists the owner's backups, newest first.
     *
     * @param ownerId Tenant identifier.
     * @return std::expected<std::vector<BackupRecord>, BackupError> Records, empty if the owner has none.
     */
    virtual std::expected<std::vector<BackupRecord>, BackupError> list(const std::string& ownerId) = 0;

    /**
     * @brief Makes a stored archive available as a local file.
     *
     * @param ownerId Tenant identifier.
     * @param storedId Id returned by put() or list().
     * @param stagingDir Directory for temporary downloads, if the backend needs one.
     * @return std::expected<StagedFile, BackupError> The local file, or NotFound.
     */
    virtual std::expected<StagedFile, BackupError> fetch(const std::string& ownerId,
                                                         const std::string& storedId,
                                                         const fs::path& stagingDir) = 0;
};

/**
 * @brief Checks that a value can be used as a single path or key component.
 *
 * Rejects empty values, "." and "..", path separators and NUL characters.
 *
 * @param value Owner id or stored id to check.
 * @param what Name used in the error message (e.g. "owner id").
 * @return std::expected<void, BackupError> Success or InvalidArgument.
 */
std::expected<void, BackupError> validatePathComponent(std::string_view value, std::string_view what);

/**
 * @brief Sorts records newest first, breaking ties by id descending.
 */
void sortNewestFirst(std::vector<BackupRecord>& records);

#endif // STORAGE_BACKEND_HPP
