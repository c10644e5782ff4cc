/**
 * @file backup.hpp
 * @brief Backup orchestration for LedgerVault.
 *
 * BackupService is the public face of the backup subsystem. It snapshots the
 * tenant database with an ArchiveBuilder, hands the archive to whichever
 * StorageBackend the mode resolver selected, and records the owner's storage
 * usage. Its public operations never throw: failures are reported as outcome
 * values and logged.
 *
 * @note Ensure libarchive, libcurl and jsoncpp are installed.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "archive_builder.hpp"
#include "backup_config.hpp"
#include "backup_log.hpp"
#include "object_store_client.hpp"
#include "storage_backend.hpp"
#include "usage_ledger.hpp"

/**
 * @brief Uniform result of CreateBackup.
 */
struct BackupOutcome {
    bool success = false;
    std::uint64_t sizeBytes = 0;
    std::string message;
};

/**
 * @brief Extension point for swapping a restored snapshot into the live database.
 *
 * The core only identifies the archive and makes it available as a verified
 * local file. Replacing the running database requires the application to drain
 * its connections first, so that step belongs to the handler.
 */
class RestoreHandler {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~RestoreHandler() = default;

    /**
     * @brief Applies a verified archive.
     *
     * The archive file may be removed as soon as this returns.
     *
     * @param ownerId Owner the backup belongs to.
     * @param archivePath Local path of the verified archive.
     * @return std::expected<void, BackupError> Success or an error.
     */
    virtual std::expected<void, BackupError> apply(const std::string& ownerId, const fs::path& archivePath) = 0;
};

/**
 * @brief Root settings of a BackupService.
 */
struct BackupServiceOptions {
    fs::path databasePath;  ///< Database file to snapshot.
    fs::path stagingDir;    ///< Staging archives and restore downloads.
    std::function<std::chrono::system_clock::time_point()> clock = [] { return std::chrono::system_clock::now(); };
};

/**
 * @brief Coordinates archive creation, the active storage backend and usage accounting.
 *
 * Backups of the same owner are serialized; different owners never wait on
 * each other.
 */
class BackupService {
public:
    /**
     * @brief Constructs a service from explicit collaborators.
     *
     * @param options Database and staging locations.
     * @param backend Active storage backend; must not be null.
     * @param usage Usage-accounting collaborator; must not be null.
     * @param log Shared log sink; must not be null.
     * @param archiveBuilder Archive format; defaults to zip.
     * @param restoreHandler Optional live-restore handler.
     * @throws std::invalid_argument If a required collaborator is null.
     */
    BackupService(BackupServiceOptions options,
                  std::unique_ptr<StorageBackend> backend,
                  std::shared_ptr<UsageAccounting> usage,
                  std::shared_ptr<BackupLog> log,
                  std::unique_ptr<ArchiveBuilder> archiveBuilder = std::make_unique<ZipArchiveBuilder>(),
                  std::shared_ptr<RestoreHandler> restoreHandler = nullptr);

    /**
     * @brief Builds a service from configuration, resolving the deployment mode once.
     *
     * @param config Loaded configuration.
     * @param clientFactory Factory for the remote client.
     * @param usage Usage-accounting collaborator.
     * @param log Shared log sink.
     * @return std::unique_ptr<BackupService> The service. A remote configuration
     *         problem is available through configurationError().
     * @throws std::filesystem::filesystem_error If the local backup root cannot be created.
     */
    static std::unique_ptr<BackupService> create(const BackupConfig& config,
                                                 const ObjectStoreClientFactory& clientFactory,
                                                 std::shared_ptr<UsageAccounting> usage,
                                                 std::shared_ptr<BackupLog> log);

    /**
     * @brief Snapshots the database into the owner's namespace.
     *
     * On success the owner's recorded usage becomes the archive size.
     *
     * @param ownerId Tenant identifier.
     * @return BackupOutcome {true, size, "Backup successful (<mode>)"} or {false, 0, reason}.
     */
    BackupOutcome createBackup(const std::string& ownerId);

    /**
     * @brief Lists the owner's backups, newest first.
     *
     * Backend failures are logged and reported as an empty list.
     *
     * @param ownerId Tenant identifier.
     * @return std::vector<BackupRecord> Records, possibly empty.
     */
    std::vector<BackupRecord> listBackups(const std::string& ownerId);

    /**
     * @brief Resolves and verifies a backup for restore.
     *
     * Downloads are removed on every exit path. If a RestoreHandler is
     * installed it receives the verified archive.
     *
     * @param ownerId Tenant identifier.
     * @param backupId Stored id from listBackups().
     * @return bool True if the archive was resolved, verified and applied.
     */
    bool restoreBackup(const std::string& ownerId, const std::string& backupId);

    /**
     * @brief Asynchronous variants; the service must outlive the returned futures.
     */
    std::future<BackupOutcome> createBackupAsync(std::string ownerId);
    std::future<std::vector<BackupRecord>> listBackupsAsync(std::string ownerId);
    std::future<bool> restoreBackupAsync(std::string ownerId, std::string backupId);

    DeploymentMode mode() const { return backend->mode(); }

    /**
     * @brief Remote configuration problem found at start-up, if any.
     */
    const std::optional<BackupError>& configurationError() const { return configError; }

    UsageAccounting& usage() { return *usageStore; }
    const BackupLog& log() const { return *logger; }

    /**
     * @brief Number of owners with a live backup lock entry; zero when idle.
     */
    std::size_t trackedOwnerLocks() const;

private:
    std::expected<std::uint64_t, BackupError> runBackup(const std::string& ownerId);
    std::shared_ptr<std::mutex> ownerLock(const std::string& ownerId);
    void releaseOwnerLock(const std::string& ownerId, std::shared_ptr<std::mutex> lock);

    BackupServiceOptions options;                   ///< Database and staging locations.
    std::unique_ptr<StorageBackend> backend;        ///< Active backend, fixed for the process.
    std::shared_ptr<UsageAccounting> usageStore;    ///< Usage collaborator.
    std::shared_ptr<BackupLog> logger;              ///< Shared log sink.
    std::unique_ptr<ArchiveBuilder> archiveBuilder; ///< Archive format.
    std::shared_ptr<RestoreHandler> restoreHandler; ///< Optional live-restore step.
    std::optional<BackupError> configError;         ///< Start-up configuration problem.

    mutable std::mutex ownerLocksMutex;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> ownerLocks;
};

#endif // BACKUP_HPP
