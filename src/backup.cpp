#include "backup.hpp"
#include <format>
#include <stdexcept>
#include "backup_time.hpp"
#include "mode_resolver.hpp"

BackupService::BackupService(BackupServiceOptions options,
                             std::unique_ptr<StorageBackend> backend,
                             std::shared_ptr<UsageAccounting> usage,
                             std::shared_ptr<BackupLog> log,
                             std::unique_ptr<ArchiveBuilder> archiveBuilder,
                             std::shared_ptr<RestoreHandler> restoreHandler)
    : options(std::move(options)),
      backend(std::move(backend)),
      usageStore(std::move(usage)),
      logger(std::move(log)),
      archiveBuilder(std::move(archiveBuilder)),
      restoreHandler(std::move(restoreHandler)) {
    if (!this->backend || !usageStore || !logger || !this->archiveBuilder) {
        throw std::invalid_argument("BackupService requires a backend, usage accounting, a log and an archive builder");
    }
    if (!this->options.clock) {
        this->options.clock = [] { return std::chrono::system_clock::now(); };
    }
}

std::unique_ptr<BackupService> BackupService::create(const BackupConfig& config,
                                                     const ObjectStoreClientFactory& clientFactory,
                                                     std::shared_ptr<UsageAccounting> usage,
                                                     std::shared_ptr<BackupLog> log) {
    auto archiveBuilder = std::make_unique<ZipArchiveBuilder>();
    auto resolution = resolveStorage(config, clientFactory, archiveBuilder->mimeType(), log);

    BackupServiceOptions options;
    options.databasePath = config.databasePath;
    options.stagingDir = config.stagingDir;

    auto service = std::make_unique<BackupService>(std::move(options), std::move(resolution.backend),
                                                   std::move(usage), std::move(log), std::move(archiveBuilder));
    service->configError = std::move(resolution.configError);
    return service;
}

std::shared_ptr<std::mutex> BackupService::ownerLock(const std::string& ownerId) {
    std::lock_guard<std::mutex> lock(ownerLocksMutex);
    auto& entry = ownerLocks[ownerId];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void BackupService::releaseOwnerLock(const std::string& ownerId, std::shared_ptr<std::mutex> lock) {
    std::lock_guard<std::mutex> guard(ownerLocksMutex);
    auto it = ownerLocks.find(ownerId);
    // The map and this reference are the only holders when nobody is waiting.
    if (it != ownerLocks.end() && it->second == lock && lock.use_count() == 2) {
        ownerLocks.erase(it);
    }
}

std::size_t BackupService::trackedOwnerLocks() const {
    std::lock_guard<std::mutex> guard(ownerLocksMutex);
    return ownerLocks.size();
}

std::expected<std::uint64_t, BackupError> BackupService::runBackup(const std::string& ownerId) {
    std::error_code ec;
    if (!fs::is_regular_file(options.databasePath, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::SourceMissing,
                                           std::format("Database file ({}) not found",
                                                       options.databasePath.filename().string())});
    }

    const std::string fileName = archiveFileName(options.clock(), archiveBuilder->extension());
    StagedFile staging(options.stagingDir / ownerId / fileName, true);

    if (auto built = archiveBuilder->build(options.databasePath, staging.path()); !built) {
        return std::unexpected(built.error());
    }

    const auto size = fs::file_size(staging.path(), ec);
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to stat {}: {}", staging.path().string(), ec.message())});
    }
    logger->logMessage(std::format("[Backup] Archive created. Size: {} bytes", size));

    auto stored = backend->put(ownerId, staging.path());
    if (!stored) {
        return std::unexpected(stored.error());
    }

    usageStore->setOwnerStorageUsage(ownerId, stored->sizeBytes);
    return stored->sizeBytes;
}

BackupOutcome BackupService::createBackup(const std::string& ownerId) {
    logger->logMessage(std::format("[Backup] Starting backup for owner: {}", ownerId));
    try {
        std::expected<std::uint64_t, BackupError> result;
        if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
            result = std::unexpected(valid.error());
        } else {
            auto lock = ownerLock(ownerId);
            try {
                std::lock_guard<std::mutex> guard(*lock);
                result = runBackup(ownerId);
            } catch (const std::exception&) {
                releaseOwnerLock(ownerId, std::move(lock));
                throw;
            }
            releaseOwnerLock(ownerId, std::move(lock));
        }
        if (!result) {
            const BackupError& error = result.error();
            logger->logError(std::format("[Backup] Backup failed for owner {}: {}", ownerId, describe(error)));
            std::string message = error.message;
            if (error.code == BackupErrorCode::BackendProvisioningError) {
                message = "Remote storage provisioning failed: " + message;
            }
            return BackupOutcome{false, 0, std::move(message)};
        }

        logger->logMessage(std::format("[Backup] Backup completed for owner {} ({} bytes)", ownerId, *result));
        return BackupOutcome{true, *result, std::format("Backup successful ({})", toString(mode()))};
    } catch (const std::exception& e) {
        logger->logError(std::format("[Backup] Backup failed for owner {}: {}", ownerId, e.what()));
        return BackupOutcome{false, 0, e.what()};
    }
}

std::vector<BackupRecord> BackupService::listBackups(const std::string& ownerId) {
    try {
        auto records = backend->list(ownerId);
        if (!records) {
            logger->logError(std::format("[Backup] Error listing {} backups for owner {}: {}",
                                       toString(mode()), ownerId, describe(records.error())));
            return {};
        }
        return std::move(*records);
    } catch (const std::exception& e) {
        logger->logError(std::format("[Backup] Error listing {} backups for owner {}: {}", toString(mode()), ownerId, e.what()));
        return {};
    }
}

bool BackupService::restoreBackup(const std::string& ownerId, const std::string& backupId) {
    try {
        auto source = backend->fetch(ownerId, backupId, options.stagingDir);
        if (!source) {
            logger->logError(std::format("[Restore] Cannot resolve backup {} for owner {}: {}",
                                       backupId, ownerId, describe(source.error())));
            return false;
        }

        auto entry = archiveBuilder->verify(source->path());
        if (!entry) {
            logger->logError(std::format("[Restore] Backup {} for owner {} is unusable: {}",
                                       backupId, ownerId, describe(entry.error())));
            return false;
        }

        if (!restoreHandler) {
            logger->logMessage(std::format("[Restore] Source {} ({}) is ready; replacing the live database "
                                         "requires draining its connections first",
                                         source->path().string(), *entry));
            return true;
        }

        if (auto applied = restoreHandler->apply(ownerId, source->path()); !applied) {
            logger->logError(std::format("[Restore] Applying backup {} for owner {} failed: {}",
                                       backupId, ownerId, describe(applied.error())));
            return false;
        }
        logger->logMessage(std::format("[Restore] Backup {} applied for owner {}", backupId, ownerId));
        return true;
    } catch (const std::exception& e) {
        logger->logError(std::format("[Restore] Restore of {} for owner {} failed: {}", backupId, ownerId, e.what()));
        return false;
    }
}

std::future<BackupOutcome> BackupService::createBackupAsync(std::string ownerId) {
    return std::async(std::launch::async, [this, ownerId = std::move(ownerId)] { return createBackup(ownerId); });
}

std::future<std::vector<BackupRecord>> BackupService::listBackupsAsync(std::string ownerId) {
    return std::async(std::launch::async, [this, ownerId = std::move(ownerId)] { return listBackups(ownerId); });
}

std::future<bool> BackupService::restoreBackupAsync(std::string ownerId, std::string backupId) {
    return std::async(std::launch::async, [this, ownerId = std::move(ownerId), backupId = std::move(backupId)] {
        return restoreBackup(ownerId, backupId);
    });
}
