#include "object_storage_backend.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include "backup_time.hpp"

namespace {

BackupError transferError(const std::string& what, const ObjectStoreError& error) {
    return BackupError{BackupErrorCode::BackendTransferError, std::format("{}: {}", what, error.message)};
}

} // namespace

ObjectStorageBackend::ObjectStorageBackend(std::unique_ptr<ObjectStoreClient> client,
                                           RemoteStorageConfig config,
                                           std::string mimeType,
                                           std::shared_ptr<BackupLog> log)
    : client(std::move(client)), config(std::move(config)), mimeType(std::move(mimeType)), log(std::move(log)) {
    if (!this->client) {
        throw std::invalid_argument("Object storage backend requires a client");
    }
}

std::expected<void, BackupError> ObjectStorageBackend::ensureContainer(const std::string& name) {
    log->logMessage(std::format("[Backup] Checking storage bucket '{}'...", name));
    auto bucket = client->getBucket(name);
    if (bucket) {
        return {};
    }

    if (!bucket.error().notFound()) {
        log->logError(std::format("[Backup] Error checking bucket '{}': {}", name, bucket.error().message));
        return std::unexpected(BackupError{BackupErrorCode::BackendProvisioningError,
                                           std::format("Error checking storage bucket '{}': {}", name, bucket.error().message)});
    }

    log->logMessage(std::format("[Backup] Bucket '{}' not found. Attempting to create it...", name));
    BucketPolicy policy;
    policy.isPublic = false;
    policy.fileSizeLimit = config.maxObjectSize;
    policy.allowedMimeTypes = {mimeType};
    auto created = client->createBucket(name, policy);
    if (!created && client->getBucket(name)) {
        // Created concurrently by another backup.
        log->logMessage(std::format("[Backup] Bucket '{}' already exists.", name));
        return {};
    }
    if (!created) {
        log->logError(std::format("[Backup] Failed to create bucket '{}': {}", name, created.error().message));
        return std::unexpected(BackupError{BackupErrorCode::BackendProvisioningError,
                                           std::format("Storage bucket '{}' missing and auto-creation failed: {}. "
                                                       "Please create it manually.", name, created.error().message)});
    }
    log->logMessage(std::format("[Backup] Bucket '{}' created successfully.", name));
    return {};
}

std::expected<StoredArchive, BackupError> ObjectStorageBackend::put(const std::string& ownerId, const fs::path& archivePath) {
    if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
        return std::unexpected(valid.error());
    }
    const std::string fileName = archivePath.filename().string();
    if (auto valid = validatePathComponent(fileName, "archive name"); !valid) {
        return std::unexpected(valid.error());
    }

    if (auto ready = ensureContainer(config.bucket); !ready) {
        return std::unexpected(ready.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(archivePath, ec);
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to stat {}: {}", archivePath.string(), ec.message())});
    }
    if (size > config.maxObjectSize) {
        return std::unexpected(BackupError{BackupErrorCode::BackendTransferError,
                                           std::format("Archive of {} bytes exceeds the {} byte object limit",
                                                       size, config.maxObjectSize)});
    }

    // Whole-file read is bounded by the object size ceiling checked above.
    std::ifstream input(archivePath, std::ios::binary);
    if (!input) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to open file: {} (error: {})", archivePath.string(), strerror(errno))});
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad() || content.size() != size) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to read {}", archivePath.string())});
    }

    const std::string key = std::format("{}/{}", ownerId, fileName);
    log->logMessage(std::format("[Backup] Uploading to storage bucket '{}'...", config.bucket));
    auto uploaded = client->upload(config.bucket, key, content, mimeType, true);
    if (!uploaded) {
        log->logError(std::format("[Backup] Storage upload error: {}", uploaded.error().message));
        return std::unexpected(transferError(std::format("Upload of {} failed", key), uploaded.error()));
    }
    log->logMessage(std::format("[Backup] Upload successful: {}", key));

    fs::remove(archivePath, ec);
    if (ec) {
        log->logError(std::format("[Backup] Failed to remove staging file {}: {}", archivePath.string(), ec.message()));
    }
    return StoredArchive{fileName, static_cast<std::uint64_t>(size)};
}

std::expected<std::vector<BackupRecord>, BackupError> ObjectStorageBackend::list(const std::string& ownerId) {
    if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
        return std::unexpected(valid.error());
    }

    ListOptions options;
    options.limit = config.listLimit;
    options.offset = 0;
    options.sortColumn = "created_at";
    options.descending = true;

    auto objects = client->list(config.bucket, ownerId, options);
    if (!objects) {
        return std::unexpected(transferError(std::format("Listing {}/ failed", ownerId), objects.error()));
    }

    std::vector<BackupRecord> records;
    records.reserve(objects->size());
    for (const auto& object : *objects) {
        // Folder placeholders have no id.
        if (!object.id || object.name.empty()) {
            continue;
        }
        BackupRecord record;
        record.id = object.name;
        record.name = object.name;
        record.sizeBytes = object.size.value_or(0);
        record.createdAt = parseIso8601(object.createdAt).value_or(std::chrono::system_clock::time_point{});
        records.push_back(std::move(record));
    }
    sortNewestFirst(records);
    return records;
}

std::expected<StagedFile, BackupError> ObjectStorageBackend::fetch(const std::string& ownerId,
                                                                   const std::string& storedId,
                                                                   const fs::path& stagingDir) {
    if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validatePathComponent(storedId, "backup id"); !valid) {
        return std::unexpected(valid.error());
    }

    const std::string key = std::format("{}/{}", ownerId, storedId);
    auto data = client->download(config.bucket, key);
    if (!data) {
        if (data.error().notFound()) {
            return std::unexpected(BackupError{BackupErrorCode::NotFound, std::format("Backup {} not found", key)});
        }
        return std::unexpected(transferError(std::format("Download of {} failed", key), data.error()));
    }

    const fs::path downloadDir = stagingDir / ownerId;
    std::error_code ec;
    fs::create_directories(downloadDir, ec);
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to create directory {}: {}", downloadDir.string(), ec.message())});
    }

    // Process id and sequence keep downloads apart across restores and processes.
    StagedFile staged(downloadDir / std::format("restore_{}_{}_{}", ::getpid(), ++downloads, storedId), true);
    std::ofstream output(staged.path(), std::ios::binary | std::ios::trunc);
    output.write(data->data(), static_cast<std::streamsize>(data->size()));
    output.close();
    if (!output) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to write {}", staged.path().string())});
    }
    return staged;
}
