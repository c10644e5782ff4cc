#include "local_storage_backend.hpp"
#include <cerrno>
#include <fcntl.h>
#include <format>
#include <sys/stat.h>
#include <system_error>

LocalStorageBackend::LocalStorageBackend(fs::path root, std::shared_ptr<BackupLog> log)
    : rootDir(std::move(root)), log(std::move(log)) {
    fs::create_directories(rootDir);
}

std::chrono::system_clock::time_point fileCreationTime(const fs::path& path, std::error_code& ec) {
    ec.clear();
#ifdef __linux__
    struct statx stx{};
    if (statx(AT_FDCWD, path.c_str(), AT_STATX_SYNC_AS_STAT, STATX_BTIME | STATX_MTIME, &stx) == 0 &&
        (stx.stx_mask & STATX_BTIME)) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(stx.stx_btime.tv_sec) + std::chrono::nanoseconds(stx.stx_btime.tv_nsec)));
    }
#endif
    auto lastWrite = fs::last_write_time(path, ec);
    if (ec) {
        return {};
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(std::chrono::file_clock::to_sys(lastWrite));
}

std::expected<StoredArchive, BackupError> LocalStorageBackend::put(const std::string& ownerId, const fs::path& archivePath) {
    if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
        return std::unexpected(valid.error());
    }
    const std::string fileName = archivePath.filename().string();
    if (auto valid = validatePathComponent(fileName, "archive name"); !valid) {
        return std::unexpected(valid.error());
    }

    std::error_code ec;
    const auto size = fs::file_size(archivePath, ec);
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to stat {}: {}", archivePath.string(), ec.message())});
    }

    const fs::path ownerDir = rootDir / ownerId;
    fs::create_directories(ownerDir, ec);
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to create directory {}: {}", ownerDir.string(), ec.message())});
    }

    const fs::path target = ownerDir / fileName;
    if (fs::exists(target, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Backup already exists: {}", target.string())});
    }

    fs::rename(archivePath, target, ec);
    if (ec == std::errc::cross_device_link) {
        // Copy next to the target first so the final step is still a rename.
        const fs::path partial = ownerDir / ("." + fileName + ".part");
        fs::copy_file(archivePath, partial, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::rename(partial, target, ec);
        }
        if (ec) {
            std::error_code cleanupEc;
            fs::remove(partial, cleanupEc);
        } else {
            fs::remove(archivePath, ec);
            if (ec) {
                log->logError(std::format("[Backup] Failed to remove staging file {}: {}", archivePath.string(), ec.message()));
                ec.clear();
            }
        }
    }
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to move {} to {}: {}", archivePath.string(),
                                                       target.string(), ec.message())});
    }

    log->logMessage(std::format("[Backup] Local backup saved: {}", target.string()));
    return StoredArchive{fileName, static_cast<std::uint64_t>(size)};
}

std::expected<std::vector<BackupRecord>, BackupError> LocalStorageBackend::list(const std::string& ownerId) {
    if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
        return std::unexpected(valid.error());
    }

    std::vector<BackupRecord> records;
    const fs::path ownerDir = rootDir / ownerId;
    std::error_code ec;
    if (!fs::is_directory(ownerDir, ec)) {
        return records;
    }

    for (auto it = fs::directory_iterator(ownerDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.starts_with(".")) {
            continue;
        }

        BackupRecord record;
        record.id = name;
        record.name = name;
        record.sizeBytes = static_cast<std::uint64_t>(entry.file_size(entryEc));
        if (!entryEc) {
            record.createdAt = fileCreationTime(entry.path(), entryEc);
        }
        if (entryEc) {
            return std::unexpected(BackupError{BackupErrorCode::IOError,
                                               std::format("Failed to stat {}: {}", entry.path().string(), entryEc.message())});
        }
        records.push_back(std::move(record));
    }
    if (ec) {
        return std::unexpected(BackupError{BackupErrorCode::IOError,
                                           std::format("Failed to read directory {}: {}", ownerDir.string(), ec.message())});
    }

    sortNewestFirst(records);
    return records;
}

std::expected<StagedFile, BackupError> LocalStorageBackend::fetch(const std::string& ownerId,
                                                                  const std::string& storedId,
                                                                  [[maybe_unused]] const fs::path& stagingDir) {
    if (auto valid = validatePathComponent(ownerId, "owner id"); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto valid = validatePathComponent(storedId, "backup id"); !valid) {
        return std::unexpected(valid.error());
    }

    const fs::path ownerDir = rootDir / ownerId;
    const fs::path path = ownerDir / storedId;
    std::error_code ec;
    if (!fs::is_directory(ownerDir, ec) || !fs::is_regular_file(path, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::NotFound, "Backup file not found locally"});
    }
    return StagedFile(path, false);
}
