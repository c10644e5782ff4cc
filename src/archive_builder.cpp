/**
 * @file archive_builder.cpp
 * @brief Zip snapshot archives built and read with libarchive.
 */

#include "archive_builder.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <system_error>

namespace {

constexpr size_t kBlockSize = 8192;

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;

BackupError ioError(std::string message) {
    return BackupError{BackupErrorCode::IOError, std::move(message)};
}

std::string archiveMessage(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

std::expected<ArchiveReader, BackupError> openForReading(const fs::path& archivePath) {
    ArchiveReader reader(archive_read_new());
    if (!reader) {
        return std::unexpected(ioError("Failed to allocate archive reader"));
    }
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected(ioError(std::format("Failed to open archive: {} (error: {})",
                                                   archivePath.string(), archiveMessage(reader.get()))));
    }
    return reader;
}

} // namespace

std::string ZipArchiveBuilder::entryNameFor(const fs::path& sourcePath) {
    return "database" + sourcePath.extension().string();
}

std::expected<void, BackupError> ZipArchiveBuilder::build(const fs::path& sourcePath, const fs::path& destPath) {
    std::error_code ec;
    if (!fs::is_regular_file(sourcePath, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::SourceMissing,
                                           std::format("Database file ({}) not found", sourcePath.filename().string())});
    }

    // The snapshot covers exactly the bytes present when the build starts.
    const auto sourceSize = fs::file_size(sourcePath, ec);
    if (ec) {
        return std::unexpected(ioError(std::format("Failed to stat {}: {}", sourcePath.string(), ec.message())));
    }
    std::error_code timeEc;
    const auto sourceTime = fs::last_write_time(sourcePath, timeEc);

    std::ifstream input(sourcePath, std::ios::binary);
    if (!input) {
        return std::unexpected(ioError(std::format("Failed to open file: {} (error: {})",
                                                   sourcePath.string(), strerror(errno))));
    }

    if (destPath.has_parent_path()) {
        fs::create_directories(destPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(ioError(std::format("Failed to create directory {}: {}",
                                                       destPath.parent_path().string(), ec.message())));
        }
    }

    auto fail = [&destPath](std::string message) -> std::expected<void, BackupError> {
        std::error_code removeEc;
        fs::remove(destPath, removeEc);
        return std::unexpected(ioError(std::move(message)));
    };

    ArchiveWriter writer(archive_write_new());
    if (!writer) {
        return std::unexpected(ioError("Failed to allocate archive writer"));
    }
    struct archive* a = writer.get();
    if (archive_write_set_format_zip(a) != ARCHIVE_OK ||
        archive_write_set_options(a, "zip:compression=deflate,zip:compression-level=9") < ARCHIVE_WARN) {
        return std::unexpected(ioError(std::format("Failed to configure zip writer: {}", archiveMessage(a))));
    }
    if (archive_write_open_filename(a, destPath.c_str()) != ARCHIVE_OK) {
        return fail(std::format("Failed to open archive file: {} (error: {})", destPath.string(), archiveMessage(a)));
    }

    std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), entryNameFor(sourcePath).c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(sourceSize));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    if (!timeEc) {
        auto modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            std::chrono::file_clock::to_sys(sourceTime));
        archive_entry_set_mtime(entry.get(), std::chrono::system_clock::to_time_t(modified), 0);
    }

    if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) {
        return fail(std::format("Failed to write archive header: {}", archiveMessage(a)));
    }

    char buf[kBlockSize];
    std::uintmax_t remaining = sourceSize;
    while (remaining > 0) {
        auto want = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, sizeof(buf)));
        input.read(buf, want);
        auto got = input.gcount();
        if (got <= 0) {
            if (input.bad()) {
                return fail(std::format("Failed to read {}: {}", sourcePath.string(), strerror(errno)));
            }
            return fail(std::format("Short read from {}: {} bytes missing", sourcePath.string(), remaining));
        }
        if (archive_write_data(a, buf, static_cast<size_t>(got)) < 0) {
            return fail(std::format("Failed to write archive data: {}", archiveMessage(a)));
        }
        remaining -= static_cast<std::uintmax_t>(got);
    }

    if (archive_write_finish_entry(a) < ARCHIVE_WARN || archive_write_close(a) != ARCHIVE_OK) {
        return fail(std::format("Failed to finalize archive {}: {}", destPath.string(), archiveMessage(a)));
    }
    return {};
}

std::expected<std::string, BackupError> ZipArchiveBuilder::verify(const fs::path& archivePath) {
    auto reader = openForReading(archivePath);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    struct archive* a = reader->get();

    std::string entryName;
    size_t entries = 0;
    struct archive_entry* entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        ++entries;
        entryName = archive_entry_pathname(entry) ? archive_entry_pathname(entry) : "";
        if (archive_entry_filetype(entry) != AE_IFREG) {
            return std::unexpected(ioError(std::format("Unexpected non-file entry in {}: {}",
                                                       archivePath.string(), entryName)));
        }
        if (archive_read_data_skip(a) != ARCHIVE_OK) {
            return std::unexpected(ioError(std::format("Corrupt archive {}: {}", archivePath.string(), archiveMessage(a))));
        }
    }
    if (r != ARCHIVE_EOF) {
        return std::unexpected(ioError(std::format("Corrupt archive {}: {}", archivePath.string(), archiveMessage(a))));
    }
    if (entries != 1 || !entryName.starts_with("database")) {
        return std::unexpected(ioError(std::format("Archive {} must hold exactly one database entry, found {}",
                                                   archivePath.string(), entries)));
    }
    return entryName;
}

std::expected<void, BackupError> ZipArchiveBuilder::extract(const fs::path& archivePath, const fs::path& outputPath) {
    auto reader = openForReading(archivePath);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    struct archive* a = reader->get();

    struct archive_entry* entry;
    if (archive_read_next_header(a, &entry) != ARCHIVE_OK) {
        return std::unexpected(ioError(std::format("Archive {} has no entry: {}", archivePath.string(), archiveMessage(a))));
    }

    std::ofstream output(outputPath, std::ios::binary | std::ios::trunc);
    if (!output) {
        return std::unexpected(ioError(std::format("Failed to open file: {} (error: {})",
                                                   outputPath.string(), strerror(errno))));
    }

    char buf[kBlockSize];
    la_ssize_t n;
    while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
        output.write(buf, n);
        if (!output) {
            return std::unexpected(ioError(std::format("Failed to write {}", outputPath.string())));
        }
    }
    if (n < 0) {
        return std::unexpected(ioError(std::format("Failed to read archive {}: {}", archivePath.string(), archiveMessage(a))));
    }
    output.close();
    if (!output) {
        return std::unexpected(ioError(std::format("Failed to close {}", outputPath.string())));
    }
    return {};
}
