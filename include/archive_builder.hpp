/**
 * @file archive_builder.hpp
 * @brief Single-file snapshot archives for LedgerVault.
 *
 * Provides the interface and the zip implementation used to wrap one database
 * file into a compressed archive holding exactly one entry, and to verify and
 * extract such archives on the restore path.
 *
 * @note Requires libarchive.
 */

#ifndef ARCHIVE_BUILDER_HPP
#define ARCHIVE_BUILDER_HPP

#include <expected>
#include <filesystem>
#include <string>
#include "backup_error.hpp"

namespace fs = std::filesystem;

/**
 * @brief Interface for snapshot archive formats.
 */
class ArchiveBuilder {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ArchiveBuilder() = default;

    /**
     * @brief Streams a source file into a new single-entry archive.
     *
     * The entry is named "database" followed by the source file's extension.
     * The source is never modified. On failure no partial archive is left at
     * destPath.
     *
     * @param sourcePath File to snapshot.
     * @param destPath Archive to create.
     * @return std::expected<void, BackupError> Success, SourceMissing or IOError.
     */
    virtual std::expected<void, BackupError> build(const fs::path& sourcePath, const fs::path& destPath) = 0;

    /**
     * @brief Checks that an archive opens and holds exactly one database entry.
     *
     * @param archivePath Archive to check.
     * @return std::expected<std::string, BackupError> Name of the entry, or IOError.
     */
    virtual std::expected<std::string, BackupError> verify(const fs::path& archivePath) = 0;

    /**
     * @brief Writes the archive's database entry to a plain file.
     *
     * @param archivePath Archive to read.
     * @param outputPath File receiving the uncompressed bytes.
     * @return std::expected<void, BackupError> Success or IOError.
     */
    virtual std::expected<void, BackupError> extract(const fs::path& archivePath, const fs::path& outputPath) = 0;

    /**
     * @brief Archive filename extension without the leading dot.
     */
    virtual std::string extension() const = 0;

    /**
     * @brief Content type of the produced archives.
     */
    virtual std::string mimeType() const = 0;
};

/**
 * @brief Zip archive builder using deflate at the highest compression level.
 *
 * Backups are infrequent and size limited, so size is favored over speed.
 */
class ZipArchiveBuilder : public ArchiveBuilder {
public:
    std::expected<void, BackupError> build(const fs::path& sourcePath, const fs::path& destPath) override;
    std::expected<std::string, BackupError> verify(const fs::path& archivePath) override;
    std::expected<void, BackupError> extract(const fs::path& archivePath, const fs::path& outputPath) override;
    std::string extension() const override { return "zip"; }
    std::string mimeType() const override { return "application/zip"; }

    /**
     * @brief Name of the single archive entry for a given source file.
     *
     * @param sourcePath Source database path (e.g. "data/database.db").
     * @return std::string Entry name (e.g. "database.db").
     */
    static std::string entryNameFor(const fs::path& sourcePath);
};

#endif // ARCHIVE_BUILDER_HPP
