#include "storage_backend.hpp"
#include <algorithm>
#include <format>
#include <system_error>

std::string_view toString(DeploymentMode mode) {
    return mode == DeploymentMode::Cloud ? "cloud" : "local";
}

StagedFile::~StagedFile() {
    reset();
}

StagedFile::StagedFile(StagedFile&& other) noexcept
    : filePath(std::move(other.filePath)), isOwned(other.isOwned) {
    other.isOwned = false;
}

StagedFile& StagedFile::operator=(StagedFile&& other) noexcept {
    if (this != &other) {
        reset();
        filePath = std::move(other.filePath);
        isOwned = other.isOwned;
        other.isOwned = false;
    }
    return *this;
}

void StagedFile::reset() {
    if (isOwned && !filePath.empty()) {
        // Already gone is fine: a successful put moves or deletes the file.
        std::error_code ec;
        fs::remove(filePath, ec);
    }
    isOwned = false;
}

std::expected<void, BackupError> validatePathComponent(std::string_view value, std::string_view what) {
    if (value.empty()) {
        return std::unexpected(BackupError{BackupErrorCode::InvalidArgument, std::format("Empty {}", what)});
    }
    if (value == "." || value == ".." ||
        value.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos) {
        return std::unexpected(BackupError{BackupErrorCode::InvalidArgument,
                                           std::format("Invalid {}: {}", what, value)});
    }
    return {};
}

void sortNewestFirst(std::vector<BackupRecord>& records) {
    std::ranges::sort(records, [](const BackupRecord& a, const BackupRecord& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt > b.createdAt;
        }
        return a.id > b.id;
    });
}
