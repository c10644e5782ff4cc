#include "backup_error.hpp"
#include <format>

std::string_view toString(BackupErrorCode code) {
    switch (code) {
    case BackupErrorCode::SourceMissing:
        return "SourceMissing";
    case BackupErrorCode::IOError:
        return "IOError";
    case BackupErrorCode::BackendProvisioningError:
        return "BackendProvisioningError";
    case BackupErrorCode::BackendTransferError:
        return "BackendTransferError";
    case BackupErrorCode::NotFound:
        return "NotFound";
    case BackupErrorCode::InvalidArgument:
        return "InvalidArgument";
    case BackupErrorCode::ConfigError:
        return "ConfigError";
    }
    return "Unknown";
}

std::string describe(const BackupError& error) {
    return std::format("{}: {}", toString(error.code), error.message);
}
