#include "exception.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DependencyMissing: return "DependencyMissing";
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::AlreadyRunning: return "AlreadyRunning";
        case ErrorKind::ResolutionError: return "ResolutionError";
        case ErrorKind::InvalidVersionFormat: return "InvalidVersionFormat";
        case ErrorKind::InputAborted: return "InputAborted";
        case ErrorKind::PrivilegeRequired: return "PrivilegeRequired";
        case ErrorKind::DirectoryCreateError: return "DirectoryCreateError";
        case ErrorKind::PreviousRemovalError: return "PreviousRemovalError";
        case ErrorKind::DownloadError: return "DownloadError";
        case ErrorKind::ChecksumFetchError: return "ChecksumFetchError";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::ExtractError: return "ExtractError";
        case ErrorKind::ProfileBackupError: return "ProfileBackupError";
        case ErrorKind::PostInstallVerificationFailed: return "PostInstallVerificationFailed";
        case ErrorKind::Unexpected: return "Unexpected";
    }
    return "Unknown";
}
