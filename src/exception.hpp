#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    DependencyMissing,
    ConfigError,
    AlreadyRunning,
    ResolutionError,
    InvalidVersionFormat,
    InputAborted,
    PrivilegeRequired,
    DirectoryCreateError,
    PreviousRemovalError,
    DownloadError,
    ChecksumFetchError,
    ChecksumMismatch,
    ExtractError,
    ProfileBackupError,
    PostInstallVerificationFailed,
    Unexpected  // anything not raised as a GosetupException
};

const char* error_kind_name(ErrorKind kind);

class GosetupException : public std::runtime_error {
public:
    GosetupException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
