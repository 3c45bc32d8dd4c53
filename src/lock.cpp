#include "lock.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace fs = std::filesystem;

InstallationLock::InstallationLock(fs::path lock_path) : lock_path_(std::move(lock_path)) {
    if (mkdir(lock_path_.c_str(), 0700) != 0) {
        if (errno == EEXIST) {
            throw GosetupException(ErrorKind::AlreadyRunning, string_format("error.already_running", lock_path_.string()));
        }
        throw GosetupException(ErrorKind::DirectoryCreateError,
            string_format("error.create_dir_failed", lock_path_.string()) + ": " + std::strerror(errno));
    }
    held_ = true;
    register_cleanup_path(lock_path_);
}

InstallationLock::~InstallationLock() {
    release();
}

InstallationLock::InstallationLock(InstallationLock&& other) noexcept
    : lock_path_(std::move(other.lock_path_)), held_(std::exchange(other.held_, false)) {}

InstallationLock& InstallationLock::operator=(InstallationLock&& other) noexcept {
    if (this != &other) {
        release();
        lock_path_ = std::move(other.lock_path_);
        held_ = std::exchange(other.held_, false);
    }
    return *this;
}

void InstallationLock::release() {
    if (!held_) return;
    held_ = false;
    unregister_cleanup_path(lock_path_);
    std::error_code ec;
    fs::remove_all(lock_path_, ec);
    if (ec) {
        log_warning(string_format("warning.remove_failed", lock_path_.string(), ec.message()));
    }
}
