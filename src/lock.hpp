#pragma once

#include <filesystem>

// Cross-process installer lock. Acquired atomically in the constructor by
// creating a directory; another live run makes construction fail with
// AlreadyRunning. No waiting, no retry.
class InstallationLock {
public:
    explicit InstallationLock(std::filesystem::path lock_path);
    ~InstallationLock();

    InstallationLock(const InstallationLock&) = delete;
    InstallationLock& operator=(const InstallationLock&) = delete;
    InstallationLock(InstallationLock&& other) noexcept;
    InstallationLock& operator=(InstallationLock&& other) noexcept;

    // Safe to call any number of times.
    void release();
    bool held() const { return held_; }
    const std::filesystem::path& path() const { return lock_path_; }

private:
    std::filesystem::path lock_path_;
    bool held_ = false;
};
