#pragma once

#include "exception.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Stable prefixes; scripts wrapping the installer match on these.
inline constexpr std::string_view INFO_PREFIX = "[>] ";
inline constexpr std::string_view WARNING_PREFIX = "[WARN]: ";
inline constexpr std::string_view ERROR_PREFIX = "[ERROR]: ";

// Log functions
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);
void log_progress(const std::string& msg, double percentage, int bar_width = 50);

// Filesystem utilities
void ensure_dir_exists(const std::filesystem::path& path);
std::vector<std::string> read_lines(const std::filesystem::path& path);
std::filesystem::path validate_path(const std::filesystem::path& path, const std::filesystem::path& root);

std::string trim(std::string_view s);
std::string to_lower(std::string_view s);

// Process helpers
struct CommandResult {
    int exit_code = -1;
    std::string output;
};

// Runs argv[0] with the given arguments (no shell), capturing stdout.
// exit_code is -1 when the program could not be started or was killed.
CommandResult run_command(const std::vector<std::string>& argv);
std::filesystem::path find_in_path(std::string_view program);

// Exit-path cleanup. Registered paths are unlinked (or rmdir'ed) in reverse
// registration order when the process receives a terminating signal.
void install_exit_handlers();
void register_cleanup_path(const std::filesystem::path& path);
void unregister_cleanup_path(const std::filesystem::path& path);

// Uniquely named staging directory, removed on destruction.
class ScratchWorkspace {
public:
    explicit ScratchWorkspace(const std::filesystem::path& parent);
    ~ScratchWorkspace();
    ScratchWorkspace(const ScratchWorkspace&) = delete;
    ScratchWorkspace& operator=(const ScratchWorkspace&) = delete;

    const std::filesystem::path& path() const { return path_; }
    void remove();

private:
    std::filesystem::path path_;
};
