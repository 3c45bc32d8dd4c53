#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view DISTRIBUTION_NAME = "go";
inline constexpr std::string_view DEFAULT_MIRROR_URL = "https://go.dev/dl/";
inline constexpr std::string_view DEFAULT_LOCK_PATH = "/tmp/golang_install.lock";
inline constexpr std::string_view DEFAULT_SYSTEM_ROOT = "/usr/local";
inline const std::vector<std::string> SUPPORTED_SHELL_PROFILES = {".zshrc", ".bashrc", ".bash_profile"};

// Global paths (defaults, overridable for tests and by CLI flags)
extern std::filesystem::path CONFIG_DIR;
extern std::filesystem::path MIRROR_CONF;
extern std::filesystem::path SYSTEM_ROOT;
extern std::filesystem::path LOCK_PATH;
extern std::filesystem::path SCRATCH_PARENT;

void set_config_dir(const std::string& dir);
void set_system_root(const std::string& root);
void set_lock_path(const std::string& path);
void set_scratch_parent(const std::string& dir);
void set_home_dir(const std::string& home);  // Manually override $HOME
void set_platform(const std::string& platform);  // Manually override os-arch
void set_mirror_url(const std::string& url);  // Takes precedence over mirror.conf
void reset_config();

std::filesystem::path get_home_dir();
std::filesystem::path get_user_root();
std::string get_platform();
std::string get_mirror_url();
