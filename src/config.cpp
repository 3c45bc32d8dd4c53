#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <sys/utsname.h>

#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

fs::path CONFIG_DIR = GOSETUP_CONF_DIR;
fs::path MIRROR_CONF = fs::path(GOSETUP_CONF_DIR) / "mirror.conf";
fs::path SYSTEM_ROOT = std::string(DEFAULT_SYSTEM_ROOT);
fs::path LOCK_PATH = std::string(DEFAULT_LOCK_PATH);
fs::path SCRATCH_PARENT;

namespace {
    std::string home_override;
    std::string platform_override;
    std::string mirror_override;
}

void set_config_dir(const std::string& dir) {
    CONFIG_DIR = fs::path(dir).lexically_normal();
    MIRROR_CONF = CONFIG_DIR / "mirror.conf";
}

void set_system_root(const std::string& root) {
    SYSTEM_ROOT = fs::path(root).lexically_normal();
}

void set_lock_path(const std::string& path) {
    LOCK_PATH = fs::path(path);
}

void set_scratch_parent(const std::string& dir) {
    SCRATCH_PARENT = fs::path(dir);
}

void set_home_dir(const std::string& home) {
    home_override = home;
}

void set_platform(const std::string& platform) {
    platform_override = platform;
}

void set_mirror_url(const std::string& url) {
    mirror_override = url;
}

void reset_config() {
    set_config_dir(GOSETUP_CONF_DIR);
    SYSTEM_ROOT = std::string(DEFAULT_SYSTEM_ROOT);
    LOCK_PATH = std::string(DEFAULT_LOCK_PATH);
    SCRATCH_PARENT.clear();
    home_override.clear();
    platform_override.clear();
    mirror_override.clear();
}

fs::path get_home_dir() {
    if (!home_override.empty()) {
        return home_override;
    }
    const char* home = std::getenv("HOME");
    if (!home || *home == '\0') {
        throw GosetupException(ErrorKind::DependencyMissing, get_string("error.home_not_set"));
    }
    return fs::path(home);
}

fs::path get_user_root() {
    return get_home_dir() / ".local";
}

std::string get_platform() {
    if (!platform_override.empty()) {
        return platform_override;
    }

    struct utsname buf;
    if (uname(&buf) != 0) {
        throw GosetupException(ErrorKind::ConfigError, get_string("error.get_arch_failed"));
    }

    std::string os = to_lower(buf.sysname);
    if (os != "linux" && os != "darwin") {
        throw GosetupException(ErrorKind::ConfigError, string_format("error.unsupported_os", os));
    }

    std::string machine(buf.machine);
    std::string arch;
    if (machine == "x86_64" || machine == "amd64") {
        arch = "amd64";
    } else if (machine == "aarch64" || machine == "arm64") {
        arch = "arm64";
    } else {
        throw GosetupException(ErrorKind::ConfigError, string_format("error.unsupported_arch", machine));
    }
    return os + "-" + arch;
}

std::string get_mirror_url() {
    std::string mirror_url = mirror_override;
    if (mirror_url.empty()) {
        std::ifstream mirror_file(MIRROR_CONF);
        if (mirror_file.is_open()) {
            std::getline(mirror_file, mirror_url);
            mirror_url = trim(mirror_url);
        }
    }
    if (mirror_url.empty()) {
        mirror_url = std::string(DEFAULT_MIRROR_URL);
    }
    if (mirror_url.back() != '/') {
        mirror_url += '/';
    }
    return mirror_url;
}
