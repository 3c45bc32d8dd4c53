#include "shell_profile.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fstream>

namespace fs = std::filesystem;

ShellProfileUpdater::ShellProfileUpdater(fs::path home_dir) : home_dir_(std::move(home_dir)) {}

bool ShellProfileUpdater::contains_path_line(const fs::path& profile, const std::string& path_line) {
    for (const auto& line : read_lines(profile)) {
        if (trim(line) == path_line) {
            return true;
        }
    }
    return false;
}

bool ShellProfileUpdater::update_one(const fs::path& profile, const std::string& path_line) {
    if (contains_path_line(profile, path_line)) {
        return false;
    }

    log_info(string_format("info.updating_profile", profile.string()));

    const fs::path backup = profile.string() + ".bak";
    std::error_code ec;
    fs::copy_file(profile, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw GosetupException(ErrorKind::ProfileBackupError,
            string_format("warning.profile_backup_failed", profile.string(), ec.message()));
    }

    std::ofstream out(profile, std::ios::app);
    out << "\n" << PROFILE_MARKER << "\n" << path_line << "\n";
    out.close();
    if (!out) {
        throw GosetupException(ErrorKind::ProfileBackupError, string_format("warning.profile_append_failed", profile.string()));
    }
    return true;
}

ProfileUpdateResult ShellProfileUpdater::update_all(const InstallPlan& plan) {
    ProfileUpdateResult result;
    for (const auto& name : SUPPORTED_SHELL_PROFILES) {
        const fs::path profile = home_dir_ / name;
        if (!fs::is_regular_file(profile)) {
            continue;
        }
        try {
            if (update_one(profile, plan.path_line)) {
                ++result.updated_count;
                result.updated_files.push_back(profile);
            }
        } catch (const GosetupException& e) {
            // One broken profile must not stop the others.
            log_warning(e.what());
        }
    }
    return result;
}
