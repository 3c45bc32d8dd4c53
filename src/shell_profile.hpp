#pragma once

#include "install_plan.hpp"

#include <filesystem>
#include <string>
#include <vector>

inline constexpr std::string_view PROFILE_MARKER = "# Golang PATH";

struct ProfileUpdateResult {
    int updated_count = 0;
    std::vector<std::filesystem::path> updated_files;
};

class ShellProfileUpdater {
public:
    explicit ShellProfileUpdater(std::filesystem::path home_dir);

    ProfileUpdateResult update_all(const InstallPlan& plan);

    // True when a line of the file equals path_line (surrounding whitespace ignored).
    static bool contains_path_line(const std::filesystem::path& profile, const std::string& path_line);

private:
    bool update_one(const std::filesystem::path& profile, const std::string& path_line);

    std::filesystem::path home_dir_;
};
