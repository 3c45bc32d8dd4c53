#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

enum class InstallMode {
    System,
    User
};

std::string_view mode_name(InstallMode mode);
std::optional<InstallMode> parse_mode(std::string_view text);

struct InstallPlan {
    InstallMode mode = InstallMode::User;
    std::filesystem::path install_root;
    std::filesystem::path target_dir;
    bool requires_privilege = false;
    std::string path_line;
};

class PrivilegeProbe {
public:
    virtual ~PrivilegeProbe() = default;
    virtual bool can_write(const std::filesystem::path& install_root) = 0;
};

// Effective root, or write access to the install root.
class SystemPrivilegeProbe : public PrivilegeProbe {
public:
    bool can_write(const std::filesystem::path& install_root) override;
};

InstallPlan build_plan(InstallMode mode, PrivilegeProbe& probe);
