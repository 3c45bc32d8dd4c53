#include "install_plan.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <unistd.h>

namespace fs = std::filesystem;

std::string_view mode_name(InstallMode mode) {
    return mode == InstallMode::System ? "system" : "user";
}

std::optional<InstallMode> parse_mode(std::string_view text) {
    const std::string value = to_lower(trim(text));
    if (value == "1" || value == "system") return InstallMode::System;
    if (value == "2" || value == "user") return InstallMode::User;
    return std::nullopt;
}

bool SystemPrivilegeProbe::can_write(const fs::path& install_root) {
    if (geteuid() == 0) {
        return true;
    }
    return access(install_root.c_str(), W_OK | X_OK) == 0;
}

InstallPlan build_plan(InstallMode mode, PrivilegeProbe& probe) {
    InstallPlan plan;
    plan.mode = mode;

    if (mode == InstallMode::System) {
        plan.install_root = SYSTEM_ROOT;
        plan.target_dir = SYSTEM_ROOT / DISTRIBUTION_NAME;
        plan.requires_privilege = true;
        plan.path_line = "export PATH=" + (plan.target_dir / "bin").string() + ":$PATH";

        if (!probe.can_write(plan.install_root)) {
            throw GosetupException(ErrorKind::PrivilegeRequired, string_format("error.privilege_required", plan.install_root.string()));
        }
    } else {
        plan.install_root = get_user_root();
        plan.target_dir = plan.install_root / DISTRIBUTION_NAME;
        plan.requires_privilege = false;
        plan.path_line = "export PATH=$HOME/.local/" + std::string(DISTRIBUTION_NAME) + "/bin:$PATH";

        std::error_code ec;
        fs::create_directories(plan.install_root, ec);
        if (ec || !fs::is_directory(plan.install_root)) {
            throw GosetupException(ErrorKind::DirectoryCreateError,
                string_format("error.create_dir_failed", plan.install_root.string()) + (ec ? ": " + ec.message() : ""));
        }
    }
    return plan;
}
