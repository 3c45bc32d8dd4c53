#include "foreign_install.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

HomebrewCaskDetector::HomebrewCaskDetector(std::string cask) : cask_(std::move(cask)) {}

std::string HomebrewCaskDetector::name() const {
    return "Homebrew";
}

bool HomebrewCaskDetector::is_installed() {
    const fs::path brew = find_in_path("brew");
    if (brew.empty()) {
        return false;
    }
    return run_command({brew.string(), "list", "--cask", cask_}).exit_code == 0;
}

void HomebrewCaskDetector::remove() {
    const fs::path brew = find_in_path("brew");
    if (brew.empty()) {
        throw GosetupException(ErrorKind::PreviousRemovalError, string_format("error.program_not_found", std::string("brew")));
    }
    CommandResult result = run_command({brew.string(), "uninstall", "--cask", cask_});
    if (result.exit_code != 0) {
        throw GosetupException(ErrorKind::PreviousRemovalError,
            string_format("error.foreign_uninstall_failed", name(), result.exit_code));
    }
}
