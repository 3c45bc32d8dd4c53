#include "verifier.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string run_subcommand(const fs::path& binary, const std::string& subcommand, const char* failure_key) {
    CommandResult result = run_command({binary.string(), subcommand});
    std::string output = trim(result.output);
    if (result.exit_code != 0 || output.empty()) {
        throw GosetupException(ErrorKind::PostInstallVerificationFailed,
            string_format(failure_key, binary.string(), result.exit_code));
    }
    return output;
}

} // anonymous namespace

VerificationReport PostInstallVerifier::verify(const fs::path& install_dir) {
    log_info(get_string("info.verifying_install"));

    const fs::path binary = install_dir / "bin" / DISTRIBUTION_NAME;
    if (!fs::is_regular_file(binary)) {
        throw GosetupException(ErrorKind::PostInstallVerificationFailed, string_format("error.binary_missing", binary.string()));
    }

    VerificationReport report;
    report.version_output = run_subcommand(binary, "version", "error.version_check_failed");
    report.env_output = run_subcommand(binary, "env", "error.env_check_failed");
    return report;
}
