#pragma once

#include <filesystem>
#include <string>

struct VerificationReport {
    std::string version_output;
    std::string env_output;
};

class PostInstallVerifier {
public:
    // Runs `<install_dir>/bin/go version` and `go env`; both must exit 0 and
    // print something. Throws PostInstallVerificationFailed otherwise.
    VerificationReport verify(const std::filesystem::path& install_dir);
};
