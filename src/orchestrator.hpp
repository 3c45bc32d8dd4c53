#pragma once

#include "exception.hpp"
#include "install_plan.hpp"
#include "verifier.hpp"
#include "version.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class Downloader;
class Extractor;
class ForeignInstallDetector;
class PromptSource;

enum class InstallState {
    Start,
    LockAcquired,
    PlanReady,
    VersionResolved,
    PreviousRemoved,
    Downloaded,
    Verified,
    Extracted,
    PathUpdated,
    PostInstallVerified,
    Cleanup,
    Done,
    Failed
};

std::string_view state_name(InstallState state);

// Suffix of the directory an existing install is moved to while a new one
// is being put in place.
inline constexpr std::string_view STAGED_SUFFIX = ".gosetup-old";

struct ArtifactDescriptor {
    ReleaseVersion version;
    std::string platform;
    std::string filename;
    std::string url;
    std::string expected_checksum;  // filled right before verification
};

struct InstallRequest {
    std::optional<InstallMode> mode;     // asked from the PromptSource when unset
    std::optional<std::string> version;  // latest (optionally confirmed by prompt) when unset
};

struct InstallReport {
    InstallPlan plan;
    ArtifactDescriptor artifact;
    int profiles_updated = 0;
    VerificationReport verification;
};

class InstallationOrchestrator {
public:
    InstallationOrchestrator(Downloader& downloader, Extractor& extractor, PrivilegeProbe& privilege_probe);

    void set_prompt_source(PromptSource* prompts) { prompts_ = prompts; }
    void set_foreign_detector(ForeignInstallDetector* detector) { foreign_detector_ = detector; }

    // Runs the whole installation. Lock, scratch space and any partial
    // install are cleaned up before a failure is rethrown.
    InstallReport run(const InstallRequest& request);

    InstallState state() const { return history_.empty() ? InstallState::Start : history_.back(); }
    const std::vector<InstallState>& history() const { return history_; }
    std::optional<ErrorKind> failure() const { return failure_; }

private:
    struct RunContext;

    void enter(InstallState state);
    void abort_run(ErrorKind kind, RunContext& ctx);
    InstallMode resolve_mode(const InstallRequest& request);
    ReleaseVersion resolve_version(const InstallRequest& request, const std::string& index_url, const std::string& platform);
    void remove_previous(const InstallPlan& plan, RunContext& ctx);
    void download(ArtifactDescriptor& artifact, RunContext& ctx);
    void verify_artifact(ArtifactDescriptor& artifact, const std::string& index_url, const RunContext& ctx);
    void extract(const InstallPlan& plan, RunContext& ctx);
    int update_path(const InstallPlan& plan);
    void rollback(RunContext& ctx);
    void commit(RunContext& ctx);

    Downloader& downloader_;
    Extractor& extractor_;
    PrivilegeProbe& privilege_probe_;
    PromptSource* prompts_ = nullptr;
    ForeignInstallDetector* foreign_detector_ = nullptr;
    PostInstallVerifier verifier_;

    std::vector<InstallState> history_;
    std::optional<ErrorKind> failure_;
};
