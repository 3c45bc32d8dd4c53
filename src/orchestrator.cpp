#include "orchestrator.hpp"

#include "archive.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "foreign_install.hpp"
#include "hash.hpp"
#include "localization.hpp"
#include "lock.hpp"
#include "prompt.hpp"
#include "shell_profile.hpp"
#include "utils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

std::string_view state_name(InstallState state) {
    switch (state) {
        case InstallState::Start: return "Start";
        case InstallState::LockAcquired: return "LockAcquired";
        case InstallState::PlanReady: return "PlanReady";
        case InstallState::VersionResolved: return "VersionResolved";
        case InstallState::PreviousRemoved: return "PreviousRemoved";
        case InstallState::Downloaded: return "Downloaded";
        case InstallState::Verified: return "Verified";
        case InstallState::Extracted: return "Extracted";
        case InstallState::PathUpdated: return "PathUpdated";
        case InstallState::PostInstallVerified: return "PostInstallVerified";
        case InstallState::Cleanup: return "Cleanup";
        case InstallState::Done: return "Done";
        case InstallState::Failed: return "Failed";
    }
    return "Unknown";
}

// Everything a single run owns. Destruction releases it on any exit path.
struct InstallationOrchestrator::RunContext {
    std::optional<InstallationLock> lock;
    std::optional<ScratchWorkspace> scratch;
    std::optional<InstallPlan> plan;
    fs::path artifact_path;
    fs::path staged_previous;
    bool extraction_started = false;

    ~RunContext() { release(); }

    void release() {
        if (!artifact_path.empty()) {
            unregister_cleanup_path(artifact_path);
            artifact_path.clear();
        }
        if (scratch) {
            scratch->remove();
            scratch.reset();
        }
        if (lock) {
            lock->release();
            lock.reset();
        }
    }
};

InstallationOrchestrator::InstallationOrchestrator(Downloader& downloader, Extractor& extractor, PrivilegeProbe& privilege_probe)
    : downloader_(downloader), extractor_(extractor), privilege_probe_(privilege_probe) {}

void InstallationOrchestrator::enter(InstallState state) {
    history_.push_back(state);
}

InstallReport InstallationOrchestrator::run(const InstallRequest& request) {
    history_.clear();
    failure_.reset();
    enter(InstallState::Start);

    RunContext ctx;
    InstallReport report;
    try {
        // Profiles live under $HOME in both modes.
        const fs::path home = get_home_dir();

        ctx.lock.emplace(LOCK_PATH);
        enter(InstallState::LockAcquired);

        ctx.plan = build_plan(resolve_mode(request), privilege_probe_);
        report.plan = *ctx.plan;
        enter(InstallState::PlanReady);

        const std::string index_url = get_mirror_url();
        const std::string platform = get_platform();
        report.artifact.version = resolve_version(request, index_url, platform);
        report.artifact.platform = platform;
        report.artifact.filename = artifact_filename(report.artifact.version, platform);
        report.artifact.url = index_url + report.artifact.filename;
        enter(InstallState::VersionResolved);

        log_info(string_format("info.selected_version", report.artifact.version.str()));
        log_info(string_format("info.install_type", std::string(mode_name(report.plan.mode))));

        remove_previous(report.plan, ctx);
        enter(InstallState::PreviousRemoved);

        ctx.scratch.emplace(SCRATCH_PARENT.empty() ? fs::temp_directory_path() : SCRATCH_PARENT);
        download(report.artifact, ctx);
        enter(InstallState::Downloaded);

        verify_artifact(report.artifact, index_url, ctx);
        enter(InstallState::Verified);

        extract(report.plan, ctx);
        enter(InstallState::Extracted);

        report.profiles_updated = update_path(report.plan);
        enter(InstallState::PathUpdated);

        report.verification = verifier_.verify(report.plan.target_dir);
        log_info(string_format("info.install_success", report.verification.version_output));
        enter(InstallState::PostInstallVerified);
    } catch (const GosetupException& e) {
        abort_run(e.kind(), ctx);
        throw;
    } catch (...) {
        abort_run(ErrorKind::Unexpected, ctx);
        throw;
    }

    enter(InstallState::Cleanup);
    commit(ctx);
    ctx.release();
    enter(InstallState::Done);

    log_info(get_string("info.install_complete"));
    return report;
}

void InstallationOrchestrator::abort_run(ErrorKind kind, RunContext& ctx) {
    failure_ = kind;
    log_warning(string_format("warning.run_aborted", std::string(state_name(state())), std::string(error_kind_name(kind))));
    enter(InstallState::Cleanup);
    rollback(ctx);
    ctx.release();
    enter(InstallState::Failed);
}

InstallMode InstallationOrchestrator::resolve_mode(const InstallRequest& request) {
    if (request.mode) {
        return *request.mode;
    }
    if (!prompts_) {
        throw GosetupException(ErrorKind::ConfigError, get_string("error.mode_not_specified"));
    }
    return prompts_->choose_mode();
}

ReleaseVersion InstallationOrchestrator::resolve_version(const InstallRequest& request, const std::string& index_url, const std::string& platform) {
    if (request.version) {
        return validate_version(trim(*request.version));
    }

    VersionResolver resolver(downloader_, index_url, platform);
    const ReleaseVersion latest = resolver.resolve_latest();

    std::optional<std::string> input;
    if (prompts_) {
        input = prompts_->choose_version(latest);
    }
    return validate_version(VersionResolver::prompt_or_default(latest, input));
}

void InstallationOrchestrator::remove_previous(const InstallPlan& plan, RunContext& ctx) {
    const fs::path staged = plan.target_dir.string() + std::string(STAGED_SUFFIX);
    std::error_code ec;

    // Left behind by an interrupted earlier run. Without a target it is the
    // only copy of the previous install, so it becomes the staged one.
    if (fs::exists(fs::symlink_status(staged))) {
        if (!fs::exists(fs::symlink_status(plan.target_dir))) {
            log_info(string_format("info.reusing_staged_previous", staged.string()));
            ctx.staged_previous = staged;
        } else {
            fs::remove_all(staged, ec);
            if (ec) {
                throw GosetupException(ErrorKind::PreviousRemovalError,
                    string_format("error.remove_previous_failed", staged.string(), ec.message()));
            }
        }
    }

    if (fs::exists(fs::symlink_status(plan.target_dir))) {
        log_info(string_format("info.removing_previous", plan.target_dir.string()));
        fs::rename(plan.target_dir, staged, ec);
        if (ec) {
            throw GosetupException(ErrorKind::PreviousRemovalError,
                string_format("error.remove_previous_failed", plan.target_dir.string(), ec.message()));
        }
        ctx.staged_previous = staged;
    }

    if (plan.mode != InstallMode::System || !foreign_detector_) {
        return;
    }
    try {
        if (foreign_detector_->is_installed()) {
            log_info(string_format("info.removing_foreign", foreign_detector_->name()));
            foreign_detector_->remove();
        }
    } catch (const GosetupException& e) {
        log_warning(string_format("warning.foreign_removal_failed", foreign_detector_->name(), std::string(e.what())));
    }
}

void InstallationOrchestrator::download(ArtifactDescriptor& artifact, RunContext& ctx) {
    log_info(string_format("info.downloading_version", artifact.version.str()));
    ctx.artifact_path = ctx.scratch->path() / artifact.filename;
    register_cleanup_path(ctx.artifact_path);
    downloader_.download_file(artifact.url, ctx.artifact_path);
}

void InstallationOrchestrator::verify_artifact(ArtifactDescriptor& artifact, const std::string& index_url, const RunContext& ctx) {
    log_info(get_string("info.verifying_download"));
    ChecksumVerifier checksums(downloader_, index_url);
    artifact.expected_checksum = checksums.fetch_expected(artifact.filename);
    checksums.verify(ctx.artifact_path, artifact.expected_checksum);
}

void InstallationOrchestrator::extract(const InstallPlan& plan, RunContext& ctx) {
    log_info(string_format("info.installing", plan.target_dir.string()));
    ctx.extraction_started = true;
    extractor_.extract(ctx.artifact_path, plan.install_root, std::string(DISTRIBUTION_NAME));
    if (!fs::is_directory(plan.target_dir)) {
        throw GosetupException(ErrorKind::ExtractError, string_format("error.target_missing_after_extract", plan.target_dir.string()));
    }
}

int InstallationOrchestrator::update_path(const InstallPlan& plan) {
    ShellProfileUpdater updater(get_home_dir());
    const ProfileUpdateResult result = updater.update_all(plan);
    if (result.updated_count == 0) {
        log_info(string_format("info.update_path_manually", plan.path_line));
    }
    return result.updated_count;
}

void InstallationOrchestrator::rollback(RunContext& ctx) {
    if (!ctx.plan) return;
    const fs::path& target = ctx.plan->target_dir;
    std::error_code ec;

    if (ctx.extraction_started) {
        fs::remove_all(target, ec);
        if (ec) {
            log_warning(string_format("warning.remove_failed", target.string(), ec.message()));
            return;
        }
    }

    if (!ctx.staged_previous.empty()) {
        fs::rename(ctx.staged_previous, target, ec);
        if (ec) {
            log_warning(string_format("warning.restore_previous_failed", ctx.staged_previous.string(), ec.message()));
        } else {
            log_info(string_format("info.restored_previous", target.string()));
        }
        ctx.staged_previous.clear();
    }
}

void InstallationOrchestrator::commit(RunContext& ctx) {
    if (ctx.staged_previous.empty()) return;
    std::error_code ec;
    fs::remove_all(ctx.staged_previous, ec);
    if (ec) {
        log_warning(string_format("warning.remove_failed", ctx.staged_previous.string(), ec.message()));
    }
    ctx.staged_previous.clear();
}
