#include "appstage/staging_pipeline.hpp"
#include "appstage/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <future>
#include <optional>
#include <set>

namespace appstage {

const char* pipeline_state_to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Start: return "Start";
        case PipelineState::TemplateMoved: return "TemplateMoved";
        case PipelineState::AppCopied: return "AppCopied";
        case PipelineState::PreHooksDone: return "PreHooksDone";
        case PipelineState::StaleDefaultAppRemoved: return "StaleDefaultAppRemoved";
        case PipelineState::Pruned: return "Pruned";
        case PipelineState::PostPruneHooksDone: return "PostPruneHooksDone";
        case PipelineState::Archived: return "Archived";
        case PipelineState::Relocated: return "Relocated";
        case PipelineState::Done: return "Done";
    }
    return "Unknown";
}

namespace {

PipelineState next_state(PipelineState state) {
    switch (state) {
        case PipelineState::Start: return PipelineState::TemplateMoved;
        case PipelineState::TemplateMoved: return PipelineState::AppCopied;
        case PipelineState::AppCopied: return PipelineState::PreHooksDone;
        case PipelineState::PreHooksDone: return PipelineState::StaleDefaultAppRemoved;
        case PipelineState::StaleDefaultAppRemoved: return PipelineState::Pruned;
        case PipelineState::Pruned: return PipelineState::PostPruneHooksDone;
        case PipelineState::PostPruneHooksDone: return PipelineState::Archived;
        case PipelineState::Archived: return PipelineState::Relocated;
        case PipelineState::Relocated:
        case PipelineState::Done:
            return PipelineState::Done;
    }
    return PipelineState::Done;
}

Result<void> from_fs(const FsResult& fs_result, ErrorCode code) {
    if (fs_result.ok) {
        return Result<void>::ok();
    }
    return Result<void>::err(Error(code, fs_result.error));
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<StagingPipeline>> StagingPipeline::create(
    const PackagingConfig& config,
    const std::string& template_path,
    const std::vector<std::string>& out_paths) {
    auto filter = make_ignore_filter(config, out_paths);
    if (!filter.ok) {
        return Result<std::unique_ptr<StagingPipeline>>::err(
            Error(ErrorCode::CONFIG_INVALID, filter.error));
    }

    return Result<std::unique_ptr<StagingPipeline>>::ok(
        std::make_unique<StagingPipeline>(config, template_path, std::move(filter.filter),
                                          std::make_unique<NpmPruner>(),
                                          std::make_unique<TarGzArchiver>()));
}

StagingPipeline::StagingPipeline(PackagingConfig config,
                                 std::string template_path,
                                 ResourceFilter filter,
                                 std::unique_ptr<DependencyPruner> pruner,
                                 std::unique_ptr<Archiver> archiver)
    : config_(std::move(config)),
      filter_(std::move(filter)),
      pruner_(std::move(pruner)),
      archiver_(std::move(archiver)) {
    ctx_ = plan_staging(config_, template_path);
}

// ============================================================================
// State Machine
// ============================================================================

PipelineResult<void> StagingPipeline::fail(PipelineState phase, Error error, std::string operation) {
    failed_ = true;
    spdlog::debug("Pipeline failed at {}{}: {}", pipeline_state_to_string(phase),
                  operation.empty() ? "" : " in " + operation, error.message());
    return PipelineResult<void>::err(PipelineError{phase, std::move(error), std::move(operation)});
}

PipelineResult<void> StagingPipeline::advance() {
    if (failed_) {
        return PipelineResult<void>::err(PipelineError{
            state_, Error(ErrorCode::INVALID_STATE, "pipeline has already failed")});
    }
    if (state_ == PipelineState::Done) {
        return PipelineResult<void>::err(PipelineError{
            state_, Error(ErrorCode::INVALID_STATE, "pipeline has already finished")});
    }

    PipelineState target = next_state(state_);
    Result<void> step = Result<void>::ok();

    switch (target) {
        case PipelineState::TemplateMoved: step = move_template(); break;
        case PipelineState::AppCopied: step = copy_app(); break;
        case PipelineState::PreHooksDone: step = run_post_copy_hooks(); break;
        case PipelineState::StaleDefaultAppRemoved: step = remove_stale_default_app(); break;
        case PipelineState::Pruned: step = prune_dependencies(); break;
        case PipelineState::PostPruneHooksDone: step = run_post_prune_hooks(); break;
        case PipelineState::Archived: step = archive_app(); break;
        case PipelineState::Relocated: step = move_to_final_path(); break;
        case PipelineState::Start:
        case PipelineState::Done:
            break;
    }

    if (step.isErr()) {
        return fail(target, step.error());
    }

    state_ = target;
    return PipelineResult<void>::ok();
}

PipelineResult<void> StagingPipeline::run_until(PipelineState target) {
    while (state_ < target) {
        auto step = advance();
        if (step.isErr()) {
            return step;
        }
    }
    if (state_ > target) {
        return PipelineResult<void>::err(PipelineError{
            state_, Error(ErrorCode::INVALID_STATE,
                          std::string("pipeline is already past ") + pipeline_state_to_string(target))});
    }
    return PipelineResult<void>::ok();
}

PipelineResult<void> StagingPipeline::initialize() {
    spdlog::debug("Initializing app in {} from {} template", ctx_.staging_path, ctx_.template_path);
    return run_until(PipelineState::Archived);
}

PipelineResult<std::string> StagingPipeline::relocate() {
    if (state_ != PipelineState::Archived) {
        return PipelineResult<std::string>::err(PipelineError{
            state_, Error(ErrorCode::INVALID_STATE, "relocate requires the Archived state")});
    }
    auto step = advance();
    if (step.isErr()) {
        return PipelineResult<std::string>::err(step.error());
    }
    return PipelineResult<std::string>::ok(ctx_.final_path);
}

PipelineResult<std::string> StagingPipeline::run(const RuntimeBinaryNaming* naming) {
    auto initialized = initialize();
    if (initialized.isErr()) {
        return PipelineResult<std::string>::err(initialized.error());
    }

    auto extras = copy_extra_resources(config_.extra_resources);
    if (extras.isErr()) {
        return PipelineResult<std::string>::err(extras.error());
    }

    if (naming) {
        auto renamed = rename_runtime_binary(*naming);
        if (renamed.isErr()) {
            return PipelineResult<std::string>::err(renamed.error());
        }
    }

    auto final_dir = relocate();
    if (final_dir.isErr()) {
        return final_dir;
    }

    auto done = advance();
    if (done.isErr()) {
        return PipelineResult<std::string>::err(done.error());
    }
    return final_dir;
}

// ============================================================================
// Operations outside the main sequence
// ============================================================================

PipelineResult<void> StagingPipeline::check_mutable(const char* operation) const {
    if (failed_ || state_ < PipelineState::TemplateMoved || state_ > PipelineState::Archived) {
        return PipelineResult<void>::err(PipelineError{
            state_, Error(ErrorCode::INVALID_STATE,
                          std::string(operation) + " is not allowed in state " +
                          pipeline_state_to_string(state_) + (failed_ ? " (failed)" : ""))});
    }
    return PipelineResult<void>::ok();
}

PipelineResult<void> StagingPipeline::copy_extra_resources(const std::string& resource) {
    return copy_extra_resources(std::vector<std::string>{resource});
}

PipelineResult<void> StagingPipeline::copy_extra_resources(const std::vector<std::string>& resources) {
    if (resources.empty()) {
        return PipelineResult<void>::ok();
    }

    auto allowed = check_mutable("copy_extra_resources");
    if (allowed.isErr()) {
        return allowed;
    }

    // Copies run concurrently, so each needs its own destination
    std::set<std::string> basenames;
    for (const auto& resource : resources) {
        if (!basenames.insert(get_filename(resource)).second) {
            return fail(state_, Error(ErrorCode::COPY_FAILED,
                                      "more than one extra resource is named " + get_filename(resource)),
                        "copy_extra_resources");
        }
    }

    std::vector<std::future<FsResult>> pending;
    pending.reserve(resources.size());
    for (const auto& resource : resources) {
        std::string dest = join_path(ctx_.resources_dir, get_filename(resource));
        spdlog::debug("Copying extra resource {} to {}", resource, dest);
        pending.push_back(std::async(std::launch::async, [resource, dest]() {
            return copy_tree(resource, dest, CopyOptions{});
        }));
    }

    std::optional<Error> first_error;
    for (auto& copy : pending) {
        FsResult copied = copy.get();
        if (!copied.ok && !first_error) {
            first_error = Error(ErrorCode::COPY_FAILED, copied.error);
        }
    }

    if (first_error) {
        return fail(state_, *first_error, "copy_extra_resources");
    }
    return PipelineResult<void>::ok();
}

PipelineResult<void> StagingPipeline::rename_runtime_binary(const RuntimeBinaryNaming& naming) {
    auto allowed = check_mutable("rename_runtime_binary");
    if (allowed.isErr()) {
        return allowed;
    }

    std::string from = naming.original_binary_name();
    std::string to = naming.new_binary_name();
    if (from == to) {
        return PipelineResult<void>::ok();
    }

    spdlog::debug("Renaming {} to {} in {}", from, to, ctx_.staging_path);
    auto renamed = move_path(join_path(ctx_.staging_path, from),
                             join_path(ctx_.staging_path, to), true);
    if (!renamed.ok) {
        return fail(state_, Error(ErrorCode::RENAME_FAILED, renamed.error), "rename_runtime_binary");
    }
    return PipelineResult<void>::ok();
}

// ============================================================================
// Transitions
// ============================================================================

HookInvocation StagingPipeline::hook_invocation() const {
    HookInvocation invocation;
    invocation.directory = ctx_.resources_app_dir;
    invocation.runtime_version = config_.runtime_version;
    invocation.platform = config_.platform;
    invocation.arch = config_.arch;
    return invocation;
}

Result<void> StagingPipeline::move_template() {
    spdlog::debug("Moving template {} to {}", ctx_.template_path, ctx_.staging_path);
    return from_fs(move_path(ctx_.template_path, ctx_.staging_path, true),
                   ErrorCode::STAGING_MOVE_FAILED);
}

Result<void> StagingPipeline::copy_app() {
    CopyOptions options;
    options.filter = filter_;
    options.dereference = config_.deref_symlinks;

    spdlog::debug("Copying {} to {}", config_.dir, ctx_.resources_app_dir);
    auto copied = copy_tree(config_.dir, ctx_.resources_app_dir, options);
    if (!copied.ok) {
        return from_fs(copied, ErrorCode::COPY_FAILED);
    }

    // resources/app must exist afterwards even if the filter rejected the root
    std::error_code ec;
    std::filesystem::create_directories(ctx_.resources_app_dir, ec);
    if (ec) {
        return Result<void>::err(Error(ErrorCode::COPY_FAILED,
            "failed to create " + ctx_.resources_app_dir + ": " + ec.message()));
    }
    return Result<void>::ok();
}

Result<void> StagingPipeline::run_post_copy_hooks() {
    return run_hooks(config_.after_copy, hook_invocation());
}

Result<void> StagingPipeline::remove_stale_default_app() {
    for (const char* stale : {"default_app", "default_app.asar"}) {
        auto removed = remove_if_exists(join_path(ctx_.resources_dir, stale));
        if (!removed.ok) {
            return from_fs(removed, ErrorCode::STALE_CLEANUP_FAILED);
        }
    }
    return Result<void>::ok();
}

Result<void> StagingPipeline::prune_dependencies() {
    if (!config_.prune) {
        return Result<void>::ok();
    }
    if (!pruner_) {
        return Result<void>::err(Error(ErrorCode::PRUNE_FAILED, "no dependency pruner configured"));
    }

    spdlog::debug("Pruning dependencies in {}", ctx_.resources_app_dir);
    auto pruned = pruner_->prune(ctx_.resources_app_dir);
    if (!pruned.ok) {
        return Result<void>::err(Error(ErrorCode::PRUNE_FAILED, pruned.error));
    }
    spdlog::debug("Pruned {} package(s)", pruned.removed.size());
    return Result<void>::ok();
}

Result<void> StagingPipeline::run_post_prune_hooks() {
    if (!config_.prune) {
        return Result<void>::ok();
    }
    return run_hooks(config_.after_prune, hook_invocation());
}

Result<void> StagingPipeline::archive_app() {
    if (!config_.archive) {
        return Result<void>::ok();
    }
    if (!archiver_) {
        return Result<void>::err(Error(ErrorCode::ARCHIVE_FAILED, "no archiver configured"));
    }

    const auto& options = *config_.archive;
    spdlog::debug("Archiving {} to {} (level {}, {} unpack pattern(s), {} unpack dir pattern(s))",
                  ctx_.resources_app_dir, ctx_.archive_path, options.compression_level,
                  options.unpack.size(), options.unpack_dirs.size());

    auto archived = archiver_->create_archive(ctx_.resources_app_dir, ctx_.archive_path, options);
    if (!archived.ok) {
        return Result<void>::err(Error(ErrorCode::ARCHIVE_FAILED, archived.error));
    }

    return from_fs(remove_if_exists(ctx_.resources_app_dir), ErrorCode::ARCHIVE_FAILED);
}

Result<void> StagingPipeline::move_to_final_path() {
    if (!config_.tmpdir) {
        return Result<void>::ok();
    }
    spdlog::debug("Moving {} to {}", ctx_.staging_path, ctx_.final_path);
    return from_fs(move_path(ctx_.staging_path, ctx_.final_path, false),
                   ErrorCode::RELOCATE_FAILED);
}

} // namespace appstage
