#pragma once

/**
 * @file staging_pipeline.hpp
 * @brief Orchestrates the staging of one packaged application bundle
 *
 * A pipeline is created per (platform, arch) target and walks a fixed
 * sequence of states:
 *
 *   Start -> TemplateMoved -> AppCopied -> PreHooksDone
 *         -> StaleDefaultAppRemoved -> Pruned -> PostPruneHooksDone
 *         -> Archived -> Relocated -> Done
 *
 * Each call to advance() performs exactly one transition. A failed
 * transition leaves the staging directory as it is and puts the pipeline
 * in a failed state; nothing is retried or rolled back.
 *
 * @example
 * ```cpp
 * auto created = appstage::StagingPipeline::create(config, template_dir);
 * if (created.isErr()) { ... }
 * auto& pipeline = *created.value();
 * auto naming = appstage::make_binary_naming(config);
 * auto result = pipeline.run(naming.get());
 * if (result.isOk()) {
 *     std::cout << "Wrote " << result.value() << "\n";
 * }
 * ```
 */

#include "appstage/archiver.hpp"
#include "appstage/dependency_pruner.hpp"
#include "appstage/path_planner.hpp"
#include "appstage/resource_filter.hpp"
#include "appstage/result.hpp"
#include "appstage/runtime_binary.hpp"
#include "appstage/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Pipeline State
// ============================================================================

enum class PipelineState {
    Start,
    TemplateMoved,
    AppCopied,
    PreHooksDone,
    StaleDefaultAppRemoved,
    Pruned,
    PostPruneHooksDone,
    Archived,
    Relocated,
    Done,
};

const char* pipeline_state_to_string(PipelineState state);

/**
 * @brief An error together with where the pipeline was
 *
 * For a failed transition, phase is the state it was trying to reach.
 * For copy_extra_resources and rename_runtime_binary, operation names the
 * call and phase is the last state that completed.
 */
struct PipelineError {
    PipelineState phase;
    Error error;
    std::string operation;

    std::string toString() const {
        if (operation.empty()) {
            return std::string(pipeline_state_to_string(phase)) + ": " + error.toString();
        }
        return operation + " (after " + pipeline_state_to_string(phase) + "): " + error.toString();
    }
};

template<typename T>
using PipelineResult = Result<T, PipelineError>;

// ============================================================================
// StagingPipeline
// ============================================================================

class StagingPipeline {
public:
    /**
     * @brief Create a pipeline with the bundled collaborators
     *
     * Uses the ignore-pattern filter built from config, NpmPruner and
     * TarGzArchiver. Fails with CONFIG_INVALID if an ignore pattern does
     * not compile.
     *
     * @param config Packaging configuration, copied into the pipeline
     * @param template_path Runtime template; consumed by the first transition
     * @param out_paths Extra output directories to keep out of the app copy
     */
    static Result<std::unique_ptr<StagingPipeline>> create(
        const PackagingConfig& config,
        const std::string& template_path,
        const std::vector<std::string>& out_paths = {});

    StagingPipeline(PackagingConfig config,
                    std::string template_path,
                    ResourceFilter filter,
                    std::unique_ptr<DependencyPruner> pruner,
                    std::unique_ptr<Archiver> archiver);

    StagingPipeline(const StagingPipeline&) = delete;
    StagingPipeline& operator=(const StagingPipeline&) = delete;

    PipelineState state() const { return state_; }
    bool failed() const { return failed_; }

    const PackagingConfig& config() const { return config_; }
    const StagingContext& context() const { return ctx_; }

    /// Perform the next transition
    PipelineResult<void> advance();

    /// Advance until `target` is reached (no-op if already there)
    PipelineResult<void> run_until(PipelineState target);

    /// Start through Archived: template, copy, hooks, cleanup, prune, archive
    PipelineResult<void> initialize();

    /// Copy extra files or directories into resources/, keyed by basename.
    /// Allowed between TemplateMoved and Archived.
    PipelineResult<void> copy_extra_resources(const std::string& resource);
    PipelineResult<void> copy_extra_resources(const std::vector<std::string>& resources);

    /// Rename the runtime binary inside the staging path.
    /// Allowed between TemplateMoved and Archived.
    PipelineResult<void> rename_runtime_binary(const RuntimeBinaryNaming& naming);

    /// Archived -> Relocated; returns the final output path
    PipelineResult<std::string> relocate();

    /**
     * @brief Complete run
     *
     * initialize(), copy config.extra_resources, rename the runtime binary
     * when a naming is given, relocate and finish.
     *
     * @return The final output path
     */
    PipelineResult<std::string> run(const RuntimeBinaryNaming* naming = nullptr);

private:
    Result<void> move_template();
    Result<void> copy_app();
    Result<void> run_post_copy_hooks();
    Result<void> remove_stale_default_app();
    Result<void> prune_dependencies();
    Result<void> run_post_prune_hooks();
    Result<void> archive_app();
    Result<void> move_to_final_path();

    PipelineResult<void> fail(PipelineState phase, Error error, std::string operation = {});
    PipelineResult<void> check_mutable(const char* operation) const;
    HookInvocation hook_invocation() const;

    PackagingConfig config_;
    StagingContext ctx_;
    ResourceFilter filter_;
    std::unique_ptr<DependencyPruner> pruner_;
    std::unique_ptr<Archiver> archiver_;

    PipelineState state_ = PipelineState::Start;
    bool failed_ = false;
};

} // namespace appstage
