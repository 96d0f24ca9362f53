#pragma once

#include "appstage/result.hpp"

#include <functional>
#include <future>
#include <string>
#include <vector>

namespace appstage {

// ============================================================================
// Hook Invocation
// ============================================================================

// Arguments passed to every hook, identical for the post-copy and
// post-prune checkpoints.
struct HookInvocation {
    std::string directory;          // Directory acted upon (resources/app)
    std::string runtime_version;
    std::string platform;
    std::string arch;
};

// ============================================================================
// Hook
// ============================================================================

/**
 * @brief A caller-supplied extension function
 *
 * A hook either completes synchronously (returns its Result directly) or
 * hands back a future that completes later. Both forms are adapted to a
 * future by start(), so the runner treats them uniformly.
 */
class Hook {
public:
    using SyncFn = std::function<Result<void>(const HookInvocation&)>;
    using DeferredFn = std::function<std::future<Result<void>>(const HookInvocation&)>;

    static Hook sync(SyncFn fn, std::string name = "");
    static Hook deferred(DeferredFn fn, std::string name = "");

    const std::string& name() const { return name_; }

    // Begin running the hook. The returned future never throws from get().
    std::future<Result<void>> start(const HookInvocation& invocation) const;

private:
    Hook(SyncFn sync_fn, DeferredFn deferred_fn, std::string name)
        : sync_fn_(std::move(sync_fn)),
          deferred_fn_(std::move(deferred_fn)),
          name_(std::move(name)) {}

    SyncFn sync_fn_;
    DeferredFn deferred_fn_;
    std::string name_;
};

// Start every hook concurrently and wait for all of them to settle.
// Returns the first failure in list order, or ok when all succeeded.
// An empty list succeeds immediately.
Result<void> run_hooks(const std::vector<Hook>& hooks, const HookInvocation& invocation);

// Build a hook that runs an external command with the arguments
//   <directory> <runtime_version> <platform> <arch>
// appended. The command string is split on whitespace; no shell is involved.
// A non-zero exit status is a failure.
Hook make_command_hook(const std::string& command);

} // namespace appstage
