#include "appstage/hooks.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace appstage {

namespace {

std::future<Result<void>> ready_future(Result<void> result) {
    std::promise<Result<void>> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

Result<void> hook_error(const std::string& message) {
    return Result<void>::err(Error(ErrorCode::HOOK_FAILED, message));
}

const char* const NON_STANDARD_THROW = "hook threw a non-standard exception";

std::string describe(const Hook& hook, size_t index) {
    if (!hook.name().empty()) return hook.name();
    return "#" + std::to_string(index + 1);
}

} // namespace

Hook Hook::sync(SyncFn fn, std::string name) {
    return Hook(std::move(fn), nullptr, std::move(name));
}

Hook Hook::deferred(DeferredFn fn, std::string name) {
    return Hook(nullptr, std::move(fn), std::move(name));
}

std::future<Result<void>> Hook::start(const HookInvocation& invocation) const {
    if (sync_fn_) {
        SyncFn fn = sync_fn_;
        return std::async(std::launch::async, [fn, invocation]() {
            try {
                return fn(invocation);
            } catch (const std::exception& e) {
                return hook_error(e.what());
            } catch (...) {
                return hook_error(NON_STANDARD_THROW);
            }
        });
    }

    if (deferred_fn_) {
        std::future<Result<void>> pending;
        try {
            pending = deferred_fn_(invocation);
        } catch (const std::exception& e) {
            return ready_future(hook_error(e.what()));
        } catch (...) {
            return ready_future(hook_error(NON_STANDARD_THROW));
        }
        if (!pending.valid()) {
            return ready_future(hook_error("hook returned no completion"));
        }
        return pending;
    }

    return ready_future(hook_error("hook has no function"));
}

Result<void> run_hooks(const std::vector<Hook>& hooks, const HookInvocation& invocation) {
    if (hooks.empty()) {
        return Result<void>::ok();
    }

    spdlog::debug("Running {} hook(s) on {}", hooks.size(), invocation.directory);

    // Fan out: every hook starts before any is awaited
    std::vector<std::future<Result<void>>> pending;
    pending.reserve(hooks.size());
    for (const auto& hook : hooks) {
        pending.push_back(hook.start(invocation));
    }

    // Fan in: wait for all of them, remember the first failure
    std::optional<Error> first_error;
    for (size_t i = 0; i < pending.size(); ++i) {
        Result<void> outcome = Result<void>::ok();
        try {
            outcome = pending[i].get();
        } catch (const std::exception& e) {
            outcome = hook_error(e.what());
        } catch (...) {
            outcome = hook_error(NON_STANDARD_THROW);
        }

        if (outcome.isErr()) {
            spdlog::debug("Hook {} failed: {}", describe(hooks[i], i), outcome.error().message());
            if (!first_error) {
                Error error(ErrorCode::HOOK_FAILED, outcome.error().message());
                error.withContext("hook " + describe(hooks[i], i));
                first_error = error;
            }
        }
    }

    if (first_error) {
        return Result<void>::err(*first_error);
    }
    return Result<void>::ok();
}

} // namespace appstage
