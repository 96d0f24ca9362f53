#include <doctest/doctest.h>
#include <appstage/hooks.hpp>

#include "../test_support.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace appstage;
using appstage::test::TempDir;

namespace {

HookInvocation sample_invocation() {
    HookInvocation inv;
    inv.directory = "/stage/resources/app";
    inv.runtime_version = "1.4.3";
    inv.platform = "linux";
    inv.arch = "x64";
    return inv;
}

Result<void> fail_with(const std::string& message) {
    return Result<void>::err(Error(ErrorCode::HOOK_FAILED, message));
}

} // namespace

TEST_CASE("run_hooks with no hooks succeeds") {
    auto result = run_hooks({}, sample_invocation());
    CHECK(result.isOk());
}

TEST_CASE("hooks receive the directory, version, platform and arch") {
    HookInvocation seen;
    std::vector<Hook> hooks = {Hook::sync([&seen](const HookInvocation& inv) {
        seen = inv;
        return Result<void>::ok();
    })};

    REQUIRE(run_hooks(hooks, sample_invocation()).isOk());
    CHECK(seen.directory == "/stage/resources/app");
    CHECK(seen.runtime_version == "1.4.3");
    CHECK(seen.platform == "linux");
    CHECK(seen.arch == "x64");
}

TEST_CASE("sync and deferred hooks can be mixed") {
    std::atomic<int> calls{0};
    std::vector<Hook> hooks = {
        Hook::sync([&calls](const HookInvocation&) {
            ++calls;
            return Result<void>::ok();
        }),
        Hook::deferred([&calls](const HookInvocation&) {
            return std::async(std::launch::async, [&calls]() {
                ++calls;
                return Result<void>::ok();
            });
        }),
    };

    CHECK(run_hooks(hooks, sample_invocation()).isOk());
    CHECK(calls.load() == 2);
}

TEST_CASE("all hooks are started before any is awaited") {
    // The first hook only finishes once the second one has started
    std::promise<void> second_started;
    auto started = second_started.get_future().share();

    std::vector<Hook> hooks = {
        Hook::sync([started](const HookInvocation&) {
            if (started.wait_for(std::chrono::seconds(10)) != std::future_status::ready) {
                return fail_with("second hook never started");
            }
            return Result<void>::ok();
        }),
        Hook::sync([&second_started](const HookInvocation&) {
            second_started.set_value();
            return Result<void>::ok();
        }),
    };

    CHECK(run_hooks(hooks, sample_invocation()).isOk());
}

TEST_CASE("run_hooks waits for every hook even when one fails early") {
    std::atomic<bool> slow_finished{false};
    std::vector<Hook> hooks = {
        Hook::sync([](const HookInvocation&) { return fail_with("boom"); }),
        Hook::sync([&slow_finished](const HookInvocation&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            slow_finished = true;
            return Result<void>::ok();
        }),
    };

    auto result = run_hooks(hooks, sample_invocation());
    CHECK(result.isErr());
    CHECK(slow_finished.load());
}

TEST_CASE("run_hooks reports the first failure in list order") {
    std::vector<Hook> hooks = {
        Hook::sync([](const HookInvocation&) { return Result<void>::ok(); }, "ok"),
        Hook::sync([](const HookInvocation&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            return fail_with("first");
        }, "stamp"),
        Hook::sync([](const HookInvocation&) { return fail_with("second"); }, "lint"),
    };

    auto result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::HOOK_FAILED);
    CHECK(result.error().message() == "hook stamp: first");
}

TEST_CASE("unnamed hooks are identified by position") {
    std::vector<Hook> hooks = {
        Hook::sync([](const HookInvocation&) { return Result<void>::ok(); }),
        Hook::sync([](const HookInvocation&) { return fail_with("nope"); }),
    };

    auto result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().message() == "hook #2: nope");
}

TEST_CASE("a throwing hook becomes a hook failure") {
    std::vector<Hook> hooks = {
        Hook::sync([](const HookInvocation&) -> Result<void> {
            throw std::runtime_error("exploded");
        }),
        Hook::deferred([](const HookInvocation&) -> std::future<Result<void>> {
            throw std::runtime_error("never started");
        }),
    };

    auto result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().message().find("exploded") != std::string::npos);
}

TEST_CASE("hooks throwing non-standard values become hook failures") {
    std::vector<Hook> hooks = {
        Hook::sync([](const HookInvocation&) -> Result<void> { throw 42; }, "sync"),
    };
    auto result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::HOOK_FAILED);
    CHECK(result.error().message() == "hook sync: hook threw a non-standard exception");

    hooks = {Hook::deferred([](const HookInvocation&) -> std::future<Result<void>> {
        throw "not started";
    }, "start")};
    result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().message() == "hook start: hook threw a non-standard exception");

    hooks = {Hook::deferred([](const HookInvocation&) {
        return std::async(std::launch::async, []() -> Result<void> { throw 7; });
    }, "settle")};
    result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().message() == "hook settle: hook threw a non-standard exception");
}

TEST_CASE("a deferred hook without a future fails") {
    std::vector<Hook> hooks = {
        Hook::deferred([](const HookInvocation&) { return std::future<Result<void>>(); }),
    };

    auto result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::HOOK_FAILED);
}

#ifndef _WIN32
TEST_CASE("command hooks pass the invocation as arguments") {
    TempDir temp;
    std::string script = temp.sub("record.sh");
    std::string log = temp.sub("args.txt");
    appstage::test::write_file(script, "#!/bin/sh\necho \"$@\" > " + log + "\n");
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    std::vector<Hook> hooks = {make_command_hook(script)};
    REQUIRE(run_hooks(hooks, sample_invocation()).isOk());
    CHECK(appstage::test::read_file(log) == "/stage/resources/app 1.4.3 linux x64\n");
}

TEST_CASE("command hooks fail on a non-zero exit status") {
    std::vector<Hook> hooks = {make_command_hook("false")};
    auto result = run_hooks(hooks, sample_invocation());
    REQUIRE(result.isErr());
    CHECK(result.error().message().find("false") != std::string::npos);
}

TEST_CASE("command hooks fail when the program does not exist") {
    std::vector<Hook> hooks = {make_command_hook("/nonexistent/appstage-hook")};
    auto result = run_hooks(hooks, sample_invocation());
    CHECK(result.isErr());
}
#endif
