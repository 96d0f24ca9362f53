#include "appstage/hooks.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#ifdef _WIN32
#include <process.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace appstage {

namespace {

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream ss(command);
    std::string part;
    while (ss >> part) {
        parts.push_back(part);
    }
    return parts;
}

Result<void> run_command(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

#ifdef _WIN32
    intptr_t status = _spawnvp(_P_WAIT, argv[0], argv.data());
    if (status == -1) {
        return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
            "failed to start " + args[0] + ": " + std::string(strerror(errno))));
    }
    if (status != 0) {
        return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
            args[0] + " exited with status " + std::to_string(status)));
    }
    return Result<void>::ok();
#else
    pid_t pid = fork();
    if (pid == -1) {
        return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
            "fork failed: " + std::string(strerror(errno))));
    }

    if (pid == 0) {
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
                "waitpid failed: " + std::string(strerror(errno))));
        }
    }

    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) {
            return Result<void>::ok();
        }
        if (code == 127) {
            return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
                "could not execute " + args[0]));
        }
        return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
            args[0] + " exited with status " + std::to_string(code)));
    }
    if (WIFSIGNALED(status)) {
        return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
            args[0] + " terminated by signal " + std::to_string(WTERMSIG(status))));
    }
    return Result<void>::err(Error(ErrorCode::HOOK_FAILED,
        args[0] + " terminated abnormally"));
#endif
}

} // namespace

Hook make_command_hook(const std::string& command) {
    std::vector<std::string> base_args = split_command(command);

    return Hook::sync([base_args, command](const HookInvocation& invocation) {
        if (base_args.empty()) {
            return Result<void>::err(Error(ErrorCode::HOOK_FAILED, "empty hook command"));
        }

        std::vector<std::string> args = base_args;
        args.push_back(invocation.directory);
        args.push_back(invocation.runtime_version);
        args.push_back(invocation.platform);
        args.push_back(invocation.arch);

        spdlog::debug("Running hook command: {}", command);
        return run_command(args);
    }, command);
}

} // namespace appstage
