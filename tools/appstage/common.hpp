/**
 * appstage CLI - Common utilities and types
 */

#pragma once

#include <appstage/config.hpp>
#include <appstage/hooks.hpp>
#include <appstage/platform.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

namespace appstage::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Library log level follows the output flags.
 */
inline void configure_logging(const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet || opts.json) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%l] %v");
}

/**
 * Warnings raised while a command runs. Text mode logs them as they come;
 * JSON mode holds them for the final document.
 */
class WarningCollector {
public:
    void reset(bool defer) {
        defer_ = defer;
        pending_.clear();
    }

    void add(const std::string& msg) {
        if (defer_) {
            pending_.push_back(msg);
        } else {
            spdlog::warn("{}", msg);
        }
    }

    const std::vector<std::string>& pending() const { return pending_; }

private:
    bool defer_ = false;
    std::vector<std::string> pending_;
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector instance;
    return instance;
}

inline void init_warning_collector(bool json_mode) {
    get_warning_collector().reset(json_mode);
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

// Print a result document, attaching any deferred warnings
inline void output_json(nlohmann::json doc) {
    const auto& warnings = get_warning_collector().pending();
    if (!warnings.empty() && !doc.contains("warnings")) {
        doc["warnings"] = warnings;
    }
    std::cout << doc.dump(2) << std::endl;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cerr << "Error: " << msg << std::endl;
        return;
    }
    output_json({{"ok", false}, {"error", msg}});
}

/**
 * Options shared by every command that builds packaging configs.
 */
struct TargetOptions {
    std::string config_file;
    std::string dir;
    std::string name;
    std::string executable_name;
    std::string platform;
    std::string arch;
    std::string runtime_version;
    std::string out;
    std::string temp_root;
    bool no_tmpdir = false;
    bool no_prune = false;
    bool no_deref_symlinks = false;
    bool no_junk = false;
    bool asar = false;
    std::vector<std::string> asar_unpack;
    std::vector<std::string> asar_unpack_dir;
    std::vector<std::string> ignore;
    std::vector<std::string> extra_resource;
    std::vector<std::string> after_copy;
    std::vector<std::string> after_prune;
};

inline void add_target_options(CLI::App* app, TargetOptions& t) {
    app->add_option("dir", t.dir, "Application source directory");
    app->add_option("-c,--config", t.config_file, "JSON packaging config");
    app->add_option("-n,--name", t.name, "Application name");
    app->add_option("--executable-name", t.executable_name, "Binary name (defaults to name)");
    app->add_option("-p,--platform", t.platform, "Target platform(s), comma separated");
    app->add_option("-a,--arch", t.arch, "Target arch(es), comma separated");
    app->add_option("--runtime-version", t.runtime_version, "Runtime version passed to hooks");
    app->add_option("-o,--out", t.out, "Output directory");
    app->add_option("--tmp-root", t.temp_root, "Root for temporary staging directories");
    app->add_flag("--no-tmpdir", t.no_tmpdir, "Stage directly in the output directory");
    app->add_flag("--no-prune", t.no_prune, "Keep development dependencies");
    app->add_flag("--no-deref-symlinks", t.no_deref_symlinks, "Copy symlinks as links");
    app->add_flag("--no-junk", t.no_junk, "Keep OS junk files");
    app->add_flag("--asar", t.asar, "Archive the app directory");
    app->add_option("--asar-unpack", t.asar_unpack, "Glob of files to keep outside the archive");
    app->add_option("--asar-unpack-dir", t.asar_unpack_dir, "Glob of directories to keep outside the archive");
    app->add_option("--ignore", t.ignore, "Regex of app paths to skip");
    app->add_option("--extra-resource", t.extra_resource, "File or directory copied into resources/");
    app->add_option("--after-copy", t.after_copy, "Command run after the app is copied");
    app->add_option("--after-prune", t.after_prune, "Command run after dependencies are pruned");
}

struct TargetsResult {
    bool ok = false;
    std::string error;
    std::vector<PackagingConfig> targets;
};

/**
 * Merge the config file (if any) with command line flags and expand into
 * one config per platform/arch. Command line values win.
 */
inline TargetsResult resolve_targets(const TargetOptions& t) {
    TargetsResult result;

    ConfigParseResult parsed;
    if (!t.config_file.empty()) {
        parsed = load_packaging_config(t.config_file);
        if (!parsed.ok) {
            result.error = parsed.error;
            return result;
        }
        for (const auto& warning : parsed.warnings) {
            print_warning(warning);
        }
    }

    PackagingConfig base = parsed.config;
    if (!t.dir.empty()) base.dir = t.dir;
    if (!t.name.empty()) base.name = t.name;
    if (!t.executable_name.empty()) base.executable_name = t.executable_name;
    if (!t.runtime_version.empty()) base.runtime_version = t.runtime_version;
    if (!t.out.empty()) base.out = t.out;
    if (!t.temp_root.empty()) base.temp_root = t.temp_root;
    if (base.temp_root.empty()) base.temp_root = get_temp_directory();
    if (t.no_tmpdir) base.tmpdir = false;
    if (t.no_prune) base.prune = false;
    if (t.no_deref_symlinks) base.deref_symlinks = false;
    if (t.no_junk) base.junk = false;

    if (t.asar || !t.asar_unpack.empty() || !t.asar_unpack_dir.empty()) {
        if (!base.archive) base.archive = ArchiveOptions{};
        base.archive->unpack.insert(base.archive->unpack.end(),
                                    t.asar_unpack.begin(), t.asar_unpack.end());
        base.archive->unpack_dirs.insert(base.archive->unpack_dirs.end(),
                                         t.asar_unpack_dir.begin(), t.asar_unpack_dir.end());
    }

    base.ignore.insert(base.ignore.end(), t.ignore.begin(), t.ignore.end());
    base.extra_resources.insert(base.extra_resources.end(),
                                t.extra_resource.begin(), t.extra_resource.end());
    for (const auto& command : t.after_copy) {
        base.after_copy.push_back(make_command_hook(command));
    }
    for (const auto& command : t.after_prune) {
        base.after_prune.push_back(make_command_hook(command));
    }

    std::vector<std::string> platforms = t.platform.empty() ? parsed.platforms : split_list(t.platform);
    std::vector<std::string> archs = t.arch.empty() ? parsed.archs : split_list(t.arch);
    if (platforms.empty()) platforms.push_back(get_host_platform());
    if (archs.empty()) archs.push_back(get_host_arch());

    result.targets = expand_targets(base, platforms, archs);
    for (const auto& target : result.targets) {
        auto valid = validate_packaging_config(target);
        if (valid.isErr()) {
            result.error = valid.error().message();
            result.targets.clear();
            return result;
        }
    }

    result.ok = true;
    return result;
}

} // namespace appstage::cli
