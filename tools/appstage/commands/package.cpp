/**
 * appstage CLI - package command
 *
 * Stage an application into a runtime template for every requested
 * platform/arch and move the results to the output directory.
 */

#include "../common.hpp"
#include <appstage/path_planner.hpp>
#include <appstage/runtime_binary.hpp>
#include <appstage/staging_pipeline.hpp>
#include <CLI/CLI.hpp>

#include <filesystem>

namespace appstage::cli::commands {

namespace {

struct PackageOptions {
    TargetOptions target;
    std::string template_dir;
    bool overwrite = false;
};

// The pipeline consumes its template, so each target gets a private copy.
FsResult copy_template(const std::string& template_dir, const std::string& scratch) {
    CopyOptions options;
    options.dereference = false;
    return copy_tree(template_dir, scratch, options);
}

void discard_scratch(const std::string& scratch) {
    auto removed = remove_if_exists(scratch);
    if (!removed.ok) {
        print_warning("Could not remove " + scratch + ": " + removed.error);
    }
}

int cmd_package(const GlobalOptions& opts, const PackageOptions& pkg_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json);

    std::error_code ec;
    if (!std::filesystem::is_directory(pkg_opts.template_dir, ec)) {
        print_error("template directory does not exist: " + pkg_opts.template_dir, opts.json);
        return 1;
    }

    auto resolved = resolve_targets(pkg_opts.target);
    if (!resolved.ok) {
        print_error(resolved.error, opts.json);
        return 1;
    }

    // Keep every target's output out of every app copy
    std::vector<std::string> out_paths;
    for (const auto& target : resolved.targets) {
        out_paths.push_back(final_path(target));
    }

    nlohmann::json written = nlohmann::json::array();
    nlohmann::json skipped = nlohmann::json::array();

    for (const auto& target : resolved.targets) {
        std::string dest = final_path(target);
        if (path_exists(dest)) {
            if (!pkg_opts.overwrite) {
                print_warning("Skipping " + target.platform + " " + target.arch +
                              " (output dir already exists, use --overwrite to force)");
                skipped.push_back(dest);
                continue;
            }
            auto removed = remove_if_exists(dest);
            if (!removed.ok) {
                print_error(removed.error, opts.json);
                return 1;
            }
        }

        std::string scratch = join_path(base_temp_dir(target), "template-" + generate_uuid());
        auto copied = copy_template(pkg_opts.template_dir, scratch);
        if (!copied.ok) {
            discard_scratch(scratch);
            print_error("failed to prepare template: " + copied.error, opts.json);
            return 1;
        }

        auto created = StagingPipeline::create(target, scratch, out_paths);
        if (created.isErr()) {
            discard_scratch(scratch);
            print_error(created.error().toString(), opts.json);
            return 1;
        }
        auto& pipeline = *created.value();

        std::unique_ptr<RuntimeBinaryNaming> naming = make_binary_naming(target);
        if (naming && !path_exists(join_path(scratch, naming->original_binary_name()))) {
            print_warning("Template has no " + naming->original_binary_name() +
                          ", runtime binary left unrenamed");
            naming.reset();
        }

        spdlog::info("Packaging app for platform {} {} using runtime v{}",
                     target.platform, target.arch,
                     target.runtime_version.empty() ? "?" : target.runtime_version);

        auto result = pipeline.run(naming.get());
        if (result.isErr()) {
            print_error(result.error().toString(), opts.json);
            return 1;
        }
        written.push_back(result.value());

        if (!opts.json && !opts.quiet) {
            std::cout << "Wrote new app to " << result.value() << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["paths"] = written;
        j["skipped"] = skipped;
        output_json(j);
    }
    return 0;
}

} // anonymous namespace

void setup_package(CLI::App* app, GlobalOptions& opts) {
    static PackageOptions pkg_opts;

    add_target_options(app, pkg_opts.target);
    app->add_option("-t,--template", pkg_opts.template_dir, "Unpacked runtime template directory")->required();
    app->add_flag("--overwrite", pkg_opts.overwrite, "Replace existing output directories");

    app->callback([&opts]() {
        std::exit(cmd_package(opts, pkg_opts));
    });
}

} // namespace appstage::cli::commands
