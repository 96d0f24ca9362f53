/**
 * appstage CLI - plan command
 *
 * Show where each target would be staged and written, without touching
 * the filesystem.
 */

#include "../common.hpp"
#include <appstage/path_planner.hpp>
#include <appstage/runtime_binary.hpp>
#include <CLI/CLI.hpp>

namespace appstage::cli::commands {

namespace {

int cmd_plan(const GlobalOptions& opts, const TargetOptions& plan_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json);

    auto resolved = resolve_targets(plan_opts);
    if (!resolved.ok) {
        print_error(resolved.error, opts.json);
        return 1;
    }

    nlohmann::json targets = nlohmann::json::array();
    for (const auto& target : resolved.targets) {
        StagingContext ctx = plan_staging(target, "");
        auto naming = make_binary_naming(target);

        if (opts.json) {
            nlohmann::json t;
            t["platform"] = target.platform;
            t["arch"] = target.arch;
            t["staging_path"] = ctx.staging_path;
            t["final_path"] = ctx.final_path;
            t["resources_dir"] = ctx.resources_dir;
            t["archive"] = target.archive.has_value();
            if (target.archive) {
                t["archive_path"] = ctx.archive_path;
            }
            if (naming) {
                t["binary"] = {{"from", naming->original_binary_name()},
                               {"to", naming->new_binary_name()}};
            }
            targets.push_back(t);
            continue;
        }

        std::cout << target.platform << "-" << target.arch << std::endl;
        std::cout << "  Staging: " << ctx.staging_path << std::endl;
        std::cout << "  Output:  " << ctx.final_path << std::endl;
        std::cout << "  App:     "
                  << (target.archive ? ctx.archive_path : ctx.resources_app_dir) << std::endl;
        if (naming) {
            std::cout << "  Binary:  " << naming->original_binary_name() << " -> "
                      << naming->new_binary_name() << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["targets"] = targets;
        output_json(j);
    }
    return 0;
}

} // anonymous namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    static TargetOptions plan_opts;

    add_target_options(app, plan_opts);

    app->callback([&opts]() {
        std::exit(cmd_plan(opts, plan_opts));
    });
}

} // namespace appstage::cli::commands
