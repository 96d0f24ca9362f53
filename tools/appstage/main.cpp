/**
 * appstage CLI - Entry Point
 *
 * Stages an application into a runtime template for each target.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace appstage::cli::commands {
    void setup_package(CLI::App* app, GlobalOptions& opts);
    void setup_plan(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace appstage::cli;

    CLI::App app{"appstage - Application bundle staging"};
    app.set_version_flag("-V,--version", APPSTAGE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* package_cmd = app.add_subcommand("package", "Stage and package an app");
    commands::setup_package(package_cmd, opts);

    auto* plan_cmd = app.add_subcommand("plan", "Print staging and output paths");
    commands::setup_plan(plan_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
