#include <doctest/doctest.h>
#include <appstage/config.hpp>
#include <appstage/path_planner.hpp>
#include <appstage/platform.hpp>
#include <appstage/runtime_binary.hpp>
#include <appstage/staging_pipeline.hpp>

#include "../test_support.hpp"

using namespace appstage;
using namespace appstage::test;

namespace {

// App with one production and one development dependency
void make_app(const std::string& app) {
    write_file(app + "/index.js", "require('proddep');");
    write_file(app + "/package.json", R"({
        "name": "app",
        "main": "index.js",
        "dependencies": {"proddep": "^1.0.0"},
        "devDependencies": {"devdep": "^1.0.0"}
    })");
    write_file(app + "/node_modules/proddep/package.json", R"({"name": "proddep"})");
    write_file(app + "/node_modules/proddep/index.js", "module.exports = 1;");
    write_file(app + "/node_modules/devdep/package.json", R"({"name": "devdep"})");
    write_file(app + "/node_modules/devdep/index.js", "module.exports = 2;");
}

PackagingConfig base_config(const TempDir& temp) {
    PackagingConfig config;
    config.name = "MyApp";
    config.platform = "linux";
    config.arch = "x64";
    config.runtime_version = "1.4.3";
    config.dir = temp.sub("app");
    config.out = temp.sub("out");
    config.temp_root = temp.sub("tmp");
    return config;
}

} // namespace

TEST_CASE("packaging an app prunes dev dependencies and relocates the result") {
    TempDir temp;
    make_app(temp.sub("app"));
    make_template(temp.sub("template"));
    auto config = base_config(temp);

    auto created = StagingPipeline::create(config, temp.sub("template"));
    REQUIRE(created.isOk());
    auto result = created.value()->run();
    REQUIRE(result.isOk());

    std::string out = result.value();
    CHECK(out == final_path(config));
    CHECK(path_exists(out + "/runtime-bin"));
    CHECK(read_file(out + "/resources/app/index.js") == "require('proddep');");
    CHECK(path_exists(out + "/resources/app/node_modules/proddep/index.js"));
    CHECK_FALSE(path_exists(out + "/resources/app/node_modules/devdep"));
    CHECK_FALSE(path_exists(out + "/resources/default_app.asar"));

    // The source app is left untouched
    CHECK(path_exists(temp.sub("app/node_modules/devdep/index.js")));
}

TEST_CASE("packaging with an archive stores the pruned app in app.asar") {
    TempDir temp;
    make_app(temp.sub("app"));
    make_template(temp.sub("template"));
    auto config = base_config(temp);
    config.archive = ArchiveOptions{};

    auto created = StagingPipeline::create(config, temp.sub("template"));
    REQUIRE(created.isOk());
    auto result = created.value()->run();
    REQUIRE(result.isOk());

    std::string resources = result.value() + "/resources";
    CHECK_FALSE(path_exists(resources + "/app"));
    REQUIRE(path_exists(resources + "/app.asar"));

    auto members = read_tar_gz_file(resources + "/app.asar");
    CHECK(members.count("index.js") == 1);
    CHECK(members.count("node_modules/proddep/index.js") == 1);
    CHECK(members.count("node_modules/devdep/index.js") == 0);
}

TEST_CASE("packaging with prune disabled keeps the app byte for byte") {
    TempDir temp;
    make_app(temp.sub("app"));
    make_template(temp.sub("template"));
    auto config = base_config(temp);
    config.prune = false;

    auto created = StagingPipeline::create(config, temp.sub("template"));
    REQUIRE(created.isOk());
    auto result = created.value()->run();
    REQUIRE(result.isOk());

    CHECK(snapshot_tree(result.value() + "/resources/app") == snapshot_tree(temp.sub("app")));
}

TEST_CASE("packaging renames the runtime binary and copies extra resources") {
    TempDir temp;
    make_app(temp.sub("app"));
    make_template(temp.sub("template"), "electron");
    write_file(temp.sub("LICENSE"), "MIT");
    auto config = base_config(temp);
    config.executable_name = "myapp";
    config.extra_resources = {temp.sub("LICENSE")};

    auto created = StagingPipeline::create(config, temp.sub("template"));
    REQUIRE(created.isOk());
    auto naming = make_binary_naming(config);
    REQUIRE(naming != nullptr);

    auto result = created.value()->run(naming.get());
    REQUIRE(result.isOk());
    CHECK(path_exists(result.value() + "/myapp"));
    CHECK_FALSE(path_exists(result.value() + "/electron"));
    CHECK(read_file(result.value() + "/resources/LICENSE") == "MIT");
}

TEST_CASE("an output directory inside the app is not copied into itself") {
    TempDir temp;
    make_app(temp.sub("app"));
    auto config = base_config(temp);
    config.out = temp.sub("app/out");
    config.prune = false;

    // A previous build for another target already sits in the output dir
    write_file(temp.sub("app/out/MyApp-win32-x64/resources/app/index.js"), "old");

    std::vector<std::string> out_paths = {temp.sub("app/out/MyApp-win32-x64")};
    make_template(temp.sub("template"));
    auto created = StagingPipeline::create(config, temp.sub("template"), out_paths);
    REQUIRE(created.isOk());
    auto result = created.value()->run();
    REQUIRE(result.isOk());

    CHECK(path_exists(result.value() + "/resources/app/index.js"));
    CHECK_FALSE(path_exists(result.value() + "/resources/app/out/MyApp-win32-x64"));
}

TEST_CASE("every target of a multi-target config is packaged separately") {
    TempDir temp;
    make_app(temp.sub("app"));
    auto targets = expand_targets(base_config(temp), {"linux", "win32"}, {"x64", "arm64"});
    REQUIRE(targets.size() == 4);

    std::vector<std::string> out_paths;
    for (const auto& target : targets) {
        out_paths.push_back(final_path(target));
    }

    int index = 0;
    for (const auto& target : targets) {
        REQUIRE(validate_packaging_config(target).isOk());
        std::string template_dir = temp.sub("template-" + std::to_string(index++));
        make_template(template_dir);

        auto created = StagingPipeline::create(target, template_dir, out_paths);
        REQUIRE(created.isOk());
        auto result = created.value()->run();
        REQUIRE(result.isOk());
        CHECK(path_exists(result.value() + "/resources/app/index.js"));
    }

    CHECK(path_exists(temp.sub("out/MyApp-linux-x64")));
    CHECK(path_exists(temp.sub("out/MyApp-linux-arm64")));
    CHECK(path_exists(temp.sub("out/MyApp-win32-x64")));
    CHECK(path_exists(temp.sub("out/MyApp-win32-arm64")));
}

TEST_CASE("a failing after-copy hook leaves no output behind") {
    TempDir temp;
    make_app(temp.sub("app"));
    make_template(temp.sub("template"));
    auto config = base_config(temp);
    config.after_copy = {Hook::sync([](const HookInvocation&) {
        return Result<void>::err(Error(ErrorCode::HOOK_FAILED, "rejected"));
    }, "check")};

    auto created = StagingPipeline::create(config, temp.sub("template"));
    REQUIRE(created.isOk());
    auto result = created.value()->run();
    REQUIRE(result.isErr());
    CHECK(result.error().phase == PipelineState::PreHooksDone);
    CHECK(result.error().toString() == "PreHooksDone: HookFailed: hook check: rejected");
    CHECK_FALSE(path_exists(final_path(config)));

    // Dependencies were not pruned yet
    CHECK(path_exists(created.value()->context().resources_app_dir + "/node_modules/devdep"));
}
