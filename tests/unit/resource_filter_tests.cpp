#include <doctest/doctest.h>
#include <appstage/resource_filter.hpp>
#include <appstage/result.hpp>

#include "../test_support.hpp"

using namespace appstage;
using appstage::test::TempDir;

namespace {

PackagingConfig config_for(const std::string& dir) {
    PackagingConfig config;
    config.name = "MyApp";
    config.platform = "linux";
    config.arch = "x64";
    config.dir = dir;
    config.out = dir + "/out";
    return config;
}

} // namespace

TEST_CASE("is_junk_file recognizes OS metadata files") {
    CHECK(is_junk_file(".DS_Store"));
    CHECK(is_junk_file("Thumbs.db"));
    CHECK(is_junk_file("._resource"));
    CHECK(is_junk_file("notes.txt~"));
    CHECK(is_junk_file("npm-debug.log"));
    CHECK_FALSE(is_junk_file("index.js"));
    CHECK_FALSE(is_junk_file("package.json"));
}

TEST_CASE("ignore filter accepts ordinary app files") {
    auto result = make_ignore_filter(config_for("/src/app"));
    REQUIRE(result.ok);

    CHECK(result.filter("/src/app"));
    CHECK(result.filter("/src/app/index.js"));
    CHECK(result.filter("/src/app/node_modules/dep/index.js"));
}

TEST_CASE("ignore filter applies the default patterns") {
    auto result = make_ignore_filter(config_for("/src/app"));
    REQUIRE(result.ok);

    CHECK_FALSE(result.filter("/src/app/.git"));
    CHECK_FALSE(result.filter("/src/app/.git/HEAD"));
    CHECK_FALSE(result.filter("/src/app/package-lock.json"));
    CHECK_FALSE(result.filter("/src/app/yarn.lock"));
    CHECK_FALSE(result.filter("/src/app/node_modules/.bin"));
    CHECK_FALSE(result.filter("/src/app/native/addon.o"));
    CHECK(result.filter("/src/app/.gitignore"));
}

TEST_CASE("ignore filter honors user patterns on the relative path") {
    auto config = config_for("/src/app");
    config.ignore = {"^/test($|/)", "\\.map$"};
    auto result = make_ignore_filter(config);
    REQUIRE(result.ok);

    CHECK_FALSE(result.filter("/src/app/test"));
    CHECK_FALSE(result.filter("/src/app/test/unit.js"));
    CHECK_FALSE(result.filter("/src/app/dist/bundle.js.map"));
    CHECK(result.filter("/src/app/lib/test.js"));
    CHECK(result.filter("/src/app/testing"));
}

TEST_CASE("ignore filter skips junk files unless junk filtering is off") {
    auto config = config_for("/src/app");
    auto with_junk = make_ignore_filter(config);
    REQUIRE(with_junk.ok);
    CHECK_FALSE(with_junk.filter("/src/app/assets/.DS_Store"));

    config.junk = false;
    auto without_junk = make_ignore_filter(config);
    REQUIRE(without_junk.ok);
    CHECK(without_junk.filter("/src/app/assets/.DS_Store"));
}

TEST_CASE("ignore filter excludes output directories inside the app") {
    auto config = config_for("/src/app");
    auto result = make_ignore_filter(config, {"/src/app/out/MyApp-win32-x64"});
    REQUIRE(result.ok);

    CHECK_FALSE(result.filter("/src/app/out/MyApp-linux-x64"));
    CHECK_FALSE(result.filter("/src/app/out/MyApp-win32-x64"));
    CHECK(result.filter("/src/app/out"));
    CHECK(result.filter("/src/app/out/notes.txt"));
}

TEST_CASE("ignore filter accepts the source root with a trailing separator") {
    TempDir temp;
    auto config = config_for(temp.sub("app"));
    auto result = make_ignore_filter(config);
    REQUIRE(result.ok);

    CHECK(result.filter(temp.sub("app") + "/"));
    CHECK(result.filter(temp.sub("app/main.js")));
    CHECK_FALSE(result.filter(temp.sub("app/.git")));
}

TEST_CASE("ignore filter rejects an invalid pattern") {
    auto config = config_for("/src/app");
    config.ignore = {"(unclosed"};
    auto result = make_ignore_filter(config);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("(unclosed") != std::string::npos);
}
