#include <doctest/doctest.h>
#include <appstage/glob.hpp>

using namespace appstage;

TEST_CASE("expand_braces produces one pattern per alternative") {
    auto expanded = expand_braces("*.{node,dll}");
    REQUIRE(expanded.size() == 2);
    CHECK(expanded[0] == "*.node");
    CHECK(expanded[1] == "*.dll");

    CHECK(expand_braces("plain").size() == 1);
    CHECK(expand_braces("{a,b}/{c,d}").size() == 4);
}

TEST_CASE("expand_braces leaves an unclosed brace alone") {
    auto expanded = expand_braces("file{a,b");
    REQUIRE(expanded.size() == 1);
    CHECK(expanded[0] == "file{a,b");
}

TEST_CASE("glob without a slash matches the basename") {
    CHECK(glob_match("*.node", "addon.node"));
    CHECK(glob_match("*.node", "build/Release/addon.node"));
    CHECK_FALSE(glob_match("*.node", "addon.node.map"));
    CHECK(glob_match("?.txt", "dir/a.txt"));
    CHECK_FALSE(glob_match("?.txt", "dir/ab.txt"));
}

TEST_CASE("glob with a slash matches whole segments") {
    CHECK(glob_match("native/*.so", "native/lib.so"));
    CHECK_FALSE(glob_match("native/*.so", "other/native/lib.so"));
    CHECK_FALSE(glob_match("native/*", "native/sub/lib.so"));
}

TEST_CASE("double star spans any number of segments") {
    CHECK(glob_match("**/*.node", "addon.node"));
    CHECK(glob_match("**/*.node", "node_modules/a/build/addon.node"));
    CHECK(glob_match("node_modules/**", "node_modules/a/b"));
    CHECK(glob_match("a/**/z", "a/z"));
    CHECK(glob_match("a/**/z", "a/b/c/z"));
    CHECK_FALSE(glob_match("a/**/z", "b/z"));
}

TEST_CASE("glob_match tries every brace alternative") {
    CHECK(glob_match("*.{node,dll}", "x/addon.dll"));
    CHECK(glob_match("{bin,lib}/**", "lib/tool"));
    CHECK_FALSE(glob_match("*.{node,dll}", "x/addon.so"));
}
