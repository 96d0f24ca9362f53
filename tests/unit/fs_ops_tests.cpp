#include <doctest/doctest.h>
#include <appstage/platform.hpp>

#include "../test_support.hpp"

#include <stdexcept>

using namespace appstage;
using namespace appstage::test;

TEST_CASE("get_filename ignores a trailing separator") {
    CHECK(get_filename("/a/b/LICENSE") == "LICENSE");
    CHECK(get_filename("/a/b/assets/") == "assets");
    CHECK(get_filename("icon.png") == "icon.png");
}

TEST_CASE("join_path uses forward slashes") {
    CHECK(join_path("/out", "MyApp-linux-x64") == "/out/MyApp-linux-x64");
    CHECK(join_path("a/b", "c/d") == "a/b/c/d");
}

TEST_CASE("copy_tree copies nested directories and file contents") {
    TempDir temp;
    write_file(temp.sub("src/a.txt"), "A");
    write_file(temp.sub("src/sub/b.txt"), "B");

    auto result = copy_tree(temp.sub("src"), temp.sub("dst"), CopyOptions{});
    REQUIRE(result.ok);
    CHECK(read_file(temp.sub("dst/a.txt")) == "A");
    CHECK(read_file(temp.sub("dst/sub/b.txt")) == "B");
}

TEST_CASE("copy_tree skips entries the filter rejects") {
    TempDir temp;
    write_file(temp.sub("src/keep.txt"), "keep");
    write_file(temp.sub("src/skip.txt"), "skip");
    write_file(temp.sub("src/skipdir/inner.txt"), "inner");

    CopyOptions options;
    options.filter = [](const std::string& path) {
        return path.find("skip") == std::string::npos;
    };

    auto result = copy_tree(temp.sub("src"), temp.sub("dst"), options);
    REQUIRE(result.ok);
    CHECK(path_exists(temp.sub("dst/keep.txt")));
    CHECK_FALSE(path_exists(temp.sub("dst/skip.txt")));
    CHECK_FALSE(path_exists(temp.sub("dst/skipdir")));
}

TEST_CASE("copy_tree reports a filter that throws") {
    TempDir temp;
    write_file(temp.sub("src/a.txt"), "A");

    CopyOptions options;
    options.filter = [](const std::string& path) -> bool {
        if (path.find("a.txt") != std::string::npos) throw std::runtime_error("bad filter");
        return true;
    };

    auto result = copy_tree(temp.sub("src"), temp.sub("dst"), options);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("bad filter") != std::string::npos);
}

TEST_CASE("copy_tree reports a filter that throws a non-standard value") {
    TempDir temp;
    write_file(temp.sub("src/a.txt"), "A");

    CopyOptions options;
    options.filter = [](const std::string& path) -> bool {
        if (path.find("a.txt") != std::string::npos) throw 42;
        return true;
    };

    auto result = copy_tree(temp.sub("src"), temp.sub("dst"), options);
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("filter failed") != std::string::npos);
    CHECK_FALSE(path_exists(temp.sub("dst/a.txt")));
}

TEST_CASE("copy_tree fails for a missing source") {
    TempDir temp;
    auto result = copy_tree(temp.sub("missing"), temp.sub("dst"), CopyOptions{});
    CHECK_FALSE(result.ok);
}

#ifndef _WIN32
TEST_CASE("copy_tree dereferences symlinks only when asked") {
    TempDir temp;
    write_file(temp.sub("src/real.txt"), "real");
    std::filesystem::create_symlink("real.txt", temp.sub("src/link.txt"));

    CopyOptions keep_links;
    keep_links.dereference = false;
    REQUIRE(copy_tree(temp.sub("src"), temp.sub("links"), keep_links).ok);
    CHECK(std::filesystem::is_symlink(temp.sub("links/link.txt")));

    CopyOptions deref;
    deref.dereference = true;
    REQUIRE(copy_tree(temp.sub("src"), temp.sub("deref"), deref).ok);
    CHECK_FALSE(std::filesystem::is_symlink(temp.sub("deref/link.txt")));
    CHECK(read_file(temp.sub("deref/link.txt")) == "real");
}
#endif

TEST_CASE("move_path renames a directory") {
    TempDir temp;
    write_file(temp.sub("from/file.txt"), "x");

    auto result = move_path(temp.sub("from"), temp.sub("nested/to"), false);
    REQUIRE(result.ok);
    CHECK_FALSE(path_exists(temp.sub("from")));
    CHECK(read_file(temp.sub("nested/to/file.txt")) == "x");
}

TEST_CASE("move_path respects the overwrite flag") {
    TempDir temp;
    write_file(temp.sub("from/new.txt"), "new");
    write_file(temp.sub("to/old.txt"), "old");

    auto refused = move_path(temp.sub("from"), temp.sub("to"), false);
    CHECK_FALSE(refused.ok);
    CHECK(path_exists(temp.sub("from/new.txt")));
    CHECK(path_exists(temp.sub("to/old.txt")));

    auto replaced = move_path(temp.sub("from"), temp.sub("to"), true);
    REQUIRE(replaced.ok);
    CHECK(path_exists(temp.sub("to/new.txt")));
    CHECK_FALSE(path_exists(temp.sub("to/old.txt")));
}

TEST_CASE("remove_if_exists treats a missing path as success") {
    TempDir temp;
    write_file(temp.sub("dir/file.txt"), "x");

    CHECK(remove_if_exists(temp.sub("dir")).ok);
    CHECK_FALSE(path_exists(temp.sub("dir")));
    CHECK(remove_if_exists(temp.sub("dir")).ok);
}

TEST_CASE("atomic_write_file creates the file with the given bytes") {
    TempDir temp;
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    REQUIRE(atomic_write_file(temp.sub("out.bin"), data).ok);
    CHECK(read_file(temp.sub("out.bin")) == "abc");
}
