#include <doctest/doctest.h>
#include <fsgate/containment.hpp>

using fsgate::dedupe_roots;
using fsgate::find_containing_root;
using fsgate::is_contained;

TEST_CASE("root contains itself") {
    CHECK(is_contained("/home/user/project", "/home/user/project"));
}

TEST_CASE("root contains descendants") {
    CHECK(is_contained("/home/user/project/src/main.cpp", "/home/user/project"));
    CHECK(is_contained("/home/user/project/a", "/home/user/project/"));
}

TEST_CASE("sibling with shared prefix is not contained") {
    CHECK_FALSE(is_contained("/allowed-evil", "/allowed"));
    CHECK_FALSE(is_contained("/allowed-evil/file", "/allowed"));
    CHECK_FALSE(is_contained("/allowedfile", "/allowed"));
}

TEST_CASE("parent is not contained in child") {
    CHECK_FALSE(is_contained("/home/user", "/home/user/project"));
    CHECK_FALSE(is_contained("/", "/home"));
}

TEST_CASE("filesystem root contains every absolute path") {
    CHECK(is_contained("/", "/"));
    CHECK(is_contained("/etc/passwd", "/"));
    CHECK_FALSE(is_contained("relative/path", "/"));
}

TEST_CASE("empty arguments are never contained") {
    CHECK_FALSE(is_contained("", "/"));
    CHECK_FALSE(is_contained("/a", ""));
}

TEST_CASE("root set containment is order independent") {
    std::vector<std::string> roots = {"/srv/data", "/home/user"};
    std::vector<std::string> reversed = {"/home/user", "/srv/data"};

    for (const char* candidate : {"/home/user/x", "/srv/data", "/srv/database", "/tmp"}) {
        CHECK(is_contained(candidate, roots) == is_contained(candidate, reversed));
    }
    CHECK(is_contained("/srv/data/file", roots));
    CHECK_FALSE(is_contained("/srv/database", roots));
}

TEST_CASE("find_containing_root reports first match") {
    std::vector<std::string> roots = {"/a/b", "/a"};
    auto index = find_containing_root("/a/b/c", roots);
    REQUIRE(index.has_value());
    CHECK(*index == 0);

    CHECK_FALSE(find_containing_root("/z", roots).has_value());
}

TEST_CASE("dedupe_roots strips trailing separators and duplicates") {
    auto roots = dedupe_roots({"/a/", "/a", "/b//", "", "/"});
    REQUIRE(roots.size() == 3);
    CHECK(roots[0] == "/a");
    CHECK(roots[1] == "/b");
    CHECK(roots[2] == "/");
}
