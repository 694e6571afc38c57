#include <doctest/doctest.h>
#include <pawkit/path_utils.hpp>

using pawkit::PathError;
using pawkit::is_within;
using pawkit::place_under_root;

TEST_CASE("place simple member under root") {
    auto r = place_under_root("/tmp/x/extracted", "dir/file.txt");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/x/extracted/dir/file.txt");
    CHECK(r.relative == "dir/file.txt");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = place_under_root("/tmp/x/extracted", "./a/../b/./file");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/x/extracted/b/file");
}

TEST_CASE("reject member escaping the root") {
    auto r = place_under_root("/tmp/x/extracted", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute member names") {
    auto r = place_under_root("/tmp/x/extracted", "/etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject NUL bytes") {
    std::string bad = std::string("dir/\0file", 9);
    auto r = place_under_root("/tmp/x/extracted", bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}

TEST_CASE("reject empty member name") {
    auto r = place_under_root("/tmp/x/extracted", "");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::Empty);
}

TEST_CASE("backslash separators are normalized") {
    auto r = place_under_root("/tmp/x/extracted", "dir\\sub\\file");
    REQUIRE(r.ok);
    CHECK(r.path.find('\\') == std::string::npos);
}

TEST_CASE("is_within compares whole segments") {
    CHECK(is_within("/home/u/Documents", "/home/u/Documents"));
    CHECK(is_within("/home/u/Documents", "/home/u/Documents/a/b"));
    CHECK_FALSE(is_within("/home/u/Documents", "/home/u/DocumentsOld/a"));
    CHECK_FALSE(is_within("/home/u/Documents", "/home/u"));
}
