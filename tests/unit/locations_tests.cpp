#include <doctest/doctest.h>
#include <pawkit/locations.hpp>

using namespace pawkit;

namespace {

LocationTable table() {
    return LocationTable::for_home("/home/u", "/home/u/.pawkit/pluginmetadata", Platform::Linux);
}

} // namespace

// ============================================================================
// Marker Resolution
// ============================================================================

TEST_CASE("documents marker maps under the home directory") {
    auto r = resolve(table(), "@documents/Proj/a.txt");
    REQUIRE(r.ok);
    CHECK(r.destination == "/home/u/Documents/Proj/a.txt");
    CHECK_FALSE(r.is_metadata);
}

TEST_CASE("marker aliases share a base directory") {
    auto t = table();
    CHECK(resolve(t, "@docs/a").destination == "/home/u/Documents/a");
    CHECK(resolve(t, "@document/a").destination == "/home/u/Documents/a");
    CHECK(resolve(t, "@applicationsupport/X/y").destination ==
          "/home/u/Library/Application Support/X/y");
}

TEST_CASE("catch-all segment before a marker is ignored") {
    auto r = resolve(table(), "@all/@desktop/note.txt");
    REQUIRE(r.ok);
    CHECK(r.destination == "/home/u/Desktop/note.txt");
}

TEST_CASE("wrapping directory before the marker is ignored") {
    auto r = resolve(table(), "MyPackage/@documents/Proj/a.txt");
    REQUIRE(r.ok);
    CHECK(r.destination == "/home/u/Documents/Proj/a.txt");
}

TEST_CASE("leading slashes dots and shadow folders are stripped") {
    CHECK(clean_archive_path("./@documents/a") == "@documents/a");
    CHECK(clean_archive_path("/@documents/a") == "@documents/a");
    CHECK(clean_archive_path("__MACOSX/@documents/a") == "@documents/a");
    CHECK(clean_archive_path("@documents\\a\\b") == "@documents/a/b");
}

TEST_CASE("applications marker depends on the platform") {
    auto mac = LocationTable::for_home("/Users/u", "/m", Platform::macOS);
    CHECK(resolve(mac, "@applications/Tool.app/Contents/Info.plist").destination ==
          "/Applications/Tool.app/Contents/Info.plist");

    auto linux_table = table();
    CHECK(resolve(linux_table, "@applications/Tool/bin").destination ==
          "/home/u/Applications/Tool/bin");
}

// ============================================================================
// Rejection
// ============================================================================

TEST_CASE("path without a marker is rejected") {
    auto r = resolve(table(), "Proj/a.txt");
    CHECK_FALSE(r.ok);
    CHECK(r.reason == RejectReason::NoMarker);
}

TEST_CASE("unknown marker is rejected") {
    auto r = resolve(table(), "@nowhere/a.txt");
    CHECK_FALSE(r.ok);
    CHECK(r.reason == RejectReason::UnknownMarker);
}

TEST_CASE("marker with nothing after it is rejected") {
    CHECK_FALSE(resolve(table(), "@documents").ok);
    CHECK_FALSE(resolve(table(), "@documents/").ok);
}

TEST_CASE("traversal after the marker is rejected") {
    auto r = resolve(table(), "@documents/../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.reason == RejectReason::Traversal);
}

TEST_CASE("empty path is rejected") {
    auto r = resolve(table(), "");
    CHECK_FALSE(r.ok);
    CHECK(r.reason == RejectReason::Empty);
}

// ============================================================================
// Metadata Classification
// ============================================================================

TEST_CASE("top-level metadata maps to the metadata directory") {
    auto r = resolve(table(), "metadata/data.json");
    REQUIRE(r.ok);
    CHECK(r.is_metadata);
    CHECK(r.destination == "/home/u/.pawkit/pluginmetadata/data.json");
}

TEST_CASE("wrapped metadata maps to the metadata directory") {
    auto r = resolve(table(), "Sample/metadata/icon.png");
    REQUIRE(r.ok);
    CHECK(r.is_metadata);
    CHECK(r.destination == "/home/u/.pawkit/pluginmetadata/icon.png");
}

TEST_CASE("metadata folder below a marker is an ordinary file") {
    auto r = resolve(table(), "@documents/Proj/metadata/x");
    REQUIRE(r.ok);
    CHECK_FALSE(r.is_metadata);
    CHECK(r.destination == "/home/u/Documents/Proj/metadata/x");
}

// ============================================================================
// Table Queries
// ============================================================================

TEST_CASE("application support is the escalated location") {
    auto t = table();
    CHECK(t.is_escalated("/home/u/Library/Application Support/Plug/file"));
    CHECK_FALSE(t.is_escalated("/home/u/Documents/file"));
    CHECK(t.is_metadata_path("/home/u/.pawkit/pluginmetadata/data.json"));
}

TEST_CASE("declared paths expand tilde and markers") {
    auto t = table();
    CHECK(expand_declared_path(t, "~/Music/Loops").value() == "/home/u/Music/Loops");
    CHECK(expand_declared_path(t, "~").value() == "/home/u");
    CHECK(expand_declared_path(t, "@preferences/com.x.plist").value() ==
          "/home/u/Library/Preferences/com.x.plist");
    CHECK(expand_declared_path(t, "/opt/tool").value() == "/opt/tool");
    CHECK_FALSE(expand_declared_path(t, "relative/path").has_value());
}
