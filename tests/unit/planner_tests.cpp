#include <doctest/doctest.h>
#include <pawkit/bundle.hpp>
#include <pawkit/planner.hpp>

#include "test_helpers.hpp"

using namespace pawkit;
using namespace pawkit::testing;

namespace {

Entry file_entry(const std::string& path, const std::string& source = "/scratch/x") {
    Entry e;
    e.path = path;
    e.kind = EntryKind::File;
    e.source_location = source;
    return e;
}

PlanEntry plan_entry(const std::string& destination, const std::string& source) {
    PlanEntry e;
    e.destination = destination;
    e.source_location = source;
    return e;
}

} // namespace

// ============================================================================
// Conflict Planning
// ============================================================================

TEST_CASE("first entry wins on duplicate destinations") {
    TempDir dir;
    auto table = scratch_locations(dir);

    auto r = plan_installation({
        file_entry("@documents/a.txt", "/s/first"),
        file_entry("@docs/a.txt", "/s/second"),
        file_entry("Wrap/@documents/a.txt", "/s/third"),
    }, table);

    REQUIRE(r.ok);
    REQUIRE(r.plan.entries.size() == 1);
    CHECK(r.plan.entries[0].source_location == "/s/first");
    CHECK(r.duplicates == 2);
}

TEST_CASE("existing destinations are conflicts") {
    TempDir dir;
    auto table = scratch_locations(dir);
    write_text(dir.sub("home/Documents/a.txt"), "old");

    auto r = plan_installation({file_entry("@documents/a.txt"), file_entry("@documents/b.txt")},
                               table);
    REQUIRE(r.ok);
    CHECK(r.plan.conflicts.size() == 1);
    CHECK(r.plan.conflicts.count(dir.sub("home/Documents/a.txt")) == 1);
}

TEST_CASE("dangling symlink at a destination is a conflict") {
    TempDir dir;
    auto table = scratch_locations(dir);
    fs::create_directories(dir.sub("home/Documents"));
    fs::create_symlink(dir.sub("nowhere"), dir.sub("home/Documents/a.txt"));

    auto r = plan_installation({file_entry("@documents/a.txt")}, table);
    REQUIRE(r.ok);
    CHECK(r.plan.has_conflicts());
}

TEST_CASE("planning twice gives the same conflicts") {
    TempDir dir;
    auto table = scratch_locations(dir);
    write_text(dir.sub("home/Desktop/n.txt"), "x");
    std::vector<Entry> entries = {file_entry("@desktop/n.txt"), file_entry("@desktop/m.txt")};

    auto first = plan_installation(entries, table);
    auto second = plan_installation(entries, table);
    CHECK(first.plan.conflicts == second.plan.conflicts);
    CHECK_FALSE(fs::exists(dir.sub("home/Desktop/m.txt")));
}

TEST_CASE("metadata destinations are never conflicts") {
    TempDir dir;
    auto table = scratch_locations(dir);
    write_text(dir.sub("data/pluginmetadata/data.json"), "{}");

    auto r = plan_installation({file_entry("metadata/data.json"), file_entry("@documents/a")},
                               table);
    REQUIRE(r.ok);
    CHECK_FALSE(r.plan.has_conflicts());
    CHECK(r.plan.entries[0].is_metadata);
}

TEST_CASE("only metadata means nothing to install") {
    TempDir dir;
    auto table = scratch_locations(dir);

    auto r = plan_installation({file_entry("metadata/data.json")}, table);
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::NoInstallableFiles);
    CHECK(r.error == "No valid files found to install");
}

TEST_CASE("rejected paths are listed in the error") {
    TempDir dir;
    auto table = scratch_locations(dir);

    auto r = plan_installation({
        file_entry("readme.txt"),
        file_entry("src/a.c"),
        file_entry("src/b.c"),
        file_entry("src/c.c"),
    }, table);

    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::NoInstallableFiles);
    CHECK(r.rejected.size() == 4);
    CHECK(r.error.find("readme.txt") != std::string::npos);
    CHECK(r.error.find("(and 1 more)") != std::string::npos);
    CHECK(r.error.find("@documents") != std::string::npos);
}

TEST_CASE("directories and junk are skipped") {
    TempDir dir;
    auto table = scratch_locations(dir);
    Entry d;
    d.path = "@documents/Proj";
    d.kind = EntryKind::Directory;

    auto r = plan_installation({d, file_entry("@documents/._a"), file_entry("@documents/a")},
                               table);
    REQUIRE(r.ok);
    CHECK(r.plan.entries.size() == 1);
    CHECK(r.rejected.empty());
}

// ============================================================================
// Bundle Grouping
// ============================================================================

TEST_CASE("bundle root requires a Contents segment") {
    CHECK(bundle_root_of("/Applications/Tool.app/Contents/MacOS/Tool").value() ==
          "/Applications/Tool.app");
    CHECK_FALSE(bundle_root_of("/Applications/Tool.app/readme.txt").has_value());
    CHECK_FALSE(bundle_root_of("/Docs/notes.app").has_value());
    CHECK(bundle_entry_point("/Applications/Tool.app") == "/Applications/Tool.app/Contents/MacOS/Tool");
}

TEST_CASE("entries are grouped by bundle root") {
    auto g = group_bundles({
        plan_entry("/A/Tool.app/Contents/Info.plist", "/s/x/Tool.app/Contents/Info.plist"),
        plan_entry("/A/Tool.app/Contents/MacOS/Tool", "/s/x/Tool.app/Contents/MacOS/Tool"),
        plan_entry("/D/readme.txt", "/s/readme.txt"),
    });

    REQUIRE(g.units.size() == 1);
    CHECK(g.units[0].root_path == "/A/Tool.app");
    CHECK(g.units[0].members.size() == 2);
    CHECK(g.units[0].source_root.value() == "/s/x/Tool.app");
    REQUIRE(g.loose.size() == 1);
    CHECK(g.loose[0].destination == "/D/readme.txt");
}

TEST_CASE("bundle assembled from several sources has no source root") {
    auto g = group_bundles({
        plan_entry("/A/Tool.app/Contents/Info.plist", "/s/one/Tool.app/Contents/Info.plist"),
        plan_entry("/A/Tool.app/Contents/MacOS/Tool", "/s/two/Tool.app/Contents/MacOS/Tool"),
    });

    REQUIRE(g.units.size() == 1);
    CHECK_FALSE(g.units[0].source_root.has_value());
}

TEST_CASE("metadata entries stay loose") {
    auto e = plan_entry("/m/Tool.app/Contents/x", "/s/Tool.app/Contents/x");
    e.is_metadata = true;
    auto g = group_bundles({e});
    CHECK(g.units.empty());
    CHECK(g.loose.size() == 1);
}

TEST_CASE("recorded destinations group by bundle root") {
    auto g = group_destinations({
        "/A/Tool.app/Contents/Info.plist",
        "/D/a.txt",
        "/A/Tool.app/Contents/MacOS/Tool",
    });
    REQUIRE(g.roots.size() == 1);
    CHECK(g.roots[0] == "/A/Tool.app");
    REQUIRE(g.loose.size() == 1);
    CHECK(g.loose[0] == "/D/a.txt");
}
