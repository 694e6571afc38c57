#include <doctest/doctest.h>
#include <pawkit/remover.hpp>

#include "test_helpers.hpp"

#include <algorithm>
#include <memory>

using namespace pawkit;
using namespace pawkit::testing;

namespace {

InstalledRecord record_with(std::vector<std::string> files,
                            std::vector<std::string> extra_paths = {}) {
    InstalledRecord record;
    record.version = "1.0.0";
    record.files = std::move(files);
    record.descriptor = default_descriptor("Sample");
    record.descriptor.extra_paths = std::move(extra_paths);
    return record;
}

// Reports success but leaves the tree in place
class InertEscalatedDeleter : public EscalatedDeleter {
public:
    const char* name() const override { return "inert"; }
    ToolResult remove_tree(const std::string&) const override { return ToolResult{true, ""}; }
};

} // namespace

TEST_CASE("recorded files are removed") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    write_text(dir.sub("home/Documents/a.txt"), "a");
    write_text(dir.sub("home/Documents/b.txt"), "b");

    std::vector<std::string> removed_events;
    auto outcome = remove_record_files(
        record_with({dir.sub("home/Documents/a.txt"), dir.sub("home/Documents/b.txt")}),
        table, tools,
        [&](const ProgressEvent& e) { removed_events.push_back(e.path); });

    CHECK(outcome.removed == 2);
    CHECK(outcome.failed.empty());
    CHECK(removed_events.size() == 2);
    CHECK_FALSE(fs::exists(dir.sub("home/Documents/a.txt")));
}

TEST_CASE("files already gone are neither removed nor failed") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();

    auto outcome = remove_record_files(record_with({dir.sub("home/Documents/gone.txt")}),
                                       table, tools);
    CHECK(outcome.removed == 0);
    CHECK(outcome.failed.empty());
}

TEST_CASE("bundles are removed as one unit") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    std::string root = dir.sub("home/Applications/Tool.app");
    write_text(root + "/Contents/Info.plist", "p");
    write_text(root + "/Contents/MacOS/Tool", "t");
    write_text(root + "/Contents/Resources/untracked", "u");

    auto outcome = remove_record_files(
        record_with({root + "/Contents/Info.plist", root + "/Contents/MacOS/Tool"}), table, tools);
    CHECK(outcome.failed.empty());
    CHECK(outcome.removed == 1);
    CHECK_FALSE(fs::exists(root));
}

TEST_CASE("declared paths are expanded and removed") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    write_text(dir.sub("home/Library/Caches/Sample/cache.db"), "c");
    write_text(dir.sub("home/Library/Application Support/Sample/state"), "s");

    auto outcome = remove_record_files(
        record_with({}, {"~/Library/Caches/Sample", "@applicationSupport/Sample"}), table, tools);
    CHECK(outcome.failed.empty());
    CHECK(outcome.removed == 2);
    CHECK_FALSE(fs::exists(dir.sub("home/Library/Caches/Sample")));
    CHECK_FALSE(fs::exists(dir.sub("home/Library/Application Support/Sample")));
    CHECK(fs::exists(dir.sub("home/Library/Application Support")));
}

TEST_CASE("relative declared path fails") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();

    auto outcome = remove_record_files(record_with({}, {"relative/path"}), table, tools);
    REQUIRE(outcome.failed.size() == 1);
    CHECK(outcome.failed[0].path == "relative/path");
    CHECK(outcome.failed[0].reason == "not an absolute path");
}

TEST_CASE("base locations are never removed") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    write_text(dir.sub("home/Documents/keep.txt"), "k");

    auto outcome = remove_record_files(record_with({}, {"~", "@documents", "/"}), table, tools);
    CHECK(outcome.failed.size() == 3);
    CHECK(fs::exists(dir.sub("home/Documents/keep.txt")));
}

TEST_CASE("declared paths above a base location are refused") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    write_text(dir.sub("otheruser/precious.txt"), "p");
    write_text(dir.sub("home/Documents/keep.txt"), "k");

    auto outcome = remove_record_files(
        record_with({}, {"~/..", "@documents/../..", "~/../../usr", dir.path()}), table, tools);
    CHECK(outcome.removed == 0);
    CHECK(outcome.failed.size() == 4);
    CHECK(fs::exists(dir.sub("otheruser/precious.txt")));
    CHECK(fs::exists(dir.sub("home/Documents/keep.txt")));
}

TEST_CASE("escalated removal leftovers are reported per child") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    tools.escalated_deleter = std::make_unique<InertEscalatedDeleter>();
    std::string target = dir.sub("home/Library/Application Support/Sample");
    write_text(target + "/one", "1");
    write_text(target + "/two", "2");

    auto outcome = remove_record_files(record_with({}, {"@applicationSupport/Sample"}), table, tools);
    CHECK(outcome.removed == 0);
    REQUIRE(outcome.failed.size() == 3);

    std::vector<std::string> paths;
    for (const auto& f : outcome.failed) {
        paths.push_back(f.path);
        CHECK(f.reason == "Could not be removed with elevated permissions");
    }
    std::sort(paths.begin(), paths.end());
    CHECK(paths[0] == target);
    CHECK(paths[1] == target + "/one");
    CHECK(paths[2] == target + "/two");
}

TEST_CASE("record is deleted even when some removals fail") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    ManifestStore store(dir.sub("data/paws.json"));

    // A non-empty directory recorded as a file cannot be removed with a plain unlink
    write_text(dir.sub("home/Documents/dir/child.txt"), "c");
    write_text(dir.sub("home/Documents/ok.txt"), "o");
    REQUIRE(store.save("Sample", record_with({dir.sub("home/Documents/dir"),
                                              dir.sub("home/Documents/ok.txt")})).ok);

    auto r = uninstall_package(store, "Sample", table, tools);
    REQUIRE(r.ok);
    CHECK(r.removed == 1);
    REQUIRE(r.failed.size() == 1);
    CHECK(r.failed[0].path == dir.sub("home/Documents/dir"));
    CHECK(store.load("Sample").code == ErrorCode::NotFound);
}

TEST_CASE("uninstalling an unknown package is NotInstalled") {
    TempDir dir;
    auto table = scratch_locations(dir);
    auto tools = Toolset::portable();
    ManifestStore store(dir.sub("data/paws.json"));

    auto r = uninstall_package(store, "Ghost", table, tools);
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::NotInstalled);
}

// ============================================================================
// Failure Report
// ============================================================================

TEST_CASE("failure report groups by directory") {
    std::vector<RemovalFailure> failed = {
        {"/opt/a/one", "Permission denied"},
        {"/opt/a/two", "Permission denied"},
        {"/opt/b/three", "Busy"},
    };

    auto report = format_failure_report(failed, Platform::Linux);
    CHECK(report.find("Failed to remove 3 item(s):") == 0);
    CHECK(report.find("  /opt/a/\n    - one (Permission denied)\n    - two") != std::string::npos);
    CHECK(report.find("To remove them manually, run:") != std::string::npos);
    CHECK(report.find("  rm -rf \"/opt/b/three\"") != std::string::npos);
    CHECK(report.find("sudo") == std::string::npos);
}

TEST_CASE("failure report truncates long command lists") {
    std::vector<RemovalFailure> failed;
    for (int i = 0; i < 7; ++i) {
        failed.push_back({"/opt/x/f" + std::to_string(i), "denied"});
    }
    auto report = format_failure_report(failed, Platform::Linux);
    CHECK(report.find("# ... and 2 more items") != std::string::npos);
}

TEST_CASE("macOS failure report uses batched sudo scripts") {
    std::vector<RemovalFailure> failed;
    for (int i = 0; i < 6; ++i) {
        failed.push_back({"/d" + std::to_string(i) + "/f", "denied"});
    }

    auto report = format_failure_report(failed, Platform::macOS);
    size_t scripts = 0;
    for (size_t pos = report.find("sudo sh -c"); pos != std::string::npos;
         pos = report.find("sudo sh -c", pos + 1)) {
        ++scripts;
    }
    CHECK(scripts == 2);
    CHECK(report.find("chflags -R 0 \"/d0/f\"") != std::string::npos);
    CHECK(report.find("Or remove the affected directories:") != std::string::npos);
    CHECK(report.find("# ... and 3 more directories") != std::string::npos);
}

TEST_CASE("empty failure list gives an empty report") {
    CHECK(format_failure_report({}, Platform::Linux).empty());
}
