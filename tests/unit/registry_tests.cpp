#include <doctest/doctest.h>
#include <pawkit/config_store.hpp>
#include <pawkit/manifest_store.hpp>
#include <pawkit/version.hpp>

#include "test_helpers.hpp"

using namespace pawkit;
using namespace pawkit::testing;

namespace {

InstalledRecord sample_record(const std::string& version) {
    InstalledRecord record;
    record.version = version;
    record.install_date = "2026-01-01T00:00:00Z";
    record.files = {"/home/u/Documents/a.txt", "/home/u/Documents/b.txt"};
    record.descriptor = default_descriptor("Sample");
    record.descriptor.version = version;
    record.source = "/tmp/Sample.paw";
    record.package_hash = "sha256:abc";
    return record;
}

} // namespace

// ============================================================================
// Manifest Store
// ============================================================================

TEST_CASE("missing manifest reads as empty") {
    TempDir dir;
    ManifestStore store(dir.sub("paws.json"));
    auto listed = store.list();
    REQUIRE(listed.ok);
    CHECK(listed.records.empty());
}

TEST_CASE("saved record loads back") {
    TempDir dir;
    ManifestStore store(dir.sub("paws.json"));
    REQUIRE(store.save("Sample", sample_record("1.0.0")).ok);

    auto loaded = store.load("Sample");
    REQUIRE(loaded.ok);
    CHECK(loaded.record.version == "1.0.0");
    CHECK(loaded.record.files.size() == 2);
    CHECK(loaded.record.source == "/tmp/Sample.paw");
    CHECK(loaded.record.package_hash == "sha256:abc");
    CHECK(loaded.record.descriptor.name == "Sample");
}

TEST_CASE("saving replaces the record and keeps others") {
    TempDir dir;
    ManifestStore store(dir.sub("paws.json"));
    REQUIRE(store.save("Sample", sample_record("1.0.0")).ok);
    REQUIRE(store.save("Other", sample_record("0.1")).ok);
    REQUIRE(store.save("Sample", sample_record("2.0.0")).ok);

    auto listed = store.list();
    REQUIRE(listed.ok);
    CHECK(listed.records.size() == 2);
    CHECK(listed.records["Sample"].version == "2.0.0");
}

TEST_CASE("loading an unknown package is NotFound") {
    TempDir dir;
    ManifestStore store(dir.sub("paws.json"));
    auto loaded = store.load("Nope");
    CHECK_FALSE(loaded.ok);
    CHECK(loaded.code == ErrorCode::NotFound);
}

TEST_CASE("removing a record leaves the others") {
    TempDir dir;
    ManifestStore store(dir.sub("paws.json"));
    REQUIRE(store.save("A", sample_record("1")).ok);
    REQUIRE(store.save("B", sample_record("1")).ok);
    REQUIRE(store.remove("A").ok);
    CHECK(store.remove("A").ok);

    auto listed = store.list();
    REQUIRE(listed.ok);
    CHECK(listed.records.count("A") == 0);
    CHECK(listed.records.count("B") == 1);
}

TEST_CASE("corrupt manifest is reported, not overwritten") {
    TempDir dir;
    write_text(dir.sub("paws.json"), "{ broken");
    ManifestStore store(dir.sub("paws.json"));

    auto listed = store.list();
    CHECK_FALSE(listed.ok);
    CHECK(listed.code == ErrorCode::InvalidDocument);

    CHECK_FALSE(store.save("A", sample_record("1")).ok);
    CHECK(read_text(dir.sub("paws.json")) == "{ broken");
}

TEST_CASE("manifest document uses the installed key") {
    TempDir dir;
    ManifestStore store(dir.sub("paws.json"));
    REQUIRE(store.save("Sample", sample_record("1.0.0")).ok);

    auto doc = nlohmann::json::parse(read_text(dir.sub("paws.json")));
    REQUIRE(doc.contains("installed"));
    CHECK(doc["installed"]["Sample"]["installDate"] == "2026-01-01T00:00:00Z");
    CHECK(doc["installed"]["Sample"]["metadata"]["name"] == "Sample");
}

// ============================================================================
// Configuration Store
// ============================================================================

TEST_CASE("missing config yields the defaults") {
    TempDir dir;
    ConfigStore config(dir.sub("config.json"));
    auto all = config.get_all();
    REQUIRE(all.ok);
    CHECK(all.value["confirm_installation"] == true);
    CHECK(all.value["verbose_logging"] == false);
    CHECK(config.get_bool("debug", true) == false);
}

TEST_CASE("boolean strings are stored as booleans") {
    TempDir dir;
    ConfigStore config(dir.sub("config.json"));
    REQUIRE(config.set("confirm_installation", "false").ok);
    REQUIRE(config.set("theme", "dark").ok);

    auto confirm = config.get("confirm_installation");
    REQUIRE(confirm.ok);
    CHECK(confirm.value.is_boolean());
    CHECK_FALSE(config.get_bool("confirm_installation", true));
    CHECK(config.get("theme").value == "dark");
}

TEST_CASE("unknown config key is NotFound") {
    TempDir dir;
    ConfigStore config(dir.sub("config.json"));
    auto r = config.get("nonexistent");
    CHECK_FALSE(r.ok);
    CHECK(r.code == ErrorCode::NotFound);
}

TEST_CASE("data directory layout") {
    auto paths = get_pawkit_paths("/data/pawkit");
    CHECK(paths.manifest_file == "/data/pawkit/paws.json");
    CHECK(paths.repos_file == "/data/pawkit/repos.json");
    CHECK(paths.config_file == "/data/pawkit/config.json");
    CHECK(paths.metadata_dir == "/data/pawkit/pluginmetadata");
    CHECK(resolve_pawkit_root(std::string("/explicit")) == "/explicit");
}

TEST_CASE("ensure structure creates the metadata directory") {
    TempDir dir;
    auto paths = get_pawkit_paths(dir.sub("root"));
    std::string error;
    REQUIRE(ensure_pawkit_structure(paths, error));
    CHECK(fs::is_directory(paths.metadata_dir));
}

// ============================================================================
// Version Comparison
// ============================================================================

TEST_CASE("missing components compare as zero") {
    CHECK(compare_versions("1.2", "1.2.0") == 0);
    CHECK(compare_versions("1.0", "1.0.1") < 0);
}

TEST_CASE("components compare numerically") {
    CHECK(compare_versions("2.0.0", "1.9.9") > 0);
    CHECK(compare_versions("1.10", "1.9") > 0);
    CHECK(compare_versions("0.0.0", "0.0.0") == 0);
}

TEST_CASE("non-numeric components count as zero") {
    CHECK(compare_versions("1.x", "1.0") == 0);
    CHECK(compare_versions("beta", "0") == 0);
}
