#include <doctest/doctest.h>
#include <pawkit/repository.hpp>

#include "test_helpers.hpp"

using namespace pawkit;
using namespace pawkit::testing;

namespace {

std::string write_index(const TempDir& dir, const std::string& file, const nlohmann::json& j) {
    std::string path = dir.sub(file);
    write_text(path, j.dump());
    return path;
}

} // namespace

// ============================================================================
// Index Parsing
// ============================================================================

TEST_CASE("paws mapping is keyed by package name") {
    auto r = parse_repository_index(R"({
        "repositoryName": "Main",
        "paws": {
            "Sample": {"version": "1.2.0", "downloadURL": "https://example.com/Sample.paw"},
            "NoUrl": {"version": "1.0.0"}
        }
    })");
    REQUIRE(r.ok);
    CHECK(r.index.name == "Main");
    REQUIRE(r.index.find("Sample") != nullptr);
    CHECK(r.index.find("Sample")->version == "1.2.0");
    CHECK(r.index.find("Sample")->download_url == "https://example.com/Sample.paw");
    CHECK(r.index.find("NoUrl") == nullptr);
}

TEST_CASE("apps list uses pawName and either URL spelling") {
    auto r = parse_repository_index(R"({
        "name": "Alt",
        "apps": [
            {"pawName": "One", "downloadUrl": "file:///tmp/one.paw"},
            {"pawName": "Two", "downloadURL": "file:///tmp/two.paw", "version": "3"},
            {"downloadURL": "file:///tmp/anonymous.paw"}
        ]
    })");
    REQUIRE(r.ok);
    CHECK(r.index.name == "Alt");
    CHECK(r.index.packages.size() == 2);
    CHECK(r.index.find("One")->version.empty());
    CHECK(r.index.find("Two")->version == "3");
}

TEST_CASE("unnamed repository gets a placeholder name") {
    auto r = parse_repository_index(R"({"paws": {}})");
    REQUIRE(r.ok);
    CHECK(r.index.name == "Unknown Repository");
}

TEST_CASE("malformed index is InvalidDocument") {
    CHECK(parse_repository_index("not json").code == ErrorCode::InvalidDocument);
    CHECK(parse_repository_index("[]").code == ErrorCode::InvalidDocument);
}

// ============================================================================
// Transport
// ============================================================================

TEST_CASE("local files are fetched by path or file URL") {
    TempDir dir;
    write_text(dir.sub("blob.bin"), "bytes");

    auto by_path = fetch_url(dir.sub("blob.bin"));
    REQUIRE(by_path.ok);
    CHECK(std::string(by_path.data.begin(), by_path.data.end()) == "bytes");

    auto by_url = fetch_url("file://" + dir.sub("blob.bin"));
    REQUIRE(by_url.ok);
    CHECK(by_url.data.size() == 5);

    CHECK_FALSE(fetch_url(dir.sub("missing.bin")).ok);
    CHECK_FALSE(fetch_url("gopher://example.com/x").ok);
}

// ============================================================================
// Repository Store
// ============================================================================

TEST_CASE("adding a repository records its name") {
    TempDir dir;
    auto index = write_index(dir, "index.json", {
        {"repositoryName", "Local"},
        {"paws", {{"Sample", {{"version", "1.0.0"}, {"downloadURL", "file:///x.paw"}}}}},
    });

    RepoStore repos(dir.sub("repos.json"));
    auto added = repos.add("file://" + index);
    REQUIRE(added.ok);
    CHECK(added.entry.name == "Local");
    CHECK_FALSE(added.entry.added_date.empty());

    auto listed = repos.list();
    REQUIRE(listed.ok);
    REQUIRE(listed.repositories.size() == 1);
    CHECK(listed.repositories[0].url == "file://" + index);
}

TEST_CASE("duplicate repository URL is rejected") {
    TempDir dir;
    auto index = write_index(dir, "index.json", {{"repositoryName", "Local"}});

    RepoStore repos(dir.sub("repos.json"));
    REQUIRE(repos.add(index).ok);
    auto again = repos.add(index);
    CHECK_FALSE(again.ok);
    CHECK(again.error.find("already exists") != std::string::npos);
}

TEST_CASE("unreachable repository is not added") {
    TempDir dir;
    RepoStore repos(dir.sub("repos.json"));
    CHECK_FALSE(repos.add(dir.sub("missing.json")).ok);
    CHECK(repos.list().repositories.empty());
}

TEST_CASE("removing and refreshing unknown repositories is NotFound") {
    TempDir dir;
    RepoStore repos(dir.sub("repos.json"));
    CHECK(repos.remove("Nope").code == ErrorCode::NotFound);
    CHECK(repos.refresh("Nope").code == ErrorCode::NotFound);
}

TEST_CASE("refresh stamps the update time") {
    TempDir dir;
    auto index = write_index(dir, "index.json", {{"repositoryName", "Local"}});
    RepoStore repos(dir.sub("repos.json"));
    REQUIRE(repos.add(index).ok);

    REQUIRE(repos.refresh("Local").ok);
    CHECK_FALSE(repos.list().repositories[0].last_updated.empty());

    REQUIRE(repos.remove("Local").ok);
    CHECK(repos.list().repositories.empty());
}

TEST_CASE("package lookup skips broken repositories") {
    TempDir dir;
    auto broken = write_index(dir, "broken.json", {{"repositoryName", "Broken"}});
    auto good = write_index(dir, "good.json", {
        {"repositoryName", "Good"},
        {"paws", {{"Sample", {{"version", "1.5"}, {"downloadURL", "file:///s.paw"}}}}},
    });

    RepoStore repos(dir.sub("repos.json"));
    REQUIRE(repos.add(broken).ok);
    REQUIRE(repos.add(good).ok);
    write_text(broken, "{ corrupted");

    auto found = repos.find_package("Sample");
    REQUIRE(found.ok);
    CHECK(found.repository.name == "Good");
    CHECK(found.package.download_url == "file:///s.paw");

    CHECK(repos.find_package("Missing").code == ErrorCode::NotFound);
}

TEST_CASE("latest version is the highest across repositories") {
    TempDir dir;
    auto a = write_index(dir, "a.json", {
        {"repositoryName", "A"},
        {"paws", {{"Sample", {{"version", "1.9.9"}, {"downloadURL", "file:///a.paw"}}}}},
    });
    auto b = write_index(dir, "b.json", {
        {"repositoryName", "B"},
        {"paws", {{"Sample", {{"version", "2.0"}, {"downloadURL", "file:///b.paw"}}}}},
    });

    RepoStore repos(dir.sub("repos.json"));
    REQUIRE(repos.add(a).ok);
    REQUIRE(repos.add(b).ok);

    auto latest = repos.latest_version("Sample");
    REQUIRE(latest.ok);
    CHECK(latest.version == "2.0");
}
