#pragma once

#include "pawkit/manifest_store.hpp"
#include "pawkit/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Transport
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
};

// file://<path>, a plain local path, or http(s):// (libcurl, TLS verified)
FetchResult fetch_url(const std::string& url);

// ============================================================================
// Repository Index
// ============================================================================

struct RepositoryPackage {
    std::string name;
    std::string download_url;
    std::string version;                // Empty when the index gives none
    nlohmann::json record = nlohmann::json::object();  // Entry as listed
};

struct RepositoryIndex {
    std::string name;                   // repositoryName, name or "Unknown Repository"
    std::map<std::string, RepositoryPackage> packages;

    const RepositoryPackage* find(const std::string& package_name) const;
};

struct IndexParseResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    RepositoryIndex index;
};

// Accepts a "paws" mapping keyed by package name, or an "apps" list of
// records carrying "pawName" and "downloadURL"/"downloadUrl".
// Entries without a download URL are skipped.
IndexParseResult parse_repository_index(const std::string& json_str);

// ============================================================================
// Repository List (repos.json)
// ============================================================================

struct RepositoryEntry {
    std::string name;
    std::string url;
    std::string added_date;
    std::string last_updated;
};

struct RepoListResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::vector<RepositoryEntry> repositories;
};

struct RepoAddResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    RepositoryEntry entry;
};

struct IndexFetchResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    RepositoryIndex index;
};

struct PackageLookupResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    RepositoryPackage package;
    RepositoryEntry repository;
};

struct VersionLookupResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::string version;
};

class RepoStore {
public:
    explicit RepoStore(std::string path);

    RepoListResult list() const;

    // Fetch and parse the index first; duplicate URLs are rejected
    RepoAddResult add(const std::string& url);

    // NotFound if no repository has that name
    StoreResult remove(const std::string& name);

    // Re-fetch the index and stamp lastUpdated
    StoreResult refresh(const std::string& name);

    IndexFetchResult fetch_index(const RepositoryEntry& repository) const;

    // First repository (in list order) that carries the package. Repositories
    // that fail to fetch are logged and skipped.
    PackageLookupResult find_package(const std::string& package_name) const;

    // Highest version of the package across all repositories
    VersionLookupResult latest_version(const std::string& package_name) const;

private:
    StoreResult write(const std::vector<RepositoryEntry>& repositories);

    std::string path_;
};

} // namespace pawkit
