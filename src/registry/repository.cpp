#include "pawkit/repository.hpp"
#include "pawkit/platform.hpp"
#include "pawkit/version.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

namespace fs = std::filesystem;

namespace pawkit {

// ============================================================================
// Transport
// ============================================================================

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

FetchResult fetch_http(const std::string& url) {
    FetchResult result;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        result.error = "failed to initialize CURL";
        return result;
    }

    std::vector<uint8_t> buffer;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 300L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "pawkit/" PAWKIT_VERSION);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = std::string("HTTP request failed: ") +
                       (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return result;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);
    if (result.http_status < 200 || result.http_status >= 300) {
        result.error = "HTTP " + std::to_string(result.http_status) + " for " + url;
        return result;
    }

    result.data = std::move(buffer);
    result.ok = true;
    return result;
}

FetchResult fetch_local(const std::string& path) {
    FetchResult result;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "file not found: " + path;
        return result;
    }
    result.data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    result.ok = true;
    return result;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

FetchResult fetch_url(const std::string& url) {
    spdlog::debug("fetch: {}", url);
    if (starts_with(url, "file://")) {
        return fetch_local(url.substr(7));
    }
    if (starts_with(url, "http://") || starts_with(url, "https://")) {
        return fetch_http(url);
    }
    if (url.find("://") == std::string::npos) {
        return fetch_local(url);
    }

    FetchResult result;
    result.error = "unsupported URL scheme: " + url;
    return result;
}

// ============================================================================
// Repository Index
// ============================================================================

const RepositoryPackage* RepositoryIndex::find(const std::string& package_name) const {
    auto it = packages.find(package_name);
    return it == packages.end() ? nullptr : &it->second;
}

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<std::string> get_download_url(const nlohmann::json& j) {
    if (auto url = get_string(j, "downloadURL"); url && !url->empty()) {
        return url;
    }
    if (auto url = get_string(j, "downloadUrl"); url && !url->empty()) {
        return url;
    }
    return std::nullopt;
}

std::optional<RepositoryPackage> make_package(const std::string& name, const nlohmann::json& j) {
    if (name.empty() || !j.is_object()) {
        return std::nullopt;
    }
    auto url = get_download_url(j);
    if (!url) {
        spdlog::debug("repository: {} has no download URL", name);
        return std::nullopt;
    }

    RepositoryPackage package;
    package.name = name;
    package.download_url = *url;
    package.version = get_string(j, "version").value_or("");
    package.record = j;
    return package;
}

} // namespace

IndexParseResult parse_repository_index(const std::string& json_str) {
    IndexParseResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.code = ErrorCode::InvalidDocument;
        result.error = std::string("repository index is not valid JSON: ") + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.code = ErrorCode::InvalidDocument;
        result.error = "repository index must be a JSON object";
        return result;
    }

    if (auto name = get_string(j, "repositoryName"); name && !name->empty()) {
        result.index.name = *name;
    } else if (auto fallback = get_string(j, "name"); fallback && !fallback->empty()) {
        result.index.name = *fallback;
    } else {
        result.index.name = "Unknown Repository";
    }

    if (j.contains("paws") && j["paws"].is_object()) {
        for (auto& [name, entry] : j["paws"].items()) {
            if (auto package = make_package(name, entry)) {
                result.index.packages.emplace(name, std::move(*package));
            }
        }
    }

    if (j.contains("apps") && j["apps"].is_array()) {
        for (const auto& entry : j["apps"]) {
            if (!entry.is_object()) continue;
            auto name = get_string(entry, "pawName");
            if (!name) continue;
            if (auto package = make_package(*name, entry)) {
                result.index.packages.emplace(*name, std::move(*package));
            }
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Repository List
// ============================================================================

RepoStore::RepoStore(std::string path) : path_(std::move(path)) {}

RepoListResult RepoStore::list() const {
    RepoListResult result;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        result.ok = true;
        return result;
    }

    auto content = read_file(path_);
    if (!content) {
        result.code = ErrorCode::IOError;
        result.error = "failed to read " + path_;
        return result;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        result.code = ErrorCode::InvalidDocument;
        result.error = path_ + " is not valid JSON: " + e.what();
        return result;
    }

    if (j.is_object() && j.contains("repositories") && j["repositories"].is_array()) {
        for (const auto& r : j["repositories"]) {
            if (!r.is_object()) continue;
            RepositoryEntry entry;
            entry.name = get_string(r, "name").value_or("");
            entry.url = get_string(r, "url").value_or("");
            entry.added_date = get_string(r, "addedDate").value_or("");
            entry.last_updated = get_string(r, "lastUpdated").value_or("");
            if (entry.url.empty()) continue;
            result.repositories.push_back(std::move(entry));
        }
    }

    result.ok = true;
    return result;
}

StoreResult RepoStore::write(const std::vector<RepositoryEntry>& repositories) {
    StoreResult result;

    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : repositories) {
        nlohmann::json entry;
        entry["name"] = r.name;
        entry["url"] = r.url;
        entry["addedDate"] = r.added_date;
        if (!r.last_updated.empty()) {
            entry["lastUpdated"] = r.last_updated;
        }
        list.push_back(std::move(entry));
    }

    nlohmann::json doc;
    doc["repositories"] = std::move(list);

    auto write = atomic_write_file(path_, doc.dump(2) + "\n");
    if (!write.ok) {
        result.code = ErrorCode::IOError;
        result.error = "failed to write " + path_ + ": " + write.error;
        return result;
    }
    result.ok = true;
    return result;
}

IndexFetchResult RepoStore::fetch_index(const RepositoryEntry& repository) const {
    IndexFetchResult result;

    auto fetched = fetch_url(repository.url);
    if (!fetched.ok) {
        result.code = ErrorCode::IOError;
        result.error = fetched.error;
        return result;
    }

    auto parsed = parse_repository_index(std::string(fetched.data.begin(), fetched.data.end()));
    if (!parsed.ok) {
        result.code = parsed.code;
        result.error = parsed.error;
        return result;
    }

    result.index = std::move(parsed.index);
    result.ok = true;
    return result;
}

RepoAddResult RepoStore::add(const std::string& url) {
    RepoAddResult result;

    auto current = list();
    if (!current.ok) {
        result.code = current.code;
        result.error = current.error;
        return result;
    }

    for (const auto& r : current.repositories) {
        if (r.url == url) {
            result.code = ErrorCode::InvalidDocument;
            result.error = "repository already exists: " + url;
            return result;
        }
    }

    RepositoryEntry probe;
    probe.url = url;
    auto index = fetch_index(probe);
    if (!index.ok) {
        result.code = index.code;
        result.error = "failed to add repository: " + index.error;
        return result;
    }

    result.entry.name = index.index.name;
    result.entry.url = url;
    result.entry.added_date = get_current_timestamp();

    current.repositories.push_back(result.entry);
    auto written = write(current.repositories);
    if (!written.ok) {
        result.code = written.code;
        result.error = written.error;
        return result;
    }

    spdlog::info("Added repository \"{}\" ({} packages)", result.entry.name,
                 index.index.packages.size());
    result.ok = true;
    return result;
}

StoreResult RepoStore::remove(const std::string& name) {
    StoreResult result;

    auto current = list();
    if (!current.ok) {
        result.code = current.code;
        result.error = current.error;
        return result;
    }

    auto& repos = current.repositories;
    auto it = std::find_if(repos.begin(), repos.end(),
                           [&](const RepositoryEntry& r) { return r.name == name; });
    if (it == repos.end()) {
        result.code = ErrorCode::NotFound;
        result.error = "repository not found: " + name;
        return result;
    }
    repos.erase(it);

    return write(repos);
}

StoreResult RepoStore::refresh(const std::string& name) {
    StoreResult result;

    auto current = list();
    if (!current.ok) {
        result.code = current.code;
        result.error = current.error;
        return result;
    }

    auto& repos = current.repositories;
    auto it = std::find_if(repos.begin(), repos.end(),
                           [&](const RepositoryEntry& r) { return r.name == name; });
    if (it == repos.end()) {
        result.code = ErrorCode::NotFound;
        result.error = "repository not found: " + name;
        return result;
    }

    auto index = fetch_index(*it);
    if (!index.ok) {
        result.code = index.code;
        result.error = "failed to update repository " + name + ": " + index.error;
        return result;
    }

    it->last_updated = get_current_timestamp();
    return write(repos);
}

PackageLookupResult RepoStore::find_package(const std::string& package_name) const {
    PackageLookupResult result;

    auto current = list();
    if (!current.ok) {
        result.code = current.code;
        result.error = current.error;
        return result;
    }

    for (const auto& repo : current.repositories) {
        auto index = fetch_index(repo);
        if (!index.ok) {
            spdlog::warn("Failed to fetch from repository {}: {}", repo.name, index.error);
            continue;
        }
        if (const auto* package = index.index.find(package_name)) {
            result.package = *package;
            result.repository = repo;
            result.ok = true;
            return result;
        }
    }

    result.code = ErrorCode::NotFound;
    result.error = "package '" + package_name + "' not found in any repository";
    return result;
}

VersionLookupResult RepoStore::latest_version(const std::string& package_name) const {
    VersionLookupResult result;

    auto current = list();
    if (!current.ok) {
        result.code = current.code;
        result.error = current.error;
        return result;
    }

    bool found = false;
    std::string latest = "0.0.0";
    for (const auto& repo : current.repositories) {
        auto index = fetch_index(repo);
        if (!index.ok) {
            spdlog::warn("Failed to fetch from repository {}: {}", repo.name, index.error);
            continue;
        }
        if (const auto* package = index.index.find(package_name)) {
            std::string version = package->version.empty() ? "0.0.0" : package->version;
            if (!found || compare_versions(version, latest) > 0) {
                latest = version;
            }
            found = true;
        }
    }

    if (!found) {
        result.code = ErrorCode::NotFound;
        result.error = "package '" + package_name + "' not found in any repository";
        return result;
    }

    result.version = latest;
    result.ok = true;
    return result;
}

} // namespace pawkit
