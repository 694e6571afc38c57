#include "pawkit/config_store.hpp"
#include "pawkit/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace pawkit {

// ============================================================================
// Data Directory Layout
// ============================================================================

std::string resolve_pawkit_root(const std::optional<std::string>& override_root) {
    if (override_root && !override_root->empty()) {
        return *override_root;
    }

    if (auto env_root = get_env("PAWKIT_HOME"); env_root && !env_root->empty()) {
        return *env_root;
    }

    return join_path(get_home_directory(), ".pawkit");
}

PawkitPaths get_pawkit_paths(const std::string& root) {
    PawkitPaths paths;
    paths.root = root;
    paths.config_file = join_path(root, "config.json");
    paths.repos_file = join_path(root, "repos.json");
    paths.manifest_file = join_path(root, "paws.json");
    paths.metadata_dir = join_path(root, "pluginmetadata");
    return paths;
}

bool ensure_pawkit_structure(const PawkitPaths& paths, std::string& error) {
    std::error_code ec;
    fs::create_directories(paths.metadata_dir, ec);
    if (ec) {
        error = "failed to create " + paths.metadata_dir + ": " + ec.message();
        return false;
    }
    return true;
}

// ============================================================================
// Configuration Store
// ============================================================================

namespace {

nlohmann::json coerce_value(const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    return value;
}

} // namespace

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

nlohmann::json ConfigStore::defaults() {
    return {
        {"confirm_installation", true},
        {"verbose_logging", false},
        {"debug", false},
    };
}

ConfigResult ConfigStore::get_all() const {
    ConfigResult result;
    result.value = defaults();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        result.ok = true;
        return result;
    }

    auto content = read_file(path_);
    if (!content) {
        result.code = ErrorCode::IOError;
        result.error = "failed to read config: " + path_;
        return result;
    }

    nlohmann::json stored;
    try {
        stored = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        result.code = ErrorCode::InvalidDocument;
        result.error = "config " + path_ + " is not valid JSON: " + e.what();
        return result;
    }

    if (!stored.is_object()) {
        result.code = ErrorCode::InvalidDocument;
        result.error = "config " + path_ + " must be a JSON object";
        return result;
    }

    for (auto& [key, value] : stored.items()) {
        result.value[key] = value;
    }
    result.ok = true;
    return result;
}

ConfigResult ConfigStore::get(const std::string& key) const {
    auto all = get_all();
    if (!all.ok) {
        return all;
    }

    ConfigResult result;
    if (!all.value.contains(key)) {
        result.code = ErrorCode::NotFound;
        result.error = "unknown config key: " + key;
        return result;
    }
    result.value = all.value[key];
    result.ok = true;
    return result;
}

StoreResult ConfigStore::set(const std::string& key, const std::string& value) {
    StoreResult result;

    auto all = get_all();
    if (!all.ok) {
        result.code = all.code;
        result.error = all.error;
        return result;
    }

    all.value[key] = coerce_value(value);

    auto write = atomic_write_file(path_, all.value.dump(2) + "\n");
    if (!write.ok) {
        result.code = ErrorCode::IOError;
        result.error = "failed to write config: " + write.error;
        return result;
    }

    spdlog::debug("config: {} = {}", key, all.value[key].dump());
    result.ok = true;
    return result;
}

bool ConfigStore::get_bool(const std::string& key, bool fallback) const {
    auto entry = get(key);
    if (!entry.ok) {
        if (entry.code != ErrorCode::NotFound) {
            spdlog::warn("{}", entry.error);
        }
        return fallback;
    }
    if (entry.value.is_boolean()) {
        return entry.value.get<bool>();
    }
    if (entry.value.is_string()) {
        return entry.value.get<std::string>() == "true";
    }
    return fallback;
}

} // namespace pawkit
