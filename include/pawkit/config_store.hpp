#pragma once

#include "pawkit/manifest_store.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace pawkit {

// ============================================================================
// Data Directory Layout
// ============================================================================

struct PawkitPaths {
    std::string root;
    std::string config_file;        // config.json
    std::string repos_file;         // repos.json
    std::string manifest_file;      // paws.json
    std::string metadata_dir;       // pluginmetadata/
};

// Priority: --root flag > PAWKIT_HOME env > ~/.pawkit
std::string resolve_pawkit_root(const std::optional<std::string>& override_root);

PawkitPaths get_pawkit_paths(const std::string& root);

bool ensure_pawkit_structure(const PawkitPaths& paths, std::string& error);

// ============================================================================
// Configuration Store
// ============================================================================

struct ConfigResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    nlohmann::json value;
};

class ConfigStore {
public:
    explicit ConfigStore(std::string path);

    // { confirm_installation: true, verbose_logging: false, debug: false }
    static nlohmann::json defaults();

    // Stored values merged over the defaults. A missing file yields the defaults.
    ConfigResult get_all() const;

    // NotFound for an unknown key
    ConfigResult get(const std::string& key) const;

    // "true"/"false" are stored as booleans. Unknown keys are created.
    StoreResult set(const std::string& key, const std::string& value);

    bool get_bool(const std::string& key, bool fallback) const;

private:
    std::string path_;
};

} // namespace pawkit
