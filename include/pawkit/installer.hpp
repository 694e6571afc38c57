#pragma once

#include "pawkit/config_store.hpp"
#include "pawkit/locations.hpp"
#include "pawkit/manifest_store.hpp"
#include "pawkit/materializer.hpp"
#include "pawkit/remover.hpp"
#include "pawkit/toolset.hpp"
#include "pawkit/types.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Engine Context
// ============================================================================

// Everything an operation needs, built once per process and passed explicitly
struct EngineContext {
    PawkitPaths paths;
    LocationTable locations;
    Toolset tools;
    bool allow_privilege_escalation = false;
};

// Resolve the data directory layout, build the location table for the
// current user and probe native tools
EngineContext make_engine_context(const std::string& root,
                                  bool allow_privilege_escalation = false,
                                  Platform platform = get_current_platform());

// ============================================================================
// Install
// ============================================================================

// Returns true to proceed with replacing installed_version by latest_version
using UpdateConfirmCallback = std::function<bool(const std::string& name,
                                                 const std::string& installed_version,
                                                 const std::string& latest_version)>;

struct InstallOptions {
    bool force = false;
    bool confirm_installation = false;      // Preview gate even without conflicts
    ConfirmCallback confirm;
    UpdateConfirmCallback confirm_update;
    ProgressCallback on_progress;

    // Repository fields laid over the embedded descriptor (null for none)
    nlohmann::json descriptor_overrides;

    // Provenance recorded instead of the archive path (e.g. download URL)
    std::string source;
};

struct InstallResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    std::string name;
    InstalledRecord record;
    std::string extraction_method;
    size_t rejected = 0;
    std::vector<std::string> warnings;
};

// inspect -> plan -> group -> materialize -> record
InstallResult install_package(EngineContext& ctx, const std::string& archive_path,
                              const InstallOptions& options);

// Look the package up in the configured repositories, download it into a
// scratch area and install it with the repository fields overlaid
InstallResult install_from_repository(EngineContext& ctx, const std::string& package_name,
                                      const InstallOptions& options);

// ============================================================================
// Update
// ============================================================================

struct UpdateResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    bool updated = false;
    std::string installed_version;
    std::string latest_version;
    std::vector<RemovalFailure> removal_failures;
};

// Up to date (ok, !updated) when installed >= latest. Otherwise confirm,
// remove and reinstall from the repositories.
UpdateResult update_package(EngineContext& ctx, const std::string& name,
                            const InstallOptions& options);

struct UpdateAllResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    size_t updated = 0;
    size_t up_to_date = 0;
    size_t failed = 0;
    std::vector<std::string> errors;        // "<name>: <reason>"
};

// Refresh every repository, then update every installed package
UpdateAllResult update_all(EngineContext& ctx, const InstallOptions& options);

// ============================================================================
// Batches
// ============================================================================

struct BatchItem {
    std::string target;
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::vector<RemovalFailure> failed;     // Uninstall only
};

struct BatchResult {
    std::vector<BatchItem> items;

    size_t succeeded() const;
    size_t failed() const;
};

// Each target is a local archive when the file exists, otherwise a
// repository package name. A failing target never stops the batch.
BatchResult install_batch(EngineContext& ctx, const std::vector<std::string>& targets,
                          const InstallOptions& options);

BatchResult uninstall_batch(EngineContext& ctx, const std::vector<std::string>& names,
                            const ProgressCallback& on_progress = nullptr);

} // namespace pawkit
