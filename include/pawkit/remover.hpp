#pragma once

#include "pawkit/locations.hpp"
#include "pawkit/manifest_store.hpp"
#include "pawkit/materializer.hpp"
#include "pawkit/toolset.hpp"
#include "pawkit/types.hpp"

#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Package Removal
// ============================================================================

struct RemovalFailure {
    std::string path;
    std::string reason;
};

struct RemovalOutcome {
    size_t removed = 0;
    std::vector<RemovalFailure> failed;
};

// Remove what a record describes: bundle roots, then declared extra paths,
// then remaining files. Never stops on a failure. Paths already absent are
// neither removed nor failed.
RemovalOutcome remove_record_files(const InstalledRecord& record,
                                   const LocationTable& table,
                                   const Toolset& tools,
                                   const ProgressCallback& on_progress = nullptr);

struct UninstallResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    size_t removed = 0;
    std::vector<RemovalFailure> failed;
};

// Load the record (NotInstalled if missing), remove its files and delete
// the record even when some deletions failed
UninstallResult uninstall_package(ManifestStore& store,
                                  const std::string& name,
                                  const LocationTable& table,
                                  const Toolset& tools,
                                  const ProgressCallback& on_progress = nullptr);

// Failures grouped by directory plus copy-pasteable removal commands
std::string format_failure_report(const std::vector<RemovalFailure>& failed, Platform platform);

} // namespace pawkit
