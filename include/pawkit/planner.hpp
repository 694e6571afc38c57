#pragma once

#include "pawkit/locations.hpp"
#include "pawkit/types.hpp"

#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Conflict Planning
// ============================================================================

struct PlanResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    InstallPlan plan;
    std::vector<std::string> rejected;      // Archive paths with no destination
    size_t duplicates = 0;                  // Entries collapsed onto an earlier destination
};

// Resolve every entry, collapse duplicate destinations (first wins) and
// record destinations that already exist. Metadata destinations are never
// conflicts. Fails with NoInstallableFiles if no non-metadata entry
// resolves. Reads the filesystem, never writes it.
PlanResult plan_installation(const std::vector<Entry>& entries, const LocationTable& table);

} // namespace pawkit
