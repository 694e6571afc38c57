#pragma once

#include "pawkit/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Bundle Grouping
// ============================================================================
//
// An application bundle is a "<name>.app" segment followed by "Contents".
// Grouping is a pure function of its input.

inline constexpr const char* kBundleSuffix = ".app";
inline constexpr const char* kBundleContents = "Contents";

// Path truncated after the first "<name>.app" segment that is followed by
// "Contents", or nullopt if the path is not inside a bundle
std::optional<std::string> bundle_root_of(const std::string& path);

// "<root>/Contents/MacOS/<name>" for "<...>/<name>.app"
std::string bundle_entry_point(const std::string& root_path);

struct BundleGrouping {
    std::vector<BundleUnit> units;      // First-appearance order
    std::vector<PlanEntry> loose;       // Entries outside any bundle
};

// Group plan entries by destination bundle root. A unit's source_root is set
// only when every member's source lies under the same extracted bundle.
BundleGrouping group_bundles(const std::vector<PlanEntry>& entries);

struct DestinationGrouping {
    std::vector<std::string> roots;     // Unique bundle roots, first-appearance order
    std::vector<std::string> loose;     // Paths outside any bundle
};

// Same rule over recorded destinations (no source tree available)
DestinationGrouping group_destinations(const std::vector<std::string>& files);

} // namespace pawkit
