#pragma once

#include "pawkit/platform.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Special Location Table
// ============================================================================
//
// Maps marker tokens ("@documents", "@applicationSupport", ...) to absolute
// base directories derived from the user's home directory. Built once at
// startup and read-only afterwards.

// Grouping segment that may precede a marker ("@all/@documents/...")
inline constexpr const char* kCatchAllMarker = "@all";

// Reserved segment for package metadata ("metadata/data.json")
inline constexpr const char* kMetadataSegment = "metadata";

struct Location {
    std::string marker;         // e.g. "@documents"
    std::string base_dir;       // Absolute
    bool escalated = false;     // Removal may need the escalated delete sequence
};

class LocationTable {
public:
    LocationTable() = default;
    LocationTable(std::string home, std::vector<Location> locations, std::string metadata_dir);

    // Standard table for a home directory.
    // metadata_dir receives metadata-classified archive paths.
    static LocationTable for_home(const std::string& home,
                                  const std::string& metadata_dir,
                                  Platform platform = get_current_platform());

    const Location* find(const std::string& marker) const;

    const std::vector<Location>& locations() const { return locations_; }
    const std::string& home() const { return home_; }
    const std::string& metadata_dir() const { return metadata_dir_; }

    std::vector<std::string> markers() const;

    // True if path lies under a base directory flagged as escalated
    bool is_escalated(const std::string& path) const;

    // True if path lies inside the metadata directory
    bool is_metadata_path(const std::string& path) const;

private:
    std::string home_;
    std::vector<Location> locations_;
    std::string metadata_dir_;
};

// ============================================================================
// Path Resolution
// ============================================================================

enum class RejectReason {
    None,
    Empty,
    NoMarker,
    UnknownMarker,
    Traversal,
};

const char* reject_reason_to_string(RejectReason reason);

struct ResolveResult {
    bool ok = false;
    std::string destination;    // Absolute when ok
    bool is_metadata = false;
    RejectReason reason = RejectReason::None;
};

// Normalize separators, strip leading slashes/dots and "__MACOSX/" segments
std::string clean_archive_path(const std::string& archive_path);

// Map an archive path to its destination. Closed world: any path without a
// known marker (and not metadata-classified) is rejected.
ResolveResult resolve(const LocationTable& table, const std::string& archive_path);

// Expand a caller-declared path ("~/...", "@library/...") to an absolute
// path. Returns nullopt if the result is not absolute.
std::optional<std::string> expand_declared_path(const LocationTable& table,
                                                const std::string& declared);

} // namespace pawkit
