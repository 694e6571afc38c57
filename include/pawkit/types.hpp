#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorCode {
    None,
    InvalidFormat,       // Not a recognizable archive
    NoInstallableFiles,  // No entry resolvable to a destination
    ConflictError,       // Existing files block an unforced install
    InstallAborted,      // Explicit user decline
    IOError,             // Filesystem or subprocess failure
    NotInstalled,        // Remove/update target has no record
    NotFound,            // Repository or manifest lookup miss
    InvalidDocument,     // Corrupt manifest/config/repository document
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "NONE";
        case ErrorCode::InvalidFormat: return "INVALID_FORMAT";
        case ErrorCode::NoInstallableFiles: return "NO_INSTALLABLE_FILES";
        case ErrorCode::ConflictError: return "CONFLICT_ERROR";
        case ErrorCode::InstallAborted: return "INSTALL_ABORTED";
        case ErrorCode::IOError: return "IO_ERROR";
        case ErrorCode::NotInstalled: return "NOT_INSTALLED";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::InvalidDocument: return "INVALID_DOCUMENT";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Archive Entries
// ============================================================================

enum class EntryKind {
    File,
    Symlink,
    Directory   // Never installed directly
};

inline const char* entry_kind_to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "file";
        case EntryKind::Symlink: return "symlink";
        case EntryKind::Directory: return "directory";
        default: return "unknown";
    }
}

// One unit extracted from a package archive
struct Entry {
    std::string path;                   // Archive-relative, forward slashes
    EntryKind kind = EntryKind::File;
    std::string link_target;            // Original target string (Symlink only)
    std::string resolved_target;        // Absolute form of link_target (Symlink only)
    std::string source_location;        // Absolute path in the scratch area
    uint32_t mode = 0644;               // Permission bits from the source
};

// ============================================================================
// Installation Plan
// ============================================================================

struct PlanEntry {
    std::string source_location;
    std::string destination;            // Always absolute
    EntryKind kind = EntryKind::File;
    std::string link_target;
    std::string resolved_target;
    uint32_t mode = 0644;
    bool is_metadata = false;           // Lands in the engine's metadata directory
};

struct InstallPlan {
    std::vector<PlanEntry> entries;     // Unique destinations, archive order
    std::set<std::string> conflicts;    // Pre-existing destinations

    bool has_conflicts() const { return !conflicts.empty(); }
};

// A relocatable application bundle installed/removed as one transaction
struct BundleUnit {
    std::string root_path;                      // Absolute, ends with ".app"
    std::vector<PlanEntry> members;
    std::optional<std::string> source_root;     // Bundle root in the scratch tree
};

// ============================================================================
// Package Descriptor
// ============================================================================

struct PackageDescriptor {
    std::string name;
    std::string version = "0.0.0";
    nlohmann::json attributes = nlohmann::json::object();  // Full free-form document
    std::vector<std::string> extra_paths;                   // "deletePaths"
};

// ============================================================================
// Installed Package Record
// ============================================================================

struct InstalledRecord {
    std::string version;
    std::string install_date;           // RFC3339
    std::vector<std::string> files;     // Ordered, unique, absolute
    PackageDescriptor descriptor;

    // Provenance
    std::string source;
    std::string package_hash;           // "sha256:..."
};

// ============================================================================
// Progress Reporting
// ============================================================================

enum class ProgressKind {
    DirectoryCreated,
    FileInstalled,
    SymlinkInstalled,
    BundleInstalled,
    PathRemoved,
    Warning
};

struct ProgressEvent {
    ProgressKind kind;
    std::string path;
    std::string detail;
};

} // namespace pawkit
