#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace pawkit {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

const char* platform_to_string(Platform platform);

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file, nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes.
// All stored paths (manifest entries, archive paths) use forward slashes.
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

// Filename without its last extension ("pkg.paw" -> "pkg")
std::string get_stem(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// True if something exists at path, including a dangling symlink
bool path_lexists(const std::string& path);

// Split a slash-separated path into non-empty segments
std::vector<std::string> split_path(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// $HOME, falling back to %USERPROFILE%
std::string get_home_directory();

// Current timestamp as RFC3339 string
std::string get_current_timestamp();

std::string generate_uuid();

} // namespace pawkit
