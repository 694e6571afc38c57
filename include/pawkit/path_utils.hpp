#pragma once

#include <string>

namespace pawkit {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError error);

struct PathResult {
    bool ok = false;
    std::string path;      // Absolute destination under root when ok
    std::string relative;  // Normalized root-relative form when ok
    PathError error = PathError::None;
};

// Place an archive member name under an extraction root (string-based,
// symlinks are not followed).
// - Rejects NUL bytes and empty names
// - Rejects absolute names and drive letters
// - Collapses "." and ".." segments; fails if the result leaves root
PathResult place_under_root(const std::string& root, const std::string& member_name);

// True if candidate equals base or lies below it (lexical comparison)
bool is_within(const std::string& base, const std::string& candidate);

} // namespace pawkit
