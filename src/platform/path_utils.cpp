#include "pawkit/path_utils.hpp"
#include "pawkit/platform.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pawkit {

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes extraction root";
        default: return "unknown";
    }
}

PathResult place_under_root(const std::string& root, const std::string& member_name) {
    PathResult result;

    if (member_name.find('\0') != std::string::npos || root.find('\0') != std::string::npos) {
        result.error = PathError::ContainsNul;
        return result;
    }

    std::string name = to_portable_path(member_name);
    if (name.empty()) {
        result.error = PathError::Empty;
        return result;
    }

    if (name[0] == '/' || (name.size() > 1 && name[1] == ':')) {
        result.error = PathError::AbsoluteNotAllowed;
        return result;
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_path(name)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                result.error = PathError::EscapesRoot;
                return result;
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        result.error = PathError::Empty;
        return result;
    }

    std::string relative;
    for (const auto& part : normalized) {
        if (!relative.empty()) relative += '/';
        relative += part;
    }

    result.ok = true;
    result.relative = relative;
    result.path = join_path(root, relative);
    return result;
}

bool is_within(const std::string& base, const std::string& candidate) {
    auto lex_base = std::filesystem::path(base).lexically_normal();
    auto lex_candidate = std::filesystem::path(candidate).lexically_normal();

    auto base_it = lex_base.begin();
    auto cand_it = lex_candidate.begin();
    for (; base_it != lex_base.end() && cand_it != lex_candidate.end(); ++base_it, ++cand_it) {
        // A trailing separator shows up as an empty final element
        if (base_it->empty()) {
            break;
        }
        if (*base_it != *cand_it) {
            return false;
        }
    }
    return base_it == lex_base.end() || base_it->empty();
}

} // namespace pawkit
