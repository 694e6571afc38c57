#include "pawkit/locations.hpp"
#include "pawkit/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace pawkit {

LocationTable::LocationTable(std::string home, std::vector<Location> locations,
                             std::string metadata_dir)
    : home_(std::move(home)),
      locations_(std::move(locations)),
      metadata_dir_(std::move(metadata_dir)) {}

LocationTable LocationTable::for_home(const std::string& home,
                                      const std::string& metadata_dir,
                                      Platform platform) {
    std::string documents = join_path(home, "Documents");
    std::string library = join_path(home, "Library");
    std::string app_support = join_path(library, "Application Support");
    std::string applications = platform == Platform::macOS
        ? std::string("/Applications")
        : join_path(home, "Applications");

    std::vector<Location> locations = {
        {"@userhome", home, false},
        {"@documents", documents, false},
        {"@document", documents, false},
        {"@docs", documents, false},
        {"@applicationSupport", app_support, true},
        {"@applicationsupport", app_support, true},
        {"@desktop", join_path(home, "Desktop"), false},
        {"@downloads", join_path(home, "Downloads"), false},
        {"@applications", applications, false},
        {"@userapplications", join_path(home, "Applications"), false},
        {"@library", library, false},
        {"@preferences", join_path(library, "Preferences"), false},
    };

    return LocationTable(home, std::move(locations), metadata_dir);
}

const Location* LocationTable::find(const std::string& marker) const {
    for (const auto& loc : locations_) {
        if (loc.marker == marker) {
            return &loc;
        }
    }
    return nullptr;
}

std::vector<std::string> LocationTable::markers() const {
    std::vector<std::string> result;
    result.reserve(locations_.size());
    for (const auto& loc : locations_) {
        result.push_back(loc.marker);
    }
    return result;
}

bool LocationTable::is_escalated(const std::string& path) const {
    for (const auto& loc : locations_) {
        if (loc.escalated && is_within(loc.base_dir, path)) {
            return true;
        }
    }
    return false;
}

bool LocationTable::is_metadata_path(const std::string& path) const {
    return !metadata_dir_.empty() && is_within(metadata_dir_, path);
}

const char* reject_reason_to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::Empty: return "empty path";
        case RejectReason::NoMarker: return "no @ location marker";
        case RejectReason::UnknownMarker: return "unknown @ location marker";
        case RejectReason::Traversal: return "path traversal";
        default: return "unknown";
    }
}

namespace {

bool is_marker_token(const std::string& segment) {
    if (segment.size() < 2 || segment[0] != '@') {
        return false;
    }
    for (size_t i = 1; i < segment.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(segment[i]);
        if (!std::isalnum(c) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string join_segments(const std::vector<std::string>& segments, size_t from) {
    std::string out;
    for (size_t i = from; i < segments.size(); ++i) {
        if (!out.empty()) out += '/';
        out += segments[i];
    }
    return out;
}

bool has_traversal(const std::vector<std::string>& segments, size_t from) {
    for (size_t i = from; i < segments.size(); ++i) {
        if (segments[i] == "..") return true;
    }
    return false;
}

} // namespace

std::string clean_archive_path(const std::string& archive_path) {
    std::string path = to_portable_path(archive_path);

    size_t start = 0;
    while (start < path.size() && (path[start] == '/' || path[start] == '.')) {
        ++start;
    }
    path = path.substr(start);

    const std::string junk = "__MACOSX/";
    size_t pos;
    while ((pos = path.find(junk)) != std::string::npos) {
        path.erase(pos, junk.size());
    }

    return path;
}

ResolveResult resolve(const LocationTable& table, const std::string& archive_path) {
    ResolveResult result;

    std::string clean = clean_archive_path(archive_path);
    auto segments = split_path(clean);
    if (segments.empty()) {
        result.reason = RejectReason::Empty;
        return result;
    }

    // First marker-shaped segment that still has something after it.
    // Anything before it is a wrapping directory added by the archiver.
    size_t marker_index = segments.size();
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (is_marker_token(segments[i])) {
            marker_index = i;
            break;
        }
    }

    // Package metadata, unless it sits below a marker
    for (size_t i = 0; i < marker_index && i < segments.size(); ++i) {
        if (segments[i] != kMetadataSegment) {
            continue;
        }
        if (i + 1 >= segments.size() || table.metadata_dir().empty()) {
            break;
        }
        if (has_traversal(segments, i + 1)) {
            result.reason = RejectReason::Traversal;
            return result;
        }
        result.ok = true;
        result.is_metadata = true;
        result.destination = join_path(table.metadata_dir(), join_segments(segments, i + 1));
        spdlog::debug("resolve: {} -> {} (metadata)", archive_path, result.destination);
        return result;
    }

    if (marker_index == segments.size()) {
        result.reason = RejectReason::NoMarker;
        spdlog::debug("resolve: {} rejected, no location marker", archive_path);
        return result;
    }

    size_t index = marker_index;
    if (segments[index] == kCatchAllMarker) {
        ++index;
    }

    if (index + 1 >= segments.size()) {
        result.reason = RejectReason::NoMarker;
        return result;
    }

    const Location* location = table.find(segments[index]);
    if (!location) {
        result.reason = RejectReason::UnknownMarker;
        spdlog::debug("resolve: {} rejected, unknown marker {}", archive_path, segments[index]);
        return result;
    }

    if (has_traversal(segments, index + 1)) {
        result.reason = RejectReason::Traversal;
        return result;
    }

    result.ok = true;
    result.destination = join_path(location->base_dir, join_segments(segments, index + 1));
    spdlog::debug("resolve: {} -> {}", archive_path, result.destination);
    return result;
}

std::optional<std::string> expand_declared_path(const LocationTable& table,
                                                const std::string& declared) {
    std::string path = to_portable_path(declared);

    if (path == "~") {
        path = table.home();
    } else if (path.rfind("~/", 0) == 0) {
        path = join_path(table.home(), path.substr(2));
    }

    auto segments = split_path(path);
    for (size_t i = 0; i < segments.size(); ++i) {
        if (!is_marker_token(segments[i]) || segments[i] == kCatchAllMarker) {
            continue;
        }
        const Location* location = table.find(segments[i]);
        if (!location) {
            continue;
        }
        std::string rest = join_segments(segments, i + 1);
        path = rest.empty() ? location->base_dir : join_path(location->base_dir, rest);
        break;
    }

    if (path.empty() || path[0] != '/') {
        return std::nullopt;
    }
    return path;
}

} // namespace pawkit
