#include "pawkit/bundle.hpp"
#include "pawkit/platform.hpp"

#include <map>
#include <set>

namespace pawkit {

namespace {

bool is_bundle_segment(const std::string& segment) {
    const std::string suffix = kBundleSuffix;
    return segment.size() > suffix.size() &&
           segment.compare(segment.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::optional<std::string> bundle_root_of(const std::string& path) {
    std::string p = to_portable_path(path);

    size_t start = 0;
    while (start < p.size()) {
        size_t end = p.find('/', start);
        if (end == std::string::npos) {
            return std::nullopt;
        }

        std::string segment = p.substr(start, end - start);
        if (is_bundle_segment(segment)) {
            size_t next_end = p.find('/', end + 1);
            std::string next = p.substr(end + 1, next_end == std::string::npos
                                                     ? std::string::npos
                                                     : next_end - end - 1);
            if (next == kBundleContents) {
                return p.substr(0, end);
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string bundle_entry_point(const std::string& root_path) {
    std::string name = get_filename(root_path);
    const std::string suffix = kBundleSuffix;
    if (is_bundle_segment(name)) {
        name = name.substr(0, name.size() - suffix.size());
    }
    return join_path(join_path(join_path(root_path, kBundleContents), "MacOS"), name);
}

BundleGrouping group_bundles(const std::vector<PlanEntry>& entries) {
    BundleGrouping grouping;
    std::map<std::string, size_t> index;

    for (const auto& entry : entries) {
        std::optional<std::string> root;
        if (!entry.is_metadata) {
            root = bundle_root_of(entry.destination);
        }
        if (!root) {
            grouping.loose.push_back(entry);
            continue;
        }

        auto it = index.find(*root);
        if (it == index.end()) {
            it = index.emplace(*root, grouping.units.size()).first;
            BundleUnit unit;
            unit.root_path = *root;
            grouping.units.push_back(std::move(unit));
        }
        grouping.units[it->second].members.push_back(entry);
    }

    for (auto& unit : grouping.units) {
        std::optional<std::string> common;
        bool consistent = true;
        for (const auto& member : unit.members) {
            auto source_root = bundle_root_of(member.source_location);
            if (!source_root || (common && *common != *source_root)) {
                consistent = false;
                break;
            }
            common = source_root;
        }
        if (consistent && common) {
            unit.source_root = common;
        }
    }

    return grouping;
}

DestinationGrouping group_destinations(const std::vector<std::string>& files) {
    DestinationGrouping grouping;
    std::set<std::string> seen;

    for (const auto& file : files) {
        auto root = bundle_root_of(file);
        if (!root) {
            grouping.loose.push_back(file);
            continue;
        }
        if (seen.insert(*root).second) {
            grouping.roots.push_back(*root);
        }
    }

    return grouping;
}

} // namespace pawkit
