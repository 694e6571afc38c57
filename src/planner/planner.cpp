#include "pawkit/planner.hpp"
#include "pawkit/inspector.hpp"
#include "pawkit/platform.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace pawkit {

namespace {

constexpr size_t kRejectedExamples = 3;

std::string no_installable_message(const std::vector<std::string>& rejected,
                                   const LocationTable& table) {
    std::vector<std::string> examples;
    for (const auto& path : rejected) {
        if (is_junk_path(path)) continue;
        examples.push_back(path);
    }

    if (examples.empty()) {
        return "No valid files found to install";
    }

    std::string msg = "No installable files found. Package files must be placed under a location "
                      "marker such as @documents/ or @applicationSupport/.";
    msg += " Rejected paths: ";
    for (size_t i = 0; i < examples.size() && i < kRejectedExamples; ++i) {
        if (i > 0) msg += ", ";
        msg += examples[i];
    }
    if (examples.size() > kRejectedExamples) {
        msg += " (and " + std::to_string(examples.size() - kRejectedExamples) + " more)";
    }
    msg += ". Supported markers: ";
    auto markers = table.markers();
    for (size_t i = 0; i < markers.size(); ++i) {
        if (i > 0) msg += ", ";
        msg += markers[i];
    }
    return msg;
}

} // namespace

PlanResult plan_installation(const std::vector<Entry>& entries, const LocationTable& table) {
    PlanResult result;
    std::set<std::string> seen;
    size_t installable = 0;

    for (const auto& entry : entries) {
        if (entry.kind == EntryKind::Directory || is_junk_path(entry.path)) {
            continue;
        }

        auto resolved = resolve(table, entry.path);
        if (!resolved.ok) {
            result.rejected.push_back(entry.path);
            continue;
        }

        if (!seen.insert(resolved.destination).second) {
            ++result.duplicates;
            spdlog::debug("plan: {} duplicates an earlier destination", entry.path);
            continue;
        }

        PlanEntry pe;
        pe.source_location = entry.source_location;
        pe.destination = resolved.destination;
        pe.kind = entry.kind;
        pe.link_target = entry.link_target;
        pe.resolved_target = entry.resolved_target;
        pe.mode = entry.mode;
        pe.is_metadata = resolved.is_metadata;

        if (!pe.is_metadata) {
            ++installable;
            if (path_lexists(pe.destination)) {
                result.plan.conflicts.insert(pe.destination);
            }
        }

        result.plan.entries.push_back(std::move(pe));
    }

    if (installable == 0) {
        result.code = ErrorCode::NoInstallableFiles;
        result.error = no_installable_message(result.rejected, table);
        return result;
    }

    spdlog::debug("plan: {} entries, {} conflicts, {} rejected",
                  result.plan.entries.size(), result.plan.conflicts.size(), result.rejected.size());

    result.ok = true;
    return result;
}

} // namespace pawkit
