#include "pawkit/materializer.hpp"
#include "pawkit/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace pawkit {

// ============================================================================
// Confirmation Gate
// ============================================================================

GateResult check_confirmation(const InstallPlan& plan, bool force, bool confirm_installation,
                              const ConfirmCallback& confirm) {
    GateResult result;

    if (force) {
        if (plan.has_conflicts()) {
            spdlog::warn("Overwriting {} existing file(s) (forced install)", plan.conflicts.size());
        }
        result.proceed = true;
        return result;
    }

    if (!plan.has_conflicts() && !confirm_installation) {
        result.proceed = true;
        return result;
    }

    if (!confirm) {
        if (plan.has_conflicts()) {
            result.code = ErrorCode::ConflictError;
            result.error = std::to_string(plan.conflicts.size()) +
                           " file(s) already exist, first: " + *plan.conflicts.begin() +
                           ". Use --force to overwrite.";
            return result;
        }
        result.proceed = true;
        return result;
    }

    if (!confirm(plan)) {
        result.code = ErrorCode::InstallAborted;
        result.error = "installation aborted by user";
        return result;
    }

    result.proceed = true;
    return result;
}

// ============================================================================
// Materialization
// ============================================================================

namespace {

class Materializer {
public:
    Materializer(const MaterializeOptions& options, const Toolset& tools, MaterializeResult& result)
        : options_(options), tools_(tools), result_(result) {}

    bool ensure_parent(const std::string& path) {
        std::string parent = get_parent_directory(path);
        if (parent.empty() || created_.count(parent)) {
            return true;
        }

        std::error_code ec;
        bool created = fs::create_directories(parent, ec);
        if (ec) {
            fail("failed to create directory " + parent + ": " + ec.message());
            return false;
        }
        created_.insert(parent);
        if (created) {
            emit(ProgressKind::DirectoryCreated, parent);
        }
        return true;
    }

    // False means the unit could not be copied whole and needs per-file install
    bool install_bundle(const BundleUnit& unit) {
        if (!ensure_parent(unit.root_path)) {
            return false;
        }

        auto copied = tools_.copier->copy_tree(*unit.source_root, unit.root_path);
        if (!copied.ok) {
            warn("Whole-bundle copy of " + unit.root_path + " failed, installing file by file: " +
                 copied.error);
            return false;
        }

        // Copy tools do not reliably keep the executable bit on the entry point
        std::string entry_point = bundle_entry_point(unit.root_path);
        std::error_code ec;
        if (fs::is_regular_file(entry_point, ec)) {
            fs::permissions(entry_point, static_cast<fs::perms>(0755), fs::perm_options::replace, ec);
            if (ec) {
                warn("Could not mark " + entry_point + " executable: " + ec.message());
            }
        }

        emit(ProgressKind::BundleInstalled, unit.root_path, tools_.copier->name());
        return true;
    }

    bool install_symlink(const PlanEntry& entry) {
        std::error_code ec;
        if (path_lexists(entry.destination)) {
            fs::remove(entry.destination, ec);
            if (ec) {
                fail("failed to replace " + entry.destination + ": " + ec.message());
                return false;
            }
        }

        fs::path original(entry.link_target);
        std::string target = original.is_relative() ? entry.link_target : entry.resolved_target;

        fs::create_symlink(target, entry.destination, ec);
        if (ec) {
            fail("failed to create symlink " + entry.destination + ": " + ec.message());
            return false;
        }

        auto tagged = tools_.tagger->tag(entry.destination);
        if (!tagged.ok) {
            warn("Could not set symlink attribute on " + entry.destination + ": " + tagged.error);
        }

        emit(ProgressKind::SymlinkInstalled, entry.destination, target);
        return true;
    }

    bool install_file(const PlanEntry& entry) {
        std::error_code ec;

        // Never write through a link left at the destination
        if (fs::is_symlink(fs::symlink_status(entry.destination, ec))) {
            fs::remove(entry.destination, ec);
            if (ec) {
                fail("failed to replace " + entry.destination + ": " + ec.message());
                return false;
            }
        }

        fs::copy_file(entry.source_location, entry.destination,
                      fs::copy_options::overwrite_existing, ec);
        if (ec) {
            fail("failed to copy " + entry.destination + ": " + ec.message());
            return false;
        }

        uint32_t mode = entry.mode & 07777;
        if (mode & 0111) {
            mode |= 0111;
        }
        fs::permissions(entry.destination, static_cast<fs::perms>(mode),
                        fs::perm_options::replace, ec);
        if (ec) {
            warn("Could not set permissions on " + entry.destination + ": " + ec.message());
        }

        emit(ProgressKind::FileInstalled, entry.destination);
        return true;
    }

private:
    void emit(ProgressKind kind, const std::string& path, const std::string& detail = "") {
        if (options_.on_progress) {
            options_.on_progress(ProgressEvent{kind, path, detail});
        }
    }

    void warn(const std::string& message) {
        spdlog::warn("{}", message);
        result_.warnings.push_back(message);
        emit(ProgressKind::Warning, "", message);
    }

    void fail(const std::string& message) {
        result_.code = ErrorCode::IOError;
        result_.error = message;
    }

    const MaterializeOptions& options_;
    const Toolset& tools_;
    MaterializeResult& result_;
    std::set<std::string> created_;
};

} // namespace

MaterializeResult materialize(const InstallPlan& plan,
                              const BundleGrouping& grouping,
                              const MaterializeOptions& options,
                              const Toolset& tools) {
    MaterializeResult result;

    auto gate = check_confirmation(plan, options.force, options.confirm_installation,
                                   options.confirm);
    if (!gate.proceed) {
        result.code = gate.code;
        result.error = gate.error;
        return result;
    }

    Materializer m(options, tools, result);
    std::set<std::string> handled;

    for (const auto& unit : grouping.units) {
        if (!unit.source_root) {
            continue;
        }
        if (!m.install_bundle(unit)) {
            if (result.code != ErrorCode::None) {
                return result;
            }
            continue;
        }
        for (const auto& member : unit.members) {
            handled.insert(member.destination);
        }
    }

    for (const auto& entry : plan.entries) {
        if (handled.count(entry.destination)) {
            continue;
        }
        if (!m.ensure_parent(entry.destination)) {
            return result;
        }

        bool ok = entry.kind == EntryKind::Symlink ? m.install_symlink(entry) : m.install_file(entry);
        if (!ok) {
            spdlog::error("Installation stopped: {}", result.error);
            return result;
        }
        handled.insert(entry.destination);
    }

    std::set<std::string> seen;
    for (const auto& entry : plan.entries) {
        if (entry.is_metadata) continue;
        if (seen.insert(entry.destination).second) {
            result.installed.push_back(entry.destination);
        }
    }

    result.ok = true;
    return result;
}

} // namespace pawkit
