#include "pawkit/remover.hpp"
#include "pawkit/bundle.hpp"
#include "pawkit/path_utils.hpp"
#include "pawkit/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace pawkit {

namespace {

constexpr const char* kEscalatedFailure = "Could not be removed with elevated permissions";

constexpr size_t kSudoBatchSize = 5;
constexpr size_t kMaxDirectoryCommands = 3;
constexpr size_t kMaxItemCommands = 5;

// The filesystem root, home, every location base directory, and any
// ancestor of those
bool is_protected(const LocationTable& table, const std::string& path) {
    std::string normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    if (normal == "/" || is_within(normal, table.home())) {
        return true;
    }
    for (const auto& loc : table.locations()) {
        if (is_within(normal, loc.base_dir)) {
            return true;
        }
    }
    return false;
}

bool has_parent_segment(const std::string& path) {
    for (const auto& part : split_path(path)) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

class Remover {
public:
    Remover(const LocationTable& table, const Toolset& tools, const ProgressCallback& on_progress)
        : table_(table), tools_(tools), on_progress_(on_progress) {}

    void remove_unit(const std::string& root) {
        if (!path_lexists(root)) {
            spdlog::warn("Bundle {} is already gone", root);
            return;
        }
        auto removed = tools_.deleter->remove_tree(root);
        if (!removed.ok || path_lexists(root)) {
            fail(root, removed.ok ? "still present after removal" : removed.error);
            return;
        }
        succeed(root);
    }

    void remove_declared(const std::string& declared) {
        if (has_parent_segment(declared)) {
            fail(declared, "refusing a path that climbs with ..");
            return;
        }
        auto expanded = expand_declared_path(table_, declared);
        if (!expanded) {
            fail(declared, "not an absolute path");
            return;
        }
        const std::string& path = *expanded;

        if (is_protected(table_, path)) {
            fail(path, "refusing to remove a base location");
            return;
        }
        if (!path_lexists(path)) {
            spdlog::debug("remove: declared path {} does not exist", path);
            return;
        }

        if (table_.is_escalated(path)) {
            auto removed = tools_.escalated_deleter->remove_tree(path);
            if (!removed.ok) {
                spdlog::warn("Escalated removal of {} reported: {}", path, removed.error);
            }
            if (path_lexists(path)) {
                fail_with_children(path);
                return;
            }
            succeed(path);
            return;
        }

        auto removed = tools_.deleter->remove_tree(path);
        if (!removed.ok || path_lexists(path)) {
            fail(path, removed.ok ? "still present after removal" : removed.error);
            return;
        }
        succeed(path);
    }

    void remove_file(const std::string& path) {
        if (!path_lexists(path)) {
            return;
        }
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            fail(path, ec.message());
            return;
        }
        succeed(path);
    }

    RemovalOutcome outcome;

private:
    void fail_with_children(const std::string& dir) {
        std::error_code ec;
        if (fs::is_directory(fs::symlink_status(dir, ec))) {
            for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
                fail(it->path().string(), kEscalatedFailure);
            }
        }
        fail(dir, kEscalatedFailure);
    }

    void succeed(const std::string& path) {
        ++outcome.removed;
        if (on_progress_) {
            on_progress_(ProgressEvent{ProgressKind::PathRemoved, path, ""});
        }
    }

    void fail(const std::string& path, const std::string& reason) {
        spdlog::warn("Failed to remove {}: {}", path, reason);
        outcome.failed.push_back(RemovalFailure{path, reason});
    }

    const LocationTable& table_;
    const Toolset& tools_;
    const ProgressCallback& on_progress_;
};

std::string quote(const std::string& path) {
    return "\"" + path + "\"";
}

} // namespace

RemovalOutcome remove_record_files(const InstalledRecord& record,
                                   const LocationTable& table,
                                   const Toolset& tools,
                                   const ProgressCallback& on_progress) {
    Remover remover(table, tools, on_progress);
    auto grouping = group_destinations(record.files);

    for (const auto& root : grouping.roots) {
        remover.remove_unit(root);
    }
    for (const auto& declared : record.descriptor.extra_paths) {
        remover.remove_declared(declared);
    }
    for (const auto& file : grouping.loose) {
        remover.remove_file(file);
    }

    return remover.outcome;
}

UninstallResult uninstall_package(ManifestStore& store,
                                  const std::string& name,
                                  const LocationTable& table,
                                  const Toolset& tools,
                                  const ProgressCallback& on_progress) {
    UninstallResult result;

    auto loaded = store.load(name);
    if (!loaded.ok) {
        result.code = loaded.code == ErrorCode::NotFound ? ErrorCode::NotInstalled : loaded.code;
        result.error = loaded.code == ErrorCode::NotFound
            ? "package '" + name + "' is not installed"
            : loaded.error;
        return result;
    }

    spdlog::info("Removing {} {}", name, loaded.record.version);
    auto outcome = remove_record_files(loaded.record, table, tools, on_progress);
    result.removed = outcome.removed;
    result.failed = std::move(outcome.failed);

    auto erased = store.remove(name);
    if (!erased.ok) {
        result.code = erased.code;
        result.error = erased.error;
        return result;
    }

    result.ok = true;
    return result;
}

std::string format_failure_report(const std::vector<RemovalFailure>& failed, Platform platform) {
    if (failed.empty()) {
        return "";
    }

    std::map<std::string, std::vector<const RemovalFailure*>> by_dir;
    for (const auto& f : failed) {
        by_dir[get_parent_directory(f.path)].push_back(&f);
    }

    std::string out = "Failed to remove " + std::to_string(failed.size()) + " item(s):\n";
    for (const auto& [dir, items] : by_dir) {
        out += "  " + dir + "/\n";
        for (const auto* f : items) {
            out += "    - " + get_filename(f->path) + " (" + f->reason + ")\n";
        }
    }

    out += "\nTo remove them manually, run:\n";

    if (platform == Platform::macOS) {
        for (size_t i = 0; i < failed.size(); i += kSudoBatchSize) {
            std::string script;
            for (size_t j = i; j < failed.size() && j < i + kSudoBatchSize; ++j) {
                const std::string q = quote(failed[j].path);
                if (!script.empty()) script += " && ";
                script += "chflags -R 0 " + q + " && chmod -R 777 " + q + " && rm -Rf " + q;
            }
            out += "  sudo sh -c '" + script + "'\n";
        }

        out += "\nOr remove the affected directories:\n";
        size_t shown = 0;
        for (const auto& [dir, items] : by_dir) {
            if (shown == kMaxDirectoryCommands) break;
            out += "  sudo rm -rf " + quote(dir) + "\n";
            ++shown;
        }
        if (by_dir.size() > kMaxDirectoryCommands) {
            out += "  # ... and " + std::to_string(by_dir.size() - kMaxDirectoryCommands) +
                   " more directories\n";
        }
        return out;
    }

    for (size_t i = 0; i < failed.size() && i < kMaxItemCommands; ++i) {
        out += "  rm -rf " + quote(failed[i].path) + "\n";
    }
    if (failed.size() > kMaxItemCommands) {
        out += "  # ... and " + std::to_string(failed.size() - kMaxItemCommands) + " more items\n";
    }
    return out;
}

} // namespace pawkit
