#include "pawkit/installer.hpp"
#include "pawkit/bundle.hpp"
#include "pawkit/descriptor.hpp"
#include "pawkit/inspector.hpp"
#include "pawkit/planner.hpp"
#include "pawkit/repository.hpp"
#include "pawkit/version.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace pawkit {

// ============================================================================
// Engine Context
// ============================================================================

EngineContext make_engine_context(const std::string& root,
                                  bool allow_privilege_escalation,
                                  Platform platform) {
    EngineContext ctx;
    ctx.paths = get_pawkit_paths(root);
    ctx.locations = LocationTable::for_home(get_home_directory(), ctx.paths.metadata_dir, platform);
    ctx.tools = Toolset::detect(platform, allow_privilege_escalation);
    ctx.allow_privilege_escalation = allow_privilege_escalation;

    std::string error;
    if (!ensure_pawkit_structure(ctx.paths, error)) {
        spdlog::warn("{}", error);
    }
    return ctx;
}

// ============================================================================
// Install
// ============================================================================

namespace {

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    return ec ? path : abs.lexically_normal().string();
}

// Archive file name for a package name from a repository
std::string scratch_file_name(const std::string& name) {
    std::string out;
    for (char c : name) {
        out += (c == '/' || c == '\\' || c == ':') ? '_' : c;
    }
    return (out.empty() ? std::string("package") : out) + ".paw";
}

} // namespace

InstallResult install_package(EngineContext& ctx, const std::string& archive_path,
                              const InstallOptions& options) {
    InstallResult result;

    auto inspected = inspect_archive(archive_path, ctx.tools);
    if (!inspected.ok) {
        result.code = inspected.code;
        result.error = inspected.error;
        return result;
    }
    result.extraction_method = inspected.extraction_method;
    result.warnings = inspected.warnings;

    PackageDescriptor descriptor = inspected.descriptor;
    if (options.descriptor_overrides.is_object()) {
        apply_descriptor_overlay(descriptor, options.descriptor_overrides);
    }
    result.name = descriptor.name;

    auto planned = plan_installation(inspected.entries, ctx.locations);
    result.rejected = planned.rejected.size();
    if (!planned.ok) {
        result.code = planned.code;
        result.error = planned.error;
        return result;
    }
    for (const auto& path : planned.rejected) {
        spdlog::debug("Skipping {}: no location marker", path);
    }

    auto grouping = group_bundles(planned.plan.entries);

    MaterializeOptions mopts;
    mopts.force = options.force;
    mopts.confirm_installation = options.confirm_installation;
    mopts.confirm = options.confirm;
    mopts.on_progress = options.on_progress;

    auto applied = materialize(planned.plan, grouping, mopts, ctx.tools);
    for (auto& w : applied.warnings) {
        result.warnings.push_back(std::move(w));
    }
    if (!applied.ok) {
        result.code = applied.code;
        result.error = applied.error;
        return result;
    }

    InstalledRecord record;
    record.version = descriptor.version;
    record.install_date = get_current_timestamp();
    record.files = std::move(applied.installed);
    record.descriptor = descriptor;
    record.source = options.source.empty() ? absolute_path(archive_path) : options.source;
    record.package_hash = inspected.package_hash;

    ManifestStore store(ctx.paths.manifest_file);
    auto saved = store.save(descriptor.name, record);
    if (!saved.ok) {
        result.code = saved.code;
        result.error = saved.error;
        return result;
    }

    spdlog::info("Installed {} {} ({} files)", descriptor.name, descriptor.version,
                 record.files.size());

    result.record = std::move(record);
    result.ok = true;
    return result;
}

InstallResult install_from_repository(EngineContext& ctx, const std::string& package_name,
                                      const InstallOptions& options) {
    InstallResult result;
    result.name = package_name;

    RepoStore repos(ctx.paths.repos_file);
    auto found = repos.find_package(package_name);
    if (!found.ok) {
        result.code = found.code;
        result.error = found.error;
        return result;
    }

    spdlog::info("Found {} in {}", package_name, found.repository.name);

    auto downloaded = fetch_url(found.package.download_url);
    if (!downloaded.ok) {
        result.code = ErrorCode::IOError;
        result.error = "failed to download " + package_name + ": " + downloaded.error;
        return result;
    }

    ScratchDirectory scratch;
    if (!scratch.ok()) {
        result.code = ErrorCode::IOError;
        result.error = scratch.error();
        return result;
    }

    std::string archive = join_path(scratch.path(), scratch_file_name(package_name));
    {
        std::ofstream out(archive, std::ios::binary);
        out.write(reinterpret_cast<const char*>(downloaded.data.data()),
                  static_cast<std::streamsize>(downloaded.data.size()));
        if (!out) {
            result.code = ErrorCode::IOError;
            result.error = "failed to write downloaded package to " + archive;
            return result;
        }
    }

    nlohmann::json overlay = found.package.record;
    overlay["name"] = package_name;

    InstallOptions repo_options = options;
    repo_options.descriptor_overrides = overlay;
    repo_options.source = found.package.download_url;

    return install_package(ctx, archive, repo_options);
}

// ============================================================================
// Update
// ============================================================================

UpdateResult update_package(EngineContext& ctx, const std::string& name,
                            const InstallOptions& options) {
    UpdateResult result;

    ManifestStore store(ctx.paths.manifest_file);
    auto installed = store.load(name);
    if (!installed.ok) {
        result.code = installed.code == ErrorCode::NotFound ? ErrorCode::NotInstalled : installed.code;
        result.error = installed.code == ErrorCode::NotFound
            ? "package '" + name + "' is not installed"
            : installed.error;
        return result;
    }
    result.installed_version = installed.record.version;

    RepoStore repos(ctx.paths.repos_file);
    auto latest = repos.latest_version(name);
    if (!latest.ok) {
        result.code = latest.code;
        result.error = latest.error;
        return result;
    }
    result.latest_version = latest.version;

    if (compare_versions(result.installed_version, result.latest_version) >= 0) {
        spdlog::info("{} is already at the latest version ({})", name, result.installed_version);
        result.ok = true;
        return result;
    }

    if (!options.force && options.confirm_update &&
        !options.confirm_update(name, result.installed_version, result.latest_version)) {
        result.code = ErrorCode::InstallAborted;
        result.error = "update cancelled by user";
        return result;
    }

    spdlog::info("Updating {} from {} to {}", name, result.installed_version, result.latest_version);

    auto removed = uninstall_package(store, name, ctx.locations, ctx.tools, options.on_progress);
    if (!removed.ok) {
        result.code = removed.code;
        result.error = removed.error;
        return result;
    }
    result.removal_failures = std::move(removed.failed);

    // Already confirmed above
    InstallOptions reinstall = options;
    reinstall.confirm_installation = false;

    auto reinstalled = install_from_repository(ctx, name, reinstall);
    if (!reinstalled.ok) {
        result.code = reinstalled.code;
        result.error = "removed " + name + " but reinstall failed: " + reinstalled.error;
        return result;
    }

    result.updated = true;
    result.ok = true;
    return result;
}

UpdateAllResult update_all(EngineContext& ctx, const InstallOptions& options) {
    UpdateAllResult result;

    RepoStore repos(ctx.paths.repos_file);
    auto listed = repos.list();
    if (!listed.ok) {
        result.code = listed.code;
        result.error = listed.error;
        return result;
    }
    for (const auto& repo : listed.repositories) {
        auto refreshed = repos.refresh(repo.name);
        if (!refreshed.ok) {
            spdlog::warn("{}", refreshed.error);
        }
    }

    ManifestStore store(ctx.paths.manifest_file);
    auto installed = store.list();
    if (!installed.ok) {
        result.code = installed.code;
        result.error = installed.error;
        return result;
    }

    for (const auto& [name, record] : installed.records) {
        auto updated = update_package(ctx, name, options);
        if (!updated.ok) {
            ++result.failed;
            result.errors.push_back(name + ": " + updated.error);
            spdlog::error("Error updating {}: {}", name, updated.error);
        } else if (updated.updated) {
            ++result.updated;
        } else {
            ++result.up_to_date;
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Batches
// ============================================================================

size_t BatchResult::succeeded() const {
    size_t n = 0;
    for (const auto& item : items) {
        if (item.ok) ++n;
    }
    return n;
}

size_t BatchResult::failed() const {
    return items.size() - succeeded();
}

BatchResult install_batch(EngineContext& ctx, const std::vector<std::string>& targets,
                          const InstallOptions& options) {
    BatchResult batch;

    for (const auto& target : targets) {
        std::error_code ec;
        bool local = fs::is_regular_file(target, ec);

        auto installed = local ? install_package(ctx, target, options)
                               : install_from_repository(ctx, target, options);

        BatchItem item;
        item.target = target;
        item.ok = installed.ok;
        item.code = installed.code;
        item.error = installed.error;
        if (!installed.ok) {
            spdlog::error("Failed to install {}: {}", target, installed.error);
        }
        batch.items.push_back(std::move(item));
    }

    return batch;
}

BatchResult uninstall_batch(EngineContext& ctx, const std::vector<std::string>& names,
                            const ProgressCallback& on_progress) {
    BatchResult batch;
    ManifestStore store(ctx.paths.manifest_file);

    for (const auto& name : names) {
        auto removed = uninstall_package(store, name, ctx.locations, ctx.tools, on_progress);

        BatchItem item;
        item.target = name;
        item.ok = removed.ok;
        item.code = removed.code;
        item.error = removed.error;
        item.failed = std::move(removed.failed);
        if (!removed.ok) {
            spdlog::error("Failed to remove {}: {}", name, removed.error);
        }
        batch.items.push_back(std::move(item));
    }

    return batch;
}

} // namespace pawkit
