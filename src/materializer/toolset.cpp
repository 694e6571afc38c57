#include "pawkit/toolset.hpp"
#include "pawkit/inspector.hpp"
#include "pawkit/process.hpp"
#include "pawkit/zip_reader.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

namespace pawkit {

namespace {

// FinderInfo with the symlink type bits set
constexpr const char* kSymlinkFinderInfo =
    "0000000000000000000400000000000000000000000000000000000000000000";

ToolResult run_tool(const std::vector<std::string>& argv) {
    ToolResult result;
    spdlog::debug("exec: {}", format_command(argv));

    auto proc = run_process(argv);
    if (!proc.ok) {
        result.error = proc.error;
        return result;
    }
    if (proc.exit_code != 0) {
        result.error = argv[0] + " exited with status " + std::to_string(proc.exit_code);
        if (!proc.output.empty()) {
            result.error += ": " + proc.output;
        }
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace

// ----------------------------------------------------------------------------
// Native variants
// ----------------------------------------------------------------------------

NativeUnzipExtractor::NativeUnzipExtractor(std::string unzip_path)
    : unzip_path_(std::move(unzip_path)) {}

ToolResult NativeUnzipExtractor::extract(const std::string& archive_path,
                                         const std::string& dest_dir) const {
    std::vector<std::string> argv = {unzip_path_, "-X", "-o", "-K", archive_path, "-d", dest_dir};
    spdlog::debug("exec: {}", format_command(argv));

    ToolResult result;
    auto proc = run_process(argv);
    if (!proc.ok) {
        result.error = proc.error;
        return result;
    }
    // 1 means warnings only, the archive was still processed
    if (proc.exit_code != 0 && proc.exit_code != 1) {
        result.error = "unzip exited with status " + std::to_string(proc.exit_code);
        if (!proc.output.empty()) {
            result.error += ": " + proc.output;
        }
        return result;
    }

    result.ok = true;
    return result;
}

DittoCopier::DittoCopier(std::string ditto_path) : ditto_path_(std::move(ditto_path)) {}

ToolResult DittoCopier::copy_tree(const std::string& src, const std::string& dst) const {
    return run_tool({ditto_path_, "--preserve-hfs-compression", "--noqtn", src, dst});
}

NativeRemoveDeleter::NativeRemoveDeleter(std::string rm_path) : rm_path_(std::move(rm_path)) {}

ToolResult NativeRemoveDeleter::remove_tree(const std::string& path) const {
    return run_tool({rm_path_, "-rf", path});
}

XattrSymlinkTagger::XattrSymlinkTagger(std::string xattr_path)
    : xattr_path_(std::move(xattr_path)) {}

ToolResult XattrSymlinkTagger::tag(const std::string& link_path) const {
    return run_tool({xattr_path_, "-w", "com.apple.FinderInfo", kSymlinkFinderInfo, link_path});
}

SudoDeleter::SudoDeleter(std::string sudo_path, Platform platform)
    : sudo_path_(std::move(sudo_path)), platform_(platform) {}

ToolResult SudoDeleter::remove_tree(const std::string& path) const {
    std::vector<std::string> unflag = platform_ == Platform::macOS
        ? std::vector<std::string>{sudo_path_, "chflags", "-R", "0", path}
        : std::vector<std::string>{sudo_path_, "chattr", "-R", "-i", path};

    auto flags = run_tool(unflag);
    if (!flags.ok) {
        spdlog::warn("Could not clear file flags on {}: {}", path, flags.error);
    }

    auto perms = run_tool({sudo_path_, "chmod", "-R", "777", path});
    if (!perms.ok) {
        spdlog::warn("Could not open permissions on {}: {}", path, perms.error);
    }

    return run_tool({sudo_path_, "rm", "-Rf", path});
}

// ----------------------------------------------------------------------------
// Portable variants
// ----------------------------------------------------------------------------

ToolResult ZipExtractor::extract(const std::string& archive_path, const std::string& dest_dir) const {
    ToolResult result;
    auto extracted = extract_zip(archive_path, dest_dir);
    if (!extracted.ok) {
        result.error = extracted.error;
        return result;
    }
    result.ok = true;
    return result;
}

ToolResult FilesystemCopier::copy_tree(const std::string& src, const std::string& dst) const {
    ToolResult result;
    std::error_code ec;

    fs::create_directories(dst, ec);
    if (ec) {
        result.error = "failed to create " + dst + ": " + ec.message();
        return result;
    }

    fs::recursive_directory_iterator it(src, ec);
    if (ec) {
        result.error = "failed to read " + src + ": " + ec.message();
        return result;
    }

    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        fs::path rel = it->path().lexically_relative(src);
        fs::path target = fs::path(dst) / rel;
        auto status = it->symlink_status(ec);
        if (ec) {
            result.error = "failed to stat " + it->path().string() + ": " + ec.message();
            return result;
        }

        // Same junk the inspector drops from the per-file plan
        if (is_junk_path(rel.generic_string())) {
            if (fs::is_directory(status)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (fs::is_symlink(status)) {
            if (path_lexists(target.string())) {
                fs::remove(target, ec);
            }
            if (!ec) {
                fs::copy_symlink(it->path(), target, ec);
            }
        } else if (fs::is_directory(status)) {
            fs::create_directories(target, ec);
        } else {
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, ec);
        }

        if (ec) {
            result.error = "failed to copy " + rel.generic_string() + ": " + ec.message();
            return result;
        }
    }
    if (ec) {
        result.error = "failed to walk " + src + ": " + ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

ToolResult FilesystemDeleter::remove_tree(const std::string& path) const {
    ToolResult result;
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }
    result.ok = true;
    return result;
}

ToolResult NullSymlinkTagger::tag(const std::string&) const {
    ToolResult result;
    result.ok = true;
    return result;
}

ToolResult PermissiveDeleter::remove_tree(const std::string& path) const {
    ToolResult result;
    std::error_code ec;

    auto root_status = fs::symlink_status(path, ec);
    if (!ec && fs::is_directory(root_status)) {
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, ec);

        // Each directory is opened on increment, after its mode was fixed
        fs::recursive_directory_iterator it(
            path, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code perm_ec;
            if (it->is_directory(perm_ec) && !it->is_symlink(perm_ec)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
                if (perm_ec) {
                    spdlog::debug("chmod {} failed: {}", it->path().string(), perm_ec.message());
                }
            }
        }
        if (ec) {
            spdlog::debug("walk of {} stopped early: {}", path, ec.message());
        }
    }

    ec.clear();
    fs::remove_all(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }
    result.ok = true;
    return result;
}

// ============================================================================
// Toolset
// ============================================================================

Toolset Toolset::detect(Platform platform, bool allow_privilege_escalation) {
    Toolset tools;
    bool posix = platform == Platform::Linux || platform == Platform::macOS;
    bool mac = platform == Platform::macOS;

    if (posix) {
        if (auto unzip = find_executable("unzip")) {
            tools.extractors.push_back(std::make_unique<NativeUnzipExtractor>(*unzip));
        }
    }
    tools.extractors.push_back(std::make_unique<ZipExtractor>());

    std::optional<std::string> ditto = mac ? find_executable("ditto") : std::nullopt;
    if (ditto) {
        tools.copier = std::make_unique<DittoCopier>(*ditto);
    } else {
        tools.copier = std::make_unique<FilesystemCopier>();
    }

    std::optional<std::string> rm = mac ? find_executable("rm") : std::nullopt;
    if (rm) {
        tools.deleter = std::make_unique<NativeRemoveDeleter>(*rm);
    } else {
        tools.deleter = std::make_unique<FilesystemDeleter>();
    }

    std::optional<std::string> xattr = mac ? find_executable("xattr") : std::nullopt;
    if (xattr) {
        tools.tagger = std::make_unique<XattrSymlinkTagger>(*xattr);
    } else {
        tools.tagger = std::make_unique<NullSymlinkTagger>();
    }

    std::optional<std::string> sudo =
        (posix && allow_privilege_escalation) ? find_executable("sudo") : std::nullopt;
    if (sudo) {
        tools.escalated_deleter = std::make_unique<SudoDeleter>(*sudo, platform);
    } else {
        if (allow_privilege_escalation) {
            spdlog::warn("Privilege escalation requested but sudo is not available");
        }
        tools.escalated_deleter = std::make_unique<PermissiveDeleter>();
    }

    spdlog::debug("toolset for {}: {}", platform_to_string(platform), tools.describe());
    return tools;
}

Toolset Toolset::portable() {
    Toolset tools;
    tools.extractors.push_back(std::make_unique<ZipExtractor>());
    tools.copier = std::make_unique<FilesystemCopier>();
    tools.deleter = std::make_unique<FilesystemDeleter>();
    tools.tagger = std::make_unique<NullSymlinkTagger>();
    tools.escalated_deleter = std::make_unique<PermissiveDeleter>();
    return tools;
}

std::string Toolset::describe() const {
    std::string extract_chain;
    for (const auto& e : extractors) {
        if (!extract_chain.empty()) extract_chain += ",";
        extract_chain += e->name();
    }
    return "extract=" + extract_chain +
           " copy=" + (copier ? copier->name() : "-") +
           " delete=" + (deleter ? deleter->name() : "-") +
           " tag=" + (tagger ? tagger->name() : "-") +
           " escalated=" + (escalated_deleter ? escalated_deleter->name() : "-");
}

} // namespace pawkit
