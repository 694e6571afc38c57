#include "pawkit/inspector.hpp"
#include "pawkit/descriptor.hpp"
#include "pawkit/digest.hpp"
#include "pawkit/platform.hpp"
#include "pawkit/zip_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace pawkit {

// ============================================================================
// Scratch Directory
// ============================================================================

ScratchDirectory::ScratchDirectory(const std::string& parent_dir) {
    std::error_code ec;
    std::string parent = parent_dir;
    if (parent.empty()) {
        parent = fs::temp_directory_path(ec).string();
        if (ec) {
            error_ = "no temporary directory: " + ec.message();
            return;
        }
    }

    path_ = join_path(parent, "pawkit-" + generate_uuid());
    fs::create_directories(path_, ec);
    if (ec) {
        error_ = "failed to create scratch directory " + path_ + ": " + ec.message();
        path_.clear();
        return;
    }
    ok_ = true;
}

ScratchDirectory::~ScratchDirectory() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("Failed to clean up scratch directory {}: {}", path_, ec.message());
    }
}

// ============================================================================
// Archive Inspection
// ============================================================================

bool is_junk_path(const std::string& archive_path) {
    auto segments = split_path(to_portable_path(archive_path));
    if (segments.empty()) {
        return false;
    }
    for (const auto& segment : segments) {
        if (segment == "__MACOSX") {
            return true;
        }
    }
    const std::string& base = segments.back();
    return base == ".DS_Store" || base.rfind("._", 0) == 0;
}

namespace {

bool reset_directory(const std::string& dir, std::string& error) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        error = "failed to clear " + dir + ": " + ec.message();
        return false;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        error = "failed to create " + dir + ": " + ec.message();
        return false;
    }
    return true;
}

struct WalkResult {
    bool ok = false;
    std::string error;
    std::vector<Entry> entries;
    size_t junk = 0;
};

WalkResult walk_tree(const std::string& root) {
    WalkResult result;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        result.error = "failed to read extracted tree: " + ec.message();
        return result;
    }

    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::string rel = it->path().lexically_relative(root).generic_string();
        auto status = it->symlink_status(ec);
        if (ec) {
            result.error = "failed to stat " + rel + ": " + ec.message();
            return result;
        }

        if (is_junk_path(rel)) {
            ++result.junk;
            if (fs::is_directory(status)) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (fs::is_directory(status)) {
            continue;
        }

        Entry entry;
        entry.path = rel;
        entry.source_location = it->path().string();
        entry.mode = static_cast<uint32_t>(status.permissions()) & 07777;

        if (fs::is_symlink(status)) {
            fs::path target = fs::read_symlink(it->path(), ec);
            if (ec) {
                result.error = "failed to read symlink " + rel + ": " + ec.message();
                return result;
            }
            entry.kind = EntryKind::Symlink;
            entry.link_target = target.string();
            if (target.is_absolute()) {
                entry.resolved_target = target.lexically_normal().string();
            } else {
                entry.resolved_target =
                    (it->path().parent_path() / target).lexically_normal().string();
            }
        } else if (fs::is_regular_file(status)) {
            entry.kind = EntryKind::File;
        } else {
            spdlog::debug("inspect: skipping special file {}", rel);
            continue;
        }

        result.entries.push_back(std::move(entry));
    }
    if (ec) {
        result.error = "failed to walk extracted tree: " + ec.message();
        return result;
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const Entry& a, const Entry& b) { return a.path < b.path; });

    result.ok = true;
    return result;
}

} // namespace

InspectResult inspect_archive(const std::string& archive_path, const Toolset& tools) {
    InspectResult result;
    std::error_code ec;

    if (!fs::is_regular_file(archive_path, ec)) {
        result.code = ErrorCode::NotFound;
        result.error = "package file not found: " + archive_path;
        return result;
    }

    if (!file_has_zip_signature(archive_path)) {
        result.code = ErrorCode::InvalidFormat;
        result.error = "not a valid package archive: " + archive_path;
        return result;
    }

    auto hash = compute_sha256(archive_path);
    if (hash.ok) {
        result.package_hash = "sha256:" + hash.hex_digest;
    } else {
        result.warnings.push_back("could not hash package: " + hash.error);
    }

    result.scratch = std::make_unique<ScratchDirectory>();
    if (!result.scratch->ok()) {
        result.code = ErrorCode::IOError;
        result.error = result.scratch->error();
        return result;
    }

    std::string scratch_archive = join_path(result.scratch->path(), "package.paw");
    fs::copy_file(archive_path, scratch_archive, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        result.code = ErrorCode::IOError;
        result.error = "failed to copy package to scratch area: " + ec.message();
        return result;
    }

    std::string extracted = join_path(result.scratch->path(), "extracted");
    std::string last_error = "no extractor available";
    for (const auto& extractor : tools.extractors) {
        std::string reset_error;
        if (!reset_directory(extracted, reset_error)) {
            result.code = ErrorCode::IOError;
            result.error = reset_error;
            return result;
        }

        auto extract = extractor->extract(scratch_archive, extracted);
        if (extract.ok) {
            result.extraction_method = extractor->name();
            break;
        }
        last_error = extract.error;
        spdlog::warn("Extraction with {} failed, trying next method: {}",
                     extractor->name(), extract.error);
    }

    if (result.extraction_method.empty()) {
        result.code = ErrorCode::InvalidFormat;
        result.error = "failed to extract package: " + last_error;
        return result;
    }
    spdlog::debug("inspect: extracted {} with {}", archive_path, result.extraction_method);

    auto walk = walk_tree(extracted);
    if (!walk.ok) {
        result.code = ErrorCode::IOError;
        result.error = walk.error;
        return result;
    }
    result.entries = std::move(walk.entries);
    result.junk_skipped = walk.junk;

    // Descriptor at the fixed path, or nested under the archive's base name
    std::string stem = get_stem(archive_path);
    std::vector<std::string> candidates = {
        join_path(extracted, kDescriptorPath),
        join_path(join_path(extracted, stem), kDescriptorPath),
    };

    result.descriptor = default_descriptor(stem);
    for (const auto& candidate : candidates) {
        if (!fs::is_regular_file(fs::symlink_status(candidate, ec))) {
            continue;
        }
        auto content = read_file(candidate);
        if (!content) {
            result.warnings.push_back("could not read descriptor " + candidate);
            continue;
        }
        auto parsed = parse_descriptor(*content, stem);
        result.descriptor = std::move(parsed.descriptor);
        result.descriptor_found = parsed.found;
        for (auto& w : parsed.warnings) {
            result.warnings.push_back(std::move(w));
        }
        break;
    }

    spdlog::debug("inspect: {} entries, {} junk, package '{}' {}",
                  result.entries.size(), result.junk_skipped,
                  result.descriptor.name, result.descriptor.version);

    result.ok = true;
    return result;
}

} // namespace pawkit
