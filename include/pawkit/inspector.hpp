#pragma once

#include "pawkit/toolset.hpp"
#include "pawkit/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Scratch Directory
// ============================================================================

// Unique temporary directory removed on destruction. A failed removal is
// logged, never raised.
class ScratchDirectory {
public:
    // Created under parent_dir, or the system temp directory when empty
    explicit ScratchDirectory(const std::string& parent_dir = "");
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    bool ok() const { return ok_; }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
    bool ok_ = false;
};

// ============================================================================
// Archive Inspection
// ============================================================================

// Resource forks, Finder indexes and __MACOSX shadow trees
bool is_junk_path(const std::string& archive_path);

struct InspectResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;

    std::vector<Entry> entries;             // Files and symlinks, sorted by path
    PackageDescriptor descriptor;
    bool descriptor_found = false;
    std::string extraction_method;          // Extractor that produced the tree
    std::string package_hash;               // "sha256:<hex>", empty if unavailable
    size_t junk_skipped = 0;
    std::vector<std::string> warnings;

    // Owns the extracted tree every Entry::source_location points into
    std::unique_ptr<ScratchDirectory> scratch;
};

// Copy the archive to a scratch area, extract it with the first extractor
// that succeeds and classify the extracted tree. The caller's file is never
// modified.
InspectResult inspect_archive(const std::string& archive_path, const Toolset& tools);

} // namespace pawkit
