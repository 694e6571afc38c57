#pragma once

#include "pawkit/platform.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Capabilities
// ============================================================================
//
// Native tools and their portable fallbacks. One instance of each is chosen
// by Toolset::detect() at startup; callers never probe per operation.

struct ToolResult {
    bool ok = false;
    std::string error;
};

class Extractor {
public:
    virtual ~Extractor() = default;
    virtual const char* name() const = 0;
    virtual ToolResult extract(const std::string& archive_path, const std::string& dest_dir) const = 0;
};

class TreeCopier {
public:
    virtual ~TreeCopier() = default;
    virtual const char* name() const = 0;
    // Copy the tree at src to dst (dst becomes the copy, not its parent)
    virtual ToolResult copy_tree(const std::string& src, const std::string& dst) const = 0;
};

class TreeDeleter {
public:
    virtual ~TreeDeleter() = default;
    virtual const char* name() const = 0;
    virtual ToolResult remove_tree(const std::string& path) const = 0;
};

class SymlinkTagger {
public:
    virtual ~SymlinkTagger() = default;
    virtual const char* name() const = 0;
    virtual ToolResult tag(const std::string& link_path) const = 0;
};

// Removal for the escalated location class. Best-effort; callers verify
// the post-condition themselves.
class EscalatedDeleter {
public:
    virtual ~EscalatedDeleter() = default;
    virtual const char* name() const = 0;
    virtual ToolResult remove_tree(const std::string& path) const = 0;
};

// ----------------------------------------------------------------------------
// Native variants
// ----------------------------------------------------------------------------

// unzip -X -o -K (keeps symlinks, owner and extended attributes)
class NativeUnzipExtractor : public Extractor {
public:
    explicit NativeUnzipExtractor(std::string unzip_path);
    const char* name() const override { return "unzip"; }
    ToolResult extract(const std::string& archive_path, const std::string& dest_dir) const override;

private:
    std::string unzip_path_;
};

// ditto --preserve-hfs-compression --noqtn (macOS)
class DittoCopier : public TreeCopier {
public:
    explicit DittoCopier(std::string ditto_path);
    const char* name() const override { return "ditto"; }
    ToolResult copy_tree(const std::string& src, const std::string& dst) const override;

private:
    std::string ditto_path_;
};

// rm -rf
class NativeRemoveDeleter : public TreeDeleter {
public:
    explicit NativeRemoveDeleter(std::string rm_path);
    const char* name() const override { return "rm"; }
    ToolResult remove_tree(const std::string& path) const override;

private:
    std::string rm_path_;
};

// Sets the Finder alias/symlink type bits (macOS)
class XattrSymlinkTagger : public SymlinkTagger {
public:
    explicit XattrSymlinkTagger(std::string xattr_path);
    const char* name() const override { return "xattr"; }
    ToolResult tag(const std::string& link_path) const override;

private:
    std::string xattr_path_;
};

// sudo chflags/chattr, sudo chmod -R 777, sudo rm -Rf. Opt-in only.
class SudoDeleter : public EscalatedDeleter {
public:
    SudoDeleter(std::string sudo_path, Platform platform);
    const char* name() const override { return "sudo"; }
    ToolResult remove_tree(const std::string& path) const override;

private:
    std::string sudo_path_;
    Platform platform_;
};

// ----------------------------------------------------------------------------
// Portable variants
// ----------------------------------------------------------------------------

// In-process zip reader (zlib)
class ZipExtractor : public Extractor {
public:
    const char* name() const override { return "zip"; }
    ToolResult extract(const std::string& archive_path, const std::string& dest_dir) const override;
};

// std::filesystem recursive copy, symlinks kept as symlinks
class FilesystemCopier : public TreeCopier {
public:
    const char* name() const override { return "filesystem"; }
    ToolResult copy_tree(const std::string& src, const std::string& dst) const override;
};

class FilesystemDeleter : public TreeDeleter {
public:
    const char* name() const override { return "filesystem"; }
    ToolResult remove_tree(const std::string& path) const override;
};

class NullSymlinkTagger : public SymlinkTagger {
public:
    const char* name() const override { return "none"; }
    ToolResult tag(const std::string& link_path) const override;
};

// Forces owner rwx on every directory in the tree, then removes it
class PermissiveDeleter : public EscalatedDeleter {
public:
    const char* name() const override { return "permissive"; }
    ToolResult remove_tree(const std::string& path) const override;
};

// ============================================================================
// Toolset
// ============================================================================

struct Toolset {
    std::vector<std::unique_ptr<Extractor>> extractors;     // Preference order
    std::unique_ptr<TreeCopier> copier;
    std::unique_ptr<TreeDeleter> deleter;
    std::unique_ptr<SymlinkTagger> tagger;
    std::unique_ptr<EscalatedDeleter> escalated_deleter;

    // Probe PATH for native tools appropriate to the platform
    static Toolset detect(Platform platform, bool allow_privilege_escalation = false);

    // In-process variants only
    static Toolset portable();

    std::string describe() const;
};

} // namespace pawkit
