#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Zip Archive Reading (portable, in-process)
// ============================================================================
//
// Supports stored and deflated members, unix permission bits and symlinks
// (host system 3). Zip64, multi-disk and encrypted archives are rejected.

// "PK" followed by one of the local-header, empty-archive or spanned markers
bool has_zip_signature(const std::vector<uint8_t>& head);

// Reads the first four bytes of a file
bool file_has_zip_signature(const std::string& file_path);

struct ZipMember {
    std::string name;               // As stored, forward slashes
    bool is_directory = false;
    bool is_symlink = false;
    uint32_t mode = 0644;           // Permission bits only
    uint16_t method = 0;            // 0 = stored, 8 = deflate
    uint32_t crc = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
};

struct ZipListResult {
    bool ok = false;
    std::string error;
    std::vector<ZipMember> members;
};

// Parse the central directory
ZipListResult list_zip_members(const std::vector<uint8_t>& data);

struct ZipExtractResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;   // Root-relative paths written
};

// Extract every member under dest_dir. Member names that escape dest_dir,
// or that would be written through an extracted symlink, fail the run.
ZipExtractResult extract_zip(const std::vector<uint8_t>& data, const std::string& dest_dir);
ZipExtractResult extract_zip(const std::string& archive_path, const std::string& dest_dir);

} // namespace pawkit
