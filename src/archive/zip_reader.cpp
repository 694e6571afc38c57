#include "pawkit/zip_reader.hpp"
#include "pawkit/path_utils.hpp"
#include "pawkit/platform.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <climits>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

namespace fs = std::filesystem;

namespace pawkit {

namespace {

constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t ZIP_CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t ZIP_EOCD_SIG = 0x06054b50;

constexpr size_t ZIP_LOCAL_HEADER_SIZE = 30;
constexpr size_t ZIP_CENTRAL_HEADER_SIZE = 46;
constexpr size_t ZIP_EOCD_SIZE = 22;
constexpr size_t ZIP_MAX_COMMENT = 0xFFFF;

constexpr uint16_t ZIP_METHOD_STORED = 0;
constexpr uint16_t ZIP_METHOD_DEFLATE = 8;
constexpr uint16_t ZIP_FLAG_ENCRYPTED = 0x0001;
constexpr uint8_t ZIP_HOST_UNIX = 3;

constexpr uint32_t UNIX_TYPE_MASK = 0170000;
constexpr uint32_t UNIX_TYPE_DIR = 0040000;
constexpr uint32_t UNIX_TYPE_LINK = 0120000;
constexpr uint32_t DOS_ATTR_DIR = 0x10;

constexpr size_t INFLATE_CHUNK = 64 * 1024;
// Deflate cannot expand input by more than about 1032:1
constexpr uint64_t DEFLATE_MAX_RATIO = 1032;

uint16_t read_u16(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t read_u32(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

// Raw deflate stream, inflated in chunks and capped at the declared size
std::optional<std::vector<uint8_t>> inflate_raw(const uint8_t* data, size_t size,
                                                size_t expected_size) {
    std::vector<uint8_t> out;
    if (expected_size == 0) {
        return out;
    }

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -15) != Z_OK) {
        return std::nullopt;
    }

    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);

    std::vector<uint8_t> chunk(INFLATE_CHUNK);
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            break;
        }

        size_t produced = chunk.size() - strm.avail_out;
        if (out.size() + produced > expected_size) {
            ret = Z_DATA_ERROR;
            break;
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));

        if (ret == Z_OK && produced == 0 && strm.avail_in == 0) {
            ret = Z_BUF_ERROR;
            break;
        }
    }
    inflateEnd(&strm);

    if (ret != Z_STREAM_END || out.size() != expected_size) {
        return std::nullopt;
    }
    return out;
}

std::optional<size_t> find_eocd(const std::vector<uint8_t>& data) {
    if (data.size() < ZIP_EOCD_SIZE) {
        return std::nullopt;
    }
    size_t last = data.size() - ZIP_EOCD_SIZE;
    size_t first = last > ZIP_MAX_COMMENT ? last - ZIP_MAX_COMMENT : 0;
    for (size_t pos = last + 1; pos-- > first;) {
        if (read_u32(data, pos) == ZIP_EOCD_SIG) {
            return pos;
        }
    }
    return std::nullopt;
}

// True if any existing component between root and path (exclusive) is a symlink
bool passes_through_symlink(const std::string& root, const std::string& relative) {
    auto segments = split_path(relative);
    std::string current = root;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        current = join_path(current, segments[i]);
        std::error_code ec;
        if (fs::is_symlink(fs::symlink_status(current, ec))) {
            return true;
        }
    }
    return false;
}

bool write_bytes(const std::string& path, const uint8_t* data, size_t size) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return static_cast<bool>(file);
}

} // namespace

bool has_zip_signature(const std::vector<uint8_t>& head) {
    if (head.size() < 4) {
        return false;
    }
    if (head[0] != 'P' || head[1] != 'K') {
        return false;
    }
    bool third = head[2] == 3 || head[2] == 5 || head[2] == 7;
    bool fourth = head[3] == 4 || head[3] == 6 || head[3] == 8;
    return third && fourth;
}

bool file_has_zip_signature(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return false;
    }
    std::vector<uint8_t> head(4);
    file.read(reinterpret_cast<char*>(head.data()), 4);
    if (file.gcount() != 4) {
        return false;
    }
    return has_zip_signature(head);
}

ZipListResult list_zip_members(const std::vector<uint8_t>& data) {
    ZipListResult result;

    auto eocd = find_eocd(data);
    if (!eocd) {
        result.error = "end of central directory not found";
        return result;
    }

    uint16_t disk = read_u16(data, *eocd + 4);
    uint16_t cd_disk = read_u16(data, *eocd + 6);
    uint16_t total = read_u16(data, *eocd + 10);
    uint32_t cd_size = read_u32(data, *eocd + 12);
    uint32_t cd_offset = read_u32(data, *eocd + 16);

    if (disk != 0 || cd_disk != 0) {
        result.error = "multi-disk archives are not supported";
        return result;
    }
    if (total == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF) {
        result.error = "zip64 archives are not supported";
        return result;
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > *eocd) {
        result.error = "central directory out of bounds";
        return result;
    }

    size_t offset = cd_offset;
    for (uint16_t i = 0; i < total; ++i) {
        if (offset + ZIP_CENTRAL_HEADER_SIZE > *eocd ||
            read_u32(data, offset) != ZIP_CENTRAL_HEADER_SIG) {
            result.error = "corrupt central directory entry " + std::to_string(i);
            return result;
        }

        uint16_t made_by = read_u16(data, offset + 4);
        uint16_t flags = read_u16(data, offset + 8);
        uint16_t name_len = read_u16(data, offset + 28);
        uint16_t extra_len = read_u16(data, offset + 30);
        uint16_t comment_len = read_u16(data, offset + 32);
        uint32_t external = read_u32(data, offset + 38);

        if (offset + ZIP_CENTRAL_HEADER_SIZE + name_len > *eocd) {
            result.error = "truncated central directory";
            return result;
        }

        ZipMember member;
        member.method = read_u16(data, offset + 10);
        member.crc = read_u32(data, offset + 16);
        member.compressed_size = read_u32(data, offset + 20);
        member.uncompressed_size = read_u32(data, offset + 24);
        member.local_header_offset = read_u32(data, offset + 42);
        member.name.assign(reinterpret_cast<const char*>(data.data() + offset + ZIP_CENTRAL_HEADER_SIZE),
                           name_len);
        member.name = to_portable_path(member.name);

        if (flags & ZIP_FLAG_ENCRYPTED) {
            result.error = "encrypted member not supported: " + member.name;
            return result;
        }

        uint32_t unix_mode = 0;
        if ((made_by >> 8) == ZIP_HOST_UNIX) {
            unix_mode = external >> 16;
        }

        member.is_directory = (!member.name.empty() && member.name.back() == '/') ||
                              (unix_mode & UNIX_TYPE_MASK) == UNIX_TYPE_DIR ||
                              (external & DOS_ATTR_DIR) != 0;
        member.is_symlink = !member.is_directory &&
                            (unix_mode & UNIX_TYPE_MASK) == UNIX_TYPE_LINK;

        if (unix_mode & 07777) {
            member.mode = unix_mode & 07777;
        } else {
            member.mode = member.is_directory ? 0755 : 0644;
        }

        result.members.push_back(std::move(member));
        offset += ZIP_CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
    }

    result.ok = true;
    return result;
}

ZipExtractResult extract_zip(const std::vector<uint8_t>& data, const std::string& dest_dir) {
    ZipExtractResult result;

    auto listing = list_zip_members(data);
    if (!listing.ok) {
        result.error = listing.error;
        return result;
    }

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        result.error = "failed to create extraction directory: " + ec.message();
        return result;
    }

    for (const auto& member : listing.members) {
        std::string name = member.name;
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        if (name.empty()) {
            continue;
        }

        auto placed = place_under_root(dest_dir, name);
        if (!placed.ok) {
            result.error = std::string("unsafe member path (") +
                           path_error_to_string(placed.error) + "): " + member.name;
            return result;
        }
        if (passes_through_symlink(dest_dir, placed.relative)) {
            result.error = "member path passes through a symlink: " + member.name;
            return result;
        }

        if (member.is_directory) {
            fs::create_directories(placed.path, ec);
            if (ec) {
                result.error = "failed to create directory " + placed.relative + ": " + ec.message();
                return result;
            }
            result.entries.push_back(placed.relative);
            continue;
        }

        // Locate member data through its local header
        size_t lh = static_cast<size_t>(member.local_header_offset);
        if (lh + ZIP_LOCAL_HEADER_SIZE > data.size() || read_u32(data, lh) != ZIP_LOCAL_HEADER_SIG) {
            result.error = "corrupt local header: " + member.name;
            return result;
        }
        size_t data_start = lh + ZIP_LOCAL_HEADER_SIZE + read_u16(data, lh + 26) + read_u16(data, lh + 28);
        if (data_start + member.compressed_size > data.size()) {
            result.error = "truncated archive: " + member.name;
            return result;
        }
        if (member.uncompressed_size > UINT_MAX || member.compressed_size > UINT_MAX) {
            result.error = "member too large: " + member.name;
            return result;
        }

        std::vector<uint8_t> content;
        if (member.method == ZIP_METHOD_STORED) {
            if (member.compressed_size != member.uncompressed_size) {
                result.error = "size mismatch in stored member: " + member.name;
                return result;
            }
            content.assign(data.begin() + static_cast<std::ptrdiff_t>(data_start),
                           data.begin() + static_cast<std::ptrdiff_t>(data_start + member.compressed_size));
        } else if (member.method == ZIP_METHOD_DEFLATE) {
            if (static_cast<uint64_t>(member.uncompressed_size) >
                static_cast<uint64_t>(member.compressed_size) * DEFLATE_MAX_RATIO + INFLATE_CHUNK) {
                result.error = "declared size exceeds what the compressed data can hold: " + member.name;
                return result;
            }
            auto inflated = inflate_raw(data.data() + data_start,
                                        static_cast<size_t>(member.compressed_size),
                                        static_cast<size_t>(member.uncompressed_size));
            if (!inflated) {
                result.error = "failed to inflate member: " + member.name;
                return result;
            }
            content = std::move(*inflated);
        } else {
            result.error = "unsupported compression method " + std::to_string(member.method) +
                           ": " + member.name;
            return result;
        }

        uint32_t crc = static_cast<uint32_t>(
            crc32(0, content.data(), static_cast<uInt>(content.size())));
        if (crc != member.crc) {
            result.error = "CRC mismatch: " + member.name;
            return result;
        }

        std::string parent = get_parent_directory(placed.path);
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                result.error = "failed to create parent directory for " + placed.relative +
                               ": " + ec.message();
                return result;
            }
        }

        if (path_lexists(placed.path)) {
            fs::remove(placed.path, ec);
            if (ec) {
                result.error = "failed to replace " + placed.relative + ": " + ec.message();
                return result;
            }
        }

        if (member.is_symlink) {
            std::string target(content.begin(), content.end());
            fs::create_symlink(target, placed.path, ec);
            if (ec) {
                result.error = "failed to create symlink " + placed.relative + ": " + ec.message();
                return result;
            }
        } else {
            if (!write_bytes(placed.path, content.data(), content.size())) {
                result.error = "failed to write file: " + placed.relative;
                return result;
            }
            fs::permissions(placed.path, static_cast<fs::perms>(member.mode & 07777),
                            fs::perm_options::replace, ec);
            if (ec) {
                spdlog::debug("zip: could not set mode on {}: {}", placed.relative, ec.message());
            }
        }

        result.entries.push_back(placed.relative);
    }

    result.ok = true;
    return result;
}

ZipExtractResult extract_zip(const std::string& archive_path, const std::string& dest_dir) {
    std::ifstream file(archive_path, std::ios::binary);
    if (!file) {
        ZipExtractResult result;
        result.error = "failed to open archive: " + archive_path;
        return result;
    }

    std::vector<uint8_t> data(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());

    return extract_zip(data, dest_dir);
}

} // namespace pawkit
