#pragma once

#include <pawkit/locations.hpp>
#include <pawkit/platform.hpp>
#include <pawkit/toolset.hpp>

#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace pawkit::testing {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("pawkit_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string sub(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Builds zip archives with unix permission bits. Members are stored unless
// added through deflated().
class ZipBuilder {
public:
    ZipBuilder& file(const std::string& name, const std::string& content, uint32_t mode = 0100644) {
        members_.push_back({name, content, mode, 0, content.size(), content});
        return *this;
    }

    ZipBuilder& directory(const std::string& name) {
        members_.push_back({name.back() == '/' ? name : name + "/", "", 040755, 0, 0, ""});
        return *this;
    }

    // Content of a symlink member is its target
    ZipBuilder& symlink(const std::string& name, const std::string& target) {
        members_.push_back({name, target, 0120777, 0, target.size(), target});
        return *this;
    }

    // Raw-deflate member; declared_size overrides the recorded uncompressed size
    ZipBuilder& deflated(const std::string& name, const std::string& content,
                         uint64_t declared_size = UINT64_MAX) {
        members_.push_back({name, content, 0100644, 8,
                            declared_size == UINT64_MAX ? content.size() : declared_size,
                            deflate_raw(content)});
        return *this;
    }

    std::vector<uint8_t> build() const {
        std::vector<uint8_t> out;
        std::vector<uint8_t> central;
        std::vector<uint32_t> offsets;

        for (const auto& m : members_) {
            uint32_t crc = static_cast<uint32_t>(
                crc32(0L, reinterpret_cast<const Bytef*>(m.content.data()),
                      static_cast<uInt>(m.content.size())));
            auto csize = static_cast<uint32_t>(m.payload.size());
            auto usize = static_cast<uint32_t>(m.declared_size);
            auto name_len = static_cast<uint16_t>(m.name.size());

            offsets.push_back(static_cast<uint32_t>(out.size()));
            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, 0);
            put16(out, m.method);
            put16(out, 0);
            put16(out, 0x21);
            put32(out, crc);
            put32(out, csize);
            put32(out, usize);
            put16(out, name_len);
            put16(out, 0);
            out.insert(out.end(), m.name.begin(), m.name.end());
            out.insert(out.end(), m.payload.begin(), m.payload.end());

            put32(central, 0x02014b50);
            put16(central, (3 << 8) | 20);
            put16(central, 20);
            put16(central, 0);
            put16(central, m.method);
            put16(central, 0);
            put16(central, 0x21);
            put32(central, crc);
            put32(central, csize);
            put32(central, usize);
            put16(central, name_len);
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put32(central, m.mode << 16);
            put32(central, offsets.back());
            central.insert(central.end(), m.name.begin(), m.name.end());
        }

        auto cd_offset = static_cast<uint32_t>(out.size());
        out.insert(out.end(), central.begin(), central.end());

        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(members_.size()));
        put16(out, static_cast<uint16_t>(members_.size()));
        put32(out, static_cast<uint32_t>(central.size()));
        put32(out, cd_offset);
        put16(out, 0);
        return out;
    }

    void write(const std::string& path) const {
        auto data = build();
        fs::create_directories(fs::path(path).parent_path());
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    }

private:
    struct Member {
        std::string name;
        std::string content;
        uint32_t mode;
        uint16_t method;
        uint64_t declared_size;
        std::string payload;
    };

    static std::string deflate_raw(const std::string& content) {
        z_stream strm;
        std::memset(&strm, 0, sizeof(strm));
        deflateInit2(&strm, Z_BEST_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY);
        std::string out(deflateBound(&strm, static_cast<uLong>(content.size())), '\0');
        strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data()));
        strm.avail_in = static_cast<uInt>(content.size());
        strm.next_out = reinterpret_cast<Bytef*>(&out[0]);
        strm.avail_out = static_cast<uInt>(out.size());
        deflate(&strm, Z_FINISH);
        out.resize(strm.total_out);
        deflateEnd(&strm);
        return out;
    }

    static void put16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v & 0xFF));
        out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    }

    static void put32(std::vector<uint8_t>& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    }

    std::vector<Member> members_;
};

// Location table rooted in a scratch home directory
inline LocationTable scratch_locations(const TempDir& dir) {
    return LocationTable::for_home(dir.sub("home"), dir.sub("data/pluginmetadata"), Platform::Linux);
}

} // namespace pawkit::testing
