#include "pawkit/version.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

namespace pawkit {

namespace {

uint64_t parse_component(const std::string& part) {
    if (part.empty()) {
        return 0;
    }
    uint64_t value = 0;
    for (char c : part) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

std::vector<uint64_t> split_version(const std::string& version) {
    std::vector<uint64_t> parts;
    size_t start = 0;
    while (true) {
        size_t dot = version.find('.', start);
        parts.push_back(parse_component(version.substr(start, dot - start)));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

} // namespace

int compare_versions(const std::string& a, const std::string& b) {
    auto pa = split_version(a);
    auto pb = split_version(b);
    size_t n = pa.size() > pb.size() ? pa.size() : pb.size();
    pa.resize(n, 0);
    pb.resize(n, 0);

    for (size_t i = 0; i < n; ++i) {
        if (pa[i] < pb[i]) return -1;
        if (pa[i] > pb[i]) return 1;
    }
    return 0;
}

} // namespace pawkit
