#pragma once

#include <string>

namespace pawkit {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

HashResult compute_sha256(const std::string& file_path);

} // namespace pawkit
