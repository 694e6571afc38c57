#pragma once

#include "pawkit/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pawkit {

// ============================================================================
// Package Descriptor Parsing
// ============================================================================

// Fixed location of the embedded descriptor inside an archive
inline constexpr const char* kDescriptorPath = "metadata/data.json";

struct DescriptorParseResult {
    PackageDescriptor descriptor;
    bool found = false;                 // A JSON object was parsed
    std::vector<std::string> warnings;
};

// Dot-separated non-negative integers ("1", "1.2", "1.2.3")
bool is_valid_version(const std::string& version);

PackageDescriptor default_descriptor(const std::string& fallback_name);

// Lenient: parse failures, non-object documents and bad fields degrade to
// defaults and a warning. Never fails.
DescriptorParseResult parse_descriptor(const std::string& json_str,
                                       const std::string& fallback_name);

// Rebuild a descriptor from its attribute document (manifest round-trip)
PackageDescriptor descriptor_from_json(const nlohmann::json& j,
                                       const std::string& fallback_name);

// Overlay repository-provided fields onto an embedded descriptor.
// Download URL fields are never copied into the attributes.
void apply_descriptor_overlay(PackageDescriptor& descriptor, const nlohmann::json& overlay);

} // namespace pawkit
