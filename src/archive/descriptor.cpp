#include "pawkit/descriptor.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace pawkit {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

void sync_attributes(PackageDescriptor& descriptor) {
    descriptor.attributes["name"] = descriptor.name;
    descriptor.attributes["version"] = descriptor.version;
}

} // namespace

bool is_valid_version(const std::string& version) {
    if (version.empty()) {
        return false;
    }
    bool need_digit = true;
    for (char c : version) {
        if (c == '.') {
            if (need_digit) return false;
            need_digit = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            need_digit = false;
        } else {
            return false;
        }
    }
    return !need_digit;
}

PackageDescriptor default_descriptor(const std::string& fallback_name) {
    PackageDescriptor descriptor;
    descriptor.name = fallback_name;
    sync_attributes(descriptor);
    return descriptor;
}

PackageDescriptor descriptor_from_json(const nlohmann::json& j,
                                       const std::string& fallback_name) {
    if (!j.is_object()) {
        return default_descriptor(fallback_name);
    }

    PackageDescriptor descriptor;
    descriptor.attributes = j;

    auto name = get_string(j, "name");
    descriptor.name = (name && !name->empty()) ? *name : fallback_name;

    auto version = get_string(j, "version");
    if (version && is_valid_version(*version)) {
        descriptor.version = *version;
    }

    descriptor.extra_paths = get_string_array(j, "deletePaths");

    sync_attributes(descriptor);
    return descriptor;
}

DescriptorParseResult parse_descriptor(const std::string& json_str,
                                       const std::string& fallback_name) {
    DescriptorParseResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.descriptor = default_descriptor(fallback_name);
        result.warnings.push_back(std::string("descriptor is not valid JSON: ") + e.what());
        spdlog::warn("Package descriptor could not be parsed, using defaults: {}", e.what());
        return result;
    }

    if (!j.is_object()) {
        result.descriptor = default_descriptor(fallback_name);
        result.warnings.push_back("descriptor is not a JSON object");
        spdlog::warn("Package descriptor is not a JSON object, using defaults");
        return result;
    }

    result.found = true;
    result.descriptor = descriptor_from_json(j, fallback_name);

    if (j.contains("name") && !j["name"].is_string()) {
        result.warnings.push_back("descriptor name is not a string");
    }
    if (auto version = get_string(j, "version")) {
        if (!is_valid_version(*version)) {
            result.warnings.push_back("invalid version '" + *version + "', using 0.0.0");
            spdlog::warn("Package version '{}' is invalid, using 0.0.0", *version);
        }
    }
    if (j.contains("deletePaths") && !j["deletePaths"].is_array()) {
        result.warnings.push_back("deletePaths is not an array");
    }

    return result;
}

void apply_descriptor_overlay(PackageDescriptor& descriptor, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        return;
    }

    if (overlay.contains("metadata") && overlay["metadata"].is_object()) {
        for (auto& [key, value] : overlay["metadata"].items()) {
            descriptor.attributes[key] = value;
        }
    }
    for (auto& [key, value] : overlay.items()) {
        if (key == "metadata" || key == "pawName") continue;
        descriptor.attributes[key] = value;
    }

    if (auto name = get_string(overlay, "name"); name && !name->empty()) {
        descriptor.name = *name;
    }
    if (auto version = get_string(overlay, "version"); version && is_valid_version(*version)) {
        descriptor.version = *version;
    }

    descriptor.attributes.erase("downloadURL");
    descriptor.attributes.erase("downloadUrl");

    auto extra = get_string_array(descriptor.attributes, "deletePaths");
    if (!extra.empty()) {
        descriptor.extra_paths = extra;
    }

    sync_attributes(descriptor);
}

} // namespace pawkit
