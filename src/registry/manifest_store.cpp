#include "pawkit/manifest_store.hpp"
#include "pawkit/descriptor.hpp"
#include "pawkit/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace pawkit {

namespace {

constexpr const char* kInstalledKey = "installed";

std::string get_string_or(const nlohmann::json& j, const std::string& key,
                          const std::string& fallback) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return fallback;
}

} // namespace

nlohmann::json record_to_json(const InstalledRecord& record) {
    nlohmann::json j;
    j["version"] = record.version;
    j["installDate"] = record.install_date;
    j["files"] = record.files;
    j["metadata"] = record.descriptor.attributes;
    if (!record.source.empty()) {
        j["source"] = record.source;
    }
    if (!record.package_hash.empty()) {
        j["packageHash"] = record.package_hash;
    }
    return j;
}

InstalledRecord record_from_json(const std::string& name, const nlohmann::json& j) {
    InstalledRecord record;
    if (!j.is_object()) {
        record.descriptor = default_descriptor(name);
        record.version = record.descriptor.version;
        return record;
    }

    nlohmann::json metadata = j.contains("metadata") ? j["metadata"] : nlohmann::json::object();
    record.descriptor = descriptor_from_json(metadata, name);
    record.version = get_string_or(j, "version", record.descriptor.version);
    record.install_date = get_string_or(j, "installDate", "");
    record.source = get_string_or(j, "source", "");
    record.package_hash = get_string_or(j, "packageHash", "");

    if (j.contains("files") && j["files"].is_array()) {
        for (const auto& f : j["files"]) {
            if (f.is_string()) {
                record.files.push_back(f.get<std::string>());
            }
        }
    }

    return record;
}

ManifestStore::ManifestStore(std::string path) : path_(std::move(path)) {}

bool ManifestStore::read_document(nlohmann::json& doc, StoreResult& result) const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        doc = nlohmann::json::object();
        doc[kInstalledKey] = nlohmann::json::object();
        return true;
    }

    auto content = read_file(path_);
    if (!content) {
        result.code = ErrorCode::IOError;
        result.error = "failed to read manifest: " + path_;
        return false;
    }

    try {
        doc = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::parse_error& e) {
        result.code = ErrorCode::InvalidDocument;
        result.error = "manifest " + path_ + " is not valid JSON: " + e.what();
        return false;
    }

    if (!doc.is_object()) {
        result.code = ErrorCode::InvalidDocument;
        result.error = "manifest " + path_ + " must be a JSON object";
        return false;
    }
    if (!doc.contains(kInstalledKey) || !doc[kInstalledKey].is_object()) {
        doc[kInstalledKey] = nlohmann::json::object();
    }
    return true;
}

StoreResult ManifestStore::write_document(const nlohmann::json& doc) {
    StoreResult result;
    auto write = atomic_write_file(path_, doc.dump(2) + "\n");
    if (!write.ok) {
        result.code = ErrorCode::IOError;
        result.error = "failed to write manifest: " + write.error;
        return result;
    }
    result.ok = true;
    return result;
}

ManifestListResult ManifestStore::list() const {
    ManifestListResult result;
    StoreResult status;
    nlohmann::json doc;
    if (!read_document(doc, status)) {
        result.code = status.code;
        result.error = status.error;
        return result;
    }

    for (auto& [name, value] : doc[kInstalledKey].items()) {
        result.records.emplace(name, record_from_json(name, value));
    }
    result.ok = true;
    return result;
}

RecordResult ManifestStore::load(const std::string& name) const {
    RecordResult result;
    StoreResult status;
    nlohmann::json doc;
    if (!read_document(doc, status)) {
        result.code = status.code;
        result.error = status.error;
        return result;
    }

    const auto& installed = doc[kInstalledKey];
    if (!installed.contains(name)) {
        result.code = ErrorCode::NotFound;
        result.error = "no installed package named '" + name + "'";
        return result;
    }

    result.record = record_from_json(name, installed[name]);
    result.ok = true;
    return result;
}

StoreResult ManifestStore::save(const std::string& name, const InstalledRecord& record) {
    StoreResult result;
    nlohmann::json doc;
    if (!read_document(doc, result)) {
        return result;
    }

    doc[kInstalledKey][name] = record_to_json(record);
    spdlog::debug("manifest: saved '{}' ({} files)", name, record.files.size());
    return write_document(doc);
}

StoreResult ManifestStore::remove(const std::string& name) {
    StoreResult result;
    nlohmann::json doc;
    if (!read_document(doc, result)) {
        return result;
    }

    if (doc[kInstalledKey].erase(name) == 0) {
        result.ok = true;
        return result;
    }
    spdlog::debug("manifest: removed '{}'", name);
    return write_document(doc);
}

} // namespace pawkit
