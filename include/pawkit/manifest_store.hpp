#pragma once

#include "pawkit/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace pawkit {

// ============================================================================
// Manifest Store
// ============================================================================
//
// Document: { "installed": { "<name>": { version, installDate, files,
//             metadata, source, packageHash } } }
// Every write is a whole-document read-modify-write followed by an atomic
// replace. Not safe against concurrent writers.

struct StoreResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
};

struct RecordResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    InstalledRecord record;
};

struct ManifestListResult {
    bool ok = false;
    ErrorCode code = ErrorCode::None;
    std::string error;
    std::map<std::string, InstalledRecord> records;
};

nlohmann::json record_to_json(const InstalledRecord& record);
InstalledRecord record_from_json(const std::string& name, const nlohmann::json& j);

class ManifestStore {
public:
    explicit ManifestStore(std::string path);

    const std::string& path() const { return path_; }

    ManifestListResult list() const;
    RecordResult load(const std::string& name) const;      // NotFound if absent
    StoreResult save(const std::string& name, const InstalledRecord& record);
    StoreResult remove(const std::string& name);            // Absent name is not an error

private:
    // Missing file reads as an empty document
    bool read_document(nlohmann::json& doc, StoreResult& result) const;
    StoreResult write_document(const nlohmann::json& doc);

    std::string path_;
};

} // namespace pawkit
