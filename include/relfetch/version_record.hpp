#pragma once

#include "relfetch/types.hpp"

#include <string>

namespace relfetch {

// ============================================================================
// Version Record Store
// ============================================================================
//
// One record per installation directory, stored as
//   {"tag_name": "<tag>", "repo": "<owner>/<name>"}
// Presence of the file means the directory holds a completed install.

constexpr const char* VERSION_RECORD_FILENAME = "version.json";

struct VersionRecordParseResult {
    bool ok = false;
    std::string error;
    VersionRecord record;
};

// Parse a record from JSON text. Both fields are required strings.
VersionRecordParseResult parse_version_record(const std::string& json_str);

// Serialize to compact JSON
std::string serialize_version_record(const VersionRecord& record);

// Path of the record file inside an installation directory
std::string version_record_path(const std::string& install_dir);

bool has_version_record(const std::string& install_dir);

struct VersionRecordReadResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;   // RecordNotFound or RecordMalformed
    std::string error;
    VersionRecord record;
};

VersionRecordReadResult read_version_record(const std::string& install_dir);

// Creates install_dir if absent and replaces any existing record atomically
Status write_version_record(const std::string& install_dir, const VersionRecord& record);

} // namespace relfetch
