#include "relfetch/version_record.hpp"
#include "relfetch/platform.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace relfetch {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

VersionRecordParseResult parse_version_record(const std::string& json_str) {
    VersionRecordParseResult result;

    nlohmann::json j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        result.error = "invalid JSON";
        return result;
    }

    if (!j.is_object()) {
        result.error = "JSON must be an object";
        return result;
    }

    if (auto tag = get_string(j, "tag_name")) {
        result.record.tag_name = *tag;
    } else {
        result.error = "tag_name missing";
        return result;
    }

    if (auto repo = get_string(j, "repo")) {
        result.record.repo = *repo;
    } else {
        result.error = "repo missing";
        return result;
    }

    result.ok = true;
    return result;
}

std::string serialize_version_record(const VersionRecord& record) {
    nlohmann::json j;
    j["tag_name"] = record.tag_name;
    j["repo"] = record.repo;
    return j.dump();
}

std::string version_record_path(const std::string& install_dir) {
    return join_path(install_dir, VERSION_RECORD_FILENAME);
}

bool has_version_record(const std::string& install_dir) {
    return path_exists(version_record_path(install_dir));
}

VersionRecordReadResult read_version_record(const std::string& install_dir) {
    VersionRecordReadResult result;
    std::string path = version_record_path(install_dir);

    if (!path_exists(path)) {
        result.kind = ErrorKind::RecordNotFound;
        result.error = "version record not found: " + path;
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        result.kind = ErrorKind::Filesystem;
        result.error = "error reading version info file: " + path;
        return result;
    }

    auto parsed = parse_version_record(*content);
    if (!parsed.ok) {
        result.kind = ErrorKind::RecordMalformed;
        result.error = "error parsing version info: " + parsed.error;
        return result;
    }

    result.record = parsed.record;
    result.ok = true;
    return result;
}

Status write_version_record(const std::string& install_dir, const VersionRecord& record) {
    if (!create_directories(install_dir)) {
        return make_error(ErrorKind::Filesystem,
                          "error creating install directory: " + install_dir);
    }

    auto write = atomic_write_file(version_record_path(install_dir),
                                   serialize_version_record(record));
    if (!write.ok) {
        return make_error(ErrorKind::Filesystem, "error writing version info: " + write.error);
    }

    return make_ok();
}

} // namespace relfetch
