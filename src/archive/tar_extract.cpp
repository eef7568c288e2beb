#include "relfetch/archive.hpp"
#include "relfetch/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <zlib.h>

namespace fs = std::filesystem;

namespace relfetch {

// ============================================================================
// Tar Format Constants (POSIX ustar + GNU/pax extensions)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char TAR_GNU_LONGNAME = 'L';
static constexpr char TAR_GNU_LONGLINK = 'K';
static constexpr char TAR_PAX_HEADER = 'x';
static constexpr char TAR_PAX_GLOBAL = 'g';

// Upper bound for GNU long-name and pax header payloads held in memory
static constexpr uint64_t TAR_MAX_META_SIZE = 1024 * 1024;

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];         // 0
    char mode[TAR_MODE_SIZE];         // 100
    char uid[8];                      // 108
    char gid[8];                      // 116
    char size[TAR_SIZE_SIZE];         // 124
    char mtime[12];                   // 136
    char chksum[TAR_CHKSUM_SIZE];     // 148
    char typeflag;                    // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[6];                    // 257
    char version[2];                  // 263
    char uname[32];                   // 265
    char gname[32];                   // 297
    char devmajor[8];                 // 329
    char devminor[8];                 // 337
    char prefix[TAR_PREFIX_SIZE];     // 345
    char padding[12];                 // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

namespace {

// ============================================================================
// Helper Functions
// ============================================================================

// Parse a numeric header field: octal text, or GNU base-256 when the high
// bit of the first byte is set
uint64_t parse_numeric(const char* data, size_t size) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);
    if (size > 0 && (bytes[0] & 0x80) != 0) {
        uint64_t result = bytes[0] & 0x7F;
        for (size_t i = 1; i < size; ++i) {
            result = (result << 8) | bytes[i];
        }
        return result;
    }

    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

uint32_t calculate_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;

    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        // Checksum field counts as spaces
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }

    return sum;
}

std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

bool is_zero_block(const uint8_t* block) {
    return std::all_of(block, block + TAR_BLOCK_SIZE, [](uint8_t b) { return b == 0; });
}

uint64_t padded_size(uint64_t size) {
    return (size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE * TAR_BLOCK_SIZE;
}

// ============================================================================
// Streaming gzip reader
// ============================================================================

class GzReader {
public:
    explicit GzReader(const std::string& path) : file_(gzopen(path.c_str(), "rb")) {
        if (file_) {
            gzbuffer(file_, 128 * 1024);
        }
    }
    ~GzReader() { if (file_) gzclose(file_); }

    GzReader(const GzReader&) = delete;
    GzReader& operator=(const GzReader&) = delete;

    explicit operator bool() const { return file_ != nullptr; }

    // Returns bytes read (less than size only at end of stream), -1 on error
    int64_t read(void* buffer, size_t size) {
        size_t total = 0;
        auto* out = static_cast<char*>(buffer);
        while (total < size) {
            size_t chunk = std::min<size_t>(size - total, 1u << 20);
            int n = gzread(file_, out + total, static_cast<unsigned>(chunk));
            if (n < 0) return -1;
            if (n == 0) break;
            total += static_cast<size_t>(n);
        }
        return static_cast<int64_t>(total);
    }

    bool skip(uint64_t size) {
        char buffer[16384];
        while (size > 0) {
            size_t chunk = static_cast<size_t>(std::min<uint64_t>(size, sizeof(buffer)));
            if (read(buffer, chunk) != static_cast<int64_t>(chunk)) return false;
            size -= chunk;
        }
        return true;
    }

    // True when the stream ended in the middle of compressed data
    bool truncated() {
        int errnum = Z_OK;
        gzerror(file_, &errnum);
        return errnum == Z_BUF_ERROR;
    }

    std::string last_error() {
        int errnum = 0;
        const char* message = gzerror(file_, &errnum);
        if (errnum == Z_ERRNO) return std::strerror(errno);
        return message && message[0] ? message : "unexpected end of stream";
    }

private:
    gzFile file_;
};

// Pax records: "<len> <key>=<value>\n"
void parse_pax_records(const std::string& data, std::string& path, std::string& linkpath) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) return;

        size_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') return;
            len = len * 10 + static_cast<size_t>(data[i] - '0');
        }
        if (len == 0 || pos + len > data.size()) return;

        std::string record = data.substr(space + 1, pos + len - space - 1);
        if (!record.empty() && record.back() == '\n') record.pop_back();

        auto eq = record.find('=');
        if (eq != std::string::npos) {
            std::string key = record.substr(0, eq);
            if (key == "path") {
                path = record.substr(eq + 1);
            } else if (key == "linkpath") {
                linkpath = record.substr(eq + 1);
            }
        }
        pos += len;
    }
}

fs::perms mode_to_perms(uint64_t mode) {
    return static_cast<fs::perms>(mode & 07777);
}

// Component-wise prefix test, so "/x/out2" is not inside "/x/out"
bool is_within(fs::path root, const fs::path& candidate) {
    if (!root.empty() && root.filename().empty()) {
        root = root.parent_path();
    }

    auto candidate_it = candidate.begin();
    for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *candidate_it != *root_it) {
            return false;
        }
    }
    return true;
}

UnpackResult archive_error(const std::string& message) {
    UnpackResult result;
    result.kind = ErrorKind::Archive;
    result.error = message;
    return result;
}

UnpackResult filesystem_error(const std::string& message) {
    UnpackResult result;
    result.kind = ErrorKind::Filesystem;
    result.error = message;
    return result;
}

} // namespace

// ============================================================================
// Path Handling
// ============================================================================

PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root) {
    PathValidation result;

    if (!entry_path.empty() && (entry_path[0] == '/' || entry_path[0] == '\\')) {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    fs::path normalized;
    for (const auto& component : fs::path(entry_path)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    if (normalized.empty()) {
        result.error = "empty path";
        return result;
    }

    fs::path full_path = fs::path(extraction_root) / normalized;
    std::error_code root_ec;
    std::error_code full_ec;
    fs::path canonical_root = fs::weakly_canonical(extraction_root, root_ec);
    fs::path canonical_full = fs::weakly_canonical(full_path, full_ec);
    if (root_ec || full_ec) {
        result.error = "cannot resolve path: " + entry_path;
        return result;
    }

    // Symlinks already extracted are followed by weakly_canonical
    if (!is_within(canonical_root, canonical_full)) {
        result.error = "path escapes extraction root: " + entry_path;
        return result;
    }

    result.safe = true;
    result.normalized_path = to_portable_path(normalized.string());
    return result;
}

std::string strip_path_components(const std::string& path, size_t count) {
    std::string rest = path;
    while (rest.rfind("./", 0) == 0) {
        rest = rest.substr(2);
    }

    for (size_t i = 0; i < count; ++i) {
        auto slash = rest.find('/');
        if (slash == std::string::npos) {
            return "";
        }
        rest = rest.substr(slash + 1);
    }

    while (!rest.empty() && rest.front() == '/') {
        rest.erase(rest.begin());
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    return rest;
}

// ============================================================================
// Tar+Gzip Extraction
// ============================================================================

UnpackResult extract_tar_gz(const std::string& archive_path, const std::string& dest_dir,
                            size_t strip_components) {
    UnpackResult result;

    GzReader reader(archive_path);
    if (!reader) {
        return filesystem_error("failed to open archive: " + archive_path);
    }

    if (!create_directories(dest_dir)) {
        return filesystem_error("failed to create directory: " + dest_dir);
    }

    std::string long_name;
    std::string long_link;
    std::string pax_path;
    std::string pax_linkpath;

    for (;;) {
        uint8_t block[TAR_BLOCK_SIZE];
        int64_t n = reader.read(block, TAR_BLOCK_SIZE);
        if (n < 0) {
            return archive_error("failed to decompress archive: " + reader.last_error());
        }
        if (n == 0) {
            // Missing end-of-archive blocks are tolerated, a cut stream is not
            if (reader.truncated()) {
                return archive_error("failed to decompress archive: unexpected end of file");
            }
            break;
        }
        if (n != static_cast<int64_t>(TAR_BLOCK_SIZE)) {
            return archive_error("truncated tar header");
        }
        if (is_zero_block(block)) break;

        TarHeader header;
        std::memcpy(&header, block, sizeof(header));

        if (parse_numeric(header.chksum, TAR_CHKSUM_SIZE) != calculate_checksum(header)) {
            return archive_error("failed to read tar header: checksum mismatch");
        }

        char typeflag = header.typeflag;
        uint64_t size = parse_numeric(header.size, TAR_SIZE_SIZE);
        uint64_t mode = parse_numeric(header.mode, TAR_MODE_SIZE);

        // Metadata entries describe the entry that follows them
        if (typeflag == TAR_GNU_LONGNAME || typeflag == TAR_GNU_LONGLINK ||
            typeflag == TAR_PAX_HEADER) {
            if (size > TAR_MAX_META_SIZE) {
                return archive_error("tar metadata entry too large");
            }
            std::string data(static_cast<size_t>(size), '\0');
            if (reader.read(&data[0], data.size()) != static_cast<int64_t>(data.size()) ||
                !reader.skip(padded_size(size) - size)) {
                return archive_error("truncated tar metadata entry");
            }
            if (typeflag == TAR_PAX_HEADER) {
                parse_pax_records(data, pax_path, pax_linkpath);
            } else {
                data.resize(strnlen(data.c_str(), data.size()));
                (typeflag == TAR_GNU_LONGNAME ? long_name : long_link) = data;
            }
            continue;
        }

        if (typeflag == TAR_PAX_GLOBAL) {
            if (!reader.skip(padded_size(size))) {
                return archive_error("truncated tar entry");
            }
            continue;
        }

        std::string path;
        if (!pax_path.empty()) {
            path = pax_path;
        } else if (!long_name.empty()) {
            path = long_name;
        } else {
            if (header.prefix[0] != '\0' && std::memcmp(header.magic, "ustar", 5) == 0) {
                path = field_string(header.prefix, TAR_PREFIX_SIZE) + "/";
            }
            path += field_string(header.name, TAR_NAME_SIZE);
        }

        std::string link_target;
        if (!pax_linkpath.empty()) {
            link_target = pax_linkpath;
        } else if (!long_link.empty()) {
            link_target = long_link;
        } else {
            link_target = field_string(header.linkname, TAR_LINKNAME_SIZE);
        }

        long_name.clear();
        long_link.clear();
        pax_path.clear();
        pax_linkpath.clear();

        bool is_dir = typeflag == TAR_DIRTYPE ||
                      ((typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE) &&
                       !path.empty() && path.back() == '/');
        bool is_file = !is_dir && (typeflag == TAR_REGTYPE || typeflag == TAR_AREGTYPE ||
                                   typeflag == TAR_CONTTYPE);
        bool is_link = typeflag == TAR_SYMTYPE;
        uint64_t data_size = (is_dir || is_link) ? 0 : size;

        std::string relative = strip_path_components(path, strip_components);

        // The wrapper directory itself, or an entry we do not materialize
        if (relative.empty() || (!is_dir && !is_file && !is_link)) {
            if (!reader.skip(padded_size(data_size))) {
                return archive_error("truncated tar entry: " + path);
            }
            continue;
        }

        auto validation = validate_extraction_path(relative, dest_dir);
        if (!validation.safe) {
            return archive_error(validation.error);
        }
        std::string full_path = join_path(dest_dir, validation.normalized_path);

        if (is_dir) {
            if (!create_directories(full_path)) {
                return filesystem_error("failed to create directory: " + full_path);
            }
            // Owner keeps rwx so later entries and a wholesale removal succeed
            std::error_code ec;
            fs::permissions(full_path, mode_to_perms(mode) | fs::perms::owner_all, ec);
            if (ec) {
                return filesystem_error("failed to set permissions on " + full_path + ": " +
                                        ec.message());
            }
        } else if (is_link) {
            std::string parent = get_parent_directory(full_path);
            if (!parent.empty() && !create_directories(parent)) {
                return filesystem_error("failed to create parent directory for: " + relative);
            }
            std::error_code ec;
            fs::create_symlink(link_target, full_path, ec);
            if (ec && ec != std::errc::file_exists) {
                return filesystem_error("failed to create symlink " + full_path + ": " +
                                        ec.message());
            }
        } else {
            std::string parent = get_parent_directory(full_path);
            if (!parent.empty() && !create_directories(parent)) {
                return filesystem_error("failed to create parent directory for: " + relative);
            }

            std::ofstream file(full_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                return filesystem_error("failed to create file: " + full_path);
            }

            char buffer[65536];
            uint64_t remaining = size;
            while (remaining > 0) {
                size_t chunk = static_cast<size_t>(std::min<uint64_t>(remaining, sizeof(buffer)));
                int64_t got = reader.read(buffer, chunk);
                if (got < 0) {
                    return archive_error("failed to decompress archive: " + reader.last_error());
                }
                if (got != static_cast<int64_t>(chunk)) {
                    return archive_error("truncated archive: " + path);
                }
                file.write(buffer, static_cast<std::streamsize>(chunk));
                if (!file) {
                    return filesystem_error("failed to write file: " + full_path);
                }
                remaining -= chunk;
            }
            file.close();
            if (!file) {
                return filesystem_error("failed to write file: " + full_path);
            }

            if (!reader.skip(padded_size(size) - size)) {
                return archive_error("truncated archive: " + path);
            }

            std::error_code ec;
            if ((mode & 0777) != 0) {
                fs::permissions(full_path, mode_to_perms(mode), ec);
            }
            if (ec) {
                return filesystem_error("failed to set permissions on " + full_path + ": " +
                                        ec.message());
            }
        }

        result.entries.push_back(validation.normalized_path);
    }

    result.ok = true;
    return result;
}

} // namespace relfetch
