#pragma once

#include <relfetch/config.hpp>
#include <relfetch/platform.hpp>
#include <relfetch/transport.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <zlib.h>

namespace relfetch::test {

namespace fs = std::filesystem;

// Random version 4 UUID, used to name scratch directories
inline std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF),
                  static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("relfetch_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string path(const std::string& sub) const { return (path_ / sub).string(); }

private:
    fs::path path_;
};

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::vector<std::string> list_names(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

// Quiet, no-delay configuration rooted at install_dir
inline ClientConfig test_config(const std::string& install_dir) {
    return ClientBuilder()
        .install_dir(install_dir)
        .retry_count(3)
        .retry_delay_secs(0)
        .no_progress()
        .build();
}

inline std::string release_json(const std::string& tag,
                                const std::vector<std::string>& assets = {}) {
    std::string body = "{\"tag_name\":\"" + tag + "\",\"assets\":[";
    for (size_t i = 0; i < assets.size(); ++i) {
        if (i > 0) body += ",";
        body += "{\"name\":\"" + assets[i] + "\",\"size\":1}";
    }
    return body + "]}";
}

// ============================================================================
// In-memory transport
// ============================================================================

class FakeTransport : public Transport {
public:
    // Responses served by get(), in order; `fallback` once exhausted
    std::deque<HttpResponse> responses;
    HttpResponse fallback;

    // Download bodies keyed by URL; unknown URLs answer 404
    std::map<std::string, std::string> files;

    std::vector<HttpRequest> get_requests;
    std::vector<HttpRequest> download_requests;

    FakeTransport() {
        fallback.ok = false;
        fallback.error = "connection refused";
    }

    void serve_latest(const std::string& tag, const std::vector<std::string>& assets = {}) {
        HttpResponse response;
        response.ok = true;
        response.http_status = 200;
        response.body = release_json(tag, assets);
        fallback = response;
    }

    void queue_status(long status, const std::string& body) {
        HttpResponse response;
        response.ok = true;
        response.http_status = status;
        response.body = body;
        responses.push_back(response);
    }

    HttpResponse get(const HttpRequest& request) override {
        get_requests.push_back(request);
        if (!responses.empty()) {
            HttpResponse response = responses.front();
            responses.pop_front();
            return response;
        }
        return fallback;
    }

    DownloadResult download(const HttpRequest& request, const std::string& file_path,
                            const ProgressFn& progress) override {
        download_requests.push_back(request);

        DownloadResult result;
        auto it = files.find(request.url);
        if (it == files.end()) {
            result.http_status = 404;
            result.kind = ErrorKind::HttpStatus;
            result.error = "download failed with status 404";
            return result;
        }

        std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
        out.write(it->second.data(), static_cast<std::streamsize>(it->second.size()));
        out.close();

        if (progress) {
            ProgressEvent event;
            event.source = request.url;
            event.downloaded = it->second.size();
            event.total = it->second.size();
            event.complete = true;
            progress(event);
        }

        result.ok = true;
        result.http_status = 200;
        result.bytes = it->second.size();
        return result;
    }
};

// ============================================================================
// Archive builders
// ============================================================================

struct TestTarEntry {
    std::string name;
    char type = '0';
    std::string data;
    unsigned mode = 0644;
    std::string linkname;
};

inline void put_octal(char* field, size_t size, unsigned long long value) {
    std::snprintf(field, size, "%0*llo", static_cast<int>(size - 1), value);
}

inline std::string tar_header(const std::string& name, char type, size_t size, unsigned mode,
                              const std::string& linkname) {
    char block[512];
    std::memset(block, 0, sizeof(block));
    std::memcpy(block, name.data(), std::min<size_t>(name.size(), 100));
    put_octal(block + 100, 8, mode);
    put_octal(block + 108, 8, 0);
    put_octal(block + 116, 8, 0);
    put_octal(block + 124, 12, size);
    put_octal(block + 136, 12, 0);
    block[156] = type;
    std::memcpy(block + 157, linkname.data(), std::min<size_t>(linkname.size(), 100));
    std::memcpy(block + 257, "ustar", 6);
    std::memcpy(block + 263, "00", 2);

    std::memset(block + 148, ' ', 8);
    unsigned sum = 0;
    for (unsigned char c : block) sum += c;
    std::snprintf(block + 148, 8, "%06o", sum);
    block[155] = ' ';
    return std::string(block, sizeof(block));
}

inline std::string pad_block(const std::string& data) {
    std::string out = data;
    out.append((512 - data.size() % 512) % 512, '\0');
    return out;
}

inline std::string build_tar(const std::vector<TestTarEntry>& entries) {
    std::string tar;
    for (const auto& entry : entries) {
        if (entry.name.size() > 100) {
            tar += tar_header("././@LongLink", 'L', entry.name.size() + 1, 0, "");
            tar += pad_block(entry.name + '\0');
        }
        tar += tar_header(entry.name, entry.type, entry.data.size(), entry.mode, entry.linkname);
        tar += pad_block(entry.data);
    }
    tar.append(1024, '\0');
    return tar;
}

inline std::string gzip_bytes(const std::string& data, const std::string& scratch_path) {
    gzFile gz = gzopen(scratch_path.c_str(), "wb");
    gzwrite(gz, data.data(), static_cast<unsigned>(data.size()));
    gzclose(gz);
    std::string bytes = read_text(scratch_path);
    std::remove(scratch_path.c_str());
    return bytes;
}

inline std::string build_tar_gz(const std::vector<TestTarEntry>& entries,
                                const std::string& scratch_path) {
    return gzip_bytes(build_tar(entries), scratch_path);
}

struct TestZipEntry {
    std::string name;
    std::string data;
    unsigned mode = 0;  // 0: no Unix attributes recorded
};

inline void put_u16(std::string& out, uint16_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
}

inline void put_u32(std::string& out, uint32_t v) {
    put_u16(out, static_cast<uint16_t>(v & 0xFFFF));
    put_u16(out, static_cast<uint16_t>(v >> 16));
}

// Stored (uncompressed) entries only
inline std::string build_zip(const std::vector<TestZipEntry>& entries) {
    std::string body;
    std::string central;

    for (const auto& entry : entries) {
        uint32_t offset = static_cast<uint32_t>(body.size());
        uint32_t crc = static_cast<uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(entry.data.data()),
                  static_cast<uInt>(entry.data.size())));
        auto size = static_cast<uint32_t>(entry.data.size());
        auto name_len = static_cast<uint16_t>(entry.name.size());

        put_u32(body, 0x04034b50);
        put_u16(body, 20);
        put_u16(body, 0);
        put_u16(body, 0);
        put_u16(body, 0);
        put_u16(body, 0);
        put_u32(body, crc);
        put_u32(body, size);
        put_u32(body, size);
        put_u16(body, name_len);
        put_u16(body, 0);
        body += entry.name;
        body += entry.data;

        put_u32(central, 0x02014b50);
        put_u16(central, entry.mode != 0 ? static_cast<uint16_t>((3 << 8) | 20) : 20);
        put_u16(central, 20);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, crc);
        put_u32(central, size);
        put_u32(central, size);
        put_u16(central, name_len);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, entry.mode != 0 ? (static_cast<uint32_t>(entry.mode) << 16) : 0);
        put_u32(central, offset);
        central += entry.name;
    }

    std::string zip = body + central;
    put_u32(zip, 0x06054b50);
    put_u16(zip, 0);
    put_u16(zip, 0);
    put_u16(zip, static_cast<uint16_t>(entries.size()));
    put_u16(zip, static_cast<uint16_t>(entries.size()));
    put_u32(zip, static_cast<uint32_t>(central.size()));
    put_u32(zip, static_cast<uint32_t>(body.size()));
    put_u16(zip, 0);
    return zip;
}

} // namespace relfetch::test
