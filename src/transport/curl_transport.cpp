#include "relfetch/transport.hpp"
#include "relfetch/platform.hpp"

#include <chrono>
#include <cstdio>

#include <curl/curl.h>

namespace relfetch {

namespace {

constexpr const char* USER_AGENT = "relfetch/" RELFETCH_VERSION;

size_t curl_string_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

size_t curl_file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* file = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, file) * size;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlHeaderList {
public:
    CurlHeaderList() = default;
    ~CurlHeaderList() { if (list_) curl_slist_free_all(list_); }

    CurlHeaderList(const CurlHeaderList&) = delete;
    CurlHeaderList& operator=(const CurlHeaderList&) = delete;

    void append(const std::string& name, const std::string& value) {
        std::string line = name + ": " + value;
        list_ = curl_slist_append(list_, line.c_str());
    }

    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

class FileCloser {
public:
    explicit FileCloser(std::FILE* file) : file_(file) {}
    ~FileCloser() { close(); }

    FileCloser(const FileCloser&) = delete;
    FileCloser& operator=(const FileCloser&) = delete;

    // Returns false if flushing the buffered data failed
    bool close() {
        if (!file_) return true;
        bool ok = std::fclose(file_) == 0;
        file_ = nullptr;
        return ok;
    }

private:
    std::FILE* file_;
};

struct ProgressState {
    const ProgressFn* progress = nullptr;
    std::string source;
    std::chrono::steady_clock::time_point start;
    curl_off_t last_reported = -1;
};

double mib_per_sec(uint64_t bytes, std::chrono::steady_clock::time_point start) {
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (elapsed <= 0.0) return 0.0;
    return static_cast<double>(bytes) / (1024.0 * 1024.0) / elapsed;
}

int curl_xferinfo_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                           curl_off_t /* ultotal */, curl_off_t /* ulnow */) {
    auto* state = static_cast<ProgressState*>(clientp);
    if (dlnow == state->last_reported) {
        return 0;
    }
    state->last_reported = dlnow;

    ProgressEvent event;
    event.source = state->source;
    event.downloaded = static_cast<uint64_t>(dlnow);
    event.total = dltotal > 0 ? static_cast<uint64_t>(dltotal) : 0;
    event.mib_per_sec = mib_per_sec(event.downloaded, state->start);
    (*state->progress)(event);
    return 0;
}

void apply_common_options(CURL* curl, const HttpRequest& request, CurlHeaderList& headers,
                          char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    } else {
        // Large assets: abort only when the transfer stalls
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);
    }

    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

    if (!request.proxy.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy.c_str());
    }

    for (const auto& header : request.headers) {
        headers.append(header.first, header.second);
    }
    if (headers.get()) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    }
}

std::string describe_curl_error(CURLcode res, const char* error_buffer) {
    return std::string("HTTP request failed: ") +
           (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
}

class CurlTransport : public Transport {
public:
    HttpResponse get(const HttpRequest& request) override {
        HttpResponse result;
        get_curl_init();

        CurlHandle curl;
        if (!curl) {
            result.error = "failed to initialize CURL";
            return result;
        }

        CurlHeaderList headers;
        char error_buffer[CURL_ERROR_SIZE] = {0};
        apply_common_options(curl.get(), request, headers, error_buffer);

        std::string buffer;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_string_write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            result.error = describe_curl_error(res, error_buffer);
            return result;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);
        result.body = std::move(buffer);
        result.ok = true;
        return result;
    }

    DownloadResult download(const HttpRequest& request, const std::string& file_path,
                            const ProgressFn& progress) override {
        DownloadResult result;
        get_curl_init();

        CurlHandle curl;
        if (!curl) {
            result.kind = ErrorKind::Transport;
            result.error = "failed to initialize CURL";
            return result;
        }

        std::FILE* raw = std::fopen(file_path.c_str(), "wb");
        if (!raw) {
            result.kind = ErrorKind::Filesystem;
            result.error = "failed to create file: " + file_path;
            return result;
        }
        FileCloser file(raw);

        CurlHeaderList headers;
        char error_buffer[CURL_ERROR_SIZE] = {0};
        apply_common_options(curl.get(), request, headers, error_buffer);

        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_file_write_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, raw);

        ProgressState state;
        state.progress = &progress;
        state.source = request.url;
        state.start = std::chrono::steady_clock::now();

        if (progress) {
            curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, curl_xferinfo_callback);
            curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        }

        CURLcode res = curl_easy_perform(curl.get());
        bool flushed = file.close();

        if (res != CURLE_OK) {
            remove_file(file_path);
            result.kind = res == CURLE_WRITE_ERROR ? ErrorKind::Filesystem : ErrorKind::Transport;
            result.error = describe_curl_error(res, error_buffer);
            return result;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);
        if (result.http_status < 200 || result.http_status >= 300) {
            remove_file(file_path);
            result.kind = ErrorKind::HttpStatus;
            result.error = "download failed with status " + std::to_string(result.http_status);
            return result;
        }

        if (!flushed) {
            remove_file(file_path);
            result.kind = ErrorKind::Filesystem;
            result.error = "failed to write file: " + file_path;
            return result;
        }

        curl_off_t received = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_SIZE_DOWNLOAD_T, &received);
        result.bytes = static_cast<uint64_t>(received);

        if (progress) {
            ProgressEvent done;
            done.source = request.url;
            done.downloaded = result.bytes;
            done.total = result.bytes;
            done.mib_per_sec = mib_per_sec(result.bytes, state.start);
            done.complete = true;
            progress(done);
        }

        result.ok = true;
        return result;
    }
};

} // namespace

std::shared_ptr<Transport> make_curl_transport() {
    return std::make_shared<CurlTransport>();
}

} // namespace relfetch
