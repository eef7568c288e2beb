#pragma once

#include "relfetch/types.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relfetch {

// ============================================================================
// HTTP Transport
// ============================================================================
//
// The network boundary of the library. Everything above it (resolver, fetch
// engine, installer) talks to a Transport reference, so tests substitute an
// in-memory implementation.

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string proxy;          // Empty: direct connection
    long timeout_seconds = 30;  // 0: no overall limit
};

struct HttpResponse {
    bool ok = false;            // Transfer completed (any status)
    std::string error;
    long http_status = 0;
    std::string body;
};

struct DownloadResult {
    bool ok = false;            // Transfer completed with a 2xx status
    ErrorKind kind = ErrorKind::None;
    std::string error;
    long http_status = 0;
    uint64_t bytes = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Fetch a small response into memory
    virtual HttpResponse get(const HttpRequest& request) = 0;

    // Stream a response body into file_path (created or truncated).
    // On failure the partial file is removed.
    virtual DownloadResult download(const HttpRequest& request,
                                    const std::string& file_path,
                                    const ProgressFn& progress) = 0;
};

// libcurl-backed transport: follows redirects, verifies TLS
std::shared_ptr<Transport> make_curl_transport();

} // namespace relfetch
