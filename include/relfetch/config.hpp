#pragma once

#include "relfetch/types.hpp"

#include <cstdint>
#include <string>

namespace relfetch {

constexpr const char* DEFAULT_API_BASE = "https://api.github.com";
constexpr const char* DEFAULT_DOWNLOAD_BASE = "https://github.com";

// ============================================================================
// Client Configuration
// ============================================================================

// Frozen configuration passed by value into the resolver, fetch engine and
// installer. Build it with ClientBuilder.
struct ClientConfig {
    std::string install_dir = ".";
    RetryPolicy retry;
    std::string proxy;                  // Empty: direct connection
    ProgressFn progress;                // Empty: no progress events
    std::string api_base = DEFAULT_API_BASE;
    std::string download_base = DEFAULT_DOWNLOAD_BASE;
};

class ClientBuilder {
public:
    // Defaults: install dir ".", 3 attempts, 3 s delay, no proxy,
    // default progress tracker
    ClientBuilder();

    // Same defaults, with the proxy read from HTTP_PROXY or HTTPS_PROXY
    static ClientBuilder from_environment();

    ClientBuilder& install_dir(const std::string& dir);
    ClientBuilder& retry_count(uint32_t count);
    ClientBuilder& retry_delay_secs(uint64_t secs);
    ClientBuilder& proxy(const std::string& url);
    ClientBuilder& progress(ProgressFn fn);
    ClientBuilder& no_progress();
    ClientBuilder& api_base(const std::string& url);
    ClientBuilder& download_base(const std::string& url);

    ClientConfig build() const { return config_; }

private:
    ClientConfig config_;
};

// Proxy URL from HTTP_PROXY, falling back to HTTPS_PROXY; empty when unset
std::string proxy_from_environment();

} // namespace relfetch
