#include "relfetch/config.hpp"
#include "relfetch/platform.hpp"
#include "relfetch/progress.hpp"

#include <utility>

namespace relfetch {

ClientBuilder::ClientBuilder() {
    config_.progress = default_progress_tracker();
}

ClientBuilder ClientBuilder::from_environment() {
    ClientBuilder builder;
    builder.config_.proxy = proxy_from_environment();
    return builder;
}

ClientBuilder& ClientBuilder::install_dir(const std::string& dir) {
    config_.install_dir = dir;
    return *this;
}

ClientBuilder& ClientBuilder::retry_count(uint32_t count) {
    config_.retry.count = count;
    return *this;
}

ClientBuilder& ClientBuilder::retry_delay_secs(uint64_t secs) {
    config_.retry.delay = std::chrono::seconds(secs);
    return *this;
}

ClientBuilder& ClientBuilder::proxy(const std::string& url) {
    config_.proxy = url;
    return *this;
}

ClientBuilder& ClientBuilder::progress(ProgressFn fn) {
    config_.progress = std::move(fn);
    return *this;
}

ClientBuilder& ClientBuilder::no_progress() {
    config_.progress = nullptr;
    return *this;
}

ClientBuilder& ClientBuilder::api_base(const std::string& url) {
    config_.api_base = url;
    return *this;
}

ClientBuilder& ClientBuilder::download_base(const std::string& url) {
    config_.download_base = url;
    return *this;
}

std::string proxy_from_environment() {
    // Set-but-empty counts as unset
    auto http = get_env("HTTP_PROXY");
    if (http && !http->empty()) {
        return *http;
    }
    auto https = get_env("HTTPS_PROXY");
    if (https && !https->empty()) {
        return *https;
    }
    return "";
}

} // namespace relfetch
