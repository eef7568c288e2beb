#include "relfetch/release_api.hpp"

#include <nlohmann/json.hpp>

#include <thread>
#include <utility>

namespace relfetch {

namespace {

std::string trim_trailing_slashes(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Performs the latest-release request and decodes the body
ReleaseParseResult request_latest_release(Transport& transport, const std::string& repo,
                                          const ClientConfig& config, ErrorKind& kind) {
    ReleaseParseResult result;

    auto response = transport.get(latest_release_request(repo, config));
    if (!response.ok) {
        kind = ErrorKind::Transport;
        result.error = response.error;
        return result;
    }

    if (response.http_status != 200) {
        kind = ErrorKind::HttpStatus;
        result.error = "received status code " + std::to_string(response.http_status) +
                       " from GitHub API: " + response.body;
        return result;
    }

    result = parse_release_json(response.body);
    if (!result.ok) {
        kind = ErrorKind::Decode;
    }
    return result;
}

} // namespace

ReleaseParseResult parse_release_json(const std::string& body) {
    ReleaseParseResult result;

    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        result.error = "invalid JSON in release response";
        return result;
    }

    if (!j.is_object()) {
        result.error = "release response must be an object";
        return result;
    }

    if (!j.contains("tag_name") || !j["tag_name"].is_string()) {
        result.error = "tag_name missing";
        return result;
    }
    result.release.tag_name = j["tag_name"].get<std::string>();

    if (j.contains("assets") && j["assets"].is_array()) {
        for (const auto& asset : j["assets"]) {
            if (asset.is_object() && asset.contains("name") && asset["name"].is_string()) {
                result.release.asset_names.push_back(asset["name"].get<std::string>());
            }
        }
    }

    result.ok = true;
    return result;
}

std::string latest_release_api_url(const std::string& api_base, const std::string& repo) {
    return trim_trailing_slashes(api_base) + "/repos/" + repo + "/releases/latest";
}

HttpRequest latest_release_request(const std::string& repo, const ClientConfig& config) {
    HttpRequest request;
    request.url = latest_release_api_url(config.api_base, repo);
    request.headers.emplace_back("Accept", GITHUB_ACCEPT);
    request.headers.emplace_back("X-GitHub-Api-Version", GITHUB_API_VERSION);
    request.proxy = config.proxy;
    return request;
}

ResolveResult fetch_latest_tag(Transport& transport, const std::string& repo,
                               const ClientConfig& config) {
    ResolveResult result;

    ErrorKind kind = ErrorKind::None;
    auto release = request_latest_release(transport, repo, config, kind);
    if (!release.ok) {
        result.kind = kind;
        result.error = release.error;
        return result;
    }

    result.tag = release.release.tag_name;
    result.ok = true;
    return result;
}

ResolveResult resolve_latest(Transport& transport, const std::string& repo,
                             const ClientConfig& config) {
    for (uint32_t attempt = 0; attempt < config.retry.count; ++attempt) {
        auto result = fetch_latest_tag(transport, repo, config);
        if (result.ok) {
            return result;
        }
        std::this_thread::sleep_for(config.retry.delay);
    }

    ResolveResult failed;
    failed.kind = ErrorKind::Resolution;
    failed.error = "unable to fetch latest version";
    return failed;
}

std::string asset_url(const std::string& repo, const std::string& version,
                      const std::string& asset_name) {
    return asset_url(DEFAULT_DOWNLOAD_BASE, repo, version, asset_name);
}

std::string asset_url(const std::string& download_base, const std::string& repo,
                      const std::string& version, const std::string& asset_name) {
    return trim_trailing_slashes(download_base) + "/" + repo + "/releases/download/" +
           version + "/" + asset_name;
}

AssetUrlResult latest_asset_url(Transport& transport, const std::string& repo,
                                const std::string& asset_name, const ClientConfig& config) {
    AssetUrlResult result;

    auto resolved = resolve_latest(transport, repo, config);
    if (!resolved.ok) {
        result.kind = resolved.kind;
        result.error = resolved.error;
        return result;
    }

    result.version = resolved.tag;
    result.url = asset_url(config.download_base, repo, resolved.tag, asset_name);
    result.ok = true;
    return result;
}

AssetListResult list_latest_assets(Transport& transport, const std::string& repo,
                                   const ClientConfig& config) {
    AssetListResult result;

    ErrorKind kind = ErrorKind::None;
    auto release = request_latest_release(transport, repo, config, kind);
    if (!release.ok) {
        result.kind = kind;
        result.error = release.error;
        return result;
    }

    result.names = std::move(release.release.asset_names);
    result.ok = true;
    return result;
}

} // namespace relfetch
