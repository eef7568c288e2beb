#pragma once

#include "relfetch/config.hpp"
#include "relfetch/transport.hpp"
#include "relfetch/types.hpp"

#include <string>
#include <vector>

namespace relfetch {

// ============================================================================
// Release Metadata
// ============================================================================

constexpr const char* GITHUB_ACCEPT = "application/vnd.github+json";
constexpr const char* GITHUB_API_VERSION = "2022-11-28";

struct ReleaseInfo {
    std::string tag_name;
    std::vector<std::string> asset_names;
};

struct ReleaseParseResult {
    bool ok = false;
    std::string error;
    ReleaseInfo release;
};

// Decode a "latest release" response body. tag_name is required; assets is
// optional and entries without a string name are skipped.
ReleaseParseResult parse_release_json(const std::string& body);

// <api_base>/repos/<repo>/releases/latest
std::string latest_release_api_url(const std::string& api_base, const std::string& repo);

// GET request for the latest-release endpoint with the API headers set
HttpRequest latest_release_request(const std::string& repo, const ClientConfig& config);

// ============================================================================
// Version Resolver
// ============================================================================

struct ResolveResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string tag;
};

// One attempt: transport failure, non-200 status or an undecodable body fail
ResolveResult fetch_latest_tag(Transport& transport, const std::string& repo,
                               const ClientConfig& config);

// Runs fetch_latest_tag up to config.retry.count times, sleeping
// config.retry.delay after each failure. Exhaustion yields a single
// ErrorKind::Resolution error; per-attempt errors are not kept.
ResolveResult resolve_latest(Transport& transport, const std::string& repo,
                             const ClientConfig& config);

// ============================================================================
// Asset Locator
// ============================================================================

// https://github.com/<repo>/releases/download/<version>/<asset_name>
// Pure string construction; asset_name is not validated.
std::string asset_url(const std::string& repo, const std::string& version,
                      const std::string& asset_name);

// Same, against a configurable download host
std::string asset_url(const std::string& download_base, const std::string& repo,
                      const std::string& version, const std::string& asset_name);

struct AssetUrlResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string url;
    std::string version;  // Tag the URL points at
};

// Resolves the latest tag (with retry) and builds the asset URL for it
AssetUrlResult latest_asset_url(Transport& transport, const std::string& repo,
                                const std::string& asset_name, const ClientConfig& config);

struct AssetListResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::vector<std::string> names;
};

// Asset names of the latest release. Single request, never retried.
AssetListResult list_latest_assets(Transport& transport, const std::string& repo,
                                   const ClientConfig& config);

} // namespace relfetch
