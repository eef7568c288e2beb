#pragma once

#include "relfetch/config.hpp"
#include "relfetch/transport.hpp"
#include "relfetch/types.hpp"

#include <string>

namespace relfetch {

// ============================================================================
// Fetch Engine
// ============================================================================
//
// fetch() dispatches on the URL suffix:
//   .tar.gz  download to a temporary file in dest_dir, extract stripping the
//            top-level wrapper directory, remove the temporary file
//   .zip     download to a temporary file, extract as-is, remove it
//   other    save as dest_dir/<last URL segment>

enum class FetchMode {
    TarGz,
    Zip,
    Raw
};

FetchMode fetch_mode_for_url(const std::string& url);

// Last path segment of a URL, ignoring any query or fragment
std::string url_basename(const std::string& url);

struct FetchResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string url;
};

FetchResult fetch(Transport& transport, const std::string& url,
                  const std::string& dest_dir, const ClientConfig& config);

// ============================================================================
// Release Asset Download
// ============================================================================

struct AssetDownloadResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::string url;
    std::string version;      // Tag the asset was fetched from
    std::string asset_name;
};

// Downloads spec.asset_name at spec.version (empty: resolve latest) into
// spec.destination_dir
AssetDownloadResult download_asset(Transport& transport, const DownloadSpec& spec,
                                   const ClientConfig& config);

// Downloads the first latest-release asset whose name matches `pattern`
// (ECMAScript regex, search semantics). No match is ErrorKind::NoMatch.
AssetDownloadResult download_latest_asset(Transport& transport, const std::string& repo,
                                          const std::string& pattern,
                                          const std::string& dest_dir,
                                          const ClientConfig& config);

} // namespace relfetch
