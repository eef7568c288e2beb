#include "relfetch/downloader.hpp"
#include "relfetch/archive.hpp"
#include "relfetch/platform.hpp"
#include "relfetch/release_api.hpp"

#include <regex>
#include <utility>

namespace relfetch {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_query(const std::string& url) {
    auto pos = url.find_first_of("?#");
    return pos == std::string::npos ? url : url.substr(0, pos);
}

// Removes the downloaded container on every exit path
class ScopedFileRemover {
public:
    explicit ScopedFileRemover(std::string path) : path_(std::move(path)) {}
    ~ScopedFileRemover() { remove_file(path_); }

    ScopedFileRemover(const ScopedFileRemover&) = delete;
    ScopedFileRemover& operator=(const ScopedFileRemover&) = delete;

private:
    std::string path_;
};

HttpRequest download_request(const std::string& url, const ClientConfig& config) {
    HttpRequest request;
    request.url = url;
    request.proxy = config.proxy;
    request.timeout_seconds = 0;
    return request;
}

FetchResult fetch_error(const std::string& url, ErrorKind kind, const std::string& message) {
    FetchResult result;
    result.url = url;
    result.kind = kind;
    result.error = message;
    return result;
}

// Download into a hidden temporary file, then hand it to `extract`
template <typename Extract>
FetchResult fetch_archive(Transport& transport, const std::string& url,
                          const std::string& dest_dir, const ClientConfig& config,
                          Extract&& extract) {
    std::string temp_path = join_path(dest_dir, "." + url_basename(url) + ".download");
    ScopedFileRemover cleanup(temp_path);

    auto download = transport.download(download_request(url, config), temp_path, config.progress);
    if (!download.ok) {
        return fetch_error(url, download.kind, download.error);
    }

    UnpackResult unpacked = extract(temp_path);
    if (!unpacked.ok) {
        return fetch_error(url, unpacked.kind, unpacked.error);
    }

    FetchResult result;
    result.url = url;
    result.ok = true;
    return result;
}

} // namespace

FetchMode fetch_mode_for_url(const std::string& url) {
    std::string path = strip_query(url);
    if (ends_with(path, ".tar.gz")) return FetchMode::TarGz;
    if (ends_with(path, ".zip")) return FetchMode::Zip;
    return FetchMode::Raw;
}

std::string url_basename(const std::string& url) {
    std::string path = strip_query(url);
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? "download" : name;
}

FetchResult fetch(Transport& transport, const std::string& url,
                  const std::string& dest_dir, const ClientConfig& config) {
    if (!create_directories(dest_dir)) {
        return fetch_error(url, ErrorKind::Filesystem, "failed to create directory: " + dest_dir);
    }

    switch (fetch_mode_for_url(url)) {
        case FetchMode::TarGz:
            return fetch_archive(transport, url, dest_dir, config,
                                 [&dest_dir](const std::string& archive) {
                                     return extract_tar_gz(archive, dest_dir, 1);
                                 });
        case FetchMode::Zip:
            return fetch_archive(transport, url, dest_dir, config,
                                 [&dest_dir](const std::string& archive) {
                                     return extract_zip(archive, dest_dir);
                                 });
        case FetchMode::Raw:
            break;
    }

    auto download = transport.download(download_request(url, config),
                                       join_path(dest_dir, url_basename(url)), config.progress);
    if (!download.ok) {
        return fetch_error(url, download.kind, download.error);
    }

    FetchResult result;
    result.url = url;
    result.ok = true;
    return result;
}

AssetDownloadResult download_asset(Transport& transport, const DownloadSpec& spec,
                                   const ClientConfig& config) {
    AssetDownloadResult result;
    result.asset_name = spec.asset_name;

    if (spec.version.empty()) {
        auto located = latest_asset_url(transport, spec.repo, spec.asset_name, config);
        if (!located.ok) {
            result.kind = located.kind;
            result.error = located.error;
            return result;
        }
        result.url = located.url;
        result.version = located.version;
    } else {
        result.url = asset_url(config.download_base, spec.repo, spec.version, spec.asset_name);
        result.version = spec.version;
    }

    auto fetched = fetch(transport, result.url, spec.destination_dir, config);
    if (!fetched.ok) {
        result.kind = fetched.kind;
        result.error = fetched.error;
        return result;
    }

    result.ok = true;
    return result;
}

AssetDownloadResult download_latest_asset(Transport& transport, const std::string& repo,
                                          const std::string& pattern,
                                          const std::string& dest_dir,
                                          const ClientConfig& config) {
    AssetDownloadResult result;

    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        result.kind = ErrorKind::InvalidArgument;
        result.error = "invalid asset pattern '" + pattern + "': " + e.what();
        return result;
    }

    auto assets = list_latest_assets(transport, repo, config);
    if (!assets.ok) {
        result.kind = assets.kind;
        result.error = assets.error;
        return result;
    }

    for (const auto& name : assets.names) {
        if (std::regex_search(name, re)) {
            DownloadSpec spec;
            spec.repo = repo;
            spec.asset_name = name;
            spec.destination_dir = dest_dir;
            return download_asset(transport, spec, config);
        }
    }

    result.kind = ErrorKind::NoMatch;
    result.error = "no matching asset found";
    return result;
}

} // namespace relfetch
