#include <doctest/doctest.h>
#include <relfetch/downloader.hpp>

#include "test_support.hpp"

#include <algorithm>

using namespace relfetch;
using namespace relfetch::test;

namespace {

bool has_download_leftovers(const std::string& dir) {
    auto names = list_names(dir);
    return std::any_of(names.begin(), names.end(), [](const std::string& name) {
        return name.size() > 9 && name.compare(name.size() - 9, 9, ".download") == 0;
    });
}

const char* BASE = "https://github.com/owner/tool/releases/download/";

} // namespace

TEST_CASE("fetch_mode_for_url dispatches on the URL suffix") {
    CHECK(fetch_mode_for_url("https://host/x/tool.tar.gz") == FetchMode::TarGz);
    CHECK(fetch_mode_for_url("https://host/x/tool.zip") == FetchMode::Zip);
    CHECK(fetch_mode_for_url("https://host/x/tool.zip?raw=1") == FetchMode::Zip);
    CHECK(fetch_mode_for_url("https://host/x/tool.tgz") == FetchMode::Raw);
    CHECK(fetch_mode_for_url("https://host/x/tool") == FetchMode::Raw);
}

TEST_CASE("url_basename returns the last path segment") {
    CHECK(url_basename("https://host/a/b/tool-linux") == "tool-linux");
    CHECK(url_basename("https://host/a/b/tool.zip?token=1#frag") == "tool.zip");
    CHECK(url_basename("https://host/a/") == "download");
}

TEST_CASE("fetch saves non-archive assets under their URL basename") {
    TempDir temp;
    FakeTransport transport;
    std::string url = std::string(BASE) + "v1/tool-linux-amd64";
    transport.files[url] = "ELF binary";
    std::string dest = temp.path("bin");

    auto result = fetch(transport, url, dest, test_config(dest));
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(read_text(dest + "/tool-linux-amd64") == "ELF binary");

    REQUIRE(transport.download_requests.size() == 1);
    CHECK(transport.download_requests[0].timeout_seconds == 0);
}

TEST_CASE("fetch extracts tar.gz assets and removes the container") {
    TempDir temp;
    FakeTransport transport;
    std::string url = std::string(BASE) + "v1/pkg-v1.tar.gz";
    std::vector<TestTarEntry> entries;
    entries.push_back({"pkg-v1/", '5', "", 0755, ""});
    entries.push_back({"pkg-v1/bin/tool", '0', "tool", 0755, ""});
    transport.files[url] = build_tar_gz(entries, temp.path("scratch.gz"));
    std::string dest = temp.path("install");

    auto result = fetch(transport, url, dest, test_config(dest));
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(read_text(dest + "/bin/tool") == "tool");
    CHECK_FALSE(path_exists(dest + "/pkg-v1.tar.gz"));
    CHECK_FALSE(has_download_leftovers(dest));
}

TEST_CASE("fetch extracts zip assets without stripping") {
    TempDir temp;
    FakeTransport transport;
    std::string url = std::string(BASE) + "v1/pkg.zip";
    transport.files[url] = build_zip({{"pkg/file.txt", "zipped", 0}});
    std::string dest = temp.path("install");

    auto result = fetch(transport, url, dest, test_config(dest));
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(read_text(dest + "/pkg/file.txt") == "zipped");
    CHECK_FALSE(has_download_leftovers(dest));
}

TEST_CASE("fetch removes the container when extraction fails") {
    TempDir temp;
    FakeTransport transport;
    std::string url = std::string(BASE) + "v1/broken.tar.gz";
    transport.files[url] = "definitely not gzip";
    std::string dest = temp.path("install");

    auto result = fetch(transport, url, dest, test_config(dest));
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Archive);
    CHECK_FALSE(has_download_leftovers(dest));
}

TEST_CASE("fetch surfaces non-success download status") {
    TempDir temp;
    FakeTransport transport;
    std::string dest = temp.path("install");

    auto result = fetch(transport, std::string(BASE) + "v1/missing.zip", dest, test_config(dest));
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::HttpStatus);
    CHECK(is_directory(dest));
    CHECK_FALSE(has_download_leftovers(dest));
}

TEST_CASE("fetch forwards progress events to the configured sink") {
    TempDir temp;
    FakeTransport transport;
    std::string url = std::string(BASE) + "v1/tool";
    transport.files[url] = "12345";
    auto config = test_config(temp.path());

    std::vector<ProgressEvent> events;
    config.progress = [&events](const ProgressEvent& event) { events.push_back(event); };

    REQUIRE(fetch(transport, url, temp.path(), config).ok);
    REQUIRE(events.size() == 1);
    CHECK(events[0].source == url);
    CHECK(events[0].complete);
}

TEST_CASE("download_asset uses the pinned version without resolving") {
    TempDir temp;
    FakeTransport transport;
    std::string url = std::string(BASE) + "v1.0.0/tool.zip";
    transport.files[url] = build_zip({{"tool", "v1", 0}});

    DownloadSpec spec{"owner/tool", "tool.zip", "v1.0.0", temp.path()};
    auto result = download_asset(transport, spec, test_config(temp.path()));
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.url == url);
    CHECK(result.version == "v1.0.0");
    CHECK(transport.get_requests.empty());
}

TEST_CASE("download_asset resolves the latest version when none is given") {
    TempDir temp;
    FakeTransport transport;
    transport.serve_latest("v2.0.0");
    std::string url = std::string(BASE) + "v2.0.0/tool";
    transport.files[url] = "latest";

    DownloadSpec spec{"owner/tool", "tool", "", temp.path()};
    auto result = download_asset(transport, spec, test_config(temp.path()));
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.version == "v2.0.0");
    CHECK(transport.get_requests.size() == 1);
    CHECK(read_text(temp.path("tool")) == "latest");
}

TEST_CASE("download_latest_asset fetches the first matching asset") {
    TempDir temp;
    FakeTransport transport;
    transport.serve_latest("v3.0.0", {"checksums.txt", "tool-linux-amd64", "tool-linux-arm64"});
    transport.files[std::string(BASE) + "v3.0.0/tool-linux-amd64"] = "amd64";
    transport.files[std::string(BASE) + "v3.0.0/tool-linux-arm64"] = "arm64";

    auto result = download_latest_asset(transport, "owner/tool", "linux-(amd|arm)64",
                                        temp.path(), test_config(temp.path()));
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.asset_name == "tool-linux-amd64");
    CHECK(read_text(temp.path("tool-linux-amd64")) == "amd64");
    CHECK_FALSE(path_exists(temp.path("tool-linux-arm64")));
}

TEST_CASE("download_latest_asset reports no match distinctly") {
    TempDir temp;
    FakeTransport transport;
    transport.serve_latest("v3.0.0", {"tool-windows.zip"});

    auto result = download_latest_asset(transport, "owner/tool", "darwin", temp.path(),
                                        test_config(temp.path()));
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::NoMatch);
    CHECK(result.error == "no matching asset found");
    CHECK(transport.download_requests.empty());
}

TEST_CASE("download_latest_asset rejects an invalid pattern before any request") {
    TempDir temp;
    FakeTransport transport;
    transport.serve_latest("v3.0.0", {"tool"});

    auto result = download_latest_asset(transport, "owner/tool", "([unclosed", temp.path(),
                                        test_config(temp.path()));
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::InvalidArgument);
    CHECK(transport.get_requests.empty());
}
