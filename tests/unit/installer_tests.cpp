#include <doctest/doctest.h>
#include <relfetch/api.hpp>
#include <relfetch/installer.hpp>

#include "test_support.hpp"

using namespace relfetch;
using namespace relfetch::test;

namespace {

const char* REPO = "owner/tool";
const char* BASE = "https://github.com/owner/tool/releases/download/";

std::string zip_asset_for(const std::string& tag) {
    return "asset-" + tag + ".zip";
}

// Serves asset-<tag>.zip for each tag, containing bin/tool with the tag as content
void serve_zip_assets(FakeTransport& transport, const std::vector<std::string>& tags) {
    for (const auto& tag : tags) {
        transport.files[std::string(BASE) + tag + "/" + zip_asset_for(tag)] =
            build_zip({{"bin/tool", "tool " + tag, 0}});
    }
}

} // namespace

TEST_CASE("fresh install resolves latest, extracts and records the tag") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    serve_zip_assets(*transport, {"v2.0.0"});
    std::string dir = temp.path("install");

    Client client(test_config(dir), transport);
    auto result = client.repo(REPO).latest().install(zip_asset_for);
    REQUIRE_MESSAGE(result.ok, result.error);

    CHECK(result.action == InstallAction::Installed);
    CHECK(result.tag == "v2.0.0");
    CHECK(result.asset_name == "asset-v2.0.0.zip");
    CHECK(read_text(dir + "/bin/tool") == "tool v2.0.0");

    auto record = read_version_record(dir);
    REQUIRE(record.ok);
    CHECK(record.record == VersionRecord{"v2.0.0", REPO});

    // Latest is resolved once and reused for both URL and record
    CHECK(transport->get_requests.size() == 1);
    REQUIRE(transport->download_requests.size() == 1);
    CHECK(transport->download_requests[0].url == std::string(BASE) + "v2.0.0/asset-v2.0.0.zip");
}

TEST_CASE("pinned install fetches the requested tag without resolving") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    serve_zip_assets(*transport, {"v1.0.0"});
    std::string dir = temp.path("install");

    Client client(test_config(dir), transport);
    auto result = client.repo(REPO).version("v1.0.0").install(zip_asset_for);
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.action == InstallAction::Installed);
    CHECK(transport->get_requests.empty());
    CHECK(read_version_record(dir).record.tag_name == "v1.0.0");
}

TEST_CASE("repeated pinned installs download once") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    serve_zip_assets(*transport, {"v1.0.0"});
    std::string dir = temp.path("install");

    Installer installer(REPO, test_config(dir), *transport);
    auto first = installer.install_asset(zip_asset_for, "v1.0.0", false);
    REQUIRE_MESSAGE(first.ok, first.error);
    auto second = installer.install_asset(zip_asset_for, "v1.0.0", false);
    REQUIRE_MESSAGE(second.ok, second.error);

    CHECK(second.action == InstallAction::Skipped);
    CHECK(second.tag == "v1.0.0");
    CHECK(second.asset_name.empty());
    CHECK(transport->download_requests.size() == 1);
    CHECK(transport->get_requests.empty());
}

TEST_CASE("install refuses a directory owned by another repository") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    serve_zip_assets(*transport, {"v2.0.0"});
    std::string dir = temp.path("install");

    VersionRecord foreign{"v9.9.9", "someone/else"};
    REQUIRE(write_version_record(dir, foreign).ok);
    write_text(dir + "/keep.txt", "untouched");

    Installer installer(REPO, test_config(dir), *transport);

    SUBCASE("tracking latest") {
        auto result = installer.install_asset(zip_asset_for, "", true);
        CHECK_FALSE(result.ok);
        CHECK(result.kind == ErrorKind::RepoMismatch);
        CHECK(result.error.find("installed version is for a different repository: someone/else") !=
              std::string::npos);
    }

    SUBCASE("pinned") {
        auto result = installer.install_asset(zip_asset_for, "v2.0.0", false);
        CHECK_FALSE(result.ok);
        CHECK(result.kind == ErrorKind::RepoMismatch);
    }

    CHECK(transport->get_requests.empty());
    CHECK(transport->download_requests.empty());
    CHECK(read_version_record(dir).record == foreign);
    CHECK(read_text(dir + "/keep.txt") == "untouched");
}

TEST_CASE("install with a current record resolves once and downloads nothing") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v1.0.0");
    std::string dir = temp.path("install");

    REQUIRE(write_version_record(dir, VersionRecord{"v1.0.0", REPO}).ok);
    write_text(dir + "/bin/tool", "tool v1.0.0");

    Installer installer(REPO, test_config(dir), *transport);
    auto result = installer.install_asset(zip_asset_for, "", true);
    REQUIRE_MESSAGE(result.ok, result.error);

    CHECK(result.action == InstallAction::UpToDate);
    CHECK(result.tag == "v1.0.0");
    CHECK(transport->get_requests.size() == 1);
    CHECK(transport->download_requests.empty());
    CHECK(read_text(dir + "/bin/tool") == "tool v1.0.0");
}

TEST_CASE("install with a stale record replaces the directory") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    serve_zip_assets(*transport, {"v2.0.0"});
    std::string dir = temp.path("install");

    REQUIRE(write_version_record(dir, VersionRecord{"v1.0.0", REPO}).ok);
    write_text(dir + "/old-only.txt", "from v1");

    Installer installer(REPO, test_config(dir), *transport);
    auto result = installer.install_asset(zip_asset_for, "", true);
    REQUIRE_MESSAGE(result.ok, result.error);

    CHECK(result.action == InstallAction::Upgraded);
    CHECK(result.tag == "v2.0.0");
    CHECK_FALSE(path_exists(dir + "/old-only.txt"));
    CHECK(read_text(dir + "/bin/tool") == "tool v2.0.0");
    CHECK(read_version_record(dir).record.tag_name == "v2.0.0");

    // Asset name follows the newly resolved tag
    REQUIRE(transport->download_requests.size() == 1);
    CHECK(transport->download_requests[0].url == std::string(BASE) + "v2.0.0/asset-v2.0.0.zip");
}

TEST_CASE("fixed asset names are reused across upgrades") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    transport->files[std::string(BASE) + "v2.0.0/tool.zip"] = build_zip({{"tool", "2", 0}});
    std::string dir = temp.path("install");
    REQUIRE(write_version_record(dir, VersionRecord{"v1.0.0", REPO}).ok);

    Installer installer(REPO, test_config(dir), *transport);
    auto result = installer.install_asset(std::string("tool.zip"), "", true);
    REQUIRE_MESSAGE(result.ok, result.error);
    CHECK(result.action == InstallAction::Upgraded);
    CHECK(read_text(dir + "/tool") == "2");
}

TEST_CASE("pinned install leaves a stale install in place") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    std::string dir = temp.path("install");
    REQUIRE(write_version_record(dir, VersionRecord{"v1.0.0", REPO}).ok);

    Client client(test_config(dir), transport);
    auto result = client.repo(REPO).version("v2.0.0").install(zip_asset_for);
    REQUIRE_MESSAGE(result.ok, result.error);

    CHECK(result.action == InstallAction::Skipped);
    CHECK(result.tag == "v1.0.0");
    CHECK(transport->get_requests.empty());
    CHECK(transport->download_requests.empty());
}

TEST_CASE("a malformed record is fatal and left untouched") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    serve_zip_assets(*transport, {"v2.0.0"});
    std::string dir = temp.path("install");
    write_text(version_record_path(dir), "{\"tag_name\": 7}");

    Installer installer(REPO, test_config(dir), *transport);
    for (bool allow_upgrade : {true, false}) {
        auto result = installer.install_asset(zip_asset_for, "", allow_upgrade);
        CHECK_FALSE(result.ok);
        CHECK(result.kind == ErrorKind::RecordMalformed);
    }

    CHECK(read_text(version_record_path(dir)) == "{\"tag_name\": 7}");
    CHECK(transport->download_requests.empty());
}

TEST_CASE("resolution failure aborts a fresh install") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    std::string dir = temp.path("install");

    Installer installer(REPO, test_config(dir), *transport);
    auto result = installer.install_asset(zip_asset_for, "", true);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Resolution);
    CHECK(result.error.find("error getting latest version") == 0);
    CHECK(transport->get_requests.size() == 3);
    CHECK_FALSE(has_version_record(dir));
}

TEST_CASE("download failure aborts without writing a record") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    std::string dir = temp.path("install");

    Installer installer(REPO, test_config(dir), *transport);
    auto result = installer.install_asset(zip_asset_for, "", true);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::HttpStatus);
    CHECK(result.error.find("error downloading asset: ") == 0);
    CHECK_FALSE(has_version_record(dir));
}

TEST_CASE("failed upgrade leaves no record so the next call installs fresh") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    std::string dir = temp.path("install");
    REQUIRE(write_version_record(dir, VersionRecord{"v1.0.0", REPO}).ok);

    Installer installer(REPO, test_config(dir), *transport);
    auto failed = installer.install_asset(zip_asset_for, "", true);
    CHECK_FALSE(failed.ok);
    CHECK_FALSE(has_version_record(dir));

    serve_zip_assets(*transport, {"v2.0.0"});
    auto retried = installer.install_asset(zip_asset_for, "", true);
    REQUIRE_MESSAGE(retried.ok, retried.error);
    CHECK(retried.action == InstallAction::Installed);
}

TEST_CASE("probe_state classifies the install directory") {
    TempDir temp;
    auto transport = std::make_shared<FakeTransport>();
    transport->serve_latest("v2.0.0");
    std::string dir = temp.path("install");
    Installer installer(REPO, test_config(dir), *transport);

    auto empty = installer.probe_state();
    REQUIRE(empty.ok);
    CHECK(empty.state == InstallState::NotInstalled);
    CHECK(transport->get_requests.empty());

    REQUIRE(write_version_record(dir, VersionRecord{"v2.0.0", REPO}).ok);
    auto current = installer.probe_state();
    REQUIRE(current.ok);
    CHECK(current.state == InstallState::InstalledCurrent);

    REQUIRE(write_version_record(dir, VersionRecord{"v1.0.0", REPO}).ok);
    auto stale = installer.probe_state();
    REQUIRE(stale.ok);
    CHECK(stale.state == InstallState::InstalledStale);
    CHECK(stale.remote_tag == "v2.0.0");
}

TEST_CASE("an empty asset name function is rejected") {
    TempDir temp;
    FakeTransport transport;
    Installer installer(REPO, test_config(temp.path()), transport);

    auto result = installer.install_asset(AssetNameFn(), "v1", false);
    CHECK(result.kind == ErrorKind::InvalidArgument);
    CHECK(transport.download_requests.empty());
}
