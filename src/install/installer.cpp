#include "relfetch/installer.hpp"
#include "relfetch/downloader.hpp"
#include "relfetch/platform.hpp"
#include "relfetch/release_api.hpp"

#include <utility>

namespace relfetch {

namespace {

InstallResult install_error(ErrorKind kind, const std::string& message) {
    InstallResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

} // namespace

Installer::Installer(std::string repo, ClientConfig config, Transport& transport)
    : repo_(std::move(repo)), config_(std::move(config)), transport_(transport) {}

VersionRecordReadResult Installer::installed_version() const {
    return read_version_record(config_.install_dir);
}

VersionRecordReadResult Installer::read_owned_record() const {
    auto read = read_version_record(config_.install_dir);
    if (!read.ok) {
        return read;
    }

    if (read.record.repo != repo_) {
        VersionRecordReadResult mismatch;
        mismatch.kind = ErrorKind::RepoMismatch;
        mismatch.error = "installed version is for a different repository: " + read.record.repo;
        mismatch.record = read.record;
        return mismatch;
    }
    return read;
}

StateProbeResult Installer::probe_state() {
    StateProbeResult result;

    if (!has_version_record(config_.install_dir)) {
        result.state = InstallState::NotInstalled;
        result.ok = true;
        return result;
    }

    auto read = read_owned_record();
    if (!read.ok) {
        result.kind = read.kind;
        result.error = "error checking version: " + read.error;
        return result;
    }
    result.record = read.record;

    auto latest = resolve_latest(transport_, repo_, config_);
    if (!latest.ok) {
        result.kind = latest.kind;
        result.error = "error getting latest version: " + latest.error;
        return result;
    }
    result.remote_tag = latest.tag;

    result.state = latest.tag == read.record.tag_name ? InstallState::InstalledCurrent
                                                      : InstallState::InstalledStale;
    result.ok = true;
    return result;
}

InstallResult Installer::install_asset(const std::string& asset_name, const std::string& version,
                                       bool allow_upgrade) {
    return install_asset([asset_name](const std::string&) { return asset_name; },
                         version, allow_upgrade);
}

InstallResult Installer::install_asset(const AssetNameFn& asset_name_fn, const std::string& version,
                                       bool allow_upgrade) {
    if (!asset_name_fn) {
        return install_error(ErrorKind::InvalidArgument, "asset name function is empty");
    }

    if (!has_version_record(config_.install_dir)) {
        return fresh_install(asset_name_fn, version);
    }

    // A foreign or unreadable record is never overwritten, whatever the mode
    if (!allow_upgrade) {
        auto read = read_owned_record();
        if (!read.ok) {
            return install_error(read.kind, "error checking version: " + read.error);
        }
        InstallResult result;
        result.ok = true;
        result.action = InstallAction::Skipped;
        result.tag = read.record.tag_name;
        return result;
    }

    auto probe = probe_state();
    if (!probe.ok) {
        return install_error(probe.kind, probe.error);
    }

    if (probe.state == InstallState::InstalledCurrent) {
        InstallResult result;
        result.ok = true;
        result.action = InstallAction::UpToDate;
        result.tag = probe.record.tag_name;
        return result;
    }

    return upgrade(asset_name_fn, probe.remote_tag);
}

InstallResult Installer::fresh_install(const AssetNameFn& asset_name_fn, const std::string& version) {
    std::string tag = version;
    if (tag.empty()) {
        auto latest = resolve_latest(transport_, repo_, config_);
        if (!latest.ok) {
            return install_error(latest.kind, "error getting latest version: " + latest.error);
        }
        tag = latest.tag;
    }
    return fetch_and_record(asset_name_fn, tag, InstallAction::Installed);
}

InstallResult Installer::upgrade(const AssetNameFn& asset_name_fn, const std::string& latest_tag) {
    if (path_exists(config_.install_dir) && !remove_directory(config_.install_dir)) {
        return install_error(ErrorKind::Filesystem,
                             "error removing old installation: " + config_.install_dir);
    }
    return fetch_and_record(asset_name_fn, latest_tag, InstallAction::Upgraded);
}

InstallResult Installer::fetch_and_record(const AssetNameFn& asset_name_fn, const std::string& tag,
                                          InstallAction action) {
    DownloadSpec spec;
    spec.repo = repo_;
    spec.asset_name = asset_name_fn(tag);
    spec.version = tag;
    spec.destination_dir = config_.install_dir;

    auto downloaded = download_asset(transport_, spec, config_);
    if (!downloaded.ok) {
        return install_error(downloaded.kind, "error downloading asset: " + downloaded.error);
    }

    VersionRecord record;
    record.tag_name = tag;
    record.repo = repo_;

    auto written = write_version_record(config_.install_dir, record);
    if (!written.ok) {
        return install_error(written.kind, written.error);
    }

    InstallResult result;
    result.ok = true;
    result.action = action;
    result.tag = tag;
    result.asset_name = spec.asset_name;
    return result;
}

} // namespace relfetch
