#pragma once

#include "relfetch/config.hpp"
#include "relfetch/transport.hpp"
#include "relfetch/types.hpp"
#include "relfetch/version_record.hpp"

#include <functional>
#include <string>

namespace relfetch {

// ============================================================================
// Install State Machine
// ============================================================================
//
// The version record in the install directory is the single source of truth
// for what is installed:
//
//   no record                     -> fetch asset, write record
//   record for another repo       -> error, nothing touched
//   record, upgrade not allowed   -> nothing to do
//   record == remote latest       -> nothing to do
//   record != remote latest       -> remove directory, fetch latest, write record
//
// No rollback: a failure after the directory was removed leaves it partially
// populated and without a record, so the next call performs a fresh install.

enum class InstallState {
    NotInstalled,
    InstalledCurrent,
    InstalledStale
};

enum class InstallAction {
    None,       // Operation failed
    Installed,  // Fresh install
    UpToDate,   // Record matches the remote latest tag
    Upgraded,   // Stale install replaced
    Skipped     // Existing install kept because upgrades are not allowed
};

inline const char* install_action_to_string(InstallAction action) {
    switch (action) {
        case InstallAction::None: return "none";
        case InstallAction::Installed: return "installed";
        case InstallAction::UpToDate: return "up_to_date";
        case InstallAction::Upgraded: return "upgraded";
        case InstallAction::Skipped: return "skipped";
    }
    return "unknown";
}

// Maps a resolved version tag to the asset file name for that release
using AssetNameFn = std::function<std::string(const std::string& version)>;

struct InstallResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    InstallAction action = InstallAction::None;
    std::string tag;         // Tag recorded after the operation
    std::string asset_name;  // Asset fetched, empty when nothing was fetched
};

struct StateProbeResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    InstallState state = InstallState::NotInstalled;
    VersionRecord record;       // Valid unless NotInstalled
    std::string remote_tag;     // Empty unless resolved
};

class Installer {
public:
    // transport must outlive the installer
    Installer(std::string repo, ClientConfig config, Transport& transport);

    const std::string& repo() const { return repo_; }
    const std::string& install_dir() const { return config_.install_dir; }

    // version empty: use the latest release
    InstallResult install_asset(const AssetNameFn& asset_name_fn, const std::string& version,
                                bool allow_upgrade);

    // Fixed asset name, reused for upgrades
    InstallResult install_asset(const std::string& asset_name, const std::string& version,
                                bool allow_upgrade);

    // Classifies the install directory. Resolves the remote latest tag only
    // when a valid record is present.
    StateProbeResult probe_state();

    VersionRecordReadResult installed_version() const;

private:
    // Reads the record and enforces the repository guard
    VersionRecordReadResult read_owned_record() const;

    InstallResult fresh_install(const AssetNameFn& asset_name_fn, const std::string& version);
    InstallResult upgrade(const AssetNameFn& asset_name_fn, const std::string& latest_tag);
    InstallResult fetch_and_record(const AssetNameFn& asset_name_fn, const std::string& tag,
                                   InstallAction action);

    std::string repo_;
    ClientConfig config_;
    Transport& transport_;
};

} // namespace relfetch
