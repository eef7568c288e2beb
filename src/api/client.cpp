#include "relfetch/api.hpp"

#include <utility>

namespace relfetch {

bool is_valid_repo_name(const std::string& repo) {
    auto slash = repo.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == repo.size()) {
        return false;
    }
    return repo.find('/', slash + 1) == std::string::npos;
}

// ============================================================================
// VersionSelection
// ============================================================================

VersionSelection::VersionSelection(std::string repo, std::string version, bool allow_upgrade,
                                   ClientConfig config, std::shared_ptr<Transport> transport)
    : repo_(std::move(repo)),
      version_(std::move(version)),
      allow_upgrade_(allow_upgrade),
      config_(std::move(config)),
      transport_(std::move(transport)) {}

InstallResult VersionSelection::install(const AssetNameFn& asset_name_fn) const {
    Installer installer(repo_, config_, *transport_);
    return installer.install_asset(asset_name_fn, version_, allow_upgrade_);
}

InstallResult VersionSelection::install(const std::string& asset_name) const {
    Installer installer(repo_, config_, *transport_);
    return installer.install_asset(asset_name, version_, allow_upgrade_);
}

// ============================================================================
// RepoSelection
// ============================================================================

RepoSelection::RepoSelection(std::string repo, ClientConfig config,
                             std::shared_ptr<Transport> transport)
    : repo_(std::move(repo)), config_(std::move(config)), transport_(std::move(transport)) {}

VersionSelection RepoSelection::latest() const {
    return VersionSelection(repo_, "", true, config_, transport_);
}

VersionSelection RepoSelection::version(const std::string& tag) const {
    return VersionSelection(repo_, tag, false, config_, transport_);
}

VersionRecordReadResult RepoSelection::installed_version() const {
    return read_version_record(config_.install_dir);
}

// ============================================================================
// Client
// ============================================================================

Client::Client(ClientConfig config, std::shared_ptr<Transport> transport)
    : config_(std::move(config)),
      transport_(transport ? std::move(transport) : make_curl_transport()) {}

RepoSelection Client::repo(const std::string& name) const {
    return RepoSelection(name, config_, transport_);
}

} // namespace relfetch
