#pragma once

#include "relfetch/config.hpp"
#include "relfetch/installer.hpp"
#include "relfetch/transport.hpp"
#include "relfetch/version_record.hpp"

#include <memory>
#include <string>

namespace relfetch {

// ============================================================================
// Repository / Version Selection
// ============================================================================
//
//   Client client(ClientBuilder::from_environment().install_dir("tools").build());
//   auto result = client.repo("owner/name").latest().install(
//       [](const std::string& tag) { return "tool-" + tag + ".tar.gz"; });
//
// latest() installs replace stale installs; version(tag) installs never do.

class VersionSelection {
public:
    VersionSelection(std::string repo, std::string version, bool allow_upgrade,
                     ClientConfig config, std::shared_ptr<Transport> transport);

    const std::string& repo() const { return repo_; }
    const std::string& version() const { return version_; }
    bool allow_upgrade() const { return allow_upgrade_; }

    InstallResult install(const AssetNameFn& asset_name_fn) const;
    InstallResult install(const std::string& asset_name) const;

private:
    std::string repo_;
    std::string version_;   // Empty: latest
    bool allow_upgrade_;
    ClientConfig config_;
    std::shared_ptr<Transport> transport_;
};

class RepoSelection {
public:
    RepoSelection(std::string repo, ClientConfig config, std::shared_ptr<Transport> transport);

    const std::string& name() const { return repo_; }

    VersionSelection latest() const;
    VersionSelection version(const std::string& tag) const;

    // Record of the client's install directory, whatever repository wrote it
    VersionRecordReadResult installed_version() const;

private:
    std::string repo_;
    ClientConfig config_;
    std::shared_ptr<Transport> transport_;
};

class Client {
public:
    // A null transport selects the libcurl transport
    explicit Client(ClientConfig config, std::shared_ptr<Transport> transport = nullptr);

    const ClientConfig& config() const { return config_; }
    Transport& transport() const { return *transport_; }

    RepoSelection repo(const std::string& name) const;

private:
    ClientConfig config_;
    std::shared_ptr<Transport> transport_;
};

// "<owner>/<name>" with both parts non-empty and no further separators
bool is_valid_repo_name(const std::string& repo);

} // namespace relfetch
