/**
 * relfetch CLI - install command
 *
 * Install a release asset into the install directory, upgrading a stale
 * install when tracking the latest release.
 */

#include "../commands.hpp"
#include <cstdlib>

namespace relfetch::cli::commands {

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    if (!check_repo_name(install_opts.repo, opts.json)) {
        return 1;
    }
    if (install_opts.asset.empty()) {
        print_error("asset name template is empty", ErrorKind::InvalidArgument, opts.json);
        return 1;
    }

    Client client(make_client_config(opts), opts.transport);
    auto repo = client.repo(install_opts.repo);
    auto selection = install_opts.tag.empty() ? repo.latest() : repo.version(install_opts.tag);

    std::string tmpl = install_opts.asset;
    spdlog::info("installing {} ({}) into {}", install_opts.repo,
                 install_opts.tag.empty() ? "latest" : install_opts.tag,
                 client.config().install_dir);

    auto result = selection.install([&tmpl](const std::string& tag) {
        std::string name = expand_asset_template(tmpl, tag);
        spdlog::debug("asset for {}: {}", tag, name);
        return name;
    });

    if (!result.ok) {
        print_error(result.error, result.kind, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["repo"] = install_opts.repo;
        j["action"] = install_action_to_string(result.action);
        j["tag"] = result.tag;
        j["install_dir"] = client.config().install_dir;
        if (!result.asset_name.empty()) {
            j["asset"] = result.asset_name;
        }
        output_json(j);
        return 0;
    }

    if (opts.quiet) {
        return 0;
    }

    switch (result.action) {
        case InstallAction::Installed:
            print_success("Installed " + install_opts.repo + " " + result.tag, false);
            break;
        case InstallAction::Upgraded:
            print_success("Upgraded " + install_opts.repo + " to " + result.tag, false);
            break;
        case InstallAction::UpToDate:
            print_success(install_opts.repo + " " + result.tag + " is up to date", false);
            break;
        case InstallAction::Skipped:
            print_success(install_opts.repo + " " + result.tag + " already installed", false);
            break;
        case InstallAction::None:
            break;
    }
    return 0;
}

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("repo", install_opts.repo, "Repository as <owner>/<name>")->required();
    app->add_option("-a,--asset", install_opts.asset,
                    "Asset name template, {tag} and {version} are expanded")->required();
    app->add_option("-t,--tag", install_opts.tag, "Pinned release tag (default: latest)");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace relfetch::cli::commands
