/**
 * relfetch CLI - assets command
 *
 * List the asset names of the latest release.
 */

#include "../commands.hpp"
#include <cstdlib>

namespace relfetch::cli::commands {

int cmd_assets(const GlobalOptions& opts, const AssetsOptions& assets_opts) {
    if (!check_repo_name(assets_opts.repo, opts.json)) {
        return 1;
    }

    ClientConfig config = make_client_config(opts);
    auto transport = make_transport(opts);

    auto result = list_latest_assets(*transport, assets_opts.repo, config);
    if (!result.ok) {
        print_error("error listing assets: " + result.error, result.kind, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["repo"] = assets_opts.repo;
        j["assets"] = result.names;
        output_json(j);
        return 0;
    }

    if (result.names.empty()) {
        spdlog::warn("latest release of {} has no assets", assets_opts.repo);
    }
    for (const auto& name : result.names) {
        std::cout << name << std::endl;
    }
    return 0;
}

void setup_assets(CLI::App* app, GlobalOptions& opts) {
    static AssetsOptions assets_opts;

    app->add_option("repo", assets_opts.repo, "Repository as <owner>/<name>")->required();

    app->callback([&opts]() {
        std::exit(cmd_assets(opts, assets_opts));
    });
}

} // namespace relfetch::cli::commands
