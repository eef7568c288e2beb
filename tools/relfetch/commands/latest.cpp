/**
 * relfetch CLI - latest command
 */

#include "../commands.hpp"
#include <cstdlib>

namespace relfetch::cli::commands {

int cmd_latest(const GlobalOptions& opts, const LatestOptions& latest_opts) {
    if (!check_repo_name(latest_opts.repo, opts.json)) {
        return 1;
    }

    ClientConfig config = make_client_config(opts);
    auto transport = make_transport(opts);

    auto result = resolve_latest(*transport, latest_opts.repo, config);
    if (!result.ok) {
        print_error("error getting latest version: " + result.error, result.kind, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["repo"] = latest_opts.repo;
        j["tag"] = result.tag;
        output_json(j);
    } else {
        std::cout << result.tag << std::endl;
    }
    return 0;
}

void setup_latest(CLI::App* app, GlobalOptions& opts) {
    static LatestOptions latest_opts;

    app->add_option("repo", latest_opts.repo, "Repository as <owner>/<name>")->required();

    app->callback([&opts]() {
        std::exit(cmd_latest(opts, latest_opts));
    });
}

} // namespace relfetch::cli::commands
