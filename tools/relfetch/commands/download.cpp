/**
 * relfetch CLI - download command
 *
 * Download the first latest-release asset matching a pattern. No version
 * record is written.
 */

#include "../commands.hpp"
#include <cstdlib>

namespace relfetch::cli::commands {

int cmd_download(const GlobalOptions& opts, const DownloadOptions& dl_opts) {
    if (!check_repo_name(dl_opts.repo, opts.json)) {
        return 1;
    }

    ClientConfig config = make_client_config(opts);
    std::string dest = dl_opts.dest.empty() ? config.install_dir : dl_opts.dest;
    auto transport = make_transport(opts);

    spdlog::debug("matching '{}' against latest assets of {}", dl_opts.pattern, dl_opts.repo);

    auto result = download_latest_asset(*transport, dl_opts.repo, dl_opts.pattern, dest, config);
    if (!result.ok) {
        print_error("error downloading asset: " + result.error, result.kind, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["repo"] = dl_opts.repo;
        j["asset"] = result.asset_name;
        j["tag"] = result.version;
        j["url"] = result.url;
        j["dest"] = dest;
        output_json(j);
    } else if (!opts.quiet) {
        print_success("Downloaded " + result.asset_name + " (" + result.version + ") to " + dest,
                      false);
    }
    return 0;
}

void setup_download(CLI::App* app, GlobalOptions& opts) {
    static DownloadOptions dl_opts;

    app->add_option("repo", dl_opts.repo, "Repository as <owner>/<name>")->required();
    app->add_option("-p,--pattern", dl_opts.pattern, "Regex matched against asset names")
        ->required();
    app->add_option("-d,--dest", dl_opts.dest, "Destination directory (default: install dir)");

    app->callback([&opts]() {
        std::exit(cmd_download(opts, dl_opts));
    });
}

} // namespace relfetch::cli::commands
