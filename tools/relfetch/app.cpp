/**
 * relfetch CLI - Application setup
 */

#include "commands.hpp"

namespace relfetch::cli {

void configure_app(CLI::App& app, GlobalOptions& opts) {
    app.set_version_flag("-V,--version", RELFETCH_VERSION);
    app.require_subcommand(0, 1);

    // Global options
    app.add_option("--dir", opts.dir, "Install directory (default: $RELFETCH_INSTALL_DIR or .)");
    app.add_option("--retry-count", opts.retry_count, "Latest-version lookup attempts")
        ->capture_default_str();
    app.add_option("--retry-delay", opts.retry_delay, "Seconds between lookup attempts")
        ->capture_default_str();
    app.add_option("--proxy", opts.proxy, "Proxy URL (default: $HTTP_PROXY or $HTTPS_PROXY)");
    app.add_flag("--no-progress", opts.no_progress, "Disable download progress");
    app.add_option("--api-base", opts.api_base, "GitHub API base URL")->capture_default_str();
    app.add_option("--download-base", opts.download_base, "Release download base URL")
        ->capture_default_str();
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    app.parse_complete_callback([&opts]() { configure_logging(opts); });

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Install or upgrade a release asset");
    commands::setup_install(install_cmd, opts);

    auto* latest_cmd = app.add_subcommand("latest", "Print the latest release tag");
    commands::setup_latest(latest_cmd, opts);

    auto* assets_cmd = app.add_subcommand("assets", "List assets of the latest release");
    commands::setup_assets(assets_cmd, opts);

    auto* download_cmd = app.add_subcommand("download", "Download the first matching latest asset");
    commands::setup_download(download_cmd, opts);

    auto* show_cmd = app.add_subcommand("show", "Show the installed version record");
    commands::setup_show(show_cmd, opts);
}

} // namespace relfetch::cli
