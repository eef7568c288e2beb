/**
 * relfetch CLI - Command entry points
 */

#pragma once

#include "common.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace relfetch::cli {

// Registers the global options and every subcommand on app
void configure_app(CLI::App& app, GlobalOptions& opts);

namespace commands {

struct InstallOptions {
    std::string repo;
    std::string asset;
    std::string tag;
};

struct LatestOptions {
    std::string repo;
};

struct AssetsOptions {
    std::string repo;
};

struct DownloadOptions {
    std::string repo;
    std::string pattern;
    std::string dest;
};

struct ShowOptions {
    std::string repo;  // Optional expected repository
};

// Each returns the process exit code: 0 on success, 1 on failure
int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts);
int cmd_latest(const GlobalOptions& opts, const LatestOptions& latest_opts);
int cmd_assets(const GlobalOptions& opts, const AssetsOptions& assets_opts);
int cmd_download(const GlobalOptions& opts, const DownloadOptions& dl_opts);
int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts);

void setup_install(CLI::App* app, GlobalOptions& opts);
void setup_latest(CLI::App* app, GlobalOptions& opts);
void setup_assets(CLI::App* app, GlobalOptions& opts);
void setup_download(CLI::App* app, GlobalOptions& opts);
void setup_show(CLI::App* app, GlobalOptions& opts);

} // namespace commands

} // namespace relfetch::cli
