/**
 * relfetch CLI - Common utilities and types
 */

#pragma once

#include <relfetch/relfetch.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace relfetch::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string dir;                   // --dir
    uint32_t retry_count = 3;          // --retry-count
    uint64_t retry_delay = 3;          // --retry-delay (seconds)
    std::string proxy;                 // --proxy
    bool no_progress = false;          // --no-progress
    std::string api_base = DEFAULT_API_BASE;
    std::string download_base = DEFAULT_DOWNLOAD_BASE;
    bool json = false;                 // --json
    bool verbose = false;              // -v, --verbose
    bool quiet = false;                // -q, --quiet
    std::shared_ptr<Transport> transport;  // Null: libcurl
};

inline std::shared_ptr<Transport> make_transport(const GlobalOptions& opts) {
    if (opts.transport) {
        return opts.transport;
    }
    return make_curl_transport();
}

/**
 * Resolve the install directory.
 * Priority: --dir flag > RELFETCH_INSTALL_DIR env > current directory
 */
inline std::string resolve_install_dir(const std::string& override_dir) {
    if (!override_dir.empty()) {
        return override_dir;
    }

    auto env_dir = get_env("RELFETCH_INSTALL_DIR");
    if (env_dir && !env_dir->empty()) {
        return *env_dir;
    }

    return ".";
}

inline void configure_logging(const GlobalOptions& opts) {
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Build the client configuration from the global options.
 * The environment proxy is only consulted when --proxy is absent.
 */
inline ClientConfig make_client_config(const GlobalOptions& opts) {
    ClientBuilder builder = ClientBuilder::from_environment();
    builder.install_dir(resolve_install_dir(opts.dir))
        .retry_count(opts.retry_count)
        .retry_delay_secs(opts.retry_delay)
        .api_base(opts.api_base)
        .download_base(opts.download_base);

    if (!opts.proxy.empty()) {
        builder.proxy(opts.proxy);
    }
    // Progress lines would interleave with JSON output
    if (opts.no_progress || opts.json || opts.quiet) {
        builder.no_progress();
    }

    ClientConfig config = builder.build();
    spdlog::debug("install dir: {}", config.install_dir);
    spdlog::debug("retry: {} attempts, {} ms delay", config.retry.count,
                  static_cast<long long>(config.retry.delay.count()));
    if (!config.proxy.empty()) {
        spdlog::debug("proxy: {}", config.proxy);
    }
    return config;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const std::string& msg, ErrorKind kind, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        j["kind"] = error_kind_to_string(kind);
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

/**
 * Expand an asset name template for a release tag.
 *   {tag}      the tag verbatim
 *   {version}  the tag without a leading 'v'
 */
inline std::string expand_asset_template(const std::string& tmpl, const std::string& tag) {
    std::string version = tag;
    if (!version.empty() && (version[0] == 'v' || version[0] == 'V')) {
        version = version.substr(1);
    }

    std::string result;
    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl.compare(i, 5, "{tag}") == 0) {
            result += tag;
            i += 5;
        } else if (tmpl.compare(i, 9, "{version}") == 0) {
            result += version;
            i += 9;
        } else {
            result += tmpl[i];
            ++i;
        }
    }
    return result;
}

inline bool check_repo_name(const std::string& repo, bool json_mode) {
    if (!is_valid_repo_name(repo)) {
        print_error("invalid repository '" + repo + "', expected <owner>/<name>",
                    ErrorKind::InvalidArgument, json_mode);
        return false;
    }
    return true;
}

} // namespace relfetch::cli
