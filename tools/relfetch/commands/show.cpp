/**
 * relfetch CLI - show command
 *
 * Print the version record of the install directory.
 */

#include "../commands.hpp"
#include <cstdlib>

namespace relfetch::cli::commands {

int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts) {
    if (!show_opts.repo.empty() && !check_repo_name(show_opts.repo, opts.json)) {
        return 1;
    }

    std::string install_dir = resolve_install_dir(opts.dir);
    auto read = read_version_record(install_dir);
    if (!read.ok) {
        print_error(read.error, read.kind, opts.json);
        return 1;
    }

    if (!show_opts.repo.empty() && read.record.repo != show_opts.repo) {
        print_error("installed version is for a different repository: " + read.record.repo,
                    ErrorKind::RepoMismatch, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["install_dir"] = install_dir;
        j["repo"] = read.record.repo;
        j["tag"] = read.record.tag_name;
        output_json(j);
    } else {
        std::cout << read.record.repo << " " << read.record.tag_name << std::endl;
    }
    return 0;
}

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowOptions show_opts;

    app->add_option("repo", show_opts.repo, "Expected repository as <owner>/<name>");

    app->callback([&opts]() {
        std::exit(cmd_show(opts, show_opts));
    });
}

} // namespace relfetch::cli::commands
