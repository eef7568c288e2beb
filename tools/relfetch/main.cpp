/**
 * relfetch CLI - Entry Point
 *
 * Fetch and install GitHub release assets.
 */

#include "commands.hpp"

int main(int argc, char** argv) {
    using namespace relfetch::cli;

    CLI::App app{"relfetch - GitHub release asset installer"};
    GlobalOptions opts;
    configure_app(app, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
