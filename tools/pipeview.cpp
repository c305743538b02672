/**
 * pipeview - live-filtering pager for piped input
 *
 * Usage:
 *   dmesg | pipeview            - page and filter dmesg output
 *   make 2>&1 | pipeview --log  - same, with a diagnostic log in $TMPDIR
 *
 * Type to filter, Backspace to edit, "jj" or Ctrl+C to quit.
 */

#include "../include/app/pager_app.hpp"
#include "../include/config/pager_config.hpp"
#include "../include/util/cli.hpp"

#include <exception>
#include <iostream>

using namespace pipeview;

int main(int argc, char* argv[]) {
    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args)) {
        return app::PagerApp::EXIT_USAGE;
    }
    if (args.help) {
        util::print_help();
        return app::PagerApp::EXIT_OK;
    }
    if (args.version) {
        util::print_version();
        return app::PagerApp::EXIT_OK;
    }

    config::PagerConfig cfg;
    if (!args.config_path.empty()) {
        try {
            cfg = config::ConfigLoader::load(args.config_path);
        } catch (const std::exception& e) {
            std::cerr << "pipeview: " << e.what() << "\n";
            return app::PagerApp::EXIT_USAGE;
        }
    }

    try {
        app::PagerApp pager(args, cfg);
        return pager.run();
    } catch (const std::exception& e) {
        std::cerr << "pipeview: " << e.what() << "\n";
        return app::PagerApp::EXIT_USAGE;
    } catch (...) {
        std::cerr << "pipeview: unknown error\n";
        return app::PagerApp::EXIT_USAGE;
    }
}
