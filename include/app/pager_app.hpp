#pragma once

#include "../config/pager_config.hpp"
#include "../util/cli.hpp"

#include <utility>

namespace pipeview {
namespace app {

/**
 * PagerApp - wires the producers, the controller and the terminal together
 *
 * run() checks stdin, opens /dev/tty, optionally starts the log file, then
 * hands control to the controller until it terminates.
 *
 * Exit codes:
 *   0  quit sequence or interrupt
 *   1  usage error (interactive stdin, no /dev/tty, log file) or runtime fault
 */
class PagerApp {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_USAGE = 1;

    PagerApp(util::CLIArgs args, config::PagerConfig config)
        : args_(std::move(args)), config_(std::move(config)) {}

    int run();

private:
    util::CLIArgs args_;
    config::PagerConfig config_;
};

}  // namespace app
}  // namespace pipeview
