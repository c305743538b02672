#pragma once

/**
 * CLI utilities for pipeview
 *
 * Provides command-line argument parsing and related utilities.
 */

#include "../version.hpp"

#include <iostream>
#include <string>

namespace pipeview {
namespace util {

/**
 * Command-line arguments for the pager.
 */
struct CLIArgs {
    bool help = false;
    bool version = false;
    bool log = false;            // Write diagnostics to a temp-dir log file
    std::string config_path;     // Empty = built-in defaults
};

/**
 * Print help message for the pager.
 */
inline void print_help(std::ostream& out = std::cout) {
    out << R"(
pipeview - live-filtering pager for piped input
===============================================

Usage: <command> | pipeview [options]
       pipeview [options] < file

Options:
  -l, --log              Write diagnostics to a log file in the temp directory
  -c, --config FILE      Load settings from a JSON config file
  -V, --version          Show version
  -h, --help             Show this help

Keys:
  <text>                 Filter lines containing the typed text
  Backspace              Delete the last filter character
  jj                     Quit
  Ctrl+C                 Quit

Examples:
  dmesg | pipeview
  tail -f /var/log/syslog | pipeview --log
)";
}

inline void print_version(std::ostream& out = std::cout) {
    out << "pipeview " << PIPEVIEW_VERSION << "\n";
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args, std::ostream& err = std::cerr) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--version" || arg == "-V") {
            args.version = true;
        }
        else if (arg == "--log" || arg == "-l") {
            args.log = true;
        }
        else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                err << "Option " << arg << " requires a file argument\n";
                return false;
            }
            args.config_path = argv[++i];
        }
        else {
            err << "Unknown option: " << arg << "\n";
            err << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

}  // namespace util
}  // namespace pipeview
