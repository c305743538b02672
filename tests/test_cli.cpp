/**
 * CLI Argument Tests
 */

#include "../include/util/cli.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace pipeview::util;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

bool parse(std::vector<std::string> words, CLIArgs& args, std::ostream& err) {
    words.insert(words.begin(), "pipeview");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data(), args, err);
}

TEST(test_no_arguments) {
    CLIArgs args;
    std::ostringstream err;
    ASSERT_TRUE(parse({}, args, err));
    ASSERT_FALSE(args.help);
    ASSERT_FALSE(args.version);
    ASSERT_FALSE(args.log);
    ASSERT_TRUE(args.config_path.empty());
    ASSERT_TRUE(err.str().empty());
}

TEST(test_short_and_long_flags) {
    CLIArgs a;
    std::ostringstream err;
    ASSERT_TRUE(parse({"-l", "-c", "cfg.json"}, a, err));
    ASSERT_TRUE(a.log);
    ASSERT_EQ(std::string("cfg.json"), a.config_path);

    CLIArgs b;
    ASSERT_TRUE(parse({"--log", "--config", "other.json", "--version", "--help"}, b, err));
    ASSERT_TRUE(b.log);
    ASSERT_TRUE(b.version);
    ASSERT_TRUE(b.help);
    ASSERT_EQ(std::string("other.json"), b.config_path);
}

TEST(test_unknown_option) {
    CLIArgs args;
    std::ostringstream err;
    ASSERT_FALSE(parse({"--colour"}, args, err));
    ASSERT_TRUE(err.str().find("Unknown option: --colour") != std::string::npos);
}

TEST(test_config_requires_value) {
    CLIArgs args;
    std::ostringstream err;
    ASSERT_FALSE(parse({"--config"}, args, err));
    ASSERT_TRUE(err.str().find("requires a file") != std::string::npos);
}

TEST(test_help_and_version_text) {
    std::ostringstream help;
    print_help(help);
    ASSERT_TRUE(help.str().find("--log") != std::string::npos);
    ASSERT_TRUE(help.str().find("jj") != std::string::npos);

    std::ostringstream version;
    print_version(version);
    ASSERT_EQ(std::string("pipeview ") + PIPEVIEW_VERSION + "\n", version.str());
}

int main() {
    std::cout << "=== CLI Tests ===\n";

    RUN_TEST(test_no_arguments);
    RUN_TEST(test_short_and_long_flags);
    RUN_TEST(test_unknown_option);
    RUN_TEST(test_config_requires_value);
    RUN_TEST(test_help_and_version_text);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
