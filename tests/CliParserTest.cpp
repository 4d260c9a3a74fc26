// =================================================================
// tests/CliParserTest.cpp
// =================================================================
// Unit tests for command-line parsing.

#include "Tally/CliParser.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

// Parses the given arguments as if they followed the program name.
Tally::Commands parseArgs(Tally::CliParser& parser, std::vector<std::string> args) {
    auto app = parser.setupCli();
    args.insert(args.begin(), "tally");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    app->parse(static_cast<int>(argv.size()), argv.data());
    return parser.getCommands();
}

} // namespace

class CliParserTest {
public:
    void testDefaults() {
        std::cout << "Testing defaults..." << std::endl;

        Tally::CliParser parser;
        auto commands = parseArgs(parser, {});

        assert(commands.path == ".");
        assert(commands.exclude_dirs.empty());
        assert(commands.include_extensions.empty());
        assert(commands.lang == "en");
        assert(commands.format == "text");
        assert(!commands.count_unknown);
        assert(!commands.verbose);

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testFullCommandLine() {
        std::cout << "Testing a full command line..." << std::endl;

        Tally::CliParser parser;
        auto commands = parseArgs(parser, {"project", "--lang", "chs", "--format", "json",
                                           "-e", "build", "dist", "-i", "PY", ".Cpp",
                                           "--count-unknown", "-v", "--log-file", "tally.log"});

        assert(commands.path == "project");
        assert(commands.lang == "chs");
        assert(commands.format == "json");
        assert((commands.exclude_dirs == std::vector<std::string>{"build", "dist"}));
        assert((commands.include_extensions == std::vector<std::string>{".py", ".cpp"}) &&
               "Include extensions are normalized");
        assert(commands.count_unknown);
        assert(commands.verbose);
        assert(commands.log_file == "tally.log");

        std::cout << "✓ Full command line test passed" << std::endl;
    }

    void testRejectsUnknownLanguage() {
        std::cout << "Testing invalid language..." << std::endl;

        Tally::CliParser parser;
        bool threw = false;
        try {
            parseArgs(parser, {"--lang", "fr"});
        } catch (const CLI::ParseError&) {
            threw = true;
        }
        assert(threw && "Unsupported languages must be rejected");

        std::cout << "✓ Invalid language test passed" << std::endl;
    }

    void testHelpExitsCleanly() {
        std::cout << "Testing --help..." << std::endl;

        Tally::CliParser parser;
        auto app = parser.setupCli();
        std::vector<std::string> args = {"tally", "--help"};
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }

        bool help = false;
        try {
            app->parse(static_cast<int>(argv.size()), argv.data());
        } catch (const CLI::CallForHelp& e) {
            help = true;
            assert(e.get_exit_code() == 0 && "--help exits with status 0");
        }
        assert(help);

        std::cout << "✓ --help test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CliParser unit tests..." << std::endl;

        testDefaults();
        testFullCommandLine();
        testRejectsUnknownLanguage();
        testHelpExitsCleanly();

        std::cout << "All CliParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        CliParserTest tests;
        tests.runAllTests();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
