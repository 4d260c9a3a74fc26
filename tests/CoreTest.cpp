// =================================================================
// tests/CoreTest.cpp
// =================================================================
// End-to-end tests: scan, aggregate and report through Core.

#include "Tally/Core.hpp"
#include "Tally/Logger.hpp"
#include <nlohmann/json.hpp>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

class CoreTest {
private:
    std::string test_dir;

    void writeFile(const std::string& relative, const std::string& content) {
        fs::path path = fs::path(test_dir) / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    Tally::Commands baseCommands() const {
        Tally::Commands commands;
        commands.path = test_dir;
        commands.format = "json";
        return commands;
    }

    static nlohmann::json runJson(const Tally::Commands& commands, int& exit_code) {
        std::ostringstream out;
        Tally::Core core(commands, out);
        exit_code = core.run();
        if (out.str().empty()) {
            return nlohmann::json();
        }
        return nlohmann::json::parse(out.str());
    }

public:
    CoreTest() : test_dir("test_core") {}

    void testEndToEndJson() {
        std::cout << "Testing end-to-end JSON report..." << std::endl;

        cleanupTestFiles();
        writeFile("app/main.cpp", "/* start\nstill comment\nend */\ncode();\n");
        writeFile("app/tool.py", "# comment\ncode()\n");
        writeFile("app/notes.md", "line1\n\nline2\n");

        int exit_code = -1;
        auto json = runJson(baseCommands(), exit_code);

        assert(exit_code == 0);
        assert(json["extensions"].size() == 2 && "Unknown .md files are skipped by default");
        assert(json["total"]["files"] == 2);
        assert(json["total"]["total_lines"] == 6);
        assert(json["total"]["comment_lines"] == 4);
        assert(json["total"]["code_lines"] == 2);
        assert(json["skipped"].empty());

        cleanupTestFiles();
        std::cout << "✓ End-to-end JSON test passed" << std::endl;
    }

    void testExcludedOnlyTree() {
        std::cout << "Testing a tree holding only an excluded directory..." << std::endl;

        cleanupTestFiles();
        writeFile("third_party/lib.c", "int lib;\n");

        Tally::Commands commands = baseCommands();
        commands.exclude_dirs = {"third_party"};

        int exit_code = -1;
        auto json = runJson(commands, exit_code);

        assert(exit_code == 0);
        assert(json["extensions"].empty());
        assert(json["total"]["files"] == 0);
        assert(json["total"]["total_lines"] == 0);
        assert(json["total"]["code_ratio"].get<double>() == 0.0);

        cleanupTestFiles();
        std::cout << "✓ Excluded-only tree test passed" << std::endl;
    }

    void testSkippedFileStillSucceeds() {
        std::cout << "Testing a scan with an unreadable file..." << std::endl;

        cleanupTestFiles();
        writeFile("a.c", "int a;\n");
        writeFile("b.c", "int b;\n");
        writeFile("c.c", "int c;\n");
        writeFile("d.c", std::string("\0\0\0\0", 4));

        int exit_code = -1;
        auto json = runJson(baseCommands(), exit_code);

        assert(exit_code == 0 && "Per-file failures are not fatal");
        assert(json["skipped"].size() == 1);
        assert(json["total"]["files"] == 3);
        assert(json["total"]["code_lines"] == 3);

        cleanupTestFiles();
        std::cout << "✓ Unreadable file scan test passed" << std::endl;
    }

    void testLocalizedTextReport() {
        std::cout << "Testing localized text output..." << std::endl;

        cleanupTestFiles();
        writeFile("x.go", "package main\n");

        Tally::Commands commands = baseCommands();
        commands.format = "text";
        commands.lang = "cht";

        std::ostringstream out;
        Tally::Core core(commands, out);
        assert(core.run() == 0);
        assert(out.str().find("程式碼行數統計結果") != std::string::npos);
        assert(out.str().find(".go (Go):") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Localized text output test passed" << std::endl;
    }

    void testRulesFile() {
        std::cout << "Testing custom rules file..." << std::endl;

        cleanupTestFiles();
        writeFile("src/script.zz", "; note\nvalue\n");
        writeFile("rules.yaml",
                  "languages:\n"
                  "  Zed:\n"
                  "    extensions: .zz\n"
                  "    line_comment: \";\"\n");

        Tally::Commands commands = baseCommands();
        commands.rules_file = test_dir + "/rules.yaml";

        int exit_code = -1;
        auto json = runJson(commands, exit_code);

        assert(exit_code == 0);
        assert(json["extensions"].size() == 2 && "rules.yaml itself is counted as YAML");
        bool found = false;
        for (const auto& group : json["extensions"]) {
            if (group["extension"] == ".zz") {
                found = true;
                assert(group["language"] == "Zed");
                assert(group["comment_lines"] == 1);
                assert(group["code_lines"] == 1);
            }
        }
        assert(found);

        cleanupTestFiles();
        std::cout << "✓ Custom rules file test passed" << std::endl;
    }

    void testFatalErrors() {
        std::cout << "Testing fatal errors..." << std::endl;

        cleanupTestFiles();

        int exit_code = -1;
        runJson(baseCommands(), exit_code);
        assert(exit_code != 0 && "Missing root must fail the run");

        fs::create_directories(test_dir);
        Tally::Commands commands = baseCommands();
        commands.rules_file = test_dir + "/missing.yml";
        runJson(commands, exit_code);
        assert(exit_code != 0 && "Missing rules file must fail the run");

        cleanupTestFiles();
        std::cout << "✓ Fatal errors test passed" << std::endl;
    }

    void testVerboseAndLogFile() {
        std::cout << "Testing verbosity and log file..." << std::endl;

        cleanupTestFiles();
        writeFile("one.c", "int one;\n");
        const std::string log_path = "test_core.log";
        fs::remove(log_path);

        Tally::Commands commands = baseCommands();
        commands.log_file = log_path;

        int exit_code = -1;
        runJson(commands, exit_code);
        assert(exit_code == 0);
        assert(Tally::Logger::getInstance().consoleLogLevel() == Tally::LogLevel::WARNING);
        assert(Tally::Logger::getInstance().logFilename() == log_path);

        commands.verbose = true;
        runJson(commands, exit_code);
        assert(exit_code == 0);
        assert(Tally::Logger::getInstance().consoleLogLevel() == Tally::LogLevel::DEBUG &&
               "--verbose lowers the console level to debug");

        std::ifstream log(log_path);
        std::stringstream content;
        content << log.rdbuf();
        assert(content.str().find("[INFO] Session: Session started") != std::string::npos);
        assert(content.str().find("[DEBUG] Core: Scanning") != std::string::npos &&
               "The log file receives every level");

        Tally::Logger::getInstance().initialize(Tally::LogLevel::WARNING);
        assert(Tally::Logger::getInstance().logFilename().empty());

        fs::remove(log_path);
        cleanupTestFiles();
        std::cout << "✓ Verbosity and log file test passed" << std::endl;
    }

    void testBuildScanConfig() {
        std::cout << "Testing scan configuration..." << std::endl;

        Tally::Commands commands;
        commands.path = "somewhere";
        commands.include_extensions = {"PY"};
        commands.lang = "ja";

        Tally::Core core(commands);
        auto config = core.buildScanConfig();
        assert(config.root_path == "somewhere");
        assert(config.include_extensions.count(".py") == 1);
        assert(config.exclude_dir_names == Tally::ScanConfig::defaultExcludedDirs());
        assert(config.language == Tally::ReportLanguage::Ja);

        commands.exclude_dirs = {"out"};
        auto custom = Tally::Core(commands).buildScanConfig();
        assert(custom.exclude_dir_names.size() == 1 && custom.exclude_dir_names.count("out") == 1);

        std::cout << "✓ Scan configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Core integration tests..." << std::endl;

        testEndToEndJson();
        testExcludedOnlyTree();
        testSkippedFileStillSucceeds();
        testLocalizedTextReport();
        testRulesFile();
        testFatalErrors();
        testVerboseAndLogFile();
        testBuildScanConfig();

        std::cout << "All Core tests passed!" << std::endl;
    }
};

int main() {
    try {
        CoreTest tests;
        tests.runAllTests();

        Tally::Logger::getInstance().flush();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
