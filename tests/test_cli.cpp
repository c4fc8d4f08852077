/**
 * Unit tests for the macroenv command
 */

#include <gtest/gtest.h>

#include "cli/cli.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace macroenv;
using macroenv::test::ScopedEnv;
using macroenv::test::TempDir;
using json = nlohmann::json;

namespace {

/**
 * Runs the command with in-memory streams
 */
class CliTest : public ::testing::Test {
protected:
    CliTest()
        : file_env_("MACROENV_FILE", std::nullopt)
        , mode_env_("MACROENV_PARSE_MODE", std::nullopt)
        , unquote_env_("MACROENV_UNQUOTE", std::nullopt) {}

    int run(std::vector<std::string> args, const std::string& terminal_input = "") {
        args.insert(args.begin(), "macroenv");
        std::vector<const char*> argv;
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }
        in_.str(terminal_input);
        in_.clear();
        out_.str("");
        err_.str("");
        return cli::run(static_cast<int>(argv.size()), argv.data(), in_, out_, err_);
    }

    std::string env_file(const std::string& content) {
        return dir_.write(".env", content).string();
    }

    TempDir dir_;
    ScopedEnv file_env_;
    ScopedEnv mode_env_;
    ScopedEnv unquote_env_;
    std::istringstream in_;
    std::ostringstream out_;
    std::ostringstream err_;
};

} // namespace

// =============================================================================
// Exit codes
// =============================================================================

TEST_F(CliTest, PrintsResolvedValue) {
    auto file = env_file("API_KEY=abc\n");

    EXPECT_EQ(run({"--source", "file", "--file", file, "API_KEY"}), cli::EXIT_RESOLVED);
    EXPECT_EQ(out_.str(), "abc\n");
}

TEST_F(CliTest, UnresolvedExitsWithOne) {
    auto file = env_file("OTHER=1\n");

    EXPECT_EQ(run({"-s", "file", "-f", file, "API_KEY"}), cli::EXIT_UNRESOLVED);
    EXPECT_EQ(out_.str(), "");
}

TEST_F(CliTest, PromptGoesToErrorStream) {
    auto file = env_file("OTHER=1\n");
    ScopedEnv env("MACROENV_TEST_CLI_TOKEN", std::nullopt);

    EXPECT_EQ(run({"-f", file, "MACROENV_TEST_CLI_TOKEN"}, "typed\n"), cli::EXIT_RESOLVED);
    EXPECT_EQ(out_.str(), "typed\n");
    EXPECT_NE(err_.str().find("MACROENV_TEST_CLI_TOKEN"), std::string::npos);
}

TEST_F(CliTest, StrictAndUnquoteFlags) {
    auto file = env_file("QUOTED=\"v\"\n");
    EXPECT_EQ(run({"-s", "file", "-f", file, "--unquote", "QUOTED"}), cli::EXIT_RESOLVED);
    EXPECT_EQ(out_.str(), "v\n");

    file = env_file("broken\nQUOTED=v\n");
    EXPECT_EQ(run({"-s", "file", "-f", file, "--strict", "QUOTED"}), cli::EXIT_UNRESOLVED);
}

TEST_F(CliTest, HelpExitsWithZero) {
    EXPECT_EQ(run({"--help"}), cli::EXIT_RESOLVED);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

// =============================================================================
// Usage errors
// =============================================================================

TEST_F(CliTest, MissingNameIsUsageError) {
    EXPECT_EQ(run({}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("Usage:"), std::string::npos);
}

TEST_F(CliTest, UnknownOptionIsUsageError) {
    EXPECT_EQ(run({"--bogus", "NAME"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("Unknown option: --bogus"), std::string::npos);
}

TEST_F(CliTest, ExtraArgumentIsUsageError) {
    EXPECT_EQ(run({"ONE", "TWO"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("Unexpected argument: TWO"), std::string::npos);
}

TEST_F(CliTest, UnknownSourceIsUsageError) {
    EXPECT_EQ(run({"--source", "dotenv", "NAME"}), cli::EXIT_USAGE);
    EXPECT_NE(err_.str().find("Unknown source: dotenv"), std::string::npos);
}

TEST_F(CliTest, SourceWithoutValueIsUsageError) {
    EXPECT_EQ(run({"--source"}), cli::EXIT_USAGE);
}

// =============================================================================
// JSON output
// =============================================================================

TEST_F(CliTest, JsonSuccess) {
    auto file = env_file("API_KEY=abc\n");

    EXPECT_EQ(run({"--json", "-s", "file", "-f", file, "API_KEY"}), cli::EXIT_RESOLVED);

    auto j = json::parse(out_.str());
    EXPECT_EQ(j["name"], "API_KEY");
    EXPECT_EQ(j["source"], "file");
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["value"], "abc");
    EXPECT_EQ(j["backend"], "file");
}

TEST_F(CliTest, JsonFailure) {
    EXPECT_EQ(run({"--json", "-s", "file", "-f", (dir_.path() / "missing.env").string(), "API_KEY"}),
              cli::EXIT_UNRESOLVED);

    auto j = json::parse(out_.str());
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error"], "read_error");
    ASSERT_EQ(j["failures"].size(), 1u);
    EXPECT_EQ(j["failures"][0]["backend"], "file");
}
