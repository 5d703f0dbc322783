#include <cxg/cli.h>

#include "test_support/temporary_directory.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace cxg {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StrEq;
using ::testing::ThrowsMessage;

TEST(ParseScanArgumentsTest, ParsesEveryOption) {
  const auto options = ParseScanArguments(
      {"--file", "a.js", "--file", "b.py", "--language", " TypeScript ",
       "--config", "cxg.yaml", "--history", "history.tsv", "--out", "reports",
       "--format", "markdown,JSON", "--format", "json", "--stats", "--debug"});

  ASSERT_EQ(options.files.size(), 2u);
  EXPECT_EQ(options.files[0].generic_string(), "a.js");
  EXPECT_EQ(options.files[1].generic_string(), "b.py");
  EXPECT_EQ(options.language, std::optional<std::string>("typescript"));
  EXPECT_EQ(options.config_file->generic_string(), "cxg.yaml");
  EXPECT_EQ(options.history_path->generic_string(), "history.tsv");
  EXPECT_EQ(options.output_directory->generic_string(), "reports");
  EXPECT_EQ(options.formats, (std::vector<std::string>{"markdown", "json"}));
  EXPECT_TRUE(options.show_stats);
  EXPECT_EQ(options.log_level, std::optional<LogLevel>(LogLevel::kDebug));
  EXPECT_FALSE(options.show_help);
}

TEST(ParseScanArgumentsTest, LogLevelFlags) {
  EXPECT_EQ(ParseScanArguments({"--verbose"}).log_level,
            std::optional<LogLevel>(LogLevel::kInfo));
  EXPECT_EQ(ParseScanArguments({"--log-level", "error"}).log_level,
            std::optional<LogLevel>(LogLevel::kError));
  EXPECT_FALSE(ParseScanArguments({}).log_level.has_value());
  EXPECT_THROW(ParseScanArguments({"--log-level", "loud"}),
               std::invalid_argument);
}

TEST(ParseScanArgumentsTest, HelpStopsParsing) {
  const auto options = ParseScanArguments({"-h", "--bogus"});

  EXPECT_TRUE(options.show_help);
}

TEST(ParseScanArgumentsTest, RejectsNonAsciiFormat) {
  EXPECT_THAT([] { ParseScanArguments({"--format", "JSON\xC3\x89"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("Unsupported format: json\xC3\x89")));
}

TEST(ParseScanArgumentsTest, ReportsInvalidArguments) {
  EXPECT_THAT([] { ParseScanArguments({"--bogus"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("Unknown argument: --bogus")));
  EXPECT_THAT([] { ParseScanArguments({"--format", "html"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("Unsupported format: html")));
  EXPECT_THAT([] { ParseScanArguments({"--file"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("--file requires a value")));
  EXPECT_THAT([] { ParseScanArguments({"--language", "  "}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("--language requires a value")));
}

TEST(ParseHistoryArgumentsTest, ParsesOptions) {
  const auto options = ParseHistoryArguments(
      {"--history", "history.tsv", "--config", "cxg.yaml", "--limit", "3"});

  EXPECT_EQ(options.history_path->generic_string(), "history.tsv");
  EXPECT_EQ(options.config_file->generic_string(), "cxg.yaml");
  EXPECT_EQ(options.limit, 3u);
  EXPECT_EQ(ParseHistoryArguments({}).limit, 10u);
}

TEST(ParseHistoryArgumentsTest, ReportsInvalidArguments) {
  EXPECT_THAT([] { ParseHistoryArguments({"--limit", "0"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("--limit requires a positive integer: 0")));
  EXPECT_THAT([] { ParseHistoryArguments({"--limit", "-2"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("--limit requires a positive integer: -2")));
  EXPECT_THAT([] { ParseHistoryArguments({"--file", "a.js"}); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("Unknown history argument: --file")));
}

TEST(MergeOptionsTest, CliOverridesConfig) {
  GuardConfig config;
  config.log_level = LogLevel::kError;
  config.history.path = "from-config.tsv";
  config.cache.max_entries = 7;

  ScanOptions cli;
  cli.log_level = LogLevel::kDebug;
  cli.history_path = "from-cli.tsv";

  const auto merged = MergeOptions(config, cli);

  EXPECT_EQ(merged.log_level, LogLevel::kDebug);
  EXPECT_EQ(merged.history.path->generic_string(), "from-cli.tsv");
  EXPECT_EQ(merged.cache.max_entries, 7u);
}

TEST(MergeOptionsTest, KeepsConfigWithoutOverrides) {
  GuardConfig config;
  config.log_level = LogLevel::kInfo;
  config.history.path = "from-config.tsv";

  const auto merged = MergeOptions(config, ScanOptions{});

  EXPECT_EQ(merged.log_level, LogLevel::kInfo);
  EXPECT_EQ(merged.history.path->generic_string(), "from-config.tsv");
}

TEST(InferLanguageTest, MapsExtensions) {
  EXPECT_EQ(InferLanguage("src/app.js"), "javascript");
  EXPECT_EQ(InferLanguage("src/app.MJS"), "javascript");
  EXPECT_EQ(InferLanguage("src/view.jsx"), "javascriptreact");
  EXPECT_EQ(InferLanguage("src/app.ts"), "typescript");
  EXPECT_EQ(InferLanguage("src/view.tsx"), "typescriptreact");
  EXPECT_EQ(InferLanguage("tool.py"), "python");
  EXPECT_EQ(InferLanguage("main.cc"), "cpp");
  EXPECT_EQ(InferLanguage("deploy.yml"), "yaml");
  EXPECT_EQ(InferLanguage(".env"), "dotenv");
  EXPECT_EQ(InferLanguage("prod.env"), "dotenv");
  EXPECT_EQ(InferLanguage("README"), "plaintext");
  EXPECT_EQ(InferLanguage("notes.txt"), "plaintext");
}

class RunScanTest : public ::testing::Test {
protected:
  test::TemporaryDirectory directory_;
};

TEST_F(RunScanTest, HighRiskSourceExitsWithThree) {
  const auto source = directory_.AddFile("config.js", "password: 'abc123'\n");
  std::ostringstream out;

  const auto exit_code = RunScan({"--file", source.string()}, out);

  EXPECT_EQ(exit_code, 3);
  EXPECT_THAT(out.str(), HasSubstr("# Context Guard Scan Report"));
  EXPECT_THAT(out.str(), HasSubstr("| Highest Risk | high |"));
  EXPECT_THAT(out.str(), HasSubstr("| high | modular | potential_secret |"));
  EXPECT_THAT(out.str(), HasSubstr("`pas***********123`"));
}

TEST_F(RunScanTest, CleanSourceExitsWithZero) {
  const auto source = directory_.AddFile("util.js", "export const one = 1;\n");
  std::ostringstream out;

  EXPECT_EQ(RunScan({"--file", source.string()}, out), 0);
  EXPECT_THAT(out.str(), HasSubstr("| Highest Risk | low |"));
}

TEST_F(RunScanTest, BusinessLogicInPlainTextExitsWithTwo) {
  const auto source =
      directory_.AddFile("notes.txt", "// proprietary ranking algorithm\n");
  std::ostringstream out;

  EXPECT_EQ(RunScan({"--file", source.string()}, out), 2);
  EXPECT_THAT(out.str(), HasSubstr("| medium | local-fallback |"));
}

TEST_F(RunScanTest, LanguageFlagOverridesInference) {
  const auto source = directory_.AddFile("config.txt", "password: 'abc123'\n");
  std::ostringstream out;

  EXPECT_EQ(RunScan({"--file", source.string(), "--language", "javascript"},
                    out),
            3);
  EXPECT_THAT(out.str(), HasSubstr("| high | modular |"));
}

TEST_F(RunScanTest, WritesReportsToOutputDirectory) {
  const auto first = directory_.AddFile("a.js", "password: 'abc123'\n");
  const auto second = directory_.AddFile("b.js", "export const b = 2;\n");
  const auto reports = directory_.root() / "reports";
  std::ostringstream out;

  const auto exit_code =
      RunScan({"--file", first.string(), "--file", second.string(), "--out",
               reports.string(), "--format", "markdown,json"},
              out);

  EXPECT_EQ(exit_code, 3);
  EXPECT_EQ(out.str(), "Scanned 2 source(s): 1 high, 0 medium, 1 low\n");
  EXPECT_THAT(directory_.ReadFile("reports/cxg_report.md"),
              HasSubstr("| Sources Scanned | 2 |"));
  EXPECT_THAT(directory_.ReadFile("reports/cxg_report.json"),
              HasSubstr("\"total\": 2,\"high\": 1"));
}

TEST_F(RunScanTest, JsonOnlyOutputSkipsMarkdown) {
  const auto source = directory_.AddFile("a.js", "export const a = 1;\n");
  std::ostringstream out;

  RunScan({"--file", source.string(), "--format", "json"}, out);

  EXPECT_THAT(out.str(), Not(HasSubstr("# Context Guard Scan Report")));
  EXPECT_THAT(out.str(), HasSubstr("\"highest_risk\": \"low\""));
}

TEST_F(RunScanTest, PrintsStatisticsOnRequest) {
  const auto source = directory_.AddFile("a.js", "export const a = 1;\n");
  std::ostringstream out;

  RunScan({"--file", source.string(), "--file", source.string(), "--stats"},
          out);

  EXPECT_THAT(out.str(), HasSubstr("# Orchestrator Statistics"));
  EXPECT_THAT(out.str(), HasSubstr("| Requests | 2 |"));
  EXPECT_THAT(out.str(), HasSubstr("| Cache Hits | 1 |"));
}

TEST_F(RunScanTest, PrintsUsageOnHelp) {
  std::ostringstream out;

  EXPECT_EQ(RunScan({"--help"}, out), 0);
  EXPECT_THAT(out.str(), HasSubstr("Usage: cxg scan --file <path>"));
}

TEST_F(RunScanTest, RequiresAFile) {
  std::ostringstream out;

  EXPECT_THAT([&] { RunScan({"--stats"}, out); },
              ThrowsMessage<std::invalid_argument>(
                  StrEq("--file is required")));
}

TEST_F(RunScanTest, ReportsUnreadableSource) {
  const auto missing = directory_.root() / "missing.js";
  std::ostringstream out;

  EXPECT_THAT([&] { RunScan({"--file", missing.string()}, out); },
              ThrowsMessage<std::runtime_error>(
                  HasSubstr("Failed to open source file: ")));
}

TEST_F(RunScanTest, ReportsMissingConfigFile) {
  const auto source = directory_.AddFile("a.js", "export const a = 1;\n");
  const auto config = directory_.root() / "absent.yaml";
  std::ostringstream out;

  EXPECT_THAT(
      [&] {
        RunScan({"--file", source.string(), "--config", config.string()}, out);
      },
      ThrowsMessage<std::runtime_error>(HasSubstr("Config file not found: ")));
}

TEST_F(RunScanTest, HistoryCommandShowsPersistedScans) {
  const auto first = directory_.AddFile("a.js", "password: 'abc123'\n");
  const auto second = directory_.AddFile("b.js", "export const b = 2;\n");
  const auto history = directory_.root() / "history.tsv";
  std::ostringstream scan_out;
  RunScan({"--file", first.string(), "--history", history.string()},
          scan_out);
  RunScan({"--file", second.string(), "--history", history.string()},
          scan_out);

  std::ostringstream out;
  EXPECT_EQ(RunHistory({"--history", history.string(), "--limit", "1"}, out),
            0);

  EXPECT_THAT(out.str(), HasSubstr("# Recent Scans"));
  EXPECT_THAT(out.str(), HasSubstr(second.string()));
  EXPECT_THAT(out.str(), Not(HasSubstr(first.string())));
  EXPECT_THAT(out.str(), HasSubstr("- Total: 2\n- High: 1\n"));
}

TEST_F(RunScanTest, HistoryPathCanComeFromConfig) {
  const auto source = directory_.AddFile("a.js", "export const a = 1;\n");
  const auto history = directory_.root() / "history.tsv";
  const auto config = directory_.AddFile(
      "cxg.yaml", "history:\n  path: " + history.generic_string() + "\n");
  std::ostringstream scan_out;
  RunScan({"--file", source.string(), "--config", config.string()}, scan_out);

  std::ostringstream out;
  RunHistory({"--config", config.string()}, out);

  EXPECT_THAT(out.str(), HasSubstr(source.string()));
  EXPECT_THAT(out.str(), HasSubstr("- Total: 1\n"));
}

TEST_F(RunScanTest, HistoryCommandRequiresAPath) {
  std::ostringstream out;

  EXPECT_THAT([&] { RunHistory({}, out); },
              ThrowsMessage<std::invalid_argument>(
                  HasSubstr("--history is required")));
}

TEST_F(RunScanTest, EmptyHistoryRendersPlaceholderRow) {
  std::ostringstream out;

  RunHistory({"--history", (directory_.root() / "none.tsv").string()}, out);

  EXPECT_THAT(out.str(), HasSubstr("| None | - | - | - | - |"));
  EXPECT_THAT(out.str(), HasSubstr("- Total: 0\n"));
}

} // namespace
} // namespace cxg
