#include <cxg/analysis_orchestrator_builder.h>
#include <cxg/cli.h>
#include <cxg/cli_exit_codes.h>
#include <cxg/history_store.h>
#include <cxg/markdown_reporter.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

namespace {

using cxg::HistoryOptions;
using cxg::ScanOptions;

void PrintScanUsage(std::ostream &out) {
  out << "Usage: cxg scan --file <path> [options]\n"
      << "Options:\n"
      << "  --file <path>         Source file to analyze (repeatable)\n"
      << "  --language <tag>      Language tag for every file (default: "
         "inferred\n"
      << "                        from the file extension)\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --history <path>      Scan history file to append to\n"
      << "  --format <list>       Comma-separated list of output formats\n"
      << "                        (supported: markdown,json)\n"
      << "  --out <path>          Directory for report outputs (default: "
         "print to\n"
      << "                        standard output)\n"
      << "  --stats               Print cache and performance statistics\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n"
      << "Exit codes: 0 low risk, 2 medium risk, 3 high risk, 1 error.\n";
}

void PrintHistoryUsage(std::ostream &out) {
  out << "Usage: cxg history [options]\n"
      << "Options:\n"
      << "  --history <path>  Scan history file (or history.path in config)\n"
      << "  --config <file>   Optional YAML config file\n"
      << "  --limit <n>       Number of recent scans to show (default: 10)\n"
      << "  --help            Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitFormats(const std::string &raw_formats) {
  std::vector<std::string> values;
  std::string current;
  for (const unsigned char character : raw_formats) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(static_cast<char>(std::tolower(character)));
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitFormats(raw_formats)) {
    format = Trim(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

std::size_t ParseLimit(const std::string &value) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw std::invalid_argument("--limit requires a positive integer: " +
                                value);
  }
  const auto limit = std::stoul(trimmed);
  if (limit == 0) {
    throw std::invalid_argument("--limit requires a positive integer: " +
                                value);
  }
  return limit;
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, ScanOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        cxg::ParseLogLevel(RequireValue(arguments, index, "--log-level"));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = cxg::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = cxg::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool DispatchScanOption(const std::vector<std::string> &arguments,
                        std::size_t &index, ScanOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--file") {
    options.files.emplace_back(RequireValue(arguments, index, "--file"));
    return true;
  }
  if (argument == "--language") {
    const auto language =
        ToLower(Trim(RequireValue(arguments, index, "--language")));
    if (language.empty()) {
      throw std::invalid_argument("--language requires a value");
    }
    options.language = language;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--history") {
    options.history_path = RequireValue(arguments, index, "--history");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  if (argument == "--stats") {
    options.show_stats = true;
    return true;
  }
  return HandleLoggingOption(arguments, index, options);
}

void ValidateScanOptions(const ScanOptions &options) {
  if (options.files.empty()) {
    throw std::invalid_argument("--file is required");
  }
}

std::string ReadSourceFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Failed to open source file: " + path.string());
  }
  return std::string(std::istreambuf_iterator<char>(stream),
                     std::istreambuf_iterator<char>());
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &root, const cxg::Report &report) {
  std::filesystem::create_directories(root);
  WriteFileIfContent(root / "cxg_report.md", report.markdown);
  WriteFileIfContent(root / "cxg_report.json", report.json);
}

cxg::GuardConfig LoadConfigIfPresent(
    const std::optional<std::filesystem::path> &config_file) {
  if (!config_file) {
    return {};
  }
  return cxg::LoadGuardConfig(*config_file);
}

void PrintStats(std::ostream &out, cxg::AnalysisOrchestrator &orchestrator) {
  const auto stats = orchestrator.Stats();
  const auto cache = orchestrator.GetCacheStats();
  out << "# Orchestrator Statistics\n\n"
      << "| Field | Value |\n"
      << "| --- | --- |\n"
      << "| Requests | " << stats.requests << " |\n"
      << "| Cache Hits | " << stats.cache_hits << " |\n"
      << "| Coalesced | " << stats.coalesced << " |\n"
      << "| Computed | " << stats.computed << " |\n"
      << "| Modular Answers | " << stats.modular_answers << " |\n"
      << "| Remote Answers | " << stats.remote_answers << " |\n"
      << "| Fallback Answers | " << stats.fallback_answers << " |\n"
      << "| Tier Failures | " << stats.tier_failures << " |\n"
      << "| Cache Entries | " << cache.total_entries << " |\n"
      << "| Cache Size (bytes) | " << cache.total_size << " |\n"
      << "| Cache Evictions | " << cache.eviction_count << " |\n\n";
  out << orchestrator.Monitor().GenerateReport() << "\n";
}

} // namespace

namespace cxg {

ScanOptions ParseScanArguments(const std::vector<std::string> &arguments) {
  ScanOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchScanOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

HistoryOptions
ParseHistoryArguments(const std::vector<std::string> &arguments) {
  HistoryOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--history") {
      options.history_path = RequireValue(arguments, i, "--history");
      continue;
    }
    if (argument == "--config") {
      options.config_file = RequireValue(arguments, i, "--config");
      continue;
    }
    if (argument == "--limit") {
      options.limit = ParseLimit(RequireValue(arguments, i, "--limit"));
      continue;
    }
    throw std::invalid_argument("Unknown history argument: " + argument);
  }
  return options;
}

GuardConfig MergeOptions(const GuardConfig &config_options,
                         const ScanOptions &cli_options) {
  GuardConfig merged = config_options;
  if (cli_options.log_level) {
    merged.log_level = *cli_options.log_level;
  }
  if (cli_options.history_path) {
    merged.history.path = cli_options.history_path;
  }
  return merged;
}

std::string InferLanguage(const std::filesystem::path &path) {
  static const std::unordered_map<std::string, std::string> languages = {
      {".js", "javascript"},       {".mjs", "javascript"},
      {".cjs", "javascript"},      {".jsx", "javascriptreact"},
      {".ts", "typescript"},       {".mts", "typescript"},
      {".tsx", "typescriptreact"}, {".py", "python"},
      {".java", "java"},           {".go", "go"},
      {".rb", "ruby"},             {".cpp", "cpp"},
      {".cc", "cpp"},              {".h", "cpp"},
      {".hpp", "cpp"},             {".json", "json"},
      {".yml", "yaml"},            {".yaml", "yaml"},
      {".env", "dotenv"}};
  const auto extension = ToLower(path.extension().string());
  if (const auto found = languages.find(extension); found != languages.end()) {
    return found->second;
  }
  if (ToLower(path.filename().string()) == ".env") {
    return "dotenv";
  }
  return "plaintext";
}

int RunScan(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto cli_options = ParseScanArguments(arguments);
  if (cli_options.show_help) {
    PrintScanUsage(out);
    return 0;
  }
  ValidateScanOptions(cli_options);

  const auto config =
      MergeOptions(LoadConfigIfPresent(cli_options.config_file), cli_options);
  ValidateGuardConfig(config);

  LoggingConfig logging;
  logging.level = config.log_level;
  auto logger = MakeLogger(logging, std::clog);

  AnalysisOrchestratorBuilder builder;
  builder.WithConfig(config).WithLogger(logger);
  auto orchestrator = builder.Build();

  std::vector<AnalysisResult> results;
  results.reserve(cli_options.files.size());
  for (const auto &file : cli_options.files) {
    const auto language = cli_options.language.value_or(InferLanguage(file));
    const auto result = orchestrator.AnalyzeCode(ReadSourceFile(file),
                                                 language, file.string());
    results.push_back(*result);
  }
  orchestrator.FlushHistory();

  const MarkdownReporter reporter;
  const auto report = reporter.Render(results, cli_options.formats,
                                      std::chrono::system_clock::now());
  if (cli_options.output_directory) {
    WriteReports(*cli_options.output_directory, report);
    const auto summary = Summarize(results);
    out << "Scanned " << summary.total << " source(s): " << summary.high
        << " high, " << summary.medium << " medium, " << summary.low
        << " low\n";
  } else {
    out << report.markdown;
    if (!report.json.empty()) {
      out << report.json << "\n";
    }
  }

  if (cli_options.show_stats) {
    PrintStats(out, orchestrator);
  }
  return RiskExitCode(results);
}

int RunHistory(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseHistoryArguments(arguments);
  if (options.show_help) {
    PrintHistoryUsage(out);
    return 0;
  }

  auto config = LoadConfigIfPresent(options.config_file);
  if (options.history_path) {
    config.history.path = options.history_path;
  }
  if (!config.history.path) {
    throw std::invalid_argument(
        "--history is required (or set history.path in config file)");
  }

  LoggingConfig logging;
  logging.level = config.log_level;
  FileHistoryStore store(*config.history.path, config.history.retention,
                         MakeLogger(logging, std::clog));
  const auto entries = store.Load();
  const auto keep = std::min(options.limit, entries.size());
  const std::vector<AnalysisResult> recent(
      entries.end() - static_cast<std::ptrdiff_t>(keep), entries.end());

  const MarkdownReporter reporter;
  out << reporter.RenderHistory(recent, Summarize(entries));
  return 0;
}

} // namespace cxg
