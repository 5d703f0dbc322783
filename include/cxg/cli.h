#pragma once

#include <cxg/guard_config.h>
#include <cxg/logging.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cxg {

struct ScanOptions {
  std::vector<std::filesystem::path> files;
  std::optional<std::string> language;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> history_path;
  std::optional<std::filesystem::path> output_directory;
  std::vector<std::string> formats;
  std::optional<LogLevel> log_level;
  bool show_stats = false;
  bool show_help = false;
};

struct HistoryOptions {
  std::optional<std::filesystem::path> history_path;
  std::optional<std::filesystem::path> config_file;
  std::size_t limit = 10;
  bool show_help = false;
};

ScanOptions ParseScanArguments(const std::vector<std::string> &arguments);
HistoryOptions
ParseHistoryArguments(const std::vector<std::string> &arguments);

// Applies command line overrides on top of the file configuration.
GuardConfig MergeOptions(const GuardConfig &config_options,
                         const ScanOptions &cli_options);

// Language tag for a source path, derived from its extension. Unknown
// extensions map to "plaintext", which only the heuristic tier handles.
std::string InferLanguage(const std::filesystem::path &path);

int RunScan(const std::vector<std::string> &arguments, std::ostream &out);
int RunHistory(const std::vector<std::string> &arguments, std::ostream &out);

} // namespace cxg
