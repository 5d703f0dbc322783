#pragma once

#include <cxg/cache_store.h>
#include <cxg/history_store.h>
#include <cxg/logging.h>
#include <cxg/performance_monitor.h>
#include <cxg/remote_tier.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cxg {

struct HistoryConfig {
  std::optional<std::filesystem::path> path;
  HistoryRetention retention;
};

struct GuardConfig {
  LogLevel log_level = LogLevel::kWarn;
  CacheOptions cache;
  MonitorOptions monitor;
  RemoteTierOptions remote;
  HistoryConfig history;
};

// Keys accepted inside `section`; the empty section lists the top level.
const std::vector<std::string> &SupportedConfigKeys(const std::string &section);

// Throws std::invalid_argument for unknown keys, mistyped values and values
// that fail ValidateGuardConfig.
GuardConfig ParseGuardConfig(const std::string &document);
GuardConfig LoadGuardConfig(const std::filesystem::path &path);

void ValidateGuardConfig(const GuardConfig &config);

} // namespace cxg
