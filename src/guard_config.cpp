#include <cxg/guard_config.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

namespace {

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

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  return key;
}

std::string QualifiedName(const std::string &section, const std::string &key) {
  return section.empty() ? key : section + "." + key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &section,
                                  const std::string &key) {
  std::string message = "Unknown config key: " + QualifiedName(section, key) +
                        ". Supported keys: ";
  const auto &supported = cxg::SupportedConfigKeys(section);
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &section,
                                    const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = cxg::SupportedConfigKeys(section);
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(section, key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string value");
  }
  return node.as<std::string>();
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  const auto value = ToLower(Trim(ExtractStringScalar(node, key_name)));
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a boolean or boolean-like string");
}

long long ExtractInteger(const YAML::Node &node, const std::string &key_name) {
  const auto text = Trim(ExtractStringScalar(node, key_name));
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::logic_error &) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != text.size()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be an integer, got '" + text + "'");
  }
  return value;
}

// Durations are capped at ten years so later conversions cannot overflow.
constexpr long long kMaxDurationDays = 10LL * 365;
constexpr long long kMaxDurationSeconds = kMaxDurationDays * 24 * 60 * 60;
constexpr long long kMaxDurationMilliseconds = kMaxDurationSeconds * 1000;

long long ExtractBoundedInteger(const YAML::Node &node,
                                const std::string &key_name, long long limit) {
  const auto value = ExtractInteger(node, key_name);
  if (value > limit || value < -limit) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' is out of range, got " +
                                std::to_string(value) + " (limit " +
                                std::to_string(limit) + ")");
  }
  return value;
}

std::size_t ExtractCount(const YAML::Node &node, const std::string &key_name) {
  const auto value = ExtractInteger(node, key_name);
  if (value < 0) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must not be negative");
  }
  return static_cast<std::size_t>(value);
}

double ExtractNumber(const YAML::Node &node, const std::string &key_name) {
  const auto text = Trim(ExtractStringScalar(node, key_name));
  std::size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::logic_error &) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != text.size()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a number, got '" + text + "'");
  }
  return value;
}

void ApplyCacheEntry(const std::string &key, const YAML::Node &node,
                     cxg::CacheOptions &cache) {
  const auto name = QualifiedName("cache", key);
  if (key == "max_size_bytes") {
    cache.max_size_bytes = ExtractCount(node, name);
  } else if (key == "max_entries") {
    cache.max_entries = ExtractCount(node, name);
  } else if (key == "ttl_seconds") {
    cache.default_ttl = std::chrono::seconds(
        ExtractBoundedInteger(node, name, kMaxDurationSeconds));
  } else if (key == "cleanup_interval_seconds") {
    cache.cleanup_interval = std::chrono::seconds(
        ExtractBoundedInteger(node, name, kMaxDurationSeconds));
  } else if (key == "hit_weight") {
    cache.hit_weight = ExtractNumber(node, name);
  } else if (key == "recency_weight") {
    cache.recency_weight = ExtractNumber(node, name);
  }
}

void ApplyMonitorEntry(const std::string &key, const YAML::Node &node,
                       cxg::MonitorOptions &monitor) {
  const auto name = QualifiedName("monitor", key);
  if (key == "max_measurements") {
    monitor.max_measurements = ExtractCount(node, name);
  } else if (key == "slow_operation_ms") {
    monitor.thresholds.slow_operation =
        cxg::Milliseconds(ExtractNumber(node, name));
  } else if (key == "high_memory_bytes") {
    monitor.thresholds.high_memory_bytes = ExtractCount(node, name);
  } else if (key == "error_rate") {
    monitor.thresholds.error_rate = ExtractNumber(node, name);
  } else if (key == "memory_tracking") {
    monitor.enable_memory_tracking = ExtractBool(node, name);
  } else if (key == "trend_analysis") {
    monitor.enable_trend_analysis = ExtractBool(node, name);
  } else if (key == "cleanup_interval_seconds") {
    monitor.cleanup_interval = std::chrono::seconds(
        ExtractBoundedInteger(node, name, kMaxDurationSeconds));
  }
}

void ApplyRemoteEntry(const std::string &key, const YAML::Node &node,
                      cxg::RemoteTierOptions &remote) {
  const auto name = QualifiedName("remote", key);
  if (key == "enabled") {
    remote.enabled = ExtractBool(node, name);
  } else if (key == "probe_interval_seconds") {
    remote.breaker.probe_interval = std::chrono::seconds(
        ExtractBoundedInteger(node, name, kMaxDurationSeconds));
  } else if (key == "probe_timeout_ms") {
    remote.breaker.probe_timeout = std::chrono::milliseconds(
        ExtractBoundedInteger(node, name, kMaxDurationMilliseconds));
  }
}

void ApplyHistoryEntry(const std::string &key, const YAML::Node &node,
                       cxg::HistoryConfig &history) {
  const auto name = QualifiedName("history", key);
  if (key == "path") {
    history.path = ExtractStringScalar(node, name);
  } else if (key == "capacity") {
    history.retention.capacity = ExtractCount(node, name);
  } else if (key == "max_age_days") {
    history.retention.max_age = std::chrono::hours(
        24 * ExtractBoundedInteger(node, name, kMaxDurationDays));
  }
}

template <typename Apply>
void ApplySection(const std::string &section, const YAML::Node &node,
                  Apply apply) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + section +
                                "' must be a mapping");
  }
  for (const auto &entry : node) {
    const auto key =
        NormalizeAndValidateKey(section, entry.first.as<std::string>());
    apply(key, entry.second);
  }
}

cxg::GuardConfig FromYaml(const YAML::Node &root) {
  cxg::GuardConfig config;
  if (!root || root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey("", entry.first.as<std::string>());
    const auto &node = entry.second;
    if (key == "log_level") {
      config.log_level = cxg::ParseLogLevel(ExtractStringScalar(node, key));
    } else if (key == "cache") {
      ApplySection(key, node,
                   [&](const std::string &name, const YAML::Node &value) {
                     ApplyCacheEntry(name, value, config.cache);
                   });
    } else if (key == "monitor") {
      ApplySection(key, node,
                   [&](const std::string &name, const YAML::Node &value) {
                     ApplyMonitorEntry(name, value, config.monitor);
                   });
    } else if (key == "remote") {
      ApplySection(key, node,
                   [&](const std::string &name, const YAML::Node &value) {
                     ApplyRemoteEntry(name, value, config.remote);
                   });
    } else if (key == "history") {
      ApplySection(key, node,
                   [&](const std::string &name, const YAML::Node &value) {
                     ApplyHistoryEntry(name, value, config.history);
                   });
    }
  }
  cxg::ValidateGuardConfig(config);
  return config;
}

} // namespace

namespace cxg {

const std::vector<std::string> &SupportedConfigKeys(const std::string &section) {
  static const std::map<std::string, std::vector<std::string>> keys = {
      {"", {"log_level", "cache", "monitor", "remote", "history"}},
      {"cache",
       {"max_size_bytes", "max_entries", "ttl_seconds",
        "cleanup_interval_seconds", "hit_weight", "recency_weight"}},
      {"monitor",
       {"max_measurements", "slow_operation_ms", "high_memory_bytes",
        "error_rate", "memory_tracking", "trend_analysis",
        "cleanup_interval_seconds"}},
      {"remote", {"enabled", "probe_interval_seconds", "probe_timeout_ms"}},
      {"history", {"path", "capacity", "max_age_days"}}};
  const auto found = keys.find(section);
  if (found == keys.end()) {
    throw std::invalid_argument("Unknown config section: " + section);
  }
  return found->second;
}

GuardConfig ParseGuardConfig(const std::string &document) {
  try {
    return FromYaml(YAML::Load(document));
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument(std::string("Invalid config: ") + error.what());
  }
}

GuardConfig LoadGuardConfig(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  try {
    return FromYaml(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception &error) {
    throw std::invalid_argument("Invalid config file " + path.string() + ": " +
                                error.what());
  }
}

void ValidateGuardConfig(const GuardConfig &config) {
  ValidateCacheOptions(config.cache);

  const auto &monitor = config.monitor;
  if (monitor.max_measurements == 0) {
    throw std::invalid_argument("monitor.max_measurements must be positive");
  }
  if (monitor.thresholds.slow_operation.count() <= 0) {
    throw std::invalid_argument("monitor.slow_operation_ms must be positive");
  }
  if (monitor.thresholds.error_rate < 0.0 ||
      monitor.thresholds.error_rate > 1.0) {
    throw std::invalid_argument("monitor.error_rate must be within [0, 1]");
  }
  if (monitor.cleanup_interval.count() <= 0) {
    throw std::invalid_argument(
        "monitor.cleanup_interval_seconds must be positive");
  }

  if (config.remote.breaker.probe_interval.count() <= 0) {
    throw std::invalid_argument(
        "remote.probe_interval_seconds must be positive");
  }
  if (config.remote.breaker.probe_timeout.count() <= 0) {
    throw std::invalid_argument("remote.probe_timeout_ms must be positive");
  }

  if (config.history.retention.capacity == 0) {
    throw std::invalid_argument("history.capacity must be positive");
  }
  if (config.history.retention.max_age.count() <= 0) {
    throw std::invalid_argument("history.max_age_days must be positive");
  }
}

} // namespace cxg
