#pragma once

#include <cxg/clock.h>

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cxg {

enum class RiskLevel { kLow = 0, kMedium = 1, kHigh = 2 };
enum class Severity { kLow = 0, kMedium = 1, kHigh = 2 };
enum class Provenance { kModular, kRemote, kLocalFallback, kCache };

inline constexpr char kSecretTag[] = "potential_secret";
inline constexpr char kBusinessLogicTag[] = "business_logic";
inline constexpr char kInfrastructureTag[] = "infrastructure";
inline constexpr char kUnknownSource[] = "Unknown";

using RequestOptions = std::map<std::string, std::string>;

struct AnalysisRequest {
  std::string content;
  std::string language;
  std::optional<std::string> name;
  RequestOptions options;
};

struct Match {
  std::string pattern;
  int line = 0;
  int column = 0;
  std::string excerpt;
  Severity severity = Severity::kLow;
};

struct AnalysisResult {
  RiskLevel risk_level = RiskLevel::kLow;
  std::set<std::string> detected_patterns;
  std::vector<std::string> suggestions;
  std::vector<Match> matches;
  TimePoint timestamp;
  std::string source_name = kUnknownSource;
  Provenance provenance = Provenance::kLocalFallback;
  std::chrono::microseconds latency{0};
};

struct SecuritySummary {
  std::size_t total = 0;
  std::size_t high = 0;
  std::size_t medium = 0;
  std::size_t low = 0;
};

std::string ToString(RiskLevel level);
std::string ToString(Severity severity);
std::string ToString(Provenance provenance);

RiskLevel ParseRiskLevel(const std::string &value);
Severity ParseSeverity(const std::string &value);
Provenance ParseProvenance(const std::string &value);

bool HasSecrets(const AnalysisResult &result);
bool HasBusinessLogic(const AnalysisResult &result);
bool HasInfrastructureExposure(const AnalysisResult &result);

// Approximate heap footprint, used as the cache size estimate.
std::size_t EstimateSize(const AnalysisResult &result);

} // namespace cxg
