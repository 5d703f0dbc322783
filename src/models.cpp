#include <cxg/models.h>

#include <stdexcept>

namespace cxg {

std::string ToString(RiskLevel level) {
  switch (level) {
  case RiskLevel::kLow:
    return "low";
  case RiskLevel::kMedium:
    return "medium";
  case RiskLevel::kHigh:
    return "high";
  }
  return "unknown";
}

std::string ToString(Severity severity) {
  switch (severity) {
  case Severity::kLow:
    return "low";
  case Severity::kMedium:
    return "medium";
  case Severity::kHigh:
    return "high";
  }
  return "unknown";
}

std::string ToString(Provenance provenance) {
  switch (provenance) {
  case Provenance::kModular:
    return "modular";
  case Provenance::kRemote:
    return "remote";
  case Provenance::kLocalFallback:
    return "local-fallback";
  case Provenance::kCache:
    return "cache";
  }
  return "unknown";
}

RiskLevel ParseRiskLevel(const std::string &value) {
  if (value == "low") {
    return RiskLevel::kLow;
  }
  if (value == "medium") {
    return RiskLevel::kMedium;
  }
  if (value == "high") {
    return RiskLevel::kHigh;
  }
  throw std::invalid_argument("Unknown risk level: " + value);
}

Severity ParseSeverity(const std::string &value) {
  if (value == "low") {
    return Severity::kLow;
  }
  if (value == "medium") {
    return Severity::kMedium;
  }
  if (value == "high") {
    return Severity::kHigh;
  }
  throw std::invalid_argument("Unknown severity: " + value);
}

Provenance ParseProvenance(const std::string &value) {
  if (value == "modular") {
    return Provenance::kModular;
  }
  if (value == "remote") {
    return Provenance::kRemote;
  }
  if (value == "local-fallback") {
    return Provenance::kLocalFallback;
  }
  if (value == "cache") {
    return Provenance::kCache;
  }
  throw std::invalid_argument("Unknown provenance: " + value);
}

bool HasSecrets(const AnalysisResult &result) {
  return result.detected_patterns.count(kSecretTag) != 0;
}

bool HasBusinessLogic(const AnalysisResult &result) {
  return result.detected_patterns.count(kBusinessLogicTag) != 0;
}

bool HasInfrastructureExposure(const AnalysisResult &result) {
  return result.detected_patterns.count(kInfrastructureTag) != 0;
}

std::size_t EstimateSize(const AnalysisResult &result) {
  std::size_t size = sizeof(AnalysisResult) + result.source_name.size();
  for (const auto &pattern : result.detected_patterns) {
    size += pattern.size() + sizeof(std::string);
  }
  for (const auto &suggestion : result.suggestions) {
    size += suggestion.size() + sizeof(std::string);
  }
  for (const auto &match : result.matches) {
    size += sizeof(Match) + match.pattern.size() + match.excerpt.size();
  }
  return size;
}

} // namespace cxg
