#include <cxg/result_normalizer.h>

#include <cxg/pattern_detector.h>

#include <algorithm>
#include <utility>
#include <variant>

namespace {

void AppendUnique(std::vector<std::string> &target, const std::string &value) {
  if (value.empty()) {
    return;
  }
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(value);
  }
}

cxg::RiskLevel FromServiceScale(int risk_level,
                                const std::set<std::string> &tags) {
  switch (risk_level) {
  case 0:
    return cxg::RiskLevel::kLow;
  case 1:
    return cxg::RiskLevel::kMedium;
  case 2:
    return cxg::RiskLevel::kHigh;
  default:
    return cxg::RiskFromTags(tags);
  }
}

class FindingsNormalizer {
public:
  cxg::AnalysisResult operator()(const cxg::ModularFindings &findings) const {
    cxg::AnalysisResult result;
    result.provenance = cxg::Provenance::kModular;
    bool high_severity = false;
    for (const auto &hit : findings.hits) {
      result.detected_patterns.insert(hit.category);
      result.matches.push_back(
          {hit.category, hit.line, hit.column, hit.excerpt, hit.severity});
      high_severity = high_severity || hit.severity == cxg::Severity::kHigh;
    }
    result.risk_level = high_severity
                            ? cxg::RiskLevel::kHigh
                            : cxg::RiskFromTags(result.detected_patterns);
    result.suggestions = cxg::SuggestionsForTags(result.detected_patterns);
    for (const auto &hit : findings.hits) {
      AppendUnique(result.suggestions, hit.recommendation);
    }
    return result;
  }

  cxg::AnalysisResult operator()(const cxg::RemoteFindings &findings) const {
    cxg::AnalysisResult result;
    result.provenance = cxg::Provenance::kRemote;
    for (const auto &secret : findings.secrets) {
      result.detected_patterns.insert(cxg::kSecretTag);
      result.matches.push_back({cxg::kSecretTag, secret.line, secret.column,
                                cxg::MaskSecret(secret.value),
                                cxg::Severity::kHigh});
    }
    if (!findings.business_logic.empty()) {
      result.detected_patterns.insert(cxg::kBusinessLogicTag);
    }
    for (const auto &exposure : findings.infrastructure) {
      result.detected_patterns.insert(cxg::kInfrastructureTag);
      result.matches.push_back({cxg::kInfrastructureTag, exposure.line, 1,
                                exposure.type, cxg::Severity::kMedium});
    }
    result.risk_level =
        FromServiceScale(findings.risk_level, result.detected_patterns);
    result.suggestions = cxg::SuggestionsForTags(result.detected_patterns);
    return result;
  }

  cxg::AnalysisResult operator()(const cxg::HeuristicFindings &findings) const {
    cxg::AnalysisResult result;
    result.provenance = cxg::Provenance::kLocalFallback;
    result.detected_patterns.insert(findings.patterns.begin(),
                                    findings.patterns.end());
    result.matches = findings.matches;
    result.risk_level = cxg::RiskFromTags(result.detected_patterns);
    result.suggestions = cxg::SuggestionsForTags(result.detected_patterns);
    return result;
  }
};

} // namespace

namespace cxg {

Provenance ProvenanceOf(const TierOutput &output) {
  switch (output.index()) {
  case 0:
    return Provenance::kModular;
  case 1:
    return Provenance::kRemote;
  default:
    return Provenance::kLocalFallback;
  }
}

RiskLevel RiskFromTags(const std::set<std::string> &tags) {
  if (tags.count(kSecretTag) != 0) {
    return RiskLevel::kHigh;
  }
  if (tags.count(kBusinessLogicTag) != 0 ||
      tags.count(kInfrastructureTag) != 0) {
    return RiskLevel::kMedium;
  }
  return RiskLevel::kLow;
}

std::vector<std::string> SuggestionsForTags(const std::set<std::string> &tags) {
  std::vector<std::string> suggestions;
  if (tags.count(kSecretTag) != 0) {
    suggestions.emplace_back(
        "Consider using environment variables for sensitive data");
    suggestions.emplace_back("Use a secrets management system like Azure Key "
                             "Vault or AWS Secrets Manager");
    suggestions.emplace_back(
        "Review your .gitignore to ensure secrets are not committed");
  }
  if (tags.count(kBusinessLogicTag) != 0) {
    suggestions.emplace_back(
        "Review if this business logic should be shared with AI assistants");
    suggestions.emplace_back("Consider abstracting proprietary algorithms");
  }
  if (tags.count(kInfrastructureTag) != 0) {
    suggestions.emplace_back("Avoid exposing internal infrastructure details");
    suggestions.emplace_back(
        "Use configuration files for environment-specific settings");
  }
  return suggestions;
}

AnalysisResult Normalize(const TierOutput &output,
                         const AnalysisRequest &request, TimePoint timestamp,
                         std::chrono::microseconds latency) {
  auto result = std::visit(FindingsNormalizer{}, output);
  result.timestamp = timestamp;
  result.source_name = request.name.value_or(kUnknownSource);
  result.latency = latency;
  return result;
}

} // namespace cxg
