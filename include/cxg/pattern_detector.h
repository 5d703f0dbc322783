#pragma once

#include <cxg/interfaces.h>
#include <cxg/logging.h>

#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace cxg {

struct DetectionRule {
  std::string name;
  // One of kSecretTag, kBusinessLogicTag or kInfrastructureTag.
  std::string category;
  Severity severity = Severity::kMedium;
  std::string pattern;
  bool ignore_case = true;
  // Case-insensitive substrings that mark a match as a placeholder.
  std::vector<std::string> false_positives;
  std::string recommendation;
};

std::vector<DetectionRule> DefaultDetectionRules();

struct PatternDetectorOptions {
  std::set<std::string> languages = {"javascript", "javascriptreact",
                                     "typescript", "typescriptreact"};
  std::vector<DetectionRule> rules = DefaultDetectionRules();
  // Hits whose confidence does not exceed this value are dropped.
  double min_confidence = 0.3;
};

// Heuristic confidence of a hit, in [0, 1]. Comments, test sources and
// placeholder markers lower it; configuration context raises it.
double HitConfidence(const DetectionRule &rule, const std::string &match,
                     const std::string &line,
                     const std::optional<std::string> &source_name);

// Keeps a short prefix and suffix visible and stars out the rest.
std::string MaskSecret(const std::string &secret);

// Rule-based primary detector. Answers only for the languages it was
// configured with; any other language yields std::nullopt so the next tier
// runs.
class PatternDetector : public PrimaryDetector {
public:
  explicit PatternDetector(PatternDetectorOptions options = {},
                           std::shared_ptr<Logger> logger = nullptr);

  std::optional<ModularFindings>
  Analyze(const AnalysisRequest &request) override;
  std::string Name() const override { return "pattern"; }

  bool Supports(const std::string &language) const;

private:
  struct CompiledRule {
    DetectionRule rule;
    std::regex expression;
  };

  PatternDetectorOptions options_;
  std::vector<CompiledRule> compiled_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cxg
