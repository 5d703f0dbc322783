#include <cxg/pattern_detector.h>

#include <cxg/bounded_regex.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::tolower(character));
                 });
  return value;
}

bool ContainsAny(const std::string &haystack,
                 const std::vector<std::string> &needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&haystack](const std::string &needle) {
                       return haystack.find(needle) != std::string::npos;
                     });
}

std::string TrimLeft(const std::string &value) {
  const auto first = value.find_first_not_of(" \t");
  return first == std::string::npos ? std::string{} : value.substr(first);
}

bool IsCommentLine(const std::string &line) {
  const auto trimmed = TrimLeft(line);
  return trimmed.rfind("//", 0) == 0 || trimmed.rfind("/*", 0) == 0 ||
         trimmed.rfind("*", 0) == 0 || trimmed.rfind("#", 0) == 0;
}

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::string::size_type start = 0;
  while (start <= content.size()) {
    auto end = content.find('\n', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    auto line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

cxg::DetectionRule Secret(std::string name, cxg::Severity severity,
                          std::string pattern, bool ignore_case,
                          std::vector<std::string> false_positives,
                          std::string recommendation) {
  return {std::move(name),
          cxg::kSecretTag,
          severity,
          std::move(pattern),
          ignore_case,
          std::move(false_positives),
          std::move(recommendation)};
}

} // namespace

namespace cxg {

std::vector<DetectionRule> DefaultDetectionRules() {
  const std::string rotate =
      "Rotate the credential and load it from the environment or a secret "
      "manager.";
  std::vector<DetectionRule> rules{
      Secret("openai_api_key", Severity::kHigh, R"(sk-[A-Za-z0-9]{20,256})",
             false, {"sk-test", "sk-fake", "sk-example"}, rotate),
      Secret("github_token", Severity::kHigh, R"(gh[pousr]_[A-Za-z0-9]{36})",
             false, {"_test", "_fake", "_example"}, rotate),
      Secret("aws_access_key", Severity::kHigh, R"(AKIA[0-9A-Z]{16})", false,
             {"akiatest", "akiafake", "example"}, rotate),
      Secret("google_api_key", Severity::kHigh, R"(AIza[0-9A-Za-z_\-]{35})",
             false, {"aizatest", "aizafake"}, rotate),
      Secret("stripe_api_key", Severity::kHigh,
             R"((?:sk|rk)_(?:live|test)_[0-9A-Za-z]{24,256})", false,
             {"_fake", "_example"}, rotate),
      Secret("slack_token", Severity::kHigh, R"(xox[baprs]-[0-9A-Za-z\-]{10,256})",
             false, {"xoxb-test", "xoxb-fake"}, rotate),
      Secret("private_key", Severity::kHigh,
             R"(-----BEGIN (?:RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----)", false,
             {}, "Never embed private keys in source; load them from a key "
                 "store."),
      Secret("jwt_token", Severity::kHigh,
             R"(eyJ[A-Za-z0-9_\-]{1,300}\.eyJ[A-Za-z0-9_\-]{1,600}\.[A-Za-z0-9_\-]{1,100})",
             false, {}, "Do not commit issued tokens; they grant access until "
                        "they expire."),
      Secret("connection_string", Severity::kHigh,
             R"((?:mongodb(?:\+srv)?|mysql|postgres(?:ql)?|redis|amqp)://[^\s"':@/]{1,128}:[^\s"'@/]{1,128}@[^\s"']{1,256})",
             true, {"example.com", "user:pass@"},
             "Move connection credentials out of source and into "
             "configuration."),
      Secret("generic_password", Severity::kHigh,
             R"((?:password|passwd|pwd)["']?\s{0,16}[:=]\s{0,16}["']?[^\s"']{6,256})", true,
             {"your_password", "placeholder", "changeme", "process.env",
              "${", "<"},
             "Use environment variables for passwords instead of literals."),
      Secret("generic_api_key", Severity::kMedium,
             R"((?:api[_-]?key|apikey)["']?\s{0,16}[:=]\s{0,16}["']?[A-Za-z0-9_\-.]{20,256})",
             true, {"your_api_key", "placeholder", "process.env"}, rotate),
      Secret("generic_token", Severity::kMedium,
             R"((?:access[_-]?token|auth[_-]?token|bearer|token)["']?\s{0,16}[:=]\s{0,16}["']?[A-Za-z0-9_\-.]{20,256})",
             true, {"your_token", "placeholder", "process.env"}, rotate),
      Secret("generic_secret", Severity::kMedium,
             R"((?:client[_-]?secret|secret[_-]?key|secret)["']?\s{0,16}[:=]\s{0,16}["']?[A-Za-z0-9_\-.]{12,256})",
             true, {"your_secret", "placeholder", "process.env"}, rotate),
  };

  rules.push_back({"pricing_logic", kBusinessLogicTag, Severity::kMedium,
                   R"(calculate\w{0,32}price|price\w{0,32}calculation|discount\w{0,32}logic|tax\w{0,32}calculation|billing\w{0,32}process)",
                   true,
                   {},
                   "Review whether pricing rules should leave the "
                   "organization."});
  rules.push_back({"proprietary_marker", kBusinessLogicTag, Severity::kMedium,
                   R"(proprietary|trade secret|secret sauce|competitive advantage|business logic)",
                   true,
                   {},
                   "Code marked proprietary should not be shared externally."});
  rules.push_back({"algorithm_marker", kBusinessLogicTag, Severity::kLow,
                   R"(\balgorithm\b)", true, {},
                   "Algorithm implementations may encode proprietary know-how."});

  rules.push_back({"loopback_host", kInfrastructureTag, Severity::kMedium,
                   R"(\blocalhost\b|\b127\.0\.0\.1\b)", true, {},
                   "Use configuration for environment specific hosts."});
  rules.push_back(
      {"private_network_address", kInfrastructureTag, Severity::kMedium,
       R"(\b(?:10\.\d{1,3}\.\d{1,3}\.\d{1,3}|192\.168\.\d{1,3}\.\d{1,3}|172\.(?:1[6-9]|2\d|3[01])\.\d{1,3}\.\d{1,3})\b)",
       false,
       {},
       "Private network addresses reveal internal topology."});
  rules.push_back({"internal_hostname", kInfrastructureTag, Severity::kMedium,
                   R"(\b[\w\-]{0,64}internal[._\-][\w.\-]{1,128})", true, {},
                   "Internal hostnames reveal service topology."});
  return rules;
}

double HitConfidence(const DetectionRule &rule, const std::string &match,
                     const std::string &line,
                     const std::optional<std::string> &source_name) {
  static const std::vector<std::string> kTestIndicators{
      "test", "fake", "example", "placeholder", "dummy", "mock"};
  static const std::vector<std::string> kTestSources{"test", "spec", "mock"};
  static const std::vector<std::string> kConfigContext{"config", "env",
                                                       "settings"};

  double confidence = 0.7;
  if (IsCommentLine(line)) {
    confidence -= 0.3;
  }
  if (source_name && ContainsAny(ToLower(*source_name), kTestSources)) {
    confidence -= 0.4;
  }
  const auto lower_line = ToLower(line);
  if (ContainsAny(lower_line, kConfigContext)) {
    confidence += 0.2;
  }
  if (ContainsAny(ToLower(match), kTestIndicators) ||
      ContainsAny(lower_line, kTestIndicators)) {
    confidence -= 0.5;
  }
  if (rule.severity == Severity::kHigh) {
    confidence += 0.1;
  }
  return std::clamp(confidence, 0.0, 1.0);
}

std::string MaskSecret(const std::string &secret) {
  if (secret.size() <= 8) {
    return std::string(secret.size(), '*');
  }
  const auto visible = std::min<std::size_t>(4, secret.size() / 5);
  return secret.substr(0, visible) +
         std::string(secret.size() - visible * 2, '*') +
         secret.substr(secret.size() - visible);
}

PatternDetector::PatternDetector(PatternDetectorOptions options,
                                 std::shared_ptr<Logger> logger)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {
  for (const auto &rule : options_.rules) {
    if (rule.category != kSecretTag && rule.category != kBusinessLogicTag &&
        rule.category != kInfrastructureTag) {
      throw std::invalid_argument("Unknown category '" + rule.category +
                                  "' for rule " + rule.name);
    }
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (rule.ignore_case) {
      flags |= std::regex::icase;
    }
    try {
      compiled_.push_back({rule, std::regex(rule.pattern, flags)});
    } catch (const std::regex_error &error) {
      throw std::invalid_argument("Invalid pattern for rule " + rule.name +
                                  ": " + error.what());
    }
  }
}

bool PatternDetector::Supports(const std::string &language) const {
  return options_.languages.count(ToLower(language)) != 0;
}

std::optional<ModularFindings>
PatternDetector::Analyze(const AnalysisRequest &request) {
  if (!Supports(request.language)) {
    logger_->Log(LogLevel::kDebug, "detector.pattern.unsupported",
                 {{"language", request.language}});
    return std::nullopt;
  }

  ModularFindings findings;
  const auto lines = SplitLines(request.content);
  for (std::size_t index = 0; index < lines.size(); ++index) {
    const auto &line = lines[index];
    for (const auto &compiled : compiled_) {
      const auto &rule = compiled.rule;
      for (const auto &match : FindAllBounded(line, compiled.expression)) {
        const auto &text = match.text;
        if (ContainsAny(ToLower(text), rule.false_positives)) {
          continue;
        }
        if (HitConfidence(rule, text, line, request.name) <=
            options_.min_confidence) {
          continue;
        }
        PatternHit hit;
        hit.rule = rule.name;
        hit.category = rule.category;
        hit.severity = rule.severity;
        hit.line = static_cast<int>(index + 1);
        hit.column = static_cast<int>(match.position + 1);
        hit.excerpt = rule.category == kSecretTag ? MaskSecret(text) : text;
        hit.recommendation = rule.recommendation;
        findings.hits.push_back(std::move(hit));
      }
    }
  }

  logger_->Log(LogLevel::kDebug, "detector.pattern.complete",
               {{"lines", std::to_string(lines.size())},
                {"hits", std::to_string(findings.hits.size())}});
  return findings;
}

} // namespace cxg
