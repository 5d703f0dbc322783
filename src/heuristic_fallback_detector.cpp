#include <cxg/heuristic_fallback_detector.h>

#include <cxg/bounded_regex.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace {

struct TagPattern {
  const char *tag;
  std::regex expression;
};

const std::vector<TagPattern> &SecretPatterns() {
  static const auto icase = std::regex::ECMAScript | std::regex::icase;
  static const std::vector<TagPattern> patterns{
      {cxg::kSecretTag,
       std::regex(R"(api[_-]?key[_-]?[:=]\s{0,16}["']?[a-zA-Z0-9_-]{20,256}["']?)",
                  icase)},
      {cxg::kSecretTag,
       std::regex(R"(password[_-]?[:=]\s{0,16}["']?[^"'\s]{6,256}["']?)",
                  icase)},
      {cxg::kSecretTag,
       std::regex(R"(secret[_-]?[:=]\s{0,16}["']?[^"'\s]{8,256}["']?)",
                  icase)},
      {cxg::kSecretTag,
       std::regex(R"(token[_-]?[:=]\s{0,16}["']?[a-zA-Z0-9_-]{20,256}["']?)",
                  icase)},
      {cxg::kSecretTag, std::regex(R"(private[_-]?key)", icase)},
      {cxg::kSecretTag, std::regex(R"(sk-[a-zA-Z0-9]{20,256})", icase)},
      {cxg::kSecretTag, std::regex(R"(ghp_[a-zA-Z0-9]{36})", icase)},
  };
  return patterns;
}

const std::vector<TagPattern> &InfrastructurePatterns() {
  static const auto icase = std::regex::ECMAScript | std::regex::icase;
  static const std::vector<TagPattern> patterns{
      {cxg::kInfrastructureTag, std::regex(R"(localhost)", icase)},
      {cxg::kInfrastructureTag, std::regex(R"(127\.0\.0\.1)", icase)},
      {cxg::kInfrastructureTag, std::regex(R"(192\.168\.)", icase)},
      {cxg::kInfrastructureTag,
       std::regex(R"(10\.\d{1,3}\.\d{1,3}\.\d{1,3})", icase)},
      {cxg::kInfrastructureTag, std::regex(R"(internal[._-])", icase)},
      {cxg::kInfrastructureTag,
       std::regex(R"(://[^/\s]{0,256}internal)", icase)},
  };
  return patterns;
}

const std::vector<std::string> &BusinessKeywords() {
  static const std::vector<std::string> keywords{
      "calculateprice",        "algorithm",    "proprietary",
      "secret sauce",          "business logic",
      "competitive advantage", "trade secret"};
  return keywords;
}

struct LinePattern {
  const char *tag;
  cxg::Severity severity;
  std::regex expression;
};

const std::vector<LinePattern> &LinePatterns() {
  static const auto icase = std::regex::ECMAScript | std::regex::icase;
  static const std::vector<LinePattern> patterns{
      {cxg::kSecretTag, cxg::Severity::kHigh,
       std::regex(R"((?:api[_-]?key|password|secret|token|private[_-]?key)[:=])",
                  icase)},
      {cxg::kBusinessLogicTag, cxg::Severity::kMedium,
       std::regex(R"((?:calculatePrice|algorithm|proprietary))", icase)},
      {cxg::kInfrastructureTag, cxg::Severity::kMedium,
       std::regex(R"((?:localhost|127\.0\.0\.1|internal))", icase)},
  };
  return patterns;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char character) {
                   return static_cast<char>(std::tolower(character));
                 });
  return value;
}

void AddOnce(std::vector<std::string> &tags, const std::string &tag) {
  if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
    tags.push_back(tag);
  }
}

// A regex engine failure on pathological input only skips that pattern.
std::optional<cxg::RegexHit> SafeSearch(const std::string &text,
                                        const std::regex &expression) {
  try {
    return cxg::FindFirstBounded(text, expression);
  } catch (const std::regex_error &) {
    return std::nullopt;
  }
}

} // namespace

namespace cxg {

HeuristicFindings
HeuristicFallbackDetector::Detect(const AnalysisRequest &request) const {
  HeuristicFindings findings;
  findings.patterns = DetectPatterns(request.content);
  findings.matches = FindMatches(request.content, findings.patterns);
  return findings;
}

std::vector<std::string>
HeuristicFallbackDetector::DetectPatterns(const std::string &content) {
  std::vector<std::string> tags;
  for (const auto &pattern : SecretPatterns()) {
    if (SafeSearch(content, pattern.expression)) {
      AddOnce(tags, pattern.tag);
      break;
    }
  }

  const auto lower = ToLower(content);
  for (const auto &keyword : BusinessKeywords()) {
    if (lower.find(keyword) != std::string::npos) {
      AddOnce(tags, kBusinessLogicTag);
      break;
    }
  }

  for (const auto &pattern : InfrastructurePatterns()) {
    if (SafeSearch(content, pattern.expression)) {
      AddOnce(tags, pattern.tag);
      break;
    }
  }
  return tags;
}

std::vector<Match>
HeuristicFallbackDetector::FindMatches(const std::string &content,
                                       const std::vector<std::string> &tags) {
  std::vector<Match> matches;
  int line_number = 0;
  std::string::size_type start = 0;
  while (start <= content.size()) {
    auto end = content.find('\n', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    const auto line = content.substr(start, end - start);
    ++line_number;

    for (const auto &tag : tags) {
      for (const auto &pattern : LinePatterns()) {
        if (tag != pattern.tag) {
          continue;
        }
        if (const auto hit = SafeSearch(line, pattern.expression)) {
          matches.push_back({tag, line_number,
                             static_cast<int>(hit->position + 1), hit->text,
                             pattern.severity});
        }
      }
    }
    start = end + 1;
  }
  return matches;
}

} // namespace cxg
