#include <cxg/markdown_reporter.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace cxg {
namespace {

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string EscapeTableCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n') {
      escaped.append(" ");
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

template <typename Collection>
std::string JoinJsonArray(const Collection &values) {
  return Join(values, ",", [](const std::string &value) {
    return "\"" + EscapeJsonString(value) + "\"";
  });
}

std::string JoinPatterns(const std::set<std::string> &patterns) {
  if (patterns.empty()) {
    return "-";
  }
  return Join(patterns, ", ", [](const std::string &value) { return value; });
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string FormatMilliseconds(std::chrono::microseconds latency) {
  std::ostringstream output;
  output << std::fixed << std::setprecision(2)
         << static_cast<double>(latency.count()) / 1000.0;
  return output.str();
}

RiskLevel HighestRisk(const std::vector<AnalysisResult> &results) {
  auto highest = RiskLevel::kLow;
  for (const auto &result : results) {
    if (static_cast<int>(result.risk_level) > static_cast<int>(highest)) {
      highest = result.risk_level;
    }
  }
  return highest;
}

std::string BuildSummaryMarkdown(const std::vector<AnalysisResult> &results,
                                 const std::string &timestamp) {
  const auto summary = Summarize(results);
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Sources Scanned | " << summary.total << " |\n";
  section << "| Highest Risk | " << ToString(HighestRisk(results)) << " |\n";
  section << "| High / Medium / Low | " << summary.high << " / "
          << summary.medium << " / " << summary.low << " |\n\n";
  return section.str();
}

std::string BuildResultsMarkdown(const std::vector<AnalysisResult> &results) {
  std::ostringstream section;
  section << "## Results\n\n";
  section << "| Source | Risk | Provenance | Patterns | Latency (ms) |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  if (results.empty()) {
    section << "| None | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &result : results) {
    section << "| " << EscapeTableCell(result.source_name) << " | "
            << ToString(result.risk_level) << " | "
            << ToString(result.provenance) << " | "
            << JoinPatterns(result.detected_patterns) << " | "
            << FormatMilliseconds(result.latency) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFindingsMarkdown(const std::vector<AnalysisResult> &results) {
  std::ostringstream section;
  section << "## Findings\n\n";
  for (const auto &result : results) {
    section << "### " << result.source_name << "\n\n";
    if (result.matches.empty()) {
      section << "- None\n\n";
      continue;
    }
    section << "| Line | Column | Pattern | Severity | Excerpt |\n";
    section << "| --- | --- | --- | --- | --- |\n";
    for (const auto &match : result.matches) {
      section << "| " << match.line << " | " << match.column << " | "
              << match.pattern << " | " << ToString(match.severity) << " | `"
              << EscapeTableCell(match.excerpt) << "` |\n";
    }
    section << "\n";
  }
  return section.str();
}

std::string
BuildSuggestionsMarkdown(const std::vector<AnalysisResult> &results) {
  std::vector<std::string> suggestions;
  for (const auto &result : results) {
    for (const auto &suggestion : result.suggestions) {
      if (std::find(suggestions.begin(), suggestions.end(), suggestion) ==
          suggestions.end()) {
        suggestions.push_back(suggestion);
      }
    }
  }

  std::ostringstream section;
  section << "## Suggestions\n\n";
  if (suggestions.empty()) {
    section << "- None\n";
    return section.str();
  }
  for (const auto &suggestion : suggestions) {
    section << "- " << suggestion << "\n";
  }
  return section.str();
}

std::string BuildSummaryJson(const std::vector<AnalysisResult> &results,
                             const std::string &timestamp) {
  const auto summary = Summarize(results);
  std::ostringstream json;
  json << "\"summary\": {";
  json << "\"generated_on\": \"" << EscapeJsonString(timestamp) << "\",";
  json << "\"total\": " << summary.total << ",";
  json << "\"high\": " << summary.high << ",";
  json << "\"medium\": " << summary.medium << ",";
  json << "\"low\": " << summary.low << ",";
  json << "\"highest_risk\": \"" << ToString(HighestRisk(results)) << "\"}";
  return json.str();
}

std::string BuildMatchesJson(const std::vector<Match> &matches) {
  std::ostringstream json;
  json << "[";
  for (std::size_t i = 0; i < matches.size(); ++i) {
    const auto &match = matches[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"pattern\": \"" << EscapeJsonString(match.pattern) << "\",";
    json << "\"line\": " << match.line << ",";
    json << "\"column\": " << match.column << ",";
    json << "\"excerpt\": \"" << EscapeJsonString(match.excerpt) << "\",";
    json << "\"severity\": \"" << ToString(match.severity) << "\"}";
  }
  json << "]";
  return json.str();
}

std::string BuildResultsJson(const std::vector<AnalysisResult> &results) {
  std::ostringstream json;
  json << "\"results\": [";
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto &result = results[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"source\": \"" << EscapeJsonString(result.source_name) << "\",";
    json << "\"risk_level\": \"" << ToString(result.risk_level) << "\",";
    json << "\"provenance\": \"" << ToString(result.provenance) << "\",";
    json << "\"timestamp\": \"" << FormatTimestamp(result.timestamp) << "\",";
    json << "\"latency_us\": " << result.latency.count() << ",";
    json << "\"detected_patterns\": ["
         << JoinJsonArray(result.detected_patterns) << "],";
    json << "\"suggestions\": [" << JoinJsonArray(result.suggestions) << "],";
    json << "\"matches\": " << BuildMatchesJson(result.matches) << "}";
  }
  json << "]";
  return json.str();
}

} // namespace

std::string FormatTimestamp(TimePoint time) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  std::ostringstream output;
  output << std::put_time(&utc, "%FT%TZ");
  return output.str();
}

SecuritySummary Summarize(const std::vector<AnalysisResult> &results) {
  SecuritySummary summary;
  summary.total = results.size();
  for (const auto &result : results) {
    switch (result.risk_level) {
    case RiskLevel::kHigh:
      ++summary.high;
      break;
    case RiskLevel::kMedium:
      ++summary.medium;
      break;
    case RiskLevel::kLow:
      ++summary.low;
      break;
    }
  }
  return summary;
}

Report MarkdownReporter::Render(const std::vector<AnalysisResult> &results,
                                const std::vector<std::string> &formats,
                                TimePoint generated_on) const {
  const auto timestamp = FormatTimestamp(generated_on);

  Report report;
  if (ShouldRenderFormat(formats, "markdown")) {
    std::ostringstream output;
    output << "# Context Guard Scan Report\n\n";
    output << BuildSummaryMarkdown(results, timestamp);
    output << BuildResultsMarkdown(results);
    output << BuildFindingsMarkdown(results);
    output << BuildSuggestionsMarkdown(results);
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildSummaryJson(results, timestamp) << ",";
    output << BuildResultsJson(results);
    output << "}";
    report.json = output.str();
  }
  return report;
}

std::string
MarkdownReporter::RenderHistory(const std::vector<AnalysisResult> &results,
                                const SecuritySummary &summary) const {
  std::ostringstream output;
  output << "# Recent Scans\n\n";
  output << "| Scanned At | Source | Risk | Provenance | Patterns |\n";
  output << "| --- | --- | --- | --- | --- |\n";
  if (results.empty()) {
    output << "| None | - | - | - | - |\n";
  }
  for (const auto &result : results) {
    output << "| " << FormatTimestamp(result.timestamp) << " | "
           << EscapeTableCell(result.source_name) << " | "
           << ToString(result.risk_level) << " | "
           << ToString(result.provenance) << " | "
           << JoinPatterns(result.detected_patterns) << " |\n";
  }
  output << "\n## Security Summary\n\n";
  output << "- Total: " << summary.total << "\n";
  output << "- High: " << summary.high << "\n";
  output << "- Medium: " << summary.medium << "\n";
  output << "- Low: " << summary.low << "\n";
  return output.str();
}

} // namespace cxg
