#pragma once

#include <cxg/clock.h>
#include <cxg/models.h>

#include <string>
#include <vector>

namespace cxg {

struct Report {
  std::string markdown;
  std::string json;
};

std::string FormatTimestamp(TimePoint time);
SecuritySummary Summarize(const std::vector<AnalysisResult> &results);

// Renders scan results. `formats` lists "markdown" and/or "json"; an empty
// list renders markdown only.
class MarkdownReporter {
public:
  Report Render(const std::vector<AnalysisResult> &results,
                const std::vector<std::string> &formats,
                TimePoint generated_on) const;

  // Compact table of persisted scans for the history command.
  std::string RenderHistory(const std::vector<AnalysisResult> &results,
                            const SecuritySummary &summary) const;
};

} // namespace cxg
