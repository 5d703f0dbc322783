#pragma once

#include <cxg/interfaces.h>

namespace cxg {

// Last tier of the detection chain. Keyword and regex scan over raw text
// that always produces an answer.
class HeuristicFallbackDetector {
public:
  HeuristicFindings Detect(const AnalysisRequest &request) const;

  // Tags found anywhere in `content`, in detection order without duplicates.
  static std::vector<std::string> DetectPatterns(const std::string &content);
  // First match per line and per detected tag.
  static std::vector<Match> FindMatches(const std::string &content,
                                        const std::vector<std::string> &tags);
};

} // namespace cxg
