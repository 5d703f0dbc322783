#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace cxg {

// std::regex recurses once per character it consumes, so a single search
// over a very long line can exhaust the stack. These helpers never hand the
// engine more than kRegexWindow characters at a time. Consecutive windows
// overlap by kMaxRegexMatch characters; a match no longer than that is
// always found, and reported once.
inline constexpr std::size_t kRegexWindow = 4096;
inline constexpr std::size_t kMaxRegexMatch = 1024;

struct RegexHit {
  // Offset of the match within the searched text.
  std::size_t position = 0;
  std::string text;
};

std::vector<RegexHit> FindAllBounded(const std::string &text,
                                     const std::regex &expression);

std::optional<RegexHit> FindFirstBounded(const std::string &text,
                                         const std::regex &expression);

} // namespace cxg
