#include <cxg/bounded_regex.h>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace {

// Calls visit(hit) for each match in position order until it returns false.
template <typename Visitor>
void VisitWindows(const std::string &text, const std::regex &expression,
                  Visitor visit) {
  constexpr auto step = cxg::kRegexWindow - cxg::kMaxRegexMatch;
  for (std::size_t start = 0;; start += step) {
    const auto end = std::min(text.size(), start + cxg::kRegexWindow);
    const bool last = end == text.size();
    // Lets \b and ^ see the character before the window.
    const auto flags = start == 0 ? std::regex_constants::match_default
                                  : std::regex_constants::match_prev_avail;
    const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
    const auto limit = text.begin() + static_cast<std::ptrdiff_t>(end);
    for (std::sregex_iterator it(first, limit, expression, flags), done;
         it != done; ++it) {
      const auto position = static_cast<std::size_t>(it->position());
      // The next window starts here and sees this match whole.
      if (!last && position >= step) {
        break;
      }
      if (!visit(cxg::RegexHit{start + position, it->str()})) {
        return;
      }
    }
    if (last) {
      return;
    }
  }
}

} // namespace

namespace cxg {

std::vector<RegexHit> FindAllBounded(const std::string &text,
                                     const std::regex &expression) {
  std::vector<RegexHit> hits;
  VisitWindows(text, expression, [&hits](RegexHit hit) {
    hits.push_back(std::move(hit));
    return true;
  });
  return hits;
}

std::optional<RegexHit> FindFirstBounded(const std::string &text,
                                         const std::regex &expression) {
  std::optional<RegexHit> found;
  VisitWindows(text, expression, [&found](RegexHit hit) {
    found = std::move(hit);
    return false;
  });
  return found;
}

} // namespace cxg
