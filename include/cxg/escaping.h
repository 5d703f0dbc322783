#pragma once

#include <string>
#include <vector>

namespace cxg {

// Tab separated record fields. Backslash, tab and newline are escaped.
std::string Escape(const std::string &value);
std::string Unescape(const std::string &value);
std::vector<std::string> SplitEscaped(const std::string &line);
std::string JoinEscaped(const std::vector<std::string> &fields);

// Comma separated lists stored inside a single field.
std::string JoinList(const std::vector<std::string> &items);
std::vector<std::string> SplitList(const std::string &value);

} // namespace cxg
