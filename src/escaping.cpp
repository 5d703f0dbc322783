#include <cxg/escaping.h>

namespace cxg {

std::string Escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '\\':
      escaped.append("\\\\");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string Unescape(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 == value.size()) {
      unescaped.push_back(value[i]);
      continue;
    }
    const auto next = value[++i];
    if (next == 't') {
      unescaped.push_back('\t');
    } else if (next == 'n') {
      unescaped.push_back('\n');
    } else if (next == 'r') {
      unescaped.push_back('\r');
    } else {
      unescaped.push_back(next);
    }
  }
  return unescaped;
}

std::vector<std::string> SplitEscaped(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  for (const auto character : line) {
    if (character == '\t') {
      fields.push_back(Unescape(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  fields.push_back(Unescape(current));
  return fields;
}

std::string JoinEscaped(const std::vector<std::string> &fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(Escape(fields[i]));
  }
  return line;
}

std::string JoinList(const std::vector<std::string> &items) {
  std::string joined;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      joined.push_back(',');
    }
    for (const auto character : items[i]) {
      if (character == ',' || character == '\\') {
        joined.push_back('\\');
      }
      joined.push_back(character);
    }
  }
  return joined;
}

std::vector<std::string> SplitList(const std::string &value) {
  std::vector<std::string> items;
  if (value.empty()) {
    return items;
  }
  std::string current;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      current.push_back(value[++i]);
      continue;
    }
    if (value[i] == ',') {
      items.push_back(current);
      current.clear();
      continue;
    }
    current.push_back(value[i]);
  }
  items.push_back(current);
  return items;
}

} // namespace cxg
