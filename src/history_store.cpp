#include <cxg/history_store.h>

#include <cxg/escaping.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

namespace {

constexpr char kHeader[] = "# cxg scan history v1";

long long ParseInteger(const std::string &value, std::size_t line_number) {
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::exception &) {
    throw cxg::HistoryStoreError("Invalid number '" + value +
                                 "' in history line " +
                                 std::to_string(line_number));
  }
}

std::vector<std::string> ResultFields(const cxg::AnalysisResult &result) {
  return {"result",
          std::to_string(result.timestamp.time_since_epoch().count()),
          cxg::ToString(result.risk_level),
          cxg::ToString(result.provenance),
          std::to_string(result.latency.count()),
          result.source_name,
          cxg::JoinList({result.detected_patterns.begin(),
                         result.detected_patterns.end()})};
}

std::vector<std::string> MatchFields(const cxg::Match &match) {
  return {"match",
          match.pattern,
          std::to_string(match.line),
          std::to_string(match.column),
          match.excerpt,
          cxg::ToString(match.severity)};
}

cxg::AnalysisResult ParseResult(const std::vector<std::string> &fields,
                                std::size_t line_number) {
  if (fields.size() != 7) {
    throw cxg::HistoryStoreError("Malformed result record in history line " +
                                 std::to_string(line_number));
  }
  cxg::AnalysisResult result;
  result.timestamp = cxg::TimePoint(
      cxg::TimePoint::duration(ParseInteger(fields[1], line_number)));
  try {
    result.risk_level = cxg::ParseRiskLevel(fields[2]);
    result.provenance = cxg::ParseProvenance(fields[3]);
  } catch (const std::invalid_argument &error) {
    throw cxg::HistoryStoreError(std::string(error.what()) +
                                 " in history line " +
                                 std::to_string(line_number));
  }
  result.latency =
      std::chrono::microseconds(ParseInteger(fields[4], line_number));
  result.source_name = fields[5];
  for (auto &tag : cxg::SplitList(fields[6])) {
    result.detected_patterns.insert(std::move(tag));
  }
  return result;
}

cxg::Match ParseMatch(const std::vector<std::string> &fields,
                      std::size_t line_number) {
  if (fields.size() != 6) {
    throw cxg::HistoryStoreError("Malformed match record in history line " +
                                 std::to_string(line_number));
  }
  cxg::Match match;
  match.pattern = fields[1];
  match.line = static_cast<int>(ParseInteger(fields[2], line_number));
  match.column = static_cast<int>(ParseInteger(fields[3], line_number));
  match.excerpt = fields[4];
  try {
    match.severity = cxg::ParseSeverity(fields[5]);
  } catch (const std::invalid_argument &error) {
    throw cxg::HistoryStoreError(std::string(error.what()) +
                                 " in history line " +
                                 std::to_string(line_number));
  }
  return match;
}

} // namespace

namespace cxg {

std::vector<AnalysisResult> ApplyRetention(std::vector<AnalysisResult> entries,
                                           TimePoint now,
                                           const HistoryRetention &retention) {
  const auto cutoff = now - retention.max_age;
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [cutoff](const AnalysisResult &entry) {
                                 return entry.timestamp < cutoff;
                               }),
                entries.end());
  if (entries.size() > retention.capacity) {
    entries.erase(entries.begin(),
                  entries.end() -
                      static_cast<std::ptrdiff_t>(retention.capacity));
  }
  return entries;
}

FileHistoryStore::FileHistoryStore(std::filesystem::path path,
                                   HistoryRetention retention,
                                   std::shared_ptr<Logger> logger,
                                   std::shared_ptr<Clock> clock)
    : path_(std::move(path)), retention_(retention),
      logger_(EnsureLogger(std::move(logger))),
      clock_(EnsureClock(std::move(clock))) {
  if (path_.empty()) {
    throw std::invalid_argument("History path cannot be empty");
  }
  if (retention_.capacity == 0) {
    throw std::invalid_argument("History capacity must be positive");
  }
}

std::vector<AnalysisResult> FileHistoryStore::Load() {
  std::error_code error;
  if (!std::filesystem::exists(path_, error)) {
    return {};
  }

  std::ifstream stream(path_);
  if (!stream) {
    throw HistoryStoreError("Failed to open history file: " + path_.string());
  }

  std::vector<AnalysisResult> entries;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = SplitEscaped(line);
    const auto &kind = fields.front();
    if (kind == "result") {
      entries.push_back(ParseResult(fields, line_number));
      continue;
    }
    if (entries.empty()) {
      throw HistoryStoreError("History line " + std::to_string(line_number) +
                              " precedes any result record");
    }
    if (kind == "suggestion" && fields.size() == 2) {
      entries.back().suggestions.push_back(fields[1]);
    } else if (kind == "match") {
      entries.back().matches.push_back(ParseMatch(fields, line_number));
    } else {
      throw HistoryStoreError("Unknown record '" + kind + "' in history line " +
                              std::to_string(line_number));
    }
  }
  if (stream.bad()) {
    throw HistoryStoreError("Failed to read history file: " + path_.string());
  }

  logger_->Log(LogLevel::kDebug, "history.load",
               {{"path", path_.string()},
                {"entries", std::to_string(entries.size())}});
  return entries;
}

void FileHistoryStore::Save(const std::vector<AnalysisResult> &entries) {
  const auto retained = ApplyRetention(entries, clock_->Now(), retention_);

  std::error_code error;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), error);
    if (error) {
      throw HistoryStoreError("Failed to create history directory " +
                              path_.parent_path().string() + ": " +
                              error.message());
    }
  }

  auto temporary = path_;
  temporary += ".tmp";
  {
    std::ofstream stream(temporary, std::ios::trunc);
    if (!stream) {
      throw HistoryStoreError("Failed to write history file: " +
                              temporary.string());
    }
    stream << kHeader << '\n';
    for (const auto &entry : retained) {
      stream << JoinEscaped(ResultFields(entry)) << '\n';
      for (const auto &suggestion : entry.suggestions) {
        stream << JoinEscaped({"suggestion", suggestion}) << '\n';
      }
      for (const auto &match : entry.matches) {
        stream << JoinEscaped(MatchFields(match)) << '\n';
      }
    }
    stream.flush();
    if (!stream) {
      throw HistoryStoreError("Failed to write history file: " +
                              temporary.string());
    }
  }

  std::filesystem::rename(temporary, path_, error);
  if (error) {
    throw HistoryStoreError("Failed to replace history file " +
                            path_.string() + ": " + error.message());
  }
  logger_->Log(LogLevel::kDebug, "history.save",
               {{"path", path_.string()},
                {"entries", std::to_string(retained.size())},
                {"dropped", std::to_string(entries.size() - retained.size())}});
}

} // namespace cxg
