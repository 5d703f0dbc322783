#include <cxg/logging.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace cxg {
namespace {

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif
  std::ostringstream stream;
  stream << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S%z");
  return stream.str();
}

std::string FormatFields(const LogFields &fields) {
  if (fields.empty()) {
    return "{}";
  }
  std::ostringstream stream;
  stream << "{";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      stream << ", ";
    }
    stream << '"' << fields[i].first << '"' << ": " << '"'
           << fields[i].second << '"';
  }
  stream << "}";
  return stream.str();
}

} // namespace

std::string LevelName(LogLevel level) {
  switch (level) {
  case LogLevel::kError:
    return "error";
  case LogLevel::kWarn:
    return "warn";
  case LogLevel::kInfo:
    return "info";
  case LogLevel::kDebug:
    return "debug";
  }
  return "unknown";
}

LogLevel ParseLogLevel(const std::string &value) {
  std::string normalized;
  for (const auto character : value) {
    if (std::isspace(static_cast<unsigned char>(character)) == 0) {
      normalized.push_back(static_cast<char>(
          std::tolower(static_cast<unsigned char>(character))));
    }
  }
  if (normalized == "error") {
    return LogLevel::kError;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::kWarn;
  }
  if (normalized == "info") {
    return LogLevel::kInfo;
  }
  if (normalized == "debug") {
    return LogLevel::kDebug;
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

StructuredLogger::StructuredLogger(std::ostream &stream, LoggingConfig config)
    : stream_(&stream), config_(config) {}

void StructuredLogger::Log(LogLevel level, std::string_view message,
                           LogFields fields) {
  if (!IsEnabled(level) || stream_ == nullptr) {
    return;
  }

  const auto line = "[" + Timestamp() + "] level=" + LevelName(level) +
                    " message=\"" + std::string(message) +
                    "\" fields=" + FormatFields(fields) + "\n";
  std::lock_guard<std::mutex> lock(mutex_);
  (*stream_) << line;
}

std::shared_ptr<Logger> EnsureLogger(std::shared_ptr<Logger> logger) {
  if (!logger) {
    return std::make_shared<NullLogger>();
  }
  return logger;
}

std::shared_ptr<Logger> MakeLogger(const LoggingConfig &config,
                                   std::ostream &stream) {
  return std::make_shared<StructuredLogger>(stream, config);
}

} // namespace cxg
