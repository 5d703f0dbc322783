#pragma once

#include <cxg/clock.h>
#include <cxg/logging.h>
#include <cxg/models.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

namespace cxg {

class HistoryStoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Durable copy of the recent scan log. Implementations throw
// HistoryStoreError on I/O failures and malformed data.
class HistoryStore {
public:
  virtual ~HistoryStore() = default;
  virtual std::vector<AnalysisResult> Load() = 0;
  virtual void Save(const std::vector<AnalysisResult> &entries) = 0;
};

struct HistoryRetention {
  std::size_t capacity = 50;
  std::chrono::hours max_age = std::chrono::hours(24 * 7);
};

// Drops entries older than `max_age` relative to `now` and keeps the newest
// `capacity` of the rest, oldest first.
std::vector<AnalysisResult> ApplyRetention(std::vector<AnalysisResult> entries,
                                           TimePoint now,
                                           const HistoryRetention &retention);

// Tab separated record file. Each result is one `result` line followed by its
// `suggestion` and `match` lines. Timestamps are stored as clock ticks.
class FileHistoryStore : public HistoryStore {
public:
  FileHistoryStore(std::filesystem::path path, HistoryRetention retention = {},
                   std::shared_ptr<Logger> logger = nullptr,
                   std::shared_ptr<Clock> clock = nullptr);

  // A missing file is an empty history.
  std::vector<AnalysisResult> Load() override;
  // Applies retention, then replaces the file through a temporary sibling.
  void Save(const std::vector<AnalysisResult> &entries) override;

  const std::filesystem::path &Path() const { return path_; }

private:
  std::filesystem::path path_;
  HistoryRetention retention_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Clock> clock_;
};

} // namespace cxg
