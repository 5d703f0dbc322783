#pragma once

#include <cxg/models.h>

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace cxg {

inline constexpr std::size_t kDefaultScanHistoryCapacity = 50;

// Oldest-first log of recent results. Appending beyond capacity drops the
// oldest entry.
class ScanHistory {
public:
  explicit ScanHistory(std::size_t capacity = kDefaultScanHistoryCapacity);

  void Append(AnalysisResult result);
  // Replaces the log with previously persisted entries, keeping the newest.
  void Replace(std::vector<AnalysisResult> loaded);

  std::vector<AnalysisResult> Snapshot() const;
  std::vector<AnalysisResult> Recent(std::size_t count = 10) const;
  // Risk distribution over the newest `window` entries.
  SecuritySummary Summary(std::size_t window = 20) const;

  std::size_t Size() const;
  std::size_t Capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<AnalysisResult> entries_;
};

} // namespace cxg
