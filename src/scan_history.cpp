#include <cxg/scan_history.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cxg {

ScanHistory::ScanHistory(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("Scan history capacity must be positive");
  }
}

void ScanHistory::Append(AnalysisResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(std::move(result));
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

void ScanHistory::Replace(std::vector<AnalysisResult> loaded) {
  const auto keep = std::min(loaded.size(), capacity_);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto first = loaded.end() - static_cast<std::ptrdiff_t>(keep);
  entries_.assign(std::make_move_iterator(first),
                  std::make_move_iterator(loaded.end()));
}

std::vector<AnalysisResult> ScanHistory::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {entries_.begin(), entries_.end()};
}

std::vector<AnalysisResult> ScanHistory::Recent(std::size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto keep = std::min(count, entries_.size());
  return {entries_.end() - static_cast<std::ptrdiff_t>(keep), entries_.end()};
}

SecuritySummary ScanHistory::Summary(std::size_t window) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto keep = std::min(window, entries_.size());
  SecuritySummary summary;
  summary.total = keep;
  for (auto it = entries_.end() - static_cast<std::ptrdiff_t>(keep);
       it != entries_.end(); ++it) {
    switch (it->risk_level) {
    case RiskLevel::kHigh:
      ++summary.high;
      break;
    case RiskLevel::kMedium:
      ++summary.medium;
      break;
    case RiskLevel::kLow:
      ++summary.low;
      break;
    }
  }
  return summary;
}

std::size_t ScanHistory::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace cxg
