#pragma once

#include <cxg/history_store.h>
#include <cxg/logging.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace cxg {

// Serializes snapshot writes on one background thread. Writes run in
// submission order and never overlap. Failures are logged and counted.
class HistoryWriter {
public:
  HistoryWriter(std::shared_ptr<HistoryStore> store,
                std::shared_ptr<Logger> logger = nullptr);
  // Drains pending writes before joining the worker.
  ~HistoryWriter();

  HistoryWriter(const HistoryWriter &) = delete;
  HistoryWriter &operator=(const HistoryWriter &) = delete;

  void Submit(std::vector<AnalysisResult> snapshot);
  // Blocks until every write submitted so far has finished.
  void Flush();

  std::size_t CompletedWrites() const;
  std::size_t FailedWrites() const;

private:
  void Run();

  std::shared_ptr<HistoryStore> store_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable work_ready_;
  std::condition_variable idle_;
  std::deque<std::vector<AnalysisResult>> queue_;
  bool busy_ = false;
  bool stopping_ = false;
  std::size_t completed_ = 0;
  std::size_t failed_ = 0;
  std::thread worker_;
};

} // namespace cxg
