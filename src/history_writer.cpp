#include <cxg/history_writer.h>

#include <stdexcept>
#include <utility>

namespace cxg {

HistoryWriter::HistoryWriter(std::shared_ptr<HistoryStore> store,
                             std::shared_ptr<Logger> logger)
    : store_(std::move(store)), logger_(EnsureLogger(std::move(logger))) {
  if (!store_) {
    throw std::invalid_argument("History writer requires a store");
  }
  worker_ = std::thread([this] { Run(); });
}

HistoryWriter::~HistoryWriter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  work_ready_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void HistoryWriter::Submit(std::vector<AnalysisResult> snapshot) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(snapshot));
  }
  work_ready_.notify_one();
}

void HistoryWriter::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

std::size_t HistoryWriter::CompletedWrites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

std::size_t HistoryWriter::FailedWrites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_;
}

void HistoryWriter::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    work_ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
      return;
    }
    auto snapshot = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();

    bool saved = true;
    try {
      store_->Save(snapshot);
    } catch (const std::exception &error) {
      saved = false;
      logger_->Log(LogLevel::kWarn, "history.save.failed",
                   {{"entries", std::to_string(snapshot.size())},
                    {"error", error.what()}});
    }

    lock.lock();
    busy_ = false;
    ++completed_;
    if (!saved) {
      ++failed_;
    }
    if (queue_.empty()) {
      idle_.notify_all();
    }
  }
}

} // namespace cxg
