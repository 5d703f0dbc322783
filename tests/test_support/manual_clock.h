#ifndef CXG_TEST_SUPPORT_MANUAL_CLOCK_H
#define CXG_TEST_SUPPORT_MANUAL_CLOCK_H

#include <cxg/clock.h>

#include <chrono>
#include <mutex>

namespace cxg {
namespace test {

// Clock that only moves when told to.
class ManualClock : public Clock {
public:
  explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(
                           24 * 365 * 50)))
      : now_(start) {}

  TimePoint Now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  template <typename Duration> void Advance(Duration duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += std::chrono::duration_cast<TimePoint::duration>(duration);
  }

  void Set(TimePoint time) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = time;
  }

private:
  mutable std::mutex mutex_;
  TimePoint now_;
};

} // namespace test
} // namespace cxg

#endif // CXG_TEST_SUPPORT_MANUAL_CLOCK_H
