#pragma once

#include <chrono>
#include <memory>

namespace cxg {

using TimePoint = std::chrono::system_clock::time_point;

// Wall clock seam. Components read time only through this interface so
// expiry and rate computations can be driven deterministically.
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimePoint Now() const = 0;
};

class SystemClock : public Clock {
public:
  TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

std::shared_ptr<Clock> EnsureClock(std::shared_ptr<Clock> clock);

} // namespace cxg
