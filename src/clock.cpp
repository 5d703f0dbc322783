#include <cxg/clock.h>

namespace cxg {

std::shared_ptr<Clock> EnsureClock(std::shared_ptr<Clock> clock) {
  if (!clock) {
    return std::make_shared<SystemClock>();
  }
  return clock;
}

} // namespace cxg
