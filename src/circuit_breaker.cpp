#include <cxg/circuit_breaker.h>

#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace cxg {

std::string ToString(CircuitState state) {
  switch (state) {
  case CircuitState::kClosed:
    return "closed";
  case CircuitState::kOpen:
    return "open";
  case CircuitState::kHalfOpen:
    return "half-open";
  }
  return "unknown";
}

bool ProbeWithTimeout(HealthProbe probe, std::chrono::milliseconds timeout) {
  if (!probe) {
    return false;
  }
  std::packaged_task<bool()> task(
      [probe = std::move(probe), timeout]() { return probe(timeout); });
  auto outcome = task.get_future();
  try {
    std::thread(std::move(task)).detach();
  } catch (const std::system_error &) {
    return false;
  }

  if (outcome.wait_for(timeout) != std::future_status::ready) {
    return false;
  }
  try {
    return outcome.get();
  } catch (const std::exception &) {
    return false;
  }
}

CircuitBreaker::CircuitBreaker(std::string name, HealthProbe probe,
                               CircuitBreakerOptions options,
                               std::shared_ptr<Logger> logger,
                               std::shared_ptr<Clock> clock)
    : name_(std::move(name)), probe_(std::move(probe)), options_(options),
      logger_(EnsureLogger(std::move(logger))),
      clock_(EnsureClock(std::move(clock))) {
  if (!probe_) {
    throw std::invalid_argument("Circuit breaker probe cannot be null");
  }
  if (options_.probe_interval.count() <= 0) {
    throw std::invalid_argument("Circuit breaker probe_interval must be "
                                "positive");
  }
  if (options_.probe_timeout.count() <= 0) {
    throw std::invalid_argument("Circuit breaker probe_timeout must be "
                                "positive");
  }
  state_since_ = clock_->Now();
}

bool CircuitBreaker::AllowRequest() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ApplyTimerLocked(clock_->Now());
    if (state_ == CircuitState::kClosed) {
      ++stats_.allowed_requests;
      return true;
    }
    if (state_ == CircuitState::kOpen || probing_) {
      ++stats_.rejected_requests;
      return false;
    }
    probing_ = true;
    ++stats_.probes;
  }

  bool healthy = false;
  std::string error;
  try {
    healthy = ProbeWithTimeout(probe_, options_.probe_timeout);
  } catch (const std::exception &failure) {
    error = failure.what();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  probing_ = false;
  const auto now = clock_->Now();
  if (healthy) {
    TransitionLocked(CircuitState::kClosed, now);
    ++stats_.allowed_requests;
    return true;
  }
  ++stats_.failed_probes;
  LogFields fields{
      {"breaker", name_},
      {"timeout_ms", std::to_string(options_.probe_timeout.count())}};
  if (!error.empty()) {
    fields.emplace_back("error", error);
  }
  logger_->Log(LogLevel::kWarn, "breaker.probe.failed", fields);
  TransitionLocked(CircuitState::kOpen, now);
  ++stats_.rejected_requests;
  return false;
}

void CircuitBreaker::RecordSuccess() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == CircuitState::kHalfOpen && !probing_) {
    TransitionLocked(CircuitState::kClosed, clock_->Now());
  }
}

void CircuitBreaker::RecordFailure() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.recorded_failures;
  TransitionLocked(CircuitState::kOpen, clock_->Now());
}

CircuitState CircuitBreaker::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CircuitBreakerStats CircuitBreaker::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto stats = stats_;
  stats.state = state_;
  return stats;
}

void CircuitBreaker::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_ = CircuitBreakerStats{};
  state_ = CircuitState::kHalfOpen;
  state_since_ = clock_->Now();
}

void CircuitBreaker::ApplyTimerLocked(TimePoint now) {
  if (state_ == CircuitState::kHalfOpen) {
    return;
  }
  if (now - state_since_ >= options_.probe_interval) {
    TransitionLocked(CircuitState::kHalfOpen, now);
  }
}

void CircuitBreaker::TransitionLocked(CircuitState next, TimePoint now) {
  state_since_ = now;
  if (next == state_) {
    return;
  }
  logger_->Log(LogLevel::kInfo, "breaker.transition",
               {{"breaker", name_},
                {"from", ToString(state_)},
                {"to", ToString(next)}});
  state_ = next;
  stats_.last_transition = now;
}

} // namespace cxg
