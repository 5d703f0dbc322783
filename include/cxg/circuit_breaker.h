#pragma once

#include <cxg/clock.h>
#include <cxg/logging.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace cxg {

enum class CircuitState { kClosed, kOpen, kHalfOpen };

std::string ToString(CircuitState state);

struct CircuitBreakerOptions {
  std::chrono::milliseconds probe_interval = std::chrono::minutes(5);
  std::chrono::milliseconds probe_timeout = std::chrono::seconds(2);
};

struct CircuitBreakerStats {
  CircuitState state = CircuitState::kHalfOpen;
  std::size_t allowed_requests = 0;
  std::size_t rejected_requests = 0;
  std::size_t probes = 0;
  std::size_t failed_probes = 0;
  std::size_t recorded_failures = 0;
  std::optional<TimePoint> last_transition;
};

// Returns true when the remote side answered healthy within `timeout`.
using HealthProbe = std::function<bool(std::chrono::milliseconds timeout)>;

// Runs `probe` on a detached worker and waits at most `timeout`. A probe that
// throws, reports unhealthy or does not finish in time counts as unreachable.
// The worker is abandoned on timeout, so `probe` must own what it touches.
bool ProbeWithTimeout(HealthProbe probe, std::chrono::milliseconds timeout);

// Liveness gate for an optional remote dependency.
//
// The breaker starts half-open because nothing is known about the remote side.
// A half-open breaker probes on the next AllowRequest and moves to closed or
// open. Both closed and open fall back to half-open once `probe_interval` has
// elapsed, so liveness is refreshed periodically without probing every call.
// RecordFailure opens the breaker immediately.
class CircuitBreaker {
public:
  CircuitBreaker(std::string name, HealthProbe probe,
                 CircuitBreakerOptions options = {},
                 std::shared_ptr<Logger> logger = nullptr,
                 std::shared_ptr<Clock> clock = nullptr);

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  bool AllowRequest();
  void RecordSuccess();
  void RecordFailure();

  CircuitState State() const;
  CircuitBreakerStats Stats() const;
  // Forgets everything learned so far and returns to half-open.
  void Reset();

  const std::string &Name() const { return name_; }

private:
  void ApplyTimerLocked(TimePoint now);
  void TransitionLocked(CircuitState next, TimePoint now);

  std::string name_;
  HealthProbe probe_;
  CircuitBreakerOptions options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::kHalfOpen;
  TimePoint state_since_;
  bool probing_ = false;
  CircuitBreakerStats stats_;
};

} // namespace cxg
