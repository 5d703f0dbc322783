#pragma once

#include <cxg/circuit_breaker.h>
#include <cxg/interfaces.h>
#include <cxg/logging.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace cxg {

struct RemoteTierOptions {
  bool enabled = false;
  CircuitBreakerOptions breaker;
};

class RemoteServiceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Secondary detection tier backed by a DetectionService and gated by a
// circuit breaker.
class RemoteTier {
public:
  RemoteTier(std::shared_ptr<DetectionService> service,
             RemoteTierOptions options, std::shared_ptr<Logger> logger = nullptr,
             std::shared_ptr<Clock> clock = nullptr);

  // True when configured on and a service is attached.
  bool Enabled() const { return enabled_; }

  // std::nullopt when the tier is disabled or the breaker rejects the call.
  // Throws RemoteServiceError when the call fails; the breaker is opened first.
  std::optional<RemoteFindings> Analyze(const AnalysisRequest &request);

  CircuitState BreakerState() const;
  CircuitBreakerStats BreakerStats() const;

private:
  [[noreturn]] void Fail(const std::string &reason);

  std::shared_ptr<DetectionService> service_;
  bool enabled_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<CircuitBreaker> breaker_;
};

} // namespace cxg
