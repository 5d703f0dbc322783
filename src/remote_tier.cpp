#include <cxg/remote_tier.h>

#include <utility>

namespace cxg {

RemoteTier::RemoteTier(std::shared_ptr<DetectionService> service,
                       RemoteTierOptions options, std::shared_ptr<Logger> logger,
                       std::shared_ptr<Clock> clock)
    : service_(std::move(service)), enabled_(options.enabled && service_),
      logger_(EnsureLogger(std::move(logger))) {
  // The probe keeps the service alive while a timed out check still runs.
  auto probed = service_;
  breaker_ = std::make_unique<CircuitBreaker>(
      "remote",
      [probed](std::chrono::milliseconds timeout) {
        return probed && probed->CheckHealth(timeout);
      },
      options.breaker, logger_, EnsureClock(std::move(clock)));
}

std::optional<RemoteFindings>
RemoteTier::Analyze(const AnalysisRequest &request) {
  if (!enabled_) {
    return std::nullopt;
  }
  if (!breaker_->AllowRequest()) {
    logger_->Log(LogLevel::kDebug, "remote.skipped",
                 {{"state", ToString(breaker_->State())}});
    return std::nullopt;
  }

  RemoteResponse response;
  try {
    response = service_->Analyze(RemoteAnalyzeRequest{
        request.content, request.language,
        request.name.value_or(kUnknownSource)});
  } catch (const std::exception &error) {
    Fail(error.what());
  }
  if (!response.success || !response.result) {
    Fail(response.error.value_or("remote service returned no result"));
  }
  breaker_->RecordSuccess();
  return std::move(response.result);
}

CircuitState RemoteTier::BreakerState() const { return breaker_->State(); }

CircuitBreakerStats RemoteTier::BreakerStats() const {
  return breaker_->Stats();
}

void RemoteTier::Fail(const std::string &reason) {
  breaker_->RecordFailure();
  throw RemoteServiceError("Remote analysis failed: " + reason);
}

} // namespace cxg
