#include <cxg/analysis_orchestrator.h>

#include <cxg/result_normalizer.h>

#include <chrono>
#include <exception>
#include <utility>

namespace {

using InflightMap =
    std::unordered_map<std::string, std::shared_future<cxg::SharedResult>>;

// Removes the computing request's marker on every exit path.
class InflightMarker {
public:
  InflightMarker(std::mutex &mutex, InflightMap &inflight,
                 const std::string &key)
      : mutex_(mutex), inflight_(inflight), key_(key) {}
  ~InflightMarker() {
    std::lock_guard<std::mutex> lock(mutex_);
    inflight_.erase(key_);
  }

  InflightMarker(const InflightMarker &) = delete;
  InflightMarker &operator=(const InflightMarker &) = delete;

private:
  std::mutex &mutex_;
  InflightMap &inflight_;
  const std::string &key_;
};

constexpr const char *kUnknownError = "unknown exception";

} // namespace

namespace cxg {

AnalysisOrchestrator::AnalysisOrchestrator(OrchestratorComponents components)
    : primary_(std::move(components.primary)),
      remote_(std::move(components.remote)),
      cache_(std::move(components.cache)),
      monitor_(std::move(components.monitor)),
      history_(std::move(components.history)),
      history_store_(std::move(components.history_store)),
      logger_(EnsureLogger(std::move(components.logger))),
      clock_(EnsureClock(std::move(components.clock))) {
  if (!cache_) {
    cache_ = std::make_shared<ResultCache>(CacheOptions{}, EstimateSize,
                                           logger_, clock_);
  }
  if (!monitor_) {
    monitor_ =
        std::make_shared<PerformanceMonitor>(MonitorOptions{}, logger_, clock_);
  }
  if (!history_) {
    history_ = std::make_shared<ScanHistory>();
  }
  if (!remote_) {
    remote_ = std::make_unique<RemoteTier>(nullptr, RemoteTierOptions{},
                                           logger_, clock_);
  }
  if (history_store_) {
    LoadHistory();
    writer_ = std::make_unique<HistoryWriter>(history_store_, logger_);
  }
}

AnalysisOrchestrator::~AnalysisOrchestrator() = default;

SharedResult AnalysisOrchestrator::AnalyzeCode(const std::string &content,
                                               const std::string &language,
                                               std::optional<std::string> name,
                                               RequestOptions options) {
  if (language.empty()) {
    throw std::invalid_argument("Language cannot be empty");
  }
  Count(&OrchestratorStats::requests);
  ScopedMeasurement total(*monitor_, "analysis.total",
                          {{"language", language}});

  AnalysisRequest request{content, language, std::move(name),
                          std::move(options)};
  const auto key = ResultCache::GenerateKey(request.content, request.language,
                                            request.options);

  std::promise<SharedResult> promise;
  {
    // The cache lookup shares the lock with the in-flight map so a
    // computation finishing in between is never missed.
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    if (auto cached = ServeFromCache(request, key)) {
      return cached;
    }
    if (const auto pending = inflight_.find(key); pending != inflight_.end()) {
      auto shared = pending->second;
      lock.unlock();
      Count(&OrchestratorStats::coalesced);
      logger_->Log(LogLevel::kDebug, "analysis.coalesced", {{"key", key}});
      return shared.get();
    }
    inflight_.emplace(key, promise.get_future().share());
  }

  const InflightMarker marker(inflight_mutex_, inflight_, key);
  try {
    auto result = Compute(request, key);
    promise.set_value(result);
    return result;
  } catch (const std::exception &error) {
    total.Fail("AnalysisUnavailableError", error.what());
    promise.set_exception(std::current_exception());
    throw;
  } catch (...) {
    // Waiting requests rethrow the same exception.
    total.Fail("AnalysisUnavailableError", kUnknownError);
    promise.set_exception(std::current_exception());
    throw;
  }
}

SharedResult AnalysisOrchestrator::ServeFromCache(const AnalysisRequest &request,
                                                  const std::string &key) {
  auto cached = cache_->Get(key);
  if (!cached) {
    return nullptr;
  }
  cached->provenance = Provenance::kCache;
  cached->latency = std::chrono::microseconds(0);
  cached->source_name = request.name.value_or(kUnknownSource);
  Count(&OrchestratorStats::cache_hits);
  logger_->Log(LogLevel::kDebug, "analysis.cache.hit", {{"key", key}});
  return std::make_shared<const AnalysisResult>(std::move(*cached));
}

SharedResult AnalysisOrchestrator::Compute(const AnalysisRequest &request,
                                           const std::string &key) {
  const auto started = std::chrono::steady_clock::now();
  const auto output = RunFallbackChain(request);
  const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started);

  auto result = std::make_shared<const AnalysisResult>(
      Normalize(output, request, clock_->Now(), latency));
  Count(&OrchestratorStats::computed);

  if (!cache_->Set(key, *result)) {
    logger_->Log(LogLevel::kDebug, "analysis.cache.skipped", {{"key", key}});
  }
  Record(*result);

  logger_->Log(LogLevel::kInfo, "analysis.complete",
               {{"source", result->source_name},
                {"language", request.language},
                {"risk", ToString(result->risk_level)},
                {"provenance", ToString(result->provenance)},
                {"latency_us", std::to_string(result->latency.count())}});
  return result;
}

TierOutput AnalysisOrchestrator::RunFallbackChain(
    const AnalysisRequest &request) {
  if (auto answer = TryPrimary(request)) {
    Count(&OrchestratorStats::modular_answers);
    return std::move(*answer);
  }
  if (auto answer = TryRemote(request)) {
    Count(&OrchestratorStats::remote_answers);
    return std::move(*answer);
  }

  ScopedMeasurement measurement(*monitor_, "analysis.tier.fallback");
  try {
    auto findings = fallback_.Detect(request);
    Count(&OrchestratorStats::fallback_answers);
    return findings;
  } catch (const std::exception &error) {
    measurement.Fail("TierFailure", error.what());
    Count(&OrchestratorStats::tier_failures);
    logger_->Log(LogLevel::kError, "detector.tier.failed",
                 {{"tier", ToString(Provenance::kLocalFallback)},
                  {"error", error.what()}});
    throw AnalysisUnavailableError(
        std::string("All detection tiers failed: ") + error.what());
  }
}

std::optional<TierOutput>
AnalysisOrchestrator::TryPrimary(const AnalysisRequest &request) {
  if (!primary_) {
    return std::nullopt;
  }
  ScopedMeasurement measurement(*monitor_, "analysis.tier.modular",
                                {{"detector", primary_->Name()}});
  try {
    auto findings = primary_->Analyze(request);
    if (!findings) {
      logger_->Log(LogLevel::kDebug, "detector.tier.empty",
                   {{"tier", ToString(Provenance::kModular)},
                    {"detector", primary_->Name()}});
      return std::nullopt;
    }
    return TierOutput{std::move(*findings)};
  } catch (const std::exception &error) {
    measurement.Fail("TierFailure", error.what());
    Count(&OrchestratorStats::tier_failures);
    logger_->Log(LogLevel::kWarn, "detector.tier.failed",
                 {{"tier", ToString(Provenance::kModular)},
                  {"detector", primary_->Name()},
                  {"error", error.what()}});
    return std::nullopt;
  } catch (...) {
    measurement.Fail("TierFailure", kUnknownError);
    Count(&OrchestratorStats::tier_failures);
    logger_->Log(LogLevel::kWarn, "detector.tier.failed",
                 {{"tier", ToString(Provenance::kModular)},
                  {"detector", primary_->Name()},
                  {"error", kUnknownError}});
    return std::nullopt;
  }
}

std::optional<TierOutput>
AnalysisOrchestrator::TryRemote(const AnalysisRequest &request) {
  if (!remote_->Enabled()) {
    return std::nullopt;
  }
  ScopedMeasurement measurement(*monitor_, "analysis.tier.remote");
  try {
    auto findings = remote_->Analyze(request);
    if (!findings) {
      return std::nullopt;
    }
    return TierOutput{std::move(*findings)};
  } catch (const std::exception &error) {
    measurement.Fail("TierFailure", error.what());
    Count(&OrchestratorStats::tier_failures);
    logger_->Log(LogLevel::kWarn, "detector.tier.failed",
                 {{"tier", ToString(Provenance::kRemote)},
                  {"error", error.what()}});
    return std::nullopt;
  } catch (...) {
    measurement.Fail("TierFailure", kUnknownError);
    Count(&OrchestratorStats::tier_failures);
    logger_->Log(LogLevel::kWarn, "detector.tier.failed",
                 {{"tier", ToString(Provenance::kRemote)},
                  {"error", kUnknownError}});
    return std::nullopt;
  }
}

void AnalysisOrchestrator::Record(const AnalysisResult &result) {
  // Snapshots reach the writer in the order their entries were appended.
  std::lock_guard<std::mutex> lock(record_mutex_);
  history_->Append(result);
  if (writer_) {
    writer_->Submit(history_->Snapshot());
  }
}

void AnalysisOrchestrator::LoadHistory() {
  try {
    auto loaded = history_store_->Load();
    const auto count = loaded.size();
    history_->Replace(std::move(loaded));
    logger_->Log(LogLevel::kDebug, "history.restored",
                 {{"entries", std::to_string(count)}});
  } catch (const std::exception &error) {
    logger_->Log(LogLevel::kWarn, "history.load.failed",
                 {{"error", error.what()}});
  }
}

void AnalysisOrchestrator::Count(std::size_t OrchestratorStats::*counter) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++(stats_.*counter);
}

std::vector<AnalysisResult>
AnalysisOrchestrator::RecentScans(std::size_t count) const {
  return history_->Recent(count);
}

SecuritySummary AnalysisOrchestrator::GetSecuritySummary() const {
  return history_->Summary(20);
}

OrchestratorStats AnalysisOrchestrator::Stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

CacheStats AnalysisOrchestrator::GetCacheStats() const {
  return cache_->Stats();
}

CircuitState AnalysisOrchestrator::RemoteState() const {
  return remote_->BreakerState();
}

void AnalysisOrchestrator::FlushHistory() {
  if (writer_) {
    writer_->Flush();
  }
}

} // namespace cxg
