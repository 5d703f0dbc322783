#pragma once

#include <cxg/cache_store.h>
#include <cxg/clock.h>
#include <cxg/heuristic_fallback_detector.h>
#include <cxg/history_store.h>
#include <cxg/history_writer.h>
#include <cxg/interfaces.h>
#include <cxg/logging.h>
#include <cxg/models.h>
#include <cxg/performance_monitor.h>
#include <cxg/remote_tier.h>
#include <cxg/scan_history.h>

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cxg {

using ResultCache = CacheStore<AnalysisResult>;
using SharedResult = std::shared_ptr<const AnalysisResult>;

// Raised only when every detection tier failed for a request.
class AnalysisUnavailableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct OrchestratorStats {
  std::size_t requests = 0;
  std::size_t cache_hits = 0;
  std::size_t coalesced = 0;
  std::size_t computed = 0;
  std::size_t modular_answers = 0;
  std::size_t remote_answers = 0;
  std::size_t fallback_answers = 0;
  std::size_t tier_failures = 0;
};

struct OrchestratorComponents {
  std::unique_ptr<PrimaryDetector> primary;
  std::unique_ptr<RemoteTier> remote;
  std::shared_ptr<ResultCache> cache;
  std::shared_ptr<PerformanceMonitor> monitor;
  std::shared_ptr<ScanHistory> history;
  // Optional. Without a store the scan log lives in memory only.
  std::shared_ptr<HistoryStore> history_store;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<Clock> clock;
};

// Produces analysis results through the detector fallback chain
// (primary, remote, heuristic) with result caching and coalescing of
// concurrent requests that share a fingerprint.
class AnalysisOrchestrator {
public:
  explicit AnalysisOrchestrator(OrchestratorComponents components);
  ~AnalysisOrchestrator();

  AnalysisOrchestrator(const AnalysisOrchestrator &) = delete;
  AnalysisOrchestrator &operator=(const AnalysisOrchestrator &) = delete;

  // Concurrent callers with the same content, language and options receive
  // the same result instance from a single computation. A cached answer is
  // returned as a copy tagged with the cache provenance and zero latency.
  SharedResult AnalyzeCode(const std::string &content,
                           const std::string &language,
                           std::optional<std::string> name = std::nullopt,
                           RequestOptions options = {});

  std::vector<AnalysisResult> RecentScans(std::size_t count = 10) const;
  SecuritySummary GetSecuritySummary() const;
  OrchestratorStats Stats() const;
  CacheStats GetCacheStats() const;
  CircuitState RemoteState() const;

  PerformanceMonitor &Monitor() { return *monitor_; }
  const PerformanceMonitor &Monitor() const { return *monitor_; }
  ResultCache &Cache() { return *cache_; }

  // Waits for queued history writes. A no-op without a history store.
  void FlushHistory();

private:
  SharedResult ServeFromCache(const AnalysisRequest &request,
                              const std::string &key);
  SharedResult Compute(const AnalysisRequest &request, const std::string &key);
  TierOutput RunFallbackChain(const AnalysisRequest &request);
  std::optional<TierOutput> TryPrimary(const AnalysisRequest &request);
  std::optional<TierOutput> TryRemote(const AnalysisRequest &request);
  void Record(const AnalysisResult &result);
  void LoadHistory();

  void Count(std::size_t OrchestratorStats::*counter);

  std::unique_ptr<PrimaryDetector> primary_;
  std::unique_ptr<RemoteTier> remote_;
  HeuristicFallbackDetector fallback_;
  std::shared_ptr<ResultCache> cache_;
  std::shared_ptr<PerformanceMonitor> monitor_;
  std::shared_ptr<ScanHistory> history_;
  std::shared_ptr<HistoryStore> history_store_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Clock> clock_;
  std::unique_ptr<HistoryWriter> writer_;
  std::mutex record_mutex_;

  std::mutex inflight_mutex_;
  std::unordered_map<std::string, std::shared_future<SharedResult>> inflight_;

  mutable std::mutex stats_mutex_;
  OrchestratorStats stats_;
};

} // namespace cxg
