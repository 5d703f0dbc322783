#pragma once

#include <cxg/analysis_orchestrator.h>
#include <cxg/guard_config.h>

#include <memory>

namespace cxg {

class AnalysisOrchestratorBuilder {
public:
  AnalysisOrchestratorBuilder &
  WithPrimaryDetector(std::unique_ptr<PrimaryDetector> primary);
  AnalysisOrchestratorBuilder &
  WithDetectionService(std::shared_ptr<DetectionService> service);
  AnalysisOrchestratorBuilder &WithRemoteOptions(RemoteTierOptions options);
  AnalysisOrchestratorBuilder &WithCacheOptions(CacheOptions options);
  AnalysisOrchestratorBuilder &WithCache(std::shared_ptr<ResultCache> cache);
  AnalysisOrchestratorBuilder &WithMonitorOptions(MonitorOptions options);
  AnalysisOrchestratorBuilder &
  WithMonitor(std::shared_ptr<PerformanceMonitor> monitor);
  AnalysisOrchestratorBuilder &WithHistoryCapacity(std::size_t capacity);
  AnalysisOrchestratorBuilder &
  WithHistoryStore(std::shared_ptr<HistoryStore> store);
  AnalysisOrchestratorBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalysisOrchestratorBuilder &WithClock(std::shared_ptr<Clock> clock);
  // Copies cache, monitor, remote and history settings. A configured history
  // path attaches a FileHistoryStore.
  AnalysisOrchestratorBuilder &WithConfig(const GuardConfig &config);

  // Missing components fall back to defaults: a PatternDetector, a disabled
  // remote tier, and cache and monitor built from the configured options.
  AnalysisOrchestrator Build();

private:
  std::unique_ptr<PrimaryDetector> primary_;
  std::shared_ptr<DetectionService> service_;
  RemoteTierOptions remote_options_;
  CacheOptions cache_options_;
  std::shared_ptr<ResultCache> cache_;
  MonitorOptions monitor_options_;
  std::shared_ptr<PerformanceMonitor> monitor_;
  std::size_t history_capacity_ = kDefaultScanHistoryCapacity;
  std::shared_ptr<HistoryStore> history_store_;
  std::optional<HistoryConfig> history_config_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Clock> clock_;
};

} // namespace cxg
