#include <cxg/analysis_orchestrator_builder.h>

#include <cxg/pattern_detector.h>

#include <utility>

namespace cxg {

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithPrimaryDetector(
    std::unique_ptr<PrimaryDetector> primary) {
  primary_ = std::move(primary);
  return *this;
}

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithDetectionService(
    std::shared_ptr<DetectionService> service) {
  service_ = std::move(service);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithRemoteOptions(RemoteTierOptions options) {
  remote_options_ = options;
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithCacheOptions(CacheOptions options) {
  cache_options_ = options;
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithCache(std::shared_ptr<ResultCache> cache) {
  cache_ = std::move(cache);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithMonitorOptions(MonitorOptions options) {
  monitor_options_ = std::move(options);
  return *this;
}

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithMonitor(
    std::shared_ptr<PerformanceMonitor> monitor) {
  monitor_ = std::move(monitor);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithHistoryCapacity(std::size_t capacity) {
  history_capacity_ = capacity;
  return *this;
}

AnalysisOrchestratorBuilder &AnalysisOrchestratorBuilder::WithHistoryStore(
    std::shared_ptr<HistoryStore> store) {
  history_store_ = std::move(store);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  logger_ = std::move(logger);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithClock(std::shared_ptr<Clock> clock) {
  clock_ = std::move(clock);
  return *this;
}

AnalysisOrchestratorBuilder &
AnalysisOrchestratorBuilder::WithConfig(const GuardConfig &config) {
  cache_options_ = config.cache;
  monitor_options_ = config.monitor;
  remote_options_ = config.remote;
  history_capacity_ = config.history.retention.capacity;
  history_config_ = config.history;
  return *this;
}

AnalysisOrchestrator AnalysisOrchestratorBuilder::Build() {
  OrchestratorComponents components;
  components.logger = EnsureLogger(std::move(logger_));
  components.clock = EnsureClock(std::move(clock_));

  components.primary = primary_ ? std::move(primary_)
                                : std::make_unique<PatternDetector>(
                                      PatternDetectorOptions{},
                                      components.logger);
  components.remote = std::make_unique<RemoteTier>(
      std::move(service_), remote_options_, components.logger,
      components.clock);
  components.cache = cache_ ? std::move(cache_)
                            : std::make_shared<ResultCache>(
                                  cache_options_, EstimateSize,
                                  components.logger, components.clock);
  components.monitor =
      monitor_ ? std::move(monitor_)
               : std::make_shared<PerformanceMonitor>(
                     monitor_options_, components.logger, components.clock);
  components.history = std::make_shared<ScanHistory>(history_capacity_);

  if (history_store_) {
    components.history_store = std::move(history_store_);
  } else if (history_config_ && history_config_->path) {
    components.history_store = std::make_shared<FileHistoryStore>(
        *history_config_->path, history_config_->retention, components.logger,
        components.clock);
  }
  return AnalysisOrchestrator(std::move(components));
}

} // namespace cxg
