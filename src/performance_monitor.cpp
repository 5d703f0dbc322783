#include <cxg/performance_monitor.h>

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <sys/resource.h>
#include <unistd.h>

namespace cxg {
namespace {

constexpr std::size_t kRecentErrorWindow = 100;
constexpr std::size_t kRecentErrorSummary = 10;
constexpr std::int64_t kMemoryTrendBand = 10ll * 1024 * 1024;
constexpr double kFrequentOperationsPerSecond = 10.0;
constexpr double kFrequentOperationMinimumMs = 1000.0;

std::string FormatFixed(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

std::string FormatBytes(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }
  static const char *kUnits[] = {"B", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }
  return FormatFixed(value) + " " + kUnits[unit];
}

std::tm LocalTime(TimePoint time) {
  const auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &seconds);
#else
  localtime_r(&seconds, &tm);
#endif
  return tm;
}

double SecondsBetween(TimePoint earlier, TimePoint later) {
  return std::chrono::duration<double>(later - earlier).count();
}

template <typename Container>
void TrimFront(Container &container, std::size_t limit) {
  while (container.size() > limit) {
    container.pop_front();
  }
}

} // namespace

MemorySnapshot ReadProcessMemory() {
  MemorySnapshot snapshot;
  std::ifstream statm("/proc/self/statm");
  std::uint64_t total_pages = 0;
  std::uint64_t resident_pages = 0;
  if (statm >> total_pages >> resident_pages) {
    const auto page_size = sysconf(_SC_PAGESIZE);
    if (page_size > 0) {
      snapshot.resident_bytes =
          resident_pages * static_cast<std::uint64_t>(page_size);
    }
  }

  rusage usage{};
  if (getrusage(RUSAGE_SELF, &usage) == 0) {
    // ru_maxrss is reported in kilobytes on Linux.
    snapshot.peak_resident_bytes =
        static_cast<std::uint64_t>(usage.ru_maxrss) * 1024;
  }
  if (snapshot.resident_bytes == 0) {
    snapshot.resident_bytes = snapshot.peak_resident_bytes;
  }
  return snapshot;
}

std::string ToString(HotspotImpact impact) {
  switch (impact) {
  case HotspotImpact::kLow:
    return "low";
  case HotspotImpact::kMedium:
    return "medium";
  case HotspotImpact::kHigh:
    return "high";
  }
  return "unknown";
}

std::string ToString(MemoryTrend trend) {
  switch (trend) {
  case MemoryTrend::kIncreasing:
    return "increasing";
  case MemoryTrend::kDecreasing:
    return "decreasing";
  case MemoryTrend::kStable:
    return "stable";
  }
  return "unknown";
}

double Percentile(const std::vector<double> &sorted, double percentile) {
  if (sorted.empty()) {
    return 0.0;
  }
  const auto count = static_cast<long long>(sorted.size());
  auto index =
      static_cast<long long>(std::ceil(static_cast<double>(count) * percentile)) -
      1;
  index = std::clamp(index, 0ll, count - 1);
  return sorted[static_cast<std::size_t>(index)];
}

OperationMetrics ComputeMetrics(const std::deque<Measurement> &samples) {
  OperationMetrics metrics;
  if (samples.empty()) {
    return metrics;
  }

  std::vector<double> durations;
  durations.reserve(samples.size());
  std::size_t errors = 0;
  auto first_start = samples.front().start_time;
  auto last_start = samples.front().start_time;
  for (const auto &sample : samples) {
    if (sample.duration) {
      durations.push_back(sample.duration->count());
    }
    if (sample.error) {
      ++errors;
    }
    first_start = std::min(first_start, sample.start_time);
    last_start = std::max(last_start, sample.start_time);
  }
  std::sort(durations.begin(), durations.end());

  metrics.total_operations = samples.size();
  if (!durations.empty()) {
    double total = 0.0;
    for (const auto duration : durations) {
      total += duration;
    }
    metrics.average_ms = total / static_cast<double>(durations.size());
    metrics.min_ms = durations.front();
    metrics.max_ms = durations.back();
  }
  metrics.p50_ms = Percentile(durations, 0.50);
  metrics.p95_ms = Percentile(durations, 0.95);
  metrics.p99_ms = Percentile(durations, 0.99);

  const auto span =
      samples.size() > 1 ? SecondsBetween(first_start, last_start) : 1.0;
  metrics.operations_per_second =
      span > 0.0 ? static_cast<double>(samples.size()) / span : 0.0;
  metrics.error_rate =
      static_cast<double>(errors) / static_cast<double>(samples.size());
  return metrics;
}

std::vector<Hotspot>
IdentifyHotspots(const std::map<std::string, OperationMetrics> &by_operation,
                 const AlertThresholds &thresholds) {
  std::vector<Hotspot> hotspots;
  for (const auto &[operation, metrics] : by_operation) {
    if (metrics.average_ms > thresholds.slow_operation.count()) {
      hotspots.push_back(
          {operation, HotspotImpact::kHigh,
           "Average duration " + FormatFixed(metrics.average_ms) +
               "ms exceeds threshold. Consider optimization."});
    } else if (metrics.operations_per_second > kFrequentOperationsPerSecond &&
               metrics.average_ms > kFrequentOperationMinimumMs) {
      hotspots.push_back({operation, HotspotImpact::kMedium,
                          "High frequency operation with " +
                              FormatFixed(metrics.average_ms) +
                              "ms duration. Consider caching."});
    } else if (metrics.error_rate > thresholds.error_rate) {
      hotspots.push_back({operation, HotspotImpact::kHigh,
                          "Error rate " +
                              FormatFixed(metrics.error_rate * 100.0) +
                              "% is above threshold. Investigate error "
                              "causes."});
    }
  }
  std::stable_sort(hotspots.begin(), hotspots.end(),
                   [](const Hotspot &left, const Hotspot &right) {
                     return static_cast<int>(left.impact) >
                            static_cast<int>(right.impact);
                   });
  return hotspots;
}

PerformanceMonitor::PerformanceMonitor(MonitorOptions options,
                                       std::shared_ptr<Logger> logger,
                                       std::shared_ptr<Clock> clock)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))),
      clock_(EnsureClock(std::move(clock))) {
  if (options_.max_measurements == 0) {
    throw std::invalid_argument("Monitor max_measurements must be positive");
  }
  if (options_.cleanup_interval.count() <= 0) {
    throw std::invalid_argument("Monitor cleanup_interval must be positive");
  }
  if (options_.thresholds.error_rate < 0.0 ||
      options_.thresholds.error_rate > 1.0) {
    throw std::invalid_argument("Monitor error_rate must be within [0, 1]");
  }
  if (!options_.memory_probe) {
    options_.memory_probe = ReadProcessMemory;
  }
  if (options_.enable_memory_tracking) {
    memory_baseline_ = options_.memory_probe();
  }
  last_cleanup_ = clock_->Now();
}

MeasurementId PerformanceMonitor::StartMeasurement(
    const std::string &operation, MeasurementMetadata metadata,
    std::vector<std::string> tags) {
  const auto now = clock_->Now();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = next_id_++;
  Measurement measurement;
  measurement.id = id;
  measurement.operation = operation;
  measurement.start_time = now;
  measurement.metadata = std::move(metadata);
  measurement.tags = std::move(tags);
  open_.emplace(id, std::move(measurement));
  return id;
}

std::optional<Measurement>
PerformanceMonitor::EndMeasurement(MeasurementId id,
                                   std::optional<MeasurementError> error) {
  try {
    const auto now = clock_->Now();
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = open_.find(id);
    if (found == open_.end()) {
      logger_->Log(LogLevel::kWarn, "monitor.measurement.unknown",
                   {{"id", std::to_string(id)}});
      return std::nullopt;
    }

    auto measurement = std::move(found->second);
    open_.erase(found);
    measurement.end_time = now;
    measurement.duration =
        std::chrono::duration_cast<Milliseconds>(now - measurement.start_time);
    if (error) {
      measurement.error = std::move(error);
      ++error_count_;
    }
    ++total_operations_;

    history_.push_back(measurement);
    TrimFront(history_, options_.max_measurements);
    by_operation_[measurement.operation].push_back(measurement);

    CheckAlertsLocked(measurement);
    if (options_.enable_trend_analysis) {
      UpdateTrendsLocked(measurement);
    }
    if (now - last_cleanup_ >= options_.cleanup_interval) {
      CompactLocked(now);
    }
    return measurement;
  } catch (const std::exception &failure) {
    logger_->Log(LogLevel::kWarn, "monitor.measurement.failed",
                 {{"id", std::to_string(id)}, {"error", failure.what()}});
    return std::nullopt;
  }
}

void PerformanceMonitor::CheckAlertsLocked(const Measurement &measurement) {
  if (measurement.duration &&
      *measurement.duration > options_.thresholds.slow_operation) {
    ++alert_count_;
    logger_->Log(LogLevel::kWarn, "monitor.alert.slow_operation",
                 {{"operation", measurement.operation},
                  {"duration_ms", FormatFixed(measurement.duration->count())}});
  }

  if (options_.enable_memory_tracking) {
    const auto memory = options_.memory_probe();
    if (memory.resident_bytes > options_.thresholds.high_memory_bytes) {
      ++alert_count_;
      logger_->Log(LogLevel::kWarn, "monitor.alert.high_memory",
                   {{"resident", FormatBytes(memory.resident_bytes)}});
    }
  }

  const auto error_rate = RecentErrorRateLocked();
  if (error_rate > options_.thresholds.error_rate) {
    ++alert_count_;
    logger_->Log(LogLevel::kWarn, "monitor.alert.error_rate",
                 {{"error_rate", FormatFixed(error_rate * 100.0) + "%"}});
  }
}

double PerformanceMonitor::RecentErrorRateLocked() const {
  if (history_.empty()) {
    return 0.0;
  }
  const auto window = std::min(kRecentErrorWindow, history_.size());
  std::size_t errors = 0;
  for (auto it = history_.end() - static_cast<std::ptrdiff_t>(window);
       it != history_.end(); ++it) {
    if (it->error) {
      ++errors;
    }
  }
  return static_cast<double>(errors) / static_cast<double>(window);
}

void PerformanceMonitor::UpdateTrendsLocked(const Measurement &measurement) {
  if (!measurement.duration || !measurement.end_time) {
    return;
  }
  const auto tm = LocalTime(*measurement.end_time);
  const auto duration = measurement.duration->count();
  trends_.hourly[static_cast<std::size_t>(tm.tm_hour) % trends_.hourly.size()] +=
      duration;
  trends_.daily[static_cast<std::size_t>(tm.tm_wday) % trends_.daily.size()] +=
      duration;
  trends_.weekly[static_cast<std::size_t>(tm.tm_mday / 7) %
                 trends_.weekly.size()] += duration;
}

void PerformanceMonitor::CompactLocked(TimePoint now) {
  TrimFront(history_, options_.max_measurements);
  const auto per_operation_limit =
      std::max<std::size_t>(1, options_.max_measurements / 10);
  for (auto &[operation, series] : by_operation_) {
    TrimFront(series, per_operation_limit);
  }
  last_cleanup_ = now;
  logger_->Log(LogLevel::kDebug, "monitor.compact",
               {{"archived", std::to_string(history_.size())},
                {"operations", std::to_string(by_operation_.size())}});
}

void PerformanceMonitor::Compact() {
  const auto now = clock_->Now();
  std::lock_guard<std::mutex> lock(mutex_);
  CompactLocked(now);
}

std::map<std::string, OperationMetrics>
PerformanceMonitor::MetricsByOperationLocked() const {
  std::map<std::string, OperationMetrics> metrics;
  for (const auto &[operation, series] : by_operation_) {
    metrics.emplace(operation, ComputeMetrics(series));
  }
  return metrics;
}

PerformanceStats PerformanceMonitor::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PerformanceStats stats;
  stats.overall = ComputeMetrics(history_);
  stats.by_operation = MetricsByOperationLocked();
  const auto recent = std::min(options_.recent_sample_size, history_.size());
  stats.recent.assign(history_.end() - static_cast<std::ptrdiff_t>(recent),
                      history_.end());
  stats.trends = trends_;
  stats.hotspots = IdentifyHotspots(stats.by_operation, options_.thresholds);
  return stats;
}

std::optional<OperationMetrics>
PerformanceMonitor::GetOperationMetrics(const std::string &operation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto found = by_operation_.find(operation);
  if (found == by_operation_.end() || found->second.empty()) {
    return std::nullopt;
  }
  return ComputeMetrics(found->second);
}

std::vector<Measurement>
PerformanceMonitor::GetSlowOperations(
    std::optional<Milliseconds> threshold) const {
  const auto limit = threshold.value_or(options_.thresholds.slow_operation);
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Measurement> slow;
  for (const auto &measurement : history_) {
    if (measurement.duration && *measurement.duration > limit) {
      slow.push_back(measurement);
    }
  }
  std::stable_sort(slow.begin(), slow.end(),
                   [](const Measurement &left, const Measurement &right) {
                     return *left.duration > *right.duration;
                   });
  return slow;
}

ErrorSummary PerformanceMonitor::GetErrorSummary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ErrorSummary summary;
  summary.total_errors = error_count_;
  summary.error_rate =
      total_operations_ > 0
          ? static_cast<double>(error_count_) /
                static_cast<double>(total_operations_)
          : 0.0;
  std::vector<Measurement> failed;
  for (const auto &measurement : history_) {
    if (!measurement.error) {
      continue;
    }
    const auto &type =
        measurement.error->type.empty() ? "Unknown" : measurement.error->type;
    ++summary.errors_by_type[type];
    failed.push_back(measurement);
  }
  const auto recent = std::min(kRecentErrorSummary, failed.size());
  summary.recent_errors.assign(
      failed.end() - static_cast<std::ptrdiff_t>(recent), failed.end());
  return summary;
}

MemoryUsage PerformanceMonitor::GetMemoryUsage() const {
  MemoryUsage usage;
  usage.current = options_.memory_probe();
  std::lock_guard<std::mutex> lock(mutex_);
  usage.baseline = memory_baseline_;
  if (memory_baseline_) {
    const auto delta =
        static_cast<std::int64_t>(usage.current.resident_bytes) -
        static_cast<std::int64_t>(memory_baseline_->resident_bytes);
    usage.resident_delta_bytes = delta;
    if (delta > kMemoryTrendBand) {
      usage.trend = MemoryTrend::kIncreasing;
    } else if (delta < -kMemoryTrendBand) {
      usage.trend = MemoryTrend::kDecreasing;
    }
  }
  return usage;
}

std::string PerformanceMonitor::GenerateReport() const {
  const auto stats = GetStats();
  const auto memory = GetMemoryUsage();
  const auto errors = GetErrorSummary();

  std::ostringstream report;
  report << "# Performance Report\n\n";
  report << "## Overall Metrics\n";
  report << "- **Total Operations**: " << stats.overall.total_operations
         << "\n";
  report << "- **Average Duration**: " << FormatFixed(stats.overall.average_ms)
         << "ms\n";
  report << "- **p95 Duration**: " << FormatFixed(stats.overall.p95_ms)
         << "ms\n";
  report << "- **Operations/Second**: "
         << FormatFixed(stats.overall.operations_per_second) << "\n";
  report << "- **Error Rate**: "
         << FormatFixed(stats.overall.error_rate * 100.0) << "%\n\n";

  report << "## Memory Usage\n";
  report << "- **Resident**: " << FormatBytes(memory.current.resident_bytes)
         << "\n";
  report << "- **Peak Resident**: "
         << FormatBytes(memory.current.peak_resident_bytes) << "\n";
  report << "- **Memory Trend**: " << ToString(memory.trend) << "\n\n";

  std::vector<std::pair<std::string, OperationMetrics>> slowest(
      stats.by_operation.begin(), stats.by_operation.end());
  std::stable_sort(slowest.begin(), slowest.end(),
                   [](const auto &left, const auto &right) {
                     return left.second.average_ms > right.second.average_ms;
                   });
  report << "## Top Operations by Duration\n";
  for (std::size_t i = 0; i < slowest.size() && i < 5; ++i) {
    report << "- **" << slowest[i].first
           << "**: " << FormatFixed(slowest[i].second.average_ms)
           << "ms avg\n";
  }

  report << "\n## Performance Hotspots\n";
  for (const auto &hotspot : stats.hotspots) {
    report << "- **" << hotspot.operation << "** (" << ToString(hotspot.impact)
           << "): " << hotspot.recommendation << "\n";
  }

  report << "\n## Recent Errors\n";
  for (std::size_t i = 0; i < errors.recent_errors.size() && i < 3; ++i) {
    const auto &failed = errors.recent_errors[i];
    report << "- " << failed.operation << ": " << failed.error->message << " ("
           << FormatFixed(failed.duration ? failed.duration->count() : 0.0)
           << "ms)\n";
  }
  return report.str();
}

void PerformanceMonitor::Reset() {
  const auto now = clock_->Now();
  std::lock_guard<std::mutex> lock(mutex_);
  open_.clear();
  history_.clear();
  by_operation_.clear();
  error_count_ = 0;
  total_operations_ = 0;
  alert_count_ = 0;
  trends_ = TrendData{};
  memory_baseline_.reset();
  if (options_.enable_memory_tracking) {
    memory_baseline_ = options_.memory_probe();
  }
  last_cleanup_ = now;
}

std::size_t PerformanceMonitor::OpenMeasurements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_.size();
}

std::size_t PerformanceMonitor::ArchivedMeasurements() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

std::size_t PerformanceMonitor::AlertCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return alert_count_;
}

ScopedMeasurement::ScopedMeasurement(PerformanceMonitor &monitor,
                                     const std::string &operation,
                                     MeasurementMetadata metadata)
    : monitor_(&monitor),
      id_(monitor.StartMeasurement(operation, std::move(metadata))) {}

ScopedMeasurement::~ScopedMeasurement() { Finish(); }

void ScopedMeasurement::Fail(std::string type, std::string message) {
  error_ = MeasurementError{std::move(type), std::move(message)};
}

std::optional<Measurement> ScopedMeasurement::Finish() {
  if (finished_) {
    return std::nullopt;
  }
  finished_ = true;
  return monitor_->EndMeasurement(id_, std::move(error_));
}

} // namespace cxg
