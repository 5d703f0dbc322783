#pragma once

#include <cxg/clock.h>
#include <cxg/logging.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cxg {

using Milliseconds = std::chrono::duration<double, std::milli>;
using MeasurementId = std::uint64_t;
using MeasurementMetadata = std::map<std::string, std::string>;

struct MeasurementError {
  std::string type;
  std::string message;
};

struct Measurement {
  MeasurementId id = 0;
  std::string operation;
  TimePoint start_time;
  std::optional<TimePoint> end_time;
  std::optional<Milliseconds> duration;
  MeasurementMetadata metadata;
  std::vector<std::string> tags;
  std::optional<MeasurementError> error;
};

struct AlertThresholds {
  Milliseconds slow_operation{5000.0};
  std::uint64_t high_memory_bytes = 500ull * 1024 * 1024;
  double error_rate = 0.05;
};

struct MemorySnapshot {
  std::uint64_t resident_bytes = 0;
  std::uint64_t peak_resident_bytes = 0;
};

using MemoryProbe = std::function<MemorySnapshot()>;

// Resident set of the current process from /proc/self/statm, peak from
// getrusage. Fields stay zero when the platform offers neither.
MemorySnapshot ReadProcessMemory();

struct MonitorOptions {
  std::size_t max_measurements = 10000;
  bool enable_memory_tracking = true;
  bool enable_trend_analysis = true;
  AlertThresholds thresholds;
  std::chrono::milliseconds cleanup_interval = std::chrono::minutes(5);
  std::size_t recent_sample_size = 50;
  MemoryProbe memory_probe;
};

struct OperationMetrics {
  std::size_t total_operations = 0;
  double average_ms = 0.0;
  double min_ms = 0.0;
  double max_ms = 0.0;
  double p50_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
  double operations_per_second = 0.0;
  double error_rate = 0.0;
};

enum class HotspotImpact { kLow = 1, kMedium = 2, kHigh = 3 };

struct Hotspot {
  std::string operation;
  HotspotImpact impact = HotspotImpact::kLow;
  std::string recommendation;
};

struct TrendData {
  std::array<double, 24> hourly{};
  std::array<double, 7> daily{};
  std::array<double, 4> weekly{};
};

struct PerformanceStats {
  OperationMetrics overall;
  std::map<std::string, OperationMetrics> by_operation;
  std::vector<Measurement> recent;
  TrendData trends;
  std::vector<Hotspot> hotspots;
};

struct ErrorSummary {
  std::size_t total_errors = 0;
  double error_rate = 0.0;
  std::map<std::string, std::size_t> errors_by_type;
  std::vector<Measurement> recent_errors;
};

enum class MemoryTrend { kIncreasing, kDecreasing, kStable };

struct MemoryUsage {
  MemorySnapshot current;
  std::optional<MemorySnapshot> baseline;
  std::optional<std::int64_t> resident_delta_bytes;
  MemoryTrend trend = MemoryTrend::kStable;
};

std::string ToString(HotspotImpact impact);
std::string ToString(MemoryTrend trend);

// `sorted` must be ascending. Index is ceil(n * p) - 1 clamped to [0, n - 1].
double Percentile(const std::vector<double> &sorted, double percentile);

OperationMetrics ComputeMetrics(const std::deque<Measurement> &samples);

// First matching rule wins per operation; result is ordered by impact.
std::vector<Hotspot>
IdentifyHotspots(const std::map<std::string, OperationMetrics> &by_operation,
                 const AlertThresholds &thresholds);

class PerformanceMonitor {
public:
  explicit PerformanceMonitor(MonitorOptions options = {},
                              std::shared_ptr<Logger> logger = nullptr,
                              std::shared_ptr<Clock> clock = nullptr);

  PerformanceMonitor(const PerformanceMonitor &) = delete;
  PerformanceMonitor &operator=(const PerformanceMonitor &) = delete;

  MeasurementId StartMeasurement(const std::string &operation,
                                 MeasurementMetadata metadata = {},
                                 std::vector<std::string> tags = {});
  // Unknown ids are logged and ignored. Never throws.
  std::optional<Measurement>
  EndMeasurement(MeasurementId id,
                 std::optional<MeasurementError> error = std::nullopt);

  PerformanceStats GetStats() const;
  std::optional<OperationMetrics>
  GetOperationMetrics(const std::string &operation) const;
  std::vector<Measurement>
  GetSlowOperations(std::optional<Milliseconds> threshold = std::nullopt) const;
  ErrorSummary GetErrorSummary() const;
  MemoryUsage GetMemoryUsage() const;
  std::string GenerateReport() const;

  void Compact();
  void Reset();

  std::size_t OpenMeasurements() const;
  std::size_t ArchivedMeasurements() const;
  std::size_t AlertCount() const;
  const MonitorOptions &Options() const { return options_; }

private:
  void CheckAlertsLocked(const Measurement &measurement);
  void UpdateTrendsLocked(const Measurement &measurement);
  void CompactLocked(TimePoint now);
  double RecentErrorRateLocked() const;
  std::map<std::string, OperationMetrics> MetricsByOperationLocked() const;

  MonitorOptions options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex mutex_;
  MeasurementId next_id_ = 1;
  std::unordered_map<MeasurementId, Measurement> open_;
  std::deque<Measurement> history_;
  std::map<std::string, std::deque<Measurement>> by_operation_;
  std::size_t error_count_ = 0;
  std::size_t total_operations_ = 0;
  std::size_t alert_count_ = 0;
  TrendData trends_;
  std::optional<MemorySnapshot> memory_baseline_;
  TimePoint last_cleanup_;
};

// Ends its measurement when it goes out of scope.
class ScopedMeasurement {
public:
  ScopedMeasurement(PerformanceMonitor &monitor, const std::string &operation,
                    MeasurementMetadata metadata = {});
  ~ScopedMeasurement();

  ScopedMeasurement(const ScopedMeasurement &) = delete;
  ScopedMeasurement &operator=(const ScopedMeasurement &) = delete;

  void Fail(std::string type, std::string message);
  std::optional<Measurement> Finish();

private:
  PerformanceMonitor *monitor_;
  MeasurementId id_;
  std::optional<MeasurementError> error_;
  bool finished_ = false;
};

} // namespace cxg
