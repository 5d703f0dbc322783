#pragma once

#include <cxg/clock.h>
#include <cxg/logging.h>
#include <cxg/models.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cxg {

struct CacheOptions {
  std::size_t max_size_bytes = 50 * 1024 * 1024;
  std::size_t max_entries = 1000;
  std::chrono::milliseconds default_ttl = std::chrono::minutes(30);
  std::chrono::milliseconds cleanup_interval = std::chrono::minutes(5);
  double hit_weight = 0.3;
  double recency_weight = 0.7;
};

struct CacheStats {
  std::size_t total_entries = 0;
  std::size_t total_size = 0;
  double hit_rate = 0.0;
  double miss_rate = 0.0;
  std::size_t eviction_count = 0;
  std::optional<TimePoint> oldest_entry;
  std::optional<TimePoint> newest_entry;
};

// Throws std::invalid_argument on bounds that cannot describe a cache.
void ValidateCacheOptions(const CacheOptions &options);

// Deterministic fingerprint of a request. The options map is ordered, so the
// key does not depend on the order in which options were inserted.
std::string GenerateCacheKey(const std::string &content,
                             const std::string &language,
                             const RequestOptions &options = {});

// Lower scores are evicted first. The recency term is the insertion time and
// is never refreshed by reads.
double EvictionScore(std::size_t hits, TimePoint created_at,
                     const CacheOptions &options);

// Matches keys against an ECMAScript pattern, or as a plain substring when
// the pattern does not compile.
std::function<bool(const std::string &)>
MakeKeyMatcher(const std::string &pattern);

template <typename T> class CacheStore {
public:
  using SizeEstimator = std::function<std::size_t(const T &)>;

  struct WarmupEntry {
    std::string key;
    T payload;
    std::optional<std::chrono::milliseconds> ttl;
  };

  CacheStore(CacheOptions options, SizeEstimator estimator,
             std::shared_ptr<Logger> logger = nullptr,
             std::shared_ptr<Clock> clock = nullptr)
      : options_(std::move(options)), estimator_(std::move(estimator)),
        logger_(EnsureLogger(std::move(logger))),
        clock_(EnsureClock(std::move(clock))) {
    ValidateCacheOptions(options_);
    if (!estimator_) {
      throw std::invalid_argument("Cache size estimator cannot be null");
    }
    last_optimize_ = clock_->Now();
  }

  CacheStore(const CacheStore &) = delete;
  CacheStore &operator=(const CacheStore &) = delete;

  static std::string GenerateKey(const std::string &content,
                                 const std::string &language,
                                 const RequestOptions &options = {}) {
    return GenerateCacheKey(content, language, options);
  }

  std::optional<T> Get(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = entries_.find(key);
    if (found == entries_.end()) {
      ++misses_;
      return std::nullopt;
    }
    if (IsExpired(found->second, clock_->Now())) {
      RemoveLocked(found);
      ++misses_;
      return std::nullopt;
    }
    ++found->second.hits;
    ++hits_;
    return found->second.payload;
  }

  // Returns false when the payload was rejected. Never throws.
  bool Set(const std::string &key, T payload,
           std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
    try {
      const auto size = estimator_(payload);
      std::lock_guard<std::mutex> lock(mutex_);
      return SetLocked(key, std::move(payload), ttl, size);
    } catch (const std::exception &error) {
      logger_->Log(LogLevel::kWarn, "cache.set.failed",
                   {{"key", key}, {"error", error.what()}});
      return false;
    }
  }

  bool Has(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = entries_.find(key);
    if (found == entries_.end()) {
      return false;
    }
    if (IsExpired(found->second, clock_->Now())) {
      RemoveLocked(found);
      return false;
    }
    return true;
  }

  bool Delete(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto found = entries_.find(key);
    if (found == entries_.end()) {
      return false;
    }
    RemoveLocked(found);
    return true;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    total_size_ = 0;
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
  }

  std::size_t Invalidate(const std::string &pattern) {
    const auto matches = MakeKeyMatcher(pattern);
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (matches(it->first)) {
        total_size_ -= it->second.size;
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    if (removed > 0) {
      logger_->Log(LogLevel::kDebug, "cache.invalidate",
                   {{"pattern", pattern},
                    {"removed", std::to_string(removed)}});
    }
    return removed;
  }

  std::vector<std::string> Keys(const std::string &pattern = "") const {
    const auto matches = MakeKeyMatcher(pattern);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (const auto &entry : entries_) {
      if (pattern.empty() || matches(entry.first)) {
        keys.push_back(entry.first);
      }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
  }

  std::size_t PruneExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return PruneExpiredLocked(clock_->Now());
  }

  void Optimize() {
    std::lock_guard<std::mutex> lock(mutex_);
    OptimizeLocked(clock_->Now());
  }

  void Warmup(std::vector<WarmupEntry> entries) {
    for (auto &entry : entries) {
      Set(entry.key, std::move(entry.payload), entry.ttl);
    }
  }

  CacheStats Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.total_entries = entries_.size();
    stats.total_size = total_size_;
    const auto requests = hits_ + misses_;
    if (requests > 0) {
      stats.hit_rate = static_cast<double>(hits_) / requests;
      stats.miss_rate = static_cast<double>(misses_) / requests;
    }
    stats.eviction_count = evictions_;
    for (const auto &entry : entries_) {
      const auto created = entry.second.created_at;
      if (!stats.oldest_entry || created < *stats.oldest_entry) {
        stats.oldest_entry = created;
      }
      if (!stats.newest_entry || created > *stats.newest_entry) {
        stats.newest_entry = created;
      }
    }
    return stats;
  }

  const CacheOptions &Options() const { return options_; }

private:
  struct Entry {
    T payload;
    TimePoint created_at;
    std::chrono::milliseconds ttl;
    std::size_t hits = 0;
    std::size_t size = 0;
  };
  using EntryMap = std::unordered_map<std::string, Entry>;

  bool IsExpired(const Entry &entry, TimePoint now) const {
    return now - entry.created_at > entry.ttl;
  }

  bool OverBounds() const {
    return entries_.size() > options_.max_entries ||
           total_size_ > options_.max_size_bytes;
  }

  bool SetLocked(const std::string &key, T payload,
                 std::optional<std::chrono::milliseconds> ttl,
                 std::size_t size) {
    if (size > options_.max_size_bytes) {
      logger_->Log(LogLevel::kWarn, "cache.set.rejected",
                   {{"key", key},
                    {"size", std::to_string(size)},
                    {"max_size", std::to_string(options_.max_size_bytes)}});
      return false;
    }

    const auto now = clock_->Now();
    if (now - last_optimize_ >= options_.cleanup_interval) {
      OptimizeLocked(now);
    }

    if (const auto existing = entries_.find(key); existing != entries_.end()) {
      RemoveLocked(existing);
    }

    while ((entries_.size() >= options_.max_entries ||
            total_size_ + size > options_.max_size_bytes) &&
           !entries_.empty()) {
      EvictLowestScoredLocked();
    }

    const auto entry_ttl = ttl && ttl->count() > 0 ? *ttl : options_.default_ttl;
    entries_.emplace(key, Entry{std::move(payload), now, entry_ttl, 0, size});
    total_size_ += size;
    return true;
  }

  void RemoveLocked(typename EntryMap::iterator position) {
    total_size_ -= position->second.size;
    entries_.erase(position);
  }

  typename EntryMap::iterator LowestScoredLocked() {
    auto lowest = entries_.end();
    double lowest_score = std::numeric_limits<double>::infinity();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      const auto score =
          EvictionScore(it->second.hits, it->second.created_at, options_);
      if (score < lowest_score ||
          (score == lowest_score && lowest != entries_.end() &&
           it->first < lowest->first)) {
        lowest_score = score;
        lowest = it;
      }
    }
    return lowest;
  }

  void EvictLowestScoredLocked() {
    const auto victim = LowestScoredLocked();
    if (victim == entries_.end()) {
      return;
    }
    logger_->Log(LogLevel::kDebug, "cache.evict", {{"key", victim->first}});
    RemoveLocked(victim);
    ++evictions_;
  }

  std::size_t PruneExpiredLocked(TimePoint now) {
    std::size_t pruned = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (IsExpired(it->second, now)) {
        total_size_ -= it->second.size;
        it = entries_.erase(it);
        ++pruned;
      } else {
        ++it;
      }
    }
    return pruned;
  }

  void OptimizeLocked(TimePoint now) {
    const auto pruned = PruneExpiredLocked(now);
    std::size_t evicted = 0;
    while (OverBounds() && !entries_.empty()) {
      EvictLowestScoredLocked();
      ++evicted;
    }
    last_optimize_ = now;
    logger_->Log(LogLevel::kDebug, "cache.optimize",
                 {{"pruned", std::to_string(pruned)},
                  {"evicted", std::to_string(evicted)},
                  {"entries", std::to_string(entries_.size())}});
  }

  CacheOptions options_;
  SizeEstimator estimator_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex mutex_;
  EntryMap entries_;
  std::size_t total_size_ = 0;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
  std::size_t evictions_ = 0;
  TimePoint last_optimize_;
};

} // namespace cxg
