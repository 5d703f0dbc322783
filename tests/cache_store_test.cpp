#include <cxg/cache_store.h>

#include "test_support/manual_clock.h"
#include "test_support/recording_logger.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cxg {
namespace {

using ::testing::ElementsAre;
using namespace std::chrono_literals;

using StringCache = CacheStore<std::string>;

class CacheStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<StringCache> MakeCache(CacheOptions options = {}) {
    return std::make_unique<StringCache>(
        options, [](const std::string &value) { return value.size(); }, logger_,
        clock_);
  }

  std::shared_ptr<test::ManualClock> clock_ =
      std::make_shared<test::ManualClock>();
  std::shared_ptr<test::RecordingLogger> logger_ =
      std::make_shared<test::RecordingLogger>();
};

TEST_F(CacheStoreTest, KeysAreDeterministicFingerprints) {
  const auto first = StringCache::GenerateKey("const a = 1;", "javascript");
  const auto second = StringCache::GenerateKey("const a = 1;", "javascript");

  EXPECT_EQ(first, second);
  EXPECT_NE(first, StringCache::GenerateKey("const a = 1;", "typescript"));
  EXPECT_NE(first, StringCache::GenerateKey("const a = 2;", "javascript"));
  EXPECT_NE(first, StringCache::GenerateKey("const a = 1;", "javascript",
                                            {{"mode", "strict"}}));
  EXPECT_EQ(0u, first.rfind("analysis_", 0));
}

TEST_F(CacheStoreTest, OptionInsertionOrderDoesNotChangeKey) {
  RequestOptions forward;
  forward["alpha"] = "1";
  forward["beta"] = "2";
  RequestOptions backward;
  backward["beta"] = "2";
  backward["alpha"] = "1";

  EXPECT_EQ(StringCache::GenerateKey("x", "go", forward),
            StringCache::GenerateKey("x", "go", backward));
}

TEST_F(CacheStoreTest, ReturnsStoredPayloadAndTracksHitRate) {
  auto cache = MakeCache();

  EXPECT_FALSE(cache->Get("missing").has_value());
  ASSERT_TRUE(cache->Set("key", "payload"));
  const auto value = cache->Get("key");

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ("payload", *value);
  const auto stats = cache->Stats();
  EXPECT_EQ(1u, stats.total_entries);
  EXPECT_EQ(7u, stats.total_size);
  EXPECT_DOUBLE_EQ(0.5, stats.hit_rate);
  EXPECT_DOUBLE_EQ(0.5, stats.miss_rate);
}

TEST_F(CacheStoreTest, EntriesExpireOnlyAfterTheirTtl) {
  auto cache = MakeCache();
  ASSERT_TRUE(cache->Set("key", "payload", 1000ms));

  clock_->Advance(1000ms);
  EXPECT_TRUE(cache->Has("key"));

  clock_->Advance(1ms);
  EXPECT_FALSE(cache->Get("key").has_value());
  EXPECT_EQ(0u, cache->Stats().total_entries);
}

TEST_F(CacheStoreTest, NonPositiveTtlFallsBackToDefault) {
  CacheOptions options;
  options.default_ttl = 10s;
  auto cache = MakeCache(options);
  ASSERT_TRUE(cache->Set("key", "payload", 0ms));

  clock_->Advance(5s);
  EXPECT_TRUE(cache->Has("key"));
  clock_->Advance(6s);
  EXPECT_FALSE(cache->Has("key"));
}

TEST_F(CacheStoreTest, EvictsOldestEntryWhenNothingWasRead) {
  CacheOptions options;
  options.max_entries = 2;
  auto cache = MakeCache(options);

  cache->Set("first", "1");
  clock_->Advance(1s);
  cache->Set("second", "2");
  clock_->Advance(1s);
  cache->Set("third", "3");

  EXPECT_THAT(cache->Keys(), ElementsAre("second", "third"));
  EXPECT_EQ(1u, cache->Stats().eviction_count);
}

TEST_F(CacheStoreTest, HitsProtectEntriesFromEviction) {
  CacheOptions options;
  options.max_entries = 2;
  auto cache = MakeCache(options);

  cache->Set("first", "1");
  clock_->Advance(1s);
  cache->Set("second", "2");
  ASSERT_TRUE(cache->Get("first").has_value());
  clock_->Advance(1s);
  cache->Set("third", "3");

  EXPECT_TRUE(cache->Has("first"));
  EXPECT_FALSE(cache->Has("second"));
  EXPECT_TRUE(cache->Has("third"));
}

TEST_F(CacheStoreTest, ScoreWeighsHitsOnTopOfInsertionTime) {
  const auto created = clock_->Now();
  const CacheOptions options;

  EXPECT_DOUBLE_EQ(EvictionScore(2, created, options),
                   EvictionScore(0, created, options) + 0.6);
}

TEST_F(CacheStoreTest, EvictsBySizeBudget) {
  CacheOptions options;
  options.max_size_bytes = 10;
  auto cache = MakeCache(options);

  cache->Set("first", "aaaa");
  clock_->Advance(1s);
  cache->Set("second", "bbbb");
  clock_->Advance(1s);
  cache->Set("third", "cccc");

  EXPECT_THAT(cache->Keys(), ElementsAre("second", "third"));
  EXPECT_EQ(8u, cache->Stats().total_size);
}

TEST_F(CacheStoreTest, RejectsPayloadLargerThanBudget) {
  CacheOptions options;
  options.max_size_bytes = 4;
  auto cache = MakeCache(options);

  EXPECT_FALSE(cache->Set("key", "too large"));
  EXPECT_FALSE(cache->Has("key"));
  EXPECT_TRUE(logger_->Contains("cache.set.rejected"));
}

TEST_F(CacheStoreTest, EstimatorFailureRejectsWithoutThrowing) {
  StringCache cache(
      CacheOptions{},
      [](const std::string &) -> std::size_t {
        throw std::runtime_error("cannot size");
      },
      logger_, clock_);

  EXPECT_FALSE(cache.Set("key", "value"));
  EXPECT_TRUE(logger_->Contains("cache.set.failed"));
}

TEST_F(CacheStoreTest, InvalidatesByPatternOrSubstring) {
  auto cache = MakeCache();
  cache->Set("analysis_1_javascript", "a");
  cache->Set("analysis_2_python", "b");
  cache->Set("other[key", "c");

  EXPECT_EQ(1u, cache->Invalidate("_python$"));
  EXPECT_EQ(1u, cache->Invalidate("other["));
  EXPECT_THAT(cache->Keys(), ElementsAre("analysis_1_javascript"));
}

TEST_F(CacheStoreTest, OptimizePrunesExpiredEntriesAfterCleanupInterval) {
  CacheOptions options;
  options.cleanup_interval = 1min;
  auto cache = MakeCache(options);
  cache->Set("short", "a", 10s);

  clock_->Advance(2min);
  cache->Set("fresh", "b");

  EXPECT_THAT(cache->Keys(), ElementsAre("fresh"));
  EXPECT_TRUE(logger_->Contains("cache.optimize"));
}

TEST_F(CacheStoreTest, DeleteAndClearResetState) {
  auto cache = MakeCache();
  cache->Set("a", "1");
  cache->Set("b", "2");

  EXPECT_TRUE(cache->Delete("a"));
  EXPECT_FALSE(cache->Delete("a"));
  cache->Clear();

  const auto stats = cache->Stats();
  EXPECT_EQ(0u, stats.total_entries);
  EXPECT_EQ(0u, stats.total_size);
  EXPECT_FALSE(stats.oldest_entry.has_value());
}

TEST_F(CacheStoreTest, WarmupStoresEveryEntry) {
  auto cache = MakeCache();
  std::vector<StringCache::WarmupEntry> entries;
  entries.push_back({"a", "1", std::nullopt});
  entries.push_back({"b", "2", 5s});

  cache->Warmup(std::move(entries));

  EXPECT_THAT(cache->Keys(), ElementsAre("a", "b"));
}

TEST_F(CacheStoreTest, StatsReportOldestAndNewestEntries) {
  auto cache = MakeCache();
  const auto start = clock_->Now();
  cache->Set("a", "1");
  clock_->Advance(3s);
  cache->Set("b", "2");

  const auto stats = cache->Stats();
  ASSERT_TRUE(stats.oldest_entry.has_value());
  ASSERT_TRUE(stats.newest_entry.has_value());
  EXPECT_EQ(start, *stats.oldest_entry);
  EXPECT_EQ(start + 3s, *stats.newest_entry);
}

TEST_F(CacheStoreTest, RejectsInvalidOptions) {
  CacheOptions no_entries;
  no_entries.max_entries = 0;
  EXPECT_THROW(MakeCache(no_entries), std::invalid_argument);

  CacheOptions negative_weight;
  negative_weight.hit_weight = -1.0;
  EXPECT_THROW(MakeCache(negative_weight), std::invalid_argument);

  EXPECT_THROW(StringCache(CacheOptions{}, nullptr), std::invalid_argument);
}

} // namespace
} // namespace cxg
