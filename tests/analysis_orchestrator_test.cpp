#include <cxg/analysis_orchestrator.h>
#include <cxg/analysis_orchestrator_builder.h>
#include <cxg/pattern_detector.h>

#include "test_support/manual_clock.h"
#include "test_support/recording_logger.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace cxg {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::SizeIs;

class ScriptedPrimary : public PrimaryDetector {
public:
  enum class Mode { kAnswer, kNoAnswer, kThrow };

  explicit ScriptedPrimary(Mode mode) : mode_(mode) {}

  std::optional<ModularFindings>
  Analyze(const AnalysisRequest &) override {
    ++calls;
    switch (mode_) {
    case Mode::kAnswer:
      return ModularFindings{{PatternHit{"internal_host", kInfrastructureTag,
                                         Severity::kMedium, 3, 7, "db.internal",
                                         "Move hostnames to configuration"}}};
    case Mode::kNoAnswer:
      return std::nullopt;
    case Mode::kThrow:
      throw std::runtime_error("rule engine crashed");
    }
    return std::nullopt;
  }

  std::string Name() const override { return "scripted"; }

  std::atomic<int> calls{0};

private:
  Mode mode_;
};

// Throws a value that is not a std::exception on its first call.
class ErraticPrimary : public PrimaryDetector {
public:
  std::optional<ModularFindings>
  Analyze(const AnalysisRequest &) override {
    if (calls++ == 0) {
      throw 42;
    }
    return ModularFindings{};
  }

  std::string Name() const override { return "erratic"; }

  std::atomic<int> calls{0};
};

class GatedPrimary : public PrimaryDetector {
public:
  std::optional<ModularFindings>
  Analyze(const AnalysisRequest &) override {
    ++calls;
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return open_; });
    return ModularFindings{};
  }

  std::string Name() const override { return "gated"; }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_ = true;
    }
    released_.notify_all();
  }

  std::atomic<int> calls{0};

private:
  std::mutex mutex_;
  std::condition_variable released_;
  bool open_ = false;
};

class FakeDetectionService : public DetectionService {
public:
  bool CheckHealth(std::chrono::milliseconds) override { return true; }

  RemoteResponse Analyze(const RemoteAnalyzeRequest &request) override {
    ++calls;
    last_name = request.name;
    if (fail) {
      throw std::runtime_error("connection refused");
    }
    RemoteFindings findings;
    findings.business_logic.push_back("pricing");
    findings.risk_level = 1;
    RemoteResponse response;
    response.success = true;
    response.result = findings;
    return response;
  }

  std::atomic<int> calls{0};
  std::string last_name;
  bool fail = false;
};

class InMemoryHistoryStore : public HistoryStore {
public:
  std::vector<AnalysisResult> Load() override {
    if (fail_load) {
      throw HistoryStoreError("history file is corrupt");
    }
    return loaded;
  }

  void Save(const std::vector<AnalysisResult> &entries) override {
    std::lock_guard<std::mutex> lock(mutex_);
    saved.push_back(entries);
  }

  std::vector<std::vector<AnalysisResult>> Saved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved;
  }

  std::vector<AnalysisResult> loaded;
  bool fail_load = false;

private:
  mutable std::mutex mutex_;
  std::vector<std::vector<AnalysisResult>> saved;
};

AnalysisResult HistoricResult(const std::string &name, RiskLevel risk) {
  AnalysisResult result;
  result.source_name = name;
  result.risk_level = risk;
  return result;
}

class AnalysisOrchestratorTest : public ::testing::Test {
protected:
  std::unique_ptr<AnalysisOrchestrator>
  Make(std::unique_ptr<PrimaryDetector> primary,
       std::shared_ptr<HistoryStore> store = nullptr) {
    OrchestratorComponents components;
    components.primary = std::move(primary);
    components.remote = std::make_unique<RemoteTier>(
        service_, RemoteTierOptions{remote_enabled_, {}}, logger_, clock_);
    components.history_store = std::move(store);
    components.logger = logger_;
    components.clock = clock_;
    return std::make_unique<AnalysisOrchestrator>(std::move(components));
  }

  bool remote_enabled_ = false;
  std::shared_ptr<FakeDetectionService> service_ =
      std::make_shared<FakeDetectionService>();
  std::shared_ptr<test::ManualClock> clock_ =
      std::make_shared<test::ManualClock>();
  std::shared_ptr<test::RecordingLogger> logger_ =
      std::make_shared<test::RecordingLogger>();
};

TEST_F(AnalysisOrchestratorTest, PrimaryDetectorFlagsInlinePassword) {
  auto orchestrator = Make(std::make_unique<PatternDetector>());

  const auto result = orchestrator->AnalyzeCode("password: 'abc123'",
                                                "javascript", "config.js");

  ASSERT_NE(nullptr, result);
  EXPECT_EQ(RiskLevel::kHigh, result->risk_level);
  EXPECT_EQ(Provenance::kModular, result->provenance);
  EXPECT_THAT(result->detected_patterns, ElementsAre(kSecretTag));
  EXPECT_EQ("config.js", result->source_name);
  EXPECT_EQ(clock_->Now(), result->timestamp);
  EXPECT_THAT(result->suggestions,
              Contains("Consider using environment variables for sensitive "
                       "data"));
  EXPECT_TRUE(logger_->Contains("analysis.complete"));
}

TEST_F(AnalysisOrchestratorTest, SecondRequestIsServedFromCache) {
  auto primary = std::make_unique<ScriptedPrimary>(
      ScriptedPrimary::Mode::kAnswer);
  auto *detector = primary.get();
  auto orchestrator = Make(std::move(primary));

  const auto first =
      orchestrator->AnalyzeCode("host = 'db.internal'", "javascript", "a.js");
  const auto second =
      orchestrator->AnalyzeCode("host = 'db.internal'", "javascript", "b.js");

  EXPECT_EQ(1, detector->calls.load());
  EXPECT_EQ(Provenance::kModular, first->provenance);
  EXPECT_EQ(Provenance::kCache, second->provenance);
  EXPECT_EQ(std::chrono::microseconds(0), second->latency);
  EXPECT_EQ("b.js", second->source_name);
  EXPECT_EQ(first->detected_patterns, second->detected_patterns);
  EXPECT_EQ(first->risk_level, second->risk_level);

  const auto stats = orchestrator->Stats();
  EXPECT_EQ(2u, stats.requests);
  EXPECT_EQ(1u, stats.cache_hits);
  EXPECT_EQ(1u, stats.computed);
  EXPECT_EQ(1u, orchestrator->GetCacheStats().hits);
}

TEST_F(AnalysisOrchestratorTest, OptionsArePartOfTheFingerprint) {
  auto primary = std::make_unique<ScriptedPrimary>(
      ScriptedPrimary::Mode::kAnswer);
  auto *detector = primary.get();
  auto orchestrator = Make(std::move(primary));

  orchestrator->AnalyzeCode("x", "javascript");
  orchestrator->AnalyzeCode("x", "javascript", std::nullopt,
                            {{"depth", "full"}});
  orchestrator->AnalyzeCode("x", "typescript");

  EXPECT_EQ(3, detector->calls.load());
  EXPECT_EQ(0u, orchestrator->Stats().cache_hits);
}

TEST_F(AnalysisOrchestratorTest, ConcurrentIdenticalRequestsShareOneComputation) {
  auto primary = std::make_unique<GatedPrimary>();
  auto *gate = primary.get();
  auto orchestrator = Make(std::move(primary));

  SharedResult first;
  SharedResult second;
  std::thread leader([&] {
    first = orchestrator->AnalyzeCode("const a = 1;", "javascript");
  });
  while (gate->calls.load() == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  std::thread follower([&] {
    second = orchestrator->AnalyzeCode("const a = 1;", "javascript");
  });
  while (orchestrator->Stats().coalesced == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  gate->Release();
  leader.join();
  follower.join();

  ASSERT_NE(nullptr, first);
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(1, gate->calls.load());
  const auto stats = orchestrator->Stats();
  EXPECT_EQ(2u, stats.requests);
  EXPECT_EQ(1u, stats.computed);
  EXPECT_EQ(1u, stats.coalesced);
}

TEST_F(AnalysisOrchestratorTest, UnsupportedLanguageFallsThroughToHeuristics) {
  auto orchestrator = Make(std::make_unique<PatternDetector>());

  const auto result =
      orchestrator->AnalyzeCode("password: 'abc123'", "python", "app.py");

  EXPECT_EQ(Provenance::kLocalFallback, result->provenance);
  EXPECT_EQ(RiskLevel::kHigh, result->risk_level);
  EXPECT_EQ(1u, orchestrator->Stats().fallback_answers);
}

TEST_F(AnalysisOrchestratorTest, ThrowingPrimaryFallsBackToRemoteTier) {
  remote_enabled_ = true;
  auto orchestrator = Make(
      std::make_unique<ScriptedPrimary>(ScriptedPrimary::Mode::kThrow));

  const auto result =
      orchestrator->AnalyzeCode("price * margin", "javascript", "pricing.js");

  EXPECT_EQ(Provenance::kRemote, result->provenance);
  EXPECT_EQ(RiskLevel::kMedium, result->risk_level);
  EXPECT_THAT(result->detected_patterns, ElementsAre(kBusinessLogicTag));
  EXPECT_EQ("pricing.js", service_->last_name);
  EXPECT_EQ(CircuitState::kClosed, orchestrator->RemoteState());

  const auto stats = orchestrator->Stats();
  EXPECT_EQ(1u, stats.tier_failures);
  EXPECT_EQ(1u, stats.remote_answers);
  EXPECT_TRUE(logger_->Contains("detector.tier.failed"));
}

TEST_F(AnalysisOrchestratorTest, NonStandardExceptionSkipsPrimaryTier) {
  auto primary = std::make_unique<ErraticPrimary>();
  auto *detector = primary.get();
  auto orchestrator = Make(std::move(primary));

  const auto first = orchestrator->AnalyzeCode("x", "javascript");
  ASSERT_NE(nullptr, first);
  EXPECT_EQ(Provenance::kLocalFallback, first->provenance);
  EXPECT_TRUE(logger_->Contains("detector.tier.failed"));
  EXPECT_EQ(1u, orchestrator->Stats().tier_failures);

  SharedResult second;
  EXPECT_NO_THROW(second = orchestrator->AnalyzeCode("x", "javascript"));
  ASSERT_NE(nullptr, second);
  EXPECT_EQ(Provenance::kCache, second->provenance);

  const auto other = orchestrator->AnalyzeCode("y", "javascript");
  EXPECT_EQ(Provenance::kModular, other->provenance);
  EXPECT_EQ(2, detector->calls.load());
}

TEST_F(AnalysisOrchestratorTest, ScansMegabyteSingleLine) {
  auto orchestrator = Make(std::make_unique<PatternDetector>());
  const std::string minified(1 << 20, 'a');

  const auto modular = orchestrator->AnalyzeCode(minified, "javascript");
  const auto fallback = orchestrator->AnalyzeCode(
      "password=" + std::string(1 << 20, 'a'), "plaintext");

  ASSERT_NE(nullptr, modular);
  EXPECT_EQ(Provenance::kModular, modular->provenance);
  EXPECT_EQ(RiskLevel::kLow, modular->risk_level);
  ASSERT_NE(nullptr, fallback);
  EXPECT_EQ(Provenance::kLocalFallback, fallback->provenance);
  EXPECT_THAT(fallback->detected_patterns, ElementsAre(kSecretTag));
}

TEST_F(AnalysisOrchestratorTest, FailingRemoteOpensBreakerAndUsesHeuristics) {
  remote_enabled_ = true;
  service_->fail = true;
  auto orchestrator = Make(
      std::make_unique<ScriptedPrimary>(ScriptedPrimary::Mode::kNoAnswer));

  const auto first = orchestrator->AnalyzeCode("token=abcdefghijklmnopqrstu",
                                               "javascript");
  EXPECT_EQ(Provenance::kLocalFallback, first->provenance);
  EXPECT_EQ(CircuitState::kOpen, orchestrator->RemoteState());

  const auto second = orchestrator->AnalyzeCode("const b = 2;", "javascript");
  EXPECT_EQ(Provenance::kLocalFallback, second->provenance);
  EXPECT_EQ(1, service_->calls.load());

  const auto stats = orchestrator->Stats();
  EXPECT_EQ(1u, stats.tier_failures);
  EXPECT_EQ(2u, stats.fallback_answers);
  EXPECT_EQ(0u, stats.modular_answers);
}

TEST_F(AnalysisOrchestratorTest, EmptyModularAnswerIsStillAnAnswer) {
  remote_enabled_ = true;
  auto orchestrator = Make(std::make_unique<PatternDetector>());

  const auto result =
      orchestrator->AnalyzeCode("console.log('hi');", "javascript");

  EXPECT_EQ(Provenance::kModular, result->provenance);
  EXPECT_EQ(RiskLevel::kLow, result->risk_level);
  EXPECT_TRUE(result->detected_patterns.empty());
  EXPECT_EQ(0, service_->calls.load());
}

TEST_F(AnalysisOrchestratorTest, RejectsEmptyLanguage) {
  auto orchestrator = Make(nullptr);

  EXPECT_THROW(orchestrator->AnalyzeCode("x", ""), std::invalid_argument);
}

TEST_F(AnalysisOrchestratorTest, RecordsTierAndTotalMeasurements) {
  auto orchestrator = Make(std::make_unique<PatternDetector>());

  orchestrator->AnalyzeCode("const a = 1;", "javascript");
  orchestrator->AnalyzeCode("const a = 1;", "javascript");

  const auto total = orchestrator->Monitor().GetOperationMetrics(
      "analysis.total");
  ASSERT_TRUE(total.has_value());
  EXPECT_EQ(2u, total->total_operations);
  const auto modular = orchestrator->Monitor().GetOperationMetrics(
      "analysis.tier.modular");
  ASSERT_TRUE(modular.has_value());
  EXPECT_EQ(1u, modular->total_operations);
}

TEST_F(AnalysisOrchestratorTest, CacheHitsAreNotAppendedToRecentScans) {
  auto orchestrator = Make(std::make_unique<PatternDetector>());

  orchestrator->AnalyzeCode("password: 'abc123'", "javascript", "a.js");
  orchestrator->AnalyzeCode("password: 'abc123'", "javascript", "a.js");
  orchestrator->AnalyzeCode("const a = 1;", "javascript", "b.js");

  const auto recent = orchestrator->RecentScans();
  ASSERT_THAT(recent, SizeIs(2));
  EXPECT_EQ("a.js", recent[0].source_name);
  EXPECT_EQ("b.js", recent[1].source_name);

  const auto summary = orchestrator->GetSecuritySummary();
  EXPECT_EQ(2u, summary.total);
  EXPECT_EQ(1u, summary.high);
  EXPECT_EQ(1u, summary.low);
}

TEST_F(AnalysisOrchestratorTest, RestoresAndPersistsHistory) {
  auto store = std::make_shared<InMemoryHistoryStore>();
  store->loaded = {HistoricResult("old.js", RiskLevel::kMedium)};
  auto orchestrator = Make(std::make_unique<PatternDetector>(), store);

  orchestrator->AnalyzeCode("const a = 1;", "javascript", "new.js");
  orchestrator->FlushHistory();

  const auto saved = store->Saved();
  ASSERT_THAT(saved, SizeIs(1));
  ASSERT_THAT(saved[0], SizeIs(2));
  EXPECT_EQ("old.js", saved[0][0].source_name);
  EXPECT_EQ("new.js", saved[0][1].source_name);
  EXPECT_EQ(1u, orchestrator->GetSecuritySummary().medium);
}

TEST_F(AnalysisOrchestratorTest, ConcurrentScansPersistGrowingSnapshots) {
  auto store = std::make_shared<InMemoryHistoryStore>();
  auto orchestrator = Make(std::make_unique<PatternDetector>(), store);

  constexpr int kScans = 8;
  std::vector<std::thread> workers;
  for (int index = 0; index < kScans; ++index) {
    workers.emplace_back([&orchestrator, index] {
      orchestrator->AnalyzeCode("const v = " + std::to_string(index) + ";",
                                "javascript", "f" + std::to_string(index));
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  orchestrator->FlushHistory();

  const auto saved = store->Saved();
  ASSERT_THAT(saved, SizeIs(kScans));
  for (std::size_t index = 0; index < saved.size(); ++index) {
    EXPECT_THAT(saved[index], SizeIs(index + 1));
  }
}

TEST_F(AnalysisOrchestratorTest, UnreadableHistoryStartsEmpty) {
  auto store = std::make_shared<InMemoryHistoryStore>();
  store->fail_load = true;
  auto orchestrator = Make(std::make_unique<PatternDetector>(), store);

  EXPECT_TRUE(orchestrator->RecentScans().empty());
  EXPECT_TRUE(logger_->Contains("history.load.failed"));
}

TEST(AnalysisOrchestratorBuilderTest, BuildsPatternDetectorByDefault) {
  auto clock = std::make_shared<test::ManualClock>();
  AnalysisOrchestratorBuilder builder;
  builder.WithClock(clock).WithHistoryCapacity(1);
  auto orchestrator = builder.Build();

  orchestrator.AnalyzeCode("password: 'abc123'", "typescript", "a.ts");
  orchestrator.AnalyzeCode("const a = 1;", "typescript", "b.ts");

  const auto recent = orchestrator.RecentScans();
  ASSERT_THAT(recent, SizeIs(1));
  EXPECT_EQ("b.ts", recent[0].source_name);
  EXPECT_EQ(2u, orchestrator.Stats().modular_answers);
  EXPECT_EQ(CircuitState::kHalfOpen, orchestrator.RemoteState());
}

} // namespace
} // namespace cxg
