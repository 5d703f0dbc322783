#include <cxg/cli_exit_codes.h>
#include <cxg/models.h>

#include <gtest/gtest.h>

namespace cxg {
namespace {

AnalysisResult WithRisk(RiskLevel level) {
  AnalysisResult result;
  result.risk_level = level;
  return result;
}

TEST(RiskExitCodesTest, MapsRiskLevels) {
  EXPECT_EQ(RiskExitCode(RiskLevel::kLow), 0);
  EXPECT_EQ(RiskExitCode(RiskLevel::kMedium), 2);
  EXPECT_EQ(RiskExitCode(RiskLevel::kHigh), 3);
}

TEST(RiskExitCodesTest, ReturnsZeroWhenNothingWasScanned) {
  EXPECT_EQ(RiskExitCode(std::vector<AnalysisResult>{}), 0);
}

TEST(RiskExitCodesTest, RiskiestResultDecides) {
  EXPECT_EQ(RiskExitCode({WithRisk(RiskLevel::kLow),
                          WithRisk(RiskLevel::kMedium),
                          WithRisk(RiskLevel::kLow)}),
            2);
  EXPECT_EQ(RiskExitCode({WithRisk(RiskLevel::kHigh),
                          WithRisk(RiskLevel::kMedium)}),
            3);
}

} // namespace
} // namespace cxg
