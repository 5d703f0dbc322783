#include <cxg/cli_exit_codes.h>

#include <algorithm>

namespace cxg {

int RiskExitCode(RiskLevel level) {
  switch (level) {
  case RiskLevel::kLow:
    return 0;
  case RiskLevel::kMedium:
    return 2;
  case RiskLevel::kHigh:
    return 3;
  }
  return 1;
}

int RiskExitCode(const std::vector<AnalysisResult> &results) {
  int code = 0;
  for (const auto &result : results) {
    code = std::max(code, RiskExitCode(result.risk_level));
  }
  return code;
}

} // namespace cxg
