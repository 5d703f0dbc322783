#pragma once

#include <cxg/models.h>

#include <vector>

namespace cxg {

// 0 for low risk, 2 for medium, 3 for high. 1 is reserved for errors.
int RiskExitCode(RiskLevel level);
// Exit code of the riskiest result; 0 when nothing was scanned.
int RiskExitCode(const std::vector<AnalysisResult> &results);

} // namespace cxg
