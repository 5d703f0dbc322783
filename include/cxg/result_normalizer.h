#pragma once

#include <cxg/interfaces.h>

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace cxg {

Provenance ProvenanceOf(const TierOutput &output);

// Secrets are high risk; business logic or infrastructure alone is medium.
RiskLevel RiskFromTags(const std::set<std::string> &tags);

std::vector<std::string> SuggestionsForTags(const std::set<std::string> &tags);

// Converts whichever tier answered into the canonical result. The variant
// alternative decides the provenance.
AnalysisResult Normalize(const TierOutput &output,
                         const AnalysisRequest &request, TimePoint timestamp,
                         std::chrono::microseconds latency);

} // namespace cxg
