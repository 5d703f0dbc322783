#pragma once

#include <cxg/models.h>

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cxg {

struct PatternHit {
  std::string rule;
  std::string category;
  Severity severity = Severity::kLow;
  int line = 0;
  int column = 0;
  std::string excerpt;
  std::string recommendation;
};

// Answer of the in-process rule engine.
struct ModularFindings {
  std::vector<PatternHit> hits;
};

struct RemoteSecret {
  int line = 0;
  int column = 0;
  std::string value;
};

struct RemoteInfrastructure {
  std::string type;
  int line = 0;
};

// Payload of a successful remote analyze call. `risk_level` is the service
// scale: 0 low, 1 medium, 2 high, anything else unknown.
struct RemoteFindings {
  std::vector<RemoteSecret> secrets;
  std::vector<std::string> business_logic;
  std::vector<RemoteInfrastructure> infrastructure;
  int risk_level = -1;
  double confidence = 0.5;
};

struct HeuristicFindings {
  std::vector<std::string> patterns;
  std::vector<Match> matches;
};

// One alternative per tier; the alternative identifies the provenance.
using TierOutput = std::variant<ModularFindings, RemoteFindings, HeuristicFindings>;

struct RemoteAnalyzeRequest {
  std::string content;
  std::string language;
  std::string name;
};

struct RemoteResponse {
  bool success = false;
  std::optional<RemoteFindings> result;
  std::optional<std::string> error;
};

class PrimaryDetector {
public:
  virtual ~PrimaryDetector() = default;
  // std::nullopt means "no answer" and lets the next tier run.
  virtual std::optional<ModularFindings>
  Analyze(const AnalysisRequest &request) = 0;
  virtual std::string Name() const = 0;
};

// Remote detection service. Implementations own the transport.
class DetectionService {
public:
  virtual ~DetectionService() = default;
  virtual bool CheckHealth(std::chrono::milliseconds timeout) = 0;
  virtual RemoteResponse Analyze(const RemoteAnalyzeRequest &request) = 0;
};

} // namespace cxg
