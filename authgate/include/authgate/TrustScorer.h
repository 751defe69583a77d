#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include "AlertAggregator.h"
#include "Common.h"
#include "Stride.h"
#include "Validator.h"

namespace authgate {

struct TrustConfig {
  double base_risk{0.05};
  // Indexed by AnomalyReason.
  std::array<double, kAnomalyReasonCount> reason_increment{
      0.15,  // Spoofing
      0.30,  // LocationMismatch
      0.20,  // Tampering
      0.08,  // PostureOutdated
      0.20,  // TlsAnomaly
      0.18,  // Repudiation
      0.05,  // MissingSignal
      0.15,  // InsufficientSignal
      0.15,  // Reconnaissance
      0.30,  // Exfiltration
      0.45,  // DenialOfService
      0.30,  // BruteForce
      0.30,  // PolicyElevation
  };
  // A signal-bound increment is scaled by floor + (1 - floor) * weight.
  double signal_scale_floor{0.5};
  double siem_high_bump{0.20};
  double siem_med_bump{0.08};
  // Normaliser for the weight-mass part of confidence; kept in sync with the
  // validator's base weights by the config loader.
  double expected_weight_mass{4.15};
  double conf_high{0.80};
  double conf_low{0.40};
  double conf_damp{0.10};
  double conf_boost{0.10};
  double allow_threshold{0.15};
  double deny_threshold{0.75};
};

struct RiskComponents {
  double base{0.0};
  double reasons{0.0};
  double alerts{0.0};
  double adjustment_factor{1.0};
};

struct RiskAssessment {
  std::string session_id;
  double risk{0.0};
  Decision decision{Decision::Allow};
  std::set<StrideCategory> stride_categories;
  double confidence{0.0};
  std::optional<StrideCategory> dominant_stride{};
  RiskComponents components{};
};

class TrustScorer {
 public:
  explicit TrustScorer(const TrustConfig& cfg);

  // Pure function of its inputs and the configuration.
  RiskAssessment score(const ValidatedVector& vec, const AlertWindowCount& alerts) const;

  double confidence(const ValidatedVector& vec) const;
  Decision classify(double risk) const;

  const TrustConfig& config() const { return cfg_; }

 private:
  TrustConfig cfg_{};
};

// The seam the gateway calls. A remote or failing implementation reports
// ok=false instead of guessing a score.
struct TrustResult {
  bool ok{false};
  RiskAssessment assessment{};
  std::string error;
};

// timeout_ms is how long the gateway will wait for the answer; a remote
// implementation bounds its connect/read by it.
class ITrustService {
 public:
  virtual ~ITrustService() = default;
  virtual TrustResult score(const ValidatedVector& vec, const AlertWindowCount& alerts,
                            TimeMs timeout_ms) = 0;
};

class LocalTrustService final : public ITrustService {
 public:
  explicit LocalTrustService(const TrustScorer& scorer) : scorer_(scorer) {}
  TrustResult score(const ValidatedVector& vec, const AlertWindowCount& alerts,
                    TimeMs) override {
    return TrustResult{true, scorer_.score(vec, alerts), {}};
  }

 private:
  const TrustScorer& scorer_;
};

} // namespace authgate
