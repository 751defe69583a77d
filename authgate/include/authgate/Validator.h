#pragma once
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "Common.h"
#include "Enrichment.h"
#include "Stride.h"

namespace authgate {

enum class SignalQuality : uint8_t {
  Ok = 0,
  Malformed = 1,
  Stale = 2,
};

std::string_view to_string(SignalQuality q);

struct CrossCheckOutcome {
  ConsistencyCheck check{};
  bool applied{false};  // subject and reference signals both passed quality
  bool violated{false};
};

struct ValidatedVector {
  SignalBundle signals;
  // Keys are always a subset of the observed signal types.
  std::map<SignalType, double> weights;
  std::set<AnomalyReason> reasons;

  // Diagnostics.
  std::map<SignalType, SignalQuality> quality;
  std::vector<CrossCheckOutcome> cross;

  double weight(SignalType t) const {
    auto it = weights.find(t);
    return it == weights.end() ? 0.0 : it->second;
  }
  bool has(AnomalyReason r) const { return reasons.count(r) != 0; }
};

struct ValidatorConfig {
  std::map<SignalType, double> base_weights{
      {SignalType::IpOrigin, 0.80},
      {SignalType::Gps, 0.90},
      {SignalType::WifiAp, 0.85},
      {SignalType::DevicePosture, 0.90},
      {SignalType::TlsFingerprint, 0.70},
  };
  double mismatch_weight_cap{0.2};
  double posture_penalty{0.5};
  double tls_penalty{0.5};
  double unknown_ap_penalty{0.75};
  TimeMs max_signal_age_ms{300000};
  TimeMs max_clock_skew_ms{30000};
  uint32_t max_posture_age_days{90};
  std::vector<SignalType> expected_signals{};
  std::vector<std::string> bad_tls_tags{
      "tor_suspect", "malware_family_x", "scanner_tool", "cloud_proxy",
      "old_openssl", "insecure_client", "honeypot_fingerprint"};
};

class SignalValidator {
 public:
  explicit SignalValidator(const ValidatorConfig& cfg);

  // Pure: same bundle, enrichment and now_ms always give the same vector.
  // Input defects never throw; they show up as quality flags and reasons.
  ValidatedVector validate(const SignalBundle& bundle, const EnrichmentResult& enrichment,
                           TimeMs now_ms) const;

  SignalQuality check_quality(SignalType t, const SignalRecord& rec, TimeMs now_ms) const;

 private:
  bool bad_tls_tag(const std::string& tag) const;

  ValidatorConfig cfg_{};
};

} // namespace authgate
