#include "authgate/TrustScorer.h"
#include "authgate/Util.h"
#include <algorithm>

namespace authgate {

TrustScorer::TrustScorer(const TrustConfig& cfg) : cfg_(cfg) {}

double TrustScorer::confidence(const ValidatedVector& vec) const {
  double mass = 0.0;
  size_t live = 0;
  for (const auto& [type, w] : vec.weights) {
    mass += w;
    if (w > 0.0) ++live;
  }
  double coverage = cfg_.expected_weight_mass > 0.0
                        ? std::min(1.0, mass / cfg_.expected_weight_mass)
                        : 0.0;
  double breadth = static_cast<double>(live) / static_cast<double>(kSignalTypeCount);
  return clamp01(0.6 * coverage + 0.4 * breadth);
}

Decision TrustScorer::classify(double risk) const {
  // Half-open bands: [0, allow) allow, [allow, deny) step-up, [deny, 1] deny.
  if (risk >= cfg_.deny_threshold) return Decision::Deny;
  if (risk >= cfg_.allow_threshold) return Decision::StepUp;
  return Decision::Allow;
}

RiskAssessment TrustScorer::score(const ValidatedVector& vec, const AlertWindowCount& alerts) const {
  RiskAssessment out{};
  out.session_id = vec.signals.session_id;

  std::array<double, 6> per_stride{};
  double reason_risk = 0.0;
  for (AnomalyReason r : vec.reasons) {
    double inc = cfg_.reason_increment[static_cast<size_t>(r)];
    if (auto sig = bound_signal(r)) {
      auto it = vec.weights.find(*sig);
      if (it != vec.weights.end()) {
        inc *= cfg_.signal_scale_floor + (1.0 - cfg_.signal_scale_floor) * clamp01(it->second);
      }
    }
    reason_risk += inc;
    StrideCategory cat = stride_of(r);
    per_stride[static_cast<size_t>(cat)] += inc;
    out.stride_categories.insert(cat);
  }

  double alert_risk = alerts.high * cfg_.siem_high_bump + alerts.medium * cfg_.siem_med_bump;
  double raw = cfg_.base_risk + reason_risk + alert_risk;

  out.confidence = confidence(vec);
  double factor = 1.0;
  if (out.confidence >= cfg_.conf_high) factor = 1.0 - cfg_.conf_damp;
  else if (out.confidence < cfg_.conf_low) factor = 1.0 + cfg_.conf_boost;

  out.risk = clamp01(raw * factor);
  out.decision = classify(out.risk);

  for (StrideCategory cat : out.stride_categories) {
    double v = per_stride[static_cast<size_t>(cat)];
    if (!out.dominant_stride || v > per_stride[static_cast<size_t>(*out.dominant_stride)]) {
      out.dominant_stride = cat;
    }
  }

  out.components = RiskComponents{cfg_.base_risk, reason_risk, alert_risk, factor};
  return out;
}

} // namespace authgate
