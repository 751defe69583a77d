#include "authgate/Validator.h"
#include "authgate/Geo.h"
#include "authgate/ReferenceData.h"
#include "authgate/Util.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>

namespace authgate {

namespace {

constexpr TimeMs kMsPerDay = 86400000ull;

std::string field(const SignalRecord& rec, const char* key) {
  auto it = rec.find(key);
  return it == rec.end() ? std::string{} : trim(it->second);
}

bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

bool valid_ip(const std::string& ip) {
  in_addr v4{};
  in6_addr v6{};
  return inet_pton(AF_INET, ip.c_str(), &v4) == 1 || inet_pton(AF_INET6, ip.c_str(), &v6) == 1;
}

bool valid_bssid(const std::string& raw) {
  std::string b = normalize_bssid(raw);
  if (b.size() != 17) return false;
  for (size_t i = 0; i < b.size(); ++i) {
    if (i % 3 == 2) {
      if (b[i] != ':') return false;
    } else if (!is_hex(b[i])) {
      return false;
    }
  }
  return true;
}

bool valid_ja3(const std::string& ja3) {
  return ja3.size() == 32 && std::all_of(ja3.begin(), ja3.end(), is_hex);
}

bool edr_disabled(const std::string& edr) {
  std::string e = to_lower(edr);
  return e == "none" || e == "disabled" || e == "off";
}

} // namespace

std::string_view to_string(SignalQuality q) {
  switch (q) {
    case SignalQuality::Ok: return "ok";
    case SignalQuality::Malformed: return "malformed";
    case SignalQuality::Stale: return "stale";
  }
  return "malformed";
}

SignalValidator::SignalValidator(const ValidatorConfig& cfg) : cfg_(cfg) {}

bool SignalValidator::bad_tls_tag(const std::string& tag) const {
  std::string t = to_lower(trim(tag));
  return std::find(cfg_.bad_tls_tags.begin(), cfg_.bad_tls_tags.end(), t) != cfg_.bad_tls_tags.end();
}

SignalQuality SignalValidator::check_quality(SignalType t, const SignalRecord& rec,
                                             TimeMs now_ms) const {
  auto ts_it = rec.find("ts");
  if (ts_it != rec.end()) {
    auto ts = parse_u64(ts_it->second);
    if (!ts) return SignalQuality::Malformed;
    if (*ts > now_ms && *ts - now_ms > cfg_.max_clock_skew_ms) return SignalQuality::Malformed;
    if (now_ms > *ts && now_ms - *ts > cfg_.max_signal_age_ms) return SignalQuality::Stale;
  }

  switch (t) {
    case SignalType::IpOrigin:
      return valid_ip(field(rec, "ip")) ? SignalQuality::Ok : SignalQuality::Malformed;
    case SignalType::Gps:
      return gps_point(rec) ? SignalQuality::Ok : SignalQuality::Malformed;
    case SignalType::WifiAp:
      return valid_bssid(field(rec, "bssid")) ? SignalQuality::Ok : SignalQuality::Malformed;
    case SignalType::DevicePosture: {
      if (field(rec, "device_id").empty()) return SignalQuality::Malformed;
      auto patched = rec.find("patched");
      if (patched != rec.end() && !parse_bool(patched->second)) return SignalQuality::Malformed;
      return SignalQuality::Ok;
    }
    case SignalType::TlsFingerprint:
      return valid_ja3(field(rec, "ja3")) ? SignalQuality::Ok : SignalQuality::Malformed;
  }
  return SignalQuality::Malformed;
}

ValidatedVector SignalValidator::validate(const SignalBundle& bundle,
                                          const EnrichmentResult& enrichment,
                                          TimeMs now_ms) const {
  ValidatedVector out{};
  out.signals = bundle;

  if (bundle.empty()) {
    out.reasons.insert(AnomalyReason::InsufficientSignal);
    return out;
  }

  // 1. quality; failing signals keep a zero weight entry
  for (const auto& [type, rec] : bundle.signals) {
    SignalQuality q = check_quality(type, rec, now_ms);
    out.quality[type] = q;
    double base = 0.0;
    auto bw = cfg_.base_weights.find(type);
    if (bw != cfg_.base_weights.end()) base = bw->second;
    out.weights[type] = q == SignalQuality::Ok ? clamp01(base) : 0.0;
  }
  auto usable = [&out](SignalType t) {
    auto it = out.quality.find(t);
    return it != out.quality.end() && it->second == SignalQuality::Ok;
  };

  for (SignalType t : cfg_.expected_signals) {
    if (!usable(t)) out.reasons.insert(AnomalyReason::MissingSignal);
  }

  // 2. posture and reputation penalties
  if (usable(SignalType::DevicePosture)) {
    const SignalRecord& rec = *bundle.find(SignalType::DevicePosture);
    std::optional<bool> patched;
    auto p = rec.find("patched");
    if (p != rec.end()) patched = parse_bool(p->second);
    else if (enrichment.device) patched = enrichment.device->patched;

    bool outdated = patched.has_value() && !*patched;
    if (!outdated && enrichment.device && enrichment.device->last_update_day) {
      int64_t today = static_cast<int64_t>(now_ms / kMsPerDay);
      outdated = today - *enrichment.device->last_update_day >
                 static_cast<int64_t>(cfg_.max_posture_age_days);
    }
    if (outdated) {
      out.reasons.insert(AnomalyReason::PostureOutdated);
      out.weights[SignalType::DevicePosture] *= cfg_.posture_penalty;
    }

    std::string edr = field(rec, "edr");
    if (edr.empty() && enrichment.device) edr = enrichment.device->edr;
    if (edr_disabled(edr)) out.reasons.insert(AnomalyReason::Tampering);
  }

  if (usable(SignalType::TlsFingerprint) && enrichment.tls && bad_tls_tag(enrichment.tls->tag)) {
    out.reasons.insert(AnomalyReason::TlsAnomaly);
    out.weights[SignalType::TlsFingerprint] *= cfg_.tls_penalty;
  }

  if (usable(SignalType::WifiAp) && !enrichment.wifi) {
    out.weights[SignalType::WifiAp] *= cfg_.unknown_ap_penalty;
  }

  if (usable(SignalType::IpOrigin) && enrichment.geo && enrichment.geo->anonymous) {
    out.reasons.insert(AnomalyReason::Spoofing);
  }

  // 3. cross-checks cap, never zero, the subject's weight. A location taken
  // from a stale or malformed signal proves nothing.
  for (const auto& check : enrichment.checks) {
    CrossCheckOutcome oc{};
    oc.check = check;
    oc.applied = usable(check.subject) && usable(check.reference);
    oc.violated = oc.applied && check.exceeded();
    if (oc.violated) {
      out.reasons.insert(AnomalyReason::LocationMismatch);
      double& w = out.weights[check.subject];
      w = std::min(w, cfg_.mismatch_weight_cap);
    }
    out.cross.push_back(oc);
  }

  // 4. flow classification
  if (bundle.label) {
    for (AnomalyReason r : reasons_for_label(*bundle.label)) out.reasons.insert(r);
  }

  for (auto& [type, w] : out.weights) w = clamp01(w);
  return out;
}

} // namespace authgate
