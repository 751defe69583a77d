#include "authgate/Config.h"
#include "authgate/Util.h"
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>

namespace authgate {

namespace {

using Setter = std::function<bool(GatewayConfig&, const std::string&)>;

Setter real(double GatewayConfig::*field) {
  return [field](GatewayConfig& c, const std::string& v) {
    auto d = parse_double(v);
    if (!d || !std::isfinite(*d)) return false;
    c.*field = *d;
    return true;
  };
}

template <typename Fn>
Setter real_at(Fn get) {
  return [get](GatewayConfig& c, const std::string& v) {
    auto d = parse_double(v);
    if (!d || !std::isfinite(*d)) return false;
    get(c) = *d;
    return true;
  };
}

template <typename T, typename Fn>
Setter whole_at(Fn get) {
  return [get](GatewayConfig& c, const std::string& v) {
    auto n = parse_u64(v);
    if (!n || *n > std::numeric_limits<T>::max()) return false;
    get(c) = static_cast<T>(*n);
    return true;
  };
}

Setter weight(SignalType t) {
  return [t](GatewayConfig& c, const std::string& v) {
    auto d = parse_double(v);
    if (!d || !std::isfinite(*d)) return false;
    c.validator.base_weights[t] = *d;
    return true;
  };
}

bool set_expected_signals(GatewayConfig& c, const std::string& v) {
  std::vector<SignalType> out;
  for (const auto& part : split(v, ',')) {
    std::string name = trim(part);
    if (name.empty()) continue;
    auto t = parse_signal_type(to_lower(name));
    if (!t) return false;
    out.push_back(*t);
  }
  c.validator.expected_signals = std::move(out);
  return true;
}

const std::map<std::string, Setter>& setters() {
  static const std::map<std::string, Setter> table{
      {"ALLOW_T", real_at([](GatewayConfig& c) -> double& { return c.trust.allow_threshold; })},
      {"DENY_T", real_at([](GatewayConfig& c) -> double& { return c.trust.deny_threshold; })},
      {"BASE_RISK", real_at([](GatewayConfig& c) -> double& { return c.trust.base_risk; })},
      {"SIEM_HIGH_BUMP", real_at([](GatewayConfig& c) -> double& { return c.trust.siem_high_bump; })},
      {"SIEM_MED_BUMP", real_at([](GatewayConfig& c) -> double& { return c.trust.siem_med_bump; })},
      {"CONF_HIGH", real_at([](GatewayConfig& c) -> double& { return c.trust.conf_high; })},
      {"CONF_LOW", real_at([](GatewayConfig& c) -> double& { return c.trust.conf_low; })},
      {"CONF_DAMP", real_at([](GatewayConfig& c) -> double& { return c.trust.conf_damp; })},
      {"CONF_BOOST", real_at([](GatewayConfig& c) -> double& { return c.trust.conf_boost; })},
      {"XCHECK_DISTANCE_KM",
       real_at([](GatewayConfig& c) -> double& { return c.enrichment.gps_distance_km; })},
      {"IP_XCHECK_DISTANCE_KM",
       real_at([](GatewayConfig& c) -> double& { return c.enrichment.ip_distance_km; })},
      {"MISMATCH_WEIGHT_CAP",
       real_at([](GatewayConfig& c) -> double& { return c.validator.mismatch_weight_cap; })},
      {"MAX_SIGNAL_AGE_MS",
       whole_at<TimeMs>([](GatewayConfig& c) -> TimeMs& { return c.validator.max_signal_age_ms; })},
      {"MAX_CLOCK_SKEW_MS",
       whole_at<TimeMs>([](GatewayConfig& c) -> TimeMs& { return c.validator.max_clock_skew_ms; })},
      {"MAX_POSTURE_AGE_DAYS",
       whole_at<uint32_t>([](GatewayConfig& c) -> uint32_t& { return c.validator.max_posture_age_days; })},
      {"WEIGHT_IP_ORIGIN", weight(SignalType::IpOrigin)},
      {"WEIGHT_GPS", weight(SignalType::Gps)},
      {"WEIGHT_WIFI_AP", weight(SignalType::WifiAp)},
      {"WEIGHT_DEVICE_POSTURE", weight(SignalType::DevicePosture)},
      {"WEIGHT_TLS_FINGERPRINT", weight(SignalType::TlsFingerprint)},
      {"EXPECTED_SIGNALS", set_expected_signals},
      {"ALERT_WINDOW_MIN",
       whole_at<uint32_t>([](GatewayConfig& c) -> uint32_t& { return c.alert_window_min; })},
      {"ALERT_RISK_T", real(&GatewayConfig::alert_risk_threshold)},
      {"ALERT_HIGH_T", real(&GatewayConfig::alert_high_threshold)},
      {"DEPENDENCY_TIMEOUT_MS",
       whole_at<TimeMs>([](GatewayConfig& c) -> TimeMs& { return c.dependency_timeout_ms; })},
      {"DEPENDENCY_WORKERS",
       whole_at<uint32_t>([](GatewayConfig& c) -> uint32_t& { return c.dependency_calls.workers; })},
      {"DEPENDENCY_MAX_INFLIGHT",
       whole_at<uint32_t>(
           [](GatewayConfig& c) -> uint32_t& { return c.dependency_calls.max_inflight; })},
      {"STEP_UP_BUCKET_MS",
       whole_at<uint32_t>([](GatewayConfig& c) -> uint32_t& { return c.step_up_bucket_ms; })},
      {"STEP_UP_MAX_SKEW",
       whole_at<uint32_t>([](GatewayConfig& c) -> uint32_t& { return c.step_up_max_skew; })},
  };
  return table;
}

constexpr TimeMs kMaxDependencyTimeoutMs = 600000;

bool in_unit(double v) { return v >= 0.0 && v <= 1.0; }

void check_unit(ConfigStatus& st, const char* key, double v) {
  if (!in_unit(v)) st.fail(std::string(key) + " must be within [0, 1]");
}

} // namespace

const std::vector<std::string>& config_keys() {
  static const std::vector<std::string> keys = [] {
    std::vector<std::string> out;
    for (const auto& [k, _] : setters()) out.push_back(k);
    return out;
  }();
  return keys;
}

ConfigStatus validate_config(GatewayConfig& cfg) {
  ConfigStatus st{};
  const auto& t = cfg.trust;

  check_unit(st, "ALLOW_T", t.allow_threshold);
  check_unit(st, "DENY_T", t.deny_threshold);
  if (!(t.allow_threshold < t.deny_threshold)) st.fail("ALLOW_T must be below DENY_T");
  check_unit(st, "BASE_RISK", t.base_risk);
  check_unit(st, "SIEM_HIGH_BUMP", t.siem_high_bump);
  check_unit(st, "SIEM_MED_BUMP", t.siem_med_bump);
  check_unit(st, "CONF_HIGH", t.conf_high);
  check_unit(st, "CONF_LOW", t.conf_low);
  if (t.conf_low > t.conf_high) st.fail("CONF_LOW must not exceed CONF_HIGH");
  if (t.conf_damp < 0.0 || t.conf_damp > 0.5) st.fail("CONF_DAMP must be within [0, 0.5]");
  if (t.conf_boost < 0.0 || t.conf_boost > 0.5) st.fail("CONF_BOOST must be within [0, 0.5]");
  check_unit(st, "signal scale floor", t.signal_scale_floor);
  for (size_t i = 0; i < t.reason_increment.size(); ++i) {
    if (!(t.reason_increment[i] >= 0.0)) {
      st.fail(std::string("negative increment for ") +
              std::string(to_string(static_cast<AnomalyReason>(i))));
    }
  }

  if (!(cfg.enrichment.gps_distance_km > 0.0)) st.fail("XCHECK_DISTANCE_KM must be positive");
  if (!(cfg.enrichment.ip_distance_km > 0.0)) st.fail("IP_XCHECK_DISTANCE_KM must be positive");

  const auto& v = cfg.validator;
  check_unit(st, "MISMATCH_WEIGHT_CAP", v.mismatch_weight_cap);
  check_unit(st, "posture penalty", v.posture_penalty);
  check_unit(st, "tls penalty", v.tls_penalty);
  check_unit(st, "unknown AP penalty", v.unknown_ap_penalty);
  if (v.max_signal_age_ms == 0) st.fail("MAX_SIGNAL_AGE_MS must be positive");

  double mass = 0.0;
  for (SignalType type : kAllSignalTypes) {
    auto it = v.base_weights.find(type);
    if (it == v.base_weights.end()) {
      st.fail("missing base weight for " + std::string(to_string(type)));
      continue;
    }
    if (!in_unit(it->second)) {
      st.fail("base weight for " + std::string(to_string(type)) + " must be within [0, 1]");
      continue;
    }
    mass += it->second;
  }
  if (st.ok && !(mass > 0.0)) st.fail("base weights must not all be zero");
  if (st.ok) cfg.trust.expected_weight_mass = mass;

  if (cfg.alert_window_min == 0) st.fail("ALERT_WINDOW_MIN must be positive");
  check_unit(st, "ALERT_RISK_T", cfg.alert_risk_threshold);
  check_unit(st, "ALERT_HIGH_T", cfg.alert_high_threshold);
  if (cfg.alert_high_threshold < cfg.alert_risk_threshold) {
    st.fail("ALERT_HIGH_T must not be below ALERT_RISK_T");
  }
  if (cfg.dependency_timeout_ms == 0 || cfg.dependency_timeout_ms > kMaxDependencyTimeoutMs) {
    st.fail("DEPENDENCY_TIMEOUT_MS must be in 1.." + std::to_string(kMaxDependencyTimeoutMs));
  }
  if (cfg.dependency_calls.workers == 0) st.fail("DEPENDENCY_WORKERS must be positive");
  if (cfg.dependency_calls.max_inflight < cfg.dependency_calls.workers) {
    st.fail("DEPENDENCY_MAX_INFLIGHT must be at least DEPENDENCY_WORKERS");
  }
  if (cfg.step_up_bucket_ms == 0) st.fail("STEP_UP_BUCKET_MS must be positive");
  return st;
}

GatewayConfig load_config(const std::map<std::string, std::string>& values,
                          ConfigStatus& status) {
  GatewayConfig cfg{};
  const auto& table = setters();
  for (const auto& [key, raw] : values) {
    auto it = table.find(key);
    if (it == table.end()) continue;
    if (!it->second(cfg, trim(raw))) status.fail(key + ": cannot parse '" + raw + "'");
  }
  ConfigStatus checked = validate_config(cfg);
  for (auto& e : checked.errors) status.fail(std::move(e));
  return cfg;
}

GatewayConfig load_config_from_env(ConfigStatus& status) {
  std::map<std::string, std::string> values;
  for (const auto& key : config_keys()) {
    if (const char* v = std::getenv(key.c_str())) values[key] = v;
  }
  return load_config(values, status);
}

} // namespace authgate
