#include "authgate/Common.h"
#include "authgate/Util.h"

namespace authgate {

std::string_view to_string(SignalType t) {
  switch (t) {
    case SignalType::IpOrigin: return "ip_origin";
    case SignalType::Gps: return "gps";
    case SignalType::WifiAp: return "wifi_ap";
    case SignalType::DevicePosture: return "device_posture";
    case SignalType::TlsFingerprint: return "tls_fingerprint";
  }
  return "unknown";
}

std::string_view to_string(Decision d) {
  switch (d) {
    case Decision::Allow: return "allow";
    case Decision::StepUp: return "step_up";
    case Decision::Deny: return "deny";
  }
  return "deny";
}

std::string_view to_string(Enforcement e) {
  switch (e) {
    case Enforcement::Allow: return "ALLOW";
    case Enforcement::MfaStepUp: return "MFA_STEP_UP";
    case Enforcement::Deny: return "DENY";
  }
  return "DENY";
}

std::string_view to_string(Severity s) {
  switch (s) {
    case Severity::Low: return "low";
    case Severity::Medium: return "medium";
    case Severity::High: return "high";
  }
  return "low";
}

std::string_view to_string(StrideCategory c) {
  switch (c) {
    case StrideCategory::Spoofing: return "Spoofing";
    case StrideCategory::Tampering: return "Tampering";
    case StrideCategory::Repudiation: return "Repudiation";
    case StrideCategory::InformationDisclosure: return "InformationDisclosure";
    case StrideCategory::DenialOfService: return "DoS";
    case StrideCategory::ElevationOfPrivilege: return "EoP";
  }
  return "InformationDisclosure";
}

std::optional<SignalType> parse_signal_type(std::string_view name) {
  std::string n = to_lower(trim(name));
  if (n == "ip_origin" || n == "ip_geo") return SignalType::IpOrigin;
  if (n == "gps") return SignalType::Gps;
  if (n == "wifi_ap" || n == "wifi_bssid") return SignalType::WifiAp;
  if (n == "device_posture") return SignalType::DevicePosture;
  if (n == "tls_fingerprint" || n == "tls_fp") return SignalType::TlsFingerprint;
  return std::nullopt;
}

std::optional<Decision> parse_decision(std::string_view name) {
  std::string n = normalize_token(name);
  if (n == "ALLOW") return Decision::Allow;
  if (n == "STEP_UP" || n == "STEPUP") return Decision::StepUp;
  if (n == "DENY" || n == "BLOCK") return Decision::Deny;
  return std::nullopt;
}

std::optional<Enforcement> parse_enforcement(std::string_view name) {
  std::string n = normalize_token(name);
  if (n == "ALLOW") return Enforcement::Allow;
  if (n == "MFA_STEP_UP") return Enforcement::MfaStepUp;
  if (n == "DENY" || n == "BLOCK") return Enforcement::Deny;
  return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view name) {
  std::string n = to_lower(trim(name));
  if (n == "low") return Severity::Low;
  if (n == "medium") return Severity::Medium;
  if (n == "high" || n == "critical") return Severity::High;
  return std::nullopt;
}

std::optional<StrideCategory> parse_stride(std::string_view name) {
  std::string k;
  for (char c : name) {
    if (c == '_' || c == '-' || c == ' ') continue;
    k.push_back(static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c));
  }
  if (k == "spoofing") return StrideCategory::Spoofing;
  if (k == "tampering") return StrideCategory::Tampering;
  if (k == "repudiation") return StrideCategory::Repudiation;
  if (k == "informationdisclosure") return StrideCategory::InformationDisclosure;
  if (k == "dos" || k == "denialofservice") return StrideCategory::DenialOfService;
  if (k == "eop" || k == "elevationofprivilege") return StrideCategory::ElevationOfPrivilege;
  return std::nullopt;
}

} // namespace authgate
