#include "authgate/Stride.h"
#include "authgate/Util.h"
#include <string>

namespace authgate {

namespace {

struct ReasonInfo {
  AnomalyReason reason;
  std::string_view token;
  StrideCategory stride;
  std::optional<SignalType> signal;
};

constexpr ReasonInfo kReasons[kAnomalyReasonCount] = {
    {AnomalyReason::Spoofing, "SPOOFING", StrideCategory::Spoofing, SignalType::IpOrigin},
    {AnomalyReason::LocationMismatch, "LOCATION_MISMATCH", StrideCategory::Spoofing, SignalType::Gps},
    {AnomalyReason::Tampering, "TAMPERING", StrideCategory::Tampering, SignalType::DevicePosture},
    {AnomalyReason::PostureOutdated, "POSTURE_OUTDATED", StrideCategory::Tampering, SignalType::DevicePosture},
    {AnomalyReason::TlsAnomaly, "TLS_ANOMALY", StrideCategory::Tampering, SignalType::TlsFingerprint},
    {AnomalyReason::Repudiation, "REPUDIATION", StrideCategory::Repudiation, std::nullopt},
    {AnomalyReason::MissingSignal, "MISSING_SIGNAL", StrideCategory::Repudiation, std::nullopt},
    {AnomalyReason::InsufficientSignal, "INSUFFICIENT_SIGNAL", StrideCategory::Repudiation, std::nullopt},
    {AnomalyReason::Reconnaissance, "RECONNAISSANCE", StrideCategory::InformationDisclosure, std::nullopt},
    {AnomalyReason::Exfiltration, "DOWNLOAD_EXFIL", StrideCategory::InformationDisclosure, std::nullopt},
    {AnomalyReason::DenialOfService, "DOS", StrideCategory::DenialOfService, std::nullopt},
    {AnomalyReason::BruteForce, "BRUTE_FORCE", StrideCategory::DenialOfService, std::nullopt},
    {AnomalyReason::PolicyElevation, "POLICY_ELEVATION", StrideCategory::ElevationOfPrivilege, std::nullopt},
};

const ReasonInfo& info(AnomalyReason r) {
  return kReasons[static_cast<size_t>(r)];
}

struct LabelRule {
  std::string_view label; // normalized
  bool prefix;
  AnomalyReason first;
  std::optional<AnomalyReason> second;
};

// First match wins, so specific entries precede their prefixes.
constexpr LabelRule kLabelRules[] = {
    {"DDOS", false, AnomalyReason::DenialOfService, std::nullopt},
    {"DOS", false, AnomalyReason::DenialOfService, std::nullopt},
    {"DOS_", true, AnomalyReason::DenialOfService, std::nullopt},
    {"PORTSCAN", false, AnomalyReason::Reconnaissance, std::nullopt},
    {"PORT_SCAN", false, AnomalyReason::Reconnaissance, std::nullopt},
    {"FTP_PATATOR", false, AnomalyReason::BruteForce, std::nullopt},
    {"SSH_PATATOR", false, AnomalyReason::BruteForce, std::nullopt},
    {"BRUTE_FORCE", false, AnomalyReason::BruteForce, std::nullopt},
    {"BRUTEFORCE", false, AnomalyReason::BruteForce, std::nullopt},
    {"CREDENTIAL_STUFFING", false, AnomalyReason::BruteForce, std::nullopt},
    {"WEB_ATTACK_BRUTE_FORCE", false, AnomalyReason::BruteForce, AnomalyReason::PolicyElevation},
    {"WEB_ATTACK", true, AnomalyReason::PolicyElevation, std::nullopt},
    {"WEBATTACK", false, AnomalyReason::PolicyElevation, std::nullopt},
    {"INFILTRATION", false, AnomalyReason::Exfiltration, std::nullopt},
    {"INFILTERATION", false, AnomalyReason::Exfiltration, std::nullopt},
    {"BOT", false, AnomalyReason::Exfiltration, std::nullopt},
    {"BOTNET", false, AnomalyReason::Exfiltration, std::nullopt},
    {"HEARTBLEED", false, AnomalyReason::TlsAnomaly, AnomalyReason::Exfiltration},
    {"REPUDIATION", false, AnomalyReason::Repudiation, std::nullopt},
};

} // namespace

StrideCategory stride_of(AnomalyReason r) { return info(r).stride; }

std::optional<SignalType> bound_signal(AnomalyReason r) { return info(r).signal; }

std::string_view to_string(AnomalyReason r) { return info(r).token; }

std::optional<AnomalyReason> parse_reason(std::string_view token) {
  std::string n = normalize_token(token);
  for (const auto& ri : kReasons) {
    if (ri.token == n) return ri.reason;
  }
  return std::nullopt;
}

std::vector<AnomalyReason> reasons_for_label(std::string_view label) {
  std::string n = normalize_token(label);
  std::vector<AnomalyReason> out;
  if (n.empty() || n == "BENIGN") return out;
  for (const auto& rule : kLabelRules) {
    bool match = rule.prefix ? n.compare(0, rule.label.size(), rule.label) == 0
                             : n == rule.label;
    if (!match) continue;
    out.push_back(rule.first);
    if (rule.second) out.push_back(*rule.second);
    break;
  }
  return out;
}

} // namespace authgate
