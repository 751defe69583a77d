#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace authgate {

using TimeMs = uint64_t;

enum class SignalType : uint8_t {
  IpOrigin = 0,
  Gps = 1,
  WifiAp = 2,
  DevicePosture = 3,
  TlsFingerprint = 4,
};

constexpr size_t kSignalTypeCount = 5;

constexpr std::array<SignalType, kSignalTypeCount> kAllSignalTypes{
    SignalType::IpOrigin, SignalType::Gps, SignalType::WifiAp,
    SignalType::DevicePosture, SignalType::TlsFingerprint};

// Opaque per-signal payload. Values arrive as text and are parsed by the
// stage that needs them.
using SignalRecord = std::map<std::string, std::string>;

struct SignalBundle {
  std::string session_id;
  std::map<SignalType, SignalRecord> signals;
  std::optional<std::string> label{}; // network-flow classification, if known

  bool empty() const { return signals.empty() && !label.has_value(); }
  const SignalRecord* find(SignalType t) const {
    auto it = signals.find(t);
    return it == signals.end() ? nullptr : &it->second;
  }
};

enum class Decision : uint8_t {
  Allow = 0,
  StepUp = 1,
  Deny = 2,
};

enum class Enforcement : uint8_t {
  Allow = 0,
  MfaStepUp = 1,
  Deny = 2,
};

enum class Severity : uint8_t {
  Low = 0,
  Medium = 1,
  High = 2,
};

enum class StrideCategory : uint8_t {
  Spoofing = 0,
  Tampering,
  Repudiation,
  InformationDisclosure,
  DenialOfService,
  ElevationOfPrivilege,
};

std::string_view to_string(SignalType t);
std::string_view to_string(Decision d);
std::string_view to_string(Enforcement e);
std::string_view to_string(Severity s);
std::string_view to_string(StrideCategory c);

// Accepts the current wire names and the legacy ones (ip_geo, wifi_bssid, tls_fp).
std::optional<SignalType> parse_signal_type(std::string_view name);
std::optional<Decision> parse_decision(std::string_view name);
std::optional<Enforcement> parse_enforcement(std::string_view name);
// "critical" folds into High; unknown strings are rejected.
std::optional<Severity> parse_severity(std::string_view name);
// Case and separator insensitive ("dos", "DoS", "denial_of_service", "EoP"...).
std::optional<StrideCategory> parse_stride(std::string_view name);

inline Enforcement enforcement_for(Decision d) {
  switch (d) {
    case Decision::Allow: return Enforcement::Allow;
    case Decision::StepUp: return Enforcement::MfaStepUp;
    case Decision::Deny: return Enforcement::Deny;
  }
  return Enforcement::Deny;
}

} // namespace authgate
