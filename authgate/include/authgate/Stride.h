#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include "Common.h"

namespace authgate {

enum class AnomalyReason : uint8_t {
  Spoofing = 0,
  LocationMismatch,
  Tampering,
  PostureOutdated,
  TlsAnomaly,
  Repudiation,
  MissingSignal,
  InsufficientSignal,
  Reconnaissance,
  Exfiltration,
  DenialOfService,
  BruteForce,
  PolicyElevation,
};

constexpr size_t kAnomalyReasonCount = 13;

// Every reason belongs to exactly one STRIDE category.
StrideCategory stride_of(AnomalyReason r);

// The signal whose weight scales this reason's risk contribution, if any.
std::optional<SignalType> bound_signal(AnomalyReason r);

// Wire token, e.g. "LOCATION_MISMATCH".
std::string_view to_string(AnomalyReason r);
std::optional<AnomalyReason> parse_reason(std::string_view token);

// Network-flow classification label -> reasons. BENIGN and unknown labels
// map to nothing.
std::vector<AnomalyReason> reasons_for_label(std::string_view label);

} // namespace authgate
