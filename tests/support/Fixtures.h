#pragma once
#include "authgate/AlertStore.h"
#include "authgate/AuditStore.h"
#include "authgate/Common.h"
#include "authgate/ReferenceData.h"
#include "authgate/TrustScorer.h"
#include "authgate/Util.h"
#include <cmath>
#include <memory>
#include <string>

namespace authgate::testing {

constexpr const char* kGoodJa3 = "0123456789abcdef0123456789abcdef";
constexpr const char* kBadJa3 = "e7d705a3286e19ea42f587b344ee6865";
constexpr const char* kOfficeBssid = "aa:bb:cc:dd:ee:01";

inline bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

// 2024-05-10T12:00:00Z
inline TimeMs fixed_now_ms() {
  return static_cast<TimeMs>(days_from_civil(2024, 5, 10)) * 86400000ull + 12ull * 3600000ull;
}

// Berlin office: IP range, access point and a healthy laptop all agree.
inline std::shared_ptr<const ReferenceSnapshot> sample_snapshot() {
  auto snap = std::make_shared<ReferenceSnapshot>();
  snap->add_geo_network("203.0.113.0/24", GeoRecord{"DE", "Berlin", GeoPoint{52.52, 13.405}, false});
  snap->add_geo_network("198.51.100.0/24", GeoRecord{"NL", "Amsterdam", GeoPoint{52.37, 4.89}, true});
  snap->add_wifi(kOfficeBssid, WifiRecord{"office", GeoPoint{52.52, 13.405}});
  snap->add_tls(kBadJa3, "tor_suspect");
  snap->add_device("dev-1", DeviceRecord{"windows", true, "crowdstrike", days_from_civil(2024, 5, 1)});
  snap->add_device("dev-old", DeviceRecord{"linux", true, "defender", days_from_civil(2023, 1, 1)});
  return snap;
}

inline SignalBundle clean_bundle(const std::string& session_id = "sess-clean") {
  SignalBundle b{};
  b.session_id = session_id;
  b.signals[SignalType::IpOrigin] = {{"ip", "203.0.113.10"}};
  b.signals[SignalType::Gps] = {{"lat", "52.5201"}, {"lon", "13.4049"}};
  b.signals[SignalType::WifiAp] = {{"bssid", "AA-BB-CC-DD-EE-01"}};
  b.signals[SignalType::DevicePosture] = {{"device_id", "dev-1"}, {"patched", "true"},
                                          {"edr", "crowdstrike"}};
  b.signals[SignalType::TlsFingerprint] = {{"ja3", kGoodJa3}};
  return b;
}

// Same as clean_bundle but the phone reports a position ~600 km south.
inline SignalBundle travel_mismatch_bundle(const std::string& session_id = "sess-travel") {
  SignalBundle b = clean_bundle(session_id);
  b.signals[SignalType::Gps] = {{"lat", "47.124"}, {"lon", "13.405"}};
  return b;
}

class FailingAlertStore final : public IAlertStore {
 public:
  StoreStatus append(const AlertRecord&) override { return StoreStatus::Fail("alerts down"); }
  StoreStatus query(const std::string&, TimeMs, std::vector<AlertRecord>&, TimeMs) const override {
    return StoreStatus::Fail("alerts down");
  }
};

class FailingAuditStore final : public IAuditStore {
 public:
  StoreStatus append(const EnforcementRecord&) override { return StoreStatus::Fail("disk full"); }
};

class UnavailableTrustService final : public ITrustService {
 public:
  TrustResult score(const ValidatedVector&, const AlertWindowCount&, TimeMs) override {
    return TrustResult{false, {}, "connection refused"};
  }
};

} // namespace authgate::testing
