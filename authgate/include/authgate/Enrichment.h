#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Common.h"
#include "Geo.h"
#include "ReferenceData.h"

namespace authgate {

struct GeoAnnotation {
  std::string country;
  std::string city;
  GeoPoint location{};
  bool anonymous{false};
};

struct WifiAnnotation {
  std::string ssid;
  GeoPoint location{};
};

struct TlsAnnotation {
  std::string tag;
};

struct DeviceAnnotation {
  std::string os;
  std::optional<bool> patched{};
  std::string edr;
  std::optional<int64_t> last_update_day{};
};

struct ConsistencyCheck {
  std::string metric_name;
  double value{0.0};
  double threshold{0.0};
  SignalType subject{SignalType::Gps}; // signal whose trust a violation reduces
  SignalType reference{SignalType::WifiAp}; // signal the location was derived from

  bool exceeded() const { return value > threshold; }
};

struct EnrichmentResult {
  std::optional<GeoAnnotation> geo{};
  std::optional<WifiAnnotation> wifi{};
  std::optional<TlsAnnotation> tls{};
  std::optional<DeviceAnnotation> device{};
  std::vector<ConsistencyCheck> checks;

  bool operator==(const EnrichmentResult& o) const;
};

struct EnrichmentConfig {
  double gps_distance_km{50.0};   // gps vs wifi (or ip) location
  double ip_distance_km{1000.0};  // wifi vs ip location
};

class EnrichmentResolver {
 public:
  EnrichmentResolver(const EnrichmentConfig& cfg, const ReferenceStore& refs);

  // False when no reference snapshot has been published yet.
  bool ready() const;

  // Uses one snapshot for the whole call. An unpublished store behaves as
  // empty reference data.
  EnrichmentResult enrich(const SignalBundle& bundle) const;
  EnrichmentResult enrich(const SignalBundle& bundle, const ReferenceSnapshot& snap) const;

 private:
  EnrichmentConfig cfg_{};
  const ReferenceStore& refs_;
};

} // namespace authgate
