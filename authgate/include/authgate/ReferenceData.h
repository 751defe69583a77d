#pragma once
#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "Common.h"
#include "Geo.h"
#include "Metrics.h"
#include "Log.h"

namespace authgate {

struct GeoRecord {
  std::string country;
  std::string city;
  GeoPoint location{};
  bool anonymous{false}; // VPN / Tor / hosting egress
};

struct WifiRecord {
  std::string ssid;
  GeoPoint location{};
};

struct DeviceRecord {
  std::string os;
  std::optional<bool> patched{};
  std::string edr;
  std::optional<int64_t> last_update_day{}; // days since epoch
};

// "AA-BB-cc:dd..." -> "aa:bb:cc:dd..."
std::string normalize_bssid(std::string_view bssid);

// Immutable once published through a ReferenceStore. The add_* mutators are
// only for building a fresh snapshot before it is shared.
class ReferenceSnapshot {
 public:
  bool add_geo_network(std::string_view cidr, const GeoRecord& rec);
  void add_wifi(std::string_view bssid, const WifiRecord& rec);
  void add_tls(std::string_view ja3, std::string_view tag);
  void add_device(std::string_view device_id, const DeviceRecord& rec);

  // Longest-prefix match for IPv4, exact match for IPv6.
  const GeoRecord* lookup_ip(std::string_view ip) const;
  const WifiRecord* lookup_wifi(std::string_view bssid) const;
  const std::string* lookup_tls(std::string_view ja3) const;
  const DeviceRecord* lookup_device(std::string_view device_id) const;

  size_t geo_size() const { return geo_count_; }
  size_t wifi_size() const { return wifi_.size(); }
  size_t tls_size() const { return tls_.size(); }
  size_t device_size() const { return devices_.size(); }

 private:
  std::array<std::unordered_map<uint32_t, GeoRecord>, 33> v4_by_prefix_{};
  std::unordered_map<std::string, GeoRecord> v6_exact_;
  std::unordered_map<std::string, WifiRecord> wifi_;
  std::unordered_map<std::string, std::string> tls_;
  std::unordered_map<std::string, DeviceRecord> devices_;
  size_t geo_count_{0};
};

// Holds the current snapshot. Readers take a shared_ptr for the lifetime of
// one request; reload publishes a complete replacement.
class ReferenceStore {
 public:
  ReferenceStore() = default;
  explicit ReferenceStore(std::shared_ptr<const ReferenceSnapshot> initial);

  std::shared_ptr<const ReferenceSnapshot> snapshot() const;
  void publish(std::shared_ptr<const ReferenceSnapshot> next);

 private:
  std::shared_ptr<const ReferenceSnapshot> current_;
};

enum class Dataset : uint8_t { Geo = 0, Wifi, Tls, Device };

std::string_view to_string(Dataset d);

struct DatasetStatus {
  bool loaded{false};
  size_t rows{0};
  size_t skipped{0};
  std::string error;
};

struct ReferencePaths {
  std::string geo;
  std::string wifi;
  std::string tls;
  std::string device;
};

struct ReferenceLoadReport {
  DatasetStatus geo{};
  DatasetStatus wifi{};
  DatasetStatus tls{};
  DatasetStatus device{};
};

// CSV with a header row. Columns:
//   Geo:    network,country,city,lat,lon[,anonymous]
//   Wifi:   bssid,ssid,lat,lon
//   Tls:    ja3,tag
//   Device: device_id,os,patched,edr,last_update
DatasetStatus load_dataset_csv(Dataset kind, std::istream& in, ReferenceSnapshot& snap);

// Missing or unreadable files leave that dataset empty (loaded=false).
std::shared_ptr<const ReferenceSnapshot> load_reference_snapshot(
    const ReferencePaths& paths, ReferenceLoadReport& report,
    ILogSink* log = nullptr, IMetricSink* metrics = nullptr);

} // namespace authgate
