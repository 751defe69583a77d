#include "authgate/Enrichment.h"
#include "authgate/Util.h"

namespace authgate {

namespace {

bool same_point(const GeoPoint& a, const GeoPoint& b) {
  return a.lat == b.lat && a.lon == b.lon;
}

std::string field(const SignalRecord* rec, const char* key) {
  if (!rec) return {};
  auto it = rec->find(key);
  return it == rec->end() ? std::string{} : trim(it->second);
}

} // namespace

bool EnrichmentResult::operator==(const EnrichmentResult& o) const {
  if (geo.has_value() != o.geo.has_value() || wifi.has_value() != o.wifi.has_value() ||
      tls.has_value() != o.tls.has_value() || device.has_value() != o.device.has_value()) {
    return false;
  }
  if (geo && (geo->country != o.geo->country || geo->city != o.geo->city ||
              !same_point(geo->location, o.geo->location) || geo->anonymous != o.geo->anonymous)) {
    return false;
  }
  if (wifi && (wifi->ssid != o.wifi->ssid || !same_point(wifi->location, o.wifi->location))) {
    return false;
  }
  if (tls && tls->tag != o.tls->tag) return false;
  if (device && (device->os != o.device->os || device->patched != o.device->patched ||
                 device->edr != o.device->edr ||
                 device->last_update_day != o.device->last_update_day)) {
    return false;
  }
  if (checks.size() != o.checks.size()) return false;
  for (size_t i = 0; i < checks.size(); ++i) {
    const auto& a = checks[i];
    const auto& b = o.checks[i];
    if (a.metric_name != b.metric_name || a.value != b.value ||
        a.threshold != b.threshold || a.subject != b.subject || a.reference != b.reference) {
      return false;
    }
  }
  return true;
}

EnrichmentResolver::EnrichmentResolver(const EnrichmentConfig& cfg, const ReferenceStore& refs)
    : cfg_(cfg), refs_(refs) {}

bool EnrichmentResolver::ready() const { return refs_.snapshot() != nullptr; }

EnrichmentResult EnrichmentResolver::enrich(const SignalBundle& bundle) const {
  auto snap = refs_.snapshot();
  if (!snap) {
    static const ReferenceSnapshot kEmpty{};
    return enrich(bundle, kEmpty);
  }
  return enrich(bundle, *snap);
}

EnrichmentResult EnrichmentResolver::enrich(const SignalBundle& bundle,
                                            const ReferenceSnapshot& snap) const {
  EnrichmentResult out{};

  std::string ip = field(bundle.find(SignalType::IpOrigin), "ip");
  if (!ip.empty()) {
    if (const GeoRecord* g = snap.lookup_ip(ip)) {
      out.geo = GeoAnnotation{g->country, g->city, g->location, g->anonymous};
    }
  }

  std::string bssid = field(bundle.find(SignalType::WifiAp), "bssid");
  if (!bssid.empty()) {
    if (const WifiRecord* w = snap.lookup_wifi(bssid)) {
      out.wifi = WifiAnnotation{w->ssid, w->location};
    }
  }

  std::string ja3 = field(bundle.find(SignalType::TlsFingerprint), "ja3");
  if (!ja3.empty()) {
    if (const std::string* tag = snap.lookup_tls(ja3)) {
      out.tls = TlsAnnotation{*tag};
    }
  }

  std::string dev = field(bundle.find(SignalType::DevicePosture), "device_id");
  if (!dev.empty()) {
    if (const DeviceRecord* d = snap.lookup_device(dev)) {
      out.device = DeviceAnnotation{d->os, d->patched, d->edr, d->last_update_day};
    }
  }

  // GPS is compared against the access point when it resolved, otherwise
  // against the IP-derived location.
  const SignalRecord* gps_rec = bundle.find(SignalType::Gps);
  std::optional<GeoPoint> gps = gps_rec ? gps_point(*gps_rec) : std::nullopt;
  if (gps) {
    const GeoPoint* other = nullptr;
    SignalType source = SignalType::WifiAp;
    if (out.wifi) {
      other = &out.wifi->location;
    } else if (out.geo) {
      other = &out.geo->location;
      source = SignalType::IpOrigin;
    }
    if (other) {
      out.checks.push_back(ConsistencyCheck{"ip_wifi_distance_km",
                                            round_to(haversine_km(*gps, *other), 3),
                                            cfg_.gps_distance_km, SignalType::Gps, source});
    }
  }
  if (out.wifi && out.geo) {
    out.checks.push_back(ConsistencyCheck{"wifi_ip_distance_km",
                                          round_to(haversine_km(out.wifi->location, out.geo->location), 3),
                                          cfg_.ip_distance_km, SignalType::IpOrigin,
                                          SignalType::WifiAp});
  }
  return out;
}

} // namespace authgate
