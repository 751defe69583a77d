#include "authgate/Geo.h"
#include "authgate/Util.h"
#include <cmath>

namespace authgate {

namespace {
constexpr double kPi = 3.14159265358979323846;
double radians(double deg) { return deg * kPi / 180.0; }
}

bool valid_coordinates(double lat, double lon) {
  return std::isfinite(lat) && std::isfinite(lon) &&
         lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

double haversine_km(const GeoPoint& a, const GeoPoint& b) {
  double dlat = radians(b.lat - a.lat);
  double dlon = radians(b.lon - a.lon);
  double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
             std::cos(radians(a.lat)) * std::cos(radians(b.lat)) *
             std::sin(dlon / 2) * std::sin(dlon / 2);
  if (h > 1.0) h = 1.0;
  return 2.0 * kEarthRadiusKm * std::asin(std::sqrt(h));
}

std::optional<GeoPoint> gps_point(const SignalRecord& rec) {
  auto lat_it = rec.find("lat");
  auto lon_it = rec.find("lon");
  if (lat_it == rec.end() || lon_it == rec.end()) return std::nullopt;
  auto lat = parse_double(lat_it->second);
  auto lon = parse_double(lon_it->second);
  if (!lat || !lon || !valid_coordinates(*lat, *lon)) return std::nullopt;
  return GeoPoint{*lat, *lon};
}

double round_to(double v, int decimals) {
  double f = std::pow(10.0, decimals);
  return std::round(v * f) / f;
}

} // namespace authgate
