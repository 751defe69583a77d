#pragma once
#include <optional>
#include "Common.h"

namespace authgate {

struct GeoPoint {
  double lat{0.0};
  double lon{0.0};
};

constexpr double kEarthRadiusKm = 6371.0;

bool valid_coordinates(double lat, double lon);

// Great-circle distance on a spherical earth (haversine).
double haversine_km(const GeoPoint& a, const GeoPoint& b);

// Parses "lat"/"lon" keys of a gps record; nullopt when absent, non-numeric
// or out of range.
std::optional<GeoPoint> gps_point(const SignalRecord& rec);

double round_to(double v, int decimals);

} // namespace authgate
