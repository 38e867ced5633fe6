#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  double phi1 = deg2rad(lat1);
  double phi2 = deg2rad(lat2);
  double delta_phi = deg2rad(lat2 - lat1);
  double delta_gamma = deg2rad(lon2 - lon1);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  // rounding can push h a hair past 1 for antipodal points
  h = std::min(1.0, std::max(0.0, h));
  return 2 * kEarthRadiusM * asin(sqrt(h));
}

double GeoUtils::surface_distance(const Coordinate &a, const Coordinate &b) {
  return haversine(a.lat, a.lon, b.lat, b.lon);
}

double GeoUtils::spatial_distance_3d(const Coordinate &a,
                                     const Coordinate &b) {
  const double planar = surface_distance(a, b);
  const double height = (a.elv && b.elv) ? (*b.elv - *a.elv) : 0.0;
  return std::sqrt(planar * planar + height * height);
}
