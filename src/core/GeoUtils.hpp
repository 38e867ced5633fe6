#pragma once
#include "models/CoreTypes.hpp"
#include <cmath>

class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;

  // haversine formula on a spherical earth, metres
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double surface_distance(const Coordinate &a, const Coordinate &b);

  // Pythagorean combination of the surface leg and the elevation change.
  // A missing elevation on either end makes the vertical leg 0.
  static double spatial_distance_3d(const Coordinate &a, const Coordinate &b);

  static double deg2rad(double deg) { return deg * M_PI / 180.0; }
};
