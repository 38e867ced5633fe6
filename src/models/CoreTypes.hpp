#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Timestamp used for points with no (or an unreadable) <time>.
constexpr int64_t kEpochSentinelMs = 0;

// Basic spatial coordinate with optional elevation.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> elv; // metres, empty when the sample carries none
};

// Derived quantities stamped on each point while it is aggregated.
struct PointMetadata {
  double cum_dist = 0.0;      // metres from the start of the document
  int64_t cum_time = 0;       // ms from the start of the document
  double velocity = 0.0;      // km/h since previous point, 0 for the first
  std::optional<double> grd;  // percent, empty until two elevation refs exist
};

// A single sampled point of a track or route.
struct TrackPoint {
  Coordinate coord;
  int64_t time = kEpochSentinelMs; // ms since Unix epoch (UTC)
  bool has_time = false;
  std::optional<int> hr;      // heart rate, bpm
  std::optional<int> cad;     // cadence, rpm
  std::optional<double> atemp; // ambient temperature, degrees
  std::string name;

  PointMetadata meta;
};

using Segment = std::vector<TrackPoint>;

// Routes hold one run of points, tracks hold one or more segments.
enum class WayKind : uint8_t { Route, Track };

inline const char *WayKindToString(WayKind kind) {
  switch (kind) {
  case WayKind::Route:
    return "route";
  case WayKind::Track:
    return "track";
  }
  return "unknown";
}

struct TrackGroup {
  WayKind kind = WayKind::Track;
  std::string name;
  std::string desc;
  std::vector<Segment> segments;
};

// Standalone <wpt>; counted, never aggregated.
struct Waypoint {
  Coordinate coord;
  std::string name;
  std::string desc;
  std::string link;
  std::string sym;
};

// Convenience container for a full document.
struct TrackDocument {
  std::string name;
  std::string desc;
  std::string author;
  std::string copyright;
  std::vector<TrackGroup> groups; // in document order
  std::vector<Waypoint> waypoints;
};
