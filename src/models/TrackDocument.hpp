#pragma once

#include "core/TimeUtils.hpp"
#include "models/CoreTypes.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

using Json = nlohmann::json;

// Structures decoded from the JSON form of a GPX document.  The ingestion
// side has already flattened the XML; here we only map fields and fill the
// "no value" states.

// ---------- field helpers ----------

// Numbers, numeric strings and null are accepted; anything else is absent.
inline std::optional<double> optional_number(const Json &j,
                                             const char *key) {
  if (!j.contains(key))
    return std::nullopt;
  const Json &x = j[key];
  if (x.is_number()) {
    const double v = x.get<double>();
    return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
  }
  if (x.is_string()) {
    try {
      const double v = std::stod(x.get<std::string>());
      return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

// Values that do not fit an int are treated as absent.
inline std::optional<int> optional_int(const Json &j, const char *key) {
  const auto v = optional_number(j, key);
  if (!v)
    return std::nullopt;
  const double t = std::trunc(*v); // parseInt semantics
  if (t < std::numeric_limits<int>::min() || t > std::numeric_limits<int>::max())
    return std::nullopt;
  return static_cast<int>(t);
}

// Numeric epoch-ms time; empty when outside the accepted epoch range.
inline std::optional<int64_t> epoch_ms_number(const Json &t) {
  if (t.is_number_unsigned()) {
    const auto v = t.get<uint64_t>();
    if (v > static_cast<uint64_t>(TimeUtils::kMaxAbsEpochMs))
      return std::nullopt;
    return static_cast<int64_t>(v);
  }
  if (t.is_number_integer()) {
    const auto v = t.get<int64_t>();
    return TimeUtils::in_epoch_range(v) ? std::optional<int64_t>(v)
                                        : std::nullopt;
  }
  const double v = std::trunc(t.get<double>());
  const double bound = static_cast<double>(TimeUtils::kMaxAbsEpochMs);
  if (!std::isfinite(v) || v < -bound || v > bound)
    return std::nullopt;
  return static_cast<int64_t>(v);
}

inline double required_number(const Json &j, const char *key) {
  const auto v = optional_number(j, key);
  if (!v)
    throw std::runtime_error(std::string("point is missing '") + key + "'");
  return *v;
}

// ---------- TrackPoint ----------
inline void from_json(const Json &j, TrackPoint &p) {
  p.coord.lat = required_number(j, "lat");
  p.coord.lon = required_number(j, "lon");
  p.coord.elv = optional_number(j, "ele");
  if (!p.coord.elv)
    p.coord.elv = optional_number(j, "elv");

  p.time = kEpochSentinelMs;
  p.has_time = false;
  if (j.contains("time")) {
    const Json &t = j["time"];
    if (t.is_number()) {
      if (auto ms = epoch_ms_number(t)) {
        p.time = *ms;
        p.has_time = true;
      }
    } else if (t.is_string()) {
      auto ms = TimeUtils::parse_iso8601_ms(t.get<std::string>());
      if (ms && TimeUtils::in_epoch_range(*ms)) {
        p.time = *ms;
        p.has_time = true;
      }
    }
  }

  p.hr = optional_int(j, "hr");
  p.cad = optional_int(j, "cad");
  p.atemp = optional_number(j, "atemp");
  p.name = j.value("name", "");
  p.meta = PointMetadata{};
}

// ---------- Waypoint ----------
inline void from_json(const Json &j, Waypoint &w) {
  w.coord.lat = required_number(j, "lat");
  w.coord.lon = required_number(j, "lon");
  w.coord.elv = optional_number(j, "ele");
  w.name = j.value("name", "");
  w.desc = j.value("desc", "");
  w.link = j.value("link", "");
  w.sym = j.value("sym", "");
}

// --- Route: a single run of points ----
inline TrackGroup route_from_json(const Json &j) {
  TrackGroup g;
  g.kind = WayKind::Route;
  g.name = j.value("name", "");
  g.desc = j.value("desc", "");
  Segment pts;
  if (j.contains("points") && j["points"].is_array()) {
    for (const auto &P : j["points"])
      pts.push_back(P.get<TrackPoint>());
  }
  g.segments.push_back(std::move(pts));
  return g;
}

// --- Track: one or more segments ----
inline TrackGroup track_from_json(const Json &j) {
  TrackGroup g;
  g.kind = WayKind::Track;
  g.name = j.value("name", "");
  g.desc = j.value("desc", "");
  if (j.contains("segments") && j["segments"].is_array()) {
    for (const auto &S : j["segments"]) {
      if (!S.is_array())
        throw std::runtime_error("track segment must be an array of points");
      Segment seg;
      seg.reserve(S.size());
      for (const auto &P : S)
        seg.push_back(P.get<TrackPoint>());
      g.segments.push_back(std::move(seg));
    }
  }
  return g;
}

// --- TrackDocument ----
inline void from_json(const Json &j, TrackDocument &d) {
  if (!j.is_object())
    throw std::runtime_error("track document must be a JSON object");
  d.name = j.value("name", "");
  d.desc = j.value("desc", "");
  d.author = j.value("author", "");
  d.copyright = j.value("copyright", "");

  // routes are listed before tracks, matching the order they are aggregated
  d.groups.clear();
  if (j.contains("routes") && j["routes"].is_array()) {
    for (const auto &R : j["routes"])
      d.groups.push_back(route_from_json(R));
  }
  if (j.contains("tracks") && j["tracks"].is_array()) {
    for (const auto &T : j["tracks"])
      d.groups.push_back(track_from_json(T));
  }
  d.waypoints.clear();
  if (j.contains("waypoints") && j["waypoints"].is_array()) {
    for (const auto &W : j["waypoints"])
      d.waypoints.push_back(W.get<Waypoint>());
  }
}
