#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// User-supplied parameters controlling statistics accumulation.
struct StatsParams {
  static constexpr int64_t kDefaultMaxPointIntervalMs = 15000;
  static constexpr double kDefaultElevationThresholdM = 4.0; // GPS noise

  int64_t max_point_interval_ms = kDefaultMaxPointIntervalMs;
  double elevation_threshold_m = kDefaultElevationThresholdM;
  bool parse_routes = true;
  bool parse_tracks = true;
  bool parse_waypoints = true;

  static StatsParams from_json(const nlohmann::json &j) {
    return from_json(j, StatsParams());
  }

  // Missing keys keep the values already in `base`.  Zero or negative
  // interval/threshold fall back to the defaults.
  static StatsParams from_json(const nlohmann::json &j, StatsParams base) {
    StatsParams p = base;
    if (!j.is_object())
      return p;
    if (j.contains("max_point_interval_ms")) {
      const auto v = j.at("max_point_interval_ms").get<int64_t>();
      p.max_point_interval_ms = v > 0 ? v : kDefaultMaxPointIntervalMs;
    }
    if (j.contains("elevation_threshold_m")) {
      const auto v = j.at("elevation_threshold_m").get<double>();
      p.elevation_threshold_m = v > 0 ? v : kDefaultElevationThresholdM;
    }
    if (j.contains("parse_elements") && j["parse_elements"].is_array()) {
      p.parse_routes = p.parse_tracks = p.parse_waypoints = false;
      for (const auto &e : j["parse_elements"]) {
        const auto name = e.get<std::string>();
        if (name == "route")
          p.parse_routes = true;
        else if (name == "track")
          p.parse_tracks = true;
        else if (name == "waypoint")
          p.parse_waypoints = true;
      }
    }
    return p;
  }

  nlohmann::json to_json() const {
    nlohmann::json elements = nlohmann::json::array();
    if (parse_routes)
      elements.push_back("route");
    if (parse_tracks)
      elements.push_back("track");
    if (parse_waypoints)
      elements.push_back("waypoint");
    return {{"max_point_interval_ms", max_point_interval_ms},
            {"elevation_threshold_m", elevation_threshold_m},
            {"parse_elements", elements}};
  }
};
