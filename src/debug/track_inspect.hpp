#pragma once
#include "models/CoreTypes.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

// Structural overview of a decoded document: counts per group plus the
// first few points, handy when an upload produces surprising statistics.
inline nlohmann::json summarize(const TrackDocument &d,
                                std::size_t sample_n = 3) {
  using nlohmann::json;
  json out;
  out["name"] = d.name;

  std::size_t total_points = 0, with_ele = 0, with_time = 0, with_hr = 0;
  json groups = json::array();
  for (const auto &g : d.groups) {
    json seg_sizes = json::array();
    json samples = json::array();
    for (const auto &seg : g.segments) {
      seg_sizes.push_back(seg.size());
      for (const auto &p : seg) {
        ++total_points;
        with_ele += p.coord.elv ? 1 : 0;
        with_time += p.has_time ? 1 : 0;
        with_hr += p.hr ? 1 : 0;
        if (samples.size() < sample_n) {
          samples.push_back({{"lat", p.coord.lat},
                             {"lon", p.coord.lon},
                             {"ele", p.coord.elv ? json(*p.coord.elv)
                                                 : json(nullptr)},
                             {"time", p.time}});
        }
      }
    }
    groups.push_back({{"kind", WayKindToString(g.kind)},
                      {"name", g.name},
                      {"segments", seg_sizes},
                      {"samples", samples}});
  }

  out["groups"] = groups;
  out["points"] = {{"count", total_points},
                   {"with_elevation", with_ele},
                   {"with_time", with_time},
                   {"with_hr", with_hr}};
  out["waypoints"] = d.waypoints.size();
  return out;
}
