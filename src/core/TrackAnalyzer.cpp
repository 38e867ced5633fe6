// TrackAnalyzer drives one aggregator over every segment of a document.

#include "TrackAnalyzer.hpp"
#include "core/GeoUtils.hpp"
#include "core/Units.hpp"
#include <cmath>
#include <initializer_list>

std::optional<double> TrackAnalysis::movingPace() const {
  const double km = Units::m_to_km(stats.length);
  if (km <= 0)
    return std::nullopt;
  return static_cast<double>(stats.duration.moving) / km;
}

std::optional<double> TrackAnalysis::movingSpeed() const {
  if (stats.duration.moving <= 0)
    return std::nullopt;
  return Units::m_to_km(stats.length) /
         Units::ms_to_h(static_cast<double>(stats.duration.moving));
}

std::optional<double> TrackAnalysis::totalSpeed() const {
  if (stats.duration.total <= 0)
    return std::nullopt;
  return Units::m_to_km(stats.length) /
         Units::ms_to_h(static_cast<double>(stats.duration.total));
}

std::optional<std::pair<std::size_t, TrackPoint>>
TrackAnalysis::closestPoint(const Coordinate &ll, bool fast) const {
  if (points.empty())
    return std::nullopt;

  auto dist = [&ll, fast](const TrackPoint &p) {
    if (fast)
      return std::fabs(ll.lat - p.coord.lat) + std::fabs(ll.lon - p.coord.lon);
    return GeoUtils::surface_distance(ll, p.coord);
  };

  std::size_t best = 0;
  double best_d = dist(points[0]);
  for (std::size_t i = 1; i < points.size(); ++i) {
    const double d = dist(points[i]);
    if (d < best_d) {
      best = i;
      best_d = d;
    }
  }
  return std::make_pair(best, points[best]);
}

// Name is the first one found; descriptions of the document and of every
// route/track are joined, one per line.
TrackInfo TrackAnalyzer::collectInfo(const TrackDocument &doc) {
  TrackInfo info;
  info.name = doc.name;
  for (const auto &g : doc.groups) {
    if (!info.name.empty())
      break;
    info.name = g.name;
  }
  if (!doc.desc.empty())
    info.desc += doc.desc + "\n";
  for (const auto &g : doc.groups) {
    if (!g.desc.empty())
      info.desc += g.desc + "\n";
  }
  info.author = doc.author;
  info.copyright = doc.copyright;
  return info;
}

TrackAnalysis TrackAnalyzer::analyze(TrackDocument &doc) const {
  TrackAnalysis out;
  out.info = collectInfo(doc);

  // fresh accumulator per document
  TrackStatsAggregator agg(P);

  // routes first, then tracks, like the tag order of the original format
  for (WayKind kind : {WayKind::Route, WayKind::Track}) {
    if (kind == WayKind::Route && !P.parse_routes)
      continue;
    if (kind == WayKind::Track && !P.parse_tracks)
      continue;
    for (auto &group : doc.groups) {
      if (group.kind != kind)
        continue;
      for (auto &seg : group.segments) {
        agg.addSegment(seg);
        out.points.insert(out.points.end(), seg.begin(), seg.end());
      }
    }
  }

  if (P.parse_waypoints) {
    for (std::size_t i = 0; i < doc.waypoints.size(); ++i)
      agg.addWaypoint();
  }

  out.stats = agg.finalize();
  return out;
}
