#pragma once
#include "core/TrackStatsAggregator.hpp"
#include "models/CoreTypes.hpp"
#include "models/TrackStats.hpp"
#include "models/params.hpp"
#include <optional>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

struct TrackInfo {
  std::string name;
  std::string desc;
  std::string author;
  std::string copyright;
};

// Result of one full-document pass; read-only once returned.
struct TrackAnalysis {
  TrackInfo info;
  AggregateStats stats;
  std::vector<TrackPoint> points; // enriched, in aggregation order

  // Derived figures; empty when the denominator is zero
  std::optional<double> movingPace() const;  // ms per km
  std::optional<double> movingSpeed() const; // km/h
  std::optional<double> totalSpeed() const;  // km/h

  // Enriched point by aggregation index; throws std::out_of_range.
  const TrackPoint &point(std::size_t i) const { return points.at(i); }

  // Index and point nearest to `ll`, first one wins on ties.  `fast` ranks
  // by |dlat| + |dlon| instead of the haversine distance.  Empty when there
  // are no points.
  std::optional<std::pair<std::size_t, TrackPoint>>
  closestPoint(const Coordinate &ll, bool fast = false) const;
};

class TrackAnalyzer {
public:
  explicit TrackAnalyzer(StatsParams p = StatsParams{}) : P(p) {}

  void setParams(const StatsParams &params) { P = params; }
  const StatsParams &params() const noexcept { return P; }

  // Aggregates routes, then tracks, then counts waypoints.  The document's
  // points receive their metadata in place.
  TrackAnalysis analyze(TrackDocument &doc) const;

private:
  StatsParams P;
  static TrackInfo collectInfo(const TrackDocument &doc);
};
