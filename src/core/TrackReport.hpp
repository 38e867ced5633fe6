#pragma once
#include "core/DataSeries.hpp"
#include "core/TrackAnalyzer.hpp"
#include "core/Units.hpp"
#include <nlohmann/json.hpp>

// JSON views of a finished analysis, as returned by the HTTP endpoints and
// the command-line mode.
class TrackReport {
public:
  static nlohmann::json build(const TrackAnalysis &a,
                              UnitSystem units = UnitSystem::Metric,
                              bool include_points = false);

  // {"metric", "axis", "units", "data": [[x, y, label], ...]}
  static nlohmann::json series(const TrackAnalysis &a, SeriesMetric metric,
                               SeriesAxis axis,
                               UnitSystem units = UnitSystem::Metric);

  static nlohmann::json point(const TrackPoint &p);

private:
  static nlohmann::json formatted(const TrackAnalysis &a, UnitSystem units);
};
