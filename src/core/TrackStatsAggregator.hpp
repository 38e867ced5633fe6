#pragma once
#include "models/CoreTypes.hpp"
#include "models/TrackStats.hpp"
#include "models/params.hpp"
#include <optional>

// Single forward pass over the points of one document.  Each call to
// addSegment() continues from the state left by the previous one, so the
// gap between the last point of a segment and the first point of the next
// counts towards distance and time like any other gap.
//
// One aggregator accumulates one document; use a new instance (or reset())
// per document.
class TrackStatsAggregator {
public:
  explicit TrackStatsAggregator(StatsParams p = StatsParams{}) : P(p) {}

  const StatsParams &params() const noexcept { return P; }

  // Aggregate a contiguous run of points, stamping each point's meta.
  void addSegment(Segment &points);
  // Throws std::out_of_range for a time outside TimeUtils::kMaxAbsEpochMs.
  void addPoint(TrackPoint &pt);

  // Waypoints are only counted.
  void addWaypoint() noexcept { ++stats_.waypoint_count; }

  // Computes the sensor averages.  Calling it again is a no-op; adding
  // points afterwards throws std::logic_error.
  const AggregateStats &finalize();

  const AggregateStats &stats() const noexcept { return stats_; }
  bool empty() const noexcept { return stats_.point_count == 0; }

  void reset() noexcept;

private:
  // What we keep of a processed point; never a pointer into the caller's
  // containers since segments may live in separate vectors.
  struct PointRef {
    Coordinate coord;
    int64_t time = 0;
    int64_t cum_time = 0;
    std::optional<double> grd;
  };

  StatsParams P;
  AggregateStats stats_;
  std::optional<PointRef> last_;     // immediately preceding point
  std::optional<PointRef> last_ele_; // last elevation reference point

  void updateElevation(TrackPoint &pt);
  void accumulateSensors(const TrackPoint &pt);
  static void raiseMax(std::optional<double> &cur, double v);
  static void lowerMin(std::optional<double> &cur, double v);
};
