// TrackStatsAggregator reduces an ordered list of track points into the
// document's AggregateStats while stamping per-point metadata.

#include "TrackStatsAggregator.hpp"
#include "core/GeoUtils.hpp"
#include "core/TimeUtils.hpp"
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

void TrackStatsAggregator::raiseMax(std::optional<double> &cur, double v) {
  if (!cur || v > *cur)
    cur = v;
}

void TrackStatsAggregator::lowerMin(std::optional<double> &cur, double v) {
  if (!cur || v < *cur)
    cur = v;
}

void TrackStatsAggregator::reset() noexcept {
  stats_ = AggregateStats{};
  last_.reset();
  last_ele_.reset();
}

void TrackStatsAggregator::addSegment(Segment &points) {
  for (auto &pt : points)
    addPoint(pt);
}

void TrackStatsAggregator::addPoint(TrackPoint &pt) {
  if (stats_.finalized)
    throw std::logic_error("TrackStatsAggregator: point added after finalize");
  if (!TimeUtils::in_epoch_range(pt.time))
    throw std::out_of_range("TrackStatsAggregator: point time out of range");

  PointMetadata &m = pt.meta;
  m = PointMetadata{};
  m.cum_dist = stats_.length; // distance *before* this point's leg

  // Every point with an elevation widens the range, noisy or not
  if (pt.coord.elv) {
    raiseMax(stats_.elevation.range.max, *pt.coord.elv);
    lowerMin(stats_.elevation.range.min, *pt.coord.elv);
  }

  if (last_) {
    const double dist = GeoUtils::spatial_distance_3d(last_->coord, pt.coord);
    stats_.length += dist;

    const int64_t dt = std::llabs(pt.time - last_->time);
    stats_.duration.total += dt;
    if (dt < P.max_point_interval_ms) {
      stats_.duration.moving += dt;
      // dt == 0 leaves the velocity undefined; keep 0 and skip extrema
      if (dt > 0) {
        m.velocity = 3600.0 * dist / static_cast<double>(dt); // km/h
        raiseMax(stats_.velocity.max, m.velocity);
        // stopped samples must not become the slowest moving speed
        if (m.velocity > 0)
          lowerMin(stats_.velocity.min, m.velocity);
      }
    }
    m.cum_time = last_->cum_time + dt;
  } else if (!stats_.duration.start) {
    stats_.duration.start = pt.time;
  }

  updateElevation(pt);
  accumulateSensors(pt);

  stats_.duration.end = pt.time;
  ++stats_.point_count;
  last_ = PointRef{pt.coord, pt.time, m.cum_time, m.grd};
}

// Elevation noise filter, see
// https://www.gpsvisualizer.com/tutorials/elevation_gain.html
// Gain/loss and gradient only move when the change since the last reference
// point exceeds the threshold; smaller changes inherit the reference's
// gradient.
void TrackStatsAggregator::updateElevation(TrackPoint &pt) {
  PointMetadata &m = pt.meta;

  if (!pt.coord.elv) {
    // no elevation: cannot be a reference, cannot move gain/loss
    if (last_ele_)
      m.grd = last_ele_->grd;
    return;
  }
  if (!last_ele_) {
    last_ele_ = PointRef{pt.coord, pt.time, m.cum_time, std::nullopt};
    return;
  }

  const double rise = *pt.coord.elv - *last_ele_->coord.elv;
  if (std::fabs(rise) <= P.elevation_threshold_m) {
    m.grd = last_ele_->grd;
    return;
  }

  if (rise > 0)
    stats_.elevation.gain += rise;
  else
    stats_.elevation.loss += -rise;

  const double dist = GeoUtils::spatial_distance_3d(last_ele_->coord, pt.coord);
  const double run_sq = dist * dist - rise * rise;
  if (run_sq > 0) {
    const double grd = 100.0 * rise / std::sqrt(run_sq);
    if (std::isfinite(grd)) {
      m.grd = grd;
      raiseMax(stats_.gradient.max, grd);
      lowerMin(stats_.gradient.min, grd);
    }
  }
  // purely vertical step: gradient stays undefined for this reference

  last_ele_ = PointRef{pt.coord, pt.time, m.cum_time, m.grd};
}

void TrackStatsAggregator::accumulateSensors(const TrackPoint &pt) {
  if (pt.hr) {
    stats_.hr.total += *pt.hr;
    ++stats_.hr.count;
  }
  if (pt.cad) {
    stats_.cad.total += *pt.cad;
    ++stats_.cad.count;
  }
  if (pt.atemp) {
    stats_.atemp.total += *pt.atemp;
    ++stats_.atemp.count;
  }
}

const AggregateStats &TrackStatsAggregator::finalize() {
  if (stats_.finalized)
    return stats_;
  stats_.finalized = true;

  // zero points: nothing to divide, every average stays empty
  if (stats_.point_count == 0)
    return stats_;

  // Averages divide by the number of points in the whole document, not by
  // the number of samples carrying the value.  Rounded half up.
  const double n = static_cast<double>(stats_.point_count);
  for (SensorTotals *s : {&stats_.hr, &stats_.cad, &stats_.atemp}) {
    if (s->count > 0)
      s->avg = std::floor(s->total / n + 0.5);
  }
  return stats_;
}
