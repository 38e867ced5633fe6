#include "core/GeoUtils.hpp"
#include "core/TrackStatsAggregator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace {

// Points along the equator, dt_ms apart, whose legs yield the given speeds.
Segment points_with_speeds(const std::vector<double> &kmh, int64_t dt_ms) {
  Segment pts;
  double lon = 0.0;
  int64_t t = 0;
  pts.push_back(make_point(0.0, lon, std::nullopt, t));
  for (double v : kmh) {
    const double metres = v * dt_ms / 3600.0;
    lon += metres / metres_per_degree();
    t += dt_ms;
    pts.push_back(make_point(0.0, lon, std::nullopt, t));
  }
  return pts;
}

} // namespace

TEST(TrackStatsAggregator, ThreePointScenarioWithLongGap) {
  Segment seg = {make_point(0, 0, 100.0, 0), make_point(0, 0.001, 103.0, 10000),
                 make_point(0, 0.002, 90.0, 26000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();

  EXPECT_EQ(s.point_count, 3u);
  EXPECT_EQ(s.duration.total, 26000);
  EXPECT_EQ(s.duration.moving, 10000);
  EXPECT_EQ(s.duration.start, std::optional<int64_t>(0));
  EXPECT_EQ(s.duration.end, std::optional<int64_t>(26000));

  const double d01 = GeoUtils::spatial_distance_3d(seg[0].coord, seg[1].coord);
  const double d12 = GeoUtils::spatial_distance_3d(seg[1].coord, seg[2].coord);
  EXPECT_NEAR(s.length, d01 + d12, 1e-9);

  // velocity only from the first leg
  const double v01 = 3600.0 * d01 / 10000.0;
  ASSERT_TRUE(s.velocity.max.has_value());
  ASSERT_TRUE(s.velocity.min.has_value());
  EXPECT_NEAR(*s.velocity.max, v01, 1e-9);
  EXPECT_NEAR(*s.velocity.min, v01, 1e-9);
  EXPECT_NEAR(seg[1].meta.velocity, v01, 1e-9);
  EXPECT_DOUBLE_EQ(seg[2].meta.velocity, 0.0);

  // 100 -> 103 is noise, 100 -> 90 is admitted
  EXPECT_DOUBLE_EQ(s.elevation.gain, 0.0);
  EXPECT_DOUBLE_EQ(s.elevation.loss, 10.0);
  EXPECT_EQ(s.elevation.range.max, std::optional<double>(103.0));
  EXPECT_EQ(s.elevation.range.min, std::optional<double>(90.0));
  EXPECT_FALSE(seg[0].meta.grd.has_value());
  EXPECT_FALSE(seg[1].meta.grd.has_value());
  ASSERT_TRUE(seg[2].meta.grd.has_value());
  const double planar02 = GeoUtils::surface_distance(seg[0].coord, seg[2].coord);
  EXPECT_NEAR(*seg[2].meta.grd, -1000.0 / planar02, 1e-6);
  EXPECT_EQ(s.gradient.max, seg[2].meta.grd);
  EXPECT_EQ(s.gradient.min, seg[2].meta.grd);

  // cumulative values are stamped before the point's own leg
  EXPECT_DOUBLE_EQ(seg[0].meta.cum_dist, 0.0);
  EXPECT_DOUBLE_EQ(seg[1].meta.cum_dist, 0.0);
  EXPECT_NEAR(seg[2].meta.cum_dist, d01, 1e-9);
  EXPECT_EQ(seg[0].meta.cum_time, 0);
  EXPECT_EQ(seg[1].meta.cum_time, 10000);
  EXPECT_EQ(seg[2].meta.cum_time, 26000);
}

TEST(TrackStatsAggregator, PureVerticalStepLeavesGradientUndefined) {
  Segment seg = {make_point(45, 6, 100.0, 0), make_point(45, 6, 105.0, 600000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();

  EXPECT_NEAR(s.length, 5.0, 1e-9);
  EXPECT_DOUBLE_EQ(s.elevation.gain, 5.0);
  EXPECT_DOUBLE_EQ(s.elevation.loss, 0.0);
  EXPECT_FALSE(seg[1].meta.grd.has_value());
  EXPECT_TRUE(s.gradient.empty());
  // ten minutes is far beyond the moving threshold
  EXPECT_EQ(s.duration.total, 600000);
  EXPECT_EQ(s.duration.moving, 0);
  EXPECT_TRUE(s.velocity.empty());
}

TEST(TrackStatsAggregator, ZeroVelocityNeverLowersMinimum) {
  Segment seg = points_with_speeds({0, 5, 3, 0, 8}, 1000);
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();

  ASSERT_TRUE(s.velocity.min.has_value());
  ASSERT_TRUE(s.velocity.max.has_value());
  EXPECT_NEAR(*s.velocity.min, 3.0, 1e-6);
  EXPECT_NEAR(*s.velocity.max, 8.0, 1e-6);
  EXPECT_DOUBLE_EQ(seg[1].meta.velocity, 0.0);
  EXPECT_NEAR(seg[2].meta.velocity, 5.0, 1e-6);
}

TEST(TrackStatsAggregator, AllStoppedKeepsMinimumUnset) {
  Segment seg = points_with_speeds({0, 0}, 1000);
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_EQ(s.velocity.max, std::optional<double>(0.0));
  EXPECT_FALSE(s.velocity.min.has_value());
  EXPECT_EQ(s.duration.moving, 2000);
}

TEST(TrackStatsAggregator, SubThresholdChangeCopiesReferenceGradient) {
  Segment seg = {make_point(0, 0, 100.0, 0), make_point(0, 0.001, 110.0, 5000),
                 make_point(0, 0.002, 112.0, 10000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();

  ASSERT_TRUE(seg[1].meta.grd.has_value());
  EXPECT_NEAR(*seg[1].meta.grd, 100.0 * 10.0 / (0.001 * metres_per_degree()),
              1e-6);
  EXPECT_EQ(seg[2].meta.grd, seg[1].meta.grd);
  EXPECT_DOUBLE_EQ(s.elevation.gain, 10.0);
  EXPECT_DOUBLE_EQ(s.elevation.loss, 0.0);
  EXPECT_EQ(s.gradient.max, seg[1].meta.grd);
  EXPECT_EQ(s.gradient.min, seg[1].meta.grd);
  // but the noisy point still widens the elevation range
  EXPECT_EQ(s.elevation.range.max, std::optional<double>(112.0));
}

TEST(TrackStatsAggregator, ReferenceDoesNotAdvanceOnNoise) {
  // 100 -> 103 -> 106: each step is noise but the drift from the reference
  // (100) eventually exceeds the threshold
  Segment seg = {make_point(0, 0, 100.0, 0), make_point(0, 0.001, 103.0, 1000),
                 make_point(0, 0.002, 106.0, 2000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_DOUBLE_EQ(s.elevation.gain, 6.0);
  ASSERT_TRUE(seg[2].meta.grd.has_value());
  EXPECT_GT(*seg[2].meta.grd, 0.0);
}

TEST(TrackStatsAggregator, GainMinusLossMatchesFilteredEndpoints) {
  const std::vector<double> eles = {200, 210, 209, 230, 224, 180, 183, 150};
  Segment seg;
  for (size_t i = 0; i < eles.size(); ++i)
    seg.push_back(make_point(0, 0.001 * i, eles[i], 1000 * i));
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();

  EXPECT_GE(s.elevation.gain, 0.0);
  EXPECT_GE(s.elevation.loss, 0.0);
  // references: 200, 210, 230, 224, 180, 150
  EXPECT_DOUBLE_EQ(s.elevation.gain, 30.0);
  EXPECT_DOUBLE_EQ(s.elevation.loss, 80.0);
  EXPECT_NEAR(s.elevation.gain - s.elevation.loss, 150.0 - 200.0, 1e-9);
}

TEST(TrackStatsAggregator, SegmentsAreConcatenated) {
  Segment first = {make_point(0, 0, 50.0, 0), make_point(0, 0.001, 50.0, 4000)};
  Segment second = {make_point(0, 0.002, 50.0, 9000),
                    make_point(0, 0.003, 50.0, 12000)};
  TrackStatsAggregator agg;
  agg.addSegment(first);
  agg.addSegment(second);
  const AggregateStats &s = agg.finalize();

  // the 5 s gap across the boundary counts like any other
  EXPECT_EQ(s.duration.total, 12000);
  EXPECT_EQ(s.duration.moving, 12000);
  EXPECT_NEAR(s.length, 3 * 0.001 * metres_per_degree(), 1e-6);
  EXPECT_EQ(second[0].meta.cum_time, 9000);
  EXPECT_NEAR(second[0].meta.cum_dist, 0.001 * metres_per_degree(), 1e-6);
  EXPECT_GT(second[0].meta.velocity, 0.0);
  EXPECT_EQ(s.duration.start, std::optional<int64_t>(0));
  EXPECT_EQ(s.duration.end, std::optional<int64_t>(12000));
}

TEST(TrackStatsAggregator, RunningDistanceMatchesPairwiseSum) {
  Segment seg;
  const double lats[] = {47.0, 47.0003, 47.0011, 47.0011, 47.0019, 47.0030};
  const double lons[] = {8.0, 8.0004, 8.0004, 8.0012, 8.0013, 8.0025};
  const double eles[] = {400, 402, 399, 405, 420, 418};
  const int64_t times[] = {0, 3000, 7000, 30000, 33000, 36000};
  for (int i = 0; i < 6; ++i)
    seg.push_back(make_point(lats[i], lons[i], eles[i], times[i]));

  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();

  double sum = 0.0;
  for (size_t i = 1; i < seg.size(); ++i) {
    EXPECT_GE(seg[i].meta.cum_dist, seg[i - 1].meta.cum_dist);
    EXPECT_NEAR(seg[i].meta.cum_dist, sum, 1e-9);
    sum += GeoUtils::spatial_distance_3d(seg[i - 1].coord, seg[i].coord);
  }
  EXPECT_NEAR(s.length, sum, 1e-9);
  EXPECT_LE(s.duration.moving, s.duration.total);
  EXPECT_EQ(s.duration.total, 36000);
  EXPECT_EQ(s.duration.moving, 36000 - 23000);
}

TEST(TrackStatsAggregator, MovingEqualsTotalWhenAllGapsShort) {
  Segment seg = points_with_speeds({10, 12, 9}, 5000);
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  EXPECT_EQ(agg.stats().duration.moving, agg.stats().duration.total);
}

TEST(TrackStatsAggregator, GapExactlyAtIntervalIsNotMoving) {
  Segment seg = points_with_speeds({10}, 15000);
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  EXPECT_EQ(agg.stats().duration.total, 15000);
  EXPECT_EQ(agg.stats().duration.moving, 0);
}

TEST(TrackStatsAggregator, CustomParams) {
  StatsParams p;
  p.max_point_interval_ms = 60000;
  p.elevation_threshold_m = 1.0;
  Segment seg = {make_point(0, 0, 100.0, 0), make_point(0, 0.001, 102.0, 30000)};
  TrackStatsAggregator agg(p);
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_EQ(s.duration.moving, 30000);
  EXPECT_DOUBLE_EQ(s.elevation.gain, 2.0);
}

TEST(TrackStatsAggregator, DuplicateTimestampHasNoVelocity) {
  Segment seg = {make_point(0, 0, std::nullopt, 1000),
                 make_point(0, 0.001, std::nullopt, 1000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_DOUBLE_EQ(seg[1].meta.velocity, 0.0);
  EXPECT_TRUE(s.velocity.empty());
  EXPECT_GT(s.length, 0.0);
}

TEST(TrackStatsAggregator, MissingElevationIsTolerated) {
  Segment seg = {make_point(0, 0, std::nullopt, 0),
                 make_point(0, 0.001, std::nullopt, 1000)};
  TrackStatsAggregator agg;
  EXPECT_NO_THROW(agg.addSegment(seg));
  const AggregateStats &s = agg.finalize();
  EXPECT_TRUE(s.elevation.range.empty());
  EXPECT_DOUBLE_EQ(s.elevation.gain, 0.0);
  EXPECT_NEAR(s.length, 0.001 * metres_per_degree(), 1e-6);
  EXPECT_FALSE(seg[1].meta.grd.has_value());
}

TEST(TrackStatsAggregator, PointWithoutElevationSkipsNoiseFilter) {
  Segment seg = {make_point(0, 0, 100.0, 0), make_point(0, 0.001, 120.0, 1000),
                 make_point(0, 0.002, std::nullopt, 2000),
                 make_point(0, 0.003, 140.0, 3000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_EQ(seg[2].meta.grd, seg[1].meta.grd);
  EXPECT_DOUBLE_EQ(s.elevation.gain, 40.0);
  EXPECT_EQ(s.elevation.range.min, std::optional<double>(100.0));
  EXPECT_EQ(s.elevation.range.max, std::optional<double>(140.0));
}

TEST(TrackStatsAggregator, SentinelTimeDistortsTotalOnly) {
  TrackPoint a = make_point(0, 0, std::nullopt, 1680293955000LL);
  TrackPoint b = make_point(0, 0.001, std::nullopt, kEpochSentinelMs);
  b.has_time = false;
  Segment seg = {a, b};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_EQ(s.duration.total, 1680293955000LL);
  EXPECT_EQ(s.duration.moving, 0);
  EXPECT_EQ(s.duration.end, std::optional<int64_t>(kEpochSentinelMs));
}

TEST(TrackStatsAggregator, SensorAveragesUseTotalPointCount) {
  Segment seg = {make_point(0, 0, 1.0, 0), make_point(0, 0.0001, 1.0, 1000),
                 make_point(0, 0.0002, 1.0, 2000),
                 make_point(0, 0.0003, 1.0, 3000)};
  seg[0].hr = 100;
  seg[1].hr = 120;
  for (auto &p : seg)
    p.atemp = 20.75;
  seg[3].atemp = 20.25; // 82.5 / 4 = 20.625

  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_EQ(s.hr.avg, std::optional<double>(55.0)); // 220 / 4
  EXPECT_EQ(s.hr.count, 2u);
  EXPECT_EQ(s.atemp.avg, std::optional<double>(21.0));
  EXPECT_FALSE(s.cad.avg.has_value());
}

TEST(TrackStatsAggregator, EmptyInputFinalizesCleanly) {
  Segment seg;
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  const AggregateStats &s = agg.finalize();
  EXPECT_TRUE(agg.empty());
  EXPECT_TRUE(s.finalized);
  EXPECT_DOUBLE_EQ(s.length, 0.0);
  EXPECT_TRUE(s.elevation.range.empty());
  EXPECT_TRUE(s.velocity.empty());
  EXPECT_TRUE(s.gradient.empty());
  EXPECT_FALSE(s.duration.start.has_value());
  EXPECT_FALSE(s.duration.end.has_value());
  EXPECT_FALSE(s.hr.avg.has_value());
  EXPECT_FALSE(s.cad.avg.has_value());
  EXPECT_FALSE(s.atemp.avg.has_value());
}

TEST(TrackStatsAggregator, FinalizeIsIdempotentAndSeals) {
  Segment seg = {make_point(0, 0, 1.0, 0)};
  seg[0].hr = 90;
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  agg.finalize();
  const AggregateStats &again = agg.finalize();
  EXPECT_EQ(again.hr.avg, std::optional<double>(90.0));

  TrackPoint late = make_point(0, 0.001, 1.0, 1000);
  EXPECT_THROW(agg.addPoint(late), std::logic_error);
}

TEST(TrackStatsAggregator, ResetStartsANewDocument) {
  Segment seg = {make_point(0, 0, 10.0, 0), make_point(0, 0.001, 30.0, 1000)};
  TrackStatsAggregator agg;
  agg.addSegment(seg);
  agg.addWaypoint();
  agg.finalize();
  agg.reset();

  EXPECT_TRUE(agg.empty());
  EXPECT_EQ(agg.stats().waypoint_count, 0u);
  Segment next = {make_point(10, 10, 5.0, 50000)};
  agg.addSegment(next);
  EXPECT_EQ(agg.stats().duration.start, std::optional<int64_t>(50000));
  EXPECT_DOUBLE_EQ(agg.stats().length, 0.0);
  EXPECT_EQ(next[0].meta.cum_time, 0);
}

TEST(TrackStatsAggregator, RejectsTimesOutsideEpochRange) {
  TrackStatsAggregator agg;
  TrackPoint first = make_point(0, 0, 10.0, INT64_MIN + 1);
  EXPECT_THROW(agg.addPoint(first), std::out_of_range);
  EXPECT_TRUE(agg.empty());

  TrackPoint a = make_point(0, 0, 10.0, -8640000000000000LL);
  TrackPoint b = make_point(0, 0.001, 10.0, 8640000000000000LL);
  agg.addPoint(a);
  agg.addPoint(b);
  EXPECT_EQ(agg.stats().duration.total, 17280000000000000LL);

  TrackPoint c = make_point(0, 0.002, 10.0, INT64_MAX);
  EXPECT_THROW(agg.addPoint(c), std::out_of_range);
  EXPECT_EQ(agg.stats().point_count, 2u);
}
