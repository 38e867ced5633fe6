#include "core/GeoUtils.hpp"
#include "core/TrackAnalyzer.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace {

TrackDocument sample_document() {
  TrackDocument d;
  d.desc = "loop";

  TrackGroup rte;
  rte.kind = WayKind::Route;
  rte.name = "planned";
  rte.desc = "via the lake";
  rte.segments.push_back({make_point(0, 0, 100.0, 0),
                          make_point(0, 0.001, 110.0, 10000)});

  TrackGroup trk;
  trk.kind = WayKind::Track;
  trk.name = "recorded";
  trk.segments.push_back({make_point(0, 0.002, 111.0, 20000)});
  trk.segments.push_back({make_point(0, 0.003, 125.0, 30000),
                          make_point(0, 0.004, 125.0, 100000)});

  // track listed first: routes must still be aggregated before it
  d.groups.push_back(trk);
  d.groups.push_back(rte);

  Waypoint w;
  w.coord = {0.0, 0.001, std::nullopt};
  d.waypoints = {w, w};
  return d;
}

} // namespace

TEST(TrackAnalyzer, AggregatesRoutesThenTracks) {
  TrackDocument doc = sample_document();
  TrackAnalysis a = TrackAnalyzer().analyze(doc);

  ASSERT_EQ(a.points.size(), 5u);
  EXPECT_EQ(a.points[0].time, 0);
  EXPECT_EQ(a.points[2].time, 20000);
  EXPECT_EQ(a.stats.point_count, 5u);
  EXPECT_EQ(a.stats.waypoint_count, 2u);
  EXPECT_TRUE(a.stats.finalized);

  // 4 equal legs along the equator plus vertical components
  EXPECT_GT(a.stats.length, 4 * 0.001 * metres_per_degree());
  EXPECT_EQ(a.stats.duration.total, 100000);
  EXPECT_EQ(a.stats.duration.moving, 30000);
  EXPECT_DOUBLE_EQ(a.stats.elevation.gain, 25.0);
  EXPECT_EQ(a.points[4].meta.cum_time, 100000);

  // metadata also lands on the document's own points
  EXPECT_EQ(doc.groups[0].segments[1][1].meta.cum_time, 100000);
}

TEST(TrackAnalyzer, InfoFallsBackToFirstGroupName) {
  TrackDocument doc = sample_document();
  TrackAnalysis a = TrackAnalyzer().analyze(doc);
  EXPECT_EQ(a.info.name, "recorded");
  EXPECT_EQ(a.info.desc, "loop\nvia the lake\n");

  doc.name = "Sunday";
  EXPECT_EQ(TrackAnalyzer().analyze(doc).info.name, "Sunday");
}

TEST(TrackAnalyzer, ParseElementsFilter) {
  StatsParams p;
  p.parse_routes = false;
  p.parse_waypoints = false;
  TrackDocument doc = sample_document();
  TrackAnalysis a = TrackAnalyzer(p).analyze(doc);
  EXPECT_EQ(a.stats.point_count, 3u);
  EXPECT_EQ(a.stats.waypoint_count, 0u);
  EXPECT_EQ(a.stats.duration.start, std::optional<int64_t>(20000));
}

TEST(TrackAnalyzer, DerivedSpeeds) {
  TrackDocument doc;
  TrackGroup trk;
  // 1 km in 6 minutes, all moving
  Segment seg;
  const double step = 25.0 / metres_per_degree();
  for (int i = 0; i <= 40; ++i)
    seg.push_back(make_point(0, step * i, std::nullopt, 9000 * i));
  trk.segments.push_back(seg);
  doc.groups.push_back(trk);

  TrackAnalysis a = TrackAnalyzer().analyze(doc);
  ASSERT_TRUE(a.movingSpeed().has_value());
  EXPECT_NEAR(*a.movingSpeed(), 10.0, 1e-6);
  EXPECT_NEAR(*a.totalSpeed(), 10.0, 1e-6);
  EXPECT_NEAR(*a.movingPace(), 360000.0, 1e-3); // 6 min per km
}

TEST(TrackAnalyzer, EmptyDocument) {
  TrackDocument doc;
  TrackAnalysis a = TrackAnalyzer().analyze(doc);
  EXPECT_EQ(a.stats.point_count, 0u);
  EXPECT_TRUE(a.points.empty());
  EXPECT_FALSE(a.movingSpeed().has_value());
  EXPECT_FALSE(a.totalSpeed().has_value());
  EXPECT_FALSE(a.movingPace().has_value());
  EXPECT_FALSE(a.stats.hr.avg.has_value());
}

TEST(TrackAnalyzer, DocumentsDoNotShareState) {
  TrackDocument first = sample_document();
  TrackDocument second = sample_document();
  TrackAnalyzer analyzer;
  TrackAnalysis a = analyzer.analyze(first);
  TrackAnalysis b = analyzer.analyze(second);
  EXPECT_DOUBLE_EQ(a.stats.length, b.stats.length);
  EXPECT_EQ(b.points[0].meta.cum_time, 0);
}

TEST(TrackAnalyzer, PointByIndex) {
  TrackDocument doc = sample_document();
  TrackAnalysis a = TrackAnalyzer().analyze(doc);
  EXPECT_DOUBLE_EQ(a.point(2).coord.lon, 0.002);
  EXPECT_EQ(a.point(2).meta.cum_time, 20000);
  EXPECT_THROW(a.point(a.points.size()), std::out_of_range);
}

TEST(TrackAnalyzer, ClosestPoint) {
  TrackDocument doc = sample_document();
  TrackAnalysis a = TrackAnalyzer().analyze(doc);

  const Coordinate near_fourth{0.0001, 0.0029, std::nullopt};
  auto hit = a.closestPoint(near_fourth);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->first, 3u);
  EXPECT_DOUBLE_EQ(hit->second.coord.lon, 0.003);

  auto fast = a.closestPoint(near_fourth, true);
  ASSERT_TRUE(fast.has_value());
  EXPECT_EQ(fast->first, 3u);
}

TEST(TrackAnalyzer, ClosestPointEmptyAndSingle) {
  TrackAnalysis none;
  EXPECT_FALSE(none.closestPoint({0.0, 0.0, std::nullopt}).has_value());
  EXPECT_FALSE(none.closestPoint({0.0, 0.0, std::nullopt}, true).has_value());

  TrackAnalysis one;
  one.points.push_back(make_point(45.0, 7.0, 300.0, 0));
  auto hit = one.closestPoint({-45.0, -170.0, std::nullopt});
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->first, 0u);
  EXPECT_DOUBLE_EQ(hit->second.coord.lat, 45.0);
}

TEST(TrackAnalyzer, ClosestPointTieKeepsFirst) {
  TrackAnalysis a;
  a.points.push_back(make_point(0.0, -1.0));
  a.points.push_back(make_point(0.0, 1.0));
  a.points.push_back(make_point(5.0, 5.0));
  const Coordinate mid{0.0, 0.0, std::nullopt};
  EXPECT_EQ(a.closestPoint(mid)->first, 0u);
  EXPECT_EQ(a.closestPoint(mid, true)->first, 0u);
}
