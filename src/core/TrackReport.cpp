#include "TrackReport.hpp"
#include "core/TimeUtils.hpp"
#include "models/TrackStats.hpp"

using json = nlohmann::json;

json TrackReport::point(const TrackPoint &p) {
  json j = {{"lat", p.coord.lat},
            {"lon", p.coord.lon},
            {"ele", optional_to_json(p.coord.elv)},
            {"time", p.has_time ? json(p.time) : json(nullptr)},
            {"hr", optional_to_json(p.hr)},
            {"cad", optional_to_json(p.cad)},
            {"atemp", optional_to_json(p.atemp)},
            {"cumdist", p.meta.cum_dist},
            {"cumtime", p.meta.cum_time},
            {"vel", p.meta.velocity},
            {"grd", optional_to_json(p.meta.grd)}};
  if (!p.name.empty())
    j["name"] = p.name;
  return j;
}

json TrackReport::formatted(const TrackAnalysis &a, UnitSystem units) {
  const AggregateStats &s = a.stats;
  json f = {
      {"distance", Units::distance_string(s.length, units)},
      {"moving_time", Units::duration_string(s.duration.moving, true)},
      {"total_time", Units::duration_string(s.duration.total, true)},
      {"elevation_gain", Units::elevation_string(s.elevation.gain, units)},
      {"elevation_loss", Units::elevation_string(s.elevation.loss, units)}};

  if (auto v = a.movingSpeed())
    f["moving_speed"] = Units::speed_string(*v, units);
  if (auto v = a.totalSpeed())
    f["total_speed"] = Units::speed_string(*v, units);
  if (auto pace = a.movingPace()) {
    // pace is per km; per mile is 1.60934 times longer
    const double per_unit =
        units == UnitSystem::Imperial ? *pace * 1.60934 : *pace;
    f["moving_pace"] =
        Units::duration_string(static_cast<int64_t>(per_unit), true) +
        (units == UnitSystem::Imperial ? " /mi" : " /km");
  }
  if (s.elevation.range.max)
    f["elevation_max"] = Units::elevation_string(*s.elevation.range.max, units);
  if (s.elevation.range.min)
    f["elevation_min"] = Units::elevation_string(*s.elevation.range.min, units);
  if (s.duration.start)
    f["start_time"] = TimeUtils::format_iso8601_ms(*s.duration.start);
  if (s.duration.end)
    f["end_time"] = TimeUtils::format_iso8601_ms(*s.duration.end);
  return f;
}

json TrackReport::build(const TrackAnalysis &a, UnitSystem units,
                        bool include_points) {
  json out;
  out["info"] = {{"name", a.info.name},
                 {"desc", a.info.desc},
                 {"author", a.info.author},
                 {"copyright", a.info.copyright}};
  out["empty"] = a.stats.point_count == 0;
  out["stats"] = a.stats;
  out["derived"] = {{"moving_pace_ms_per_km", optional_to_json(a.movingPace())},
                    {"moving_speed_kmh", optional_to_json(a.movingSpeed())},
                    {"total_speed_kmh", optional_to_json(a.totalSpeed())}};
  out["units"] = Units::unit_system_name(units);
  out["formatted"] = formatted(a, units);

  if (include_points) {
    json pts = json::array();
    for (const auto &p : a.points)
      pts.push_back(point(p));
    out["points"] = std::move(pts);
  }
  return out;
}

json TrackReport::series(const TrackAnalysis &a, SeriesMetric metric,
                         SeriesAxis axis, UnitSystem units) {
  DataSeries ds(a.points, metric, axis, units);
  json data = json::array();
  for (const SeriesSample &s : ds)
    data.push_back(json::array({s.x, optional_to_json(s.y), s.label}));
  return {{"metric", DataSeries::metric_name(metric)},
          {"axis", DataSeries::axis_name(axis)},
          {"units", Units::unit_system_name(units)},
          {"data", std::move(data)}};
}
