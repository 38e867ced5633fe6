// DataSeries maps enriched track points to (x, y, label) chart samples.

#include "DataSeries.hpp"

double DataSeries::raw_x(const TrackPoint &p) const {
  return axis_ == SeriesAxis::Distance ? p.meta.cum_dist
                                       : static_cast<double>(p.meta.cum_time);
}

std::optional<double> DataSeries::raw_y(const TrackPoint &p) const {
  switch (metric_) {
  case SeriesMetric::Elevation:
    return p.coord.elv;
  case SeriesMetric::HeartRate:
    return p.hr ? std::optional<double>(*p.hr) : std::nullopt;
  case SeriesMetric::Cadence:
    return p.cad ? std::optional<double>(*p.cad) : std::nullopt;
  case SeriesMetric::Temperature:
    return p.atemp;
  }
  return std::nullopt;
}

double DataSeries::convert_x(double raw) const {
  if (axis_ == SeriesAxis::Time)
    return Units::ms_to_h(raw);
  return units_ == UnitSystem::Imperial ? Units::m_to_mi(raw)
                                        : Units::m_to_km(raw);
}

double DataSeries::convert_y(double raw) const {
  // only elevation has an imperial unit
  if (metric_ == SeriesMetric::Elevation && units_ == UnitSystem::Imperial)
    return Units::to_ft(raw);
  return raw;
}

const char *DataSeries::x_unit() const {
  if (axis_ == SeriesAxis::Time)
    return "h";
  return units_ == UnitSystem::Imperial ? "mi" : "km";
}

const char *DataSeries::y_unit() const {
  switch (metric_) {
  case SeriesMetric::Elevation:
    return units_ == UnitSystem::Imperial ? "ft" : "m";
  case SeriesMetric::HeartRate:
    return "bpm";
  case SeriesMetric::Cadence:
    return "rpm";
  case SeriesMetric::Temperature:
    return "degrees";
  }
  return "";
}

SeriesSample DataSeries::at(std::size_t i) const {
  const TrackPoint &p = pts_->at(i);
  SeriesSample out;
  out.x = convert_x(raw_x(p));
  if (auto y = raw_y(p))
    out.y = convert_y(*y);

  if (out.y)
    out.label = Units::fstring("%.2f %s, %.0f %s", out.x, x_unit(), *out.y,
                               y_unit());
  else
    out.label = Units::fstring("%.2f %s, -", out.x, x_unit());
  return out;
}

std::optional<SeriesMetric> DataSeries::parse_metric(const std::string &s) {
  if (s == "elevation" || s == "ele")
    return SeriesMetric::Elevation;
  if (s == "heartrate" || s == "hr")
    return SeriesMetric::HeartRate;
  if (s == "cadence" || s == "cad")
    return SeriesMetric::Cadence;
  if (s == "temperature" || s == "atemp")
    return SeriesMetric::Temperature;
  return std::nullopt;
}

std::optional<SeriesAxis> DataSeries::parse_axis(const std::string &s) {
  if (s.empty() || s == "distance" || s == "cumdist")
    return SeriesAxis::Distance;
  if (s == "time" || s == "cumtime")
    return SeriesAxis::Time;
  return std::nullopt;
}

const char *DataSeries::metric_name(SeriesMetric m) {
  switch (m) {
  case SeriesMetric::Elevation:
    return "elevation";
  case SeriesMetric::HeartRate:
    return "heartrate";
  case SeriesMetric::Cadence:
    return "cadence";
  case SeriesMetric::Temperature:
    return "temperature";
  }
  return "unknown";
}

const char *DataSeries::axis_name(SeriesAxis a) {
  return a == SeriesAxis::Time ? "time" : "distance";
}
