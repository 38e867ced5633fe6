#pragma once
#include "core/Units.hpp"
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

enum class SeriesMetric { Elevation, HeartRate, Cadence, Temperature };
enum class SeriesAxis { Distance, Time };

// One chart sample: converted x, converted y (empty when the point has no
// value for the metric) and a tooltip label.
struct SeriesSample {
  double x = 0.0;
  std::optional<double> y;
  std::string label;
};

// Lazy view over enriched points; each sample is built on dereference, so
// iterating twice is cheap and always yields the same sequence.  The points
// must outlive the series.
class DataSeries {
public:
  DataSeries(const std::vector<TrackPoint> &points, SeriesMetric metric,
             SeriesAxis axis, UnitSystem units = UnitSystem::Metric)
      : pts_(&points), metric_(metric), axis_(axis), units_(units) {}

  class const_iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = SeriesSample;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = SeriesSample;

    const_iterator() = default;
    const_iterator(const DataSeries *s, std::size_t i) : s_(s), i_(i) {}

    SeriesSample operator*() const { return s_->at(i_); }
    const_iterator &operator++() {
      ++i_;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++i_;
      return tmp;
    }
    bool operator==(const const_iterator &o) const {
      return s_ == o.s_ && i_ == o.i_;
    }
    bool operator!=(const const_iterator &o) const { return !(*this == o); }

  private:
    const DataSeries *s_ = nullptr;
    std::size_t i_ = 0;
  };

  const_iterator begin() const { return const_iterator(this, 0); }
  const_iterator end() const { return const_iterator(this, size()); }
  std::size_t size() const noexcept { return pts_->size(); }

  SeriesSample at(std::size_t i) const;

  // Raw (unconverted) values, metres / ms / native metric units
  double raw_x(const TrackPoint &p) const;
  std::optional<double> raw_y(const TrackPoint &p) const;

  SeriesMetric metric() const noexcept { return metric_; }
  SeriesAxis axis() const noexcept { return axis_; }
  UnitSystem units() const noexcept { return units_; }

  static std::optional<SeriesMetric> parse_metric(const std::string &s);
  static std::optional<SeriesAxis> parse_axis(const std::string &s);
  static const char *metric_name(SeriesMetric m);
  static const char *axis_name(SeriesAxis a);

private:
  const std::vector<TrackPoint> *pts_;
  SeriesMetric metric_;
  SeriesAxis axis_;
  UnitSystem units_;

  double convert_x(double raw) const;
  double convert_y(double raw) const;
  const char *x_unit() const;
  const char *y_unit() const;
};
