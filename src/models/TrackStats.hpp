#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

// Running max/min pair; both stay empty until the first admitted sample.
struct Extremum {
  std::optional<double> max;
  std::optional<double> min;

  bool empty() const noexcept { return !max && !min; }
};

struct ElevationStats {
  double gain = 0.0; // metres, >= 0
  double loss = 0.0; // metres, >= 0
  Extremum range;
};

struct DurationStats {
  std::optional<int64_t> start; // ms since epoch, first point of the document
  std::optional<int64_t> end;   // ms since epoch, latest point processed
  int64_t moving = 0;           // ms, gaps below max_point_interval only
  int64_t total = 0;            // ms, every gap
};

// Running sum for an optional per-point sensor value.
struct SensorTotals {
  double total = 0.0;
  std::size_t count = 0;       // points that carried the value
  std::optional<double> avg;   // set on finalize
};

// All accumulated attributes for one parsed document
struct AggregateStats {
  // ================== Distance / shape ==================
  double length = 0.0; // 3D metres
  std::size_t point_count = 0;
  std::size_t waypoint_count = 0;

  ElevationStats elevation;
  Extremum velocity; // km/h
  Extremum gradient; // percent
  DurationStats duration;

  // ================== Sensors ==================
  SensorTotals hr;
  SensorTotals cad;
  SensorTotals atemp;

  bool finalized = false;
};

// ---------- JSON output ----------
// Unset optionals serialize as null rather than +/-inf.

template <typename T>
inline nlohmann::json optional_to_json(const std::optional<T> &v) {
  return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

inline void to_json(nlohmann::json &j, const Extremum &e) {
  j = {{"max", optional_to_json(e.max)}, {"min", optional_to_json(e.min)}};
}

inline void to_json(nlohmann::json &j, const ElevationStats &e) {
  j = {{"gain", e.gain},
       {"loss", e.loss},
       {"max", optional_to_json(e.range.max)},
       {"min", optional_to_json(e.range.min)}};
}

inline void to_json(nlohmann::json &j, const DurationStats &d) {
  j = {{"start", optional_to_json(d.start)},
       {"end", optional_to_json(d.end)},
       {"moving", d.moving},
       {"total", d.total}};
}

inline void to_json(nlohmann::json &j, const SensorTotals &s) {
  j = {{"avg", optional_to_json(s.avg)}, {"samples", s.count}};
}

inline void to_json(nlohmann::json &j, const AggregateStats &s) {
  j = {{"length", s.length},
       {"points", s.point_count},
       {"waypoints", s.waypoint_count},
       {"elevation", s.elevation},
       {"velocity", s.velocity},
       {"gradient", s.gradient},
       {"duration", s.duration},
       {"hr", s.hr},
       {"cad", s.cad},
       {"atemp", s.atemp}};
}
