#pragma once
#include <cstdint>
#include <optional>
#include <string>

enum class UnitSystem : uint8_t { Metric, Imperial };

// Thin presentation layer over the aggregate numbers.  Distances come in
// metres, durations in milliseconds.
class Units {
public:
  static double to_miles(double km) { return km / 1.60934; }
  static double to_ft(double m) { return m * 3.28084; }
  static double m_to_km(double m) { return m / 1000.0; }
  static double m_to_mi(double m) { return m / 1609.34; }
  static double ms_to_h(double ms) { return ms / 3600000.0; }

  // [Nd ][H:]MM'SS"  or  [Nd ][H:]MM'SS.mmm when a millisecond remainder is
  // shown
  static std::string duration_string(int64_t ms, bool hide_ms = false);
  // same with ':' in place of ' and no trailing "
  static std::string duration_string_iso(int64_t ms, bool hide_ms = false);

  // "12.35 km" / "7.67 mi"
  static std::string distance_string(double m, UnitSystem u);
  // "123 m" / "404 ft"
  static std::string elevation_string(double m, UnitSystem u);
  // "18.2 km/h" / "11.3 mph"
  static std::string speed_string(double kmh, UnitSystem u);

  static std::optional<UnitSystem> parse_unit_system(const std::string &s);
  static const char *unit_system_name(UnitSystem u);

  // printf-style formatting into a std::string
  static std::string fstring(const char *fmt, ...)
      __attribute__((format(printf, 1, 2)));
};
