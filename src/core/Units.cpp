#include "Units.hpp"
#include <cstdarg>
#include <cstdio>
#include <vector>

namespace {
constexpr int64_t kSecondMs = 1000;
constexpr int64_t kMinuteMs = 60 * kSecondMs;
constexpr int64_t kHourMs = 60 * kMinuteMs;
constexpr int64_t kDayMs = 24 * kHourMs;
} // namespace

std::string Units::fstring(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args2;
  va_copy(args2, args);
  const int n = vsnprintf(nullptr, 0, fmt, args);
  va_end(args);
  if (n < 0) {
    va_end(args2);
    return std::string();
  }
  std::vector<char> buf(static_cast<size_t>(n) + 1);
  vsnprintf(buf.data(), buf.size(), fmt, args2);
  va_end(args2);
  return std::string(buf.data(), static_cast<size_t>(n));
}

std::string Units::duration_string(int64_t ms, bool hide_ms) {
  std::string s;
  if (ms < 0)
    ms = 0;

  if (ms >= kDayMs) {
    s += std::to_string(ms / kDayMs) + "d ";
    ms %= kDayMs;
  }
  if (ms >= kHourMs) {
    s += std::to_string(ms / kHourMs) + ":";
    ms %= kHourMs;
  }

  const int64_t mins = ms / kMinuteMs;
  ms %= kMinuteMs;
  s += fstring("%02lld'", static_cast<long long>(mins));

  const int64_t secs = ms / kSecondMs;
  ms %= kSecondMs;
  s += fstring("%02lld", static_cast<long long>(secs));

  if (!hide_ms && ms > 0)
    s += fstring(".%03lld", static_cast<long long>(ms));
  else
    s += '"';
  return s;
}

std::string Units::duration_string_iso(int64_t ms, bool hide_ms) {
  std::string s = duration_string(ms, hide_ms);
  if (auto pos = s.find('\''); pos != std::string::npos)
    s[pos] = ':';
  if (auto pos = s.find('"'); pos != std::string::npos)
    s.erase(pos, 1);
  return s;
}

std::string Units::distance_string(double m, UnitSystem u) {
  if (u == UnitSystem::Imperial)
    return fstring("%.2f mi", m_to_mi(m));
  return fstring("%.2f km", m_to_km(m));
}

std::string Units::elevation_string(double m, UnitSystem u) {
  if (u == UnitSystem::Imperial)
    return fstring("%.0f ft", to_ft(m));
  return fstring("%.0f m", m);
}

std::string Units::speed_string(double kmh, UnitSystem u) {
  if (u == UnitSystem::Imperial)
    return fstring("%.1f mph", to_miles(kmh));
  return fstring("%.1f km/h", kmh);
}

std::optional<UnitSystem> Units::parse_unit_system(const std::string &s) {
  if (s.empty() || s == "metric")
    return UnitSystem::Metric;
  if (s == "imperial")
    return UnitSystem::Imperial;
  return std::nullopt;
}

const char *Units::unit_system_name(UnitSystem u) {
  return u == UnitSystem::Imperial ? "imperial" : "metric";
}
