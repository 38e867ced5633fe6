#pragma once
#include <cstdint>
#include <optional>
#include <string>

// ISO-8601 timestamps as carried by <time> elements.
class TimeUtils {
public:
  // Times outside +/-8.64e15 ms (the JavaScript Date range) are not accepted
  // anywhere, so differences between two of them always fit in int64.
  static constexpr int64_t kMaxAbsEpochMs = 8640000000000000LL;

  static bool in_epoch_range(int64_t ms) noexcept {
    return ms >= -kMaxAbsEpochMs && ms <= kMaxAbsEpochMs;
  }

  // "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]" -> ms since Unix epoch.
  // A timestamp without a zone designator is read as UTC.  Returns empty on
  // anything it cannot read.
  static std::optional<int64_t> parse_iso8601_ms(const std::string &s);

  // ms since epoch -> "YYYY-MM-DDTHH:MM:SS.fffZ"
  static std::string format_iso8601_ms(int64_t ms);
};
