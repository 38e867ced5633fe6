// TimeUtils converts between GPX-style ISO-8601 strings and epoch millis.

#include "TimeUtils.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

// get_time stops quietly at end of input, so a truncated value such as
// "2023-03-31T20" would read as a full timestamp.  Check the fixed-width
// date/time part first.
static bool has_full_date_time(const std::string &s) {
  static const char kShape[] = "dddd-dd-ddTdd:dd:dd";
  const size_t n = sizeof(kShape) - 1;
  if (s.size() < n)
    return false;
  for (size_t i = 0; i < n; ++i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (kShape[i] == 'd' ? !std::isdigit(c) : c != kShape[i])
      return false;
  }
  return true;
}

std::optional<int64_t> TimeUtils::parse_iso8601_ms(const std::string &s) {
  if (!has_full_date_time(s))
    return std::nullopt;

  std::tm tmb{};
  std::istringstream in(s);
  in >> std::get_time(&tmb, "%Y-%m-%dT%H:%M:%S"); // 2023-03-31T20:19:15
  if (in.fail())
    return std::nullopt;

  // Fractional seconds: keep millisecond precision, ignore the rest
  int64_t millis = 0;
  if (in.peek() == '.') {
    in.get();
    int digits = 0;
    while (std::isdigit(in.peek())) {
      const int d = in.get() - '0';
      if (digits < 3)
        millis = millis * 10 + d;
      ++digits;
    }
    if (digits == 0)
      return std::nullopt;
    for (int i = digits; i < 3; ++i)
      millis *= 10;
  }

  // Zone designator
  int64_t offset_min = 0;
  const int c = in.peek();
  if (c == 'Z' || c == 'z') {
    in.get();
  } else if (c == '+' || c == '-') {
    const int sign = (in.get() == '-') ? -1 : 1;
    std::string hhmm;
    while (std::isdigit(in.peek()) || in.peek() == ':') {
      const char ch = static_cast<char>(in.get());
      if (ch != ':')
        hhmm.push_back(ch);
    }
    if (hhmm.size() != 2 && hhmm.size() != 4)
      return std::nullopt;
    const int hh = std::stoi(hhmm.substr(0, 2));
    const int mm = hhmm.size() == 4 ? std::stoi(hhmm.substr(2, 2)) : 0;
    if (hh > 23 || mm > 59)
      return std::nullopt;
    offset_min = sign * (hh * 60 + mm);
  }

  // Trailing garbage makes the whole value unreadable
  while (in.peek() != std::char_traits<char>::eof()) {
    if (!std::isspace(in.get()))
      return std::nullopt;
  }

  const time_t secs = timegm(&tmb);
  return static_cast<int64_t>(secs) * 1000 + millis - offset_min * 60000;
}

std::string TimeUtils::format_iso8601_ms(int64_t ms) {
  int64_t secs = ms / 1000;
  int64_t rem = ms % 1000;
  if (rem < 0) {
    rem += 1000;
    --secs;
  }
  const time_t t = static_cast<time_t>(secs);
  std::tm tmb{};
  gmtime_r(&t, &tmb);
  char timebuf[64];
  strftime(timebuf, sizeof(timebuf), "%FT%T", &tmb);
  std::ostringstream out;
  out << timebuf << '.' << std::setw(3) << std::setfill('0') << rem << 'Z';
  return out.str();
}
