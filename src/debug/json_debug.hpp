#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Returns (line, column) from a byte position in the raw text (1-based).
inline std::pair<size_t, size_t> calc_line_col(const std::string &s,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// Returns a small window of text around the byte position with a caret.
inline std::string context_snippet(const std::string &s, size_t byte_pos,
                                   size_t window = 60) {
  byte_pos = std::min(byte_pos, s.size());
  size_t start = (byte_pos > window ? byte_pos - window : 0);
  size_t end = std::min(s.size(), byte_pos + window);
  std::string snippet = s.substr(start, end - start);

  // keep the caret under the right column when the window spans lines
  const size_t rel = byte_pos - start;
  size_t line_start = rel == 0 ? std::string::npos : snippet.rfind('\n', rel - 1);
  line_start = (line_start == std::string::npos) ? 0 : line_start + 1;
  std::string caret_line(rel - line_start, ' ');
  caret_line.push_back('^');

  return snippet + "\n" + caret_line;
}

// Error body for a request whose JSON could not be parsed.  nlohmann reports
// the byte *after* the offending character, hence the -1.
inline nlohmann::json describe_parse_error(const std::string &body,
                                           const nlohmann::json::parse_error &e) {
  const size_t pos = e.byte > 0 ? e.byte - 1 : 0;
  const auto [line, col] = calc_line_col(body, pos);
  return {{"error", "invalid JSON"},
          {"detail", e.what()},
          {"line", line},
          {"column", col},
          {"context", context_snippet(body, pos)}};
}
