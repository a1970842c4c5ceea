#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::core {

// Deterministic ASCII-only string helpers.
// Locale-independent and byte-stable across platforms and compilers.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    // ES.46: Avoid lossy conversions - explicit range check
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

inline bool is_ascii_upper(const char ch) {
  return ch >= 'A' && ch <= 'Z';
}

inline bool is_ascii_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// split_ascii splits on a single delimiter, keeping empty pieces.
// "a..b" with '.' yields {"a", "", "b"}.
inline std::vector<std::string> split_ascii(const std::string_view input, const char delimiter) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= input.size(); ++i) {
    if (i == input.size() || input[i] == delimiter) {
      parts.emplace_back(input.substr(start, i - start));
      start = i + 1;
    }
  }
  return parts;
}

}  // namespace fhirgate::core
