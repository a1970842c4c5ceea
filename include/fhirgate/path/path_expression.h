#pragma once

#include "fhirgate/core/result.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::path {

// Marker that may follow a segment identifier.
//   name      kNone
//   name[3]   kIndex     (concrete element)
//   name[*]   kWildcard  (every element)
//   value[x]  kChoice    (any property "value" + UpperCaseSuffix)
enum class SegmentMarker {
  kNone,
  kIndex,
  kWildcard,
  kChoice,
};

struct PathSegment {
  std::string name;                             // NOLINT(readability-identifier-naming)
  SegmentMarker marker{SegmentMarker::kNone};   // NOLINT(readability-identifier-naming)
  std::size_t index{0};                         // NOLINT(readability-identifier-naming)

  bool operator==(const PathSegment&) const = default;
};

// parse_path parses a plain relative path: dot-separated identifiers, each with an
// optional [n], [*] or [x] marker. Filters and function calls are not part of this
// grammar. Returns err(reason) for an empty or malformed path.
[[nodiscard]] core::Result<std::vector<PathSegment>, std::string> parse_path(
    std::string_view path);

// check_authoring_syntax accepts everything parse_path accepts plus the forms an
// author may still have typed: ".where(<balanced>)", ".exists()" and ".count()".
// Those forms are legal input but are flagged later by governance.
[[nodiscard]] core::Result<bool, std::string> check_authoring_syntax(std::string_view path);

// format_path renders segments back to text ("name[0].given").
[[nodiscard]] std::string format_path(const std::vector<PathSegment>& segments);

[[nodiscard]] bool is_identifier(std::string_view text);

}  // namespace fhirgate::path
