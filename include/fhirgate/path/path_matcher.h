#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::path {

// Match strength, strongest first. Enumerator order is the priority order.
enum class MatchType {
  kExact,
  kWildcard,
  kParent,
};

[[nodiscard]] std::string match_type_to_string(MatchType type);

[[nodiscard]] bool matches(MatchType type, std::string_view rule_path,
                           std::string_view target_path);

struct PathMatch {
  std::size_t index{0};                // NOLINT(readability-identifier-naming)
  MatchType type{MatchType::kExact};   // NOLINT(readability-identifier-naming)
};

// match_best_path selects the candidate that covers target.
//
// Precondition: ordered_paths is in authoring order; the order is significant.
// Three passes run over the whole list, exact then wildcard then parent. Within a
// pass the first candidate that matches wins, and a later pass is only tried when
// no candidate matched in an earlier one.
[[nodiscard]] std::optional<PathMatch> match_best_path(
    const std::vector<std::string>& ordered_paths, std::string_view target_path);

}  // namespace fhirgate::path
