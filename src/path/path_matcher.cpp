#include "fhirgate/path/path_matcher.h"

#include "fhirgate/path/path_normalizer.h"

#include <array>

namespace fhirgate::path {

namespace {

// Per.11: pass order fixed at compile time.
constexpr std::array<MatchType, 3> kPassOrder = {
    MatchType::kExact,
    MatchType::kWildcard,
    MatchType::kParent,
};

}  // namespace

std::string match_type_to_string(const MatchType type) {
  switch (type) {
    case MatchType::kExact:
      return "exact";
    case MatchType::kWildcard:
      return "wildcard";
    case MatchType::kParent:
      return "parent";
  }
  return "exact";
}

bool matches(const MatchType type, const std::string_view rule_path,
             const std::string_view target_path) {
  switch (type) {
    case MatchType::kExact:
      return is_exact_match(rule_path, target_path);
    case MatchType::kWildcard:
      return is_wildcard_match(rule_path, target_path);
    case MatchType::kParent:
      return is_parent_match(rule_path, target_path);
  }
  return false;
}

std::optional<PathMatch> match_best_path(const std::vector<std::string>& ordered_paths,
                                         const std::string_view target_path) {
  for (const MatchType pass : kPassOrder) {
    for (std::size_t i = 0; i < ordered_paths.size(); ++i) {
      if (matches(pass, ordered_paths[i], target_path)) {
        return PathMatch{i, pass};
      }
    }
  }
  return std::nullopt;
}

}  // namespace fhirgate::path
