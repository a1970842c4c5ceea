#pragma once

#include "fhirgate/path/path_expression.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fhirgate::path {

// A node selected by navigation together with its concrete path relative to the
// navigation root ("name[1].family").
struct SelectedNode {
  const nlohmann::json* node{nullptr};  // NOLINT(readability-identifier-naming)
  std::string path;                      // NOLINT(readability-identifier-naming)
};

// select_nodes navigates from root following FHIR collection semantics: an array
// met at any step is flattened into its elements, [n] keeps one element, [*] keeps
// all, and a [x] segment matches every property named <name><UpperCaseSuffix>.
// Null values are treated as absent. Results are in document order, and an empty
// segment list selects root itself. Concrete paths are prefixed with base_path.
// The returned pointers borrow from root.
[[nodiscard]] std::vector<SelectedNode> select_nodes(const nlohmann::json& root,
                                                     const std::vector<PathSegment>& segments,
                                                     const std::string& base_path = "");

// is_empty_value: null, a blank or whitespace-only string, [] and {} are empty.
[[nodiscard]] bool is_empty_value(const nlohmann::json& value);

// values_equal compares a record value with a configured literal, type-aware:
// strings compare as strings, numbers numerically, booleans as booleans.
// Values of different kinds are never equal.
[[nodiscard]] bool values_equal(const nlohmann::json& value, const nlohmann::json& literal);

}  // namespace fhirgate::path
