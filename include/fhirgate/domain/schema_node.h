#pragma once

#include "fhirgate/core/result.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fhirgate::domain {

// SchemaNode is one element of a resource type's schema tree.
// The root node's name is the resource type.
struct SchemaNode {
  std::string path;                  // NOLINT(readability-identifier-naming)
  std::string name;                  // NOLINT(readability-identifier-naming)
  std::string type;                  // NOLINT(readability-identifier-naming)
  std::string cardinality;           // NOLINT(readability-identifier-naming)
  std::vector<SchemaNode> children;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] core::Result<SchemaNode, core::ConfigError> schema_from_json(const nlohmann::json& j);

// flatten_schema_paths lists every descendant of root as a schema-relative,
// normalized path, depth-first pre-order. The root itself is not listed.
// A node without an explicit path is addressed by its ancestors' names.
[[nodiscard]] std::vector<std::string> flatten_schema_paths(const SchemaNode& root);

}  // namespace fhirgate::domain
