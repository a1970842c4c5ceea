#include "fhirgate/domain/schema_node.h"

#include "fhirgate/path/path_normalizer.h"

#include <utility>

namespace fhirgate::domain {

namespace {

// Missing and non-string members read as "".
std::string string_member(const nlohmann::json& j, const char* key) {
  const auto it = j.find(key);
  return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

using SchemaResult = core::Result<SchemaNode, core::ConfigError>;

SchemaResult parse_node(const nlohmann::json& j, const std::string& parent_path) {
  if (!j.is_object()) {
    return SchemaResult::err({core::ConfigErrorKind::kInvalidDocument, "",
                              "schema node under '" + parent_path + "' must be an object"});
  }

  SchemaNode node;
  node.name = string_member(j, "name");
  node.path = string_member(j, "path");
  node.type = string_member(j, "type");
  node.cardinality = string_member(j, "cardinality");
  if (node.name.empty() && node.path.empty()) {
    return SchemaResult::err({core::ConfigErrorKind::kInvalidDocument, "",
                              "schema node under '" + parent_path + "' has neither name nor path"});
  }

  if (j.contains("children")) {
    if (!j.at("children").is_array()) {
      return SchemaResult::err({core::ConfigErrorKind::kInvalidDocument, "",
                                "schema node '" + node.name + "': children must be an array"});
    }
    const std::string here = node.path.empty() ? node.name : node.path;
    for (const auto& child_json : j.at("children")) {
      auto child = parse_node(child_json, here);
      if (!child.has_value()) {
        return child;
      }
      node.children.push_back(child.take_value());
    }
  }
  return SchemaResult::ok(std::move(node));
}

void flatten_into(const SchemaNode& node, const std::string& root_type,
                  const std::string& relative_parent, std::vector<std::string>& out) {
  for (const auto& child : node.children) {
    std::string relative;
    if (!child.path.empty()) {
      relative = path::normalize_path(child.path, root_type);
    } else if (relative_parent.empty()) {
      relative = child.name;
    } else {
      relative = relative_parent + "." + child.name;
    }
    out.push_back(relative);
    flatten_into(child, root_type, relative, out);
  }
}

}  // namespace

core::Result<SchemaNode, core::ConfigError> schema_from_json(const nlohmann::json& j) {
  return parse_node(j, "<root>");
}

std::vector<std::string> flatten_schema_paths(const SchemaNode& root) {
  std::vector<std::string> paths;
  const std::string root_type = root.name.empty() ? root.path : root.name;
  flatten_into(root, root_type, "", paths);
  return paths;
}

}  // namespace fhirgate::domain
