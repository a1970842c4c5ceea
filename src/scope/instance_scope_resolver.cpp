#include "fhirgate/scope/instance_scope_resolver.h"

#include "fhirgate/path/json_navigator.h"
#include "fhirgate/path/path_expression.h"

namespace fhirgate::scope {

using nlohmann::json;

std::optional<std::string> resource_type_of(const json& resource) {
  if (!resource.is_object()) {
    return std::nullopt;
  }
  const auto it = resource.find("resourceType");
  if (it == resource.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::vector<Location> collect_resource_instances(const nlohmann::json& record) {
  std::vector<Location> instances;
  const auto record_type = resource_type_of(record);
  if (!record_type.has_value()) {
    return instances;
  }

  if (record_type.value() != "Bundle") {
    instances.push_back({record_type.value(), std::nullopt, &record});
    return instances;
  }

  const auto entries = record.find("entry");
  if (entries == record.end() || !entries->is_array()) {
    return instances;
  }
  for (std::size_t i = 0; i < entries->size(); ++i) {
    const auto& entry = (*entries)[i];
    if (!entry.is_object() || !entry.contains("resource")) {
      continue;
    }
    const auto& resource = entry.at("resource");
    const auto type = resource_type_of(resource);
    if (type.has_value()) {
      instances.push_back({type.value(), i, &resource});
    }
  }
  return instances;
}

std::vector<Location> instances_of_type(const std::vector<Location>& instances,
                                        const std::string_view resource_type) {
  std::vector<Location> matching;
  for (const auto& instance : instances) {
    if (instance.resource_type == resource_type) {
      matching.push_back(instance);
    }
  }
  return matching;
}

bool evaluate_filter(const domain::ScopeFilter& filter, const nlohmann::json& resource) {
  const auto segments = path::parse_path(filter.field_path);
  if (!segments.has_value()) {
    return false;
  }
  const auto selected = path::select_nodes(resource, segments.value());

  bool any_equal = false;
  for (const auto& node : selected) {
    if (path::values_equal(*node.node, filter.value)) {
      any_equal = true;
      break;
    }
  }

  switch (filter.op) {
    case domain::FilterOp::kEquals:
      return any_equal;
    case domain::FilterOp::kNotEquals:
      return !any_equal;
    case domain::FilterOp::kExists:
      return !selected.empty();
    case domain::FilterOp::kNotExists:
      return selected.empty();
  }
  return false;
}

core::Result<std::vector<Location>, core::ConfigError> resolve_scope(
    const domain::InstanceScope& scope, const std::vector<Location>& instances,
    const std::string& rule_id) {
  using R = core::Result<std::vector<Location>, core::ConfigError>;

  if (std::holds_alternative<domain::AllInstances>(scope)) {
    return R::ok(instances);
  }
  if (std::holds_alternative<domain::FirstInstance>(scope)) {
    if (instances.empty()) {
      return R::ok({});
    }
    return R::ok({instances.front()});
  }

  const auto& filter = std::get<domain::FilteredInstances>(scope).filter;
  auto valid = filter.validate();
  if (!valid.has_value()) {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id, valid.error()});
  }

  std::vector<Location> selected;
  for (const auto& instance : instances) {
    if (evaluate_filter(filter, *instance.resource)) {
      selected.push_back(instance);
    }
  }
  return R::ok(std::move(selected));
}

}  // namespace fhirgate::scope
