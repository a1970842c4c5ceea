#include "fhirgate/evaluation/resource_composition_evaluator.h"

#include "fhirgate/evaluation/rule_evaluator.h"

#include <algorithm>
#include <set>
#include <string>
#include <utility>

namespace fhirgate::evaluation {

namespace {

bool satisfies_all(const std::vector<domain::ScopeFilter>& filters, const nlohmann::json& resource) {
  return std::all_of(filters.begin(), filters.end(), [&](const domain::ScopeFilter& filter) {
    return scope::evaluate_filter(filter, resource);
  });
}

// Findings from a record-scoped rule are addressed by resource type alone.
scope::Location record_location(const std::string& resource_type,
                                const std::optional<std::size_t> entry_index) {
  return scope::Location{resource_type, entry_index, nullptr};
}

}  // namespace

std::vector<domain::Finding> evaluate_resource_composition(
    const domain::Rule& rule, const domain::ResourceCompositionParams& params,
    const std::vector<scope::Location>& instances) {
  std::vector<domain::Finding> findings;

  for (const auto& requirement : params.requirements) {
    std::size_t count = 0;
    for (const auto& instance : instances) {
      if (instance.resource_type == requirement.resource_type &&
          satisfies_all(requirement.filters, *instance.resource)) {
        ++count;
      }
    }

    const auto location = record_location(requirement.resource_type, std::nullopt);
    if (count < requirement.min) {
      findings.push_back(make_rule_finding(
          rule, location, "",
          "record has " + std::to_string(count) + " " + requirement.resource_type +
              " resources, expected at least " + std::to_string(requirement.min),
          {{"resourceType", requirement.resource_type},
           {"violation", "min"},
           {"expected", requirement.min},
           {"actual", count}}));
    } else if (requirement.max.has_value() && count > requirement.max.value()) {
      findings.push_back(make_rule_finding(
          rule, location, "",
          "record has " + std::to_string(count) + " " + requirement.resource_type +
              " resources, expected at most " + std::to_string(requirement.max.value()),
          {{"resourceType", requirement.resource_type},
           {"violation", "max"},
           {"expected", requirement.max.value()},
           {"actual", count}}));
    }
  }

  if (!params.reject_undeclared) {
    return findings;
  }

  std::set<std::string> declared;
  for (const auto& requirement : params.requirements) {
    declared.insert(requirement.resource_type);
  }
  std::set<std::string> reported;
  for (const auto& instance : instances) {
    if (declared.contains(instance.resource_type) || reported.contains(instance.resource_type)) {
      continue;
    }
    reported.insert(instance.resource_type);
    const auto count = static_cast<std::size_t>(
        std::count_if(instances.begin(), instances.end(), [&](const scope::Location& other) {
          return other.resource_type == instance.resource_type;
        }));
    findings.push_back(make_rule_finding(
        rule, record_location(instance.resource_type, instance.entry_index), "",
        "record contains undeclared resource type " + instance.resource_type,
        {{"resourceType", instance.resource_type}, {"violation", "undeclared"}, {"actual", count}}));
  }
  return findings;
}

}  // namespace fhirgate::evaluation
