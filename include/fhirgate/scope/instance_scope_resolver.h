#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/rule.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::scope {

// Location is one resource instance a rule evaluates against.
// entry_index is the position in Bundle.entry, nullopt when the record is a bare resource.
// resource borrows from the record and must not outlive it.
struct Location {
  std::string resource_type;                 // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> entry_index;    // NOLINT(readability-identifier-naming)
  const nlohmann::json* resource{nullptr};   // NOLINT(readability-identifier-naming)
};

// resource_type_of reads a string "resourceType"; nullopt for a non-object, a missing
// member or a member of any other JSON type.
[[nodiscard]] std::optional<std::string> resource_type_of(const nlohmann::json& resource);

// collect_resource_instances lists every resource in the record in document order.
// A Bundle yields its entry[].resource objects; entries without a typed resource are
// skipped but keep their index. Any other typed object is a single bare resource.
[[nodiscard]] std::vector<Location> collect_resource_instances(const nlohmann::json& record);

// instances_of_type keeps the instances of one resource type, order preserved.
[[nodiscard]] std::vector<Location> instances_of_type(const std::vector<Location>& instances,
                                                      std::string_view resource_type);

// evaluate_filter tests one resource against a scope filter.
// Precondition: filter.validate() succeeded.
[[nodiscard]] bool evaluate_filter(const domain::ScopeFilter& filter,
                                   const nlohmann::json& resource);

// resolve_scope expands a scope over the owning type's instances:
//   all      every instance
//   first    the first instance, or nothing
//   filter   the instances satisfying the filter
// Document order is preserved. No instances is an empty list, not an error.
// A filter with a malformed path fails with kMalformedScope attributed to rule_id.
[[nodiscard]] core::Result<std::vector<Location>, core::ConfigError> resolve_scope(
    const domain::InstanceScope& scope, const std::vector<Location>& instances,
    const std::string& rule_id = "");

}  // namespace fhirgate::scope
