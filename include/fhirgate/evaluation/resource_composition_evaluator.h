#pragma once

#include "fhirgate/domain/finding.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/scope/instance_scope_resolver.h"

#include <vector>

namespace fhirgate::evaluation {

// evaluate_resource_composition checks instance counts per declared resource type over
// the whole record. With reject_undeclared, each present type that no requirement
// declares yields one finding at its first occurrence.
//
// Precondition: every requirement filter validates.
[[nodiscard]] std::vector<domain::Finding> evaluate_resource_composition(
    const domain::Rule& rule, const domain::ResourceCompositionParams& params,
    const std::vector<scope::Location>& instances);

}  // namespace fhirgate::evaluation
