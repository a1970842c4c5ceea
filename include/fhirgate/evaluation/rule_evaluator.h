#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/finding.h"
#include "fhirgate/domain/question_set.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/scope/instance_scope_resolver.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fhirgate::evaluation {

using FindingsResult = core::Result<std::vector<domain::Finding>, core::ConfigError>;

// EvaluationInput is what a rule reads during one evaluation. Members borrow.
struct EvaluationInput {
  const std::vector<scope::Location>& instances;      // NOLINT(readability-identifier-naming)
  const domain::QuestionSetCatalog& question_sets;    // NOLINT(readability-identifier-naming)
};

// make_rule_finding builds a business finding for rule at location.
// relative_path is concrete and resource-relative; empty addresses the resource itself.
// The rule's user hint, when present, is carried in details.userHint.
[[nodiscard]] domain::Finding make_rule_finding(const domain::Rule& rule,
                                                const scope::Location& location,
                                                const std::string& relative_path,
                                                std::string message,
                                                nlohmann::json details = nlohmann::json::object());

// check_evaluable_path refuses a field path that still carries ".where(...)", a
// concrete [n] index, ".exists()" or ".count()". Returns kMalformedPath.
[[nodiscard]] core::Result<bool, core::ConfigError> check_evaluable_path(const domain::Rule& rule);

// evaluate_at_location runs a per-location rule at one resolved location.
// QuestionAnswer yields at most one finding per iteration node and ArrayLength at
// most one per parent node; every other type yields at most one finding. Absent
// values pass every value-level check.
//
// Precondition: rule.validate() succeeded and the rule is not record-scoped.
[[nodiscard]] FindingsResult evaluate_at_location(const domain::Rule& rule,
                                                  const scope::Location& location,
                                                  const domain::QuestionSetCatalog& question_sets);

// evaluate_rule resolves the rule's scope over the instances of its resource type and
// evaluates each location independently, in document order. ResourceComposition rules
// run once over every instance in the record. Disabled rules yield nothing.
//
// Precondition: rule.validate() succeeded.
[[nodiscard]] FindingsResult evaluate_rule(const domain::Rule& rule, const EvaluationInput& input);

// evaluate_rule_set checks every enabled rule, including check_evaluable_path, before
// evaluating any of them and fails on the first invalid one. Findings keep rule-set order, then location order.
[[nodiscard]] FindingsResult evaluate_rule_set(const nlohmann::json& record,
                                               const std::vector<domain::Rule>& rules,
                                               const domain::QuestionSetCatalog& question_sets = {});

}  // namespace fhirgate::evaluation
