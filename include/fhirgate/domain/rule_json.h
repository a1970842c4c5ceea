#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/rule.h"

#include <nlohmann/json.hpp>

namespace fhirgate::domain {

// Rule JSON uses the authoring format:
//   {id, type, resourceType, instanceScope:{kind, filter|condition}, fieldPath,
//    severity, errorCode, userHint, enabled, params}
// Parsing validates the rule (Rule::validate) and fills in the fixed error code
// when the author left it empty.
[[nodiscard]] core::Result<Rule, core::ConfigError> rule_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json rule_to_json(const Rule& rule);

// Fails on the first invalid rule.
[[nodiscard]] core::Result<RuleSet, core::ConfigError> rule_set_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json rule_set_to_json(const RuleSet& rule_set);

// Parses without Rule::validate so that governance can review rules an author
// has not fixed yet. Only structural JSON errors fail.
[[nodiscard]] core::Result<RuleSet, core::ConfigError> rule_set_from_json_unchecked(
    const nlohmann::json& j);

}  // namespace fhirgate::domain
