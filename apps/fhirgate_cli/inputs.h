#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/coverage/coverage_analyzer.h"
#include "fhirgate/domain/finding.h"
#include "fhirgate/domain/question_set.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/domain/schema_node.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fhirgate::cli {

// File loaders for subcommand inputs. Errors name the file and the problem.

[[nodiscard]] core::Result<nlohmann::json, std::string> load_record(const std::string& path);

// Rules are parsed without Rule::validate so that the engine and the review gate
// report invalid rules themselves.
[[nodiscard]] core::Result<domain::RuleSet, std::string> load_rule_set(const std::string& path);

[[nodiscard]] core::Result<domain::QuestionSetCatalog, std::string> load_question_sets(
    const std::string& path);

[[nodiscard]] core::Result<std::vector<domain::Finding>, std::string> load_external_findings(
    const std::string& path);

[[nodiscard]] core::Result<domain::SchemaNode, std::string> load_schema(const std::string& path);

[[nodiscard]] core::Result<std::vector<coverage::Suggestion>, std::string> load_suggestions(
    const std::string& path);

}  // namespace fhirgate::cli
