#pragma once

#include "fhirgate/domain/finding.h"
#include "fhirgate/domain/question_set.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/evaluation/rule_evaluator.h"
#include "fhirgate/path/path_expression.h"
#include "fhirgate/scope/instance_scope_resolver.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fhirgate::evaluation {

// A question coding read from the record.
struct QuestionCoding {
  std::string system;  // NOLINT(readability-identifier-naming)
  std::string code;    // NOLINT(readability-identifier-naming)
};

// Reads the first coding under node at question_path. Accepts a CodeableConcept
// (first coding with a code) or a Coding.
[[nodiscard]] std::optional<QuestionCoding> extract_question_coding(
    const nlohmann::json& node, const std::vector<path::PathSegment>& question_path);

// infer_answer_type reads the answer kind from the concrete property name
// ("valueQuantity" -> quantity) and falls back to the JSON kind of the value.
[[nodiscard]] std::optional<domain::AnswerType> infer_answer_type(const std::string& concrete_path,
                                                                  const nlohmann::json& value);

// evaluate_question_answer expands iteration_path under the location and checks the
// rule's single constraint at each iteration node that carries a question coding.
[[nodiscard]] FindingsResult evaluate_question_answer(
    const domain::Rule& rule, const domain::QuestionAnswerParams& params,
    const scope::Location& location, const std::vector<path::PathSegment>& iteration_path,
    const domain::QuestionSetCatalog& question_sets);

}  // namespace fhirgate::evaluation
