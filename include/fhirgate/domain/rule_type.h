#pragma once

#include <optional>
#include <string>

namespace fhirgate::domain {

enum class Severity {
  kError,
  kWarning,
  kInformation,
};

// RuleType enumerator order matches the alternative order of RuleParams (rule.h).
enum class RuleType {
  kRequired,
  kFixedValue,
  kAllowedValues,
  kRegex,
  kArrayLength,
  kCodeSystem,
  kCustomExpression,
  kResourceComposition,
  kQuestionAnswer,
};

// The single check a QuestionAnswer rule applies to every question in the set.
enum class AnswerConstraint {
  kRequired,
  kAnswerType,
  kRange,
  kValueSet,
  kFormat,
  kSingleAnswer,
};

[[nodiscard]] std::string severity_to_string(Severity severity);
[[nodiscard]] std::optional<Severity> string_to_severity(const std::string& str);

[[nodiscard]] std::string rule_type_to_string(RuleType type);
[[nodiscard]] std::optional<RuleType> string_to_rule_type(const std::string& str);

[[nodiscard]] std::string answer_constraint_to_string(AnswerConstraint constraint);
[[nodiscard]] std::optional<AnswerConstraint> string_to_answer_constraint(const std::string& str);

}  // namespace fhirgate::domain
