#include "fhirgate/domain/rule_type.h"

#include <array>
#include <string_view>
#include <utility>

namespace fhirgate::domain {

namespace {

// Per.11: name tables fixed at compile time, keyed by enum.
constexpr std::array<std::pair<Severity, std::string_view>, 3> kSeverityNames = {{
    {Severity::kError, "error"},
    {Severity::kWarning, "warning"},
    {Severity::kInformation, "information"},
}};

constexpr std::array<std::pair<RuleType, std::string_view>, 9> kRuleTypeNames = {{
    {RuleType::kRequired, "Required"},
    {RuleType::kFixedValue, "FixedValue"},
    {RuleType::kAllowedValues, "AllowedValues"},
    {RuleType::kRegex, "Regex"},
    {RuleType::kArrayLength, "ArrayLength"},
    {RuleType::kCodeSystem, "CodeSystem"},
    {RuleType::kCustomExpression, "CustomExpression"},
    {RuleType::kResourceComposition, "ResourceComposition"},
    {RuleType::kQuestionAnswer, "QuestionAnswer"},
}};

constexpr std::array<std::pair<AnswerConstraint, std::string_view>, 6> kConstraintNames = {{
    {AnswerConstraint::kRequired, "required"},
    {AnswerConstraint::kAnswerType, "answer_type"},
    {AnswerConstraint::kRange, "range"},
    {AnswerConstraint::kValueSet, "value_set"},
    {AnswerConstraint::kFormat, "format"},
    {AnswerConstraint::kSingleAnswer, "single_answer"},
}};

template <typename Enum, std::size_t N>
std::string name_of(const std::array<std::pair<Enum, std::string_view>, N>& table,
                    const Enum value) {
  for (const auto& [key, name] : table) {
    if (key == value) {
      return std::string(name);
    }
  }
  return std::string(table.front().second);
}

template <typename Enum, std::size_t N>
std::optional<Enum> value_of(const std::array<std::pair<Enum, std::string_view>, N>& table,
                             const std::string& str) {
  for (const auto& [key, name] : table) {
    if (name == str) {
      return key;
    }
  }
  return std::nullopt;
}

}  // namespace

std::string severity_to_string(const Severity severity) {
  return name_of(kSeverityNames, severity);
}

std::optional<Severity> string_to_severity(const std::string& str) {
  return value_of(kSeverityNames, str);
}

std::string rule_type_to_string(const RuleType type) {
  return name_of(kRuleTypeNames, type);
}

std::optional<RuleType> string_to_rule_type(const std::string& str) {
  return value_of(kRuleTypeNames, str);
}

std::string answer_constraint_to_string(const AnswerConstraint constraint) {
  return name_of(kConstraintNames, constraint);
}

std::optional<AnswerConstraint> string_to_answer_constraint(const std::string& str) {
  return value_of(kConstraintNames, str);
}

}  // namespace fhirgate::domain
