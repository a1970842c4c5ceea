#include "fhirgate/domain/error_codes.h"

#include <algorithm>
#include <array>
#include <utility>

namespace fhirgate::domain {

namespace {

constexpr std::array<std::pair<RuleType, std::string_view>, 7> kFixedCodes = {{
    {RuleType::kRequired, codes::kFieldRequired},
    {RuleType::kFixedValue, codes::kFixedValueMismatch},
    {RuleType::kAllowedValues, codes::kValueNotAllowed},
    {RuleType::kRegex, codes::kPatternMismatch},
    {RuleType::kArrayLength, codes::kArrayLengthViolation},
    {RuleType::kCodeSystem, codes::kInvalidCode},
    {RuleType::kResourceComposition, codes::kResourceRequirementViolation},
}};

constexpr std::array<std::pair<AnswerConstraint, std::string_view>, 6> kConstraintCodes = {{
    {AnswerConstraint::kRequired, codes::kAnswerRequired},
    {AnswerConstraint::kAnswerType, codes::kInvalidAnswerType},
    {AnswerConstraint::kRange, codes::kAnswerOutOfRange},
    {AnswerConstraint::kValueSet, codes::kAnswerNotInValueSet},
    {AnswerConstraint::kFormat, codes::kInvalidAnswerValue},
    {AnswerConstraint::kSingleAnswer, codes::kAnswerMultipleNotAllowed},
}};

// Vocabulary an author may pick from for CustomExpression rules.
constexpr std::array<std::string_view, 14> kCustomExpressionCodes = {
    codes::kFieldRequired,        codes::kValueNotEqual,       codes::kPatternMismatch,
    codes::kFormatInvalid,        codes::kValueOutOfRange,     codes::kValueNotAllowed,
    codes::kCodeNotAllowed,       codes::kCodeNotInValueSet,   codes::kReferenceRequired,
    codes::kReferenceInvalid,     codes::kArrayLengthViolation, codes::kFixedValueMismatch,
    codes::kResourceMissing,      codes::kConditionNotMet,
};

constexpr std::array<std::string_view, 6> kQuestionAnswerCodes = {
    codes::kAnswerRequired,      codes::kInvalidAnswerType,   codes::kAnswerOutOfRange,
    codes::kAnswerNotInValueSet, codes::kInvalidAnswerValue,  codes::kAnswerMultipleNotAllowed,
};

// Single-element views over the fixed codes, indexed like kFixedCodes.
constexpr std::array<std::string_view, 1> kRequiredCodes = {codes::kFieldRequired};
constexpr std::array<std::string_view, 1> kFixedValueCodes = {codes::kFixedValueMismatch};
constexpr std::array<std::string_view, 1> kAllowedValuesCodes = {codes::kValueNotAllowed};
constexpr std::array<std::string_view, 1> kRegexCodes = {codes::kPatternMismatch};
constexpr std::array<std::string_view, 1> kArrayLengthCodes = {codes::kArrayLengthViolation};
constexpr std::array<std::string_view, 1> kCodeSystemCodes = {codes::kInvalidCode};
constexpr std::array<std::string_view, 1> kCompositionCodes = {
    codes::kResourceRequirementViolation};

}  // namespace

std::optional<std::string_view> fixed_error_code(const RuleType type) {
  for (const auto& [key, code] : kFixedCodes) {
    if (key == type) {
      return code;
    }
  }
  return std::nullopt;
}

std::string_view answer_constraint_error_code(const AnswerConstraint constraint) {
  for (const auto& [key, code] : kConstraintCodes) {
    if (key == constraint) {
      return code;
    }
  }
  return codes::kAnswerRequired;
}

std::span<const std::string_view> governed_error_codes(const RuleType type) {
  switch (type) {
    case RuleType::kRequired:
      return kRequiredCodes;
    case RuleType::kFixedValue:
      return kFixedValueCodes;
    case RuleType::kAllowedValues:
      return kAllowedValuesCodes;
    case RuleType::kRegex:
      return kRegexCodes;
    case RuleType::kArrayLength:
      return kArrayLengthCodes;
    case RuleType::kCodeSystem:
      return kCodeSystemCodes;
    case RuleType::kCustomExpression:
      return kCustomExpressionCodes;
    case RuleType::kResourceComposition:
      return kCompositionCodes;
    case RuleType::kQuestionAnswer:
      return kQuestionAnswerCodes;
  }
  return {};
}

bool is_governed_error_code(const RuleType type, const std::string_view code) {
  const auto vocabulary = governed_error_codes(type);
  return std::find(vocabulary.begin(), vocabulary.end(), code) != vocabulary.end();
}

}  // namespace fhirgate::domain
