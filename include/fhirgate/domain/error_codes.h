#pragma once

#include "fhirgate/domain/rule_type.h"

#include <optional>
#include <span>
#include <string_view>

namespace fhirgate::domain {

namespace codes {

inline constexpr std::string_view kFieldRequired = "FIELD_REQUIRED";
inline constexpr std::string_view kFixedValueMismatch = "FIXED_VALUE_MISMATCH";
inline constexpr std::string_view kValueNotAllowed = "VALUE_NOT_ALLOWED";
inline constexpr std::string_view kPatternMismatch = "PATTERN_MISMATCH";
inline constexpr std::string_view kArrayLengthViolation = "ARRAY_LENGTH_VIOLATION";
inline constexpr std::string_view kInvalidCode = "INVALID_CODE";
inline constexpr std::string_view kResourceRequirementViolation = "RESOURCE_REQUIREMENT_VIOLATION";

inline constexpr std::string_view kValueNotEqual = "VALUE_NOT_EQUAL";
inline constexpr std::string_view kFormatInvalid = "FORMAT_INVALID";
inline constexpr std::string_view kValueOutOfRange = "VALUE_OUT_OF_RANGE";
inline constexpr std::string_view kCodeNotAllowed = "CODE_NOT_ALLOWED";
inline constexpr std::string_view kCodeNotInValueSet = "CODE_NOT_IN_VALUESET";
inline constexpr std::string_view kReferenceRequired = "REFERENCE_REQUIRED";
inline constexpr std::string_view kReferenceInvalid = "REFERENCE_INVALID";
inline constexpr std::string_view kResourceMissing = "RESOURCE_MISSING";
inline constexpr std::string_view kConditionNotMet = "CONDITION_NOT_MET";

inline constexpr std::string_view kAnswerRequired = "ANSWER_REQUIRED";
inline constexpr std::string_view kInvalidAnswerType = "INVALID_ANSWER_TYPE";
inline constexpr std::string_view kAnswerOutOfRange = "ANSWER_OUT_OF_RANGE";
inline constexpr std::string_view kAnswerNotInValueSet = "ANSWER_NOT_IN_VALUESET";
inline constexpr std::string_view kInvalidAnswerValue = "INVALID_ANSWER_VALUE";
inline constexpr std::string_view kAnswerMultipleNotAllowed = "ANSWER_MULTIPLE_NOT_ALLOWED";
inline constexpr std::string_view kQuestionNotFound = "QUESTION_NOT_FOUND";
inline constexpr std::string_view kQuestionSetDataMissing = "QUESTIONSET_DATA_MISSING";

inline constexpr std::string_view kReferenceNotFound = "REFERENCE_NOT_FOUND";
inline constexpr std::string_view kReferenceTypeMismatch = "REFERENCE_TYPE_MISMATCH";

}  // namespace codes

// fixed_error_code returns the one code a rule type always reports, or nullopt for
// CustomExpression (author-selected) and QuestionAnswer (computed per constraint).
[[nodiscard]] std::optional<std::string_view> fixed_error_code(RuleType type);

// answer_constraint_error_code is the fixed constraint -> code table.
[[nodiscard]] std::string_view answer_constraint_error_code(AnswerConstraint constraint);

// governed_error_codes lists the codes a rule of this type may carry.
// Fixed types yield their single code; QuestionAnswer yields the constraint codes.
[[nodiscard]] std::span<const std::string_view> governed_error_codes(RuleType type);

[[nodiscard]] bool is_governed_error_code(RuleType type, std::string_view code);

}  // namespace fhirgate::domain
