#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/rule_type.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fhirgate::domain {

// ────────────────────────────────────────────────────────────────
// Instance Scope
// ────────────────────────────────────────────────────────────────

enum class FilterOp {
  kEquals,
  kNotEquals,
  kExists,
  kNotExists,
};

[[nodiscard]] std::string filter_op_to_string(FilterOp op);
[[nodiscard]] std::optional<FilterOp> string_to_filter_op(const std::string& str);

// ScopeFilter is a structural predicate over one resource instance:
// field_path (plain relative path) + comparison + literal.
struct ScopeFilter {
  std::string field_path;              // NOLINT(readability-identifier-naming)
  FilterOp op{FilterOp::kEquals};      // NOLINT(readability-identifier-naming)
  nlohmann::json value;                // NOLINT(readability-identifier-naming)

  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

struct AllInstances {};
struct FirstInstance {};
struct FilteredInstances {
  ScopeFilter filter;  // NOLINT(readability-identifier-naming)
};

using InstanceScope = std::variant<AllInstances, FirstInstance, FilteredInstances>;

// Stable text key used to tell apart rules that differ only in scope:
// "all", "first", "filter:<path><op><value>".
[[nodiscard]] std::string scope_stable_key(const InstanceScope& scope);

// ────────────────────────────────────────────────────────────────
// Params (one alternative per RuleType, same order)
// ────────────────────────────────────────────────────────────────

struct RequiredParams {};

struct FixedValueParams {
  nlohmann::json value;  // NOLINT(readability-identifier-naming)
};

struct AllowedValuesParams {
  std::vector<nlohmann::json> values;  // NOLINT(readability-identifier-naming)
};

struct RegexParams {
  std::string pattern;            // NOLINT(readability-identifier-naming)
  bool negate{false};             // NOLINT(readability-identifier-naming)
  bool case_insensitive{false};   // NOLINT(readability-identifier-naming)
};

struct ArrayLengthParams {
  std::optional<std::size_t> min;  // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max;  // NOLINT(readability-identifier-naming)
};

struct CodeSystemParams {
  std::string system;               // NOLINT(readability-identifier-naming)
  std::vector<std::string> codes;   // NOLINT(readability-identifier-naming)
};

struct CustomExpressionParams {
  std::string expression;  // NOLINT(readability-identifier-naming)
};

struct ResourceRequirement {
  std::string resource_type;           // NOLINT(readability-identifier-naming)
  std::size_t min{0};                  // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> max;      // NOLINT(readability-identifier-naming)
  std::vector<ScopeFilter> filters;    // NOLINT(readability-identifier-naming)
};

struct ResourceCompositionParams {
  std::vector<ResourceRequirement> requirements;  // NOLINT(readability-identifier-naming)
  bool reject_undeclared{false};                  // NOLINT(readability-identifier-naming)
};

// The rule's field_path is the iteration path; question_path and answer_path are
// relative to each iteration node.
struct QuestionAnswerParams {
  std::string question_set_id;                              // NOLINT(readability-identifier-naming)
  std::string question_path;                                // NOLINT(readability-identifier-naming)
  std::string answer_path;                                  // NOLINT(readability-identifier-naming)
  AnswerConstraint constraint{AnswerConstraint::kRequired};  // NOLINT(readability-identifier-naming)
};

using RuleParams =
    std::variant<RequiredParams, FixedValueParams, AllowedValuesParams, RegexParams,
                 ArrayLengthParams, CodeSystemParams, CustomExpressionParams,
                 ResourceCompositionParams, QuestionAnswerParams>;

static_assert(std::variant_size_v<RuleParams> ==
                  static_cast<std::size_t>(RuleType::kQuestionAnswer) + 1,
              "RuleParams must have one alternative per RuleType");
static_assert(std::is_same_v<std::variant_alternative_t<
                                 static_cast<std::size_t>(RuleType::kQuestionAnswer), RuleParams>,
                             QuestionAnswerParams>,
              "RuleParams alternatives must follow RuleType order");

// ────────────────────────────────────────────────────────────────
// Rule
// ────────────────────────────────────────────────────────────────

// Rule is a value type (C.2: struct, members vary independently).
// Invariants are checked by validate(), which every construction path calls.
struct Rule {
  std::string id;                                // NOLINT(readability-identifier-naming)
  std::string resource_type;                     // NOLINT(readability-identifier-naming)
  InstanceScope scope{AllInstances{}};           // NOLINT(readability-identifier-naming)
  std::string field_path;                        // NOLINT(readability-identifier-naming)
  RuleParams params{RequiredParams{}};           // NOLINT(readability-identifier-naming)
  Severity severity{Severity::kError};           // NOLINT(readability-identifier-naming)
  std::string error_code;                        // NOLINT(readability-identifier-naming)
  std::optional<std::string> hint;               // NOLINT(readability-identifier-naming)
  bool enabled{true};                            // NOLINT(readability-identifier-naming)

  [[nodiscard]] RuleType type() const { return static_cast<RuleType>(params.index()); }

  // ResourceComposition evaluates once per record; every other type per location.
  [[nodiscard]] bool is_record_scoped() const { return type() == RuleType::kResourceComposition; }

  // The code findings of this rule carry: the stored code, or the fixed/computed
  // code for types that do not let the author choose.
  [[nodiscard]] std::string effective_error_code() const;

  // validate checks authoring-time invariants: identity, path grammar, scope filter
  // grammar, required params for the declared type, and the error-code vocabulary.
  [[nodiscard]] core::Result<bool, core::ConfigError> validate() const;
};

struct RuleSet {
  std::string version{"1.0"};      // NOLINT(readability-identifier-naming)
  std::string project;             // NOLINT(readability-identifier-naming)
  std::string fhir_version{"R4"};  // NOLINT(readability-identifier-naming)
  std::vector<Rule> rules;         // NOLINT(readability-identifier-naming)
};

}  // namespace fhirgate::domain
