#pragma once

#include "fhirgate/domain/rule.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::governance {

// Ordered by strength: a result takes the strongest status among its issues.
enum class ReviewStatus {
  kOk,
  kWarning,
  kBlocked,
};

[[nodiscard]] std::string review_status_to_string(ReviewStatus status);
[[nodiscard]] std::optional<ReviewStatus> string_to_review_status(const std::string& str);

namespace issue_codes {
// Blocking
inline constexpr std::string_view kRuleConfigurationInvalid = "RULE_CONFIGURATION_INVALID";
inline constexpr std::string_view kMissingErrorCode = "MISSING_ERROR_CODE";
inline constexpr std::string_view kEmptyPath = "EMPTY_PATH";
inline constexpr std::string_view kResourceTypeInPath = "RESOURCE_TYPE_IN_PATH";
inline constexpr std::string_view kWhereClauseInPath = "WHERE_CLAUSE_IN_PATH";
inline constexpr std::string_view kIndexMarkerInPath = "INDEX_MARKER_IN_PATH";
inline constexpr std::string_view kFunctionInPath = "FUNCTION_IN_PATH";
inline constexpr std::string_view kQuestionAnswerWithoutQuestionSetId =
    "QUESTION_ANSWER_WITHOUT_QUESTION_SET_ID";
inline constexpr std::string_view kPatternErrorCodeMismatch = "PATTERN_ERROR_CODE_MISMATCH";
inline constexpr std::string_view kPatternOnNonString = "PATTERN_ON_NON_STRING";
inline constexpr std::string_view kFilterPathInvalid = "FILTER_PATH_INVALID";
// Warning
inline constexpr std::string_view kBroadPath = "BROAD_PATH";
inline constexpr std::string_view kGenericWildcard = "GENERIC_WILDCARD";
inline constexpr std::string_view kArrayLengthOnNonArray = "ARRAY_LENGTH_ON_NON_ARRAY";
inline constexpr std::string_view kFixedValueWithoutSystem = "FIXED_VALUE_WITHOUT_SYSTEM";
inline constexpr std::string_view kRuleSemanticStabilityInfo = "RULE_SEMANTIC_STABILITY_INFO";
inline constexpr std::string_view kDuplicateRule = "DUPLICATE_RULE";
inline constexpr std::string_view kPathErrorCodeConflict = "PATH_ERROR_CODE_CONFLICT";
}  // namespace issue_codes

// rule_id names the rule the issue was raised on.
struct ReviewIssue {
  std::string code;                                   // NOLINT(readability-identifier-naming)
  ReviewStatus severity{ReviewStatus::kWarning};      // NOLINT(readability-identifier-naming)
  std::string rule_id;                                // NOLINT(readability-identifier-naming)
  nlohmann::json facts = nlohmann::json::object();    // NOLINT(readability-identifier-naming)
};

struct ReviewResult {
  std::string rule_id;                    // NOLINT(readability-identifier-naming)
  ReviewStatus status{ReviewStatus::kOk};  // NOLINT(readability-identifier-naming)
  std::vector<ReviewIssue> issues;        // NOLINT(readability-identifier-naming)
};

// status_of: kBlocked if any issue blocks, else kWarning if any issue exists, else kOk.
[[nodiscard]] ReviewStatus status_of(const std::vector<ReviewIssue>& issues);

// review_rule runs the checks that look at one rule in isolation.
[[nodiscard]] ReviewResult review_rule(const domain::Rule& rule);

// review_rule_set reviews every rule, then adds the checks that compare rules
// (duplicates, conflicting error codes). One result per rule, in input order.
// Stateless: nothing from an earlier review is reused.
[[nodiscard]] std::vector<ReviewResult> review_rule_set(const std::vector<domain::Rule>& rules);

// A rule set may be persisted only when no result is blocked.
[[nodiscard]] bool is_persist_eligible(const std::vector<ReviewResult>& results);

[[nodiscard]] nlohmann::json review_result_to_json(const ReviewResult& result);
[[nodiscard]] nlohmann::json review_results_to_json(const std::vector<ReviewResult>& results);

}  // namespace fhirgate::governance
