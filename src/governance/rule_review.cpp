#include "fhirgate/governance/rule_review.h"

#include "fhirgate/core/normalization.h"
#include "fhirgate/domain/error_codes.h"
#include "fhirgate/path/path_normalizer.h"

#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <utility>

namespace fhirgate::governance {

namespace {

using nlohmann::json;

// Fields that repeat in common resource types.
constexpr std::array<std::string_view, 15> kRepeatingFields{
    "identifier", "telecom", "address", "name",      "contact",
    "communication", "extension", "contained", "entry", "item",
    "component", "code", "coding", "note", "performer"};

// Fields whose values are not strings.
constexpr std::array<std::string_view, 8> kNonStringFields{
    "active", "multiplebirth", "deceasedboolean", "birthdate",
    "period", "quantity", "address", "contact"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table, const std::string_view value) {
  return std::find(table.begin(), table.end(), value) != table.end();
}

// Segment names of a path, markers and filters removed: "a.where(x).b[*]" -> {a, b}.
std::vector<std::string> segment_names(const std::string& field_path,
                                       const std::string& resource_type) {
  const std::string plain = path::strip_wildcards(path::normalize_path(field_path, resource_type));
  std::vector<std::string> names;
  for (auto& piece : core::split_ascii(plain, '.')) {
    const auto bracket = piece.find('[');
    if (bracket != std::string::npos) {
      piece.erase(bracket);
    }
    if (!piece.empty()) {
      names.push_back(std::move(piece));
    }
  }
  return names;
}

// True when text holds "[n]" or "[*]"; the choice marker "[x]" is legal.
bool has_index_marker(const std::string& text) {
  for (std::size_t open = text.find('['); open != std::string::npos;
       open = text.find('[', open + 1)) {
    const auto close = text.find(']', open);
    if (close == std::string::npos) {
      return false;
    }
    const std::string_view inside = std::string_view(text).substr(open + 1, close - open - 1);
    if (inside == "*") {
      return true;
    }
    if (!inside.empty() && std::all_of(inside.begin(), inside.end(), core::is_ascii_digit)) {
      return true;
    }
  }
  return false;
}

bool is_value_constraining(const domain::RuleType type) {
  return type == domain::RuleType::kFixedValue || type == domain::RuleType::kAllowedValues ||
         type == domain::RuleType::kCodeSystem;
}

class IssueCollector {
 public:
  explicit IssueCollector(const domain::Rule& rule) : rule_(rule) {}

  void block(const std::string_view code, json facts = json::object()) {
    add(code, ReviewStatus::kBlocked, std::move(facts));
  }
  void warn(const std::string_view code, json facts = json::object()) {
    add(code, ReviewStatus::kWarning, std::move(facts));
  }

  std::vector<ReviewIssue> take() { return std::move(issues_); }

 private:
  void add(const std::string_view code, const ReviewStatus severity, json facts) {
    facts["ruleType"] = domain::rule_type_to_string(rule_.type());
    issues_.push_back({std::string(code), severity, rule_.id, std::move(facts)});
  }

  const domain::Rule& rule_;
  std::vector<ReviewIssue> issues_;
};

void check_path_shape(const domain::Rule& rule, IssueCollector& issues) {
  const std::string field_path = core::trim(rule.field_path);
  if (field_path.empty()) {
    issues.block(issue_codes::kEmptyPath);
    return;
  }

  if (field_path == rule.resource_type || field_path.starts_with(rule.resource_type + ".") ||
      field_path.starts_with(rule.resource_type + "[")) {
    issues.block(issue_codes::kResourceTypeInPath,
                 {{"path", field_path}, {"resourceType", rule.resource_type}});
  }
  if (field_path.find("where(") != std::string::npos) {
    issues.block(issue_codes::kWhereClauseInPath, {{"path", field_path}});
  }
  if (has_index_marker(field_path)) {
    issues.block(issue_codes::kIndexMarkerInPath, {{"path", field_path}});
  }
  if (field_path.find(".exists()") != std::string::npos ||
      field_path.find(".count()") != std::string::npos) {
    issues.block(issue_codes::kFunctionInPath, {{"path", field_path}});
  }

  const auto names = segment_names(field_path, rule.resource_type);
  if (names.size() == 1 && field_path.find("where(") == std::string::npos &&
      field_path.find('[') == std::string::npos) {
    issues.warn(issue_codes::kBroadPath, {{"path", field_path}, {"segmentCount", names.size()}});
  }
}

void check_filters(const domain::Rule& rule, IssueCollector& issues) {
  if (const auto* filtered = std::get_if<domain::FilteredInstances>(&rule.scope)) {
    auto valid = filtered->filter.validate();
    if (!valid.has_value()) {
      issues.block(issue_codes::kFilterPathInvalid,
                   {{"filterPath", filtered->filter.field_path}, {"reason", valid.error()}});
    }
  }
  if (const auto* composition = std::get_if<domain::ResourceCompositionParams>(&rule.params)) {
    for (const auto& requirement : composition->requirements) {
      for (const auto& filter : requirement.filters) {
        auto valid = filter.validate();
        if (!valid.has_value()) {
          issues.block(issue_codes::kFilterPathInvalid,
                       {{"filterPath", filter.field_path},
                        {"resourceType", requirement.resource_type},
                        {"reason", valid.error()}});
        }
      }
    }
  }
}

void check_type_specific(const domain::Rule& rule, IssueCollector& issues) {
  const auto names = segment_names(rule.field_path, rule.resource_type);

  switch (rule.type()) {
    case domain::RuleType::kRegex: {
      if (!rule.error_code.empty() && rule.error_code != domain::codes::kPatternMismatch) {
        issues.block(issue_codes::kPatternErrorCodeMismatch,
                     {{"currentErrorCode", rule.error_code},
                      {"requiredErrorCode", domain::codes::kPatternMismatch}});
      }
      // Only the targeted field matters: "address.postalCode" is a string.
      if (!names.empty() &&
          contains(kNonStringFields, core::normalize_ascii_lower(names.back()))) {
        issues.block(issue_codes::kPatternOnNonString,
                     {{"path", rule.field_path}, {"field", names.back()}});
      }
      break;
    }
    case domain::RuleType::kArrayLength:
      if (!names.empty() && !contains(kRepeatingFields, names.back())) {
        issues.warn(issue_codes::kArrayLengthOnNonArray, {{"path", rule.field_path}});
      }
      break;
    case domain::RuleType::kFixedValue: {
      const bool coded = std::any_of(names.begin(), names.end(), [](const std::string& name) {
        return name == "code" || name == "coding";
      });
      const bool has_system =
          std::find(names.begin(), names.end(), "system") != names.end();
      if (coded && !has_system) {
        issues.warn(issue_codes::kFixedValueWithoutSystem, {{"path", rule.field_path}});
      }
      break;
    }
    case domain::RuleType::kCustomExpression:
      issues.warn(issue_codes::kRuleSemanticStabilityInfo,
                  {{"reason", "outcome depends on expression semantics beyond the rule definition"}});
      break;
    case domain::RuleType::kQuestionAnswer: {
      const auto& params = std::get<domain::QuestionAnswerParams>(rule.params);
      if (core::trim(params.question_set_id).empty()) {
        issues.block(issue_codes::kQuestionAnswerWithoutQuestionSetId,
                     {{"path", rule.field_path}});
      }
      issues.warn(issue_codes::kRuleSemanticStabilityInfo,
                  {{"reason", "outcome depends on question set data"}});
      break;
    }
    case domain::RuleType::kRequired:
    case domain::RuleType::kAllowedValues:
    case domain::RuleType::kCodeSystem:
    case domain::RuleType::kResourceComposition:
      break;
  }

  if (is_value_constraining(rule.type()) &&
      std::holds_alternative<domain::AllInstances>(rule.scope) && names.size() > 1) {
    const auto repeating = std::find_if(names.begin(), names.end() - 1, [](const std::string& name) {
      return contains(kRepeatingFields, name);
    });
    if (repeating != names.end() - 1) {
      issues.warn(issue_codes::kGenericWildcard,
                  {{"path", rule.field_path}, {"repeatingField", *repeating}});
    }
  }
}

void add_issue(ReviewResult& result, ReviewIssue issue) {
  result.issues.push_back(std::move(issue));
  result.status = status_of(result.issues);
}

}  // namespace

std::string review_status_to_string(const ReviewStatus status) {
  switch (status) {
    case ReviewStatus::kOk:
      return "OK";
    case ReviewStatus::kWarning:
      return "WARNING";
    case ReviewStatus::kBlocked:
      return "BLOCKED";
  }
  return "BLOCKED";
}

std::optional<ReviewStatus> string_to_review_status(const std::string& str) {
  if (str == "OK") {
    return ReviewStatus::kOk;
  }
  if (str == "WARNING") {
    return ReviewStatus::kWarning;
  }
  if (str == "BLOCKED") {
    return ReviewStatus::kBlocked;
  }
  return std::nullopt;
}

ReviewStatus status_of(const std::vector<ReviewIssue>& issues) {
  ReviewStatus status = ReviewStatus::kOk;
  for (const auto& issue : issues) {
    status = std::max(status, issue.severity);
  }
  return status;
}

ReviewResult review_rule(const domain::Rule& rule) {
  IssueCollector issues(rule);

  auto valid = rule.validate();
  if (!valid.has_value()) {
    issues.block(issue_codes::kRuleConfigurationInvalid,
                 {{"kind", core::config_error_kind_to_string(valid.error().kind)},
                  {"reason", valid.error().reason}});
  }
  if (core::trim(rule.error_code).empty()) {
    issues.block(issue_codes::kMissingErrorCode);
  }
  if (!rule.is_record_scoped()) {
    check_path_shape(rule, issues);
  }
  check_filters(rule, issues);
  check_type_specific(rule, issues);

  ReviewResult result;
  result.rule_id = rule.id;
  result.issues = issues.take();
  result.status = status_of(result.issues);
  return result;
}

std::vector<ReviewResult> review_rule_set(const std::vector<domain::Rule>& rules) {
  std::vector<ReviewResult> results;
  results.reserve(rules.size());
  for (const auto& rule : rules) {
    results.push_back(review_rule(rule));
  }

  // Duplicates: same type, resource type, scope and normalized path as an earlier rule.
  std::map<std::string, std::string> first_by_key;
  for (std::size_t i = 0; i < rules.size(); ++i) {
    const auto& rule = rules[i];
    const std::string key = domain::rule_type_to_string(rule.type()) + "|" + rule.resource_type +
                            "|" + domain::scope_stable_key(rule.scope) + "|" +
                            path::normalize_path(rule.field_path, rule.resource_type);
    const auto [it, inserted] = first_by_key.emplace(key, rule.id);
    if (!inserted) {
      add_issue(results[i], {std::string(issue_codes::kDuplicateRule), ReviewStatus::kWarning,
                             rule.id,
                             {{"duplicateOf", it->second},
                              {"ruleType", domain::rule_type_to_string(rule.type())},
                              {"path", rule.field_path}}});
    }
  }

  // Conflicts: per-location rules on the same resource type and path with different codes.
  std::map<std::string, std::set<std::string>> codes_by_path;
  for (const auto& rule : rules) {
    if (rule.is_record_scoped() || rule.error_code.empty()) {
      continue;
    }
    codes_by_path[rule.resource_type + "." +
                  path::normalize_path(rule.field_path, rule.resource_type)]
        .insert(rule.error_code);
  }
  for (std::size_t i = 0; i < rules.size(); ++i) {
    const auto& rule = rules[i];
    if (rule.is_record_scoped() || rule.error_code.empty()) {
      continue;
    }
    const std::string key =
        rule.resource_type + "." + path::normalize_path(rule.field_path, rule.resource_type);
    const auto& codes = codes_by_path.at(key);
    if (codes.size() < 2) {
      continue;
    }
    json others = json::array();
    for (const auto& code : codes) {
      if (code != rule.error_code) {
        others.push_back(code);
      }
    }
    add_issue(results[i], {std::string(issue_codes::kPathErrorCodeConflict), ReviewStatus::kWarning,
                           rule.id,
                           {{"path", rule.field_path},
                            {"thisErrorCode", rule.error_code},
                            {"conflictingErrorCodes", others}}});
  }

  return results;
}

bool is_persist_eligible(const std::vector<ReviewResult>& results) {
  return std::none_of(results.begin(), results.end(), [](const ReviewResult& result) {
    return result.status == ReviewStatus::kBlocked;
  });
}

nlohmann::json review_result_to_json(const ReviewResult& result) {
  json issues = json::array();
  for (const auto& issue : result.issues) {
    issues.push_back({{"code", issue.code},
                      {"severity", review_status_to_string(issue.severity)},
                      {"rule_id", issue.rule_id},
                      {"facts", issue.facts}});
  }
  return {{"rule_id", result.rule_id},
          {"status", review_status_to_string(result.status)},
          {"issues", issues}};
}

nlohmann::json review_results_to_json(const std::vector<ReviewResult>& results) {
  json j = json::array();
  for (const auto& result : results) {
    j.push_back(review_result_to_json(result));
  }
  return j;
}

}  // namespace fhirgate::governance
