#include "fhirgate/domain/rule.h"

#include "fhirgate/core/normalization.h"
#include "fhirgate/domain/error_codes.h"
#include "fhirgate/path/condition.h"
#include "fhirgate/path/path_expression.h"

#include <regex>

namespace fhirgate::domain {

namespace {

using ValidationResult = core::Result<bool, core::ConfigError>;

ValidationResult reject(const core::ConfigErrorKind kind, const std::string& rule_id,
                        std::string reason) {
  return ValidationResult::err(core::ConfigError{kind, rule_id, std::move(reason)});
}

bool is_scalar(const nlohmann::json& value) {
  return value.is_string() || value.is_number() || value.is_boolean();
}

bool is_resource_type_name(const std::string& name) {
  return path::is_identifier(name) && core::is_ascii_upper(name.front());
}

// One overload per params alternative: a missing overload fails to compile.
struct ParamsValidator {
  const std::string& rule_id;  // NOLINT(readability-identifier-naming)

  ValidationResult operator()(const RequiredParams& /*params*/) const {
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const FixedValueParams& params) const {
    if (params.value.is_null()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id, "params.value is required");
    }
    if (!is_scalar(params.value)) {
      return reject(core::ConfigErrorKind::kInvalidParam, rule_id,
                    "params.value must be a string, number or boolean");
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const AllowedValuesParams& params) const {
    if (params.values.empty()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id,
                    "params.values must list at least one value");
    }
    for (const auto& value : params.values) {
      if (!is_scalar(value)) {
        return reject(core::ConfigErrorKind::kInvalidParam, rule_id,
                      "params.values entries must be strings, numbers or booleans");
      }
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const RegexParams& params) const {
    if (params.pattern.empty()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id, "params.pattern is required");
    }
    try {
      auto flags = std::regex::ECMAScript;
      if (params.case_insensitive) {
        flags |= std::regex::icase;
      }
      const std::regex compiled(params.pattern, flags);
      (void)compiled;
    } catch (const std::regex_error& e) {
      return reject(core::ConfigErrorKind::kInvalidParam, rule_id,
                    "params.pattern does not compile: " + std::string(e.what()));
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const ArrayLengthParams& params) const {
    if (!params.min.has_value() && !params.max.has_value()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id,
                    "ArrayLength needs params.min, params.max or both");
    }
    if (params.min.has_value() && params.max.has_value() && *params.min > *params.max) {
      return reject(core::ConfigErrorKind::kInvalidParam, rule_id,
                    "params.min must not exceed params.max");
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const CodeSystemParams& params) const {
    if (core::trim(params.system).empty()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id, "params.system is required");
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const CustomExpressionParams& params) const {
    auto parsed = path::Condition::parse(params.expression);
    if (!parsed.has_value()) {
      return reject(core::ConfigErrorKind::kMalformedExpression, rule_id,
                    "params.expression: " + parsed.error());
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const ResourceCompositionParams& params) const {
    if (params.requirements.empty()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id,
                    "params.requirements must declare at least one resource type");
    }
    for (const auto& requirement : params.requirements) {
      if (!is_resource_type_name(requirement.resource_type)) {
        return reject(core::ConfigErrorKind::kInvalidParam, rule_id,
                      "requirement resourceType '" + requirement.resource_type + "' is invalid");
      }
      if (requirement.max.has_value() && *requirement.max < requirement.min) {
        return reject(core::ConfigErrorKind::kInvalidParam, rule_id,
                      "requirement for " + requirement.resource_type + " has max < min");
      }
      for (const auto& filter : requirement.filters) {
        auto valid = filter.validate();
        if (!valid.has_value()) {
          return reject(core::ConfigErrorKind::kMalformedScope, rule_id,
                        "requirement filter for " + requirement.resource_type + ": " +
                            valid.error());
        }
      }
    }
    return ValidationResult::ok(true);
  }

  ValidationResult operator()(const QuestionAnswerParams& params) const {
    if (core::trim(params.question_set_id).empty()) {
      return reject(core::ConfigErrorKind::kMissingParam, rule_id,
                    "params.questionSetId is required");
    }
    auto question_path = path::parse_path(params.question_path);
    if (!question_path.has_value()) {
      return reject(core::ConfigErrorKind::kMalformedPath, rule_id,
                    "params.questionPath: " + question_path.error());
    }
    auto answer_path = path::parse_path(params.answer_path);
    if (!answer_path.has_value()) {
      return reject(core::ConfigErrorKind::kMalformedPath, rule_id,
                    "params.answerPath: " + answer_path.error());
    }
    return ValidationResult::ok(true);
  }
};

}  // namespace

std::string filter_op_to_string(const FilterOp op) {
  switch (op) {
    case FilterOp::kEquals:
      return "equals";
    case FilterOp::kNotEquals:
      return "not_equals";
    case FilterOp::kExists:
      return "exists";
    case FilterOp::kNotExists:
      return "not_exists";
  }
  return "equals";
}

std::optional<FilterOp> string_to_filter_op(const std::string& str) {
  if (str == "equals") {
    return FilterOp::kEquals;
  }
  if (str == "not_equals") {
    return FilterOp::kNotEquals;
  }
  if (str == "exists") {
    return FilterOp::kExists;
  }
  if (str == "not_exists") {
    return FilterOp::kNotExists;
  }
  return std::nullopt;
}

core::Result<bool, std::string> ScopeFilter::validate() const {
  using R = core::Result<bool, std::string>;

  auto segments = path::parse_path(field_path);
  if (!segments.has_value()) {
    return R::err("filter path: " + segments.error());
  }
  if ((op == FilterOp::kEquals || op == FilterOp::kNotEquals) && !is_scalar(value)) {
    return R::err("filter '" + filter_op_to_string(op) + "' needs a string, number or boolean value");
  }
  return R::ok(true);
}

std::string scope_stable_key(const InstanceScope& scope) {
  if (std::holds_alternative<AllInstances>(scope)) {
    return "all";
  }
  if (std::holds_alternative<FirstInstance>(scope)) {
    return "first";
  }
  const auto& filter = std::get<FilteredInstances>(scope).filter;
  std::string key = "filter:" + filter.field_path + ":" + filter_op_to_string(filter.op);
  if (!filter.value.is_null()) {
    key += ":" + filter.value.dump();
  }
  return key;
}

std::string Rule::effective_error_code() const {
  if (!error_code.empty()) {
    return error_code;
  }
  if (const auto fixed = fixed_error_code(type())) {
    return std::string(*fixed);
  }
  if (const auto* qa = std::get_if<QuestionAnswerParams>(&params)) {
    return std::string(answer_constraint_error_code(qa->constraint));
  }
  return {};
}

core::Result<bool, core::ConfigError> Rule::validate() const {
  if (core::trim(id).empty()) {
    return reject(core::ConfigErrorKind::kMissingParam, id, "rule id is required");
  }
  if (!is_resource_type_name(resource_type)) {
    return reject(core::ConfigErrorKind::kInvalidParam, id,
                  "resourceType '" + resource_type + "' is not a resource type name");
  }

  if (is_record_scoped()) {
    if (!field_path.empty()) {
      return reject(core::ConfigErrorKind::kInvalidParam, id,
                    "ResourceComposition rules apply to the whole record and take no fieldPath");
    }
  } else {
    auto syntax = path::check_authoring_syntax(field_path);
    if (!syntax.has_value()) {
      return reject(core::ConfigErrorKind::kMalformedPath, id, "fieldPath: " + syntax.error());
    }
  }

  if (const auto* filtered = std::get_if<FilteredInstances>(&scope)) {
    auto valid = filtered->filter.validate();
    if (!valid.has_value()) {
      return reject(core::ConfigErrorKind::kMalformedScope, id, valid.error());
    }
  }

  auto params_valid = std::visit(ParamsValidator{id}, params);
  if (!params_valid.has_value()) {
    return params_valid;
  }

  const RuleType rule_type = type();
  if (rule_type == RuleType::kCustomExpression && error_code.empty()) {
    return reject(core::ConfigErrorKind::kMissingParam, id,
                  "CustomExpression rules must select an errorCode");
  }
  if (!error_code.empty() && !is_governed_error_code(rule_type, error_code)) {
    return reject(core::ConfigErrorKind::kUngovernedErrorCode, id,
                  "errorCode '" + error_code + "' is not allowed for " +
                      rule_type_to_string(rule_type) + " rules");
  }
  if (const auto* qa = std::get_if<QuestionAnswerParams>(&params);
      qa != nullptr && !error_code.empty() &&
      error_code != answer_constraint_error_code(qa->constraint)) {
    return reject(core::ConfigErrorKind::kUngovernedErrorCode, id,
                  "errorCode '" + error_code + "' does not match constraint '" +
                      answer_constraint_to_string(qa->constraint) + "'");
  }

  return ValidationResult::ok(true);
}

}  // namespace fhirgate::domain
