#include "fhirgate/domain/rule_json.h"

#include "fhirgate/path/condition.h"
#include "fhirgate/path/path_expression.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace fhirgate::domain {

namespace {

using nlohmann::json;
using RuleResult = core::Result<Rule, core::ConfigError>;

// FieldReader reads typed members from one JSON object.
// The first type error is kept; later reads return fallbacks.
class FieldReader {
 public:
  FieldReader(const json& object, std::string rule_id, std::string context)
      : object_(object), rule_id_(std::move(rule_id)), context_(std::move(context)) {}

  std::string string(const char* key, std::string fallback = {}) {
    const json* member = find(key);
    if (member == nullptr) {
      return fallback;
    }
    if (!member->is_string()) {
      fail(core::ConfigErrorKind::kInvalidDocument, std::string(key) + " must be a string");
      return fallback;
    }
    return member->get<std::string>();
  }

  std::optional<std::string> optional_string(const char* key) {
    if (find(key) == nullptr) {
      return std::nullopt;
    }
    return string(key);
  }

  bool boolean(const char* key, const bool fallback) {
    const json* member = find(key);
    if (member == nullptr) {
      return fallback;
    }
    if (!member->is_boolean()) {
      fail(core::ConfigErrorKind::kInvalidDocument, std::string(key) + " must be a boolean");
      return fallback;
    }
    return member->get<bool>();
  }

  std::optional<std::size_t> count(const char* key) {
    const json* member = find(key);
    if (member == nullptr) {
      return std::nullopt;
    }
    if (!member->is_number_integer() || member->get<std::int64_t>() < 0) {
      fail(core::ConfigErrorKind::kInvalidParam,
           std::string(key) + " must be a non-negative integer");
      return std::nullopt;
    }
    return member->get<std::size_t>();
  }

  // Returns the member (any JSON kind) or null when absent.
  json any(const char* key) const {
    const json* member = find(key);
    return member == nullptr ? json() : *member;
  }

  // Returns the array member, or nullptr when absent; a non-array member fails.
  const json* array(const char* key) {
    const json* member = find(key);
    if (member == nullptr) {
      return nullptr;
    }
    if (!member->is_array()) {
      fail(core::ConfigErrorKind::kInvalidDocument, std::string(key) + " must be an array");
      return nullptr;
    }
    return member;
  }

  void fail(const core::ConfigErrorKind kind, const std::string& reason) {
    if (!error_.has_value()) {
      error_ = core::ConfigError{kind, rule_id_, context_.empty() ? reason : context_ + "." + reason};
    }
  }

  [[nodiscard]] bool failed() const { return error_.has_value(); }
  [[nodiscard]] const core::ConfigError& error() const { return error_.value(); }

 private:
  const json* find(const char* key) const {
    const auto it = object_.find(key);
    if (it == object_.end() || it->is_null()) {
      return nullptr;
    }
    return &*it;
  }

  const json& object_;
  std::string rule_id_;
  std::string context_;
  std::optional<core::ConfigError> error_;
};

core::Result<ScopeFilter, core::ConfigError> parse_filter(const json& j, const std::string& rule_id,
                                                          const std::string& context) {
  using R = core::Result<ScopeFilter, core::ConfigError>;
  if (!j.is_object()) {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id, context + " must be an object"});
  }
  FieldReader reader(j, rule_id, context);
  ScopeFilter filter;
  filter.field_path = reader.string("fieldPath");
  const std::string op_text = reader.string("op", "equals");
  filter.value = reader.any("value");
  if (reader.failed()) {
    return R::err(reader.error());
  }
  const auto op = string_to_filter_op(op_text);
  if (!op.has_value()) {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                   context + ".op '" + op_text + "' is not a filter operator"});
  }
  filter.op = op.value();
  return R::ok(std::move(filter));
}

// A scope condition is a single predicate: "path = literal", "path != literal",
// "path.exists()" or "path.empty()".
core::Result<ScopeFilter, core::ConfigError> filter_from_condition(const std::string& text,
                                                                   const std::string& rule_id) {
  using R = core::Result<ScopeFilter, core::ConfigError>;
  auto parsed = path::Condition::parse(text);
  if (!parsed.has_value()) {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                   "instanceScope.condition: " + parsed.error()});
  }
  const auto& root = parsed.value().root();
  if (root.kind != path::ConditionNode::Kind::kPredicate) {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                   "instanceScope.condition must be a single predicate"});
  }

  const auto& predicate = root.predicate;
  ScopeFilter filter;
  filter.field_path = path::format_path(predicate.path);
  switch (predicate.kind) {
    case path::PredicateKind::kExists:
      filter.op = FilterOp::kExists;
      return R::ok(std::move(filter));
    case path::PredicateKind::kEmpty:
      filter.op = FilterOp::kNotExists;
      return R::ok(std::move(filter));
    case path::PredicateKind::kValueCompare:
      if (predicate.op == path::CompareOp::kEqual || predicate.op == path::CompareOp::kNotEqual) {
        filter.op =
            predicate.op == path::CompareOp::kEqual ? FilterOp::kEquals : FilterOp::kNotEquals;
        filter.value = predicate.literal;
        return R::ok(std::move(filter));
      }
      break;
    case path::PredicateKind::kTruthy:
    case path::PredicateKind::kCountCompare:
      break;
  }
  return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                 "instanceScope.condition '" + text + "' is not a supported filter predicate"});
}

core::Result<InstanceScope, core::ConfigError> parse_scope(const json& j,
                                                           const std::string& rule_id) {
  using R = core::Result<InstanceScope, core::ConfigError>;
  if (j.is_null()) {
    return R::ok(AllInstances{});
  }
  if (!j.is_object()) {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                   "instanceScope must be an object"});
  }

  FieldReader reader(j, rule_id, "instanceScope");
  const std::string kind = reader.string("kind", "all");
  const auto condition = reader.optional_string("condition");
  if (reader.failed()) {
    return R::err(reader.error());
  }

  if (kind == "all") {
    return R::ok(AllInstances{});
  }
  if (kind == "first") {
    return R::ok(FirstInstance{});
  }
  if (kind != "filter") {
    return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                   "instanceScope.kind '" + kind + "' is not all, first or filter"});
  }

  if (j.contains("filter") && !j.at("filter").is_null()) {
    auto filter = parse_filter(j.at("filter"), rule_id, "instanceScope.filter");
    if (!filter.has_value()) {
      return R::err(filter.error());
    }
    return R::ok(FilteredInstances{filter.take_value()});
  }
  if (condition.has_value()) {
    auto filter = filter_from_condition(condition.value(), rule_id);
    if (!filter.has_value()) {
      return R::err(filter.error());
    }
    return R::ok(FilteredInstances{filter.take_value()});
  }
  return R::err({core::ConfigErrorKind::kMalformedScope, rule_id,
                 "instanceScope of kind filter needs a filter or a condition"});
}

core::Result<RuleParams, core::ConfigError> parse_params(const RuleType type, const json& j,
                                                         const std::string& rule_id) {
  using R = core::Result<RuleParams, core::ConfigError>;
  FieldReader reader(j, rule_id, "params");
  RuleParams params;

  switch (type) {
    case RuleType::kRequired:
      params = RequiredParams{};
      break;
    case RuleType::kFixedValue:
      params = FixedValueParams{reader.any("value")};
      break;
    case RuleType::kAllowedValues: {
      AllowedValuesParams allowed;
      if (const json* values = reader.array("values")) {
        allowed.values.assign(values->begin(), values->end());
      }
      params = std::move(allowed);
      break;
    }
    case RuleType::kRegex: {
      RegexParams regex;
      regex.pattern = reader.string("pattern");
      regex.negate = reader.boolean("negate", false);
      regex.case_insensitive = reader.boolean("caseInsensitive", false);
      params = std::move(regex);
      break;
    }
    case RuleType::kArrayLength: {
      ArrayLengthParams length;
      length.min = reader.count("min");
      length.max = reader.count("max");
      params = length;
      break;
    }
    case RuleType::kCodeSystem: {
      CodeSystemParams code_system;
      code_system.system = reader.string("system");
      if (const json* codes = reader.array("codes")) {
        for (const auto& code : *codes) {
          if (!code.is_string()) {
            reader.fail(core::ConfigErrorKind::kInvalidParam, "codes entries must be strings");
            break;
          }
          code_system.codes.push_back(code.get<std::string>());
        }
      }
      params = std::move(code_system);
      break;
    }
    case RuleType::kCustomExpression:
      params = CustomExpressionParams{reader.string("expression")};
      break;
    case RuleType::kResourceComposition: {
      ResourceCompositionParams composition;
      composition.reject_undeclared = reader.boolean("rejectUndeclared", false);
      if (const json* requirements = reader.array("requirements")) {
        for (const auto& requirement_json : *requirements) {
          if (!requirement_json.is_object()) {
            reader.fail(core::ConfigErrorKind::kInvalidDocument,
                        "requirements entries must be objects");
            break;
          }
          FieldReader requirement_reader(requirement_json, rule_id, "params.requirements");
          ResourceRequirement requirement;
          requirement.resource_type = requirement_reader.string("resourceType");
          requirement.min = requirement_reader.count("min").value_or(0);
          requirement.max = requirement_reader.count("max");
          if (const json* filters = requirement_reader.array("filters")) {
            for (const auto& filter_json : *filters) {
              auto filter = parse_filter(filter_json, rule_id, "params.requirements.filters");
              if (!filter.has_value()) {
                return R::err(filter.error());
              }
              requirement.filters.push_back(filter.take_value());
            }
          }
          if (requirement_reader.failed()) {
            return R::err(requirement_reader.error());
          }
          composition.requirements.push_back(std::move(requirement));
        }
      }
      params = std::move(composition);
      break;
    }
    case RuleType::kQuestionAnswer: {
      QuestionAnswerParams qa;
      qa.question_set_id = reader.string("questionSetId");
      qa.question_path = reader.string("questionPath");
      qa.answer_path = reader.string("answerPath");
      const std::string constraint_text = reader.string("constraint", "required");
      const auto constraint = string_to_answer_constraint(constraint_text);
      if (!constraint.has_value()) {
        reader.fail(core::ConfigErrorKind::kInvalidParam,
                    "constraint '" + constraint_text + "' is not a known answer constraint");
      } else {
        qa.constraint = constraint.value();
      }
      params = std::move(qa);
      break;
    }
  }

  if (reader.failed()) {
    return R::err(reader.error());
  }
  return R::ok(std::move(params));
}

// parse_rule reads the authoring format without checking rule invariants.
// An omitted error code is filled from the fixed or constraint table.
RuleResult parse_rule(const json& j) {
  if (!j.is_object()) {
    return RuleResult::err(
        {core::ConfigErrorKind::kInvalidDocument, "", "rule must be a JSON object"});
  }

  Rule rule;
  FieldReader id_reader(j, "", "");
  rule.id = id_reader.string("id");
  if (id_reader.failed()) {
    return RuleResult::err(id_reader.error());
  }

  FieldReader reader(j, rule.id, "");
  const std::string type_text = reader.string("type");
  rule.resource_type = reader.string("resourceType");
  rule.field_path = reader.string("fieldPath");
  const std::string severity_text = reader.string("severity", "error");
  rule.error_code = reader.string("errorCode");
  rule.hint = reader.optional_string("userHint");
  rule.enabled = reader.boolean("enabled", true);
  if (reader.failed()) {
    return RuleResult::err(reader.error());
  }

  const auto type = string_to_rule_type(type_text);
  if (!type.has_value()) {
    return RuleResult::err({core::ConfigErrorKind::kInvalidParam, rule.id,
                            "type '" + type_text + "' is not a known rule type"});
  }
  const auto severity = string_to_severity(severity_text);
  if (!severity.has_value()) {
    return RuleResult::err({core::ConfigErrorKind::kInvalidParam, rule.id,
                            "severity '" + severity_text + "' is not error, warning or information"});
  }
  rule.severity = severity.value();

  auto scope = parse_scope(j.contains("instanceScope") ? j.at("instanceScope") : json(), rule.id);
  if (!scope.has_value()) {
    return RuleResult::err(scope.error());
  }
  rule.scope = scope.take_value();

  const json params_json =
      j.contains("params") && j.at("params").is_object() ? j.at("params") : json::object();
  auto params = parse_params(type.value(), params_json, rule.id);
  if (!params.has_value()) {
    return RuleResult::err(params.error());
  }
  rule.params = params.take_value();

  if (rule.error_code.empty()) {
    rule.error_code = rule.effective_error_code();
  }
  return RuleResult::ok(std::move(rule));
}

json filter_to_json(const ScopeFilter& filter) {
  return {{"fieldPath", filter.field_path},
          {"op", filter_op_to_string(filter.op)},
          {"value", filter.value}};
}

json scope_to_json(const InstanceScope& scope) {
  if (std::holds_alternative<AllInstances>(scope)) {
    return {{"kind", "all"}};
  }
  if (std::holds_alternative<FirstInstance>(scope)) {
    return {{"kind", "first"}};
  }
  return {{"kind", "filter"}, {"filter", filter_to_json(std::get<FilteredInstances>(scope).filter)}};
}

struct ParamsToJson {
  json operator()(const RequiredParams& /*params*/) const { return json::object(); }
  json operator()(const FixedValueParams& params) const { return {{"value", params.value}}; }
  json operator()(const AllowedValuesParams& params) const {
    return {{"values", params.values}};
  }
  json operator()(const RegexParams& params) const {
    return {{"pattern", params.pattern},
            {"negate", params.negate},
            {"caseInsensitive", params.case_insensitive}};
  }
  json operator()(const ArrayLengthParams& params) const {
    json j = json::object();
    if (params.min.has_value()) {
      j["min"] = params.min.value();
    }
    if (params.max.has_value()) {
      j["max"] = params.max.value();
    }
    return j;
  }
  json operator()(const CodeSystemParams& params) const {
    return {{"system", params.system}, {"codes", params.codes}};
  }
  json operator()(const CustomExpressionParams& params) const {
    return {{"expression", params.expression}};
  }
  json operator()(const ResourceCompositionParams& params) const {
    json requirements = json::array();
    for (const auto& requirement : params.requirements) {
      json r;
      r["resourceType"] = requirement.resource_type;
      r["min"] = requirement.min;
      if (requirement.max.has_value()) {
        r["max"] = requirement.max.value();
      }
      json filters = json::array();
      for (const auto& filter : requirement.filters) {
        filters.push_back(filter_to_json(filter));
      }
      r["filters"] = filters;
      requirements.push_back(r);
    }
    return {{"requirements", requirements}, {"rejectUndeclared", params.reject_undeclared}};
  }
  json operator()(const QuestionAnswerParams& params) const {
    return {{"questionSetId", params.question_set_id},
            {"questionPath", params.question_path},
            {"answerPath", params.answer_path},
            {"constraint", answer_constraint_to_string(params.constraint)}};
  }
};

core::Result<RuleSet, core::ConfigError> parse_rule_set(const json& j, const bool checked) {
  using R = core::Result<RuleSet, core::ConfigError>;
  RuleSet rule_set;
  const json* rules = nullptr;

  if (j.is_array()) {
    rules = &j;
  } else if (j.is_object()) {
    FieldReader reader(j, "", "");
    rule_set.version = reader.string("version", rule_set.version);
    rule_set.project = reader.string("project");
    rule_set.fhir_version = reader.string("fhirVersion", rule_set.fhir_version);
    rules = reader.array("rules");
    if (reader.failed()) {
      return R::err(reader.error());
    }
  } else {
    return R::err({core::ConfigErrorKind::kInvalidDocument, "",
                   "rule set must be an object or an array of rules"});
  }

  if (rules == nullptr) {
    return R::ok(std::move(rule_set));
  }
  for (const auto& rule_json : *rules) {
    auto rule = checked ? rule_from_json(rule_json) : parse_rule(rule_json);
    if (!rule.has_value()) {
      return R::err(rule.error());
    }
    rule_set.rules.push_back(rule.take_value());
  }
  return R::ok(std::move(rule_set));
}

}  // namespace

core::Result<Rule, core::ConfigError> rule_from_json(const nlohmann::json& j) {
  auto parsed = parse_rule(j);
  if (!parsed.has_value()) {
    return parsed;
  }
  auto valid = parsed.value().validate();
  if (!valid.has_value()) {
    return RuleResult::err(valid.error());
  }
  return parsed;
}

nlohmann::json rule_to_json(const Rule& rule) {
  json j;
  j["id"] = rule.id;
  j["type"] = rule_type_to_string(rule.type());
  j["resourceType"] = rule.resource_type;
  j["instanceScope"] = scope_to_json(rule.scope);
  j["fieldPath"] = rule.field_path;
  j["severity"] = severity_to_string(rule.severity);
  j["errorCode"] = rule.error_code;
  if (rule.hint.has_value()) {
    j["userHint"] = rule.hint.value();
  }
  j["enabled"] = rule.enabled;
  j["params"] = std::visit(ParamsToJson{}, rule.params);
  return j;
}

core::Result<RuleSet, core::ConfigError> rule_set_from_json(const nlohmann::json& j) {
  return parse_rule_set(j, true);
}

nlohmann::json rule_set_to_json(const RuleSet& rule_set) {
  json rules = json::array();
  for (const auto& rule : rule_set.rules) {
    rules.push_back(rule_to_json(rule));
  }
  return {{"version", rule_set.version},
          {"project", rule_set.project},
          {"fhirVersion", rule_set.fhir_version},
          {"rules", rules}};
}

core::Result<RuleSet, core::ConfigError> rule_set_from_json_unchecked(const nlohmann::json& j) {
  return parse_rule_set(j, false);
}

}  // namespace fhirgate::domain
