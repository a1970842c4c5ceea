#include "fhirgate/evaluation/rule_evaluator.h"

#include "fhirgate/evaluation/question_answer_evaluator.h"
#include "fhirgate/evaluation/resource_composition_evaluator.h"
#include "fhirgate/path/condition.h"
#include "fhirgate/path/json_navigator.h"
#include "fhirgate/path/path_expression.h"
#include "fhirgate/path/path_normalizer.h"

#include <algorithm>
#include <optional>
#include <regex>
#include <utility>

namespace fhirgate::evaluation {

namespace {

using nlohmann::json;

std::string qualified_path(const std::string& resource_type, const std::string& relative_path) {
  return relative_path.empty() ? resource_type : resource_type + "." + relative_path;
}

// Text form of a value for pattern and display purposes.
std::string value_text(const json& value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string string_member(const json& object, const char* key) {
  const auto it = object.find(key);
  return it != object.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

// Codings reachable from a selected node: a CodeableConcept contributes its coding
// elements, a Coding itself.
std::vector<path::SelectedNode> collect_codings(const std::vector<path::SelectedNode>& nodes) {
  std::vector<path::SelectedNode> codings;
  for (const auto& selected : nodes) {
    const json& node = *selected.node;
    if (!node.is_object()) {
      continue;
    }
    const auto coding = node.find("coding");
    if (coding != node.end() && coding->is_array()) {
      for (std::size_t i = 0; i < coding->size(); ++i) {
        if ((*coding)[i].is_object()) {
          codings.push_back({&(*coding)[i], selected.path + ".coding[" + std::to_string(i) + "]"});
        }
      }
    } else if (node.contains("system") || node.contains("code")) {
      codings.push_back(selected);
    }
  }
  return codings;
}

// One overload per params alternative: a missing overload fails to compile.
class LocationEvaluator {
 public:
  LocationEvaluator(const domain::Rule& rule, const scope::Location& location,
                    const std::vector<path::PathSegment>& segments, std::string relative_path,
                    const domain::QuestionSetCatalog& question_sets)
      : rule_(rule),
        location_(location),
        segments_(segments),
        relative_path_(std::move(relative_path)),
        question_sets_(question_sets) {}

  FindingsResult operator()(const domain::RequiredParams& /*params*/) const {
    for (const auto& node : select()) {
      if (!path::is_empty_value(*node.node)) {
        return pass();
      }
    }
    return fail(relative_path_, qualified() + " is required", json::object());
  }

  FindingsResult operator()(const domain::FixedValueParams& params) const {
    for (const auto& node : select()) {
      if (!path::values_equal(*node.node, params.value)) {
        return fail(node.path, qualified() + " must equal " + params.value.dump(),
                    {{"expected", params.value}, {"actual", *node.node}});
      }
    }
    return pass();
  }

  FindingsResult operator()(const domain::AllowedValuesParams& params) const {
    for (const auto& node : select()) {
      if (path::is_empty_value(*node.node)) {
        continue;
      }
      bool allowed = false;
      for (const auto& value : params.values) {
        if (path::values_equal(*node.node, value)) {
          allowed = true;
          break;
        }
      }
      if (!allowed) {
        return fail(node.path, qualified() + " has a value outside the allowed set",
                    {{"allowed", params.values}, {"actual", *node.node}});
      }
    }
    return pass();
  }

  FindingsResult operator()(const domain::RegexParams& params) const {
    auto flags = std::regex::ECMAScript;
    if (params.case_insensitive) {
      flags |= std::regex::icase;
    }
    std::regex pattern;
    try {
      pattern = std::regex(params.pattern, flags);
    } catch (const std::regex_error& e) {
      return FindingsResult::err({core::ConfigErrorKind::kInvalidParam, rule_.id,
                                  "params.pattern does not compile: " + std::string(e.what())});
    }

    for (const auto& node : select()) {
      if (path::is_empty_value(*node.node) || node.node->is_object() || node.node->is_array()) {
        continue;
      }
      const std::string text = value_text(*node.node);
      const bool matched = std::regex_search(text, pattern);
      if (matched == params.negate) {
        const std::string expectation = params.negate ? " must not match " : " must match ";
        return fail(node.path, qualified() + expectation + params.pattern,
                    {{"pattern", params.pattern}, {"negate", params.negate}, {"actual", text}});
      }
    }
    return pass();
  }

  // Cardinality is checked per parent node: "address.line" counts the lines of each
  // address. Parents that are absent are not checked.
  FindingsResult operator()(const domain::ArrayLengthParams& params) const {
    if (segments_.empty()) {
      return pass();
    }
    const std::vector<path::PathSegment> parent_segments(segments_.begin(), segments_.end() - 1);
    path::PathSegment leaf = segments_.back();
    if (leaf.marker == path::SegmentMarker::kWildcard) {
      leaf.marker = path::SegmentMarker::kNone;
    }
    const std::vector<path::PathSegment> leaf_segments{leaf};
    const std::string leaf_text = path::format_path(leaf_segments);

    std::vector<domain::Finding> findings;
    for (const auto& parent : path::select_nodes(*location_.resource, parent_segments)) {
      if (!parent.node->is_object()) {
        continue;
      }
      const std::size_t count = path::select_nodes(*parent.node, leaf_segments, parent.path).size();
      const std::string concrete = parent.path.empty() ? leaf_text : parent.path + "." + leaf_text;
      if (auto finding = length_violation(params, count, concrete)) {
        findings.push_back(std::move(*finding));
      }
    }
    return FindingsResult::ok(std::move(findings));
  }

  FindingsResult operator()(const domain::CodeSystemParams& params) const {
    for (const auto& coding : collect_codings(select())) {
      const std::string system = string_member(*coding.node, "system");
      const std::string code = string_member(*coding.node, "code");
      if (system != params.system) {
        return fail(coding.path, qualified() + " must use code system " + params.system,
                    {{"violation", "system"},
                     {"expectedSystem", params.system},
                     {"actualSystem", system},
                     {"actualCode", code}});
      }
      if (!params.codes.empty() &&
          std::find(params.codes.begin(), params.codes.end(), code) == params.codes.end()) {
        return fail(coding.path, qualified() + " has code '" + code + "' outside the allowed codes",
                    {{"violation", "code"},
                     {"expectedSystem", params.system},
                     {"actualSystem", system},
                     {"actualCode", code},
                     {"allowedCodes", params.codes}});
      }
    }
    return pass();
  }

  FindingsResult operator()(const domain::CustomExpressionParams& params) const {
    auto condition = path::Condition::parse(params.expression);
    if (!condition.has_value()) {
      return FindingsResult::err(
          {core::ConfigErrorKind::kMalformedExpression, rule_.id, condition.error()});
    }

    // Paths in the expression are relative to the resource; the field path only
    // addresses the finding.
    if (!condition.value().evaluate(*location_.resource)) {
      return fail(relative_path_, "condition not satisfied: " + params.expression,
                  {{"expression", params.expression}});
    }
    return pass();
  }

  FindingsResult operator()(const domain::ResourceCompositionParams& /*params*/) const {
    return pass();
  }

  FindingsResult operator()(const domain::QuestionAnswerParams& params) const {
    return evaluate_question_answer(rule_, params, location_, segments_, question_sets_);
  }

 private:
  [[nodiscard]] std::vector<path::SelectedNode> select() const {
    if (segments_.empty()) {
      return {};
    }
    return path::select_nodes(*location_.resource, segments_);
  }

  [[nodiscard]] std::string qualified() const {
    return qualified_path(location_.resource_type, relative_path_);
  }

  [[nodiscard]] std::optional<domain::Finding> length_violation(
      const domain::ArrayLengthParams& params, const std::size_t count,
      const std::string& concrete_path) const {
    json details = {{"actual", count}};
    if (params.min.has_value()) {
      details["min"] = params.min.value();
    }
    if (params.max.has_value()) {
      details["max"] = params.max.value();
    }

    std::string expectation;
    if (params.min.has_value() && count < params.min.value()) {
      details["violation"] = "min";
      expectation = "at least " + std::to_string(params.min.value());
    } else if (params.max.has_value() && count > params.max.value()) {
      details["violation"] = "max";
      expectation = "at most " + std::to_string(params.max.value());
    } else {
      return std::nullopt;
    }
    return make_rule_finding(rule_, location_, concrete_path,
                             qualified_path(location_.resource_type, concrete_path) + " has " +
                                 std::to_string(count) + " elements, expected " + expectation,
                             std::move(details));
  }

  static FindingsResult pass() { return FindingsResult::ok({}); }

  [[nodiscard]] FindingsResult fail(const std::string& concrete_path, std::string message,
                                    json details) const {
    return FindingsResult::ok(
        {make_rule_finding(rule_, location_, concrete_path, std::move(message), std::move(details))});
  }

  const domain::Rule& rule_;
  const scope::Location& location_;
  const std::vector<path::PathSegment>& segments_;
  std::string relative_path_;
  const domain::QuestionSetCatalog& question_sets_;
};

}  // namespace

domain::Finding make_rule_finding(const domain::Rule& rule, const scope::Location& location,
                                  const std::string& relative_path, std::string message,
                                  nlohmann::json details) {
  domain::Finding finding;
  finding.source = domain::FindingSource::kBusiness;
  finding.severity = rule.severity;
  finding.code = rule.effective_error_code();
  finding.path = qualified_path(location.resource_type, relative_path);
  finding.message = std::move(message);
  finding.rule_id = rule.id;
  finding.entry_index = location.entry_index;
  finding.details = std::move(details);
  if (rule.hint.has_value()) {
    finding.details["userHint"] = rule.hint.value();
  }
  return finding;
}

core::Result<bool, core::ConfigError> check_evaluable_path(const domain::Rule& rule) {
  using R = core::Result<bool, core::ConfigError>;
  if (rule.field_path.empty() || path::is_canonical_path(rule.field_path)) {
    return R::ok(true);
  }
  return R::err({core::ConfigErrorKind::kMalformedPath, rule.id,
                 "fieldPath: '" + rule.field_path +
                     "' filters, indexes or applies a function; use an instance scope instead"});
}

FindingsResult evaluate_at_location(const domain::Rule& rule, const scope::Location& location,
                                    const domain::QuestionSetCatalog& question_sets) {
  auto evaluable = check_evaluable_path(rule);
  if (!evaluable.has_value()) {
    return FindingsResult::err(evaluable.error());
  }

  const std::string relative_path = path::normalize_path(rule.field_path, rule.resource_type);

  std::vector<path::PathSegment> segments;
  if (!relative_path.empty()) {
    auto parsed = path::parse_path(relative_path);
    if (!parsed.has_value()) {
      return FindingsResult::err(
          {core::ConfigErrorKind::kMalformedPath, rule.id, "fieldPath: " + parsed.error()});
    }
    segments = parsed.take_value();
  }

  return std::visit(LocationEvaluator{rule, location, segments, relative_path, question_sets},
                    rule.params);
}

FindingsResult evaluate_rule(const domain::Rule& rule, const EvaluationInput& input) {
  if (!rule.enabled) {
    return FindingsResult::ok({});
  }

  if (const auto* composition = std::get_if<domain::ResourceCompositionParams>(&rule.params)) {
    return FindingsResult::ok(evaluate_resource_composition(rule, *composition, input.instances));
  }

  const auto candidates = scope::instances_of_type(input.instances, rule.resource_type);
  auto locations = scope::resolve_scope(rule.scope, candidates, rule.id);
  if (!locations.has_value()) {
    return FindingsResult::err(locations.error());
  }

  std::vector<domain::Finding> findings;
  for (const auto& location : locations.value()) {
    auto at_location = evaluate_at_location(rule, location, input.question_sets);
    if (!at_location.has_value()) {
      return at_location;
    }
    for (auto& finding : at_location.take_value()) {
      findings.push_back(std::move(finding));
    }
  }
  return FindingsResult::ok(std::move(findings));
}

FindingsResult evaluate_rule_set(const nlohmann::json& record,
                                 const std::vector<domain::Rule>& rules,
                                 const domain::QuestionSetCatalog& question_sets) {
  for (const auto& rule : rules) {
    if (!rule.enabled) {
      continue;
    }
    auto valid = rule.validate();
    if (!valid.has_value()) {
      return FindingsResult::err(valid.error());
    }
    auto evaluable = check_evaluable_path(rule);
    if (!evaluable.has_value()) {
      return FindingsResult::err(evaluable.error());
    }
  }

  const auto instances = scope::collect_resource_instances(record);
  const EvaluationInput input{instances, question_sets};

  std::vector<domain::Finding> findings;
  for (const auto& rule : rules) {
    auto rule_findings = evaluate_rule(rule, input);
    if (!rule_findings.has_value()) {
      return rule_findings;
    }
    for (auto& finding : rule_findings.take_value()) {
      findings.push_back(std::move(finding));
    }
  }
  return FindingsResult::ok(std::move(findings));
}

}  // namespace fhirgate::evaluation
