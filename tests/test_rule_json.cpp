#include "fhirgate/domain/error_codes.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/domain/rule_json.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <variant>

using namespace fhirgate;
using nlohmann::json;

TEST_CASE("rule_from_json applies defaults and the fixed error code", "[rule_json]") {
  const json j = {{"id", "r1"},
                  {"type", "Required"},
                  {"resourceType", "Patient"},
                  {"fieldPath", "birthDate"}};
  auto parsed = domain::rule_from_json(j);
  REQUIRE(parsed.has_value());
  const auto& rule = parsed.value();
  CHECK(rule.type() == domain::RuleType::kRequired);
  CHECK(std::holds_alternative<domain::AllInstances>(rule.scope));
  CHECK(rule.severity == domain::Severity::kError);
  CHECK(rule.enabled);
  CHECK(rule.error_code == "FIELD_REQUIRED");
  CHECK_FALSE(rule.hint.has_value());
}

TEST_CASE("rule_from_json reads typed params", "[rule_json]") {
  SECTION("Regex") {
    const json j = {{"id", "r"},
                    {"type", "Regex"},
                    {"resourceType", "Patient"},
                    {"fieldPath", "identifier.value"},
                    {"params", {{"pattern", "^[0-9]+$"}, {"caseInsensitive", true}}}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE(parsed.has_value());
    const auto& params = std::get<domain::RegexParams>(parsed.value().params);
    CHECK(params.pattern == "^[0-9]+$");
    CHECK(params.case_insensitive);
    CHECK_FALSE(params.negate);
  }

  SECTION("ResourceComposition") {
    const json j = {{"id", "comp"},
                    {"type", "ResourceComposition"},
                    {"resourceType", "Bundle"},
                    {"params",
                     {{"rejectUndeclared", true},
                      {"requirements",
                       {{{"resourceType", "Patient"}, {"min", 1}, {"max", 1}},
                        {{"resourceType", "Observation"},
                         {"filters", {{{"fieldPath", "status"}, {"op", "equals"}, {"value", "final"}}}}}}}}}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().is_record_scoped());
    CHECK(parsed.value().error_code == "RESOURCE_REQUIREMENT_VIOLATION");
    const auto& params = std::get<domain::ResourceCompositionParams>(parsed.value().params);
    REQUIRE(params.requirements.size() == 2);
    CHECK(params.reject_undeclared);
    CHECK(params.requirements[0].max == 1U);
    CHECK(params.requirements[1].min == 0U);
    REQUIRE(params.requirements[1].filters.size() == 1);
    CHECK(params.requirements[1].filters[0].op == domain::FilterOp::kEquals);
  }

  SECTION("QuestionAnswer fills the constraint code") {
    const json j = {{"id", "qa"},
                    {"type", "QuestionAnswer"},
                    {"resourceType", "Observation"},
                    {"fieldPath", "component"},
                    {"params",
                     {{"questionSetId", "vitals"},
                      {"questionPath", "code"},
                      {"answerPath", "value[x]"},
                      {"constraint", "range"}}}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().error_code == "ANSWER_OUT_OF_RANGE");
  }
}

TEST_CASE("rule_from_json reads instance scopes", "[rule_json][scope]") {
  json j = {{"id", "r"}, {"type", "Required"}, {"resourceType", "Observation"}, {"fieldPath", "code"}};

  SECTION("first") {
    j["instanceScope"] = {{"kind", "first"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE(parsed.has_value());
    CHECK(std::holds_alternative<domain::FirstInstance>(parsed.value().scope));
  }

  SECTION("structured filter") {
    j["instanceScope"] = {{"kind", "filter"},
                          {"filter", {{"fieldPath", "status"}, {"op", "not_equals"}, {"value", "final"}}}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE(parsed.has_value());
    const auto& filter = std::get<domain::FilteredInstances>(parsed.value().scope).filter;
    CHECK(filter.field_path == "status");
    CHECK(filter.op == domain::FilterOp::kNotEquals);
    CHECK(filter.value == "final");
  }

  SECTION("condition with a single predicate") {
    j["instanceScope"] = {{"kind", "filter"}, {"condition", "category.exists()"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE(parsed.has_value());
    const auto& filter = std::get<domain::FilteredInstances>(parsed.value().scope).filter;
    CHECK(filter.field_path == "category");
    CHECK(filter.op == domain::FilterOp::kExists);
  }

  SECTION("compound condition is rejected") {
    j["instanceScope"] = {{"kind", "filter"}, {"condition", "status = 'final' and code.exists()"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMalformedScope);
    CHECK(parsed.error().rule_id == "r");
  }

  SECTION("unknown kind is rejected") {
    j["instanceScope"] = {{"kind", "some"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMalformedScope);
  }

  SECTION("filter kind without a filter is rejected") {
    j["instanceScope"] = {{"kind", "filter"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMalformedScope);
  }
}

TEST_CASE("rule_from_json rejects invalid rules", "[rule_json]") {
  const json base = {{"id", "bad"}, {"resourceType", "Patient"}, {"fieldPath", "gender"}};

  SECTION("unknown type") {
    json j = base;
    j["type"] = "Mystery";
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kInvalidParam);
  }

  SECTION("missing FixedValue value") {
    json j = base;
    j["type"] = "FixedValue";
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMissingParam);
  }

  SECTION("ArrayLength without bounds") {
    json j = base;
    j["type"] = "ArrayLength";
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMissingParam);
  }

  SECTION("ArrayLength min above max") {
    json j = base;
    j["type"] = "ArrayLength";
    j["params"] = {{"min", 3}, {"max", 1}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kInvalidParam);
  }

  SECTION("Regex that does not compile") {
    json j = base;
    j["type"] = "Regex";
    j["params"] = {{"pattern", "([a-z"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kInvalidParam);
  }

  SECTION("CustomExpression without an error code") {
    json j = base;
    j["type"] = "CustomExpression";
    j["params"] = {{"expression", "gender.exists()"}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMissingParam);
  }

  SECTION("CustomExpression with a malformed expression") {
    json j = base;
    j["type"] = "CustomExpression";
    j["errorCode"] = "CONDITION_NOT_MET";
    j["params"] = {{"expression", "gender = "}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMalformedExpression);
  }

  SECTION("error code outside the type's vocabulary") {
    json j = base;
    j["type"] = "Required";
    j["errorCode"] = "VALUE_NOT_ALLOWED";
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kUngovernedErrorCode);
  }

  SECTION("malformed field path") {
    json j = base;
    j["type"] = "Required";
    j["fieldPath"] = "name..family";
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kMalformedPath);
  }

  SECTION("ResourceComposition with a field path") {
    json j = base;
    j["type"] = "ResourceComposition";
    j["params"] = {{"requirements", {{{"resourceType", "Patient"}, {"min", 1}}}}};
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kInvalidParam);
  }

  SECTION("wrong member type") {
    json j = base;
    j["type"] = "Required";
    j["enabled"] = "yes";
    auto parsed = domain::rule_from_json(j);
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().kind == core::ConfigErrorKind::kInvalidDocument);
  }
}

TEST_CASE("CustomExpression accepts a code from its vocabulary", "[rule_json]") {
  const json j = {{"id", "ce"},
                  {"type", "CustomExpression"},
                  {"resourceType", "Patient"},
                  {"fieldPath", "gender"},
                  {"errorCode", "CONDITION_NOT_MET"},
                  {"params", {{"expression", "gender.exists() or active"}}}};
  auto parsed = domain::rule_from_json(j);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().effective_error_code() == "CONDITION_NOT_MET");
}

TEST_CASE("rule_to_json output parses back to the same rule", "[rule_json]") {
  const json j = {{"id", "fv"},
                  {"type", "FixedValue"},
                  {"resourceType", "Patient"},
                  {"instanceScope", {{"kind", "first"}}},
                  {"fieldPath", "gender"},
                  {"severity", "warning"},
                  {"userHint", "Use the administrative gender"},
                  {"params", {{"value", "male"}}}};
  auto parsed = domain::rule_from_json(j);
  REQUIRE(parsed.has_value());

  const json written = domain::rule_to_json(parsed.value());
  CHECK(written["instanceScope"]["kind"] == "first");
  CHECK(written["errorCode"] == "FIXED_VALUE_MISMATCH");
  CHECK(written["userHint"] == "Use the administrative gender");

  auto reparsed = domain::rule_from_json(written);
  REQUIRE(reparsed.has_value());
  CHECK(domain::rule_to_json(reparsed.value()) == written);
}

TEST_CASE("rule_set_from_json accepts an object or a bare array", "[rule_json]") {
  const json rule = {{"id", "r1"}, {"type", "Required"}, {"resourceType", "Patient"}, {"fieldPath", "gender"}};

  auto from_object = domain::rule_set_from_json(
      {{"version", "2.0"}, {"project", "p1"}, {"fhirVersion", "R4"}, {"rules", {rule}}});
  REQUIRE(from_object.has_value());
  CHECK(from_object.value().version == "2.0");
  CHECK(from_object.value().project == "p1");
  CHECK(from_object.value().rules.size() == 1);

  auto from_array = domain::rule_set_from_json(json::array({rule}));
  REQUIRE(from_array.has_value());
  CHECK(from_array.value().rules.size() == 1);

  CHECK_FALSE(domain::rule_set_from_json(json("rules")).has_value());
}

TEST_CASE("unchecked rule set parse keeps rules that fail validation", "[rule_json]") {
  const json rules = json::array({
      {{"id", ""}, {"type", "Required"}, {"resourceType", "Patient"}, {"fieldPath", "gender"}},
      {{"id", "r2"}, {"type", "ArrayLength"}, {"resourceType", "Patient"}, {"fieldPath", "name"}},
  });

  CHECK_FALSE(domain::rule_set_from_json(rules).has_value());

  auto unchecked = domain::rule_set_from_json_unchecked(rules);
  REQUIRE(unchecked.has_value());
  REQUIRE(unchecked.value().rules.size() == 2);
  CHECK(unchecked.value().rules[0].error_code == "FIELD_REQUIRED");
  CHECK_FALSE(unchecked.value().rules[1].validate().has_value());
}

TEST_CASE("error code vocabulary", "[rule_json][codes]") {
  CHECK(domain::fixed_error_code(domain::RuleType::kArrayLength) == "ARRAY_LENGTH_VIOLATION");
  CHECK_FALSE(domain::fixed_error_code(domain::RuleType::kCustomExpression).has_value());
  CHECK_FALSE(domain::fixed_error_code(domain::RuleType::kQuestionAnswer).has_value());
  CHECK(domain::answer_constraint_error_code(domain::AnswerConstraint::kSingleAnswer) ==
        "ANSWER_MULTIPLE_NOT_ALLOWED");
  CHECK(domain::is_governed_error_code(domain::RuleType::kCustomExpression, "RESOURCE_MISSING"));
  CHECK_FALSE(domain::is_governed_error_code(domain::RuleType::kCustomExpression,
                                             "ANSWER_REQUIRED"));
  CHECK_FALSE(domain::is_governed_error_code(domain::RuleType::kQuestionAnswer,
                                             "QUESTION_NOT_FOUND"));
}
