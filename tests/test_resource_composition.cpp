#include "fhirgate/domain/rule_json.h"
#include "fhirgate/evaluation/rule_evaluator.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <vector>

using namespace fhirgate;
using nlohmann::json;

namespace {

const json kBundle = json::parse(R"({
  "resourceType": "Bundle",
  "type": "collection",
  "entry": [
    {"resource": {"resourceType": "Patient", "id": "p1"}},
    {"resource": {"resourceType": "Observation", "status": "final"}},
    {"resource": {"resourceType": "Observation", "status": "preliminary"}},
    {"resource": {"resourceType": "Encounter", "status": "finished"}},
    {"resource": {"resourceType": "Encounter", "status": "finished"}}
  ]
})");

domain::Rule composition_rule(json params) {
  auto parsed = domain::rule_from_json({{"id", "composition"},
                                        {"type", "ResourceComposition"},
                                        {"resourceType", "Bundle"},
                                        {"params", std::move(params)}});
  REQUIRE(parsed.has_value());
  return parsed.take_value();
}

std::vector<domain::Finding> run(const json& record, const domain::Rule& rule) {
  auto findings = evaluation::evaluate_rule_set(record, std::vector<domain::Rule>{rule});
  REQUIRE(findings.has_value());
  return findings.take_value();
}

}  // namespace

TEST_CASE("ResourceComposition passes when every requirement holds", "[composition]") {
  const auto rule = composition_rule(
      {{"requirements",
        {{{"resourceType", "Patient"}, {"min", 1}, {"max", 1}},
         {{"resourceType", "Observation"}, {"min", 1}}}}});
  CHECK(run(kBundle, rule).empty());
}

TEST_CASE("ResourceComposition reports min and max violations", "[composition]") {
  const auto rule = composition_rule(
      {{"requirements",
        {{{"resourceType", "Practitioner"}, {"min", 1}},
         {{"resourceType", "Encounter"}, {"max", 1}}}}});
  const auto findings = run(kBundle, rule);
  REQUIRE(findings.size() == 2);

  CHECK(findings[0].code == "RESOURCE_REQUIREMENT_VIOLATION");
  CHECK(findings[0].path == "Practitioner");
  CHECK(findings[0].details["violation"] == "min");
  CHECK(findings[0].details["actual"] == 0);
  CHECK_FALSE(findings[0].entry_index.has_value());

  CHECK(findings[1].path == "Encounter");
  CHECK(findings[1].details["violation"] == "max");
  CHECK(findings[1].details["actual"] == 2);
}

TEST_CASE("ResourceComposition counts only instances passing the filters", "[composition]") {
  const auto rule = composition_rule(
      {{"requirements",
        {{{"resourceType", "Observation"},
          {"min", 2},
          {"filters", {{{"fieldPath", "status"}, {"op", "equals"}, {"value", "final"}}}}}}}});
  const auto findings = run(kBundle, rule);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].details["actual"] == 1);
  CHECK(findings[0].details["expected"] == 2);
}

TEST_CASE("ResourceComposition rejectUndeclared reports each undeclared type once",
          "[composition]") {
  const auto rule = composition_rule(
      {{"rejectUndeclared", true},
       {"requirements", {{{"resourceType", "Patient"}, {"min", 1}}}}});
  const auto findings = run(kBundle, rule);
  REQUIRE(findings.size() == 2);

  CHECK(findings[0].path == "Observation");
  CHECK(findings[0].details["violation"] == "undeclared");
  CHECK(findings[0].details["actual"] == 2);
  CHECK(findings[0].entry_index == 1U);

  CHECK(findings[1].path == "Encounter");
  CHECK(findings[1].entry_index == 3U);
}

TEST_CASE("ResourceComposition runs once per record", "[composition]") {
  const auto rule = composition_rule(
      {{"requirements", {{{"resourceType", "Practitioner"}, {"min", 1}}}}});
  CHECK(run(kBundle, rule).size() == 1);

  const json bare = {{"resourceType", "Patient"}};
  const auto findings = run(bare, rule);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].path == "Practitioner");
}

TEST_CASE("ResourceComposition requirement validation", "[composition]") {
  auto no_requirements = domain::rule_from_json({{"id", "c"},
                                                 {"type", "ResourceComposition"},
                                                 {"resourceType", "Bundle"},
                                                 {"params", {{"requirements", json::array()}}}});
  REQUIRE_FALSE(no_requirements.has_value());
  CHECK(no_requirements.error().kind == core::ConfigErrorKind::kMissingParam);

  auto inverted = domain::rule_from_json(
      {{"id", "c"},
       {"type", "ResourceComposition"},
       {"resourceType", "Bundle"},
       {"params", {{"requirements", {{{"resourceType", "Patient"}, {"min", 2}, {"max", 1}}}}}}});
  REQUIRE_FALSE(inverted.has_value());
  CHECK(inverted.error().kind == core::ConfigErrorKind::kInvalidParam);

  auto bad_filter = domain::rule_from_json(
      {{"id", "c"},
       {"type", "ResourceComposition"},
       {"resourceType", "Bundle"},
       {"params",
        {{"requirements",
          {{{"resourceType", "Patient"},
            {"filters", {{{"fieldPath", "a..b"}, {"op", "exists"}}}}}}}}}});
  REQUIRE_FALSE(bad_filter.has_value());
  CHECK(bad_filter.error().kind == core::ConfigErrorKind::kMalformedScope);
}
