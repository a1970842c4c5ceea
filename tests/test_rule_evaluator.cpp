#include "fhirgate/domain/rule_json.h"
#include "fhirgate/evaluation/rule_evaluator.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace fhirgate;
using nlohmann::json;

namespace {

const json kPatient = json::parse(R"({
  "resourceType": "Patient",
  "id": "p1",
  "active": true,
  "gender": "male",
  "name": [{"family": "Doe", "given": ["John"]}],
  "identifier": [
    {"system": "urn:mrn", "value": "12345"},
    {"system": "urn:ssn", "value": "abc"}
  ],
  "maritalStatus": {
    "coding": [{"system": "http://terminology.hl7.org/CodeSystem/v3-MaritalStatus", "code": "M"}]
  }
})");

domain::Rule make_rule(json j) {
  if (!j.contains("id")) {
    j["id"] = "rule-1";
  }
  if (!j.contains("resourceType")) {
    j["resourceType"] = "Patient";
  }
  auto parsed = domain::rule_from_json(j);
  REQUIRE(parsed.has_value());
  return parsed.take_value();
}

std::vector<domain::Finding> run(const json& record, const std::vector<domain::Rule>& rules) {
  auto findings = evaluation::evaluate_rule_set(record, rules);
  REQUIRE(findings.has_value());
  return findings.take_value();
}

std::vector<domain::Finding> run(const json& record, const domain::Rule& rule) {
  return run(record, std::vector<domain::Rule>{rule});
}

}  // namespace

TEST_CASE("Required reports an absent or empty field", "[evaluator][required]") {
  SECTION("absent") {
    const auto findings =
        run(kPatient, make_rule({{"type", "Required"}, {"fieldPath", "birthDate"}}));
    REQUIRE(findings.size() == 1);
    const auto& finding = findings[0];
    CHECK(finding.source == domain::FindingSource::kBusiness);
    CHECK(finding.code == "FIELD_REQUIRED");
    CHECK(finding.path == "Patient.birthDate");
    CHECK(finding.rule_id == "rule-1");
    CHECK(finding.severity == domain::Severity::kError);
    CHECK_FALSE(finding.entry_index.has_value());
  }

  SECTION("present") {
    CHECK(run(kPatient, make_rule({{"type", "Required"}, {"fieldPath", "name.family"}})).empty());
  }

  SECTION("empty string counts as absent") {
    json patient = kPatient;
    patient["gender"] = "";
    CHECK(run(patient, make_rule({{"type", "Required"}, {"fieldPath", "gender"}})).size() == 1);
  }

  SECTION("whitespace-only string counts as absent") {
    json patient = kPatient;
    patient["gender"] = "   ";
    const auto findings = run(patient, make_rule({{"type", "Required"}, {"fieldPath", "gender"}}));
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].code == "FIELD_REQUIRED");
  }

  SECTION("resource type prefix in the path is accepted") {
    const auto findings =
        run(kPatient, make_rule({{"type", "Required"}, {"fieldPath", "Patient.birthDate"}}));
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].path == "Patient.birthDate");
  }
}

TEST_CASE("FixedValue compares present values only", "[evaluator][fixed]") {
  CHECK(run(kPatient, make_rule({{"type", "FixedValue"},
                                 {"fieldPath", "gender"},
                                 {"params", {{"value", "male"}}}}))
            .empty());

  const auto findings = run(kPatient, make_rule({{"type", "FixedValue"},
                                                 {"fieldPath", "gender"},
                                                 {"params", {{"value", "female"}}}}));
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "FIXED_VALUE_MISMATCH");
  CHECK(findings[0].path == "Patient.gender");
  CHECK(findings[0].details["expected"] == "female");
  CHECK(findings[0].details["actual"] == "male");

  CHECK(run(kPatient, make_rule({{"type", "FixedValue"},
                                 {"fieldPath", "birthDate"},
                                 {"params", {{"value", "2000-01-01"}}}}))
            .empty());
}

TEST_CASE("AllowedValues", "[evaluator][allowed]") {
  CHECK(run(kPatient, make_rule({{"type", "AllowedValues"},
                                 {"fieldPath", "gender"},
                                 {"params", {{"values", {"male", "female"}}}}}))
            .empty());

  const auto findings = run(kPatient, make_rule({{"type", "AllowedValues"},
                                                 {"fieldPath", "gender"},
                                                 {"params", {{"values", {"female", "other"}}}}}));
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "VALUE_NOT_ALLOWED");
}

TEST_CASE("Regex yields one finding at the first failing element", "[evaluator][regex]") {
  const auto findings = run(kPatient, make_rule({{"type", "Regex"},
                                                 {"fieldPath", "identifier.value"},
                                                 {"params", {{"pattern", "^[0-9]+$"}}}}));
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "PATTERN_MISMATCH");
  CHECK(findings[0].path == "Patient.identifier[1].value");
  CHECK(findings[0].details["actual"] == "abc");

  SECTION("negated pattern") {
    const auto negated = run(kPatient, make_rule({{"type", "Regex"},
                                                  {"fieldPath", "identifier.value"},
                                                  {"params", {{"pattern", "^[a-z]+$"}, {"negate", true}}}}));
    REQUIRE(negated.size() == 1);
    CHECK(negated[0].path == "Patient.identifier[1].value");
  }

  SECTION("case-insensitive pattern") {
    CHECK(run(kPatient, make_rule({{"type", "Regex"},
                                   {"fieldPath", "name.family"},
                                   {"params", {{"pattern", "^DOE$"}, {"caseInsensitive", true}}}}))
              .empty());
  }
}

TEST_CASE("ArrayLength counts collection elements", "[evaluator][array_length]") {
  CHECK(run(kPatient, make_rule({{"type", "ArrayLength"},
                                 {"fieldPath", "name"},
                                 {"params", {{"min", 1}}}}))
            .empty());

  const auto too_many = run(kPatient, make_rule({{"type", "ArrayLength"},
                                                 {"fieldPath", "identifier"},
                                                 {"params", {{"max", 1}}}}));
  REQUIRE(too_many.size() == 1);
  CHECK(too_many[0].code == "ARRAY_LENGTH_VIOLATION");
  CHECK(too_many[0].path == "Patient.identifier");
  CHECK(too_many[0].details["violation"] == "max");
  CHECK(too_many[0].details["actual"] == 2);

  const auto absent = run(kPatient, make_rule({{"type", "ArrayLength"},
                                               {"fieldPath", "telecom"},
                                               {"params", {{"min", 1}, {"max", 3}}}}));
  REQUIRE(absent.size() == 1);
  CHECK(absent[0].details["violation"] == "min");
  CHECK(absent[0].details["actual"] == 0);
}

TEST_CASE("ArrayLength checks each parent's array separately", "[evaluator][array_length]") {
  const json patient = json::parse(R"({
    "resourceType": "Patient",
    "id": "p1",
    "address": [
      {"line": ["1 Main St", "Apt 2"]},
      {"line": ["9 High St", "Floor 3"]},
      {"city": "Springfield"}
    ]
  })");

  SECTION("lines are not pooled across addresses") {
    CHECK(run(patient, make_rule({{"type", "ArrayLength"},
                                  {"fieldPath", "address.line"},
                                  {"params", {{"max", 2}}}}))
              .empty());
  }

  SECTION("an address without lines violates a minimum") {
    const auto findings = run(patient, make_rule({{"type", "ArrayLength"},
                                                  {"fieldPath", "address.line"},
                                                  {"params", {{"min", 1}}}}));
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].path == "Patient.address[2].line");
    CHECK(findings[0].details["actual"] == 0);
    CHECK(findings[0].details["violation"] == "min");
  }

  SECTION("each offending parent is reported") {
    const auto findings = run(patient, make_rule({{"type", "ArrayLength"},
                                                  {"fieldPath", "address.line"},
                                                  {"params", {{"max", 1}}}}));
    REQUIRE(findings.size() == 2);
    CHECK(findings[0].path == "Patient.address[0].line");
    CHECK(findings[1].path == "Patient.address[1].line");
    CHECK(findings[1].details["actual"] == 2);
  }

  SECTION("absent parents are not checked") {
    CHECK(run(kPatient, make_rule({{"type", "ArrayLength"},
                                   {"fieldPath", "address.line"},
                                   {"params", {{"min", 1}}}}))
              .empty());
  }
}

TEST_CASE("CodeSystem checks system then codes", "[evaluator][code_system]") {
  const std::string system = "http://terminology.hl7.org/CodeSystem/v3-MaritalStatus";

  CHECK(run(kPatient, make_rule({{"type", "CodeSystem"},
                                 {"fieldPath", "maritalStatus"},
                                 {"params", {{"system", system}}}}))
            .empty());

  const auto wrong_system = run(kPatient, make_rule({{"type", "CodeSystem"},
                                                     {"fieldPath", "maritalStatus"},
                                                     {"params", {{"system", "urn:other"}}}}));
  REQUIRE(wrong_system.size() == 1);
  CHECK(wrong_system[0].code == "INVALID_CODE");
  CHECK(wrong_system[0].path == "Patient.maritalStatus.coding[0]");
  CHECK(wrong_system[0].details["violation"] == "system");

  const auto wrong_code = run(kPatient, make_rule({{"type", "CodeSystem"},
                                                   {"fieldPath", "maritalStatus"},
                                                   {"params", {{"system", system}, {"codes", {"S", "D"}}}}}));
  REQUIRE(wrong_code.size() == 1);
  CHECK(wrong_code[0].details["violation"] == "code");
  CHECK(wrong_code[0].details["actualCode"] == "M");
}

TEST_CASE("CustomExpression evaluates against the resource", "[evaluator][custom]") {
  CHECK(run(kPatient, make_rule({{"type", "CustomExpression"},
                                 {"fieldPath", "gender"},
                                 {"errorCode", "CONDITION_NOT_MET"},
                                 {"params", {{"expression", "active = true and name.count() >= 1"}}}}))
            .empty());

  const auto findings = run(kPatient, make_rule({{"type", "CustomExpression"},
                                                 {"fieldPath", "gender"},
                                                 {"errorCode", "VALUE_NOT_EQUAL"},
                                                 {"params", {{"expression", "gender = 'female'"}}}}));
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "VALUE_NOT_EQUAL");
  CHECK(findings[0].path == "Patient.gender");
}

TEST_CASE("Rule metadata flows into findings", "[evaluator]") {
  const auto findings = run(kPatient, make_rule({{"type", "Required"},
                                                 {"fieldPath", "birthDate"},
                                                 {"severity", "warning"},
                                                 {"userHint", "Ask the front desk"}}));
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].severity == domain::Severity::kWarning);
  CHECK(findings[0].details["userHint"] == "Ask the front desk");
}

TEST_CASE("Disabled rules yield nothing and are not validated", "[evaluator]") {
  auto disabled = make_rule({{"type", "Required"}, {"fieldPath", "birthDate"}, {"enabled", false}});
  CHECK(run(kPatient, disabled).empty());

  domain::Rule broken = disabled;
  broken.field_path = "birth..date";
  CHECK(run(kPatient, broken).empty());
}

TEST_CASE("Rules for other resource types do not apply", "[evaluator]") {
  CHECK(run(kPatient, make_rule({{"type", "Required"},
                                 {"resourceType", "Observation"},
                                 {"fieldPath", "status"}}))
            .empty());
}

TEST_CASE("Bundle instances are evaluated per scope", "[evaluator][scope]") {
  const json bundle = json::parse(R"({
    "resourceType": "Bundle",
    "entry": [
      {"resource": {"resourceType": "Patient", "id": "a"}},
      {"resource": {"resourceType": "Observation", "status": "final"}},
      {"resource": {"resourceType": "Patient", "id": "b", "birthDate": "1990-01-01"}},
      {"resource": {"resourceType": "Patient", "id": "c"}}
    ]
  })");

  SECTION("all instances, document order") {
    const auto findings = run(bundle, make_rule({{"type", "Required"}, {"fieldPath", "birthDate"}}));
    REQUIRE(findings.size() == 2);
    CHECK(findings[0].entry_index == 0U);
    CHECK(findings[1].entry_index == 3U);
  }

  SECTION("first instance only") {
    const auto findings = run(bundle, make_rule({{"type", "Required"},
                                                 {"fieldPath", "birthDate"},
                                                 {"instanceScope", {{"kind", "first"}}}}));
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].entry_index == 0U);
  }

  SECTION("filtered instances") {
    const auto findings = run(bundle, make_rule({{"type", "Required"},
                                                 {"fieldPath", "birthDate"},
                                                 {"instanceScope", {{"kind", "filter"}, {"condition", "id = 'c'"}}}}));
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].entry_index == 3U);
  }

  SECTION("scope with no instances yields nothing") {
    CHECK(run(bundle, make_rule({{"type", "Required"},
                                 {"resourceType", "Encounter"},
                                 {"fieldPath", "status"}}))
              .empty());
  }
}

TEST_CASE("evaluate_rule_set fails on an invalid enabled rule before evaluating", "[evaluator]") {
  auto good = make_rule({{"type", "Required"}, {"fieldPath", "birthDate"}});
  domain::Rule bad = good;
  bad.id = "bad-rule";
  bad.params = domain::ArrayLengthParams{};

  auto result = evaluation::evaluate_rule_set(kPatient, std::vector<domain::Rule>{good, bad});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().rule_id == "bad-rule");
  CHECK(result.error().kind == core::ConfigErrorKind::kMissingParam);
}

TEST_CASE("paths that filter or index elements are refused at evaluation", "[evaluator]") {
  const json patient = json::parse(R"({
    "resourceType": "Patient",
    "id": "p1",
    "identifier": [{"system": "urn:a", "value": "1"}, {"system": "urn:nric"}],
    "name": [{"family": "A"}, {"given": ["x"]}]
  })");

  const auto refused = [&](const std::string& field_path) {
    auto result = evaluation::evaluate_rule_set(
        patient, std::vector<domain::Rule>{make_rule({{"id", "narrowed"},
                                                      {"type", "Required"},
                                                      {"fieldPath", field_path}})});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().kind == core::ConfigErrorKind::kMalformedPath);
    CHECK(result.error().rule_id == "narrowed");
  };

  SECTION("where clause") { refused("identifier.where(system='urn:nric').value"); }
  SECTION("concrete index") { refused("name[1].family"); }
  SECTION("function suffix") { refused("identifier.exists()"); }

  SECTION("a wildcard selects the same elements as the plain path") {
    CHECK(run(patient, make_rule({{"type", "Required"}, {"fieldPath", "name[*].family"}}))
              .empty());
  }
}

TEST_CASE("evaluate_rule_set keeps rule order", "[evaluator]") {
  const auto findings =
      run(kPatient, std::vector<domain::Rule>{
                        make_rule({{"id", "second"}, {"type", "Required"}, {"fieldPath", "telecom"}}),
                        make_rule({{"id", "first"}, {"type", "Required"}, {"fieldPath", "birthDate"}})});
  REQUIRE(findings.size() == 2);
  CHECK(findings[0].rule_id == "second");
  CHECK(findings[1].rule_id == "first");
}
