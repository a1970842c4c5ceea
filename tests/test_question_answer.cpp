#include "fhirgate/domain/question_set.h"
#include "fhirgate/domain/rule_json.h"
#include "fhirgate/evaluation/question_answer_evaluator.h"
#include "fhirgate/evaluation/rule_evaluator.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using namespace fhirgate;
using nlohmann::json;

namespace {

const json kVitalsSet = json::parse(R"({
  "id": "vitals",
  "title": "Vital signs panel",
  "questions": [
    {"system": "http://loinc.org", "code": "8480-6", "display": "Systolic",
     "answerType": "quantity", "required": true, "min": 50, "max": 250},
    {"system": "http://loinc.org", "code": "8462-4", "display": "Diastolic",
     "answerType": "quantity", "required": true},
    {"code": {"system": "http://loinc.org", "code": "72166-2"}, "display": "Smoker",
     "answerType": "code", "valueSetSystem": "urn:yes-no", "allowedCodes": ["yes", "no"]},
    {"system": "http://loinc.org", "code": "48767-8", "display": "Comment",
     "answerType": "string", "maxLength": 5, "pattern": "^[a-z]+$"}
  ]
})");

const json kObservation = json::parse(R"({
  "resourceType": "Observation",
  "status": "final",
  "component": [
    {"code": {"coding": [{"system": "http://loinc.org", "code": "8480-6"}]},
     "valueQuantity": {"value": 300, "unit": "mmHg"}},
    {"code": {"coding": [{"system": "http://loinc.org", "code": "8462-4"}]}},
    {"code": {"coding": [{"system": "http://loinc.org", "code": "72166-2"}]},
     "valueCodeableConcept": {"coding": [{"system": "urn:yes-no", "code": "maybe"}]}},
    {"code": {"coding": [{"system": "http://loinc.org", "code": "48767-8"}]},
     "valueString": "toolong"},
    {"code": {"coding": [{"system": "http://loinc.org", "code": "0000-0"}]},
     "valueString": "x"},
    {"valueString": "no question here"}
  ]
})");

domain::QuestionSetCatalog vitals_catalog() {
  auto catalog = domain::question_set_catalog_from_json(kVitalsSet);
  REQUIRE(catalog.has_value());
  return catalog.take_value();
}

domain::Rule qa_rule(const std::string& constraint, const std::string& set_id = "vitals") {
  auto parsed = domain::rule_from_json({{"id", "qa-" + constraint},
                                        {"type", "QuestionAnswer"},
                                        {"resourceType", "Observation"},
                                        {"fieldPath", "component"},
                                        {"params",
                                         {{"questionSetId", set_id},
                                          {"questionPath", "code"},
                                          {"answerPath", "value[x]"},
                                          {"constraint", constraint}}}});
  REQUIRE(parsed.has_value());
  return parsed.take_value();
}

std::vector<domain::Finding> run(const json& record, const domain::Rule& rule,
                                 const domain::QuestionSetCatalog& catalog) {
  auto findings = evaluation::evaluate_rule_set(record, std::vector<domain::Rule>{rule}, catalog);
  REQUIRE(findings.has_value());
  return findings.take_value();
}

}  // namespace

TEST_CASE("question_set_catalog_from_json reads flat and nested codings", "[question_answer]") {
  const auto catalog = vitals_catalog();
  REQUIRE(catalog.contains("vitals"));
  const auto& set = catalog.at("vitals");
  CHECK(set.questions.size() == 4);

  const auto* smoker = set.find("http://loinc.org", "72166-2");
  REQUIRE(smoker != nullptr);
  CHECK(smoker->answer_type == domain::AnswerType::kCode);
  CHECK(smoker->allowed_codes == std::vector<std::string>{"yes", "no"});
  CHECK(set.find("http://snomed.info/sct", "72166-2") == nullptr);
}

TEST_CASE("question set catalog rejects bad documents", "[question_answer]") {
  CHECK_FALSE(domain::question_set_catalog_from_json(json{{"title", "no id"}}).has_value());
  CHECK_FALSE(domain::question_set_catalog_from_json(
                  json::array({{{"id", "a"}}, {{"id", "a"}}}))
                  .has_value());
  CHECK_FALSE(domain::question_set_from_json(
                  {{"id", "a"}, {"questions", {{{"code", "q1"}, {"answerType", "date"}}}}})
                  .has_value());
}

TEST_CASE("QuestionAnswer required constraint", "[question_answer]") {
  const auto findings = run(kObservation, qa_rule("required"), vitals_catalog());
  REQUIRE(findings.size() == 2);

  CHECK(findings[0].code == "ANSWER_REQUIRED");
  CHECK(findings[0].path == "Observation.component[1]");
  CHECK(findings[0].details["code"] == "8462-4");
  CHECK(findings[0].severity == domain::Severity::kError);

  CHECK(findings[1].code == "QUESTION_NOT_FOUND");
  CHECK(findings[1].path == "Observation.component[4]");
  CHECK(findings[1].severity == domain::Severity::kWarning);
}

TEST_CASE("QuestionAnswer range constraint", "[question_answer]") {
  const auto findings = run(kObservation, qa_rule("range"), vitals_catalog());
  REQUIRE(findings.size() == 2);
  CHECK(findings[0].code == "ANSWER_OUT_OF_RANGE");
  CHECK(findings[0].path == "Observation.component[0].valueQuantity");
  CHECK(findings[0].details["actual"] == 300.0);
  CHECK(findings[0].details["max"] == 250.0);
  CHECK(findings[1].code == "QUESTION_NOT_FOUND");
}

TEST_CASE("QuestionAnswer value set constraint", "[question_answer]") {
  const auto findings = run(kObservation, qa_rule("value_set"), vitals_catalog());
  REQUIRE(findings.size() == 2);
  CHECK(findings[0].code == "ANSWER_NOT_IN_VALUESET");
  CHECK(findings[0].path == "Observation.component[2].valueCodeableConcept");
  CHECK(findings[0].details["answerCode"] == "maybe");
}

TEST_CASE("QuestionAnswer format constraint", "[question_answer]") {
  const auto findings = run(kObservation, qa_rule("format"), vitals_catalog());
  REQUIRE(findings.size() == 2);
  CHECK(findings[0].code == "INVALID_ANSWER_VALUE");
  CHECK(findings[0].path == "Observation.component[3].valueString");
  CHECK(findings[0].details["maxLength"] == 5);
}

TEST_CASE("QuestionAnswer answer type constraint", "[question_answer]") {
  const json record = json::parse(R"({
    "resourceType": "Observation",
    "component": [
      {"code": {"coding": [{"system": "http://loinc.org", "code": "8480-6"}]},
       "valueString": "high"},
      {"code": {"coding": [{"system": "http://loinc.org", "code": "8462-4"}]},
       "valueQuantity": {"value": 80}}
    ]
  })");
  const auto findings = run(record, qa_rule("answer_type"), vitals_catalog());
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "INVALID_ANSWER_TYPE");
  CHECK(findings[0].path == "Observation.component[0].valueString");
  CHECK(findings[0].details["expectedType"] == "quantity");
  CHECK(findings[0].details["actualType"] == "string");
}

TEST_CASE("QuestionAnswer single answer constraint", "[question_answer]") {
  domain::QuestionSetCatalog catalog;
  auto set = domain::question_set_from_json(
      {{"id", "intake"},
       {"questions", {{{"system", "urn:q"}, {"code", "allergy"}, {"answerType", "string"}}}}});
  REQUIRE(set.has_value());
  catalog.emplace("intake", set.take_value());

  auto rule = domain::rule_from_json({{"id", "single"},
                                      {"type", "QuestionAnswer"},
                                      {"resourceType", "QuestionnaireResponse"},
                                      {"fieldPath", "item"},
                                      {"params",
                                       {{"questionSetId", "intake"},
                                        {"questionPath", "code"},
                                        {"answerPath", "answer"},
                                        {"constraint", "single_answer"}}}});
  REQUIRE(rule.has_value());

  const json record = json::parse(R"({
    "resourceType": "QuestionnaireResponse",
    "item": [
      {"code": [{"system": "urn:q", "code": "allergy"}],
       "answer": [{"valueString": "peanut"}, {"valueString": "latex"}]}
    ]
  })");
  const auto findings = run(record, rule.value(), catalog);
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "ANSWER_MULTIPLE_NOT_ALLOWED");
  CHECK(findings[0].path == "QuestionnaireResponse.item[0]");
  CHECK(findings[0].details["answerCount"] == 2);
}

TEST_CASE("QuestionAnswer without its question set reports missing data", "[question_answer]") {
  const auto findings = run(kObservation, qa_rule("required", "absent"), vitals_catalog());
  REQUIRE(findings.size() == 1);
  CHECK(findings[0].code == "QUESTIONSET_DATA_MISSING");
  CHECK(findings[0].path == "Observation.component");
  CHECK(findings[0].details["questionSetId"] == "absent");
}

TEST_CASE("infer_answer_type prefers the property name", "[question_answer]") {
  using domain::AnswerType;
  CHECK(evaluation::infer_answer_type("item[0].valueQuantity", json::object()) == AnswerType::kQuantity);
  CHECK(evaluation::infer_answer_type("answer[0].valueBoolean", json(true)) == AnswerType::kBoolean);
  CHECK(evaluation::infer_answer_type("valueCoding", json::object()) == AnswerType::kCode);
  CHECK(evaluation::infer_answer_type("answer", json(3)) == AnswerType::kInteger);
  CHECK(evaluation::infer_answer_type("answer", json(3.5)) == AnswerType::kDecimal);
  CHECK(evaluation::infer_answer_type("answer", json("x")) == AnswerType::kString);
  CHECK_FALSE(evaluation::infer_answer_type("answer", json::array()).has_value());
}

TEST_CASE("extract_question_coding reads CodeableConcept or Coding", "[question_answer]") {
  auto code_path = path::parse_path("code");
  REQUIRE(code_path.has_value());

  const json concept_node = {{"code", {{"coding", {{{"system", "s"}, {"code", ""}}, {{"system", "s"}, {"code", "c2"}}}}}}};
  const auto from_concept = evaluation::extract_question_coding(concept_node, code_path.value());
  REQUIRE(from_concept.has_value());
  CHECK(from_concept->code == "c2");

  const json coding_node = {{"code", {{"system", "s"}, {"code", "c1"}}}};
  const auto from_coding = evaluation::extract_question_coding(coding_node, code_path.value());
  REQUIRE(from_coding.has_value());
  CHECK(from_coding->system == "s");

  CHECK_FALSE(evaluation::extract_question_coding(json{{"text", "t"}}, code_path.value()).has_value());
}
