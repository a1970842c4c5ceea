#include "fhirgate/domain/rule_json.h"
#include "fhirgate/governance/rule_review.h"
#include "fhirgate/validation/reference_layer.h"
#include "fhirgate/validation/validation_engine.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <memory>

using namespace fhirgate;
using nlohmann::json;

namespace {

std::vector<domain::Rule> rules_of(const json& rules) {
  auto parsed = domain::rule_set_from_json({{"rules", rules}});
  REQUIRE(parsed.has_value());
  return parsed.value().rules;
}

validation::ValidationEngine engine_with(std::vector<domain::Rule> rules) {
  std::vector<std::unique_ptr<const validation::IValidationLayer>> layers;
  layers.push_back(std::make_unique<validation::ReferenceIntegrityLayer>(
      validation::ReferencePolicy::kInBundleOnly));
  return validation::ValidationEngine(std::move(rules), {}, std::move(layers));
}

}  // namespace

TEST_CASE("missing required birthDate makes a bundle non-compliant", "[e2e]") {
  const auto engine = engine_with(rules_of(json::array({{{"id", "birthdate-required"},
                                                         {"type", "Required"},
                                                         {"resourceType", "Patient"},
                                                         {"instanceScope", {{"kind", "all"}}},
                                                         {"fieldPath", "birthDate"}}})));

  const json bundle = json::parse(R"({
    "resourceType": "Bundle",
    "type": "collection",
    "entry": [
      {"fullUrl": "urn:uuid:p1", "resource": {"resourceType": "Patient", "id": "p1", "gender": "female"}}
    ]
  })");

  auto report = engine.validate(bundle);
  REQUIRE(report.has_value());
  const auto& r = report.value();
  REQUIRE(r.findings.size() == 1);

  const auto& finding = r.findings[0].finding;
  CHECK(finding.source == domain::FindingSource::kBusiness);
  CHECK(finding.severity == domain::Severity::kError);
  CHECK(finding.code == "FIELD_REQUIRED");
  CHECK(finding.path == "Patient.birthDate");
  CHECK(finding.rule_id == "birthdate-required");
  CHECK(finding.entry_index == 0U);
  CHECK(r.findings[0].blocking);

  CHECK(r.must_fix == 1);
  CHECK(r.verdict == validation::Verdict::kNonCompliant);
  CHECK(validation::report_to_json(r)["verdict"] == "non_compliant");
}

TEST_CASE("a record satisfying every rule is compliant", "[e2e]") {
  const auto engine = engine_with(rules_of(json::array({
      {{"id", "name-present"},
       {"type", "ArrayLength"},
       {"resourceType", "Patient"},
       {"fieldPath", "name"},
       {"params", {{"min", 1}}}},
      {{"id", "gender-male"},
       {"type", "FixedValue"},
       {"resourceType", "Patient"},
       {"fieldPath", "gender"},
       {"params", {{"value", "male"}}}},
  })));

  const json patient = json::parse(R"({
    "resourceType": "Patient",
    "id": "p1",
    "name": [{"family": "Doe", "given": ["John"]}],
    "gender": "male"
  })");

  auto report = engine.validate(patient);
  REQUIRE(report.has_value());
  CHECK(report.value().findings.empty());
  CHECK(report.value().must_fix == 0);
  CHECK(report.value().recommendations == 0);
  CHECK(report.value().verdict == validation::Verdict::kCompliant);

  SECTION("the same rules flag a violating record") {
    json other = patient;
    other["gender"] = "female";
    other["name"] = json::array();
    auto failing = engine.validate(other);
    REQUIRE(failing.has_value());
    REQUIRE(failing.value().findings.size() == 2);
    CHECK(failing.value().findings[0].finding.rule_id == "name-present");
    CHECK(failing.value().findings[1].finding.rule_id == "gender-male");
    CHECK(failing.value().verdict == validation::Verdict::kNonCompliant);
  }
}

TEST_CASE("a where clause in a rule path blocks saving the whole set", "[e2e][governance]") {
  const auto rules = rules_of(json::array({
      {{"id", "family-required"},
       {"type", "Required"},
       {"resourceType", "Patient"},
       {"fieldPath", "name.family"}},
      {{"id", "official-family"},
       {"type", "Required"},
       {"resourceType", "Patient"},
       {"fieldPath", "name.where(use='official').family"}},
  }));

  const auto reviews = governance::review_rule_set(rules);
  REQUIRE(reviews.size() == 2);
  CHECK(reviews[0].rule_id == "family-required");
  CHECK(reviews[0].status == governance::ReviewStatus::kOk);
  CHECK(reviews[1].rule_id == "official-family");
  CHECK(reviews[1].status == governance::ReviewStatus::kBlocked);
  CHECK_FALSE(governance::is_persist_eligible(reviews));

  // Inline evaluation refuses the filtered path instead of widening it.
  const auto report = engine_with(rules).validate(
      json{{"resourceType", "Patient"}, {"id", "p1"}, {"name", {{{"family", "Doe"}}}}});
  REQUIRE_FALSE(report.has_value());
  CHECK(report.error().kind == core::ConfigErrorKind::kMalformedPath);
  CHECK(report.error().rule_id == "official-family");
}
