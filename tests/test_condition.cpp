#include "fhirgate/path/condition.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace fhirgate;
using nlohmann::json;

namespace {

bool holds(const char* expression, const json& context) {
  auto condition = path::Condition::parse(expression);
  REQUIRE(condition.has_value());
  return condition.value().evaluate(context);
}

const json kObservation = json::parse(R"({
  "resourceType": "Observation",
  "status": "final",
  "valueQuantity": {"value": 7.5, "unit": "mmol/L"},
  "component": [{"code": "a"}, {"code": "b"}],
  "note": [],
  "active": true
})");

}  // namespace

TEST_CASE("Condition value comparisons", "[condition]") {
  CHECK(holds("status = 'final'", kObservation));
  CHECK_FALSE(holds("status = 'preliminary'", kObservation));
  CHECK(holds("status != 'preliminary'", kObservation));
  CHECK(holds("valueQuantity.value > 7", kObservation));
  CHECK(holds("valueQuantity.value <= 7.5", kObservation));
  CHECK_FALSE(holds("valueQuantity.value < 7", kObservation));
  CHECK(holds("component.code = 'b'", kObservation));
}

TEST_CASE("Condition mismatched kinds never compare", "[condition]") {
  CHECK_FALSE(holds("status = 1", kObservation));
  CHECK_FALSE(holds("valueQuantity.value = '7.5'", kObservation));
}

TEST_CASE("Condition functions", "[condition]") {
  CHECK(holds("status.exists()", kObservation));
  CHECK_FALSE(holds("note.exists()", kObservation));
  CHECK(holds("note.empty()", kObservation));
  CHECK(holds("subject.empty()", kObservation));
  CHECK(holds("component.count() = 2", kObservation));
  CHECK(holds("component.count() >= 1", kObservation));
  CHECK_FALSE(holds("component.count() > 2", kObservation));
}

TEST_CASE("Condition bare path needs boolean true", "[condition]") {
  CHECK(holds("active", kObservation));
  CHECK_FALSE(holds("status", kObservation));
  CHECK_FALSE(holds("missing", kObservation));
}

TEST_CASE("Condition boolean connectives", "[condition]") {
  CHECK(holds("status = 'final' and active", kObservation));
  CHECK(holds("status = 'draft' or component.count() = 2", kObservation));
  CHECK(holds("not status = 'draft'", kObservation));
  CHECK_FALSE(holds("not (status = 'final' and active)", kObservation));
  CHECK(holds("(status = 'draft' or active) and note.empty()", kObservation));
}

TEST_CASE("Condition parse errors", "[condition]") {
  CHECK_FALSE(path::Condition::parse("").has_value());
  CHECK_FALSE(path::Condition::parse("status = 'final").has_value());
  CHECK_FALSE(path::Condition::parse("status ! 'final'").has_value());
  CHECK_FALSE(path::Condition::parse("component.count()").has_value());
  CHECK_FALSE(path::Condition::parse("component.count() = 1.5").has_value());
  CHECK_FALSE(path::Condition::parse("code.where(system)").has_value());
  CHECK_FALSE(path::Condition::parse("status.matches()").has_value());
  CHECK_FALSE(path::Condition::parse("(status = 'final'").has_value());
  CHECK_FALSE(path::Condition::parse("status = 'final' active").has_value());
}

TEST_CASE("Condition keeps its text and tree", "[condition]") {
  auto parsed = path::Condition::parse("  status = 'final'  ");
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().text() == "status = 'final'");
  const auto& root = parsed.value().root();
  CHECK(root.kind == path::ConditionNode::Kind::kPredicate);
  CHECK(root.predicate.kind == path::PredicateKind::kValueCompare);
  CHECK(root.predicate.op == path::CompareOp::kEqual);
  CHECK(root.predicate.literal == "final");
}
