#include "fhirgate/domain/rule_json.h"
#include "fhirgate/storage/sqlite/sqlite_audit_log.h"
#include "fhirgate/storage/sqlite/sqlite_db.h"
#include "fhirgate/storage/sqlite/sqlite_rule_set_store.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace fhirgate;
using nlohmann::json;

namespace {

std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  REQUIRE(db->get_schema_version() == 0);
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

domain::RuleSet rule_set_with(const std::vector<std::string>& fields) {
  json rules = json::array();
  for (const auto& field : fields) {
    rules.push_back({{"id", "req-" + field},
                     {"type", "Required"},
                     {"resourceType", "Patient"},
                     {"fieldPath", field},
                     {"errorCode", "FIELD_REQUIRED"}});
  }
  auto parsed = domain::rule_set_from_json({{"version", "1.0"}, {"rules", rules}});
  REQUIRE(parsed.has_value());
  return parsed.take_value();
}

}  // namespace

TEST_CASE("SqliteDb applies schema v1 once", "[sqlite]") {
  auto db = make_db();
  CHECK(db->get_schema_version() == 1);
  CHECK(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqliteRuleSetStore keeps revisions and returns the latest", "[sqlite][rule_sets]") {
  auto db = make_db();
  storage::sqlite::SqliteRuleSetStore store(db);

  CHECK_FALSE(store.get("clinic-a").has_value());
  CHECK(store.list_projects().empty());

  auto first = store.replace("clinic-a", rule_set_with({"birthDate"}), "2026-01-01T00:00:00Z");
  REQUIRE(first.has_value());
  CHECK(first.value() == 1);

  auto second =
      store.replace("clinic-a", rule_set_with({"gender", "name"}), "2026-01-02T00:00:00Z");
  REQUIRE(second.has_value());
  CHECK(second.value() == 2);

  const auto stored = store.get("clinic-a");
  REQUIRE(stored.has_value());
  CHECK(stored->revision == 2);
  CHECK(stored->saved_at == "2026-01-02T00:00:00Z");
  CHECK(stored->rule_set.project == "clinic-a");
  REQUIRE(stored->rule_set.rules.size() == 2);
  CHECK(stored->rule_set.rules[0].id == "req-gender");
  CHECK(stored->rule_set.rules[1].field_path == "name");
  CHECK(stored->rule_set.rules[1].type() == domain::RuleType::kRequired);
}

TEST_CASE("SqliteRuleSetStore isolates projects", "[sqlite][rule_sets]") {
  auto db = make_db();
  storage::sqlite::SqliteRuleSetStore store(db);

  REQUIRE(store.replace("clinic-b", rule_set_with({"gender"}), "t1").has_value());
  REQUIRE(store.replace("clinic-a", rule_set_with({"birthDate"}), "t2").has_value());

  CHECK(store.list_projects() == std::vector<std::string>{"clinic-a", "clinic-b"});
  CHECK(store.get("clinic-b")->revision == 1);
  CHECK(store.get("clinic-a")->rule_set.rules[0].field_path == "birthDate");

  CHECK_FALSE(store.replace("", rule_set_with({"gender"}), "t3").has_value());
}

TEST_CASE("SqliteAuditLog orders events within a trace", "[sqlite][audit]") {
  auto db = make_db();
  storage::sqlite::SqliteAuditLog audit_log(db);

  audit_log.append({"evt-1", "trace-2", "ValidationStarted", R"({"rule_count":1})",
                    "2026-01-01T00:00:00Z", {"clinic-a"}});
  audit_log.append({"evt-2", "trace-1", "RuleSetReviewCompleted", "{}", "2026-01-01T00:00:01Z", {}});
  audit_log.append({"evt-3", "trace-2", "ValidationCompleted", R"({"verdict":"compliant"})",
                    "2026-01-01T00:00:02Z", {"clinic-a"}});

  const auto events = audit_log.query("trace-2");
  REQUIRE(events.size() == 2);
  CHECK(events[0].event_id == "evt-1");
  CHECK(events[1].event_id == "evt-3");
  CHECK(events[1].refs == std::vector<std::string>{"clinic-a"});
  CHECK(events[1].payload == R"({"verdict":"compliant"})");
  CHECK(events[1].previous_hash == events[0].event_hash);

  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.query("trace-missing").empty());
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-1", "trace-2"});
}
