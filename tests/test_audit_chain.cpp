#include "fhirgate/storage/audit_chain.h"
#include "fhirgate/storage/audit_log.h"
#include "fhirgate/storage/sqlite/sqlite_audit_log.h"
#include "fhirgate/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <utility>

using namespace fhirgate;

// Helper: open an in-memory DB with schema v1 applied.
static std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v1();
  REQUIRE(schema.has_value());
  return db;
}

// Helper: build a minimal AuditEvent (hash fields left empty; filled by append).
static storage::AuditEvent make_event(const std::string& event_id, const std::string& trace_id,
                                      const std::string& event_type = "ValidationStarted",
                                      const std::string& payload = "{}") {
  return {event_id, trace_id, event_type, payload, "2026-01-01T00:00:00Z", {}};
}

// ── compute_event_hash ──────────────────────────────────────────────────────

TEST_CASE("compute_event_hash is stable and hex encoded", "[audit_chain]") {
  const storage::AuditEvent ev = make_event("evt-1", "trace-A");
  const std::string prev(storage::kGenesisHash);

  const std::string h1 = storage::compute_event_hash(ev, prev);
  CHECK(h1 == storage::compute_event_hash(ev, prev));
  REQUIRE(h1.size() == 64);
  CHECK(h1.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("compute_event_hash depends on every hashed field", "[audit_chain]") {
  const storage::AuditEvent ev = make_event("evt-1", "trace-A");
  const std::string prev(storage::kGenesisHash);
  const std::string base = storage::compute_event_hash(ev, prev);

  CHECK(storage::compute_event_hash(ev, std::string(64, 'f')) != base);

  auto changed = ev;
  changed.payload = R"({"verdict":"compliant"})";
  CHECK(storage::compute_event_hash(changed, prev) != base);

  changed = ev;
  changed.refs = {"project-1"};
  CHECK(storage::compute_event_hash(changed, prev) != base);

  changed = ev;
  changed.event_type = "ValidationCompleted";
  CHECK(storage::compute_event_hash(changed, prev) != base);

  // Stored hash fields are not part of the digest.
  changed = ev;
  changed.event_hash = "ignored";
  CHECK(storage::compute_event_hash(changed, prev) == base);
}

// ── verify_audit_chain ──────────────────────────────────────────────────────

TEST_CASE("verify_audit_chain: empty chain is valid", "[audit_chain]") {
  const auto result = storage::verify_audit_chain({});
  CHECK(result.valid);
  CHECK(result.first_invalid_index == 0);
  CHECK(result.error.empty());
}

TEST_CASE("InMemoryAuditLog chains events per trace", "[audit_chain]") {
  storage::InMemoryAuditLog log;
  log.append(make_event("evt-1", "trace-A"));
  log.append(make_event("evt-2", "trace-B"));
  log.append(make_event("evt-3", "trace-A", "ValidationCompleted"));

  const auto a = log.query("trace-A");
  REQUIRE(a.size() == 2);
  CHECK(a[0].previous_hash == storage::kGenesisHash);
  CHECK(a[1].previous_hash == a[0].event_hash);

  const auto b = log.query("trace-B");
  REQUIRE(b.size() == 1);
  CHECK(b[0].previous_hash == storage::kGenesisHash);

  const auto verified = storage::verify_audit_chain(a);
  CHECK(verified.valid);
  CHECK(verified.first_invalid_index == 2);

  CHECK(log.query("").size() == 3);
  CHECK(log.list_trace_ids() == std::vector<std::string>{"trace-A", "trace-B"});
}

TEST_CASE("verify_audit_chain detects tampering", "[audit_chain]") {
  storage::InMemoryAuditLog log;
  log.append(make_event("evt-1", "trace-A"));
  log.append(make_event("evt-2", "trace-A", "ValidationCompleted", R"({"verdict":"compliant"})"));
  log.append(make_event("evt-3", "trace-A", "CoverageAnalyzed"));
  auto events = log.query("trace-A");
  REQUIRE(events.size() == 3);

  SECTION("edited payload") {
    events[1].payload = R"({"verdict":"non_compliant"})";
    const auto result = storage::verify_audit_chain(events);
    CHECK_FALSE(result.valid);
    CHECK(result.first_invalid_index == 1);
    CHECK_FALSE(result.error.empty());
  }

  SECTION("reordered events") {
    std::swap(events[1], events[2]);
    const auto result = storage::verify_audit_chain(events);
    CHECK_FALSE(result.valid);
    CHECK(result.first_invalid_index == 1);
  }

  SECTION("dropped first event") {
    events.erase(events.begin());
    const auto result = storage::verify_audit_chain(events);
    CHECK_FALSE(result.valid);
    CHECK(result.first_invalid_index == 0);
  }
}

TEST_CASE("SqliteAuditLog produces the same chain as the in-memory log", "[audit_chain][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteAuditLog sqlite_log(db);
  storage::InMemoryAuditLog memory_log;

  for (auto* log : {static_cast<storage::IAuditLog*>(&sqlite_log),
                    static_cast<storage::IAuditLog*>(&memory_log)}) {
    log->append(make_event("evt-1", "trace-A"));
    log->append(make_event("evt-2", "trace-A", "ValidationCompleted", R"({"finding_count":1})"));
  }

  const auto stored = sqlite_log.query("trace-A");
  const auto expected = memory_log.query("trace-A");
  REQUIRE(stored.size() == 2);
  CHECK(stored[0].event_hash == expected[0].event_hash);
  CHECK(stored[1].event_hash == expected[1].event_hash);
  CHECK(storage::verify_audit_chain(stored).valid);
}

TEST_CASE("verify_audit_chain rejects events of another trace", "[audit_chain]") {
  storage::InMemoryAuditLog log;
  log.append(make_event("evt-1", "trace-A"));
  log.append(make_event("evt-2", "trace-B"));

  const auto mixed = log.query("");
  REQUIRE(mixed.size() == 2);
  const auto result = storage::verify_audit_chain(mixed);
  CHECK_FALSE(result.valid);
  CHECK(result.first_invalid_index == 1);
  CHECK(result.error.find("trace-B") != std::string::npos);
}
