#include "runtime.h"

#include "fhirgate/storage/audit_chain.h"
#include "fhirgate/storage/sqlite/sqlite_audit_log.h"
#include "fhirgate/storage/sqlite/sqlite_db.h"
#include "fhirgate/storage/sqlite/sqlite_rule_set_store.h"

#include <iostream>

namespace fhirgate::cli {

namespace {

// Returns false when a corrupt chain must stop the run.
bool verify_stored_chains(const storage::IAuditLog& audit_log, const AuditChainVerifyMode mode) {
  if (mode == AuditChainVerifyMode::kOff) {
    return true;
  }

  bool intact = true;
  for (const auto& trace_id : audit_log.list_trace_ids()) {
    const auto result = storage::verify_audit_chain(audit_log.query(trace_id));
    if (result.valid) {
      continue;
    }
    intact = false;
    std::cerr << (mode == AuditChainVerifyMode::kFail ? "Error" : "Warning")
              << ": audit chain for trace " << trace_id << " is corrupt: " << result.error
              << "\n";
  }
  return intact || mode == AuditChainVerifyMode::kWarn;
}

}  // namespace

core::Result<std::unique_ptr<Runtime>, std::string> Runtime::create(const GlobalConfig& config) {
  using CreateResult = core::Result<std::unique_ptr<Runtime>, std::string>;

  std::unique_ptr<Runtime> runtime(new Runtime());

  if (config.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      return CreateResult::err(db_result.error());
    }
    auto db = db_result.value();
    auto schema_result = db->ensure_schema_v1();
    if (!schema_result.has_value()) {
      return CreateResult::err("Failed to initialize schema: " + schema_result.error());
    }
    runtime->rule_sets_ = std::make_unique<storage::sqlite::SqliteRuleSetStore>(db);
    runtime->audit_log_ = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
  } else {
    runtime->rule_sets_ = std::make_unique<storage::InMemoryRuleSetStore>();
    runtime->audit_log_ = std::make_unique<storage::InMemoryAuditLog>();
  }

  if (config.deterministic) {
    runtime->id_gen_ = std::make_unique<core::DeterministicIdGenerator>();
    runtime->clock_ = std::make_unique<core::FixedClock>("2026-01-01T00:00:00Z");
  } else {
    runtime->id_gen_ = std::make_unique<core::SystemIdGenerator>();
    runtime->clock_ = std::make_unique<core::SystemClock>();
  }

  if (!verify_stored_chains(*runtime->audit_log_, config.audit_chain_verify)) {
    return CreateResult::err("audit chain verification failed");
  }

  runtime->services_ = std::make_unique<core::Services>(*runtime->rule_sets_, *runtime->audit_log_);
  return CreateResult::ok(std::move(runtime));
}

}  // namespace fhirgate::cli
