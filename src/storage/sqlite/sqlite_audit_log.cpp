#include "fhirgate/storage/sqlite/sqlite_audit_log.h"

#include "fhirgate/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>
#include <utility>

namespace fhirgate::storage::sqlite {

namespace {

[[noreturn]] void fail(const std::string& what, sqlite3* db) {
  throw std::runtime_error("audit log: " + what + ": " + sqlite3_errmsg(db));
}

AuditEvent row_to_event(sqlite3_stmt* stmt) {
  AuditEvent event;
  event.event_id = column_string(stmt, 0);
  event.trace_id = column_string(stmt, 1);
  event.event_type = column_string(stmt, 2);
  event.payload = column_string(stmt, 3);
  event.created_at = column_string(stmt, 4);
  event.refs = nlohmann::json::parse(column_string(stmt, 5)).get<std::vector<std::string>>();
  event.previous_hash = column_string(stmt, 6);
  event.event_hash = column_string(stmt, 7);
  return event;
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  const AppendState state = append_state(event.trace_id);
  const std::string event_hash = compute_event_hash(event, state.previous_hash);
  const std::string refs_json = nlohmann::json(event.refs).dump();

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx,
       previous_hash, event_hash)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    fail("prepare insert", db_->connection());
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, state.idx);
  sqlite3_bind_text(stmt.get(), 8, state.previous_hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 9, event_hash.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    fail("insert event '" + event.event_id + "'", db_->connection());
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const std::string columns =
      "SELECT event_id, trace_id, event_type, payload, created_at, refs_json,"
      "       previous_hash, event_hash FROM audit_events";
  const std::string sql = trace_id.empty() ? columns + " ORDER BY trace_id, idx"
                                           : columns + " WHERE trace_id = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    fail("prepare query", db_->connection());
  }
  if (!trace_id.empty()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> events;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    events.push_back(row_to_event(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    fail("query trace '" + trace_id + "'", db_->connection());
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    fail("prepare trace listing", db_->connection());
  }

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(column_string(stmt.get(), 0));
  }
  return ids;
}

SqliteAuditLog::AppendState SqliteAuditLog::append_state(const std::string& trace_id) const {
  const char* sql =
      "SELECT idx, event_hash FROM audit_events WHERE trace_id = ? ORDER BY idx DESC LIMIT 1";
  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    fail("prepare chain lookup", db_->connection());
  }
  sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return {sqlite3_column_int(stmt.get(), 0) + 1, column_string(stmt.get(), 1)};
  }
  return {0, std::string(kGenesisHash)};
}

}  // namespace fhirgate::storage::sqlite
