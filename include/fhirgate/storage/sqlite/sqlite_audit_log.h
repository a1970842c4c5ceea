#pragma once

#include "fhirgate/storage/audit_log.h"
#include "fhirgate/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace fhirgate::storage::sqlite {

// SqliteAuditLog stores the per-trace hash chain in audit_events.
// The idx column orders events within a trace. Appends are serialized by a mutex.
// Failing statements throw std::runtime_error.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  struct AppendState {
    int idx{0};                   // NOLINT(readability-identifier-naming)
    std::string previous_hash{};  // NOLINT(readability-identifier-naming)
  };

  // Next idx and last event_hash of a trace; caller holds mutex_.
  [[nodiscard]] AppendState append_state(const std::string& trace_id) const;

  std::shared_ptr<SqliteDb> db_;
  std::mutex mutex_;
};

}  // namespace fhirgate::storage::sqlite
