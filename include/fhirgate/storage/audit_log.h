#pragma once

#include "fhirgate/storage/audit_event.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fhirgate::storage {

// IAuditLog is an append-only, per-trace hash-chained event log.
// append() fills previous_hash and event_hash; callers leave them empty.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;

  virtual void append(const AuditEvent& event) = 0;

  // Events of one trace in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;

  // Distinct trace ids, used at startup to verify every stored chain.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

// InMemoryAuditLog backs --deterministic CLI runs and tests. Nothing survives
// the process.
class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  // All events in append order.
  std::vector<AuditEvent> events_;
  // Positions in events_ per trace, in append order.
  std::map<std::string, std::vector<std::size_t>> by_trace_;
};

}  // namespace fhirgate::storage
