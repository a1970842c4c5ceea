#include "fhirgate/storage/audit_log.h"

#include "fhirgate/storage/audit_chain.h"

namespace fhirgate::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  auto& positions = by_trace_[event.trace_id];

  AuditEvent& stored = events_.emplace_back(event);
  stored.previous_hash =
      positions.empty() ? std::string(kGenesisHash) : events_[positions.back()].event_hash;
  stored.event_hash = compute_event_hash(stored, stored.previous_hash);
  positions.push_back(events_.size() - 1);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> trace;
  const auto it = by_trace_.find(trace_id);
  if (it == by_trace_.end()) {
    return trace;
  }
  trace.reserve(it->second.size());
  for (const std::size_t position : it->second) {
    trace.push_back(events_[position]);
  }
  return trace;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::vector<std::string> ids;
  ids.reserve(by_trace_.size());
  for (const auto& entry : by_trace_) {
    ids.push_back(entry.first);
  }
  return ids;
}

}  // namespace fhirgate::storage
