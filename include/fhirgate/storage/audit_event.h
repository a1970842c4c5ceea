#pragma once

#include <string>
#include <vector>

namespace fhirgate::storage {

// AuditEvent is one entry of a trace. payload is a JSON document serialized with
// sorted keys; refs name the entities the event is about (project ids, rule ids).
struct AuditEvent {
  std::string event_id;             // NOLINT(readability-identifier-naming)
  std::string trace_id;             // NOLINT(readability-identifier-naming)
  std::string event_type;           // NOLINT(readability-identifier-naming)
  std::string payload;              // NOLINT(readability-identifier-naming)
  std::string created_at;           // NOLINT(readability-identifier-naming)
  std::vector<std::string> refs;    // NOLINT(readability-identifier-naming)
  std::string previous_hash{};      // NOLINT(readability-identifier-naming)
  std::string event_hash{};         // NOLINT(readability-identifier-naming)
};

}  // namespace fhirgate::storage
