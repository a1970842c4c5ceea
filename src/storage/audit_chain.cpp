#include "fhirgate/storage/audit_chain.h"

#include "fhirgate/core/sha256.h"

#include <nlohmann/json.hpp>

namespace fhirgate::storage {

namespace {

bool is_hex_digest(const std::string& hash) {
  return hash.size() == kGenesisHash.size() &&
         hash.find_first_not_of("0123456789abcdef") == std::string::npos;
}

AuditChainVerificationResult broken_at(const std::size_t index, const std::string& what) {
  return {false, index, what + " at index " + std::to_string(index)};
}

}  // namespace

std::string compute_event_hash(const AuditEvent& event, const std::string& previous_hash) {
  // Object keys dump in sorted order, which keeps the digest input canonical.
  const nlohmann::json canonical = {{"trace_id", event.trace_id},
                                    {"event_id", event.event_id},
                                    {"event_type", event.event_type},
                                    {"created_at", event.created_at},
                                    {"payload", event.payload},
                                    {"refs", event.refs}};
  return core::sha256_hex(canonical.dump() + previous_hash);
}

AuditChainVerificationResult verify_audit_chain(const std::vector<AuditEvent>& events) {
  std::string expected_previous(kGenesisHash);

  for (std::size_t i = 0; i < events.size(); ++i) {
    const AuditEvent& event = events[i];
    if (event.trace_id != events.front().trace_id) {
      return broken_at(i, "trace_id '" + event.trace_id + "' differs from the chain's");
    }
    if (event.previous_hash != expected_previous) {
      return broken_at(i, "previous_hash mismatch");
    }
    if (!is_hex_digest(event.event_hash) ||
        event.event_hash != compute_event_hash(event, event.previous_hash)) {
      return broken_at(i, "event_hash mismatch");
    }
    expected_previous = event.event_hash;
  }

  return {true, events.size(), ""};
}

}  // namespace fhirgate::storage
