#pragma once

#include "fhirgate/storage/audit_event.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fhirgate::storage {

// previous_hash of the first event in every trace.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

// compute_event_hash = SHA-256 over the sorted-key JSON of the event fields
// (hash fields excluded) followed by previous_hash. 64 lower-case hex chars.
[[nodiscard]] std::string compute_event_hash(const AuditEvent& event,
                                             const std::string& previous_hash);

struct AuditChainVerificationResult {
  bool valid{false};                  // NOLINT(readability-identifier-naming)
  std::size_t first_invalid_index{};  // NOLINT(readability-identifier-naming)
  std::string error;                  // NOLINT(readability-identifier-naming)
};

// verify_audit_chain checks events of one trace, in append order. An event of
// another trace breaks the chain like a tampered one.
//   valid == true:  first_invalid_index == events.size()
//   valid == false: first_invalid_index is the first corrupt or reordered event
[[nodiscard]] AuditChainVerificationResult verify_audit_chain(
    const std::vector<AuditEvent>& events);

}  // namespace fhirgate::storage
