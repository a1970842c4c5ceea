#pragma once

#include "fhirgate/storage/audit_log.h"
#include "fhirgate/storage/rule_set_store.h"

namespace fhirgate::core {

// Services is the composition root handed to the app pipelines.
// It holds references, not ownership; the entry point owns the concrete stores.
struct Services {
  storage::IRuleSetStore& rule_sets;  // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;      // NOLINT(readability-identifier-naming)

  Services(storage::IRuleSetStore& rule_sets, storage::IAuditLog& audit_log)
      : rule_sets(rule_sets), audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace fhirgate::core
