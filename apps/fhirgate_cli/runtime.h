#pragma once

#include "config.h"

#include "fhirgate/core/clock.h"
#include "fhirgate/core/id_generator.h"
#include "fhirgate/core/result.h"
#include "fhirgate/core/services.h"
#include "fhirgate/storage/audit_log.h"
#include "fhirgate/storage/rule_set_store.h"

#include <memory>
#include <string>

namespace fhirgate::cli {

// Runtime owns the concrete stores, clock and id generator of one CLI run and
// exposes them as interfaces. SQLite-backed when --db is given, in-memory otherwise.
class Runtime {
 public:
  // Opens storage and runs the configured audit-chain verification.
  [[nodiscard]] static core::Result<std::unique_ptr<Runtime>, std::string> create(
      const GlobalConfig& config);

  ~Runtime() = default;

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(Runtime&&) = delete;

  [[nodiscard]] core::Services& services() { return *services_; }
  [[nodiscard]] core::IIdGenerator& id_gen() { return *id_gen_; }
  [[nodiscard]] core::IClock& clock() { return *clock_; }

 private:
  Runtime() = default;

  std::unique_ptr<storage::IRuleSetStore> rule_sets_;
  std::unique_ptr<storage::IAuditLog> audit_log_;
  std::unique_ptr<core::Services> services_;
  std::unique_ptr<core::IIdGenerator> id_gen_;
  std::unique_ptr<core::IClock> clock_;
};

}  // namespace fhirgate::cli
