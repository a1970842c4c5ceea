#include "audit_trace_logic.h"

#include "fhirgate/app/app_service.h"
#include "fhirgate/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <iostream>

int execute_audit_trace(const std::string& trace_id, fhirgate::core::Services& services) {
  const auto events = fhirgate::app::fetch_audit_trace(trace_id, services);
  const auto verification = fhirgate::storage::verify_audit_chain(events);

  nlohmann::json out;
  out["trace_id"] = trace_id;
  out["events"] = fhirgate::app::audit_events_to_json(events);
  out["chain"] = {{"valid", verification.valid},
                  {"first_invalid_index", verification.first_invalid_index},
                  {"error", verification.error}};
  std::cout << out.dump(2) << "\n";

  if (events.empty()) {
    std::cerr << "No events for trace " << trace_id << "\n";
  }
  return verification.valid ? 0 : 2;
}
