#include "validate_logic.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

int execute_validate(const fhirgate::app::ValidationPipelineRequest& request,
                     fhirgate::core::Services& services, fhirgate::core::IIdGenerator& id_gen,
                     fhirgate::core::IClock& clock) {
  try {
    const auto response = fhirgate::app::run_validation_pipeline(request, services, id_gen, clock);

    if (!response.outcome.has_value()) {
      const auto& error = response.outcome.error();
      std::cerr << "Invalid rule configuration ("
                << fhirgate::core::config_error_kind_to_string(error.kind) << ")"
                << (error.rule_id.empty() ? "" : " in rule " + error.rule_id) << ": "
                << error.reason << "\n";
      std::cerr << "trace_id: " << response.trace_id << "\n";
      return 1;
    }

    const auto& report = response.outcome.value();
    nlohmann::json out;
    out["trace_id"] = response.trace_id;
    out["report"] = fhirgate::validation::report_to_json(report);
    std::cout << out.dump(2) << "\n";

    return report.verdict == fhirgate::validation::Verdict::kNonCompliant ? 2 : 0;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
