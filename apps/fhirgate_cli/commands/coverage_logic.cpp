#include "coverage_logic.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>

int execute_coverage(const fhirgate::app::CoveragePipelineRequest& request,
                     fhirgate::core::Services& services, fhirgate::core::IIdGenerator& id_gen,
                     fhirgate::core::IClock& clock) {
  try {
    const auto response = fhirgate::app::run_coverage_pipeline(request, services, id_gen, clock);
    nlohmann::json out;
    out["trace_id"] = response.trace_id;
    out["coverage"] = fhirgate::coverage::coverage_report_to_json(response.report);
    std::cout << out.dump(2) << "\n";
    return 0;
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
