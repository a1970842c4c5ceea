#include "save_rules_logic.h"

#include <iostream>
#include <stdexcept>

int execute_save_rules(const fhirgate::app::RuleSetSaveRequest& request,
                       fhirgate::core::Services& services, fhirgate::core::IIdGenerator& id_gen,
                       fhirgate::core::IClock& clock) {
  try {
    const auto response =
        fhirgate::app::run_rule_set_save_pipeline(request, services, id_gen, clock);
    std::cout << fhirgate::app::save_response_to_json(response).dump(2) << "\n";
    if (!response.saved) {
      std::cerr << "Rule set for project " << request.project_id
                << " was not saved: at least one rule is BLOCKED\n";
      return 2;
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
