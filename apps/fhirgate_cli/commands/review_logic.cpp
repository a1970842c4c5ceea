#include "review_logic.h"

#include "fhirgate/governance/rule_review.h"

#include <nlohmann/json.hpp>

#include <iostream>

int execute_review(const std::vector<fhirgate::domain::Rule>& rules) {
  const auto results = fhirgate::governance::review_rule_set(rules);
  const bool eligible = fhirgate::governance::is_persist_eligible(results);

  nlohmann::json out;
  out["persist_eligible"] = eligible;
  out["reviews"] = fhirgate::governance::review_results_to_json(results);
  std::cout << out.dump(2) << "\n";

  return eligible ? 0 : 2;
}
