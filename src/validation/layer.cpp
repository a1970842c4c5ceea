#include "fhirgate/validation/layer.h"

#include <utility>

namespace fhirgate::validation {

PrecomputedFindingsLayer::PrecomputedFindingsLayer(const domain::FindingSource source,
                                                   std::vector<domain::Finding> findings)
    : source_(source), findings_(std::move(findings)) {}

std::vector<domain::Finding> PrecomputedFindingsLayer::validate(
    const nlohmann::json& /*record*/) const {
  return findings_;
}

}  // namespace fhirgate::validation
