#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/question_set.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/validation/layer.h"
#include "fhirgate/validation/validation_report.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <vector>

namespace fhirgate::validation {

// ValidationEngine is a class (not struct) per C++ Core Guidelines C.2:
// it owns its rules and layers and keeps them fixed after construction.
class ValidationEngine {
 public:
  ValidationEngine(std::vector<domain::Rule> rules, domain::QuestionSetCatalog question_sets,
                   std::vector<std::unique_ptr<const IValidationLayer>> layers = {});

  // Con.2: validate() is const; one engine can validate many records concurrently.
  //
  // Business rules run first, then every layer in registration order. The combined
  // findings go to aggregate_findings. An invalid rule fails the whole call.
  [[nodiscard]] core::Result<ValidationReport, core::ConfigError> validate(
      const nlohmann::json& record) const;

  [[nodiscard]] const std::vector<domain::Rule>& rules() const { return rules_; }

 private:
  std::vector<domain::Rule> rules_;
  domain::QuestionSetCatalog question_sets_;
  std::vector<std::unique_ptr<const IValidationLayer>> layers_;
};

}  // namespace fhirgate::validation
