#include "fhirgate/validation/validation_engine.h"

#include "fhirgate/evaluation/rule_evaluator.h"

#include <utility>

namespace fhirgate::validation {

ValidationEngine::ValidationEngine(std::vector<domain::Rule> rules,
                                   domain::QuestionSetCatalog question_sets,
                                   std::vector<std::unique_ptr<const IValidationLayer>> layers)
    : rules_(std::move(rules)), question_sets_(std::move(question_sets)), layers_(std::move(layers)) {}

core::Result<ValidationReport, core::ConfigError> ValidationEngine::validate(
    const nlohmann::json& record) const {
  using R = core::Result<ValidationReport, core::ConfigError>;

  auto business = evaluation::evaluate_rule_set(record, rules_, question_sets_);
  if (!business.has_value()) {
    return R::err(business.error());
  }
  std::vector<domain::Finding> findings = business.take_value();

  for (const auto& layer : layers_) {
    if (!layer) {
      continue;
    }
    for (auto& finding : layer->validate(record)) {
      finding.source = layer->source();
      findings.push_back(std::move(finding));
    }
  }

  return R::ok(aggregate_findings(std::move(findings)));
}

}  // namespace fhirgate::validation
