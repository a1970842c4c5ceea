#include "validate.h"

#include "fhirgate/app/app_service.h"
#include "fhirgate/validation/reference_layer.h"

#include "config.h"
#include "inputs.h"
#include "runtime.h"
#include "validate_logic.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ValidateCliConfig {
  fhirgate::cli::GlobalConfig global;                    // NOLINT(readability-identifier-naming)
  std::optional<std::string> record_path;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> rules_path;                 // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;                 // NOLINT(readability-identifier-naming)
  std::optional<std::string> question_sets_path;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> external_findings_path;     // NOLINT(readability-identifier-naming)
  fhirgate::validation::ReferencePolicy reference_policy{
      fhirgate::validation::ReferencePolicy::kInBundleOnly};  // NOLINT(readability-identifier-naming)
};

std::vector<fhirgate::apps::Option<ValidateCliConfig>> validate_options() {
  return fhirgate::cli::with_global_options<ValidateCliConfig>({
      {"--record", true, "Record (Bundle or resource) JSON file",
       [](ValidateCliConfig& c, const std::string& v) {
         c.record_path = v;
         return true;
       }},
      {"--rules", true, "Rule set JSON file",
       [](ValidateCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
      {"--project", true, "Project whose stored rule set applies",
       [](ValidateCliConfig& c, const std::string& v) {
         c.project_id = v;
         return true;
       }},
      {"--question-sets", true, "Question set catalog JSON file",
       [](ValidateCliConfig& c, const std::string& v) {
         c.question_sets_path = v;
         return true;
       }},
      {"--external-findings", true, "Findings of external layers (JSON array)",
       [](ValidateCliConfig& c, const std::string& v) {
         c.external_findings_path = v;
         return true;
       }},
      {"--reference-policy", true, "Unresolved references (in-bundle|allow-external)",
       [](ValidateCliConfig& c, const std::string& v) {
         const auto policy = fhirgate::validation::string_to_reference_policy(v);
         if (!policy.has_value()) {
           std::cerr << "Invalid --reference-policy: " << v
                     << " (valid: in-bundle, allow-external)\n";
           return false;
         }
         c.reference_policy = *policy;
         return true;
       }},
  });
}

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = validate_options();
  const auto config = fhirgate::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    fhirgate::apps::print_usage(std::cerr, "validate", options);
    return 1;
  }
  if (!config->record_path.has_value()) {
    std::cerr << "Error: --record <file> is required\n";
    return 1;
  }
  if (config->rules_path.has_value() == config->project_id.has_value()) {
    std::cerr << "Error: exactly one of --rules <file> or --project <id> is required\n";
    return 1;
  }

  fhirgate::app::ValidationPipelineRequest request;
  request.reference_policy = config->reference_policy;
  request.project_id = config->project_id;

  auto record = fhirgate::cli::load_record(*config->record_path);
  if (!record.has_value()) {
    std::cerr << "Error: " << record.error() << "\n";
    return 1;
  }
  request.record = record.take_value();

  if (config->rules_path.has_value()) {
    auto rule_set = fhirgate::cli::load_rule_set(*config->rules_path);
    if (!rule_set.has_value()) {
      std::cerr << "Error: " << rule_set.error() << "\n";
      return 1;
    }
    request.rules = rule_set.take_value().rules;
  }
  if (config->question_sets_path.has_value()) {
    auto catalog = fhirgate::cli::load_question_sets(*config->question_sets_path);
    if (!catalog.has_value()) {
      std::cerr << "Error: " << catalog.error() << "\n";
      return 1;
    }
    request.question_sets = catalog.take_value();
  }
  if (config->external_findings_path.has_value()) {
    auto findings = fhirgate::cli::load_external_findings(*config->external_findings_path);
    if (!findings.has_value()) {
      std::cerr << "Error: " << findings.error() << "\n";
      return 1;
    }
    request.external_findings = findings.take_value();
  }

  auto runtime = fhirgate::cli::Runtime::create(config->global);
  if (!runtime.has_value()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }
  auto& rt = *runtime.value();
  return execute_validate(request, rt.services(), rt.id_gen(), rt.clock());
}
