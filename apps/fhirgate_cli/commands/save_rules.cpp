#include "save_rules.h"

#include "config.h"
#include "inputs.h"
#include "runtime.h"
#include "save_rules_logic.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct SaveRulesCliConfig {
  fhirgate::cli::GlobalConfig global;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> rules_path;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_save_rules(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = fhirgate::cli::with_global_options<SaveRulesCliConfig>({
      {"--project", true, "Project id",
       [](SaveRulesCliConfig& c, const std::string& v) {
         c.project_id = v;
         return true;
       }},
      {"--rules", true, "Candidate rule set JSON file",
       [](SaveRulesCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
  });
  const auto config = fhirgate::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    fhirgate::apps::print_usage(std::cerr, "save-rules", options);
    return 1;
  }
  if (!config->project_id.has_value() || !config->rules_path.has_value()) {
    std::cerr << "Error: --project <id> and --rules <file> are required\n";
    return 1;
  }

  auto rule_set = fhirgate::cli::load_rule_set(*config->rules_path);
  if (!rule_set.has_value()) {
    std::cerr << "Error: " << rule_set.error() << "\n";
    return 1;
  }

  auto runtime = fhirgate::cli::Runtime::create(config->global);
  if (!runtime.has_value()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }
  auto& rt = *runtime.value();

  fhirgate::app::RuleSetSaveRequest request;
  request.project_id = *config->project_id;
  request.rule_set = rule_set.take_value();
  return execute_save_rules(request, rt.services(), rt.id_gen(), rt.clock());
}
