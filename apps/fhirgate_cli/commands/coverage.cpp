#include "coverage.h"

#include "config.h"
#include "coverage_logic.h"
#include "inputs.h"
#include "runtime.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CoverageCliConfig {
  fhirgate::cli::GlobalConfig global;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> schema_path;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> rules_path;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> suggestions_path;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_coverage(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = fhirgate::cli::with_global_options<CoverageCliConfig>({
      {"--schema", true, "Schema tree JSON file",
       [](CoverageCliConfig& c, const std::string& v) {
         c.schema_path = v;
         return true;
       }},
      {"--rules", true, "Rule set JSON file",
       [](CoverageCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
      {"--project", true, "Project whose stored rule set applies",
       [](CoverageCliConfig& c, const std::string& v) {
         c.project_id = v;
         return true;
       }},
      {"--suggestions", true, "Suggestion candidates JSON file",
       [](CoverageCliConfig& c, const std::string& v) {
         c.suggestions_path = v;
         return true;
       }},
  });
  const auto config = fhirgate::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    fhirgate::apps::print_usage(std::cerr, "coverage", options);
    return 1;
  }
  if (!config->schema_path.has_value()) {
    std::cerr << "Error: --schema <file> is required\n";
    return 1;
  }
  if (config->rules_path.has_value() == config->project_id.has_value()) {
    std::cerr << "Error: exactly one of --rules <file> or --project <id> is required\n";
    return 1;
  }

  fhirgate::app::CoveragePipelineRequest request;
  request.project_id = config->project_id;

  auto schema = fhirgate::cli::load_schema(*config->schema_path);
  if (!schema.has_value()) {
    std::cerr << "Error: " << schema.error() << "\n";
    return 1;
  }
  request.schema = schema.take_value();

  if (config->rules_path.has_value()) {
    auto rule_set = fhirgate::cli::load_rule_set(*config->rules_path);
    if (!rule_set.has_value()) {
      std::cerr << "Error: " << rule_set.error() << "\n";
      return 1;
    }
    request.rules = rule_set.take_value().rules;
  }
  if (config->suggestions_path.has_value()) {
    auto suggestions = fhirgate::cli::load_suggestions(*config->suggestions_path);
    if (!suggestions.has_value()) {
      std::cerr << "Error: " << suggestions.error() << "\n";
      return 1;
    }
    request.suggestions = suggestions.take_value();
  }

  auto runtime = fhirgate::cli::Runtime::create(config->global);
  if (!runtime.has_value()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }
  auto& rt = *runtime.value();
  return execute_coverage(request, rt.services(), rt.id_gen(), rt.clock());
}
