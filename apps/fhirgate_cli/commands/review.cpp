#include "review.h"

#include "inputs.h"
#include "review_logic.h"
#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct ReviewCliConfig {
  std::optional<std::string> rules_path;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_review(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<fhirgate::apps::Option<ReviewCliConfig>> options = {
      {"--rules", true, "Candidate rule set JSON file",
       [](ReviewCliConfig& c, const std::string& v) {
         c.rules_path = v;
         return true;
       }},
  };
  const auto config = fhirgate::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    fhirgate::apps::print_usage(std::cerr, "review", options);
    return 1;
  }
  if (!config->rules_path.has_value()) {
    std::cerr << "Error: --rules <file> is required\n";
    return 1;
  }

  auto rule_set = fhirgate::cli::load_rule_set(*config->rules_path);
  if (!rule_set.has_value()) {
    std::cerr << "Error: " << rule_set.error() << "\n";
    return 1;
  }
  return execute_review(rule_set.value().rules);
}
