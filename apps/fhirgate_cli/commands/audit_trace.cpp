#include "audit_trace.h"

#include "audit_trace_logic.h"
#include "config.h"
#include "runtime.h"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct AuditTraceCliConfig {
  fhirgate::cli::GlobalConfig global;   // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_audit_trace(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = fhirgate::cli::with_global_options<AuditTraceCliConfig>({
      {"--trace-id", true, "Trace to print",
       [](AuditTraceCliConfig& c, const std::string& v) {
         c.trace_id = v;
         return true;
       }},
  });
  const auto config = fhirgate::apps::parse_options(argc, argv, options, 2);
  if (!config.has_value()) {
    fhirgate::apps::print_usage(std::cerr, "audit-trace", options);
    return 1;
  }
  if (!config->trace_id.has_value() || config->trace_id->empty()) {
    std::cerr << "Error: --trace-id <id> is required\n";
    return 1;
  }

  auto runtime = fhirgate::cli::Runtime::create(config->global);
  if (!runtime.has_value()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }

  try {
    return execute_audit_trace(*config->trace_id, runtime.value()->services());
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
