#include "commands/audit_trace.h"
#include "commands/coverage.h"
#include "commands/review.h"
#include "commands/save_rules.h"
#include "commands/validate.h"

#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: fhirgate_cli <command> [options]\n"
               "Commands:\n"
               "  validate     --record <file> (--rules <file> | --project <id>)\n"
               "  review       --rules <file>\n"
               "  save-rules   --project <id> --rules <file>\n"
               "  coverage     --schema <file> (--rules <file> | --project <id>)\n"
               "  audit-trace  --trace-id <id>\n"
               "Global options: --db <file> --deterministic --audit-chain-verify off|warn|fail\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  try {
    if (command == "validate") {
      return cmd_validate(argc, argv);
    }
    if (command == "review") {
      return cmd_review(argc, argv);
    }
    if (command == "save-rules") {
      return cmd_save_rules(argc, argv);
    }
    if (command == "coverage") {
      return cmd_coverage(argc, argv);
    }
    if (command == "audit-trace") {
      return cmd_audit_trace(argc, argv);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}
