#pragma once

#include "shared/arg_parser.h"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fhirgate::cli {

// AuditChainVerifyMode controls startup-time hash-chain verification.
// kOff  no verification (default)
// kWarn verify every trace; report corrupt traces to stderr and continue
// kFail verify every trace; refuse to run if any chain is corrupt
enum class AuditChainVerifyMode {
  kOff,
  kWarn,
  kFail,
};

// GlobalConfig holds the flags every subcommand accepts.
struct GlobalConfig {
  std::optional<std::string> db_path;  // NOLINT(readability-identifier-naming)
  bool deterministic{false};           // NOLINT(readability-identifier-naming)
  AuditChainVerifyMode audit_chain_verify{
      AuditChainVerifyMode::kOff};  // NOLINT(readability-identifier-naming)
};

bool parse_audit_chain_verify(GlobalConfig& config, const std::string& value);

// global_options registers the shared flags for a subcommand config that
// carries a GlobalConfig member named global.
template <typename Config>
std::vector<apps::Option<Config>> global_options() {
  return {
      {"--db", true, "SQLite database file (in-memory stores when absent)",
       [](Config& c, const std::string& v) {
         c.global.db_path = v;
         return true;
       }},
      {"--deterministic", false, "Fixed clock and sequential ids",
       [](Config& c, const std::string&) {
         c.global.deterministic = true;
         return true;
       }},
      {"--audit-chain-verify", true, "Verify stored audit chains at startup (off|warn|fail)",
       [](Config& c, const std::string& v) { return parse_audit_chain_verify(c.global, v); }},
  };
}

// with_global_options appends the shared flags to a subcommand's own flags.
template <typename Config>
std::vector<apps::Option<Config>> with_global_options(std::vector<apps::Option<Config>> options) {
  for (auto& opt : global_options<Config>()) {
    options.push_back(std::move(opt));
  }
  return options;
}

}  // namespace fhirgate::cli
