#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fhirgate::apps {

// Option describes one flag of a subcommand. Config is the caller's configuration
// struct; handler fills it and returns false when the value is invalid (after
// printing why to stderr).
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1] and dispatches each flag to its handler.
// Returns nullopt when a flag is unknown, lacks its value, or its handler rejects
// the value; every problem is reported to stderr before returning.
template <typename Config>
std::optional<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  Config config = std::move(default_config);
  bool ok = true;

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << "Unknown option: " << arg << "\n";
      ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      ok = opt->handler(config, "") && ok;
    } else if (i + 1 < argc) {
      ok = opt->handler(config,
                        argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
           ok;
    } else {
      std::cerr << "Option " << arg << " requires a value\n";
      ok = false;
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  return config;
}

// print_usage lists the registered flags of a subcommand.
template <typename Config>
void print_usage(std::ostream& out, const std::string& command,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: fhirgate_cli " << command << " [options]\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
        << "\n";
  }
}

}  // namespace fhirgate::apps
