#pragma once

#include "fhirgate/core/result.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace fhirgate::apps {

// load_json_file reads and parses a whole JSON document.
inline core::Result<nlohmann::json, std::string> load_json_file(const std::string& path) {
  using LoadResult = core::Result<nlohmann::json, std::string>;

  std::ifstream in(path);
  if (!in) {
    return LoadResult::err("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json parsed = nlohmann::json::parse(buffer.str(), nullptr, false);
  if (parsed.is_discarded()) {
    return LoadResult::err(path + " is not valid JSON");
  }
  return LoadResult::ok(std::move(parsed));
}

}  // namespace fhirgate::apps
