#pragma once

#include "fhirgate/domain/rule_type.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace fhirgate::domain {

// Validation layer a finding originates from.
enum class FindingSource {
  kStructural,
  kBusiness,
  kTerminology,
  kReference,
  kLint,
  kSpecHint,
};

[[nodiscard]] std::string finding_source_to_string(FindingSource source);
[[nodiscard]] std::optional<FindingSource> string_to_finding_source(const std::string& str);

// Finding is one failed check at one concrete location.
// Whether it blocks is not stored here; the aggregator derives it from the layer table.
struct Finding {
  FindingSource source{FindingSource::kBusiness};  // NOLINT(readability-identifier-naming)
  Severity severity{Severity::kError};             // NOLINT(readability-identifier-naming)
  std::string code;                                // NOLINT(readability-identifier-naming)
  std::string path;                                // NOLINT(readability-identifier-naming)
  std::string message;                             // NOLINT(readability-identifier-naming)
  std::optional<std::string> rule_id;              // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> entry_index;          // NOLINT(readability-identifier-naming)
  nlohmann::json details = nlohmann::json::object();  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json finding_to_json(const Finding& finding);

// Parses a finding produced by an external layer. Returns nullopt when source,
// severity or code is missing or unknown.
[[nodiscard]] std::optional<Finding> finding_from_json(const nlohmann::json& j);

}  // namespace fhirgate::domain
