#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/domain/rule_type.h"
#include "fhirgate/domain/schema_node.h"
#include "fhirgate/path/path_matcher.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fhirgate::coverage {

enum class CoverageStatus {
  kCovered,
  kSuggested,
  kUncovered,
};

[[nodiscard]] std::string coverage_status_to_string(CoverageStatus status);

// Suggestion is a candidate rule an authoring assistant proposes for a path.
struct Suggestion {
  std::string id;                              // NOLINT(readability-identifier-naming)
  std::string path;                            // NOLINT(readability-identifier-naming)
  std::optional<domain::RuleType> rule_type;   // NOLINT(readability-identifier-naming)
};

[[nodiscard]] core::Result<std::vector<Suggestion>, core::ConfigError> suggestions_from_json(
    const nlohmann::json& j);

struct CoverageNode {
  std::string path;                                  // NOLINT(readability-identifier-naming)
  CoverageStatus status{CoverageStatus::kUncovered};  // NOLINT(readability-identifier-naming)
  std::optional<path::MatchType> match_type;         // NOLINT(readability-identifier-naming)
  std::optional<std::string> rule_id;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> suggestion_id;          // NOLINT(readability-identifier-naming)
};

struct CoverageSummary {
  std::size_t total{0};                 // NOLINT(readability-identifier-naming)
  std::size_t covered{0};               // NOLINT(readability-identifier-naming)
  std::size_t suggested{0};             // NOLINT(readability-identifier-naming)
  std::size_t uncovered{0};             // NOLINT(readability-identifier-naming)
  std::size_t exact{0};                 // NOLINT(readability-identifier-naming)
  std::size_t wildcard{0};              // NOLINT(readability-identifier-naming)
  std::size_t parent{0};                // NOLINT(readability-identifier-naming)
  int coverage_percentage{0};           // NOLINT(readability-identifier-naming)
};

struct CoverageReport {
  std::string resource_type;        // NOLINT(readability-identifier-naming)
  std::vector<CoverageNode> nodes;  // NOLINT(readability-identifier-naming)
  CoverageSummary summary;          // NOLINT(readability-identifier-naming)
};

struct RuleMatch {
  std::size_t index{0};                         // NOLINT(readability-identifier-naming)
  path::MatchType type{path::MatchType::kExact};  // NOLINT(readability-identifier-naming)
};

// match_best_rule picks the rule that covers target_path.
//
// Precondition: ordered_rules is in authoring order. Rules for other resource
// types, disabled rules and record-scoped rules never match. Among the rest,
// the first exact match wins, then the first wildcard match, then the first
// parent match. The returned index refers to ordered_rules.
[[nodiscard]] std::optional<RuleMatch> match_best_rule(const std::vector<domain::Rule>& ordered_rules,
                                                       const std::string& resource_type,
                                                       const std::string& target_path);

// analyze_coverage classifies every schema path below root. A rule match makes
// a path covered; otherwise a suggestion match makes it suggested.
[[nodiscard]] CoverageReport analyze_coverage(const domain::SchemaNode& root,
                                              const std::vector<domain::Rule>& rules,
                                              const std::vector<Suggestion>& suggestions = {});

[[nodiscard]] CoverageSummary summarize(const std::vector<CoverageNode>& nodes);

[[nodiscard]] nlohmann::json coverage_report_to_json(const CoverageReport& report);

}  // namespace fhirgate::coverage
