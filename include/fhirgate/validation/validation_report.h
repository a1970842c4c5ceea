#pragma once

#include "fhirgate/domain/finding.h"
#include "fhirgate/validation/layer.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fhirgate::validation {

enum class Verdict {
  kCompliant,
  kCompliantWithRecommendations,
  kNonCompliant,
};

[[nodiscard]] std::string verdict_to_string(Verdict verdict);

struct AggregatedFinding {
  domain::Finding finding;  // NOLINT(readability-identifier-naming)
  bool blocking{false};     // NOLINT(readability-identifier-naming)
};

struct LayerCount {
  std::size_t total{0};     // NOLINT(readability-identifier-naming)
  std::size_t blocking{0};  // NOLINT(readability-identifier-naming)
};

// ValidationReport is the combined verdict over every layer's findings.
// Counts are derived from findings by aggregate_findings and never edited after.
struct ValidationReport {
  std::vector<AggregatedFinding> findings;        // NOLINT(readability-identifier-naming)
  std::size_t must_fix{0};                        // NOLINT(readability-identifier-naming)
  std::size_t recommendations{0};                 // NOLINT(readability-identifier-naming)
  std::array<LayerCount, kLayerCount> layers{};   // NOLINT(readability-identifier-naming)
  Verdict verdict{Verdict::kCompliant};           // NOLINT(readability-identifier-naming)
};

// aggregate_findings computes blocking per finding from the layer table, then the
// counts and the verdict. Finding order is preserved.
//   no blocking finding, nothing else   kCompliant
//   no blocking finding, some advisory  kCompliantWithRecommendations
//   any blocking finding                kNonCompliant
[[nodiscard]] ValidationReport aggregate_findings(std::vector<domain::Finding> findings);

// FindingGroup indexes into ValidationReport::findings.
struct FindingGroup {
  domain::FindingSource source{domain::FindingSource::kBusiness};  // NOLINT(readability-identifier-naming)
  std::string code;                                                 // NOLINT(readability-identifier-naming)
  std::optional<std::string> rule_id;                               // NOLINT(readability-identifier-naming)
  std::vector<std::size_t> members;                                 // NOLINT(readability-identifier-naming)
};

struct GroupedFindings {
  std::vector<FindingGroup> groups;     // NOLINT(readability-identifier-naming)
  std::vector<std::size_t> ungrouped;   // NOLINT(readability-identifier-naming)
};

// group_findings is a display transform. Findings sharing (source, code), and for
// business findings also rule id, form a group when there are at least two of them.
// Groups appear in order of their first member; every finding lands in exactly one
// group or in ungrouped.
[[nodiscard]] GroupedFindings group_findings(const ValidationReport& report);

[[nodiscard]] nlohmann::json report_to_json(const ValidationReport& report);

}  // namespace fhirgate::validation
