#pragma once

#include "fhirgate/core/clock.h"
#include "fhirgate/core/id_generator.h"
#include "fhirgate/core/result.h"
#include "fhirgate/core/services.h"
#include "fhirgate/coverage/coverage_analyzer.h"
#include "fhirgate/domain/finding.h"
#include "fhirgate/domain/question_set.h"
#include "fhirgate/domain/rule.h"
#include "fhirgate/domain/schema_node.h"
#include "fhirgate/governance/rule_review.h"
#include "fhirgate/storage/audit_event.h"
#include "fhirgate/validation/reference_layer.h"
#include "fhirgate/validation/validation_report.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace fhirgate::app {

// ────────────────────────────────────────────────────────────────
// Validation Pipeline
// ────────────────────────────────────────────────────────────────

struct ValidationPipelineRequest {
  nlohmann::json record;  // NOLINT(readability-identifier-naming)

  // Rules to apply: either given inline or loaded from a project's stored set.
  std::optional<std::vector<domain::Rule>> rules;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;           // NOLINT(readability-identifier-naming)

  domain::QuestionSetCatalog question_sets;  // NOLINT(readability-identifier-naming)
  validation::ReferencePolicy reference_policy{
      validation::ReferencePolicy::kInBundleOnly};  // NOLINT(readability-identifier-naming)

  // Findings of external layers (structural, terminology, advisory) for this record.
  std::vector<domain::Finding> external_findings;  // NOLINT(readability-identifier-naming)

  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct ValidationPipelineResponse {
  std::string trace_id;                                                 // NOLINT(readability-identifier-naming)
  core::Result<validation::ValidationReport, core::ConfigError> outcome;  // NOLINT(readability-identifier-naming)
};

// Runs business rules and the built-in layers (reference, lint) plus any external layers,
// then aggregates.
// Emits audit events: ValidationStarted, then ValidationCompleted or ValidationRejected.
// Throws std::invalid_argument when neither rules nor a stored project set are available.
[[nodiscard]] ValidationPipelineResponse run_validation_pipeline(
    const ValidationPipelineRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Rule-Set Save Pipeline (governance gated)
// ────────────────────────────────────────────────────────────────

struct RuleSetSaveRequest {
  std::string project_id;               // NOLINT(readability-identifier-naming)
  domain::RuleSet rule_set;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct RuleSetSaveResponse {
  std::string trace_id;                           // NOLINT(readability-identifier-naming)
  bool saved{false};                              // NOLINT(readability-identifier-naming)
  std::optional<int> revision;                    // NOLINT(readability-identifier-naming)
  std::vector<governance::ReviewResult> reviews;  // NOLINT(readability-identifier-naming)
};

// Reviews the whole candidate set and replaces the project's stored set only when
// no rule is BLOCKED. All review results are returned either way.
// Emits audit events: RuleSetReviewCompleted, then RuleSetSaved or RuleSetSaveRejected.
// Throws std::runtime_error when the store fails.
[[nodiscard]] RuleSetSaveResponse run_rule_set_save_pipeline(const RuleSetSaveRequest& req,
                                                             core::Services& services,
                                                             core::IIdGenerator& id_gen,
                                                             core::IClock& clock);

[[nodiscard]] nlohmann::json save_response_to_json(const RuleSetSaveResponse& response);

// ────────────────────────────────────────────────────────────────
// Coverage Pipeline
// ────────────────────────────────────────────────────────────────

struct CoveragePipelineRequest {
  domain::SchemaNode schema;                            // NOLINT(readability-identifier-naming)
  std::optional<std::vector<domain::Rule>> rules;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> project_id;                // NOLINT(readability-identifier-naming)
  std::vector<coverage::Suggestion> suggestions;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;                  // NOLINT(readability-identifier-naming)
};

struct CoveragePipelineResponse {
  std::string trace_id;              // NOLINT(readability-identifier-naming)
  coverage::CoverageReport report;   // NOLINT(readability-identifier-naming)
};

// Emits audit event: CoverageAnalyzed.
[[nodiscard]] CoveragePipelineResponse run_coverage_pipeline(const CoveragePipelineRequest& req,
                                                             core::Services& services,
                                                             core::IIdGenerator& id_gen,
                                                             core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

[[nodiscard]] nlohmann::json audit_events_to_json(const std::vector<storage::AuditEvent>& events);

}  // namespace fhirgate::app
