#include "fhirgate/app/app_service.h"

#include "fhirgate/core/ids.h"
#include "fhirgate/validation/layer.h"
#include "fhirgate/validation/lint_layer.h"
#include "fhirgate/validation/validation_engine.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fhirgate::app {

namespace {

using nlohmann::json;

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const std::string& event_type, const json& payload,
          std::vector<std::string> refs = {}) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

std::string resolve_trace_id(const std::optional<std::string>& requested,
                             core::IIdGenerator& id_gen) {
  return requested.has_value() ? *requested : core::new_trace_id(id_gen).value;
}

// Inline rules win; otherwise the project's stored set.
std::vector<domain::Rule> resolve_rules(const std::optional<std::vector<domain::Rule>>& rules,
                                        const std::optional<std::string>& project_id,
                                        core::Services& services) {
  if (rules.has_value()) {
    return *rules;
  }
  if (project_id.has_value()) {
    auto stored = services.rule_sets.get(*project_id);
    if (!stored.has_value()) {
      throw std::invalid_argument("No rule set stored for project: " + *project_id);
    }
    return stored->rule_set.rules;
  }
  throw std::invalid_argument("Must provide either rules or project_id");
}

std::vector<std::string> project_refs(const std::optional<std::string>& project_id) {
  if (project_id.has_value()) {
    return {*project_id};
  }
  return {};
}

// One replay layer per external source, in order of first appearance.
std::vector<std::unique_ptr<const validation::IValidationLayer>> external_layers(
    const std::vector<domain::Finding>& findings) {
  std::vector<domain::FindingSource> order;
  std::map<domain::FindingSource, std::vector<domain::Finding>> by_source;
  for (const auto& finding : findings) {
    auto& bucket = by_source[finding.source];
    if (bucket.empty()) {
      order.push_back(finding.source);
    }
    bucket.push_back(finding);
  }

  std::vector<std::unique_ptr<const validation::IValidationLayer>> layers;
  for (const auto source : order) {
    layers.push_back(std::make_unique<validation::PrecomputedFindingsLayer>(
        source, std::move(by_source[source])));
  }
  return layers;
}

}  // namespace

ValidationPipelineResponse run_validation_pipeline(const ValidationPipelineRequest& req,
                                                   core::Services& services,
                                                   core::IIdGenerator& id_gen,
                                                   core::IClock& clock) {
  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);
  const auto refs = project_refs(req.project_id);

  auto rules = resolve_rules(req.rules, req.project_id, services);

  emit(services, id_gen, clock, trace_id, "ValidationStarted",
       {{"rule_count", rules.size()},
        {"reference_policy", validation::reference_policy_to_string(req.reference_policy)},
        {"external_finding_count", req.external_findings.size()}},
       refs);

  std::vector<std::unique_ptr<const validation::IValidationLayer>> layers;
  layers.push_back(std::make_unique<validation::ReferenceIntegrityLayer>(req.reference_policy));
  layers.push_back(std::make_unique<validation::LintLayer>());
  for (auto& layer : external_layers(req.external_findings)) {
    layers.push_back(std::move(layer));
  }

  const validation::ValidationEngine engine(std::move(rules), req.question_sets, std::move(layers));
  auto outcome = engine.validate(req.record);

  if (!outcome.has_value()) {
    const auto& error = outcome.error();
    emit(services, id_gen, clock, trace_id, "ValidationRejected",
         {{"kind", core::config_error_kind_to_string(error.kind)},
          {"rule_id", error.rule_id},
          {"reason", error.reason}},
         refs);
  } else {
    const auto& report = outcome.value();
    emit(services, id_gen, clock, trace_id, "ValidationCompleted",
         {{"verdict", validation::verdict_to_string(report.verdict)},
          {"finding_count", report.findings.size()},
          {"must_fix", report.must_fix},
          {"recommendations", report.recommendations}},
         refs);
  }

  return ValidationPipelineResponse{trace_id, std::move(outcome)};
}

RuleSetSaveResponse run_rule_set_save_pipeline(const RuleSetSaveRequest& req,
                                               core::Services& services,
                                               core::IIdGenerator& id_gen, core::IClock& clock) {
  if (req.project_id.empty()) {
    throw std::invalid_argument("project_id must not be empty");
  }

  RuleSetSaveResponse response;
  response.trace_id = resolve_trace_id(req.trace_id, id_gen);
  response.reviews = governance::review_rule_set(req.rule_set.rules);

  std::size_t blocked = 0;
  std::size_t warning = 0;
  json blocked_ids = json::array();
  for (const auto& review : response.reviews) {
    if (review.status == governance::ReviewStatus::kBlocked) {
      ++blocked;
      blocked_ids.push_back(review.rule_id);
    } else if (review.status == governance::ReviewStatus::kWarning) {
      ++warning;
    }
  }

  emit(services, id_gen, clock, response.trace_id, "RuleSetReviewCompleted",
       {{"rule_count", response.reviews.size()},
        {"blocked", blocked},
        {"warning", warning},
        {"ok", response.reviews.size() - blocked - warning}},
       {req.project_id});

  if (!governance::is_persist_eligible(response.reviews)) {
    emit(services, id_gen, clock, response.trace_id, "RuleSetSaveRejected",
         {{"reason", "blocked"}, {"blocked_rule_ids", blocked_ids}}, {req.project_id});
    return response;
  }

  auto replaced = services.rule_sets.replace(req.project_id, req.rule_set, clock.now_iso8601());
  if (!replaced.has_value()) {
    emit(services, id_gen, clock, response.trace_id, "RuleSetSaveRejected",
         {{"reason", "store_error"}, {"error", replaced.error()}}, {req.project_id});
    throw std::runtime_error("Failed to save rule set for project " + req.project_id + ": " +
                             replaced.error());
  }

  response.saved = true;
  response.revision = replaced.value();
  emit(services, id_gen, clock, response.trace_id, "RuleSetSaved",
       {{"revision", replaced.value()}, {"rule_count", req.rule_set.rules.size()}},
       {req.project_id});
  return response;
}

nlohmann::json save_response_to_json(const RuleSetSaveResponse& response) {
  json j = {{"trace_id", response.trace_id},
            {"saved", response.saved},
            {"reviews", governance::review_results_to_json(response.reviews)}};
  if (response.revision.has_value()) {
    j["revision"] = *response.revision;
  }
  return j;
}

CoveragePipelineResponse run_coverage_pipeline(const CoveragePipelineRequest& req,
                                               core::Services& services,
                                               core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = resolve_trace_id(req.trace_id, id_gen);
  const auto rules = resolve_rules(req.rules, req.project_id, services);

  CoveragePipelineResponse response{trace_id,
                                    coverage::analyze_coverage(req.schema, rules, req.suggestions)};

  const auto& summary = response.report.summary;
  emit(services, id_gen, clock, trace_id, "CoverageAnalyzed",
       {{"resource_type", response.report.resource_type},
        {"total", summary.total},
        {"covered", summary.covered},
        {"suggested", summary.suggested},
        {"uncovered", summary.uncovered},
        {"coverage_percentage", summary.coverage_percentage}},
       project_refs(req.project_id));
  return response;
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

nlohmann::json audit_events_to_json(const std::vector<storage::AuditEvent>& events) {
  json out = json::array();
  for (const auto& event : events) {
    json payload = json::parse(event.payload, nullptr, false);
    if (payload.is_discarded()) {
      payload = event.payload;
    }
    out.push_back({{"event_id", event.event_id},
                   {"trace_id", event.trace_id},
                   {"event_type", event.event_type},
                   {"payload", payload},
                   {"created_at", event.created_at},
                   {"refs", event.refs},
                   {"previous_hash", event.previous_hash},
                   {"event_hash", event.event_hash}});
  }
  return out;
}

}  // namespace fhirgate::app
