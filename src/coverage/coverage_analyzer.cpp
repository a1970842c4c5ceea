#include "fhirgate/coverage/coverage_analyzer.h"

#include "fhirgate/path/path_normalizer.h"

#include <utility>

namespace fhirgate::coverage {

namespace {

using nlohmann::json;

bool takes_part(const domain::Rule& rule, const std::string& resource_type) {
  return rule.enabled && !rule.is_record_scoped() && rule.resource_type == resource_type;
}

}  // namespace

std::string coverage_status_to_string(const CoverageStatus status) {
  switch (status) {
    case CoverageStatus::kCovered:
      return "covered";
    case CoverageStatus::kSuggested:
      return "suggested";
    case CoverageStatus::kUncovered:
      return "uncovered";
  }
  return "uncovered";
}

core::Result<std::vector<Suggestion>, core::ConfigError> suggestions_from_json(const json& j) {
  using SuggestionsResult = core::Result<std::vector<Suggestion>, core::ConfigError>;
  const json& items = j.is_object() && j.contains("suggestions") ? j.at("suggestions") : j;
  if (!items.is_array()) {
    return SuggestionsResult::err(
        {core::ConfigErrorKind::kInvalidDocument, "", "suggestions must be an array"});
  }

  std::vector<Suggestion> suggestions;
  for (const auto& item : items) {
    if (!item.is_object() || !item.contains("path") || !item.at("path").is_string()) {
      return SuggestionsResult::err(
          {core::ConfigErrorKind::kInvalidDocument, "", "suggestion needs a string 'path'"});
    }
    Suggestion suggestion;
    suggestion.path = item.at("path").get<std::string>();
    suggestion.id = item.contains("id") && item.at("id").is_string()
                        ? item.at("id").get<std::string>()
                        : suggestion.path;
    const std::string type_name = item.contains("ruleType") && item.at("ruleType").is_string()
                                      ? item.at("ruleType").get<std::string>()
                                      : "";
    if (!type_name.empty()) {
      suggestion.rule_type = domain::string_to_rule_type(type_name);
      if (!suggestion.rule_type.has_value()) {
        return SuggestionsResult::err({core::ConfigErrorKind::kInvalidDocument, "",
                                       "suggestion '" + suggestion.id +
                                           "' has unknown ruleType '" + type_name + "'"});
      }
    }
    suggestions.push_back(std::move(suggestion));
  }
  return SuggestionsResult::ok(std::move(suggestions));
}

std::optional<RuleMatch> match_best_rule(const std::vector<domain::Rule>& ordered_rules,
                                         const std::string& resource_type,
                                         const std::string& target_path) {
  // Keep the mapping back to ordered_rules so the caller sees original indices.
  std::vector<std::string> paths;
  std::vector<std::size_t> origin;
  for (std::size_t i = 0; i < ordered_rules.size(); ++i) {
    const auto& rule = ordered_rules[i];
    if (!takes_part(rule, resource_type)) {
      continue;
    }
    paths.push_back(path::normalize_path(rule.field_path, resource_type));
    origin.push_back(i);
  }

  const auto best = path::match_best_path(paths, target_path);
  if (!best.has_value()) {
    return std::nullopt;
  }
  return RuleMatch{origin[best->index], best->type};
}

CoverageReport analyze_coverage(const domain::SchemaNode& root,
                                const std::vector<domain::Rule>& rules,
                                const std::vector<Suggestion>& suggestions) {
  CoverageReport report;
  report.resource_type = root.name.empty() ? root.path : root.name;

  std::vector<std::string> suggestion_paths;
  suggestion_paths.reserve(suggestions.size());
  for (const auto& suggestion : suggestions) {
    suggestion_paths.push_back(path::normalize_path(suggestion.path, report.resource_type));
  }

  for (const auto& schema_path : domain::flatten_schema_paths(root)) {
    CoverageNode node;
    node.path = schema_path;

    if (const auto rule_match = match_best_rule(rules, report.resource_type, schema_path)) {
      node.status = CoverageStatus::kCovered;
      node.match_type = rule_match->type;
      node.rule_id = rules[rule_match->index].id;
    } else if (const auto suggestion_match = path::match_best_path(suggestion_paths, schema_path)) {
      node.status = CoverageStatus::kSuggested;
      node.match_type = suggestion_match->type;
      node.suggestion_id = suggestions[suggestion_match->index].id;
    }
    report.nodes.push_back(std::move(node));
  }

  report.summary = summarize(report.nodes);
  return report;
}

CoverageSummary summarize(const std::vector<CoverageNode>& nodes) {
  CoverageSummary summary;
  summary.total = nodes.size();
  for (const auto& node : nodes) {
    switch (node.status) {
      case CoverageStatus::kCovered:
        ++summary.covered;
        break;
      case CoverageStatus::kSuggested:
        ++summary.suggested;
        break;
      case CoverageStatus::kUncovered:
        ++summary.uncovered;
        break;
    }
    // Match-type counts describe covered paths only.
    if (node.status != CoverageStatus::kCovered || !node.match_type.has_value()) {
      continue;
    }
    switch (*node.match_type) {
      case path::MatchType::kExact:
        ++summary.exact;
        break;
      case path::MatchType::kWildcard:
        ++summary.wildcard;
        break;
      case path::MatchType::kParent:
        ++summary.parent;
        break;
    }
  }
  if (summary.total > 0) {
    summary.coverage_percentage =
        static_cast<int>((summary.covered * 200 + summary.total) / (summary.total * 2));
  }
  return summary;
}

json coverage_report_to_json(const CoverageReport& report) {
  json nodes = json::array();
  for (const auto& node : report.nodes) {
    json j = {{"path", node.path}, {"status", coverage_status_to_string(node.status)}};
    if (node.match_type.has_value()) {
      j["match_type"] = path::match_type_to_string(*node.match_type);
    }
    if (node.rule_id.has_value()) {
      j["rule_id"] = *node.rule_id;
    }
    if (node.suggestion_id.has_value()) {
      j["suggestion_id"] = *node.suggestion_id;
    }
    nodes.push_back(std::move(j));
  }

  const auto& s = report.summary;
  return {{"resource_type", report.resource_type},
          {"nodes", nodes},
          {"summary",
           {{"total", s.total},
            {"covered", s.covered},
            {"suggested", s.suggested},
            {"uncovered", s.uncovered},
            {"exact", s.exact},
            {"wildcard", s.wildcard},
            {"parent", s.parent},
            {"coverage_percentage", s.coverage_percentage}}}};
}

}  // namespace fhirgate::coverage
