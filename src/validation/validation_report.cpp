#include "fhirgate/validation/validation_report.h"

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

namespace fhirgate::validation {

std::string verdict_to_string(const Verdict verdict) {
  switch (verdict) {
    case Verdict::kCompliant:
      return "compliant";
    case Verdict::kCompliantWithRecommendations:
      return "compliant_with_recommendations";
    case Verdict::kNonCompliant:
      return "non_compliant";
  }
  return "non_compliant";
}

ValidationReport aggregate_findings(std::vector<domain::Finding> findings) {
  ValidationReport report;
  report.findings.reserve(findings.size());

  for (auto& finding : findings) {
    const bool blocking = is_blocking(finding.severity, finding.source);
    auto& layer = report.layers[static_cast<std::size_t>(finding.source)];
    ++layer.total;
    if (blocking) {
      ++layer.blocking;
      ++report.must_fix;
    } else {
      ++report.recommendations;
    }
    report.findings.push_back({std::move(finding), blocking});
  }

  if (report.must_fix > 0) {
    report.verdict = Verdict::kNonCompliant;
  } else if (report.recommendations > 0) {
    report.verdict = Verdict::kCompliantWithRecommendations;
  } else {
    report.verdict = Verdict::kCompliant;
  }
  return report;
}

GroupedFindings group_findings(const ValidationReport& report) {
  using GroupKey = std::tuple<domain::FindingSource, std::string, std::string>;

  std::map<GroupKey, std::vector<std::size_t>> members;
  std::vector<GroupKey> first_seen;
  for (std::size_t i = 0; i < report.findings.size(); ++i) {
    const auto& finding = report.findings[i].finding;
    std::string rule_key;
    if (finding.source == domain::FindingSource::kBusiness) {
      rule_key = finding.rule_id.value_or("");
    }
    GroupKey key{finding.source, finding.code, rule_key};
    auto& bucket = members[key];
    if (bucket.empty()) {
      first_seen.push_back(key);
    }
    bucket.push_back(i);
  }

  GroupedFindings grouped;
  for (const auto& key : first_seen) {
    const auto& bucket = members.at(key);
    if (bucket.size() < 2) {
      grouped.ungrouped.push_back(bucket.front());
      continue;
    }
    FindingGroup group;
    group.source = std::get<0>(key);
    group.code = std::get<1>(key);
    if (group.source == domain::FindingSource::kBusiness) {
      group.rule_id = report.findings[bucket.front()].finding.rule_id;
    }
    group.members = bucket;
    grouped.groups.push_back(std::move(group));
  }
  std::sort(grouped.ungrouped.begin(), grouped.ungrouped.end());
  return grouped;
}

nlohmann::json report_to_json(const ValidationReport& report) {
  nlohmann::json j;

  nlohmann::json findings = nlohmann::json::array();
  for (const auto& aggregated : report.findings) {
    auto finding_json = domain::finding_to_json(aggregated.finding);
    finding_json["blocking"] = aggregated.blocking;
    findings.push_back(finding_json);
  }
  j["findings"] = findings;

  nlohmann::json layers = nlohmann::json::object();
  for (const auto& info : kLayerTable) {
    const auto& count = report.layers[static_cast<std::size_t>(info.source)];
    layers[std::string(info.name)] = {{"total", count.total},
                                      {"blocking", count.blocking},
                                      {"blocking_capable", info.blocking_capable}};
  }
  j["layers"] = layers;

  const auto grouped = group_findings(report);
  nlohmann::json groups = nlohmann::json::array();
  for (const auto& group : grouped.groups) {
    nlohmann::json group_json;
    group_json["source"] = domain::finding_source_to_string(group.source);
    group_json["code"] = group.code;
    group_json["rule_id"] = group.rule_id.has_value() ? nlohmann::json(group.rule_id.value())
                                                      : nlohmann::json(nullptr);
    group_json["members"] = group.members;
    groups.push_back(group_json);
  }
  j["groups"] = groups;
  j["ungrouped"] = grouped.ungrouped;

  j["must_fix"] = report.must_fix;
  j["recommendations"] = report.recommendations;
  j["verdict"] = verdict_to_string(report.verdict);
  return j;
}

}  // namespace fhirgate::validation
