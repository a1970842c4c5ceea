#include "fhirgate/domain/finding.h"

#include <cstdint>

namespace fhirgate::domain {

std::string finding_source_to_string(const FindingSource source) {
  switch (source) {
    case FindingSource::kStructural:
      return "structural";
    case FindingSource::kBusiness:
      return "business";
    case FindingSource::kTerminology:
      return "terminology";
    case FindingSource::kReference:
      return "reference";
    case FindingSource::kLint:
      return "lint";
    case FindingSource::kSpecHint:
      return "spec-hint";
  }
  return "business";
}

std::optional<FindingSource> string_to_finding_source(const std::string& str) {
  if (str == "structural") {
    return FindingSource::kStructural;
  }
  if (str == "business") {
    return FindingSource::kBusiness;
  }
  if (str == "terminology") {
    return FindingSource::kTerminology;
  }
  if (str == "reference") {
    return FindingSource::kReference;
  }
  if (str == "lint") {
    return FindingSource::kLint;
  }
  if (str == "spec-hint") {
    return FindingSource::kSpecHint;
  }
  return std::nullopt;
}

nlohmann::json finding_to_json(const Finding& finding) {
  nlohmann::json j;
  j["code"] = finding.code;
  j["details"] = finding.details;
  if (finding.entry_index.has_value()) {
    j["entry_index"] = finding.entry_index.value();
  } else {
    j["entry_index"] = nullptr;
  }
  j["message"] = finding.message;
  j["path"] = finding.path;
  if (finding.rule_id.has_value()) {
    j["rule_id"] = finding.rule_id.value();
  } else {
    j["rule_id"] = nullptr;
  }
  j["severity"] = severity_to_string(finding.severity);
  j["source"] = finding_source_to_string(finding.source);
  return j;
}

std::optional<Finding> finding_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("source") || !j.contains("severity") || !j.contains("code")) {
    return std::nullopt;
  }
  if (!j.at("source").is_string() || !j.at("severity").is_string() || !j.at("code").is_string()) {
    return std::nullopt;
  }

  const auto source = string_to_finding_source(j.at("source").get<std::string>());
  const auto severity = string_to_severity(j.at("severity").get<std::string>());
  if (!source.has_value() || !severity.has_value()) {
    return std::nullopt;
  }

  Finding finding;
  finding.source = source.value();
  finding.severity = severity.value();
  finding.code = j.at("code").get<std::string>();
  if (j.contains("path") && j.at("path").is_string()) {
    finding.path = j.at("path").get<std::string>();
  }
  if (j.contains("message") && j.at("message").is_string()) {
    finding.message = j.at("message").get<std::string>();
  }
  if (j.contains("rule_id") && j.at("rule_id").is_string()) {
    finding.rule_id = j.at("rule_id").get<std::string>();
  }
  if (j.contains("entry_index") && j.at("entry_index").is_number_integer() &&
      j.at("entry_index").get<std::int64_t>() >= 0) {
    finding.entry_index = j.at("entry_index").get<std::size_t>();
  }
  if (j.contains("details") && j.at("details").is_object()) {
    finding.details = j.at("details");
  }
  return finding;
}

}  // namespace fhirgate::domain
