#include "inputs.h"

#include "fhirgate/domain/rule_json.h"

#include "shared/json_file.h"

#include <utility>

namespace fhirgate::cli {

namespace {

template <typename T>
core::Result<T, std::string> from_config_result(core::Result<T, core::ConfigError> parsed,
                                                const std::string& path) {
  if (!parsed.has_value()) {
    const auto& error = parsed.error();
    std::string where = error.rule_id.empty() ? "" : " (rule " + error.rule_id + ")";
    return core::Result<T, std::string>::err(path + ": " +
                                             core::config_error_kind_to_string(error.kind) +
                                             where + ": " + error.reason);
  }
  return core::Result<T, std::string>::ok(parsed.take_value());
}

}  // namespace

core::Result<nlohmann::json, std::string> load_record(const std::string& path) {
  auto loaded = apps::load_json_file(path);
  if (loaded.has_value() && !loaded.value().is_object()) {
    return core::Result<nlohmann::json, std::string>::err(path + ": record must be a JSON object");
  }
  return loaded;
}

core::Result<domain::RuleSet, std::string> load_rule_set(const std::string& path) {
  auto loaded = apps::load_json_file(path);
  if (!loaded.has_value()) {
    return core::Result<domain::RuleSet, std::string>::err(loaded.error());
  }
  return from_config_result(domain::rule_set_from_json_unchecked(loaded.value()), path);
}

core::Result<domain::QuestionSetCatalog, std::string> load_question_sets(const std::string& path) {
  auto loaded = apps::load_json_file(path);
  if (!loaded.has_value()) {
    return core::Result<domain::QuestionSetCatalog, std::string>::err(loaded.error());
  }
  return from_config_result(domain::question_set_catalog_from_json(loaded.value()), path);
}

core::Result<std::vector<domain::Finding>, std::string> load_external_findings(
    const std::string& path) {
  using FindingsResult = core::Result<std::vector<domain::Finding>, std::string>;

  auto loaded = apps::load_json_file(path);
  if (!loaded.has_value()) {
    return FindingsResult::err(loaded.error());
  }
  const auto& doc = loaded.value();
  const auto& items = doc.is_object() && doc.contains("findings") ? doc.at("findings") : doc;
  if (!items.is_array()) {
    return FindingsResult::err(path + ": findings must be an array");
  }

  std::vector<domain::Finding> findings;
  for (std::size_t i = 0; i < items.size(); ++i) {
    auto finding = domain::finding_from_json(items[i]);
    if (!finding.has_value()) {
      return FindingsResult::err(path + ": finding " + std::to_string(i) +
                                 " needs a known source, severity and code");
    }
    findings.push_back(std::move(*finding));
  }
  return FindingsResult::ok(std::move(findings));
}

core::Result<domain::SchemaNode, std::string> load_schema(const std::string& path) {
  auto loaded = apps::load_json_file(path);
  if (!loaded.has_value()) {
    return core::Result<domain::SchemaNode, std::string>::err(loaded.error());
  }
  return from_config_result(domain::schema_from_json(loaded.value()), path);
}

core::Result<std::vector<coverage::Suggestion>, std::string> load_suggestions(
    const std::string& path) {
  auto loaded = apps::load_json_file(path);
  if (!loaded.has_value()) {
    return core::Result<std::vector<coverage::Suggestion>, std::string>::err(loaded.error());
  }
  return from_config_result(coverage::suggestions_from_json(loaded.value()), path);
}

}  // namespace fhirgate::cli
