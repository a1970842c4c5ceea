#include "fhirgate/validation/lint_layer.h"

#include <optional>
#include <regex>
#include <string>
#include <utility>

namespace fhirgate::validation {

namespace {

using nlohmann::json;

const std::regex& date_pattern() {
  static const std::regex pattern(R"(^\d{4}(-\d{2}(-\d{2})?)?$)");
  return pattern;
}

const std::regex& date_time_pattern() {
  static const std::regex pattern(
      R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})?$)");
  return pattern;
}

bool is_date_property(const std::string& name) {
  return name.ends_with("Date") && !name.ends_with("DateTime");
}

bool is_date_time_property(const std::string& name) {
  return name.ends_with("DateTime") || name == "issued" || name == "recorded";
}

bool is_boolean_property(const std::string& name) {
  return name == "active" || name.ends_with("Boolean");
}

class LintCollector {
 public:
  void add(const std::string_view code, const domain::Severity severity, std::string path,
           std::string message, const std::optional<std::size_t> entry_index,
           json details = json::object()) {
    domain::Finding finding;
    finding.source = domain::FindingSource::kLint;
    finding.severity = severity;
    finding.code = std::string(code);
    finding.path = std::move(path);
    finding.message = std::move(message);
    finding.entry_index = entry_index;
    finding.details = std::move(details);
    findings_.push_back(std::move(finding));
  }

  // Checks one primitive against the format its property name implies.
  void check_primitive(const std::string& name, const json& value, const std::string& path,
                       const std::optional<std::size_t> entry_index) {
    if (!value.is_string()) {
      return;
    }
    const auto& text = value.get_ref<const std::string&>();
    if (is_boolean_property(name)) {
      add(lint_codes::kBooleanAsString, domain::Severity::kError, path,
          "'" + name + "' is a string, expected a boolean", entry_index, {{"value", text}});
      return;
    }
    if (text.empty()) {
      return;
    }
    if (is_date_property(name) && !std::regex_match(text, date_pattern())) {
      add(lint_codes::kInvalidDate, domain::Severity::kWarning, path,
          "'" + name + "' is not a date: '" + text + "'", entry_index, {{"value", text}});
    } else if (is_date_time_property(name) && !std::regex_match(text, date_time_pattern())) {
      add(lint_codes::kInvalidDateTime, domain::Severity::kWarning, path,
          "'" + name + "' is not a dateTime: '" + text + "'", entry_index, {{"value", text}});
    }
  }

  // Walks every property below node in key order.
  void walk(const json& node, const std::string& path,
            const std::optional<std::size_t> entry_index) {
    for (auto it = node.begin(); it != node.end(); ++it) {
      const std::string& name = it.key();
      if (name == "resourceType") {
        continue;
      }
      const std::string child_path = path + "." + name;
      const json& value = it.value();
      if (value.is_array()) {
        for (std::size_t i = 0; i < value.size(); ++i) {
          const std::string element_path = child_path + "[" + std::to_string(i) + "]";
          if (value[i].is_object()) {
            walk(value[i], element_path, entry_index);
          } else {
            check_primitive(name, value[i], element_path, entry_index);
          }
        }
      } else if (value.is_object()) {
        walk(value, child_path, entry_index);
      } else {
        check_primitive(name, value, child_path, entry_index);
      }
    }
  }

  // An entry without a typed resource is reported and not walked.
  void check_entry(const json& entry, const std::size_t index) {
    const std::string path = "Bundle.entry[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
      add(lint_codes::kEntryNotObject, domain::Severity::kError, path,
          "entry " + std::to_string(index) + " is not an object", index);
      return;
    }
    const auto resource = entry.find("resource");
    if (resource == entry.end()) {
      add(lint_codes::kEntryMissingResource, domain::Severity::kError, path,
          "entry " + std::to_string(index) + " has no 'resource'", index);
      return;
    }
    if (!resource->is_object()) {
      add(lint_codes::kResourceNotObject, domain::Severity::kError, path + ".resource",
          "resource in entry " + std::to_string(index) + " is not an object", index);
      return;
    }
    const auto type = resource->find("resourceType");
    if (type == resource->end()) {
      add(lint_codes::kResourceMissingType, domain::Severity::kError, path + ".resource",
          "resource in entry " + std::to_string(index) + " has no 'resourceType'", index);
      return;
    }
    if (!type->is_string()) {
      add(lint_codes::kResourceTypeNotString, domain::Severity::kError,
          path + ".resource.resourceType",
          "resourceType in entry " + std::to_string(index) + " is not a string", index,
          {{"value", *type}});
      return;
    }
    walk(*resource, type->get<std::string>(), index);
  }

  std::vector<domain::Finding> take() { return std::move(findings_); }

 private:
  std::vector<domain::Finding> findings_;
};

}  // namespace

std::vector<domain::Finding> LintLayer::validate(const nlohmann::json& record) const {
  LintCollector lint;
  if (!record.is_object()) {
    lint.add(lint_codes::kRootNotObject, domain::Severity::kError, "", "record is not a JSON object",
             std::nullopt);
    return lint.take();
  }

  const auto type = record.find("resourceType");
  if (type == record.end()) {
    lint.add(lint_codes::kMissingResourceType, domain::Severity::kError, "",
             "record has no 'resourceType'", std::nullopt);
    return lint.take();
  }
  if (!type->is_string()) {
    lint.add(lint_codes::kResourceTypeNotString, domain::Severity::kError, "resourceType",
             "record resourceType is not a string", std::nullopt, {{"value", *type}});
    return lint.take();
  }

  const std::string resource_type = type->get<std::string>();
  if (resource_type != "Bundle") {
    lint.walk(record, resource_type, std::nullopt);
    return lint.take();
  }

  const auto entries = record.find("entry");
  if (entries == record.end()) {
    return lint.take();
  }
  if (!entries->is_array()) {
    lint.add(lint_codes::kEntryNotArray, domain::Severity::kError, "Bundle.entry",
             "Bundle.entry is not an array", std::nullopt);
    return lint.take();
  }
  for (std::size_t i = 0; i < entries->size(); ++i) {
    lint.check_entry((*entries)[i], i);
  }
  return lint.take();
}

}  // namespace fhirgate::validation
