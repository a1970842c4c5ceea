#include "fhirgate/validation/reference_layer.h"

#include "fhirgate/core/normalization.h"
#include "fhirgate/domain/error_codes.h"
#include "fhirgate/path/path_expression.h"
#include "fhirgate/scope/instance_scope_resolver.h"

#include <map>
#include <set>
#include <utility>

namespace fhirgate::validation {

namespace {

using nlohmann::json;

struct ReferenceTarget {
  std::string resource_type;
  std::size_t entry_index{0};
};

struct ReferenceSite {
  std::string path;
  const json* reference{nullptr};
};

std::map<std::string, ReferenceTarget> build_lookup(const json& record) {
  std::map<std::string, ReferenceTarget> lookup;
  const auto entries = record.find("entry");
  if (entries == record.end() || !entries->is_array()) {
    return lookup;
  }
  for (std::size_t i = 0; i < entries->size(); ++i) {
    const json& entry = (*entries)[i];
    if (!entry.is_object() || !entry.contains("resource") || !entry.at("resource").is_object()) {
      continue;
    }
    const json& resource = entry.at("resource");
    const std::string type = scope::resource_type_of(resource).value_or("");
    if (type.empty()) {
      continue;
    }
    if (entry.contains("fullUrl") && entry.at("fullUrl").is_string()) {
      const auto full_url = entry.at("fullUrl").get<std::string>();
      if (!full_url.empty()) {
        lookup[full_url] = {type, i};
      }
    }
    if (resource.contains("id") && resource.at("id").is_string()) {
      const auto id = resource.at("id").get<std::string>();
      if (!id.empty()) {
        lookup[type + "/" + id] = {type, i};
      }
    }
  }
  return lookup;
}

// Depth-first walk collecting every object that carries a "reference" string.
void collect_references(const json& node, const std::string& path, std::vector<ReferenceSite>& out) {
  if (node.is_array()) {
    for (std::size_t i = 0; i < node.size(); ++i) {
      collect_references(node[i], path + "[" + std::to_string(i) + "]", out);
    }
    return;
  }
  if (!node.is_object()) {
    return;
  }
  const auto reference = node.find("reference");
  if (reference != node.end() && reference->is_string()) {
    out.push_back({path, &node});
  }
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (it.key() == "reference") {
      continue;
    }
    collect_references(it.value(), path.empty() ? it.key() : path + "." + it.key(), out);
  }
}

// Type a reference expects: its declared "type", else the "Type/id" prefix.
std::optional<std::string> expected_type(const json& reference_object,
                                         const std::string& reference) {
  const auto declared = reference_object.find("type");
  if (declared != reference_object.end() && declared->is_string() &&
      !declared->get<std::string>().empty()) {
    return declared->get<std::string>();
  }
  const auto parts = core::split_ascii(reference, '/');
  if (parts.size() == 2 && path::is_identifier(parts[0]) && core::is_ascii_upper(parts[0].front()) &&
      !parts[1].empty()) {
    return parts[0];
  }
  return std::nullopt;
}

}  // namespace

std::string reference_policy_to_string(const ReferencePolicy policy) {
  switch (policy) {
    case ReferencePolicy::kInBundleOnly:
      return "in-bundle";
    case ReferencePolicy::kAllowExternal:
      return "allow-external";
  }
  return "in-bundle";
}

std::optional<ReferencePolicy> string_to_reference_policy(const std::string& str) {
  if (str == "in-bundle") {
    return ReferencePolicy::kInBundleOnly;
  }
  if (str == "allow-external") {
    return ReferencePolicy::kAllowExternal;
  }
  return std::nullopt;
}

ReferenceIntegrityLayer::ReferenceIntegrityLayer(const ReferencePolicy policy) : policy_(policy) {}

std::vector<domain::Finding> ReferenceIntegrityLayer::validate(const nlohmann::json& record) const {
  std::vector<domain::Finding> findings;
  if (scope::resource_type_of(record) != std::optional<std::string>("Bundle")) {
    return findings;
  }

  const auto lookup = build_lookup(record);
  for (const auto& instance : scope::collect_resource_instances(record)) {
    std::vector<ReferenceSite> sites;
    collect_references(*instance.resource, "", sites);

    std::set<std::string> seen;
    for (const auto& site : sites) {
      const auto reference = site.reference->at("reference").get<std::string>();
      if (reference.empty() || reference.front() == '#' || !seen.insert(reference).second) {
        continue;
      }

      domain::Finding finding;
      finding.source = domain::FindingSource::kReference;
      finding.path = instance.resource_type + "." + site.path;
      finding.entry_index = instance.entry_index;

      const auto target = lookup.find(reference);
      if (target == lookup.end()) {
        const bool external_allowed = policy_ == ReferencePolicy::kAllowExternal;
        finding.severity = external_allowed ? domain::Severity::kWarning : domain::Severity::kError;
        finding.code = std::string(domain::codes::kReferenceNotFound);
        finding.message = external_allowed
                              ? "reference not resolved in bundle: " + reference
                              : "referenced resource not found: " + reference;
        finding.details = {{"reference", reference}, {"policy", reference_policy_to_string(policy_)}};
        findings.push_back(std::move(finding));
        continue;
      }

      const auto expected = expected_type(*site.reference, reference);
      if (expected.has_value() && expected.value() != target->second.resource_type) {
        finding.severity = domain::Severity::kError;
        finding.code = std::string(domain::codes::kReferenceTypeMismatch);
        finding.message = "reference " + reference + " expects " + expected.value() +
                          " but resolves to " + target->second.resource_type;
        finding.details = {{"reference", reference},
                           {"expectedType", expected.value()},
                           {"actualType", target->second.resource_type},
                           {"targetEntryIndex", target->second.entry_index}};
        findings.push_back(std::move(finding));
      }
    }
  }
  return findings;
}

}  // namespace fhirgate::validation
