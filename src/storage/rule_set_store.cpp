#include "fhirgate/storage/rule_set_store.h"

namespace fhirgate::storage {

std::optional<StoredRuleSet> InMemoryRuleSetStore::get(const std::string& project_id) const {
  const auto it = sets_.find(project_id);
  if (it == sets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

core::Result<int, std::string> InMemoryRuleSetStore::replace(const std::string& project_id,
                                                             const domain::RuleSet& rule_set,
                                                             const std::string& saved_at) {
  if (project_id.empty()) {
    return core::Result<int, std::string>::err("project id must not be empty");
  }

  auto& stored = sets_[project_id];
  stored.project_id = project_id;
  stored.revision += 1;
  stored.saved_at = saved_at;
  stored.rule_set = rule_set;
  stored.rule_set.project = project_id;
  return core::Result<int, std::string>::ok(stored.revision);
}

std::vector<std::string> InMemoryRuleSetStore::list_projects() const {
  std::vector<std::string> ids;
  ids.reserve(sets_.size());
  for (const auto& [project_id, _] : sets_) {
    ids.push_back(project_id);
  }
  return ids;
}

}  // namespace fhirgate::storage
