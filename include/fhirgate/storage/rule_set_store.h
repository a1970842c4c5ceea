#pragma once

#include "fhirgate/core/result.h"
#include "fhirgate/domain/rule.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fhirgate::storage {

// StoredRuleSet is the persisted rule set of one project.
struct StoredRuleSet {
  std::string project_id;          // NOLINT(readability-identifier-naming)
  int revision{0};                 // NOLINT(readability-identifier-naming)
  std::string saved_at;            // NOLINT(readability-identifier-naming)
  domain::RuleSet rule_set;        // NOLINT(readability-identifier-naming)
};

// IRuleSetStore persists one rule set per project. replace() swaps the whole set
// atomically and returns the new revision (1 for the first save, then +1).
// Writes go through the governance-gated save pipeline only.
class IRuleSetStore {
 public:
  virtual ~IRuleSetStore() = default;

  [[nodiscard]] virtual std::optional<StoredRuleSet> get(const std::string& project_id) const = 0;
  [[nodiscard]] virtual core::Result<int, std::string> replace(const std::string& project_id,
                                                               const domain::RuleSet& rule_set,
                                                               const std::string& saved_at) = 0;
  // Sorted by project id.
  [[nodiscard]] virtual std::vector<std::string> list_projects() const = 0;

 protected:
  IRuleSetStore() = default;
  IRuleSetStore(const IRuleSetStore&) = default;
  IRuleSetStore& operator=(const IRuleSetStore&) = default;
  IRuleSetStore(IRuleSetStore&&) = default;
  IRuleSetStore& operator=(IRuleSetStore&&) = default;
};

class InMemoryRuleSetStore final : public IRuleSetStore {
 public:
  [[nodiscard]] std::optional<StoredRuleSet> get(const std::string& project_id) const override;
  [[nodiscard]] core::Result<int, std::string> replace(const std::string& project_id,
                                                       const domain::RuleSet& rule_set,
                                                       const std::string& saved_at) override;
  [[nodiscard]] std::vector<std::string> list_projects() const override;

 private:
  std::map<std::string, StoredRuleSet> sets_;
};

}  // namespace fhirgate::storage
