#pragma once

#include "fhirgate/storage/rule_set_store.h"
#include "fhirgate/storage/sqlite/sqlite_db.h"

#include <memory>

namespace fhirgate::storage::sqlite {

// SqliteRuleSetStore keeps every revision in rule_sets; get() returns the latest.
// replace() writes the new revision inside one IMMEDIATE transaction.
class SqliteRuleSetStore final : public IRuleSetStore {
 public:
  explicit SqliteRuleSetStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] std::optional<StoredRuleSet> get(const std::string& project_id) const override;
  [[nodiscard]] core::Result<int, std::string> replace(const std::string& project_id,
                                                       const domain::RuleSet& rule_set,
                                                       const std::string& saved_at) override;
  [[nodiscard]] std::vector<std::string> list_projects() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace fhirgate::storage::sqlite
