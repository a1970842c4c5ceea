#include "fhirgate/storage/sqlite/sqlite_rule_set_store.h"

#include "fhirgate/domain/rule_json.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>
#include <utility>

namespace fhirgate::storage::sqlite {

SqliteRuleSetStore::SqliteRuleSetStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

std::optional<StoredRuleSet> SqliteRuleSetStore::get(const std::string& project_id) const {
  const char* sql =
      "SELECT revision, rules_json, saved_at FROM rule_sets"
      " WHERE project_id = ? ORDER BY revision DESC LIMIT 1";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("rule set store: " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, project_id.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  // Stored sets passed the save gate; parse without re-validating so a set saved
  // under an older vocabulary stays readable.
  auto parsed = domain::rule_set_from_json_unchecked(
      nlohmann::json::parse(column_string(stmt.get(), 1)));
  if (!parsed.has_value()) {
    throw std::runtime_error("rule set store: stored rules for '" + project_id +
                             "' are unreadable: " + parsed.error().reason);
  }

  StoredRuleSet stored;
  stored.project_id = project_id;
  stored.revision = sqlite3_column_int(stmt.get(), 0);
  stored.saved_at = column_string(stmt.get(), 2);
  stored.rule_set = parsed.take_value();
  stored.rule_set.project = project_id;
  return stored;
}

core::Result<int, std::string> SqliteRuleSetStore::replace(const std::string& project_id,
                                                           const domain::RuleSet& rule_set,
                                                           const std::string& saved_at) {
  using ReplaceResult = core::Result<int, std::string>;
  if (project_id.empty()) {
    return ReplaceResult::err("project id must not be empty");
  }

  Transaction tx(*db_);
  if (!tx.begin_status().has_value()) {
    return ReplaceResult::err(tx.begin_status().error());
  }

  int revision = 1;
  {
    PreparedStatement stmt(db_->connection(),
                           "SELECT MAX(revision) FROM rule_sets WHERE project_id = ?");
    if (!stmt.is_valid()) {
      return ReplaceResult::err(stmt.error());
    }
    sqlite3_bind_text(stmt.get(), 1, project_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
      revision = sqlite3_column_int(stmt.get(), 0) + 1;
    }
  }

  domain::RuleSet stored = rule_set;
  stored.project = project_id;
  const std::string rules_json = domain::rule_set_to_json(stored).dump();

  {
    PreparedStatement insert(
        db_->connection(),
        "INSERT INTO rule_sets (project_id, revision, rules_json, saved_at) VALUES (?, ?, ?, ?)");
    if (!insert.is_valid()) {
      return ReplaceResult::err(insert.error());
    }
    sqlite3_bind_text(insert.get(), 1, project_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(insert.get(), 2, revision);
    sqlite3_bind_text(insert.get(), 3, rules_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert.get(), 4, saved_at.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(insert.get()) != SQLITE_DONE) {
      return ReplaceResult::err(std::string("insert failed: ") +
                                sqlite3_errmsg(db_->connection()));
    }
  }

  auto committed = tx.commit();
  if (!committed.has_value()) {
    return ReplaceResult::err(committed.error());
  }
  return ReplaceResult::ok(revision);
}

std::vector<std::string> SqliteRuleSetStore::list_projects() const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT project_id FROM rule_sets ORDER BY project_id");
  if (!stmt.is_valid()) {
    throw std::runtime_error("rule set store: " + stmt.error());
  }

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(column_string(stmt.get(), 0));
  }
  return ids;
}

}  // namespace fhirgate::storage::sqlite
