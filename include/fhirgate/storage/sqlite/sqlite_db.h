#pragma once

#include "fhirgate/core/result.h"

#include <memory>
#include <string>

// Forward declared so that the SQLite header stays out of the public API.
struct sqlite3;
struct sqlite3_stmt;

namespace fhirgate::storage::sqlite {

// SqliteDb owns one SQLite connection and applies the schema.
// One connection per instance; instances are shared by the stores built on them.
class SqliteDb {
 public:
  // Opens or creates the database at path; ":memory:" creates an in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied.
  [[nodiscard]] int get_schema_version() const;

  // Applies schema v1 (rule sets + audit events) unless already present.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection for the store implementations.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII prepared statement.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// RAII transaction: BEGIN IMMEDIATE on construction, ROLLBACK on destruction
// unless commit() succeeded.
class Transaction {
 public:
  explicit Transaction(SqliteDb& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  // Error from BEGIN, if it failed. Nothing may run in a failed transaction.
  [[nodiscard]] const core::Result<bool, std::string>& begin_status() const { return begun_; }

  [[nodiscard]] core::Result<bool, std::string> commit();

 private:
  SqliteDb& db_;
  core::Result<bool, std::string> begun_;
  bool finished_{false};
};

// column_string copies a TEXT column; NULL reads as "".
[[nodiscard]] std::string column_string(sqlite3_stmt* stmt, int column);

}  // namespace fhirgate::storage::sqlite
