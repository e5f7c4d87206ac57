#pragma once

#include <string>
#include <vector>

namespace market::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

/*
  Idempotent DDL for the market schema, in execution order.
  Every statement is CREATE ... IF NOT EXISTS or an INSERT that ignores
  an existing row, so running it on every start is safe.
*/
const std::vector<std::string>& SchemaStatements(Dialect dialect);

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace market::db::sql
