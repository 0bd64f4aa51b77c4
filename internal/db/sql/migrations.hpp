#pragma once

#include <string>
#include <vector>

namespace durable::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; RunMigrations applies every
  migration newer than AppliedVersion() in order and records it.
*/

struct Migration {
  int         version = 0;
  std::string sql;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // 0 when nothing was applied yet.
  virtual int AppliedVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

// Schema of the checkpoint and append-only tables, ordered by version.
const std::vector<Migration>& SchemaMigrations();

// Returns the number of migrations applied.
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace durable::db::sql
