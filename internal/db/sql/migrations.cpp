#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace durable::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "CREATE TABLE IF NOT EXISTS checkpoints ("
       " run_id TEXT PRIMARY KEY,"
       " checkpoint_value BLOB NOT NULL,"
       " errored INTEGER NOT NULL DEFAULT 0,"
       " updated_at_ms INTEGER NOT NULL);"},
      {2,
       "CREATE TABLE IF NOT EXISTS records ("
       " store TEXT NOT NULL,"
       " record_key TEXT NOT NULL,"
       " record_value BLOB NOT NULL,"
       " created_at_ms INTEGER NOT NULL,"
       " PRIMARY KEY (store, record_key));"},
      {3, "CREATE INDEX IF NOT EXISTS checkpoints_errored_idx ON checkpoints(errored);"},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  int current = executor.AppliedVersion();
  int applied = 0;

  for (const auto& migration : ordered) {
    if (migration.version <= current) continue;
    if (migration.version != current + 1) {
      throw util::InvalidState("migration version gap: have " + std::to_string(current) + ", next is " + std::to_string(migration.version));
    }

    executor.ExecuteSQL(migration.sql);
    executor.RecordVersion(migration.version);
    current = migration.version;
    ++applied;

    DURABLE_LOG_DEBUG("schema migration applied", {durable::observability::IntField("version", migration.version)});
  }
  return applied;
}

} // namespace durable::db::sql
