#include "sqlite_schema.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace durable::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int AppliedVersion() override {
    Statement st(db_.Handle(), "SELECT COALESCE(MAX(version), 0) FROM durable_schema_migrations;");
    if (!st || sqlite3_step(st.get()) != SQLITE_ROW) {
      throw util::StorageUnavailable(std::string("read schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
    return sqlite3_column_int(st.get(), 0);
  }

  void RecordVersion(int version) override {
    Statement st(db_.Handle(), "INSERT INTO durable_schema_migrations(version, applied_at_ms) VALUES(?, ?);");
    if (!st) {
      throw util::StorageUnavailable(std::string("record schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
    sqlite3_bind_int(st.get(), 1, version);
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(util::NowMs()));
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      throw util::StorageUnavailable(std::string("record schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

int BootstrapSchema(const std::shared_ptr<SqliteDB>& db) {
  std::lock_guard lock(db->WriterMutex());

  db->Exec("BEGIN IMMEDIATE;");
  try {
    db->Exec("CREATE TABLE IF NOT EXISTS durable_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

    SqliteMigrationExecutor executor(*db);
    int                     applied = sql::RunMigrations(executor, sql::SchemaMigrations());

    db->Exec("COMMIT;");
    return applied;
  } catch (...) {
    if (!sqlite3_get_autocommit(db->Handle())) {
      db->Exec("ROLLBACK;");
    }
    throw;
  }
}

} // namespace durable::db::sqlite
