#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace durable::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  Result DeleteCheckpoint(Transaction&, const std::string& run_id) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& run_id) override;
  std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&) override;

  Result InsertRecord(Transaction&, const model::AppendOnlyRecord&) override;
  std::optional<model::AppendOnlyRecord> GetRecord(Transaction&, const std::string& store, const std::string& key) override;
  std::vector<model::AppendOnlyRecord> ListRecords(Transaction&, const std::string& store) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
