#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace durable::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Committed state lives here; every transaction keeps its own write set and
  reads through it. Nothing survives process exit.

  A record key inserted by an open transaction is reserved until that
  transaction finishes: a concurrent insert of the same key reports
  AlreadyExists, as it would under SQLite's single writer.
*/

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result UpsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  Result DeleteCheckpoint(Transaction&, const std::string& run_id) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& run_id) override;
  std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&) override;

  Result InsertRecord(Transaction&, const model::AppendOnlyRecord&) override;
  std::optional<model::AppendOnlyRecord> GetRecord(Transaction&, const std::string& store, const std::string& key) override;
  std::vector<model::AppendOnlyRecord> ListRecords(Transaction&, const std::string& store) override;

private:
  friend class MemoryTransaction;

  using RecordKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, model::CheckpointRecord> checkpoints;
    std::map<RecordKey, model::AppendOnlyRecord>   records;
  };

  static MemoryTransaction& TX(Transaction& t);

  std::mutex          mutex_;
  State               committed_;
  std::set<RecordKey> reserved_records_;
};

} // namespace durable::db::memory
