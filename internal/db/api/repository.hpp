#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/append_only_record.hpp"
#include "internal/db/model/checkpoint_record.hpp"

namespace durable::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Append-only rows are never overwritten; a second insert of the same
    (store, key) returns ErrorCode::AlreadyExists
  - Deleting a missing checkpoint is Ok

  Writes report backend failures as Result codes. Reads that cannot reach
  the backend throw util::StorageUnavailable.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Checkpoints
  // ---------------------------------------------------------------------

  virtual Result UpsertCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  virtual Result DeleteCheckpoint(Transaction&, const std::string& run_id) = 0;

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& run_id) = 0;

  // Ordered by run id.
  virtual std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Append-only records
  // ---------------------------------------------------------------------

  virtual Result InsertRecord(Transaction&, const model::AppendOnlyRecord&) = 0;

  virtual std::optional<model::AppendOnlyRecord> GetRecord(Transaction&, const std::string& store, const std::string& key) = 0;

  // Ordered by key.
  virtual std::vector<model::AppendOnlyRecord> ListRecords(Transaction&, const std::string& store) = 0;
};

} // namespace durable::db
