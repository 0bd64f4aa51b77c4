#pragma once

#include <map>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace durable::db::memory {

/*
  Transaction = committed state + write set

  A checkpoint entry of nullopt marks a delete. Record inserts hold their
  key reserved in the repository until commit or rollback releases it.
*/

class MemoryTransaction final : public db::Transaction {
public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

private:
  friend class MemoryRepository;

  void EnsureOpen() const;
  void ReleaseReservations();

  MemoryRepository& repo_;

  std::map<std::string, std::optional<model::CheckpointRecord>>    checkpoint_writes_;
  std::map<MemoryRepository::RecordKey, model::AppendOnlyRecord>   record_inserts_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace durable::db::memory
