#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace durable::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("memory transaction already finished");
  }
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  {
    std::scoped_lock lock(repo_.mutex_);
    for (auto& [run_id, write] : checkpoint_writes_) {
      if (write) {
        repo_.committed_.checkpoints[run_id] = std::move(*write);
      } else {
        repo_.committed_.checkpoints.erase(run_id);
      }
    }
    for (auto& [key, record] : record_inserts_) {
      repo_.reserved_records_.erase(key);
      repo_.committed_.records.emplace(key, std::move(record));
    }
  }
  checkpoint_writes_.clear();
  record_inserts_.clear();
  committed_ = true;

  RunCommitHooks();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  ReleaseReservations();
  checkpoint_writes_.clear();
  record_inserts_.clear();
  rolled_back_ = true;

  RunRollbackHooks();
}

void MemoryTransaction::ReleaseReservations() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [key, _] : record_inserts_) {
    repo_.reserved_records_.erase(key);
  }
}

} // namespace durable::db::memory
