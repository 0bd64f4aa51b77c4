#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace durable::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

MemoryTransaction& MemoryRepository::TX(Transaction& t) {
  auto& tx = static_cast<MemoryTransaction&>(t);
  tx.EnsureOpen();
  return tx;
}

// ---------------------------------------------------------------------
// Checkpoints
// ---------------------------------------------------------------------

Result MemoryRepository::UpsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  TX(t).checkpoint_writes_[r.run_id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteCheckpoint(Transaction& t, const std::string& run_id) {
  TX(t).checkpoint_writes_[run_id] = std::nullopt;
  return Result::Ok();
}

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t, const std::string& run_id) {
  auto& tx = TX(t);
  if (auto it = tx.checkpoint_writes_.find(run_id); it != tx.checkpoint_writes_.end()) {
    return it->second;
  }

  std::scoped_lock lock(mutex_);
  auto             it = committed_.checkpoints.find(run_id);
  if (it == committed_.checkpoints.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpoints(Transaction& t) {
  auto& tx = TX(t);

  std::map<std::string, model::CheckpointRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    merged = committed_.checkpoints;
  }
  for (const auto& [run_id, write] : tx.checkpoint_writes_) {
    if (write) {
      merged[run_id] = *write;
    } else {
      merged.erase(run_id);
    }
  }

  std::vector<model::CheckpointRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

// ---------------------------------------------------------------------
// Append-only records
// ---------------------------------------------------------------------

Result MemoryRepository::InsertRecord(Transaction& t, const model::AppendOnlyRecord& r) {
  auto&     tx = TX(t);
  RecordKey key{r.store, r.key};

  if (tx.record_inserts_.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  {
    std::scoped_lock lock(mutex_);
    if (committed_.records.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
    if (!reserved_records_.insert(key).second) return Result::Err(ErrorCode::AlreadyExists);
  }
  tx.record_inserts_.emplace(std::move(key), r);
  return Result::Ok();
}

std::optional<model::AppendOnlyRecord> MemoryRepository::GetRecord(Transaction& t, const std::string& store, const std::string& key) {
  auto&     tx = TX(t);
  RecordKey k{store, key};

  if (auto it = tx.record_inserts_.find(k); it != tx.record_inserts_.end()) {
    return it->second;
  }

  std::scoped_lock lock(mutex_);
  auto             it = committed_.records.find(k);
  if (it == committed_.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AppendOnlyRecord> MemoryRepository::ListRecords(Transaction& t, const std::string& store) {
  auto& tx = TX(t);

  std::map<std::string, model::AppendOnlyRecord> merged;
  {
    std::scoped_lock lock(mutex_);
    for (auto it = committed_.records.lower_bound({store, ""}); it != committed_.records.end() && it->first.first == store; ++it) {
      merged.emplace(it->first.second, it->second);
    }
  }
  for (const auto& [k, record] : tx.record_inserts_) {
    if (k.first == store) merged.emplace(k.second, record);
  }

  std::vector<model::AppendOnlyRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

} // namespace durable::db::memory
