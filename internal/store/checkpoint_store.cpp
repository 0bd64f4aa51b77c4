#include "internal/store/checkpoint_store.hpp"

#include "internal/serialization/proto_codec.hpp"
#include "internal/store/result_check.hpp"
#include "internal/util/time.hpp"

namespace durable::store {

using Codec = serialization::ProtoCodec<durable::v1::Checkpoint>;

CheckpointSequence::Entry CheckpointSequence::Iterator::operator*() const {
  const auto& row = (*rows_)[pos_];

  durable::v1::RunID id;
  id.set_value(row.run_id);
  return {std::move(id), Codec::Decode(row.value)};
}

CheckpointStore::CheckpointStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void CheckpointStore::Add(db::Transaction& tx, const durable::v1::RunID& id, const durable::v1::Checkpoint& checkpoint) {
  db::model::CheckpointRecord row;
  row.run_id        = id.value();
  row.value         = Codec::Encode(checkpoint);
  row.errored       = checkpoint.error_state().has_errored();
  row.updated_at_ms = util::NowMs();

  ThrowIfDbError(repository_->UpsertCheckpoint(tx, row), "add checkpoint " + id.value());
}

void CheckpointStore::Remove(db::Transaction& tx, const durable::v1::RunID& id) {
  ThrowIfDbError(repository_->DeleteCheckpoint(tx, id.value()), "remove checkpoint " + id.value());
}

std::optional<durable::v1::Checkpoint> CheckpointStore::Get(db::Transaction& tx, const durable::v1::RunID& id) {
  auto row = repository_->GetCheckpoint(tx, id.value());
  if (!row) return std::nullopt;
  return Codec::Decode(row->value);
}

CheckpointSequence CheckpointStore::Enumerate(db::Transaction& tx) {
  return CheckpointSequence(repository_->ListCheckpoints(tx));
}

} // namespace durable::store
