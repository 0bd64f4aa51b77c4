#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "durable/v1/checkpoint.pb.h"
#include "internal/db/api/repository.hpp"

namespace durable::store {

/*
  Result of CheckpointStore::Enumerate.

  Holds the rows visible to the transaction at the time of the call;
  checkpoints are decoded when an iterator is dereferenced, so a corrupt row
  throws util::DeserializationError at that point and not before.
*/
class CheckpointSequence {
 public:
  using Entry = std::pair<durable::v1::RunID, durable::v1::Checkpoint>;

  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = Entry;
    using difference_type   = std::ptrdiff_t;
    using pointer           = void;
    using reference         = Entry;

    Iterator(const std::vector<db::model::CheckpointRecord>* rows, std::size_t pos) : rows_(rows), pos_(pos) {
    }

    Entry operator*() const;

    Iterator& operator++() {
      ++pos_;
      return *this;
    }

    bool operator==(const Iterator& other) const {
      return pos_ == other.pos_;
    }
    bool operator!=(const Iterator& other) const {
      return pos_ != other.pos_;
    }

   private:
    const std::vector<db::model::CheckpointRecord>* rows_;
    std::size_t                                     pos_;
  };

  explicit CheckpointSequence(std::vector<db::model::CheckpointRecord> rows) : rows_(std::move(rows)) {
  }

  Iterator begin() const {
    return Iterator(&rows_, 0);
  }
  Iterator end() const {
    return Iterator(&rows_, rows_.size());
  }

  std::size_t size() const {
    return rows_.size();
  }
  bool empty() const {
    return rows_.empty();
  }

 private:
  std::vector<db::model::CheckpointRecord> rows_;
};

/*
  Durable map RunID -> latest Checkpoint.

  Every call is scoped to the caller's transaction. Writes are visible to
  reads in the same transaction at once and to other transactions after
  commit. Backend failures throw util::StorageUnavailable.
*/
class CheckpointStore {
 public:
  explicit CheckpointStore(std::shared_ptr<db::Repository> repository);

  // Last write wins.
  void Add(db::Transaction& tx, const durable::v1::RunID& id, const durable::v1::Checkpoint& checkpoint);

  // Absent id is a no-op.
  void Remove(db::Transaction& tx, const durable::v1::RunID& id);

  std::optional<durable::v1::Checkpoint> Get(db::Transaction& tx, const durable::v1::RunID& id);

  // Fresh sequence per call, ordered by run id.
  CheckpointSequence Enumerate(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace durable::store
