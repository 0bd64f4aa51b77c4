#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/serialization/proto_codec.hpp"
#include "internal/store/result_check.hpp"
#include "internal/store/update_feed.hpp"
#include "internal/util/time.hpp"

namespace durable::store {

/*
  Keyed durable store of immutable protobuf values.

  IMPORTANT:
  - First writer wins; an existing key is never overwritten or compared
  - The cache only holds values committed through this instance
  - Each insert is published to the feed once, after its transaction
    commits; rolled-back inserts are never published nor cached
  - AwaitKey never completes on an insert that has not committed yet
  - Commit hooks reference the store, so it must outlive every transaction
    that wrote through it

  Several stores may share one repository; rows are partitioned by name.
*/
template <typename Message>
class AppendOnlyStore {
 public:
  struct Entry {
    std::string key;
    Message     value;
  };

  struct Feed {
    std::vector<Entry>                   snapshot;
    std::shared_ptr<Subscription<Entry>> updates;
  };

  AppendOnlyStore(std::string name, std::shared_ptr<db::Repository> repository)
      : name_(std::move(name)), repository_(std::move(repository)) {
  }

  const std::string& Name() const {
    return name_;
  }

  // True if this call created the entry.
  bool AddIfAbsent(db::Transaction& tx, const std::string& key, const Message& value) {
    std::lock_guard lock(mutex_);
    if (cache_.contains(key)) return false;

    db::model::AppendOnlyRecord row;
    row.store         = name_;
    row.key           = key;
    row.value         = Codec::Encode(value);
    row.created_at_ms = util::NowMs();

    auto result = repository_->InsertRecord(tx, row);
    if (result.code == db::ErrorCode::AlreadyExists) return false;
    ThrowIfDbError(result, "insert " + name_ + "/" + key);

    pending_.insert(key);
    tx.OnCommit([this, key, value] { OnCommitted(key, value); });
    tx.OnRollback([this, key] { OnRolledBack(key); });
    return true;
  }

  std::optional<Message> Get(db::Transaction& tx, const std::string& key) {
    std::lock_guard lock(mutex_);
    return LookupLocked(tx, key);
  }

  // Snapshot and subscription are taken atomically with respect to publishes.
  Feed Track(db::Transaction& tx) {
    std::lock_guard lock(mutex_);

    Feed                            feed;
    std::unordered_set<std::string> seen;
    for (auto& row : repository_->ListRecords(tx, name_)) {
      seen.insert(row.key);
      feed.snapshot.push_back(Entry{row.key, Codec::Decode(row.value)});
    }
    feed.updates = feed_.Subscribe(std::move(seen));
    return feed;
  }

  // Ready at once if the key is committed; otherwise completes on the inserting commit.
  std::shared_future<Message> AwaitKey(db::Transaction& tx, const std::string& key) {
    std::lock_guard lock(mutex_);

    // a pending key may be the caller's own insert, visible through tx
    if (!pending_.contains(key)) {
      if (auto existing = LookupLocked(tx, key)) {
        std::promise<Message> ready;
        ready.set_value(std::move(*existing));
        return ready.get_future().share();
      }
    }

    auto it = waiters_.find(key);
    if (it == waiters_.end()) {
      Waiter waiter;
      waiter.future = waiter.promise.get_future().share();
      it            = waiters_.emplace(key, std::move(waiter)).first;
    }
    return it->second.future;
  }

  // Live feed without snapshot.
  std::shared_ptr<Subscription<Entry>> Updates() {
    return feed_.Subscribe();
  }

  void CloseSubscriptions() {
    feed_.CloseAll();
  }

  std::size_t CachedCount() const {
    std::lock_guard lock(mutex_);
    return cache_.size();
  }

 private:
  using Codec = serialization::ProtoCodec<Message>;

  struct Waiter {
    std::promise<Message>       promise;
    std::shared_future<Message> future;
  };

  std::optional<Message> LookupLocked(db::Transaction& tx, const std::string& key) {
    if (auto it = cache_.find(key); it != cache_.end()) return it->second;

    auto row = repository_->GetRecord(tx, name_, key);
    if (!row) return std::nullopt;
    return Codec::Decode(row->value);
  }

  void OnCommitted(const std::string& key, const Message& value) {
    std::optional<Waiter> waiter;
    {
      std::lock_guard lock(mutex_);
      pending_.erase(key);
      cache_.emplace(key, value);
      feed_.Publish(key, Entry{key, value});

      if (auto it = waiters_.find(key); it != waiters_.end()) {
        waiter = std::move(it->second);
        waiters_.erase(it);
      }
    }
    if (waiter) waiter->promise.set_value(value);
  }

  void OnRolledBack(const std::string& key) {
    std::lock_guard lock(mutex_);
    pending_.erase(key);
  }

  const std::string               name_;
  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                       mutex_;
  std::unordered_map<std::string, Message> cache_;
  std::unordered_map<std::string, Waiter>  waiters_;
  std::unordered_set<std::string>          pending_;
  UpdateFeed<Entry>                        feed_;
};

} // namespace durable::store
