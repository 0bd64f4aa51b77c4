#include "internal/store/append_only_store.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <string>

#include "durable/v1/record.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/record_stores.hpp"
#include "internal/util/errors.hpp"

namespace {

using durable::db::memory::MemoryRepository;
using durable::store::RecordStore;
using durable::store::RecordStores;
using durable::v1::Record;
using google::protobuf::util::MessageDifferencer;
using namespace std::chrono_literals;

Record MakeRecord(const std::string& key, const std::string& payload) {
  Record record;
  record.set_key(key);
  record.set_kind("test");
  record.set_payload(payload);
  return record;
}

void TestFirstWriterWins() {
  auto        repo = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);

  {
    auto tx = repo->Begin();
    assert(store.AddIfAbsent(*tx, "k", MakeRecord("k", "first")));
    // same key in the same transaction
    assert(!store.AddIfAbsent(*tx, "k", MakeRecord("k", "second")));
    tx->Commit();
  }
  {
    auto tx = repo->Begin();
    assert(!store.AddIfAbsent(*tx, "k", MakeRecord("k", "third")));
    tx->Commit();
  }

  auto tx   = repo->Begin();
  auto read = store.Get(*tx, "k");
  assert(read.has_value());
  assert(read->payload() == "first");
  assert(!store.Get(*tx, "missing").has_value());
  tx->Commit();
  assert(store.CachedCount() == 1);
}

void TestRollbackIsNeitherPublishedNorCached() {
  auto        repo    = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);
  auto        updates = store.Updates();

  {
    auto tx = repo->Begin();
    assert(store.AddIfAbsent(*tx, "k", MakeRecord("k", "lost")));
    tx->Rollback();
  }
  {
    auto tx = repo->Begin();
    assert(store.AddIfAbsent(*tx, "dropped", MakeRecord("dropped", "lost")));
    // destructor rolls back
  }

  assert(updates->Pending() == 0);
  assert(store.CachedCount() == 0);

  auto tx = repo->Begin();
  assert(!store.Get(*tx, "k").has_value());
  // the key is free again
  assert(store.AddIfAbsent(*tx, "k", MakeRecord("k", "kept")));
  tx->Commit();

  auto published = updates->TryPop();
  assert(published.has_value());
  assert(published->key == "k");
  assert(published->value.payload() == "kept");
}

void TestPublishedOnceAfterCommit() {
  auto        repo    = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);
  auto        updates = store.Updates();

  auto tx = repo->Begin();
  assert(store.AddIfAbsent(*tx, "a", MakeRecord("a", "1")));
  assert(updates->Pending() == 0);
  tx->Commit();

  assert(updates->Pending() == 1);
  assert(updates->TryPop()->key == "a");
  assert(!updates->TryPop().has_value());
}

void TestAwaitKeyCompletesOnCommit() {
  auto        repo = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);

  std::shared_future<Record> pending;
  {
    auto tx = repo->Begin();
    pending = store.AwaitKey(*tx, "k");
    tx->Commit();
  }
  auto again = [&] {
    auto tx = repo->Begin();
    auto f  = store.AwaitKey(*tx, "k");
    tx->Commit();
    return f;
  }();

  assert(pending.wait_for(0ms) == std::future_status::timeout);

  auto tx = repo->Begin();
  assert(store.AddIfAbsent(*tx, "k", MakeRecord("k", "v")));
  assert(pending.wait_for(0ms) == std::future_status::timeout);
  tx->Commit();

  assert(pending.wait_for(1s) == std::future_status::ready);
  assert(pending.get().payload() == "v");
  assert(again.get().payload() == "v");

  auto read_tx = repo->Begin();
  auto ready   = store.AwaitKey(*read_tx, "k");
  assert(ready.wait_for(0ms) == std::future_status::ready);
  assert(MessageDifferencer::Equals(ready.get(), MakeRecord("k", "v")));
  read_tx->Commit();
}

void TestAwaitKeyIgnoresUncommittedInsert() {
  auto        repo = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);

  std::shared_future<Record> pending;
  {
    auto tx = repo->Begin();
    assert(store.AddIfAbsent(*tx, "k", MakeRecord("k", "phantom")));
    // the insert is visible to tx but not committed
    assert(store.Get(*tx, "k").has_value());
    pending = store.AwaitKey(*tx, "k");
    assert(pending.wait_for(0ms) == std::future_status::timeout);
    tx->Rollback();
  }
  assert(pending.wait_for(0ms) == std::future_status::timeout);

  {
    auto tx = repo->Begin();
    assert(!store.Get(*tx, "k").has_value());
    auto again = store.AwaitKey(*tx, "k");
    assert(again.wait_for(0ms) == std::future_status::timeout);
    tx->Commit();
  }

  {
    auto tx = repo->Begin();
    assert(store.AddIfAbsent(*tx, "k", MakeRecord("k", "real")));
    auto own = store.AwaitKey(*tx, "k");
    assert(own.wait_for(0ms) == std::future_status::timeout);
    tx->Commit();
    assert(own.wait_for(1s) == std::future_status::ready);
  }
  assert(pending.wait_for(1s) == std::future_status::ready);
  assert(pending.get().payload() == "real");
}

void TestTrackSnapshotThenUpdatesWithoutDuplicates() {
  auto        repo = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);

  {
    auto tx = repo->Begin();
    store.AddIfAbsent(*tx, "a", MakeRecord("a", "1"));
    store.AddIfAbsent(*tx, "b", MakeRecord("b", "2"));
    tx->Commit();
  }

  RecordStore::Feed feed;
  {
    auto tx = repo->Begin();
    feed    = store.Track(*tx);
    tx->Commit();
  }
  assert(feed.snapshot.size() == 2);
  assert(feed.snapshot[0].key == "a");
  assert(feed.snapshot[1].key == "b");
  assert(feed.updates->Pending() == 0);

  {
    auto tx = repo->Begin();
    assert(!store.AddIfAbsent(*tx, "a", MakeRecord("a", "again")));
    assert(store.AddIfAbsent(*tx, "c", MakeRecord("c", "3")));
    tx->Commit();
  }

  auto next = feed.updates->TryPop();
  assert(next.has_value());
  assert(next->key == "c");
  assert(!feed.updates->TryPop().has_value());

  store.CloseSubscriptions();
  assert(feed.updates->IsClosed());
}

void TestStoresArePartitionedByName() {
  auto         repo = std::make_shared<MemoryRepository>();
  RecordStores stores(repo);

  auto left  = stores.Get("left");
  auto right = stores.Get("right");
  assert(stores.Get("left") == left);

  auto tx = repo->Begin();
  assert(left->AddIfAbsent(*tx, "k", MakeRecord("k", "l")));
  assert(right->AddIfAbsent(*tx, "k", MakeRecord("k", "r")));
  tx->Commit();

  auto read_tx = repo->Begin();
  assert(left->Get(*read_tx, "k")->payload() == "l");
  assert(right->Get(*read_tx, "k")->payload() == "r");
  read_tx->Commit();

  auto left_updates = left->Updates();
  stores.CloseSubscriptions();
  assert(left_updates->IsClosed());
}

void TestCorruptRowFailsRead() {
  auto        repo = std::make_shared<MemoryRepository>();
  RecordStore store("records", repo);

  {
    auto                                tx = repo->Begin();
    durable::db::model::AppendOnlyRecord row;
    row.store = "records";
    row.key   = "bad";
    row.value = std::string("\xff\xff\xff", 3);
    assert(repo->InsertRecord(*tx, row));
    tx->Commit();
  }

  auto tx    = repo->Begin();
  bool threw = false;
  try {
    (void)store.Get(*tx, "bad");
  } catch (const durable::util::DeserializationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.Track(*tx);
  } catch (const durable::util::DeserializationError&) {
    threw = true;
  }
  assert(threw);
  tx->Commit();
}

} // namespace

int main() {
  TestFirstWriterWins();
  TestRollbackIsNeitherPublishedNorCached();
  TestPublishedOnceAfterCommit();
  TestAwaitKeyCompletesOnCommit();
  TestAwaitKeyIgnoresUncommittedInsert();
  TestTrackSnapshotThenUpdatesWithoutDuplicates();
  TestStoresArePartitionedByName();
  TestCorruptRowFailsRead();

  std::cout << "durable_flow_unit_append_only_store: pass\n";
  return 0;
}
