#include "internal/db/memory/memory_repository.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using durable::db::ErrorCode;
using durable::db::memory::MemoryRepository;
using durable::db::model::AppendOnlyRecord;
using durable::db::model::CheckpointRecord;

CheckpointRecord Checkpoint(const std::string& run_id, const std::string& value) {
  CheckpointRecord row;
  row.run_id = run_id;
  row.value  = value;
  return row;
}

AppendOnlyRecord Record(const std::string& store, const std::string& key, const std::string& value) {
  AppendOnlyRecord row;
  row.store = store;
  row.key   = key;
  row.value = value;
  return row;
}

void TestConcurrentInsertSeesReservedKey() {
  MemoryRepository repo;

  auto a = repo.Begin();
  auto b = repo.Begin();
  assert(repo.InsertRecord(*a, Record("s", "k", "from-a")));
  assert(repo.InsertRecord(*b, Record("s", "k", "from-b")).code == ErrorCode::AlreadyExists);
  assert(repo.UpsertCheckpoint(*b, Checkpoint("run-b", "cp")));

  bool hook_ran = false;
  b->OnCommit([&] { hook_ran = true; });

  a->Commit();
  b->Commit();
  assert(hook_ran);

  auto tx = repo.Begin();
  assert(repo.GetCheckpoint(*tx, "run-b").has_value());
  assert(repo.GetRecord(*tx, "s", "k")->value == "from-a");
  assert(repo.InsertRecord(*tx, Record("s", "k", "again")).code == ErrorCode::AlreadyExists);
  tx->Commit();
}

void TestRollbackReleasesReservedKey() {
  MemoryRepository repo;

  {
    auto a = repo.Begin();
    assert(repo.InsertRecord(*a, Record("s", "k", "lost")));

    auto b = repo.Begin();
    assert(repo.InsertRecord(*b, Record("s", "k", "early")).code == ErrorCode::AlreadyExists);
    b->Rollback();

    a->Rollback();
  }
  {
    // destructor rolls back
    auto a = repo.Begin();
    assert(repo.InsertRecord(*a, Record("s", "k", "dropped")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetRecord(*tx, "s", "k").has_value());
  assert(repo.InsertRecord(*tx, Record("s", "k", "kept")));
  tx->Commit();

  auto read = repo.Begin();
  assert(repo.GetRecord(*read, "s", "k")->value == "kept");
  read->Commit();
}

void TestFinishedTransactionRejectsUse() {
  MemoryRepository repo;

  auto tx = repo.Begin();
  assert(repo.UpsertCheckpoint(*tx, Checkpoint("r", "v")));
  tx->Commit();
  assert(tx->IsCommitted());

  bool threw = false;
  try {
    tx->Commit();
  } catch (const durable::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)repo.GetCheckpoint(*tx, "r");
  } catch (const durable::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestDeleteThenUpsertInOneTransaction() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    repo.UpsertCheckpoint(*tx, Checkpoint("r", "v1"));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.DeleteCheckpoint(*tx, "r"));
    assert(repo.ListCheckpoints(*tx).empty());
    assert(repo.UpsertCheckpoint(*tx, Checkpoint("r", "v2")));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto rows = repo.ListCheckpoints(*tx);
  assert(rows.size() == 1);
  assert(rows[0].value == "v2");
  tx->Commit();
}

void TestListingsAreOrdered() {
  MemoryRepository repo;

  auto tx = repo.Begin();
  repo.UpsertCheckpoint(*tx, Checkpoint("c", "3"));
  repo.UpsertCheckpoint(*tx, Checkpoint("a", "1"));
  repo.InsertRecord(*tx, Record("s", "z", "z"));
  repo.InsertRecord(*tx, Record("s", "m", "m"));
  repo.InsertRecord(*tx, Record("other", "a", "a"));
  tx->Commit();

  auto rtx = repo.Begin();
  repo.UpsertCheckpoint(*rtx, Checkpoint("b", "2"));

  auto checkpoints = repo.ListCheckpoints(*rtx);
  assert(checkpoints.size() == 3);
  assert(checkpoints[0].run_id == "a");
  assert(checkpoints[1].run_id == "b");
  assert(checkpoints[2].run_id == "c");

  auto records = repo.ListRecords(*rtx, "s");
  assert(records.size() == 2);
  assert(records[0].key == "m");
  assert(records[1].key == "z");
  rtx->Rollback();
}

} // namespace

int main() {
  TestConcurrentInsertSeesReservedKey();
  TestRollbackReleasesReservedKey();
  TestFinishedTransactionRejectsUse();
  TestDeleteThenUpsertInOneTransaction();
  TestListingsAreOrdered();

  std::cout << "durable_flow_unit_memory_repository: pass\n";
  return 0;
}
