#pragma once

#include <functional>
#include <vector>

namespace durable::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Reads inside the transaction see its own writes immediately
  - Changes are invisible to other transactions until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE, serialized by a per-database writer mutex
  Memory: committed state + per-transaction write set

  Commit hooks run once, after the backend has made the writes durable and
  released its locks. They are dropped on rollback. Rollback hooks mirror
  them: they run once after an explicit or implicit rollback and are dropped
  on commit.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  void OnCommit(std::function<void()> hook) {
    commit_hooks_.push_back(std::move(hook));
  }

  void OnRollback(std::function<void()> hook) {
    rollback_hooks_.push_back(std::move(hook));
  }

protected:
  // Backends call exactly one of these, after releasing their locks.
  void RunCommitHooks();
  void RunRollbackHooks();

private:
  std::vector<std::function<void()>> commit_hooks_;
  std::vector<std::function<void()>> rollback_hooks_;
};

}
