#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace durable::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_lock_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    DURABLE_LOG_ERROR("sqlite rollback failed", {durable::observability::StringField("error", e.what())});
  }
}

sqlite3* SqliteTransaction::Handle() const {
  if (finished_) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  return db_->Handle();
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (...) {
    Rollback();
    throw;
  }
  committed_ = true;
  finished_  = true;
  writer_lock_.unlock();

  RunCommitHooks();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;

  // a failed COMMIT may already have ended the transaction
  try {
    if (!sqlite3_get_autocommit(db_->Handle())) {
      db_->Exec("ROLLBACK;");
    }
  } catch (...) {
    writer_lock_.unlock();
    RunRollbackHooks();
    throw;
  }
  writer_lock_.unlock();

  RunRollbackHooks();
}

} // namespace durable::db::sqlite
