#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace durable::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per database file. Transactions on it are serialized by
  WriterMutex(); a SqliteTransaction holds it from BEGIN to COMMIT/ROLLBACK.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

/*
  Owns a prepared statement for the scope of one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace durable::db::sqlite
