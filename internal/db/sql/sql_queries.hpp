#pragma once

namespace durable::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  IMPORTANT:
  Column order in every SELECT matches the Read* helpers in
  sqlite_repository.cpp.
*/

// checkpoints

static constexpr const char* UPSERT_CHECKPOINT =
    "INSERT INTO checkpoints(run_id,checkpoint_value,errored,updated_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(run_id) DO UPDATE SET"
    " checkpoint_value=excluded.checkpoint_value,"
    " errored=excluded.errored,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* DELETE_CHECKPOINT =
    "DELETE FROM checkpoints WHERE run_id=?;";

static constexpr const char* SELECT_CHECKPOINT =
    "SELECT run_id,checkpoint_value,errored,updated_at_ms"
    " FROM checkpoints WHERE run_id=?;";

static constexpr const char* SELECT_ALL_CHECKPOINTS =
    "SELECT run_id,checkpoint_value,errored,updated_at_ms"
    " FROM checkpoints ORDER BY run_id;";

// append-only records

static constexpr const char* INSERT_RECORD =
    "INSERT INTO records(store,record_key,record_value,created_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(store,record_key) DO NOTHING;";

static constexpr const char* SELECT_RECORD =
    "SELECT store,record_key,record_value,created_at_ms"
    " FROM records WHERE store=? AND record_key=?;";

static constexpr const char* SELECT_RECORDS_IN_STORE =
    "SELECT store,record_key,record_value,created_at_ms"
    " FROM records WHERE store=? ORDER BY record_key;";

} // namespace durable::db::sql
