#pragma once

#include <cstdint>
#include <string>

namespace durable::db::model {

/*
  Row of an append-only store.

  (store, key) is unique and a row is never updated once written.
*/

struct AppendOnlyRecord {
  std::string store;
  std::string key;
  std::string value;

  uint64_t created_at_ms = 0;
};

}
