#pragma once

#include <cstdint>
#include <string>

namespace durable::db::model {

/*
  Persistent checkpoint row.

  IMPORTANT:
  - One row per run id; writes overwrite.
  - value is the serialized durable.v1.Checkpoint, opaque to the repository.
  - errored mirrors the checkpoint's error state so operators can query it
    without decoding.
*/

struct CheckpointRecord {
  std::string run_id;
  std::string value;

  bool errored = false;

  uint64_t updated_at_ms = 0;
};

}
