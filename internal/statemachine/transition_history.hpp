#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/statemachine/types.hpp"

namespace durable::statemachine {

// One executed transition; in-memory only.
struct TransitionRecord {
  durable::v1::RunID   run_id;
  StateMachineState    previous_state;
  Event                event;
  TransitionResult     transition;
  ContinuationDecision continuation;
  StateMachineState    next_state;
  uint64_t             recorded_at_ms = 0;
};

// Single line, no trailing newline.
std::string Describe(const TransitionRecord& record);

/*
  Per-run ordered transition history.

  Sharded by run id; each shard has its own mutex, so appends for
  different runs rarely contend. Within a run, records keep append order.
*/
class TransitionHistory {
 public:
  static constexpr std::size_t kShardCount = 16;

  // Appends, creating the run's list if absent; returns the list after the append.
  std::vector<TransitionRecord> Append(TransitionRecord record);

  // Drops the run's whole history.
  void Discard(const std::string& run_id);

  std::vector<TransitionRecord> Get(const std::string& run_id) const;

  std::size_t RunCount() const;

 private:
  struct Shard {
    mutable std::mutex                                             mutex;
    std::unordered_map<std::string, std::vector<TransitionRecord>> runs;
  };

  Shard&       ShardFor(const std::string& run_id);
  const Shard& ShardFor(const std::string& run_id) const;

  std::array<Shard, kShardCount> shards_;
};

} // namespace durable::statemachine
