#include "internal/statemachine/transition_history.hpp"

#include <functional>
#include <sstream>

namespace durable::statemachine {

std::string Describe(const TransitionRecord& record) {
  std::ostringstream out;
  out << "TransitionRecord(run=" << record.run_id.value() << ", previous=" << ToString(record.previous_state) << ", event=" << ToString(record.event)
      << ", actions=[";
  for (std::size_t i = 0; i < record.transition.actions.size(); ++i) {
    if (i) out << ", ";
    out << ToString(record.transition.actions[i]);
  }
  out << "], continuation=" << ToString(record.continuation) << ", next=" << ToString(record.next_state) << ")";
  return out.str();
}

TransitionHistory::Shard& TransitionHistory::ShardFor(const std::string& run_id) {
  return shards_[std::hash<std::string>{}(run_id) % kShardCount];
}

const TransitionHistory::Shard& TransitionHistory::ShardFor(const std::string& run_id) const {
  return shards_[std::hash<std::string>{}(run_id) % kShardCount];
}

std::vector<TransitionRecord> TransitionHistory::Append(TransitionRecord record) {
  auto&          shard = ShardFor(record.run_id.value());
  std::lock_guard lock(shard.mutex);

  auto& records = shard.runs[record.run_id.value()];
  records.push_back(std::move(record));
  return records;
}

void TransitionHistory::Discard(const std::string& run_id) {
  auto&          shard = ShardFor(run_id);
  std::lock_guard lock(shard.mutex);
  shard.runs.erase(run_id);
}

std::vector<TransitionRecord> TransitionHistory::Get(const std::string& run_id) const {
  const auto&    shard = ShardFor(run_id);
  std::lock_guard lock(shard.mutex);

  auto it = shard.runs.find(run_id);
  if (it == shard.runs.end()) return {};
  return it->second;
}

std::size_t TransitionHistory::RunCount() const {
  std::size_t count = 0;
  for (const auto& shard : shards_) {
    std::lock_guard lock(shard.mutex);
    count += shard.runs.size();
  }
  return count;
}

} // namespace durable::statemachine
