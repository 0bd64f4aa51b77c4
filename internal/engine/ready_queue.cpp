#include "ready_queue.hpp"

namespace durable::engine {

void ReadyQueue::Enqueue(const std::string& run_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    queue_.push(run_id);
  }
  cv_.notify_one();
}

std::optional<std::string> ReadyQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  // pending runs stay checkpointed; they are not drained on shutdown
  if (shutdown_) return std::nullopt;

  std::string run_id = std::move(queue_.front());
  queue_.pop();
  return run_id;
}

void ReadyQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t ReadyQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace durable::engine
