#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace durable::engine {

/*
  Thread-safe blocking queue of runnable run ids for scheduler workers.

  A run id is queued at most once at a time; the scheduler's busy flag
  guarantees it.
*/
class ReadyQueue {
 public:
  void Enqueue(const std::string& run_id);

  // blocking wait; nullopt after Shutdown
  std::optional<std::string> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  bool                    shutdown_ = false;
};

} // namespace durable::engine
