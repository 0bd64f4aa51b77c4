#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace durable::store {

template <typename T>
class UpdateFeed;

/*
  Per-subscriber queue of published values.

  Created at subscribe time, optionally seeded with keys the subscriber has
  already seen in a snapshot. The first publish of a seeded key is dropped
  and consumes the seed; unseeded keys pass straight through. With a feed
  that publishes each key once, a subscriber observes every key at most once.
*/
template <typename T>
class Subscription {
 public:
  explicit Subscription(std::unordered_set<std::string> seeds = {}) : seeds_(std::move(seeds)) {
  }

  std::optional<T> TryPop() {
    std::lock_guard lock(mutex_);
    return PopLocked();
  }

  // Waits up to timeout; nullopt on timeout or once closed and drained.
  template <typename Rep, typename Period>
  std::optional<T> WaitPop(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
    return PopLocked();
  }

  // Blocking wait; nullopt once closed and drained.
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });
    return PopLocked();
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  std::size_t Pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  // Snapshot keys whose publish has not arrived yet.
  std::size_t UnmatchedSeeds() const {
    std::lock_guard lock(mutex_);
    return seeds_.size();
  }

 private:
  friend class UpdateFeed<T>;

  void Push(const std::string& key, const T& value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) return;
      if (!seeds_.empty() && seeds_.erase(key) > 0) return;
      queue_.push(value);
    }
    cv_.notify_one();
  }

  std::optional<T> PopLocked() {
    if (queue_.empty()) return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::queue<T>                   queue_;
  std::unordered_set<std::string> seeds_;
  bool                            closed_ = false;
};

/*
  Fan-out of committed values to live subscribers.

  Subscribers are held weakly; dropping the last shared_ptr unsubscribes.
*/
template <typename T>
class UpdateFeed {
 public:
  std::shared_ptr<Subscription<T>> Subscribe(std::unordered_set<std::string> seen_keys = {}) {
    auto subscription = std::make_shared<Subscription<T>>(std::move(seen_keys));

    std::lock_guard lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
  }

  void Publish(const std::string& key, const T& value) {
    for (auto& subscriber : LiveSubscribers()) {
      subscriber->Push(key, value);
    }
  }

  // Closes every live subscription; later subscribers are unaffected.
  void CloseAll() {
    for (auto& subscriber : LiveSubscribers()) {
      subscriber->Close();
    }
  }

  std::size_t SubscriberCount() {
    return LiveSubscribers().size();
  }

 private:
  std::vector<std::shared_ptr<Subscription<T>>> LiveSubscribers() {
    std::vector<std::shared_ptr<Subscription<T>>> live;

    std::lock_guard lock(mutex_);
    auto            out = subscribers_.begin();
    for (auto& weak : subscribers_) {
      if (auto strong = weak.lock()) {
        live.push_back(std::move(strong));
        if (&*out != &weak) *out = std::move(weak);
        ++out;
      }
    }
    subscribers_.erase(out, subscribers_.end());
    return live;
  }

  std::mutex                                  mutex_;
  std::vector<std::weak_ptr<Subscription<T>>> subscribers_;
};

} // namespace durable::store
