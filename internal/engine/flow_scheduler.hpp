#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/engine/ready_queue.hpp"
#include "internal/statemachine/action_executor.hpp"
#include "internal/statemachine/transition_executor.hpp"
#include "internal/statemachine/transition_history.hpp"
#include "internal/store/record_stores.hpp"

namespace durable::db {
class Repository;
}
namespace durable::store {
class CheckpointStore;
}

namespace durable::engine {

class FlowRegistry;

// Runs suspended on "record:<key>" wake when <key> is published to the record store.
inline constexpr const char* kRecordKeyPrefix = "record:";

/*
  Drives runs through their transition functions on a fixed worker pool.

  IMPORTANT:
  - A run is bound to at most one worker at a time (mailbox + busy flag)
  - Suspend parks the run on the decision's reason key; Deliver() or a
    matching record publish resumes it
  - Abort keeps the last committed checkpoint; Remove is terminal
  - A transition that throws aborts the run; its transaction rolled back,
    so the run resumes from its last checkpoint after restart
  - A terminated run leaves nothing behind in memory except its decision,
    kept until AwaitTermination claims it or retention evicts it
  - Start() restores every Clean checkpoint of a registered flow class;
    Errored checkpoints are left for inspection
*/
class FlowScheduler {
 public:
  struct Options {
    uint32_t    worker_threads = 4;
    std::string record_store   = "records";
    // Unclaimed termination decisions kept for AwaitTermination, oldest evicted first.
    std::size_t terminated_retention = 1024;
    // When set, a terminated run's transition history is discarded.
    std::shared_ptr<statemachine::TransitionHistory> history;
  };

  FlowScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<store::CheckpointStore> checkpoints,
                std::shared_ptr<store::RecordStores> records, std::shared_ptr<FlowRegistry> registry, statemachine::TransitionExecutor executor,
                Options options);
  ~FlowScheduler();

  FlowScheduler(const FlowScheduler&)            = delete;
  FlowScheduler& operator=(const FlowScheduler&) = delete;

  // Returns the number of restored runs. Throws util::InvalidState if called twice.
  std::size_t Start();

  // In-memory runs are dropped; checkpoints remain.
  void Stop();

  // Throws util::InvalidState for an unregistered flow class.
  durable::v1::RunID StartRun(const std::string& flow_class, const std::string& arguments,
                              durable::v1::InvocationOrigin origin = durable::v1::INVOCATION_ORIGIN_SERVICE);

  // Returns the number of runs woken.
  std::size_t Deliver(const std::string& key, const std::string& payload);

  // nullopt if the run did not terminate within timeout. The decision is
  // handed out once; a second call for the same run waits again.
  std::optional<statemachine::ContinuationDecision> AwaitTermination(const durable::v1::RunID& run_id, std::chrono::milliseconds timeout);

  std::size_t ActiveRuns() const;
  std::size_t ParkedCount(const std::string& key) const;

 private:
  struct RunSlot {
    statemachine::FlowFiber          fiber;
    statemachine::StateMachineState  state;
    std::deque<statemachine::Event>  mailbox;
    bool                             busy = false;
    std::string                      parked_on;
    bool                             parked = false;
  };

  void Enqueue(const durable::v1::RunID& run_id, statemachine::Event event);
  void ScheduleLocked(const std::string& run_id, RunSlot& slot);
  void ParkLocked(const std::string& run_id, RunSlot& slot, const std::string& key);
  void TerminateLocked(const std::string& run_id, const statemachine::ContinuationDecision& decision);

  std::size_t Restore(std::vector<std::string>& parked_keys);
  void        WakeIfRecordPresent(const std::string& key);

  void WorkerLoop();
  void Drive(const std::string& run_id);
  void PumpRecordFeed();

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<store::CheckpointStore>       checkpoints_;
  std::shared_ptr<store::RecordStores>          records_;
  std::shared_ptr<FlowRegistry>                 registry_;
  statemachine::TransitionExecutor              executor_;
  Options                                       options_;
  std::unique_ptr<statemachine::ActionExecutor> actions_;

  ReadyQueue               ready_;
  std::vector<std::thread> workers_;
  std::thread              pump_;

  std::shared_ptr<store::Subscription<store::RecordStore::Entry>> record_feed_;

  mutable std::mutex                                                      mutex_;
  std::condition_variable                                                 terminated_cv_;
  std::unordered_map<std::string, std::shared_ptr<RunSlot>>               runs_;
  std::unordered_map<std::string, std::unordered_set<std::string>>        parked_;
  std::unordered_map<std::string, statemachine::ContinuationDecision>     terminated_;
  std::deque<std::string>                                                 terminated_order_;
  bool                                                                    started_ = false;
  bool                                                                    stopped_ = false;
  std::atomic<bool>                                                       stopping_{false};
};

} // namespace durable::engine
