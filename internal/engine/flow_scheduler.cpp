#include "flow_scheduler.hpp"

#include <exception>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/engine/flow_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/checkpoint_store.hpp"
#include "internal/util/error_codes.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace durable::engine {

using observability::IntField;
using observability::RunIdField;
using observability::StringField;
using namespace durable::statemachine;

FlowScheduler::FlowScheduler(std::shared_ptr<db::Repository> repository, std::shared_ptr<store::CheckpointStore> checkpoints,
                             std::shared_ptr<store::RecordStores> records, std::shared_ptr<FlowRegistry> registry, TransitionExecutor executor,
                             Options options)
    : repository_(std::move(repository)),
      checkpoints_(std::move(checkpoints)),
      records_(std::move(records)),
      registry_(std::move(registry)),
      executor_(std::move(executor)),
      options_(std::move(options)) {
  if (options_.worker_threads == 0) options_.worker_threads = 1;
  if (options_.terminated_retention == 0) options_.terminated_retention = 1;

  actions_ = std::make_unique<StoreActionExecutor>(checkpoints_, records_,
                                                   [this](const durable::v1::RunID& run_id, const Event& event) { Enqueue(run_id, event); });
}

FlowScheduler::~FlowScheduler() {
  Stop();
}

// ---------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------

std::size_t FlowScheduler::Start() {
  {
    std::lock_guard lock(mutex_);
    if (started_) {
      throw util::InvalidState("flow scheduler already started");
    }
    started_ = true;
  }

  // subscribe before restoring so no publish falls between the two
  record_feed_ = records_->Get(options_.record_store)->Updates();

  for (uint32_t i = 0; i < options_.worker_threads; ++i) {
    workers_.emplace_back(&FlowScheduler::WorkerLoop, this);
  }
  pump_ = std::thread(&FlowScheduler::PumpRecordFeed, this);

  std::vector<std::string> parked_keys;
  auto                     restored = Restore(parked_keys);
  for (const auto& key : parked_keys) {
    WakeIfRecordPresent(key);
  }

  DURABLE_LOG_INFO("flow scheduler started",
                   {IntField("workers", options_.worker_threads), IntField("restored_runs", static_cast<int64_t>(restored))});
  return restored;
}

void FlowScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!started_ || stopped_) return;
    stopped_ = true;
  }
  stopping_ = true;

  ready_.Shutdown();
  if (record_feed_) record_feed_->Close();

  if (pump_.joinable()) pump_.join();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    dropped = runs_.size();
    runs_.clear();
    parked_.clear();
  }
  terminated_cv_.notify_all();

  DURABLE_LOG_INFO("flow scheduler stopped", {IntField("dropped_runs", static_cast<int64_t>(dropped))});
}

std::size_t FlowScheduler::Restore(std::vector<std::string>& parked_keys) {
  auto tx       = repository_->Begin();
  auto sequence = checkpoints_->Enumerate(*tx);

  std::size_t restored = 0;
  for (auto it = sequence.begin(); it != sequence.end(); ++it) {
    durable::v1::RunID      run_id;
    durable::v1::Checkpoint checkpoint;
    try {
      std::tie(run_id, checkpoint) = *it;
    } catch (const util::DeserializationError& e) {
      DURABLE_LOG_ERROR("skipping unreadable checkpoint", {StringField("code", util::ErrorCodeOf(e)), StringField("error", e.what())});
      continue;
    }

    if (checkpoint.error_state().has_errored()) {
      DURABLE_LOG_WARN("not resuming errored run", {RunIdField(run_id), StringField("flow_class", checkpoint.flow_class())});
      continue;
    }
    if (!registry_->Contains(checkpoint.flow_class())) {
      DURABLE_LOG_WARN("not resuming run of unknown flow class", {StringField("code", util::ErrorCode(util::FlowErrors::kUnknownFlowClass)),
                                                                  RunIdField(run_id),
                                                                  StringField("flow_class", checkpoint.flow_class())});
      continue;
    }

    auto slot                = std::make_shared<RunSlot>();
    slot->fiber.run_id       = run_id;
    slot->fiber.flow_class   = checkpoint.flow_class();
    slot->state.checkpoint   = std::move(checkpoint);
    const auto& suspended_on = slot->state.checkpoint.suspended_on();

    std::lock_guard lock(mutex_);
    auto&           stored = runs_[run_id.value()];
    stored                 = slot;
    if (!suspended_on.empty()) {
      ParkLocked(run_id.value(), *stored, suspended_on);
      parked_keys.push_back(suspended_on);
    } else {
      stored->mailbox.emplace_back(event::DoRemainingWork{});
      ScheduleLocked(run_id.value(), *stored);
    }
    ++restored;
  }
  tx->Commit();
  return restored;
}

// ---------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------

durable::v1::RunID FlowScheduler::StartRun(const std::string& flow_class, const std::string& arguments, durable::v1::InvocationOrigin origin) {
  if (!registry_->Contains(flow_class)) {
    throw util::InvalidState(util::ErrorCode(util::FlowErrors::kUnknownFlowClass) + ": " + flow_class);
  }

  auto run_id = util::NewRunID();
  auto now    = util::ToProto(util::Now());

  auto slot              = std::make_shared<RunSlot>();
  slot->fiber.run_id     = run_id;
  slot->fiber.flow_class = flow_class;

  auto& checkpoint           = slot->state.checkpoint;
  *checkpoint.mutable_id()   = run_id;
  checkpoint.set_flow_class(flow_class);
  checkpoint.set_origin(origin);
  *checkpoint.mutable_created_at() = now;
  *checkpoint.mutable_updated_at() = now;
  checkpoint.mutable_error_state()->mutable_clean();

  slot->mailbox.emplace_back(event::Start{arguments});

  {
    std::lock_guard lock(mutex_);
    if (stopped_) {
      throw util::InvalidState("flow scheduler stopped");
    }
    auto& stored = runs_[run_id.value()];
    stored       = std::move(slot);
    ScheduleLocked(run_id.value(), *stored);
  }

  DURABLE_LOG_DEBUG("run started", {RunIdField(run_id), StringField("flow_class", flow_class)});
  return run_id;
}

std::size_t FlowScheduler::Deliver(const std::string& key, const std::string& payload) {
  std::lock_guard lock(mutex_);

  auto it = parked_.find(key);
  if (it == parked_.end()) return 0;

  auto waiting = std::move(it->second);
  parked_.erase(it);

  std::size_t woken = 0;
  for (const auto& run_id : waiting) {
    auto run = runs_.find(run_id);
    if (run == runs_.end()) continue;

    auto& slot = *run->second;
    slot.parked = false;
    slot.parked_on.clear();
    slot.mailbox.emplace_back(event::DeliverMessage{key, payload});
    ScheduleLocked(run_id, slot);
    ++woken;
  }
  return woken;
}

std::optional<ContinuationDecision> FlowScheduler::AwaitTermination(const durable::v1::RunID& run_id, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  terminated_cv_.wait_for(lock, timeout, [&] { return terminated_.contains(run_id.value()); });

  auto it = terminated_.find(run_id.value());
  if (it == terminated_.end()) return std::nullopt;
  auto decision = std::move(it->second);
  terminated_.erase(it);
  return decision;
}

std::size_t FlowScheduler::ActiveRuns() const {
  std::lock_guard lock(mutex_);
  return runs_.size();
}

std::size_t FlowScheduler::ParkedCount(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = parked_.find(key);
  return it == parked_.end() ? 0 : it->second.size();
}

void FlowScheduler::Enqueue(const durable::v1::RunID& run_id, Event event) {
  std::lock_guard lock(mutex_);

  auto it = runs_.find(run_id.value());
  if (it == runs_.end()) {
    DURABLE_LOG_DEBUG("dropping event for inactive run", {RunIdField(run_id), StringField("event", ToString(event))});
    return;
  }

  auto& slot = *it->second;
  if (slot.parked) {
    if (auto parked = parked_.find(slot.parked_on); parked != parked_.end()) {
      parked->second.erase(run_id.value());
      if (parked->second.empty()) parked_.erase(parked);
    }
    slot.parked = false;
    slot.parked_on.clear();
  }
  slot.mailbox.push_back(std::move(event));
  ScheduleLocked(run_id.value(), slot);
}

void FlowScheduler::ScheduleLocked(const std::string& run_id, RunSlot& slot) {
  if (slot.busy || slot.parked) return;
  slot.busy = true;
  ready_.Enqueue(run_id);
}

void FlowScheduler::ParkLocked(const std::string& run_id, RunSlot& slot, const std::string& key) {
  slot.parked    = true;
  slot.parked_on = key;
  parked_[key].insert(run_id);
}

void FlowScheduler::TerminateLocked(const std::string& run_id, const ContinuationDecision& decision) {
  auto it = runs_.find(run_id);
  if (it != runs_.end()) {
    const auto& slot = *it->second;
    if (slot.parked) {
      if (auto parked = parked_.find(slot.parked_on); parked != parked_.end()) {
        parked->second.erase(run_id);
        if (parked->second.empty()) parked_.erase(parked);
      }
    }
    runs_.erase(it);
  }
  if (options_.history) options_.history->Discard(run_id);

  terminated_[run_id] = decision;
  terminated_order_.push_back(run_id);
  while (terminated_order_.size() > options_.terminated_retention) {
    terminated_.erase(terminated_order_.front());
    terminated_order_.pop_front();
  }
  terminated_cv_.notify_all();
}

void FlowScheduler::WakeIfRecordPresent(const std::string& key) {
  if (key.rfind(kRecordKeyPrefix, 0) != 0) return;
  const auto record_key = key.substr(std::char_traits<char>::length(kRecordKeyPrefix));

  std::optional<durable::v1::Record> record;
  try {
    auto tx = repository_->Begin();
    record  = records_->Get(options_.record_store)->Get(*tx, record_key);
    tx->Commit();
  } catch (const std::exception& e) {
    DURABLE_LOG_WARN("record lookup for parked run failed", {StringField("key", key), StringField("code", util::ErrorCodeOf(e)),
                                                              StringField("error", e.what())});
    return;
  }

  if (record) Deliver(key, record->payload());
}

// ---------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------

void FlowScheduler::WorkerLoop() {
  while (auto run_id = ready_.Dequeue()) {
    Drive(*run_id);
  }
}

void FlowScheduler::Drive(const std::string& run_id) {
  std::shared_ptr<RunSlot> slot;
  {
    std::lock_guard lock(mutex_);
    auto            it = runs_.find(run_id);
    if (it == runs_.end()) return;
    slot = it->second;
  }

  auto transition_fn = registry_->Find(slot->fiber.flow_class);

  while (true) {
    Event event;
    {
      std::lock_guard lock(mutex_);
      if (stopping_ || slot->mailbox.empty()) {
        slot->busy = false;
        return;
      }
      event = std::move(slot->mailbox.front());
      slot->mailbox.pop_front();
    }

    std::pair<ContinuationDecision, StateMachineState> outcome;
    try {
      if (!transition_fn) {
        throw util::InvalidState(util::ErrorCode(util::FlowErrors::kUnknownFlowClass) + ": " + slot->fiber.flow_class);
      }
      auto transition = (*transition_fn)(slot->state, event);
      outcome         = executor_(slot->fiber, slot->state, event, transition, *actions_);
    } catch (const std::exception& e) {
      DURABLE_LOG_ERROR("transition failed, aborting run",
                        {RunIdField(slot->fiber.run_id), StringField("flow_class", slot->fiber.flow_class), StringField("event", ToString(event)),
                         StringField("code", util::ErrorCodeOf(e)), StringField("error", e.what())});
      std::lock_guard lock(mutex_);
      TerminateLocked(run_id, continuation::Abort{});
      return;
    }

    slot->state         = std::move(outcome.second);
    const auto decision = std::move(outcome.first);

    if (IsTerminal(decision)) {
      std::lock_guard lock(mutex_);
      TerminateLocked(run_id, decision);
      return;
    }

    if (const auto* suspend = std::get_if<continuation::Suspend>(&decision)) {
      bool parked = false;
      {
        std::lock_guard lock(mutex_);
        // events scheduled by the transition run before the run parks
        if (slot->mailbox.empty()) {
          ParkLocked(run_id, *slot, suspend->reason);
          slot->busy = false;
          parked     = true;
        }
      }
      if (parked) {
        WakeIfRecordPresent(suspend->reason);
        return;
      }
      continue;
    }

    // Continue
    std::lock_guard lock(mutex_);
    if (slot->mailbox.empty()) slot->mailbox.emplace_back(event::DoRemainingWork{});
  }
}

void FlowScheduler::PumpRecordFeed() {
  while (auto entry = record_feed_->Pop()) {
    Deliver(std::string(kRecordKeyPrefix) + entry->key, entry->value.payload());
  }
}

} // namespace durable::engine
