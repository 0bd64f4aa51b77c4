#pragma once

#include <functional>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "internal/statemachine/types.hpp"

namespace durable::store {
class CheckpointStore;
class RecordStores;
} // namespace durable::store

namespace durable::statemachine {

/*
  Executes the side effects a transition asked for, inside the caller's
  transaction. It never decides which actions run.
*/
class ActionExecutor {
 public:
  virtual ~ActionExecutor() = default;

  virtual void Execute(db::Transaction& tx, const FlowFiber& fiber, const StateMachineState& new_state, const Action& action) = 0;
};

// Receives ScheduleEvent actions after their transaction commits.
using EventScheduler = std::function<void(const durable::v1::RunID&, const Event&)>;

class StoreActionExecutor final : public ActionExecutor {
 public:
  StoreActionExecutor(std::shared_ptr<store::CheckpointStore> checkpoints, std::shared_ptr<store::RecordStores> records, EventScheduler scheduler);

  void Execute(db::Transaction& tx, const FlowFiber& fiber, const StateMachineState& new_state, const Action& action) override;

 private:
  std::shared_ptr<store::CheckpointStore> checkpoints_;
  std::shared_ptr<store::RecordStores>    records_;
  EventScheduler                          scheduler_;
};

} // namespace durable::statemachine
