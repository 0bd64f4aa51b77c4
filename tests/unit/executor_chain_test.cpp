#include "internal/statemachine/transition_executor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/statemachine/action_executor.hpp"
#include "internal/store/checkpoint_store.hpp"
#include "internal/store/record_stores.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace durable::statemachine;
using durable::db::memory::MemoryRepository;
using durable::store::CheckpointStore;
using durable::store::RecordStores;

struct Scheduled {
  std::string run_id;
  Event       event;
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repo        = std::make_shared<MemoryRepository>();
  std::shared_ptr<CheckpointStore>  checkpoints = std::make_shared<CheckpointStore>(repo);
  std::shared_ptr<RecordStores>     records     = std::make_shared<RecordStores>(repo);
  std::vector<Scheduled>            scheduled;
  StoreActionExecutor               actions{checkpoints, records, [this](const durable::v1::RunID& id, const Event& e) {
                                 scheduled.push_back({id.value(), e});
                               }};

  std::optional<durable::v1::Checkpoint> Checkpoint(const FlowFiber& fiber) {
    auto tx = repo->Begin();
    auto cp = checkpoints->Get(*tx, fiber.run_id);
    tx->Commit();
    return cp;
  }
};

// Fails every action after the first `allowed` executions.
class FailAfter final : public ActionExecutor {
 public:
  FailAfter(ActionExecutor& inner, int allowed) : inner_(inner), allowed_(allowed) {
  }

  void Execute(durable::db::Transaction& tx, const FlowFiber& fiber, const StateMachineState& state, const Action& action) override {
    if (allowed_-- <= 0) throw std::runtime_error("action failed");
    inner_.Execute(tx, fiber, state, action);
  }

 private:
  ActionExecutor& inner_;
  int             allowed_;
};

FlowFiber NewFiber() {
  return FlowFiber{durable::util::NewRunID(), "test.Flow"};
}

StateMachineState CleanState(uint64_t step) {
  StateMachineState state;
  state.checkpoint.set_step(step);
  state.checkpoint.mutable_error_state()->mutable_clean();
  return state;
}

StateMachineState ErroredState(uint64_t step) {
  StateMachineState state;
  state.checkpoint.set_step(step);
  state.checkpoint.mutable_error_state()->mutable_errored()->add_errors()->set_message("boom");
  return state;
}

durable::v1::Record MakeRecord(const std::string& key) {
  durable::v1::Record record;
  record.set_key(key);
  record.set_payload("payload-" + key);
  return record;
}

TransitionInterceptor Tag(std::vector<std::string>& trace, const std::string& name) {
  return [&trace, name](TransitionExecutor inner) -> TransitionExecutor {
    return [&trace, name, inner = std::move(inner)](FlowFiber& fiber, const StateMachineState& previous, const Event& event,
                                                    const TransitionResult& transition, ActionExecutor& actions) {
      trace.push_back(name + ":before");
      auto outcome = inner(fiber, previous, event, transition, actions);
      trace.push_back(name + ":after");
      return outcome;
    };
  };
}

void TestFirstInterceptorIsOutermost() {
  std::vector<std::string> trace;
  TransitionExecutor       core = [&trace](FlowFiber&, const StateMachineState&, const Event&, const TransitionResult& transition, ActionExecutor&) {
    trace.push_back("core");
    return std::make_pair(transition.continuation, transition.new_state);
  };

  auto executor = ComposeExecutor(core, {Tag(trace, "outer"), Tag(trace, "inner")});

  Fixture          f;
  auto             fiber = NewFiber();
  TransitionResult transition{CleanState(1), {}, continuation::Continue{}};
  executor(fiber, CleanState(0), event::Start{}, transition, f.actions);

  const std::vector<std::string> expected = {"outer:before", "inner:before", "core", "inner:after", "outer:after"};
  assert(trace == expected);

  trace.clear();
  auto bare = ComposeExecutor(core, {});
  bare(fiber, CleanState(0), event::Start{}, transition, f.actions);
  assert(trace == std::vector<std::string>{"core"});
}

void TestActionsCommitTogether() {
  Fixture f;
  auto    executor = MakeCoreExecutor(f.repo);
  auto    fiber    = NewFiber();

  TransitionResult transition;
  transition.new_state = CleanState(1);
  transition.new_state.checkpoint.set_frozen_state("state-1");
  transition.actions      = {action::PersistCheckpoint{}, action::PersistRecord{"records", "r1", MakeRecord("r1")}};
  transition.continuation = continuation::Suspend{"record:r2"};

  auto [decision, next] = executor(fiber, CleanState(0), event::Start{}, transition, f.actions);
  assert(std::holds_alternative<continuation::Suspend>(decision));
  assert(std::get<continuation::Suspend>(decision).reason == "record:r2");
  assert(next.checkpoint.step() == 1);

  auto stored = f.Checkpoint(fiber);
  assert(stored.has_value());
  assert(stored->id().value() == fiber.run_id.value());
  assert(stored->flow_class() == "test.Flow");
  assert(stored->frozen_state() == "state-1");
  assert(stored->has_updated_at());

  auto tx = f.repo->Begin();
  assert(f.records->Get("records")->Get(*tx, "r1").has_value());
  tx->Commit();
}

void TestActionFailureRollsBackEverything() {
  Fixture f;
  auto    executor = MakeCoreExecutor(f.repo);
  auto    fiber    = NewFiber();
  auto    updates  = f.records->Get("records")->Updates();

  TransitionResult transition;
  transition.new_state    = CleanState(1);
  transition.actions      = {action::PersistCheckpoint{}, action::PersistRecord{"records", "r1", MakeRecord("r1")},
                             action::ScheduleEvent{event::DoRemainingWork{}}, action::RemoveCheckpoint{}};
  transition.continuation = continuation::Continue{};

  FailAfter failing(f.actions, 3);
  bool      threw = false;
  try {
    executor(fiber, CleanState(0), event::Start{}, transition, failing);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  assert(!f.Checkpoint(fiber).has_value());
  assert(f.scheduled.empty());
  assert(updates->Pending() == 0);

  auto tx = f.repo->Begin();
  assert(!f.records->Get("records")->Get(*tx, "r1").has_value());
  tx->Commit();
}

void TestScheduledEventArrivesAfterCommit() {
  Fixture f;
  auto    executor = MakeCoreExecutor(f.repo);
  auto    fiber    = NewFiber();

  // observes the scheduler queue while the transaction is still open
  std::size_t delivered_during_actions = 0;
  class Observing final : public ActionExecutor {
   public:
    Observing(Fixture& f, std::size_t& delivered) : f_(f), delivered_(delivered) {
    }
    void Execute(durable::db::Transaction& tx, const FlowFiber& fiber, const StateMachineState& state, const Action& action) override {
      f_.actions.Execute(tx, fiber, state, action);
      delivered_ += f_.scheduled.size();
    }

   private:
    Fixture&     f_;
    std::size_t& delivered_;
  } observing(f, delivered_during_actions);

  TransitionResult transition;
  transition.new_state    = CleanState(1);
  transition.actions      = {action::ScheduleEvent{event::DeliverMessage{"k", "v"}}, action::PersistCheckpoint{}};
  transition.continuation = continuation::Continue{};

  executor(fiber, CleanState(0), event::Start{}, transition, observing);

  assert(delivered_during_actions == 0);
  assert(f.scheduled.size() == 1);
  assert(f.scheduled[0].run_id == fiber.run_id.value());
  assert(std::holds_alternative<event::DeliverMessage>(f.scheduled[0].event));
  assert(std::get<event::DeliverMessage>(f.scheduled[0].event).key == "k");
}

void TestRecoveryPolicy() {
  auto fiber = NewFiber();

  TransitionResult recover;
  recover.new_state    = CleanState(2);
  recover.actions      = {action::PersistCheckpoint{}};
  recover.continuation = continuation::Continue{};

  {
    Fixture f;
    auto    executor = MakeCoreExecutor(f.repo);
    bool    threw    = false;
    try {
      executor(fiber, ErroredState(1), event::DoRemainingWork{}, recover, f.actions);
    } catch (const durable::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
    assert(!f.Checkpoint(fiber).has_value());

    // errored to errored stays allowed
    TransitionResult stay{ErroredState(2), {action::PersistCheckpoint{}}, continuation::Suspend{"retry"}};
    executor(fiber, ErroredState(1), event::DoRemainingWork{}, stay, f.actions);
    auto stored = f.Checkpoint(fiber);
    assert(stored.has_value());
    assert(stored->error_state().has_errored());
  }
  {
    Fixture f;
    auto    executor = MakeCoreExecutor(f.repo, ExecutorPolicy{true});
    auto [decision, next] = executor(fiber, ErroredState(1), event::DoRemainingWork{}, recover, f.actions);
    assert(std::holds_alternative<continuation::Continue>(decision));
    assert(!next.IsErrored());
    assert(f.Checkpoint(fiber).has_value());
  }
}

void TestRemoveCheckpointAction() {
  Fixture f;
  auto    executor = MakeCoreExecutor(f.repo);
  auto    fiber    = NewFiber();

  TransitionResult persist{CleanState(1), {action::PersistCheckpoint{}}, continuation::Continue{}};
  executor(fiber, CleanState(0), event::Start{}, persist, f.actions);
  assert(f.Checkpoint(fiber).has_value());

  auto done    = CleanState(2);
  done.removed = true;
  TransitionResult remove{done, {action::RecordError{"nothing wrong"}, action::RemoveCheckpoint{}}, continuation::Remove{}};
  auto [decision, next] = executor(fiber, CleanState(1), event::DoRemainingWork{}, remove, f.actions);
  assert(IsRemove(decision));
  assert(IsTerminal(decision));
  assert(next.removed);
  assert(!f.Checkpoint(fiber).has_value());
}

} // namespace

int main() {
  TestFirstInterceptorIsOutermost();
  TestActionsCommitTogether();
  TestActionFailureRollsBackEverything();
  TestScheduledEventArrivesAfterCommit();
  TestRecoveryPolicy();
  TestRemoveCheckpointAction();

  std::cout << "durable_flow_unit_executor_chain: pass\n";
  return 0;
}
