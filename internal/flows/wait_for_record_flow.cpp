#include "internal/flows/wait_for_record_flow.hpp"

#include "internal/engine/flow_registry.hpp"
#include "internal/engine/flow_scheduler.hpp"
#include "internal/util/overloaded.hpp"
#include "internal/util/time.hpp"

namespace durable::flows {

using namespace durable::statemachine;

namespace {

TransitionResult Suspended(StateMachineState next, const std::string& key) {
  next.checkpoint.set_step(next.checkpoint.step() + 1);
  next.checkpoint.set_number_of_suspends(next.checkpoint.number_of_suspends() + 1);
  next.checkpoint.set_suspended_on(key);

  TransitionResult result;
  result.new_state    = std::move(next);
  result.actions      = {action::PersistCheckpoint{}};
  result.continuation = continuation::Suspend{key};
  return result;
}

TransitionResult Finished(StateMachineState next) {
  next.checkpoint.set_step(next.checkpoint.step() + 1);
  next.checkpoint.clear_suspended_on();
  next.removed = true;

  TransitionResult result;
  result.new_state    = std::move(next);
  result.actions      = {action::RemoveCheckpoint{}};
  result.continuation = continuation::Remove{};
  return result;
}

TransitionResult Failed(StateMachineState next, const std::string& message) {
  auto* error = next.checkpoint.mutable_error_state()->mutable_errored()->add_errors();
  error->set_message(message);
  error->set_error_type("WaitForRecordError");
  *error->mutable_occurred_at() = util::ToProto(util::Now());

  TransitionResult result;
  result.new_state    = std::move(next);
  result.actions      = {action::PersistCheckpoint{}, action::RecordError{message}};
  result.continuation = continuation::Abort{};
  return result;
}

} // namespace

TransitionResult WaitForRecordTransition(const StateMachineState& state, const Event& event) {
  return std::visit(util::Overloaded{
                        [&](const event::Start& start) {
                          if (start.arguments.empty()) return Failed(state, "record key argument is required");
                          return Suspended(state, std::string(engine::kRecordKeyPrefix) + start.arguments);
                        },
                        [&](const event::DoRemainingWork&) {
                          // restored without a suspension key: nothing left to wait for
                          return Finished(state);
                        },
                        [&](const event::DeliverMessage& message) {
                          if (message.key != state.checkpoint.suspended_on()) {
                            return Suspended(state, state.checkpoint.suspended_on());
                          }
                          return Finished(state);
                        },
                        [&](const event::Error& error) { return Failed(state, error.message); },
                    },
                    event);
}

void RegisterBuiltinFlows(engine::FlowRegistry& registry) {
  registry.Register(kWaitForRecordFlow, WaitForRecordTransition);
}

} // namespace durable::flows
