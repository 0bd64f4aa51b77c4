#pragma once

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "durable/v1.hpp"

namespace durable::statemachine {

/*
  In-memory state of one run.

  The checkpoint is the whole persisted continuation; removed marks the
  terminal state after which the run can never resume.
*/
struct StateMachineState {
  durable::v1::Checkpoint checkpoint;
  bool                    removed = false;

  bool IsErrored() const {
    return checkpoint.error_state().has_errored();
  }
};

// ---------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------

namespace event {

struct Start {
  std::string arguments;
};

struct DoRemainingWork {};

struct DeliverMessage {
  std::string key;
  std::string payload;
};

struct Error {
  std::string message;
  std::string error_type;
};

} // namespace event

using Event = std::variant<event::Start, event::DoRemainingWork, event::DeliverMessage, event::Error>;

// ---------------------------------------------------------------------
// Actions
// ---------------------------------------------------------------------

namespace action {

// Writes the transition's new checkpoint.
struct PersistCheckpoint {};

struct RemoveCheckpoint {};

struct PersistRecord {
  std::string         store;
  std::string         key;
  durable::v1::Record record;
};

struct RecordError {
  std::string details;
};

// Enqueued for the same run once the transition commits.
struct ScheduleEvent {
  Event event;
};

} // namespace action

using Action = std::variant<action::PersistCheckpoint, action::RemoveCheckpoint, action::PersistRecord, action::RecordError, action::ScheduleEvent>;

// ---------------------------------------------------------------------
// Continuation
// ---------------------------------------------------------------------

namespace continuation {

struct Continue {};

// reason is the external-event key the run parks on.
struct Suspend {
  std::string reason;
};

struct Abort {};

struct Remove {};

} // namespace continuation

using ContinuationDecision = std::variant<continuation::Continue, continuation::Suspend, continuation::Abort, continuation::Remove>;

inline bool IsRemove(const ContinuationDecision& decision) {
  return std::holds_alternative<continuation::Remove>(decision);
}

inline bool IsTerminal(const ContinuationDecision& decision) {
  return std::holds_alternative<continuation::Remove>(decision) || std::holds_alternative<continuation::Abort>(decision);
}

// ---------------------------------------------------------------------
// Transition
// ---------------------------------------------------------------------

struct TransitionResult {
  StateMachineState    new_state;
  std::vector<Action>  actions;
  ContinuationDecision continuation;
};

// Identity of the run a transition is executed for.
struct FlowFiber {
  durable::v1::RunID run_id;
  std::string        flow_class;
};

// Pure: decides, never executes.
using TransitionFunction = std::function<TransitionResult(const StateMachineState&, const Event&)>;

std::string ToString(const Event& event);
std::string ToString(const Action& action);
std::string ToString(const ContinuationDecision& decision);
std::string ToString(const StateMachineState& state);

} // namespace durable::statemachine
