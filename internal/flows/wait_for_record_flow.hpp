#pragma once

#include <string>

#include "internal/statemachine/types.hpp"

namespace durable::engine {
class FlowRegistry;
}

namespace durable::flows {

/*
  Built-in flow: waits until a record with the given key is published.

  Start(arguments = record key) checkpoints and suspends on
  "record:<key>"; the delivered record payload ends the run, which removes
  its checkpoint. Survives restarts while waiting.
*/
inline constexpr const char* kWaitForRecordFlow = "durable.WaitForRecord";

statemachine::TransitionResult WaitForRecordTransition(const statemachine::StateMachineState& state, const statemachine::Event& event);

void RegisterBuiltinFlows(engine::FlowRegistry& registry);

} // namespace durable::flows
