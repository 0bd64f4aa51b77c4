#pragma once

#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "internal/statemachine/action_executor.hpp"
#include "internal/statemachine/types.hpp"

namespace durable::db {
class Repository;
}

namespace durable::statemachine {

/*
  Executes one already-decided transition and reports its outcome.

  Returns the continuation decision and the state the run moves to.
*/
using TransitionExecutor = std::function<std::pair<ContinuationDecision, StateMachineState>(
    FlowFiber& fiber, const StateMachineState& previous_state, const Event& event, const TransitionResult& transition, ActionExecutor& actions)>;

// Wraps an executor; must delegate to the inner one exactly once.
using TransitionInterceptor = std::function<TransitionExecutor(TransitionExecutor)>;

struct ExecutorPolicy {
  // Permit Errored -> Clean transitions.
  bool allow_error_recovery = false;
};

/*
  Core executor: one transaction per transition, actions run in order,
  commit, then return the transition's continuation and new state.

  Any exception from an action rolls the transaction back and propagates.
  With recovery disabled an Errored -> Clean transition throws
  util::InvalidState before any action runs.
*/
TransitionExecutor MakeCoreExecutor(std::shared_ptr<db::Repository> repository, ExecutorPolicy policy = {});

// First interceptor is outermost.
TransitionExecutor ComposeExecutor(TransitionExecutor core, const std::vector<TransitionInterceptor>& interceptors);

} // namespace durable::statemachine
