#include "internal/statemachine/transition_executor.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/util/error_codes.hpp"
#include "internal/util/errors.hpp"

namespace durable::statemachine {

TransitionExecutor MakeCoreExecutor(std::shared_ptr<db::Repository> repository, ExecutorPolicy policy) {
  return [repository = std::move(repository), policy](FlowFiber& fiber, const StateMachineState& previous_state, const Event&,
                                                      const TransitionResult& transition, ActionExecutor& actions) {
    if (!policy.allow_error_recovery && previous_state.IsErrored() && !transition.new_state.IsErrored()) {
      throw util::InvalidState(util::ErrorCode(util::FlowErrors::kRecoveryForbidden) + ": run " + fiber.run_id.value() +
                               " cannot leave the errored state");
    }

    // rolls back on unwind
    auto tx = repository->Begin();
    for (const auto& action : transition.actions) {
      actions.Execute(*tx, fiber, transition.new_state, action);
    }
    tx->Commit();

    return std::make_pair(transition.continuation, transition.new_state);
  };
}

TransitionExecutor ComposeExecutor(TransitionExecutor core, const std::vector<TransitionInterceptor>& interceptors) {
  auto executor = std::move(core);
  for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it) {
    executor = (*it)(std::move(executor));
  }
  return executor;
}

} // namespace durable::statemachine
