#include "internal/statemachine/interceptors.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace durable::statemachine {

namespace {

std::string FormatDump(const durable::v1::RunID& run_id, const std::vector<TransitionRecord>& records) {
  std::string dump = "Flow [" + run_id.value() + "] errored, dumping all transitions:";
  for (const auto& record : records) {
    dump += '\n';
    dump += Describe(record);
  }
  return dump;
}

} // namespace

HistorySink LogHistorySink() {
  return [](const durable::v1::RunID& run_id, const std::string& dump) {
    DURABLE_LOG_WARN(dump, {observability::RunIdField(run_id)});
  };
}

TransitionInterceptor MakeDumpHistoryOnErrorInterceptor(std::shared_ptr<TransitionHistory> history, HistorySink sink) {
  return [history = std::move(history), sink = std::move(sink)](TransitionExecutor inner) -> TransitionExecutor {
    return [history, sink, inner = std::move(inner)](FlowFiber& fiber, const StateMachineState& previous_state, const Event& event,
                                                     const TransitionResult& transition, ActionExecutor& actions) {
      std::pair<ContinuationDecision, StateMachineState> outcome;
      try {
        outcome = inner(fiber, previous_state, event, transition, actions);
      } catch (const std::exception&) {
        // the scheduler aborts a run whose transition fails
        history->Discard(fiber.run_id.value());
        throw;
      }
      const auto& [decision, next_state] = outcome;

      TransitionRecord record;
      record.run_id         = fiber.run_id;
      record.previous_state = previous_state;
      record.event          = event;
      record.transition     = transition;
      record.continuation   = decision;
      record.next_state     = next_state;
      record.recorded_at_ms = util::NowMs();

      auto records = history->Append(std::move(record));

      if (!previous_state.IsErrored() && next_state.IsErrored()) {
        try {
          sink(fiber.run_id, FormatDump(fiber.run_id, records));
        } catch (const std::exception& e) {
          DURABLE_LOG_ERROR("transition history dump failed",
                            {observability::RunIdField(fiber.run_id), observability::StringField("error", e.what())});
        }
      }

      if (IsTerminal(decision)) {
        history->Discard(fiber.run_id.value());
      }
      return outcome;
    };
  };
}

TransitionInterceptor MakeTracingInterceptor() {
  return [](TransitionExecutor inner) -> TransitionExecutor {
    return [inner = std::move(inner)](FlowFiber& fiber, const StateMachineState& previous_state, const Event& event, const TransitionResult& transition,
                                      ActionExecutor& actions) {
      auto outcome = inner(fiber, previous_state, event, transition, actions);
      DURABLE_LOG_DEBUG("transition executed", {observability::RunIdField(fiber.run_id),
                                                observability::StringField("flow_class", fiber.flow_class),
                                                observability::StringField("event", ToString(event)),
                                                observability::IntField("actions", static_cast<int64_t>(transition.actions.size())),
                                                observability::StringField("continuation", ToString(outcome.first)),
                                                observability::StringField("next", ToString(outcome.second))});
      return outcome;
    };
  };
}

} // namespace durable::statemachine
