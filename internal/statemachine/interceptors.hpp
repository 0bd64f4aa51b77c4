#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/statemachine/transition_executor.hpp"
#include "internal/statemachine/transition_history.hpp"

namespace durable::statemachine {

// Receives the full history dump of a run that just errored.
using HistorySink = std::function<void(const durable::v1::RunID& run_id, const std::string& dump)>;

// Logs the dump at warn level.
HistorySink LogHistorySink();

/*
  Records every executed transition of a run and dumps the run's whole
  history to the sink when its state moves from Clean to Errored. The
  history is discarded once the run is removed or aborted, or when the
  inner executor throws.

  Sink failures are logged and never fail the transition.
*/
TransitionInterceptor MakeDumpHistoryOnErrorInterceptor(std::shared_ptr<TransitionHistory> history, HistorySink sink = LogHistorySink());

// One debug line per executed transition.
TransitionInterceptor MakeTracingInterceptor();

} // namespace durable::statemachine
