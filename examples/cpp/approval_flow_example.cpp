#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "internal/config/config_loader.hpp"
#include "internal/engine/flow_registry.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/overloaded.hpp"

using namespace durable::statemachine;

namespace {

// Start: record the request, checkpoint, wait for "approval:<run id>".
// DeliverMessage: record the decision and finish.
TransitionResult ApprovalTransition(const StateMachineState& state, const Event& event) {
  StateMachineState next = state;
  next.checkpoint.set_step(state.checkpoint.step() + 1);

  TransitionResult result;
  std::visit(durable::util::Overloaded{
                 [&](const event::Start& start) {
                   const auto key = "approval:" + state.checkpoint.id().value();
                   next.checkpoint.set_frozen_state(start.arguments);
                   next.checkpoint.set_suspended_on(key);
                   next.checkpoint.set_number_of_suspends(state.checkpoint.number_of_suspends() + 1);

                   durable::v1::Record request;
                   request.set_key("request/" + state.checkpoint.id().value());
                   request.set_kind("approval-request");
                   request.set_payload(start.arguments);

                   result.actions      = {action::PersistRecord{"records", request.key(), request}, action::PersistCheckpoint{}};
                   result.continuation = continuation::Suspend{key};
                 },
                 [&](const event::DeliverMessage& message) {
                   durable::v1::Record decision;
                   decision.set_key("decision/" + state.checkpoint.id().value());
                   decision.set_kind("approval-decision");
                   decision.set_payload(message.payload);

                   next.checkpoint.clear_suspended_on();
                   next.removed        = true;
                   result.actions      = {action::PersistRecord{"records", decision.key(), decision}, action::RemoveCheckpoint{}};
                   result.continuation = continuation::Remove{};
                 },
                 [&](const event::DoRemainingWork&) { result.continuation = continuation::Suspend{state.checkpoint.suspended_on()}; },
                 [&](const event::Error& error) {
                   result.actions      = {action::RecordError{error.message}};
                   result.continuation = continuation::Abort{};
                 },
             },
             event);

  result.new_state = std::move(next);
  return result;
}

} // namespace

int main() {
  auto config = durable::config::ConfigLoader::LoadFromYamlString(R"(
logging:
  level: debug
database:
  memory: {}
engine:
  worker_threads: 2
  trace_transitions: true
)");
  durable::observability::InitializeLogging(config);

  auto registry = std::make_shared<durable::engine::FlowRegistry>();
  registry->Register("example.Approval", ApprovalTransition);

  auto app = durable::factory::Build(config, registry);
  app.scheduler->Start();

  auto run_id = app.scheduler->StartRun("example.Approval", "purchase order #42");

  // Wait until the run has parked, then approve it.
  const auto key = "approval:" + run_id.value();
  for (int i = 0; i < 100 && app.scheduler->ParkedCount(key) == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  app.scheduler->Deliver(key, "approved");

  auto outcome = app.scheduler->AwaitTermination(run_id, std::chrono::seconds(5));
  if (!outcome) {
    std::cerr << "run " << run_id.value() << " did not finish" << '\n';
    return 1;
  }

  auto tx       = app.repository->Begin();
  auto decision = app.records->Get("records")->Get(*tx, "decision/" + run_id.value());
  tx->Commit();

  std::cout << "run " << run_id.value() << " finished with " << ToString(*outcome) << ", decision=" << (decision ? decision->payload() : "<none>")
            << '\n';

  app.scheduler->Stop();
  durable::observability::ShutdownLogging();
  return 0;
}
