#include "internal/statemachine/types.hpp"

#include <sstream>

#include "internal/util/overloaded.hpp"

namespace durable::statemachine {

using util::Overloaded;

std::string ToString(const Event& event) {
  return std::visit(Overloaded{
                        [](const event::Start& e) { return "Start(arguments=" + std::to_string(e.arguments.size()) + "B)"; },
                        [](const event::DoRemainingWork&) { return std::string("DoRemainingWork"); },
                        [](const event::DeliverMessage& e) {
                          return "DeliverMessage(key=" + e.key + ", payload=" + std::to_string(e.payload.size()) + "B)";
                        },
                        [](const event::Error& e) { return "Error(" + e.error_type + ": " + e.message + ")"; },
                    },
                    event);
}

std::string ToString(const Action& action) {
  return std::visit(Overloaded{
                        [](const action::PersistCheckpoint&) { return std::string("PersistCheckpoint"); },
                        [](const action::RemoveCheckpoint&) { return std::string("RemoveCheckpoint"); },
                        [](const action::PersistRecord& a) { return "PersistRecord(" + a.store + "/" + a.key + ")"; },
                        [](const action::RecordError& a) { return "RecordError(" + a.details + ")"; },
                        [](const action::ScheduleEvent& a) { return "ScheduleEvent(" + ToString(a.event) + ")"; },
                    },
                    action);
}

std::string ToString(const ContinuationDecision& decision) {
  return std::visit(Overloaded{
                        [](const continuation::Continue&) { return std::string("Continue"); },
                        [](const continuation::Suspend& d) { return "Suspend(" + d.reason + ")"; },
                        [](const continuation::Abort&) { return std::string("Abort"); },
                        [](const continuation::Remove&) { return std::string("Remove"); },
                    },
                    decision);
}

std::string ToString(const StateMachineState& state) {
  const auto& cp = state.checkpoint;

  std::ostringstream out;
  out << "{step=" << cp.step() << " suspends=" << cp.number_of_suspends();
  if (!cp.suspended_on().empty()) out << " suspended_on=" << cp.suspended_on();
  if (state.IsErrored()) {
    out << " error=Errored(" << cp.error_state().errored().errors_size() << ")";
  } else {
    out << " error=Clean";
  }
  if (state.removed) out << " removed";
  out << "}";
  return out.str();
}

} // namespace durable::statemachine
