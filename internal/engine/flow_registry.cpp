#include "flow_registry.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace durable::engine {

void FlowRegistry::Register(const std::string& flow_class, statemachine::TransitionFunction transition) {
  if (flow_class.empty() || !transition) {
    throw util::InvalidState("flow registration requires a class name and a transition function");
  }

  std::lock_guard lock(mutex_);
  if (!flows_.emplace(flow_class, std::move(transition)).second) {
    throw util::InvalidState("flow class already registered: " + flow_class);
  }
}

std::optional<statemachine::TransitionFunction> FlowRegistry::Find(const std::string& flow_class) const {
  std::lock_guard lock(mutex_);
  auto            it = flows_.find(flow_class);
  if (it == flows_.end()) return std::nullopt;
  return it->second;
}

bool FlowRegistry::Contains(const std::string& flow_class) const {
  std::lock_guard lock(mutex_);
  return flows_.contains(flow_class);
}

std::vector<std::string> FlowRegistry::FlowClasses() const {
  std::vector<std::string> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(flows_.size());
    for (const auto& [name, _] : flows_) out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace durable::engine
