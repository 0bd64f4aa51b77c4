#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/statemachine/types.hpp"

namespace durable::engine {

/*
  flow class name -> transition function.

  Registration happens before the scheduler starts; lookups are
  thread-safe.
*/
class FlowRegistry {
 public:
  // Throws util::InvalidState if the class is already registered.
  void Register(const std::string& flow_class, statemachine::TransitionFunction transition);

  std::optional<statemachine::TransitionFunction> Find(const std::string& flow_class) const;

  bool Contains(const std::string& flow_class) const;

  std::vector<std::string> FlowClasses() const;

 private:
  mutable std::mutex                                                mutex_;
  std::unordered_map<std::string, statemachine::TransitionFunction> flows_;
};

} // namespace durable::engine
