#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/engine/flow_registry.hpp"
#include "internal/engine/flow_scheduler.hpp"
#include "internal/statemachine/transition_history.hpp"
#include "internal/store/checkpoint_store.hpp"
#include "internal/store/record_stores.hpp"

namespace durable::factory {

/*
  Application

  Owns all long-lived components of the engine. Members are destroyed in
  reverse order, so the scheduler stops before the stores go away.
*/
struct Application {
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<store::CheckpointStore>          checkpoints;
  std::shared_ptr<store::RecordStores>             records;
  std::shared_ptr<statemachine::TransitionHistory> history;
  std::shared_ptr<engine::FlowRegistry>            registry;
  std::shared_ptr<engine::FlowScheduler>           scheduler;
};

/*
  Composition root: the only place that knows concrete DB types.

  The scheduler is built but not started, so callers can register flows
  first. A null registry gets a fresh one with the built-in flows.
*/
Application Build(const durable::runtime::config::RuntimeConfig& config, std::shared_ptr<engine::FlowRegistry> registry = nullptr);

std::shared_ptr<db::Repository> BuildRepository(const durable::runtime::config::RuntimeConfig& config);

// Interceptor chain selected by engine config, outermost first.
std::vector<statemachine::TransitionInterceptor> BuildInterceptors(const durable::runtime::config::RuntimeConfig& config,
                                                                   std::shared_ptr<statemachine::TransitionHistory> history);

} // namespace durable::factory
