#include "internal/statemachine/action_executor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/store/checkpoint_store.hpp"
#include "internal/store/record_stores.hpp"
#include "internal/util/overloaded.hpp"
#include "internal/util/time.hpp"

namespace durable::statemachine {

using util::Overloaded;

StoreActionExecutor::StoreActionExecutor(std::shared_ptr<store::CheckpointStore> checkpoints, std::shared_ptr<store::RecordStores> records,
                                         EventScheduler scheduler)
    : checkpoints_(std::move(checkpoints)), records_(std::move(records)), scheduler_(std::move(scheduler)) {
}

void StoreActionExecutor::Execute(db::Transaction& tx, const FlowFiber& fiber, const StateMachineState& new_state, const Action& action) {
  std::visit(Overloaded{
                 [&](const action::PersistCheckpoint&) {
                   auto checkpoint = new_state.checkpoint;
                   *checkpoint.mutable_id() = fiber.run_id;
                   if (checkpoint.flow_class().empty()) checkpoint.set_flow_class(fiber.flow_class);
                   *checkpoint.mutable_updated_at() = util::ToProto(util::Now());
                   checkpoints_->Add(tx, fiber.run_id, checkpoint);
                 },
                 [&](const action::RemoveCheckpoint&) { checkpoints_->Remove(tx, fiber.run_id); },
                 [&](const action::PersistRecord& a) {
                   bool created = records_->Get(a.store)->AddIfAbsent(tx, a.key, a.record);
                   if (!created) {
                     DURABLE_LOG_DEBUG("record already present",
                                       {observability::RunIdField(fiber.run_id), observability::StringField("store", a.store),
                                        observability::StringField("key", a.key)});
                   }
                 },
                 [&](const action::RecordError& a) {
                   DURABLE_LOG_WARN("flow reported error", {observability::RunIdField(fiber.run_id),
                                                             observability::StringField("flow_class", fiber.flow_class),
                                                             observability::StringField("details", a.details)});
                 },
                 [&](const action::ScheduleEvent& a) {
                   if (!scheduler_) return;
                   tx.OnCommit([scheduler = scheduler_, run_id = fiber.run_id, event = a.event] { scheduler(run_id, event); });
                 },
             },
             action);
}

} // namespace durable::statemachine
