#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/flows/wait_for_record_flow.hpp"
#include "internal/observability/logging.hpp"
#include "internal/statemachine/interceptors.hpp"
#include "internal/statemachine/transition_executor.hpp"
#include "internal/util/error_codes.hpp"
#include "internal/util/errors.hpp"
#if DURABLE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace durable::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const durable::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if DURABLE_DB_SQLITE
    const auto& sqlite = database.sqlite();

    std::shared_ptr<db::sqlite::SqliteDB> sqlite_db;
    try {
      sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    } catch (const util::StorageUnavailable& e) {
      DURABLE_LOG_ERROR("cannot open database", {StringField("code", util::ErrorCode(util::DatabaseErrors::kCouldNotConnect)),
                                                 StringField("path", sqlite.path()), StringField("error", e.what())});
      throw;
    }

    try {
      auto applied = db::sqlite::BootstrapSchema(sqlite_db);
      DURABLE_LOG_INFO("sqlite database ready", {StringField("path", sqlite.path()), IntField("migrations_applied", applied)});
    } catch (const std::exception& e) {
      DURABLE_LOG_ERROR("database schema bootstrap failed", {StringField("code", util::ErrorCode(util::DatabaseErrors::kFailedStartup)),
                                                             StringField("path", sqlite.path()), StringField("error", e.what())});
      throw util::StorageUnavailable(util::ErrorCode(util::DatabaseErrors::kFailedStartup) + ": " + e.what());
    }

    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::vector<statemachine::TransitionInterceptor> BuildInterceptors(const durable::runtime::config::RuntimeConfig& config,
                                                                   std::shared_ptr<statemachine::TransitionHistory> history) {
  std::vector<statemachine::TransitionInterceptor> interceptors;

  // history records what tracing saw, so tracing is outermost
  if (config.engine().trace_transitions()) {
    interceptors.push_back(statemachine::MakeTracingInterceptor());
  }
  if (!config.engine().has_dump_history_on_error() || config.engine().dump_history_on_error()) {
    interceptors.push_back(statemachine::MakeDumpHistoryOnErrorInterceptor(std::move(history)));
  }
  return interceptors;
}

/*
    Build full application dependency graph
*/
Application Build(const durable::runtime::config::RuntimeConfig& config, std::shared_ptr<engine::FlowRegistry> registry) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository  = BuildRepository(config);
  app.checkpoints = std::make_shared<store::CheckpointStore>(app.repository);
  app.records     = std::make_shared<store::RecordStores>(app.repository);

  // ------------------------------------------------------------------
  // Flows
  // ------------------------------------------------------------------
  if (!registry) {
    registry = std::make_shared<engine::FlowRegistry>();
    flows::RegisterBuiltinFlows(*registry);
  }
  app.registry = std::move(registry);

  // ------------------------------------------------------------------
  // Executor chain
  // ------------------------------------------------------------------
  app.history = std::make_shared<statemachine::TransitionHistory>();

  statemachine::ExecutorPolicy policy;
  policy.allow_error_recovery = config.engine().allow_error_recovery();

  auto executor = statemachine::ComposeExecutor(statemachine::MakeCoreExecutor(app.repository, policy), BuildInterceptors(config, app.history));

  // ------------------------------------------------------------------
  // Scheduler
  // ------------------------------------------------------------------
  engine::FlowScheduler::Options options;
  if (config.engine().worker_threads() > 0) options.worker_threads = config.engine().worker_threads();
  if (!config.engine().record_store().empty()) options.record_store = config.engine().record_store();
  options.history = app.history;

  app.scheduler = std::make_shared<engine::FlowScheduler>(app.repository, app.checkpoints, app.records, app.registry, std::move(executor), options);

  return app;
}

} // namespace durable::factory
