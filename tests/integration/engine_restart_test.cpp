#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "internal/factory.hpp"
#include "internal/flows/wait_for_record_flow.hpp"

namespace {

using durable::factory::Application;
using namespace std::chrono_literals;

std::filesystem::path FreshDatabase(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "durable_flow_engine_restart_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (name + ".db");
  for (const auto* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

durable::runtime::config::RuntimeConfig SqliteConfig(const std::filesystem::path& path) {
  durable::runtime::config::RuntimeConfig config;
  auto*                                   sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path(path.string());
  sqlite->set_wal_mode(true);
  config.mutable_engine()->set_worker_threads(2);
  return config;
}

bool WaitParked(Application& app, const std::string& key) {
  for (int i = 0; i < 1000; ++i) {
    if (app.scheduler->ParkedCount(key) == 1) return true;
    std::this_thread::sleep_for(5ms);
  }
  return false;
}

std::size_t CheckpointCount(Application& app) {
  auto tx = app.repository->Begin();
  auto n  = app.checkpoints->Enumerate(*tx).size();
  tx->Commit();
  return n;
}

void Publish(Application& app, const std::string& key, const std::string& payload) {
  durable::v1::Record record;
  record.set_key(key);
  record.set_kind("invoice");
  record.set_payload(payload);

  auto tx = app.repository->Begin();
  assert(app.records->Get("records")->AddIfAbsent(*tx, key, record));
  tx->Commit();
}

void TestParkedRunResumesAfterRestart() {
  const auto config = SqliteConfig(FreshDatabase("parked"));

  durable::v1::RunID waiting;
  durable::v1::RunID failed;
  {
    auto app = durable::factory::Build(config);
    assert(app.scheduler->Start() == 0);

    waiting = app.scheduler->StartRun(durable::flows::kWaitForRecordFlow, "invoice-7");
    failed  = app.scheduler->StartRun(durable::flows::kWaitForRecordFlow, "");
    assert(WaitParked(app, "record:invoice-7"));
    assert(app.scheduler->AwaitTermination(failed, 5s).has_value());

    Publish(app, "invoice-1", "paid");
    app.scheduler->Stop();
    assert(CheckpointCount(app) == 2);
  }

  auto app = durable::factory::Build(config);

  // committed records outlive the process
  {
    auto tx     = app.repository->Begin();
    auto record = app.records->Get("records")->Get(*tx, "invoice-1");
    tx->Commit();
    assert(record.has_value());
    assert(record->payload() == "paid");
  }

  // only the clean run comes back
  assert(app.scheduler->Start() == 1);
  assert(app.scheduler->ParkedCount("record:invoice-7") == 1);

  Publish(app, "invoice-7", "paid");
  auto decision = app.scheduler->AwaitTermination(waiting, 5s);
  assert(decision.has_value());
  assert(durable::statemachine::IsRemove(*decision));

  auto tx = app.repository->Begin();
  assert(!app.checkpoints->Get(*tx, waiting).has_value());
  auto errored = app.checkpoints->Get(*tx, failed);
  assert(errored.has_value());
  assert(errored->error_state().has_errored());
  tx->Commit();

  app.scheduler->Stop();
}

void TestSchemaBootstrapIsRepeatable() {
  const auto config = SqliteConfig(FreshDatabase("bootstrap"));
  for (int i = 0; i < 3; ++i) {
    auto app = durable::factory::Build(config);
    assert(CheckpointCount(app) == 0);
  }
}

} // namespace

int main() {
  TestParkedRunResumesAfterRestart();
  TestSchemaBootstrapIsRepeatable();

  std::cout << "durable_flow_integration_engine_restart: pass\n";
  return 0;
}
