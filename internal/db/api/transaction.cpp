#include "internal/db/api/transaction.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace durable::db {

namespace {

// The transaction outcome is already final; a failing hook must not
// surface as a commit or rollback failure.
void RunHooks(std::vector<std::function<void()>> hooks, const char* phase) {
  for (auto& hook : hooks) {
    try {
      hook();
    } catch (const std::exception& e) {
      DURABLE_LOG_WARN("transaction hook failed",
                       {durable::observability::StringField("phase", phase), durable::observability::StringField("error", e.what())});
    }
  }
}

} // namespace

void Transaction::RunCommitHooks() {
  auto hooks = std::move(commit_hooks_);
  commit_hooks_.clear();
  rollback_hooks_.clear();
  RunHooks(std::move(hooks), "commit");
}

void Transaction::RunRollbackHooks() {
  auto hooks = std::move(rollback_hooks_);
  rollback_hooks_.clear();
  commit_hooks_.clear();
  RunHooks(std::move(hooks), "rollback");
}

} // namespace durable::db
