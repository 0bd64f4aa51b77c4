#pragma once

#include <exception>
#include <string>
#include <string_view>

namespace durable::util {

/*
  Namespaced error codes attached to log lines.

  Rendered as "<namespace>-<code>", e.g. "database-could-not-connect".
*/

enum class ErrorNamespace {
  kDatabase,
  kFlow,
  kInternal,
};

enum class DatabaseErrors {
  kCouldNotConnect,
  kFailedStartup,
  kCorruptRecord,
  kConflict,
};

enum class FlowErrors {
  kUnknownFlowClass,
  kRecoveryForbidden,
  kTransitionFailed,
};

std::string ErrorCode(DatabaseErrors error);
std::string ErrorCode(FlowErrors error);

// Best-effort classification of an exception raised by the engine.
std::string ErrorCodeOf(const std::exception& error);

std::string_view ToString(ErrorNamespace ns);

} // namespace durable::util
