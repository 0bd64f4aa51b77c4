#include "error_codes.hpp"

#include "internal/util/errors.hpp"

namespace durable::util {

namespace {

std::string Join(ErrorNamespace ns, std::string_view code) {
  std::string out(ToString(ns));
  out += '-';
  out += code;
  return out;
}

} // namespace

std::string_view ToString(ErrorNamespace ns) {
  switch (ns) {
    case ErrorNamespace::kDatabase:
      return "database";
    case ErrorNamespace::kFlow:
      return "flow";
    case ErrorNamespace::kInternal:
      return "internal";
  }
  return "internal";
}

std::string ErrorCode(DatabaseErrors error) {
  switch (error) {
    case DatabaseErrors::kCouldNotConnect:
      return Join(ErrorNamespace::kDatabase, "could-not-connect");
    case DatabaseErrors::kFailedStartup:
      return Join(ErrorNamespace::kDatabase, "failed-startup");
    case DatabaseErrors::kCorruptRecord:
      return Join(ErrorNamespace::kDatabase, "corrupt-record");
    case DatabaseErrors::kConflict:
      return Join(ErrorNamespace::kDatabase, "conflict");
  }
  return Join(ErrorNamespace::kInternal, "unknown");
}

std::string ErrorCode(FlowErrors error) {
  switch (error) {
    case FlowErrors::kUnknownFlowClass:
      return Join(ErrorNamespace::kFlow, "unknown-flow-class");
    case FlowErrors::kRecoveryForbidden:
      return Join(ErrorNamespace::kFlow, "recovery-forbidden");
    case FlowErrors::kTransitionFailed:
      return Join(ErrorNamespace::kFlow, "transition-failed");
  }
  return Join(ErrorNamespace::kInternal, "unknown");
}

std::string ErrorCodeOf(const std::exception& error) {
  if (dynamic_cast<const StorageUnavailable*>(&error)) {
    return ErrorCode(DatabaseErrors::kCouldNotConnect);
  }
  if (dynamic_cast<const DeserializationError*>(&error)) {
    return ErrorCode(DatabaseErrors::kCorruptRecord);
  }
  if (dynamic_cast<const Conflict*>(&error)) {
    return ErrorCode(DatabaseErrors::kConflict);
  }
  if (dynamic_cast<const InvalidState*>(&error)) {
    return ErrorCode(FlowErrors::kTransitionFailed);
  }
  return Join(ErrorNamespace::kInternal, "error");
}

} // namespace durable::util
