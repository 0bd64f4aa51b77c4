#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace durable::store {

// Translates a failed repository write into the engine's exception types.
inline void ThrowIfDbError(const db::Result& result, const std::string& what) {
  if (result) return;

  std::string message = what;
  if (!result.message.empty()) message += ": " + result.message;

  switch (result.code) {
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::Conflict(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageUnavailable(message);
  }
}

} // namespace durable::store
