#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "durable/v1/id.pb.h"

namespace durable::util {

/*
  UUID helpers

  RunID carries the canonical text form of a random RFC4122 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// protobuf helpers
durable::v1::RunID ToProto(const UUID& id);

durable::v1::RunID NewRunID();

} // namespace durable::util
