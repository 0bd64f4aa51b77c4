#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace durable::serialization {

/*
  Binary protobuf codec for stored values.

  Decode failures surface as util::DeserializationError; the read that hit
  them fails outright.
*/
template <typename Message>
struct ProtoCodec {
  static std::string Encode(const Message& message) {
    std::string out;
    if (!message.SerializeToString(&out)) {
      throw util::InvalidState("cannot encode " + Message::descriptor()->full_name());
    }
    return out;
  }

  static Message Decode(std::string_view bytes) {
    Message message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
      throw util::DeserializationError("cannot decode " + Message::descriptor()->full_name() + " (" + std::to_string(bytes.size()) + " bytes)");
    }
    return message;
  }
};

} // namespace durable::serialization
