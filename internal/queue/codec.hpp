#pragma once

#include <string>
#include <type_traits>

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace jobq::queue {

/*
  Payload codecs. A codec is any type with

    static std::string Encode(const T&);
    static T           Decode(const std::string&);

  that throws util::SerializationError on failure.
*/

// Payload passes through unchanged.
struct RawCodec {
  static std::string Encode(const std::string& value) {
    return value;
  }
  static std::string Decode(const std::string& bytes) {
    return bytes;
  }
};

// Protobuf message <-> JSON text.
template <typename Message>
struct ProtoJsonCodec {
  static_assert(std::is_base_of_v<google::protobuf::Message, Message>, "ProtoJsonCodec needs a protobuf message");

  static std::string Encode(const Message& message) {
    std::string                               json;
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
      throw util::SerializationError("encode " + message.GetTypeName() + ": " + std::string(status.message()));
    }
    return json;
  }

  static Message Decode(const std::string& bytes) {
    Message                                  message;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(bytes, &message, options);
    if (!status.ok()) {
      throw util::SerializationError("decode " + message.GetTypeName() + ": " + std::string(status.message()));
    }
    return message;
  }
};

} // namespace jobq::queue
