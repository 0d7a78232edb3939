#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace sda::mq {

/*
  Broker bodies are JSON with the proto field names as keys.
*/
inline std::string EncodeJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::ValidationError("cannot encode " + std::string(message.GetTypeName()) + ": " + std::string(status.message()));
  }
  return json;
}

// Strict: unknown fields are an error. Throws util::ValidationError.
inline void DecodeJson(std::string_view json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), message, options);
  if (!status.ok()) {
    throw util::ValidationError(std::string(status.message()));
  }
}

template <typename M>
M DecodeJson(std::string_view json) {
  M message;
  DecodeJson(json, &message);
  return message;
}

} // namespace sda::mq
