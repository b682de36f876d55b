#include "json_message_serializer.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace outbox::messaging {

std::string JsonMessageSerializer::Serialize(const v1::Command& command) const {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(command, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize command " + command.type_url() + ": " + std::string(status.message()));
  }
  return json;
}

v1::Command JsonMessageSerializer::Deserialize(const std::string& payload) const {
  v1::Command command;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(payload, &command, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to deserialize command: " + std::string(status.message()));
  }
  return command;
}

} // namespace outbox::messaging
