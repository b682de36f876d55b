#pragma once

#include "internal/messaging/message_serializer.hpp"

namespace outbox::messaging {

/*
  Protobuf JSON mapping of google.protobuf.Any.

  The payload carries "@type"; the packed type must be linked into the
  process (generated pool) to deserialize.
*/
class JsonMessageSerializer final : public MessageSerializer {
 public:
  std::string Serialize(const v1::Command& command) const override;
  v1::Command Deserialize(const std::string& payload) const override;
};

} // namespace outbox::messaging
