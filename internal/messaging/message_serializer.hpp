#pragma once

#include <string>

#include "api/outbox/v1.hpp"

namespace outbox::messaging {

/*
  Converts commands to the text stored in pending rows and back.
  Deserialize(Serialize(c)) must reproduce c.
*/
class MessageSerializer {
 public:
  virtual ~MessageSerializer() = default;

  virtual std::string Serialize(const v1::Command& command) const = 0;
  virtual v1::Command Deserialize(const std::string& payload) const = 0;
};

} // namespace outbox::messaging
