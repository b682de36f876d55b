#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace outbox::db::model {

/*
  A command produced by a process manager and not yet handed to the
  message bus.
*/

struct PendingCommandRecord {
  uint64_t id = 0; // assigned on insert

  std::string process_manager_id;
  std::string message_id;

  std::optional<std::string> correlation_id;

  // serialized by messaging::MessageSerializer
  std::string command_json;
};

}
