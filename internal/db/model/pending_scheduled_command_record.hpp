#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace outbox::db::model {

struct PendingScheduledCommandRecord {
  uint64_t id = 0;

  std::string process_manager_id;
  std::string message_id;

  std::optional<std::string> correlation_id;

  std::string command_json;

  // earliest release time, Unix ms UTC
  uint64_t scheduled_time_ms = 0;
};

}
