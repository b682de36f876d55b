#include "process_manager.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace outbox::processes {

ProcessManager::ProcessManager(const util::UUID& id, uint64_t version) : id_(id), version_(version) {
  if (util::IsNil(id_)) {
    throw util::InvalidArgument("process manager id cannot be empty");
  }
}

std::vector<v1::Command> ProcessManager::FlushPendingCommands() {
  return std::exchange(pending_commands_, {});
}

std::vector<ScheduledCommand> ProcessManager::FlushPendingScheduledCommands() {
  return std::exchange(pending_scheduled_commands_, {});
}

void ProcessManager::AddCommand(const google::protobuf::Message& command) {
  v1::Command packed;
  packed.PackFrom(command);
  pending_commands_.push_back(std::move(packed));
}

void ProcessManager::AddScheduledCommand(const google::protobuf::Message& command, util::TimePoint scheduled_time) {
  ScheduledCommand scheduled;
  scheduled.command.PackFrom(command);
  scheduled.scheduled_time = scheduled_time;
  pending_scheduled_commands_.push_back(std::move(scheduled));
}

} // namespace outbox::processes
