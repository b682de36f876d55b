#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <google/protobuf/message.h>

#include "api/outbox/v1.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace outbox::processes {

struct ScheduledCommand {
  v1::Command     command;
  util::TimePoint scheduled_time;
};

/*
  Base class for process managers (sagas).

  A transition records the commands it decides to send with
  AddCommand/AddScheduledCommand. ProcessManagerStore drains them with
  the Flush* calls when it persists the transition; each drain returns
  everything accumulated since the previous one and clears it.

  Version() is the optimistic concurrency token of the persisted row,
  0 until the first successful save.
*/
class ProcessManager {
 public:
  virtual ~ProcessManager() = default;

  const util::UUID& Id() const {
    return id_;
  }

  uint64_t Version() const {
    return version_;
  }

  // Stable name of the concrete type, stored with the state row.
  virtual std::string TypeName() const = 0;

  virtual std::string SerializeState() const = 0;

  std::vector<v1::Command>      FlushPendingCommands();
  std::vector<ScheduledCommand> FlushPendingScheduledCommands();

 protected:
  explicit ProcessManager(const util::UUID& id, uint64_t version = 0);

  void AddCommand(const google::protobuf::Message& command);
  void AddScheduledCommand(const google::protobuf::Message& command, util::TimePoint scheduled_time);

 private:
  friend class ProcessManagerStore;

  void SetVersion(uint64_t version) {
    version_ = version;
  }

  util::UUID                    id_;
  uint64_t                      version_ = 0;
  std::vector<v1::Command>      pending_commands_;
  std::vector<ScheduledCommand> pending_scheduled_commands_;
};

} // namespace outbox::processes
