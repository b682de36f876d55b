#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace outbox::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and the memory runtime.

  Not durable. Pending row ids come from a counter owned by the
  repository, shared by both pending tables.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProcessManager(Transaction&, const model::ProcessManagerRecord&) override;
  Result UpdateProcessManager(Transaction&, const model::ProcessManagerRecord&, uint64_t expected_version) override;
  std::optional<model::ProcessManagerRecord> GetProcessManager(Transaction&, const std::string&) override;

  Result InsertPendingCommands(Transaction&, std::vector<model::PendingCommandRecord>&) override;
  std::vector<model::PendingCommandRecord> ListPendingCommands(Transaction&, const std::string&) override;
  Result DeletePendingCommand(Transaction&, uint64_t id) override;
  std::vector<std::string> ListProcessManagersWithPendingCommands(Transaction&, std::size_t limit) override;

  Result InsertPendingScheduledCommands(Transaction&, std::vector<model::PendingScheduledCommandRecord>&) override;
  std::vector<model::PendingScheduledCommandRecord> ListPendingScheduledCommands(Transaction&, const std::string&) override;
  Result DeletePendingScheduledCommand(Transaction&, uint64_t id) override;
  std::vector<std::string> ListProcessManagersWithPendingScheduledCommands(Transaction&, std::size_t limit) override;

  // committed rows
  struct State {
    std::unordered_map<std::string, model::ProcessManagerRecord> process_managers;

    // keyed by id so iteration is insertion order
    std::map<uint64_t, model::PendingCommandRecord>          pending_commands;
    std::map<uint64_t, model::PendingScheduledCommandRecord> pending_scheduled_commands;
  };

private:
  friend class MemoryTransaction;

  std::mutex            mutex_;
  State                 committed_;
  std::atomic<uint64_t> next_command_id_{1};
};

}
