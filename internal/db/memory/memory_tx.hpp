#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace outbox::db::memory {

/*
  Transaction = write overlay + journal

  Reads see committed rows merged with this transaction's own writes.
  Every write also appends a replay step; Commit() applies the journal
  in place under the repository mutex, so transactions touching
  different rows never conflict. A replay step that finds its
  precondition broken throws util::ConcurrencyConflict and the steps
  already applied are undone.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using UndoStep   = std::function<void(MemoryRepository::State&)>;
  using ReplayStep = std::function<UndoStep(MemoryRepository::State&)>;

  struct Overlay {
    std::unordered_map<std::string, model::ProcessManagerRecord> process_managers;

    std::map<uint64_t, model::PendingCommandRecord> inserted_commands;
    std::set<uint64_t>                              deleted_commands;

    std::map<uint64_t, model::PendingScheduledCommandRecord> inserted_scheduled_commands;
    std::set<uint64_t>                                       deleted_scheduled_commands;
  };

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  Overlay& Writes() {
    return overlay_;
  }

  void Record(ReplayStep step);

  uint64_t NextCommandId() {
    return repo_.next_command_id_.fetch_add(1);
  }

 private:
  MemoryRepository&       repo_;
  Overlay                 overlay_;
  std::vector<ReplayStep> journal_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace outbox::db::memory
