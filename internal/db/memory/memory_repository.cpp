#include "memory_repository.hpp"

#include <map>
#include <set>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace outbox::db::memory {

namespace {

/*
  Walks committed rows merged with rows inserted by the transaction, in
  id order, skipping rows the transaction deleted. visit returns false
  to stop.
*/
template <typename Row, typename Visit>
void ForEachVisible(const std::map<uint64_t, Row>& committed,
                    const std::map<uint64_t, Row>& inserted,
                    const std::set<uint64_t>&      deleted,
                    Visit                          visit) {
  auto c = committed.begin();
  auto i = inserted.begin();
  while (c != committed.end() || i != inserted.end()) {
    const bool take_committed = i == inserted.end() || (c != committed.end() && c->first < i->first);
    const auto& [id, row]     = take_committed ? *c++ : *i++;
    if (deleted.contains(id)) continue;
    if (!visit(row)) return;
  }
}

template <typename Row>
std::vector<Row> RowsOwnedBy(const std::map<uint64_t, Row>& committed,
                             const std::map<uint64_t, Row>& inserted,
                             const std::set<uint64_t>&      deleted,
                             const std::string&             process_manager_id) {
  std::vector<Row> out;
  ForEachVisible(committed, inserted, deleted, [&](const Row& row) {
    if (row.process_manager_id == process_manager_id) out.push_back(row);
    return true;
  });
  return out;
}

template <typename Row>
std::vector<std::string> DistinctOwners(const std::map<uint64_t, Row>& committed,
                                        const std::map<uint64_t, Row>& inserted,
                                        const std::set<uint64_t>&      deleted,
                                        std::size_t                    limit) {
  std::vector<std::string>        out;
  std::unordered_set<std::string> seen;
  ForEachVisible(committed, inserted, deleted, [&](const Row& row) {
    if (out.size() >= limit) return false;
    if (seen.insert(row.process_manager_id).second) out.push_back(row.process_manager_id);
    return true;
  });
  return out;
}

/*
  Shared delete path for both pending tables. Deleting a row this
  transaction inserted drops it from the overlay; the replayed insert
  and delete then cancel out at commit.
*/
template <typename Row>
Result DeleteRow(std::map<uint64_t, Row>&  committed_rows,
                 std::map<uint64_t, Row>&  inserted,
                 std::set<uint64_t>&       deleted,
                 uint64_t                  id,
                 const std::string&        what,
                 MemoryTransaction&        tx,
                 std::map<uint64_t, Row> MemoryRepository::State::*table) {
  if (inserted.erase(id) == 0) {
    if (deleted.contains(id) || !committed_rows.contains(id)) {
      return Result::Err(ErrorCode::NotFound, what + " " + std::to_string(id));
    }
    deleted.insert(id);
  }

  // already gone at commit time means a concurrent delete won; nothing to do
  tx.Record([id, table](MemoryRepository::State& state) -> MemoryTransaction::UndoStep {
    auto& rows = state.*table;
    auto  node = rows.extract(id);
    if (node.empty()) return [](MemoryRepository::State&) {};
    return [table, row = std::move(node.mapped()), id](MemoryRepository::State& s) { (s.*table)[id] = row; };
  });
  return Result::Ok();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Process managers
// ------------------------------------------------------------------

Result MemoryRepository::InsertProcessManager(Transaction& t, const model::ProcessManagerRecord& r) {
  auto& writes = TX(t).Writes();
  {
    std::scoped_lock lock(mutex_);
    if (writes.process_managers.contains(r.id) || committed_.process_managers.contains(r.id)) {
      return Result::Err(ErrorCode::AlreadyExists, "process manager " + r.id);
    }
  }
  writes.process_managers[r.id] = r;

  TX(t).Record([r](State& state) -> MemoryTransaction::UndoStep {
    if (state.process_managers.contains(r.id)) {
      throw util::ConcurrencyConflict("process manager " + r.id + " was inserted concurrently");
    }
    state.process_managers[r.id] = r;
    return [id = r.id](State& s) { s.process_managers.erase(id); };
  });
  return Result::Ok();
}

Result MemoryRepository::UpdateProcessManager(Transaction& t, const model::ProcessManagerRecord& r, uint64_t expected_version) {
  auto& writes  = TX(t).Writes();
  auto  current = GetProcessManager(t, r.id);
  if (!current) return Result::Err(ErrorCode::Conflict, "process manager " + r.id + " does not exist");
  if (current->version != expected_version) return Result::Err(ErrorCode::Conflict, "process manager " + r.id + " version mismatch");
  writes.process_managers[r.id] = r;

  TX(t).Record([r, expected_version](State& state) -> MemoryTransaction::UndoStep {
    auto it = state.process_managers.find(r.id);
    if (it == state.process_managers.end() || it->second.version != expected_version) {
      throw util::ConcurrencyConflict("process manager " + r.id + " was modified concurrently");
    }
    auto previous = std::exchange(it->second, r);
    return [previous = std::move(previous)](State& s) { s.process_managers[previous.id] = previous; };
  });
  return Result::Ok();
}

std::optional<model::ProcessManagerRecord> MemoryRepository::GetProcessManager(Transaction& t, const std::string& id) {
  const auto& writes = TX(t).Writes();
  if (auto own = writes.process_managers.find(id); own != writes.process_managers.end()) return own->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.process_managers.find(id);
  if (it == committed_.process_managers.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Pending commands
// ------------------------------------------------------------------

Result MemoryRepository::InsertPendingCommands(Transaction& t, std::vector<model::PendingCommandRecord>& records) {
  auto& writes = TX(t).Writes();
  for (auto& r : records) {
    r.id = TX(t).NextCommandId();
    writes.inserted_commands[r.id] = r;
    TX(t).Record([r](State& state) -> MemoryTransaction::UndoStep {
      state.pending_commands[r.id] = r;
      return [id = r.id](State& s) { s.pending_commands.erase(id); };
    });
  }
  return Result::Ok();
}

std::vector<model::PendingCommandRecord> MemoryRepository::ListPendingCommands(Transaction& t, const std::string& process_manager_id) {
  const auto&      writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return RowsOwnedBy(committed_.pending_commands, writes.inserted_commands, writes.deleted_commands, process_manager_id);
}

Result MemoryRepository::DeletePendingCommand(Transaction& t, uint64_t id) {
  auto&            writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return DeleteRow(committed_.pending_commands, writes.inserted_commands, writes.deleted_commands, id, "pending command", TX(t),
                   &State::pending_commands);
}

std::vector<std::string> MemoryRepository::ListProcessManagersWithPendingCommands(Transaction& t, std::size_t limit) {
  const auto&      writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return DistinctOwners(committed_.pending_commands, writes.inserted_commands, writes.deleted_commands, limit);
}

// ------------------------------------------------------------------
// Pending scheduled commands
// ------------------------------------------------------------------

Result MemoryRepository::InsertPendingScheduledCommands(Transaction& t, std::vector<model::PendingScheduledCommandRecord>& records) {
  auto& writes = TX(t).Writes();
  for (auto& r : records) {
    r.id = TX(t).NextCommandId();
    writes.inserted_scheduled_commands[r.id] = r;
    TX(t).Record([r](State& state) -> MemoryTransaction::UndoStep {
      state.pending_scheduled_commands[r.id] = r;
      return [id = r.id](State& s) { s.pending_scheduled_commands.erase(id); };
    });
  }
  return Result::Ok();
}

std::vector<model::PendingScheduledCommandRecord> MemoryRepository::ListPendingScheduledCommands(Transaction& t,
                                                                                                 const std::string& process_manager_id) {
  const auto&      writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return RowsOwnedBy(committed_.pending_scheduled_commands, writes.inserted_scheduled_commands, writes.deleted_scheduled_commands,
                     process_manager_id);
}

Result MemoryRepository::DeletePendingScheduledCommand(Transaction& t, uint64_t id) {
  auto&            writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return DeleteRow(committed_.pending_scheduled_commands, writes.inserted_scheduled_commands, writes.deleted_scheduled_commands, id,
                   "pending scheduled command", TX(t), &State::pending_scheduled_commands);
}

std::vector<std::string> MemoryRepository::ListProcessManagersWithPendingScheduledCommands(Transaction& t, std::size_t limit) {
  const auto&      writes = TX(t).Writes();
  std::scoped_lock lock(mutex_);
  return DistinctOwners(committed_.pending_scheduled_commands, writes.inserted_scheduled_commands, writes.deleted_scheduled_commands,
                        limit);
}

} // namespace outbox::db::memory
