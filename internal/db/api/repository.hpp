#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/pending_command_record.hpp"
#include "internal/db/model/pending_scheduled_command_record.hpp"
#include "internal/db/model/process_manager_record.hpp"

namespace outbox::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Pending rows get their id from a monotonically increasing
    sequence owned by the backend; per process manager, ascending
    id is production order
  - Pending rows are write-once, delete-once
  - Deleting a pending row that is already gone returns NotFound
    and leaves the store untouched

  The DB is the source of truth for:
    process manager state
    pending commands (immediate and scheduled)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Process manager state
  // ---------------------------------------------------------------------

  virtual Result InsertProcessManager(Transaction&, const model::ProcessManagerRecord&) = 0;

  // Conflict unless the stored version equals expected_version.
  virtual Result UpdateProcessManager(Transaction&, const model::ProcessManagerRecord&, uint64_t expected_version) = 0;

  virtual std::optional<model::ProcessManagerRecord> GetProcessManager(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Pending commands
  // ---------------------------------------------------------------------

  // Assigns record.id for every inserted row.
  virtual Result InsertPendingCommands(Transaction&, std::vector<model::PendingCommandRecord>& records) = 0;

  // Ordered by id ascending.
  virtual std::vector<model::PendingCommandRecord> ListPendingCommands(Transaction&, const std::string& process_manager_id) = 0;

  virtual Result DeletePendingCommand(Transaction&, uint64_t id) = 0;

  // Distinct owners with at least one pending command, at most limit.
  virtual std::vector<std::string> ListProcessManagersWithPendingCommands(Transaction&, std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Pending scheduled commands
  // ---------------------------------------------------------------------

  virtual Result InsertPendingScheduledCommands(Transaction&, std::vector<model::PendingScheduledCommandRecord>& records) = 0;

  virtual std::vector<model::PendingScheduledCommandRecord> ListPendingScheduledCommands(Transaction&,
                                                                                         const std::string& process_manager_id) = 0;

  virtual Result DeletePendingScheduledCommand(Transaction&, uint64_t id) = 0;

  virtual std::vector<std::string> ListProcessManagersWithPendingScheduledCommands(Transaction&, std::size_t limit) = 0;
};

} // namespace outbox::db
