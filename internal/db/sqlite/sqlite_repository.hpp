#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace outbox::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
