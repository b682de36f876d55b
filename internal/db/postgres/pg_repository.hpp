#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace outbox::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
