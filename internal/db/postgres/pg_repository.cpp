#include "pg_repository.hpp"

namespace outbox::db::postgres {

namespace {

std::optional<std::string> OptionalText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::vector<std::string> Owners(const pqxx::result& res) {
  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Process managers
// ------------------------------------------------------------------

Result PgRepository::InsertProcessManager(Transaction& t, const model::ProcessManagerRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_process_manager", r.id, r.type, r.state, r.version);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateProcessManager(Transaction& t, const model::ProcessManagerRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_process_manager", r.id, r.type, r.state, r.version, expected_version);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::Conflict, "process manager " + r.id + " missing or version mismatch");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProcessManagerRecord> PgRepository::GetProcessManager(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_process_manager", id);
  if (res.empty()) return std::nullopt;

  model::ProcessManagerRecord r;
  r.id      = res[0][0].c_str();
  r.type    = res[0][1].c_str();
  r.state   = res[0][2].c_str();
  r.version = res[0][3].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Pending commands
// ------------------------------------------------------------------

Result PgRepository::InsertPendingCommands(Transaction& t, std::vector<model::PendingCommandRecord>& records) {
  try {
    for (auto& r : records) {
      auto res = TX(t).Work().exec_prepared("insert_pending_command", r.process_manager_id, r.message_id, r.correlation_id, r.command_json);
      r.id     = res[0][0].as<uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PendingCommandRecord> PgRepository::ListPendingCommands(Transaction& t, const std::string& process_manager_id) {
  auto res = TX(t).Work().exec_prepared("list_pending_commands", process_manager_id);

  std::vector<model::PendingCommandRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PendingCommandRecord r;
    r.id                 = row[0].as<uint64_t>();
    r.process_manager_id = row[1].c_str();
    r.message_id         = row[2].c_str();
    r.correlation_id     = OptionalText(row[3]);
    r.command_json       = row[4].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeletePendingCommand(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_pending_command", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "pending command " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListProcessManagersWithPendingCommands(Transaction& t, std::size_t limit) {
  return Owners(TX(t).Work().exec_prepared("owners_with_pending_commands", static_cast<uint64_t>(limit)));
}

// ------------------------------------------------------------------
// Pending scheduled commands
// ------------------------------------------------------------------

Result PgRepository::InsertPendingScheduledCommands(Transaction& t, std::vector<model::PendingScheduledCommandRecord>& records) {
  try {
    for (auto& r : records) {
      auto res = TX(t).Work().exec_prepared("insert_pending_scheduled_command", r.process_manager_id, r.message_id, r.correlation_id,
                                            r.command_json, r.scheduled_time_ms);
      r.id     = res[0][0].as<uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PendingScheduledCommandRecord> PgRepository::ListPendingScheduledCommands(Transaction& t,
                                                                                             const std::string& process_manager_id) {
  auto res = TX(t).Work().exec_prepared("list_pending_scheduled_commands", process_manager_id);

  std::vector<model::PendingScheduledCommandRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PendingScheduledCommandRecord r;
    r.id                 = row[0].as<uint64_t>();
    r.process_manager_id = row[1].c_str();
    r.message_id         = row[2].c_str();
    r.correlation_id     = OptionalText(row[3]);
    r.command_json       = row[4].c_str();
    r.scheduled_time_ms  = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeletePendingScheduledCommand(Transaction& t, uint64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_pending_scheduled_command", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "pending scheduled command " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListProcessManagersWithPendingScheduledCommands(Transaction& t, std::size_t limit) {
  return Owners(TX(t).Work().exec_prepared("owners_with_pending_scheduled_commands", static_cast<uint64_t>(limit)));
}

} // namespace outbox::db::postgres
