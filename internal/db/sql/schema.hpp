#pragma once

#include <array>

namespace outbox::db::sql {

/*
  Bootstrap DDL per backend.

  Pending tables use an engine-assigned, never reused, increasing id:
  per process manager, ascending id is production order.
*/

inline constexpr std::array<const char*, 5> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS process_manager ("
    " id TEXT PRIMARY KEY, type TEXT NOT NULL, state TEXT NOT NULL, version INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS pending_command ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, process_manager_id TEXT NOT NULL, message_id TEXT NOT NULL UNIQUE,"
    " correlation_id TEXT, command_json TEXT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS pending_command_owner ON pending_command(process_manager_id, id);",

    "CREATE TABLE IF NOT EXISTS pending_scheduled_command ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, process_manager_id TEXT NOT NULL, message_id TEXT NOT NULL UNIQUE,"
    " correlation_id TEXT, command_json TEXT NOT NULL, scheduled_time_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS pending_scheduled_command_owner ON pending_scheduled_command(process_manager_id, id);",
};

inline constexpr std::array<const char*, 5> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS process_manager ("
    " id TEXT PRIMARY KEY, type TEXT NOT NULL, state TEXT NOT NULL, version BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS pending_command ("
    " id BIGINT GENERATED ALWAYS AS IDENTITY PRIMARY KEY, process_manager_id TEXT NOT NULL, message_id TEXT NOT NULL UNIQUE,"
    " correlation_id TEXT, command_json TEXT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS pending_command_owner ON pending_command(process_manager_id, id);",

    "CREATE TABLE IF NOT EXISTS pending_scheduled_command ("
    " id BIGINT GENERATED ALWAYS AS IDENTITY PRIMARY KEY, process_manager_id TEXT NOT NULL, message_id TEXT NOT NULL UNIQUE,"
    " correlation_id TEXT, command_json TEXT NOT NULL, scheduled_time_ms BIGINT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS pending_scheduled_command_owner ON pending_scheduled_command(process_manager_id, id);",
};

} // namespace outbox::db::sql
