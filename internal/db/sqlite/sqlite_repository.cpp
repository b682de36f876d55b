#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace outbox::db::sqlite {

using outbox::db::ErrorCode;
using outbox::db::Result;

namespace {

// finalizes on scope exit
struct Statement {
    sqlite3_stmt* st = nullptr;

    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(st);
            throw std::runtime_error("sqlite prepare: " + msg);
        }
    }
    ~Statement() { sqlite3_finalize(st); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::vector<std::string> ListOwners(sqlite3* db, const char* sql, std::size_t limit) {
    Statement s(db, sql);
    BindU64(s.st, 1, limit);

    std::vector<std::string> out;
    while (sqlite3_step(s.st) == SQLITE_ROW) {
        out.push_back(ColText(s.st, 0));
    }
    return out;
}

Result DeleteById(sqlite3* db, const char* sql, uint64_t id, const char* what) {
    Statement s(db, sql);
    BindU64(s.st, 1, id);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, std::string(what) + " " + std::to_string(id));
    return Result::Ok();
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Process managers
// ------------------------------------------------------------------

Result SqliteRepository::InsertProcessManager(Transaction& t, const model::ProcessManagerRecord& r) {
    auto* db = TX(t).Handle();

    Statement s(db, "INSERT INTO process_manager(id,type,state,version) VALUES(?,?,?,?);");
    BindText(s.st, 1, r.id);
    BindText(s.st, 2, r.type);
    BindText(s.st, 3, r.state);
    BindU64(s.st, 4, r.version);

    return Translate(db, sqlite3_step(s.st));
}

Result SqliteRepository::UpdateProcessManager(Transaction& t, const model::ProcessManagerRecord& r, uint64_t expected_version) {
    auto* db = TX(t).Handle();

    Statement s(db, "UPDATE process_manager SET type=?,state=?,version=? WHERE id=? AND version=?;");
    BindText(s.st, 1, r.type);
    BindText(s.st, 2, r.state);
    BindU64(s.st, 3, r.version);
    BindText(s.st, 4, r.id);
    BindU64(s.st, 5, expected_version);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::Conflict, "process manager " + r.id + " missing or version mismatch");
    return Result::Ok();
}

std::optional<model::ProcessManagerRecord>
SqliteRepository::GetProcessManager(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement s(db, "SELECT id,type,state,version FROM process_manager WHERE id=?;");
    BindText(s.st, 1, id);

    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;

    model::ProcessManagerRecord r;
    r.id      = ColText(s.st, 0);
    r.type    = ColText(s.st, 1);
    r.state   = ColText(s.st, 2);
    r.version = ColU64(s.st, 3);
    return r;
}

// ------------------------------------------------------------------
// Pending commands
// ------------------------------------------------------------------

Result SqliteRepository::InsertPendingCommands(Transaction& t, std::vector<model::PendingCommandRecord>& records) {
    auto* db = TX(t).Handle();

    Statement s(db,
        "INSERT INTO pending_command(process_manager_id,message_id,correlation_id,command_json) VALUES(?,?,?,?);");

    for (auto& r : records) {
        sqlite3_reset(s.st);
        sqlite3_clear_bindings(s.st);
        BindText(s.st, 1, r.process_manager_id);
        BindText(s.st, 2, r.message_id);
        BindOptionalText(s.st, 3, r.correlation_id);
        BindText(s.st, 4, r.command_json);

        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
        r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }
    return Result::Ok();
}

std::vector<model::PendingCommandRecord>
SqliteRepository::ListPendingCommands(Transaction& t, const std::string& process_manager_id) {
    auto* db = TX(t).Handle();

    Statement s(db,
        "SELECT id,process_manager_id,message_id,correlation_id,command_json "
        "FROM pending_command WHERE process_manager_id=? ORDER BY id ASC;");
    BindText(s.st, 1, process_manager_id);

    std::vector<model::PendingCommandRecord> out;
    while (sqlite3_step(s.st) == SQLITE_ROW) {
        model::PendingCommandRecord r;
        r.id                 = ColU64(s.st, 0);
        r.process_manager_id = ColText(s.st, 1);
        r.message_id         = ColText(s.st, 2);
        r.correlation_id     = ColOptionalText(s.st, 3);
        r.command_json       = ColText(s.st, 4);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::DeletePendingCommand(Transaction& t, uint64_t id) {
    return DeleteById(TX(t).Handle(), "DELETE FROM pending_command WHERE id=?;", id, "pending command");
}

std::vector<std::string> SqliteRepository::ListProcessManagersWithPendingCommands(Transaction& t, std::size_t limit) {
    return ListOwners(TX(t).Handle(),
        "SELECT process_manager_id FROM pending_command "
        "GROUP BY process_manager_id ORDER BY MIN(id) LIMIT ?;",
        limit);
}

// ------------------------------------------------------------------
// Pending scheduled commands
// ------------------------------------------------------------------

Result SqliteRepository::InsertPendingScheduledCommands(Transaction& t, std::vector<model::PendingScheduledCommandRecord>& records) {
    auto* db = TX(t).Handle();

    Statement s(db,
        "INSERT INTO pending_scheduled_command(process_manager_id,message_id,correlation_id,command_json,scheduled_time_ms) "
        "VALUES(?,?,?,?,?);");

    for (auto& r : records) {
        sqlite3_reset(s.st);
        sqlite3_clear_bindings(s.st);
        BindText(s.st, 1, r.process_manager_id);
        BindText(s.st, 2, r.message_id);
        BindOptionalText(s.st, 3, r.correlation_id);
        BindText(s.st, 4, r.command_json);
        BindU64(s.st, 5, r.scheduled_time_ms);

        int rc = sqlite3_step(s.st);
        if (rc != SQLITE_DONE) return Translate(db, rc);
        r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    }
    return Result::Ok();
}

std::vector<model::PendingScheduledCommandRecord>
SqliteRepository::ListPendingScheduledCommands(Transaction& t, const std::string& process_manager_id) {
    auto* db = TX(t).Handle();

    Statement s(db,
        "SELECT id,process_manager_id,message_id,correlation_id,command_json,scheduled_time_ms "
        "FROM pending_scheduled_command WHERE process_manager_id=? ORDER BY id ASC;");
    BindText(s.st, 1, process_manager_id);

    std::vector<model::PendingScheduledCommandRecord> out;
    while (sqlite3_step(s.st) == SQLITE_ROW) {
        model::PendingScheduledCommandRecord r;
        r.id                 = ColU64(s.st, 0);
        r.process_manager_id = ColText(s.st, 1);
        r.message_id         = ColText(s.st, 2);
        r.correlation_id     = ColOptionalText(s.st, 3);
        r.command_json       = ColText(s.st, 4);
        r.scheduled_time_ms  = ColU64(s.st, 5);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::DeletePendingScheduledCommand(Transaction& t, uint64_t id) {
    return DeleteById(TX(t).Handle(), "DELETE FROM pending_scheduled_command WHERE id=?;", id, "pending scheduled command");
}

std::vector<std::string> SqliteRepository::ListProcessManagersWithPendingScheduledCommands(Transaction& t, std::size_t limit) {
    return ListOwners(TX(t).Handle(),
        "SELECT process_manager_id FROM pending_scheduled_command "
        "GROUP BY process_manager_id ORDER BY MIN(id) LIMIT ?;",
        limit);
}

} // namespace outbox::db::sqlite
