#include "process_manager_store.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace outbox::processes {

namespace {

void ThrowIfDbError(const db::Result& result, std::string_view operation, const std::string& id) {
  switch (result.code) {
    case db::ErrorCode::OK:
      return;
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
      throw util::ConcurrencyConflict("process manager " + id + " was modified concurrently: " + result.message);
    default:
      throw std::runtime_error(std::string(operation) + " failed: " + result.message);
  }
}

} // namespace

ProcessManagerStore::ProcessManagerStore(std::shared_ptr<db::Repository> repository,
                                         std::shared_ptr<const messaging::MessageSerializer> serializer,
                                         std::shared_ptr<CommandPublisher> publisher,
                                         std::shared_ptr<CommandPublisherExceptionHandler> exception_handler)
    : repository_(std::move(repository)),
      serializer_(std::move(serializer)),
      publisher_(std::move(publisher)),
      exception_handler_(std::move(exception_handler)) {
  if (!repository_ || !serializer_ || !publisher_) {
    throw util::InvalidArgument("ProcessManagerStore requires repository, serializer and publisher");
  }
  if (!exception_handler_) {
    exception_handler_ = std::make_shared<DefaultCommandPublisherExceptionHandler>();
  }
}

void ProcessManagerStore::SaveAndPublishCommands(ProcessManager& process_manager,
                                                 const std::optional<std::string>& correlation_id,
                                                 std::stop_token stop) {
  SaveTransition(process_manager, correlation_id);
  PublishCommands(process_manager, stop);
}

std::optional<db::model::ProcessManagerRecord> ProcessManagerStore::FindRecord(const util::UUID& id) {
  if (util::IsNil(id)) {
    throw util::InvalidArgument("process manager id cannot be empty");
  }
  auto tx     = repository_->Begin();
  auto record = repository_->GetProcessManager(*tx, util::ToString(id));
  tx->Commit();
  return record;
}

void ProcessManagerStore::SaveTransition(ProcessManager& process_manager,
                                         const std::optional<std::string>& correlation_id) {
  const auto id = util::ToString(process_manager.Id());

  observability::SpanScope span("outbox.save_transition");
  span.SetAttribute("outbox.process_manager_id", id);
  span.SetAttribute("outbox.process_manager_type", process_manager.TypeName());

  db::model::ProcessManagerRecord record;
  record.id      = id;
  record.type    = process_manager.TypeName();
  record.state   = process_manager.SerializeState();
  record.version = process_manager.Version() + 1;

  auto tx = repository_->Begin();

  if (process_manager.Version() == 0) {
    ThrowIfDbError(repository_->InsertProcessManager(*tx, record), "InsertProcessManager", id);
  } else {
    ThrowIfDbError(repository_->UpdateProcessManager(*tx, record, process_manager.Version()), "UpdateProcessManager", id);
  }

  std::vector<db::model::PendingCommandRecord> commands;
  for (const auto& command : process_manager.FlushPendingCommands()) {
    db::model::PendingCommandRecord row;
    row.process_manager_id = id;
    row.message_id         = util::ToString(util::GenerateUUID());
    row.correlation_id     = correlation_id;
    row.command_json       = serializer_->Serialize(command);
    commands.push_back(std::move(row));
  }

  std::vector<db::model::PendingScheduledCommandRecord> scheduled_commands;
  for (const auto& scheduled : process_manager.FlushPendingScheduledCommands()) {
    db::model::PendingScheduledCommandRecord row;
    row.process_manager_id = id;
    row.message_id         = util::ToString(util::GenerateUUID());
    row.correlation_id     = correlation_id;
    row.command_json       = serializer_->Serialize(scheduled.command);
    row.scheduled_time_ms  = util::ToUnixMillis(scheduled.scheduled_time);
    scheduled_commands.push_back(std::move(row));
  }

  if (!commands.empty()) {
    ThrowIfDbError(repository_->InsertPendingCommands(*tx, commands), "InsertPendingCommands", id);
  }
  if (!scheduled_commands.empty()) {
    ThrowIfDbError(repository_->InsertPendingScheduledCommands(*tx, scheduled_commands), "InsertPendingScheduledCommands",
                   id);
  }

  tx->Commit();
  process_manager.SetVersion(record.version);

  OUTBOX_LOG_DEBUG("saved process manager transition",
                   {observability::StringField("process_manager_id", id),
                    observability::StringField("process_manager_type", record.type),
                    observability::IntField("version", static_cast<std::int64_t>(record.version)),
                    observability::IntField("commands", static_cast<std::int64_t>(commands.size())),
                    observability::IntField("scheduled_commands", static_cast<std::int64_t>(scheduled_commands.size()))});
}

void ProcessManagerStore::PublishCommands(const ProcessManager& process_manager, std::stop_token stop) {
  observability::SpanScope span("outbox.publish_commands");
  span.SetAttribute("outbox.process_manager_id", util::ToString(process_manager.Id()));

  try {
    publisher_->FlushCommands(process_manager.Id(), stop);
  } catch (...) {
    CommandPublisherExceptionContext context;
    context.process_manager_type = process_manager.TypeName();
    context.process_manager_id   = process_manager.Id();
    context.exception            = std::current_exception();

    auto decision = HandlerDecision::kPropagate;
    try {
      decision = exception_handler_->Handle(context);
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      observability::Metrics::Instance().RecordUnhandleableFailure();
      OUTBOX_LOG_ERROR("command publisher exception handler failed",
                       {observability::StringField("process_manager_id", util::ToString(context.process_manager_id)),
                        observability::StringField("flush_error", context.Message()),
                        observability::StringField("handler_error", e.what())});
    } catch (...) {
      span.RecordException("non-standard exception");
      observability::Metrics::Instance().RecordUnhandleableFailure();
      OUTBOX_LOG_ERROR("command publisher exception handler failed",
                       {observability::StringField("process_manager_id", util::ToString(context.process_manager_id)),
                        observability::StringField("flush_error", context.Message()),
                        observability::StringField("handler_error", "non-standard exception")});
    }

    if (decision == HandlerDecision::kPropagate) {
      throw;
    }
    span.AddEvent("outbox.flush_failure_handled");
  }
}

} // namespace outbox::processes
